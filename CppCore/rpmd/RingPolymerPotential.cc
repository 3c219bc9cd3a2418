// MIT License
// Copyright 2023--present rpmd developers

#include <utility>

#include "rpmd/RingPolymerPotential.hpp"
#include "rpmd/errors.hpp"

namespace rpmd {

RingPolymerPotential::RingPolymerPotential(std::shared_ptr<PotentialBase> pot)
    : m_pot(std::move(pot)) {
  if (!m_pot) {
    throw InvalidInput("RingPolymerPotential needs a potential");
  }
}

/**
 * @details
 * # Caching Logic
 * If @c RPMD_HAS_CACHE is defined and a cache is attached, the whole ring
 * polymer configuration is hashed first. A hit fills @a V and @a dVdq
 * without any force call; a miss evaluates all beads and stores the result.
 */
void RingPolymerPotential::operator()(const types::BeadArray &q,
                                      std::vector<double> &V,
                                      types::BeadArray &dVdq) {
  const size_t nAtoms = q.natoms();
  const size_t nBeads = q.nbeads();
  V.assign(nBeads, 0.0);
  if (!dVdq.same_shape(q)) {
    dVdq = types::BeadArray(nAtoms, nBeads);
  }

#ifdef RPMD_HAS_CACHE
  std::optional<cache::KeyHash> key;
  if (m_cache && m_cache->is_open()) {
    key = cache::hash_configuration(q, m_pot->get_type(),
                                   m_pot->get_parameters());
    auto hit = m_cache->find(*key);
    if (hit && m_cache->deserialize_hit(*hit, V, dVdq)) {
      return;
    }
  }
#endif

  if (m_config.rows() != 3 || m_config.cols() != nAtoms) {
    m_config = AtomMatrix::Zero(nAtoms);
  }
  for (size_t k = 0; k < nBeads; ++k) {
    for (size_t i = 0; i < 3; ++i) {
      for (size_t j = 0; j < nAtoms; ++j) {
        m_config(i, j) = q(i, j, k);
      }
    }
    auto [energy, forces] = (*m_pot)(m_config);
    V[k] = energy;
    for (size_t i = 0; i < 3; ++i) {
      for (size_t j = 0; j < nAtoms; ++j) {
        dVdq(i, j, k) = -forces(i, j);
      }
    }
  }

#ifdef RPMD_HAS_CACHE
  if (key) {
    m_cache->add_serialized(*key, V, dVdq);
  }
#endif
}

} // namespace rpmd
