#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Bead-by-bead evaluation of a classical potential.
 *
 * In RPMD each bead feels the physical potential at its own position. This
 * adapter slices a ring polymer configuration into one classical
 * configuration per bead, evaluates a @c PotentialBase on each and stores
 * the bead energies and the potential gradient (negative force).
 */

#include <functional>
#include <memory>
#include <vector>

#include "rpmd/Potential.hpp"
#include "rpmd/types/AtomMatrix.hpp"
#include "rpmd/types/BeadArray.hpp"

#ifdef RPMD_HAS_CACHE
#include "rpmd/PotentialCache.hpp"
#endif

namespace rpmd {

/**
 * @brief Signature of a ring polymer potential evaluator.
 *
 * Called with the bead positions [3, nAtoms, nBeads]; fills the bead
 * energies [nBeads] and the potential gradient [3, nAtoms, nBeads]. Any
 * callable with this shape can drive @c VelocityVerlet.
 */
using BeadPotentialFn = std::function<void(
    const types::BeadArray &q, std::vector<double> &V, types::BeadArray &dVdq)>;

/**
 * @class RingPolymerPotential
 * @brief Adapts a single configuration potential to ring polymers.
 */
class RingPolymerPotential {
public:
  /**
   * @brief Constructor.
   * @param pot The classical potential to evaluate on each bead.
   * @throws rpmd::InvalidInput if @a pot is null.
   */
  explicit RingPolymerPotential(std::shared_ptr<PotentialBase> pot);

#ifdef RPMD_HAS_CACHE
  /**
   * @brief Attaches a persistent cache.
   * @param c Pointer to a PotentialCache, not owned; @c nullptr detaches.
   * @return Void.
   */
  void set_cache(cache::PotentialCache *c) { m_cache = c; }
#endif

  /**
   * @brief Evaluates every bead.
   * @param q Bead positions [3, nAtoms, nBeads].
   * @param V Bead energies; resized to nBeads.
   * @param dVdq Potential gradient; reshaped to match @a q.
   * @return Void.
   */
  void operator()(const types::BeadArray &q, std::vector<double> &V,
                  types::BeadArray &dVdq);

  [[nodiscard]] PotType get_type() const { return m_pot->get_type(); }

private:
  std::shared_ptr<PotentialBase> m_pot; //!< Classical potential.
  AtomMatrix m_config;                  //!< One bead's configuration.
#ifdef RPMD_HAS_CACHE
  cache::PotentialCache *m_cache = nullptr; //!< Optional cache.
#endif
};

} // namespace rpmd
