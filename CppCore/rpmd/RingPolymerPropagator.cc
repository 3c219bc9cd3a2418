// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Implementation of the free ring polymer propagator.
 */

#include <cmath>
#include <numbers>

#include <fmt/core.h>

#include "rpmd/RingPolymerPropagator.hpp"
#include "rpmd/errors.hpp"

namespace rpmd {

namespace {

std::vector<std::vector<ModeMatrix>>
build_matrices(const SystemParameters &params, size_t nBeads, double dt) {
  std::vector<std::vector<ModeMatrix>> matrices;
  matrices.reserve(params.natoms());
  for (double mass : params.masses) {
    matrices.push_back(FreeRingPolymerPropagator::mode_matrices(
        mass, params.beta, nBeads, dt));
  }
  return matrices;
}

size_t checked_beads(const SystemParameters &params, size_t nBeads) {
  params.validate();
  params.validate_beads(nBeads);
  return nBeads;
}

} // namespace

FreeRingPolymerPropagator::FreeRingPolymerPropagator(
    const SystemParameters &params, size_t nBeads)
    : m_params(params), m_beads(checked_beads(params, nBeads)),
      m_transform(m_beads),
      m_matrices(build_matrices(m_params, m_beads, m_params.dt)) {}

double FreeRingPolymerPropagator::mode_frequency(size_t k, double beta,
                                                 size_t nBeads) {
  const double beta_n = beta / static_cast<double>(nBeads);
  return (2.0 / beta_n) * std::sin(static_cast<double>(k) * std::numbers::pi /
                                   static_cast<double>(nBeads));
}

/**
 * @details
 * Slot 0 is the centroid, which moves as a free particle. Slots
 * @c 1..N/2 get the analytic harmonic solution of their frequency and are
 * copied onto slots @c N-k for @c k=1..(N-1)/2, where the halfcomplex
 * layout keeps the imaginary parts. For even N the Nyquist slot @c N/2 has
 * no partner and is written once.
 */
std::vector<ModeMatrix>
FreeRingPolymerPropagator::mode_matrices(double mass, double beta,
                                         size_t nBeads, double dt) {
  std::vector<ModeMatrix> poly(nBeads);
  poly[0] = ModeMatrix{1.0, 0.0, dt / mass, 1.0};
  for (size_t k = 1; k <= nBeads / 2; ++k) {
    const double wk = mode_frequency(k, beta, nBeads);
    const double wt = wk * dt;
    const double wm = wk * mass;
    const double cos_wt = std::cos(wt);
    const double sin_wt = std::sin(wt);
    poly[k] = ModeMatrix{cos_wt, -wm * sin_wt, sin_wt / wm, cos_wt};
  }
  for (size_t k = 1; k <= (nBeads - 1) / 2; ++k) {
    poly[nBeads - k] = poly[k];
  }
  return poly;
}

void FreeRingPolymerPropagator::propagate(types::BeadArray &p,
                                          types::BeadArray &q) {
  apply(p, q, m_params.dt, m_matrices);
}

void FreeRingPolymerPropagator::propagate(types::BeadArray &p,
                                          types::BeadArray &q, double dt) {
  apply(p, q, dt, build_matrices(m_params, m_beads, dt));
}

void FreeRingPolymerPropagator::apply(
    types::BeadArray &p, types::BeadArray &q, double dt,
    const std::vector<std::vector<ModeMatrix>> &matrices) {
  check_shape(p, q);
  const size_t nAtoms = m_params.natoms();

  if (m_beads == 1) {
    // A lone bead has no springs, so this is a classical drift
    for (size_t i = 0; i < 3; ++i) {
      for (size_t j = 0; j < nAtoms; ++j) {
        q(i, j, 0) += p(i, j, 0) * dt / m_params.masses[j];
      }
    }
    return;
  }

  for (size_t i = 0; i < 3; ++i) {
    for (size_t j = 0; j < nAtoms; ++j) {
      double *pk = p.ring(i, j);
      double *qk = q.ring(i, j);
      const auto &poly = matrices[j];
      m_transform.forward(pk);
      m_transform.forward(qk);
      for (size_t k = 0; k < m_beads; ++k) {
        const double p_new = pk[k] * poly[k].pp + qk[k] * poly[k].pq;
        qk[k] = pk[k] * poly[k].qp + qk[k] * poly[k].qq;
        pk[k] = p_new;
      }
      m_transform.inverse(pk);
      m_transform.inverse(qk);
    }
  }
}

void FreeRingPolymerPropagator::check_shape(const types::BeadArray &p,
                                            const types::BeadArray &q) const {
  if (!p.same_shape(q)) {
    throw ShapeMismatch(fmt::format(
        "Momentum [3, {}, {}] and position [3, {}, {}] differ in shape",
        p.natoms(), p.nbeads(), q.natoms(), q.nbeads()));
  }
  if (q.natoms() != m_params.natoms() || q.nbeads() != m_beads) {
    throw ShapeMismatch(fmt::format(
        "Propagator set up for [3, {}, {}] was given [3, {}, {}]",
        m_params.natoms(), m_beads, q.natoms(), q.nbeads()));
  }
}

} // namespace rpmd
