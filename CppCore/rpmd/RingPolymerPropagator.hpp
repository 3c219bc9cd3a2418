#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Exact propagation of the free ring polymer Hamiltonian.
 *
 * The harmonic spring term coupling neighbouring beads is diagonal in the
 * normal mode basis, where each mode is an independent harmonic oscillator
 * of frequency @f$\omega_k = (2/\beta_n)\sin(k\pi/N)@f$ with
 * @f$\beta_n = \beta/N@f$. Each mode is advanced with its analytic solution,
 * so the step stays stable however stiff the springs become.
 */

#include <cstddef>
#include <vector>

#include "rpmd/NormalModeTransform.hpp"
#include "rpmd/SystemParameters.hpp"
#include "rpmd/types/BeadArray.hpp"

namespace rpmd {

/**
 * @brief 2x2 propagator acting on a (p, q) pair of one normal mode.
 *
 * @code
 * p' = pp * p + pq * q
 * q' = qp * p + qq * q
 * @endcode
 */
struct ModeMatrix {
  double pp; //!< dp'/dp
  double pq; //!< dp'/dq
  double qp; //!< dq'/dp
  double qq; //!< dq'/dq
};

/**
 * @class FreeRingPolymerPropagator
 * @brief Drift sub-step of the RPMD velocity Verlet integrator.
 */
class FreeRingPolymerPropagator {
public:
  /**
   * @brief Builds the per-atom mode matrices for the configured time step.
   * @param params Validated run parameters.
   * @param nBeads Number of beads per atom.
   * @throws rpmd::ConfigurationError if the parameters are invalid.
   */
  FreeRingPolymerPropagator(const SystemParameters &params, size_t nBeads);

  /**
   * @brief Advances @a p and @a q in place by the configured time step.
   * @param p Momenta [3, nAtoms, nBeads].
   * @param q Positions [3, nAtoms, nBeads].
   * @return Void.
   * @throws rpmd::ShapeMismatch if the arrays disagree with the
   * configuration.
   */
  void propagate(types::BeadArray &p, types::BeadArray &q);

  /**
   * @brief Advances @a p and @a q in place by an arbitrary time step.
   *
   * A negative @a dt runs the exact solution backwards, which undoes a
   * forward call with the same magnitude.
   *
   * @param p Momenta [3, nAtoms, nBeads].
   * @param q Positions [3, nAtoms, nBeads].
   * @param dt Time step to apply.
   * @return Void.
   */
  void propagate(types::BeadArray &p, types::BeadArray &q, double dt);

  /**
   * @brief Angular frequency of normal mode @a k.
   * @param k Mode index, @c 0 <= k < nBeads.
   * @param beta Inverse temperature.
   * @param nBeads Number of beads.
   * @return @f$(2N/\beta)\sin(k\pi/N)@f$; zero for the centroid.
   */
  [[nodiscard]] static double mode_frequency(size_t k, double beta,
                                             size_t nBeads);

  /**
   * @brief Propagators of all halfcomplex slots for one atom.
   * @param mass Atom mass.
   * @param beta Inverse temperature.
   * @param nBeads Number of beads.
   * @param dt Time step.
   * @return @a nBeads matrices, slot @c N-k mirroring slot @c k.
   */
  [[nodiscard]] static std::vector<ModeMatrix>
  mode_matrices(double mass, double beta, size_t nBeads, double dt);

  [[nodiscard]] size_t nbeads() const { return m_beads; }

private:
  void check_shape(const types::BeadArray &p,
                   const types::BeadArray &q) const;
  void apply(types::BeadArray &p, types::BeadArray &q, double dt,
             const std::vector<std::vector<ModeMatrix>> &matrices);

  SystemParameters m_params;  //!< Copy of the run parameters.
  size_t m_beads;             //!< Beads per atom.
  NormalModeTransform m_transform;
  std::vector<std::vector<ModeMatrix>>
      m_matrices; //!< Per-atom mode matrices for @c m_params.dt.
};

} // namespace rpmd
