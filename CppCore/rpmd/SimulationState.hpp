#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Bead-resolved dynamical state of one ring polymer trajectory.
 */

#include <cstddef>
#include <vector>

#include "rpmd/types/AtomMatrix.hpp"
#include "rpmd/types/BeadArray.hpp"
#include "rpmd/types/HessianTensor.hpp"

namespace rpmd {

/**
 * @class SimulationState
 * @brief Mutable buffers owned by the caller driving the simulation loop.
 *
 * The stepper updates these in place. @c dVdq holds the gradient of the
 * potential (the negative of the physical force) so that the kicks read
 * @c p -= dt/2 * dVdq.
 */
struct SimulationState {
  double t{0.0};               //!< Simulation time.
  types::BeadArray p;          //!< Momentum [3, nAtoms, nBeads].
  types::BeadArray q;          //!< Position [3, nAtoms, nBeads].
  std::vector<double> V;       //!< Potential energy of each bead.
  types::BeadArray dVdq;       //!< Potential gradient [3, nAtoms, nBeads].
  double xi{0.0};              //!< Reaction coordinate value.
  types::AtomMatrix dxi;       //!< Reaction coordinate gradient [3, nAtoms].
  types::HessianTensor d2xi;   //!< Reaction coordinate Hessian.

  SimulationState() = default;

  /**
   * @brief Allocates zeroed buffers for a ring polymer system.
   * @param nAtoms Number of atoms.
   * @param nBeads Number of beads per atom.
   */
  SimulationState(size_t nAtoms, size_t nBeads);

  [[nodiscard]] size_t natoms() const { return q.natoms(); }
  [[nodiscard]] size_t nbeads() const { return q.nbeads(); }

  /**
   * @brief Verifies every buffer has the expected dimensions.
   * @param nAtoms Expected number of atoms.
   * @param nBeads Expected number of beads per atom.
   * @return Void.
   * @throws rpmd::ShapeMismatch naming the first inconsistent buffer.
   */
  void check_shape(size_t nAtoms, size_t nBeads) const;
};

} // namespace rpmd
