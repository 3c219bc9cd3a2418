// MIT License
// Copyright 2023--present rpmd developers

#include <fmt/core.h>

#include "rpmd/SimulationState.hpp"
#include "rpmd/errors.hpp"

namespace rpmd {

SimulationState::SimulationState(size_t nAtoms, size_t nBeads)
    : p(nAtoms, nBeads), q(nAtoms, nBeads), V(nBeads, 0.0),
      dVdq(nAtoms, nBeads), dxi(types::AtomMatrix::Zero(nAtoms)),
      d2xi(nAtoms) {}

void SimulationState::check_shape(size_t nAtoms, size_t nBeads) const {
  auto check = [&](const types::BeadArray &arr, const char *name) {
    if (arr.natoms() != nAtoms || arr.nbeads() != nBeads) {
      throw ShapeMismatch(fmt::format(
          "{} is shaped [3, {}, {}] but the run expects [3, {}, {}]", name,
          arr.natoms(), arr.nbeads(), nAtoms, nBeads));
    }
  };
  check(p, "Momentum");
  check(q, "Position");
  check(dVdq, "Potential gradient");
  if (V.size() != nBeads) {
    throw ShapeMismatch(fmt::format(
        "Bead energies hold {} entries but the run has {} beads", V.size(),
        nBeads));
  }
  if (dxi.rows() != 3 || dxi.cols() != nAtoms) {
    throw ShapeMismatch(fmt::format(
        "Reaction coordinate gradient is shaped [{}, {}], expected [3, {}]",
        dxi.rows(), dxi.cols(), nAtoms));
  }
  if (d2xi.natoms() != nAtoms) {
    throw ShapeMismatch(fmt::format(
        "Reaction coordinate Hessian covers {} atoms, expected {}",
        d2xi.natoms(), nAtoms));
  }
}

} // namespace rpmd
