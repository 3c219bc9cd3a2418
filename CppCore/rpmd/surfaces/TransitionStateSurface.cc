// MIT License
// Copyright 2023--present rpmd developers

#include <utility>

#include <fmt/core.h>

#include "rpmd/errors.hpp"
#include "rpmd/surfaces/TransitionStateSurface.hpp"
#include "rpmd/surfaces/distance.hpp"

namespace rpmd {
namespace surfaces {

TransitionStateSurface::TransitionStateSurface(
    size_t nAtoms, std::vector<BondCoordinate> forming,
    std::vector<BondCoordinate> breaking)
    : m_atoms(nAtoms), m_forming(std::move(forming)),
      m_breaking(std::move(breaking)) {
  if (m_forming.empty() && m_breaking.empty()) {
    throw ConfigurationError(
        "Transition state surface needs at least one bond");
  }
  for (const auto *bonds : {&m_forming, &m_breaking}) {
    for (const auto &bond : *bonds) {
      if (bond.i >= nAtoms || bond.j >= nAtoms || bond.i == bond.j) {
        throw ConfigurationError(fmt::format(
            "Invalid bond ({}, {}) for {} atoms", bond.i, bond.j, nAtoms));
      }
    }
  }
}

void TransitionStateSurface::check_centroid(
    const types::AtomMatrix &centroid) const {
  if (centroid.rows() != 3 || centroid.natoms() != m_atoms) {
    throw ShapeMismatch(fmt::format(
        "Transition state surface set up for {} atoms was given [{}, {}]",
        m_atoms, centroid.rows(), centroid.cols()));
  }
}

double TransitionStateSurface::value(const types::AtomMatrix &centroid) const {
  check_centroid(centroid);
  double s1 = 0.0;
  for (const auto &bond : m_breaking) {
    s1 += separation(centroid, bond.i, bond.j).r - bond.r_ts;
  }
  for (const auto &bond : m_forming) {
    s1 -= separation(centroid, bond.i, bond.j).r - bond.r_ts;
  }
  return s1;
}

types::AtomMatrix
TransitionStateSurface::gradient(const types::AtomMatrix &centroid) const {
  check_centroid(centroid);
  types::AtomMatrix grad = types::AtomMatrix::Zero(m_atoms);
  for (const auto &bond : m_breaking) {
    add_distance_gradient(grad, bond.i, bond.j,
                          separation(centroid, bond.i, bond.j), 1.0);
  }
  for (const auto &bond : m_forming) {
    add_distance_gradient(grad, bond.i, bond.j,
                          separation(centroid, bond.i, bond.j), -1.0);
  }
  return grad;
}

types::HessianTensor
TransitionStateSurface::hessian(const types::AtomMatrix &centroid) const {
  check_centroid(centroid);
  types::HessianTensor hess(m_atoms);
  for (const auto &bond : m_breaking) {
    add_distance_hessian(hess, bond.i, bond.j,
                         separation(centroid, bond.i, bond.j), 1.0);
  }
  for (const auto &bond : m_forming) {
    add_distance_hessian(hess, bond.i, bond.j,
                         separation(centroid, bond.i, bond.j), -1.0);
  }
  return hess;
}

} // namespace surfaces
} // namespace rpmd
