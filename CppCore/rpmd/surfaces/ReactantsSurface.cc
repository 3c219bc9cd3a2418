// MIT License
// Copyright 2023--present rpmd developers

#include <fmt/core.h>

#include "rpmd/errors.hpp"
#include "rpmd/surfaces/ReactantsSurface.hpp"
#include "rpmd/surfaces/distance.hpp"

namespace rpmd {
namespace surfaces {

namespace {

/**
 * The fragment separation is linear in the centroids,
 * @f$R_A - R_B = \sum_i w_i c_i@f$, so the weights carry everything the
 * derivatives need.
 */
Separation fragment_separation(const std::vector<double> &weights,
                               const types::AtomMatrix &c) {
  std::array<double, 3> d{0.0, 0.0, 0.0};
  for (size_t a = 0; a < 3; ++a) {
    for (size_t i = 0; i < weights.size(); ++i) {
      d[a] += weights[i] * c(a, i);
    }
  }
  return separation(d);
}

} // namespace

ReactantsSurface::ReactantsSurface(const std::vector<double> &masses,
                                   const std::vector<size_t> &fragmentA,
                                   const std::vector<size_t> &fragmentB,
                                   double Rinf)
    : m_weights(masses.size(), 0.0), m_Rinf(Rinf) {
  if (fragmentA.empty() || fragmentB.empty()) {
    throw ConfigurationError("Both reactant fragments need at least one atom");
  }
  if (!(Rinf > 0.0)) {
    throw ConfigurationError(
        fmt::format("Reactant separation must be positive, got {}", Rinf));
  }
  auto assign = [&](const std::vector<size_t> &fragment, double sign) {
    double total = 0.0;
    for (size_t idx : fragment) {
      if (idx >= masses.size()) {
        throw ConfigurationError(fmt::format(
            "Fragment atom {} out of range for {} atoms", idx, masses.size()));
      }
      if (m_weights[idx] != 0.0) {
        throw ConfigurationError(
            fmt::format("Atom {} appears in a fragment twice", idx));
      }
      total += masses[idx];
      m_weights[idx] = sign * masses[idx];
    }
    for (size_t idx : fragment) {
      m_weights[idx] /= total;
    }
  };
  assign(fragmentA, 1.0);
  assign(fragmentB, -1.0);
}

void ReactantsSurface::check_centroid(const types::AtomMatrix &centroid) const {
  if (centroid.rows() != 3 || centroid.natoms() != m_weights.size()) {
    throw ShapeMismatch(fmt::format(
        "Reactants surface set up for {} atoms was given [{}, {}]",
        m_weights.size(), centroid.rows(), centroid.cols()));
  }
}

double ReactantsSurface::value(const types::AtomMatrix &centroid) const {
  check_centroid(centroid);
  return m_Rinf - fragment_separation(m_weights, centroid).r;
}

types::AtomMatrix
ReactantsSurface::gradient(const types::AtomMatrix &centroid) const {
  check_centroid(centroid);
  const Separation s = fragment_separation(m_weights, centroid);
  types::AtomMatrix grad = types::AtomMatrix::Zero(centroid.natoms());
  for (size_t a = 0; a < 3; ++a) {
    for (size_t i = 0; i < m_weights.size(); ++i) {
      grad(a, i) = -m_weights[i] * s.u[a];
    }
  }
  return grad;
}

types::HessianTensor
ReactantsSurface::hessian(const types::AtomMatrix &centroid) const {
  check_centroid(centroid);
  const Separation s = fragment_separation(m_weights, centroid);
  const size_t nAtoms = centroid.natoms();
  types::HessianTensor hess(nAtoms);
  for (size_t a = 0; a < 3; ++a) {
    for (size_t i = 0; i < nAtoms; ++i) {
      for (size_t b = 0; b < 3; ++b) {
        for (size_t j = 0; j < nAtoms; ++j) {
          hess(a, i, b, j) = -m_weights[i] * m_weights[j] *
                             ((a == b ? 1.0 : 0.0) - s.u[a] * s.u[b]) / s.r;
        }
      }
    }
  }
  return hess;
}

} // namespace surfaces
} // namespace rpmd
