#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Derivatives of interatomic distances over centroid coordinates.
 *
 * Shared by the dividing surface models. For @f$r = |c_i - c_j|@f$ and
 * @f$u = (c_i - c_j)/r@f$ the gradient is @f$+u@f$ on atom i and @f$-u@f$
 * on atom j, and every block of the Hessian is
 * @f$\pm(\delta_{\alpha\beta} - u_\alpha u_\beta)/r@f$.
 */

#include <array>
#include <cmath>
#include <cstddef>

#include <fmt/core.h>

#include "rpmd/errors.hpp"
#include "rpmd/types/AtomMatrix.hpp"
#include "rpmd/types/HessianTensor.hpp"

namespace rpmd {
namespace surfaces {

/**
 * @brief Length and unit direction of a separation vector.
 */
struct Separation {
  double r;                 //!< Length.
  std::array<double, 3> u;  //!< Unit vector along the separation.
};

/**
 * @brief Builds a separation from a displacement vector.
 * @param d Displacement.
 * @return Its length and direction.
 * @throws rpmd::InvalidInput for a zero displacement.
 */
inline Separation separation(const std::array<double, 3> &d) {
  const double r = std::sqrt(d[0] * d[0] + d[1] * d[1] + d[2] * d[2]);
  if (r == 0.0) {
    throw InvalidInput("Distance derivatives are undefined at zero separation");
  }
  return Separation{r, {d[0] / r, d[1] / r, d[2] / r}};
}

/**
 * @brief Separation between two atoms of a centroid configuration.
 * @param c Centroid [3, nAtoms].
 * @param i First atom.
 * @param j Second atom.
 * @return Separation of @c c_i - c_j.
 */
inline Separation separation(const types::AtomMatrix &c, size_t i, size_t j) {
  if (i >= c.natoms() || j >= c.natoms()) {
    throw InvalidInput(fmt::format(
        "Atom pair ({}, {}) out of range for {} atoms", i, j, c.natoms()));
  }
  return separation(std::array<double, 3>{c(0, i) - c(0, j), c(1, i) - c(1, j),
                                          c(2, i) - c(2, j)});
}

/**
 * @brief Adds @c scale * dr/dc for the pair (i, j) to @a grad.
 * @return Void.
 */
inline void add_distance_gradient(types::AtomMatrix &grad, size_t i, size_t j,
                                  const Separation &s, double scale) {
  for (size_t a = 0; a < 3; ++a) {
    grad(a, i) += scale * s.u[a];
    grad(a, j) -= scale * s.u[a];
  }
}

/**
 * @brief Adds @c scale * d2r/dc2 for the pair (i, j) to @a hess.
 * @return Void.
 */
inline void add_distance_hessian(types::HessianTensor &hess, size_t i,
                                 size_t j, const Separation &s, double scale) {
  for (size_t a = 0; a < 3; ++a) {
    for (size_t b = 0; b < 3; ++b) {
      const double block =
          scale * ((a == b ? 1.0 : 0.0) - s.u[a] * s.u[b]) / s.r;
      hess(a, i, b, i) += block;
      hess(a, j, b, j) += block;
      hess(a, i, b, j) -= block;
      hess(a, j, b, i) -= block;
    }
  }
}

} // namespace surfaces
} // namespace rpmd
