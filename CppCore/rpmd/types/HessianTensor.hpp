#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Definition of the HessianTensor class.
 *
 * Second derivatives of a scalar field over centroid coordinates, shaped
 * [3, nAtoms, 3, nAtoms]. Storage is a row-major (3 nAtoms) x (3 nAtoms)
 * matrix whose row and column indices use the @c AtomMatrix flat ordering
 * @c axis*nAtoms+atom.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace rpmd {
namespace types {

/**
 * @class HessianTensor
 * @brief Dense rank-4 [axis, atom, axis, atom] tensor.
 */
class HessianTensor {
public:
  HessianTensor() : m_atoms(0), m_dim(0) {}

  /**
   * @brief Constructor for a zero-filled tensor.
   * @param nAtoms  Number of atoms.
   */
  explicit HessianTensor(size_t nAtoms)
      : m_atoms(nAtoms), m_dim(3 * nAtoms), m_data(m_dim * m_dim, 0.0) {}

  double &operator()(size_t axis1, size_t atom1, size_t axis2, size_t atom2) {
    return m_data[(axis1 * m_atoms + atom1) * m_dim + axis2 * m_atoms + atom2];
  }

  const double &operator()(size_t axis1, size_t atom1, size_t axis2,
                           size_t atom2) const {
    return m_data[(axis1 * m_atoms + atom1) * m_dim + axis2 * m_atoms + atom2];
  }

  /**
   * @brief Access by flat coordinate indices.
   * @param row  Flat index of the first coordinate.
   * @param col  Flat index of the second coordinate.
   * @return Reference to the element.
   */
  double &operator()(size_t row, size_t col) {
    return m_data[row * m_dim + col];
  }

  const double &operator()(size_t row, size_t col) const {
    return m_data[row * m_dim + col];
  }

  size_t natoms() const { return m_atoms; }

  /**
   * @brief Side length of the flattened matrix.
   * @return @c 3*natoms().
   */
  size_t dim() const { return m_dim; }
  size_t size() const { return m_data.size(); }

  double *data() { return m_data.data(); }
  const double *data() const { return m_data.data(); }

  bool all_finite() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](double v) { return std::isfinite(v); });
  }

private:
  size_t m_atoms;             //!< Number of atoms.
  size_t m_dim;               //!< Flattened side length, 3 * nAtoms.
  std::vector<double> m_data; //!< Row-major flattened storage.
};

} // namespace types
} // namespace rpmd
