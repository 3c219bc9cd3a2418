#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Definition of the native AtomMatrix class.
 *
 * A lightweight row-major matrix used for centroid-level quantities. Within
 * rpmd an @c AtomMatrix is always shaped [3, nAtoms]: the row is the
 * Cartesian axis and the column the atom, so the flat index of a coordinate
 * is @c axis*nAtoms+atom. The same flat ordering is used by
 * @c HessianTensor and by the @c ForceInput position arrays.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <vector>

namespace rpmd {
namespace types {

/**
 * @class AtomMatrix
 * @brief A lightweight row-major [axis, atom] matrix.
 */
class AtomMatrix {
public:
  /**
   * @brief Default constructor.
   */
  AtomMatrix() : m_rows(0), m_cols(0) {}

  /**
   * @brief Constructor for list initialization, one inner list per axis.
   * @param list  The nested initializer list.
   */
  AtomMatrix(std::initializer_list<std::initializer_list<double>> list)
      : m_rows(list.size()), m_cols((list.begin())->size()),
        m_data(m_rows * m_cols) {
    size_t rowIdx = 0;
    for (const auto &rowList : list) {
      std::copy(rowList.begin(), rowList.end(),
                m_data.begin() + rowIdx * m_cols);
      ++rowIdx;
    }
  }

  /**
   * @brief Constructor for a zero-filled matrix of given dimensions.
   * @param rows  Number of rows (axes).
   * @param cols  Number of columns (atoms).
   */
  AtomMatrix(size_t rows, size_t cols)
      : m_rows(rows), m_cols(cols), m_data(rows * cols, 0.0) {}

  /**
   * @brief Creates a [3, nAtoms] matrix initialized with zeroes.
   * @param nAtoms  Number of atoms.
   * @return A zero-initialized @c AtomMatrix.
   */
  static AtomMatrix Zero(size_t nAtoms) { return AtomMatrix(3, nAtoms); }

  /**
   * @brief Access element for mutation.
   * @param axis  Cartesian axis (0, 1, 2).
   * @param atom  Atom index.
   * @return Reference to the element.
   */
  double &operator()(size_t axis, size_t atom) {
    return m_data[axis * m_cols + atom];
  }

  /**
   * @brief Access element for reading.
   * @param axis  Cartesian axis (0, 1, 2).
   * @param atom  Atom index.
   * @return Const reference to the element.
   */
  const double &operator()(size_t axis, size_t atom) const {
    return m_data[axis * m_cols + atom];
  }

  double &operator[](size_t flat) { return m_data[flat]; }
  const double &operator[](size_t flat) const { return m_data[flat]; }

  size_t rows() const { return m_rows; }
  size_t cols() const { return m_cols; }

  /**
   * @brief Number of atoms described by the matrix.
   * @return Column count.
   */
  size_t natoms() const { return m_cols; }

  /**
   * @brief Fetches the total number of elements.
   * @return Size of the underlying data vector.
   */
  size_t size() const { return m_rows * m_cols; }

  double *data() { return m_data.data(); }
  const double *data() const { return m_data.data(); }

  /**
   * @brief Checks whether @a other has the same dimensions.
   * @param other The matrix to compare with.
   * @return True when rows and columns agree.
   */
  bool same_shape(const AtomMatrix &other) const {
    return m_rows == other.m_rows && m_cols == other.m_cols;
  }

  /**
   * @brief Checks that every element is finite.
   * @return False if any element is NaN or infinite.
   */
  bool all_finite() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](double v) { return std::isfinite(v); });
  }

private:
  size_t m_rows; //!< The number of rows (axes) in the matrix.
  size_t m_cols; //!< The number of columns (atoms) in the matrix.
  std::vector<double>
      m_data; //!< The underlying flat container for row-major data.
};

} // namespace types
} // namespace rpmd
