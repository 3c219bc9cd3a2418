#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Conversion utilities between Eigen and native types.
 *
 * Inline adapters that expose @c AtomMatrix and @c HessianTensor storage to
 * Eigen, either as zero-copy maps over the flat coordinate ordering
 * (@c axis*nAtoms+atom) or as owning copies.
 */

// clang-format off
#include <Eigen/Dense>
// clang-format on
#include <array>
#include <stdexcept>
#include <vector>

#include "rpmd/types/AtomMatrix.hpp"
#include "rpmd/types/HessianTensor.hpp"

namespace rpmd {
namespace types {
namespace adapt {
namespace eigen {

using RowMajorMatrix =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorMap = Eigen::Map<Eigen::VectorXd>;
using ConstVectorMap = Eigen::Map<const Eigen::VectorXd>;
using MatrixMap = Eigen::Map<RowMajorMatrix>;
using ConstMatrixMap = Eigen::Map<const RowMajorMatrix>;

/**
 * @brief Views a [3, nAtoms] matrix as a flat coordinate vector.
 * @param matrix  The source matrix; must outlive the map.
 * @return A mutable @c Eigen::Map of length @c 3*nAtoms.
 */
inline VectorMap asVector(AtomMatrix &matrix) {
  return VectorMap(matrix.data(), static_cast<Eigen::Index>(matrix.size()));
}

inline ConstVectorMap asVector(const AtomMatrix &matrix) {
  return ConstVectorMap(matrix.data(),
                        static_cast<Eigen::Index>(matrix.size()));
}

/**
 * @brief Views a Hessian as a square (3 nAtoms) matrix.
 * @param hessian  The source tensor; must outlive the map.
 * @return A mutable row-major @c Eigen::Map.
 */
inline MatrixMap asMatrix(HessianTensor &hessian) {
  const auto dim = static_cast<Eigen::Index>(hessian.dim());
  return MatrixMap(hessian.data(), dim, dim);
}

inline ConstMatrixMap asMatrix(const HessianTensor &hessian) {
  const auto dim = static_cast<Eigen::Index>(hessian.dim());
  return ConstMatrixMap(hessian.data(), dim, dim);
}

/**
 * @brief Converts an Eigen [3, nAtoms] matrix to a native AtomMatrix.
 * @param matrix  The source Eigen matrix.
 * @return An @c AtomMatrix instance with copied data.
 */
inline AtomMatrix convertToAtomMatrix(const Eigen::MatrixXd &matrix) {
  AtomMatrix result(matrix.rows(), matrix.cols());
  for (int i = 0; i < matrix.rows(); ++i) {
    for (int j = 0; j < matrix.cols(); ++j) {
      result(i, j) = matrix(i, j);
    }
  }
  return result;
}

/**
 * @brief Converts a native AtomMatrix to an Eigen matrix.
 * @param atomMatrix  The source native matrix.
 * @return An owning @c Eigen::MatrixXd copy.
 */
inline Eigen::MatrixXd convertToEigen(const AtomMatrix &atomMatrix) {
  return Eigen::Map<const RowMajorMatrix>(atomMatrix.data(), atomMatrix.rows(),
                                          atomMatrix.cols());
}

/**
 * @brief Converts a square Eigen matrix to a HessianTensor.
 * @param matrix  A (3 nAtoms) x (3 nAtoms) matrix.
 * @return The equivalent @c HessianTensor.
 * @throws std::invalid_argument if @a matrix is not square with a side
 * divisible by three.
 */
inline HessianTensor convertToHessian(const Eigen::MatrixXd &matrix) {
  if (matrix.rows() != matrix.cols() || matrix.rows() % 3 != 0) {
    throw std::invalid_argument(
        "Hessian conversion needs a square matrix of side 3*nAtoms");
  }
  HessianTensor result(static_cast<size_t>(matrix.rows() / 3));
  asMatrix(result) = matrix;
  return result;
}

/**
 * @brief Converts an Eigen vector to a standard vector.
 * @param vector  The source Eigen vector.
 * @return A @c std::vector containing the data.
 */
template <typename T>
std::vector<T> convertToVector(const Eigen::VectorX<T> &vector) {
  return std::vector<T>(vector.data(), vector.data() + vector.size());
}

/**
 * @brief Converts a 3-vector to a standard array.
 * @param vec  The source vector.
 * @return A @c std::array with the same components.
 */
inline std::array<double, 3> convertToArray3(const Eigen::Vector3d &vec) {
  return {vec(0), vec(1), vec(2)};
}

} // namespace eigen
} // namespace adapt
} // namespace types
} // namespace rpmd
