#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Conversion utilities between xtensor and native types.
 *
 * Adapters for the @c xtensor library so that ring polymer configurations
 * and centroid arrays can be handed to xtensor based analysis code.
 */

#include <array>
#include <vector>
#include <xtensor/xtensor.hpp>

#include "rpmd/types/AtomMatrix.hpp"
#include "rpmd/types/BeadArray.hpp"

namespace rpmd {
namespace types {
namespace adapt {
namespace xtensor {

/**
 * @brief Converts a 2D [3, nAtoms] xtensor array to a native AtomMatrix.
 * @param matrix  The source 2D xtensor array.
 * @return An @c AtomMatrix containing the copied data.
 */
inline AtomMatrix convertToAtomMatrix(const xt::xtensor<double, 2> &matrix) {
  AtomMatrix result(matrix.shape(0), matrix.shape(1));
  for (size_t i = 0; i < matrix.shape(0); ++i) {
    for (size_t j = 0; j < matrix.shape(1); ++j) {
      result(i, j) = matrix(i, j);
    }
  }
  return result;
}

/**
 * @brief Converts a native AtomMatrix to an xtensor array.
 * @param atomMatrix  The source native matrix.
 * @return A 2D @c xt::xtensor containing the data.
 */
inline xt::xtensor<double, 2> convertToXtensor(const AtomMatrix &atomMatrix) {
  xt::xtensor<double, 2> result =
      xt::zeros<double>({atomMatrix.rows(), atomMatrix.cols()});
  for (size_t i = 0; i < atomMatrix.rows(); ++i) {
    for (size_t j = 0; j < atomMatrix.cols(); ++j) {
      result(i, j) = atomMatrix(i, j);
    }
  }
  return result;
}

/**
 * @brief Converts a bead-resolved array to a 3D xtensor.
 * @param beads  The [3, nAtoms, nBeads] source array.
 * @return A 3D @c xt::xtensor with the same index order.
 */
inline xt::xtensor<double, 3> convertToXtensor(const BeadArray &beads) {
  xt::xtensor<double, 3> result =
      xt::zeros<double>({size_t{3}, beads.natoms(), beads.nbeads()});
  for (size_t i = 0; i < 3; ++i) {
    for (size_t j = 0; j < beads.natoms(); ++j) {
      for (size_t k = 0; k < beads.nbeads(); ++k) {
        result(i, j, k) = beads(i, j, k);
      }
    }
  }
  return result;
}

/**
 * @brief Converts a 3D [3, nAtoms, nBeads] xtensor to a BeadArray.
 * @param tensor  The source tensor; its first extent must be three.
 * @return A @c BeadArray containing the copied data.
 */
inline BeadArray convertToBeadArray(const xt::xtensor<double, 3> &tensor) {
  BeadArray result(tensor.shape(1), tensor.shape(2));
  for (size_t i = 0; i < 3; ++i) {
    for (size_t j = 0; j < tensor.shape(1); ++j) {
      for (size_t k = 0; k < tensor.shape(2); ++k) {
        result(i, j, k) = tensor(i, j, k);
      }
    }
  }
  return result;
}

/**
 * @brief Converts a 1D xtensor to a standard vector.
 * @param vector  The source 1D xtensor.
 * @return A @c std::vector containing the data.
 */
template <typename T>
std::vector<T> convertToVector(const xt::xtensor<T, 1> &vector) {
  return std::vector<T>(vector.begin(), vector.end());
}

} // namespace xtensor
} // namespace adapt
} // namespace types
} // namespace rpmd
