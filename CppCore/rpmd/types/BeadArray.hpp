#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Definition of the bead-resolved BeadArray class.
 *
 * Stores per-bead quantities (positions, momenta, potential gradients) shaped
 * [3, nAtoms, nBeads]. The bead index runs fastest so that the ring of beads
 * belonging to one (axis, atom) pair is a contiguous sequence, which is what
 * the normal mode transform operates on.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace rpmd {
namespace types {

/**
 * @class BeadArray
 * @brief Dense [axis, atom, bead] array of doubles.
 */
class BeadArray {
public:
  BeadArray() : m_atoms(0), m_beads(0) {}

  /**
   * @brief Constructor for a zero-filled array.
   * @param nAtoms  Number of atoms.
   * @param nBeads  Number of beads per atom.
   */
  BeadArray(size_t nAtoms, size_t nBeads)
      : m_atoms(nAtoms), m_beads(nBeads), m_data(3 * nAtoms * nBeads, 0.0) {}

  double &operator()(size_t axis, size_t atom, size_t bead) {
    return m_data[(axis * m_atoms + atom) * m_beads + bead];
  }

  const double &operator()(size_t axis, size_t atom, size_t bead) const {
    return m_data[(axis * m_atoms + atom) * m_beads + bead];
  }

  /**
   * @brief Pointer to the contiguous ring of beads of one coordinate.
   * @param axis  Cartesian axis.
   * @param atom  Atom index.
   * @return Pointer to @c nbeads() consecutive values.
   */
  double *ring(size_t axis, size_t atom) {
    return m_data.data() + (axis * m_atoms + atom) * m_beads;
  }

  const double *ring(size_t axis, size_t atom) const {
    return m_data.data() + (axis * m_atoms + atom) * m_beads;
  }

  size_t natoms() const { return m_atoms; }
  size_t nbeads() const { return m_beads; }
  size_t size() const { return m_data.size(); }

  double *data() { return m_data.data(); }
  const double *data() const { return m_data.data(); }

  void fill(double value) { std::fill(m_data.begin(), m_data.end(), value); }

  bool same_shape(const BeadArray &other) const {
    return m_atoms == other.m_atoms && m_beads == other.m_beads;
  }

  /**
   * @brief In-place @c this += factor * other.
   * @param other   Array of identical shape.
   * @param factor  Scale applied to @a other.
   * @return Void.
   * @pre @c same_shape(other); checked by the callers that own the shapes.
   */
  void add_scaled(const BeadArray &other, double factor) {
    for (size_t idx = 0; idx < m_data.size(); ++idx) {
      m_data[idx] += factor * other.m_data[idx];
    }
  }

private:
  size_t m_atoms;              //!< Number of atoms.
  size_t m_beads;              //!< Number of beads per atom.
  std::vector<double> m_data; //!< Flat storage, bead index fastest.
};

} // namespace types
} // namespace rpmd
