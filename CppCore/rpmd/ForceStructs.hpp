#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief POD structures for single configuration force calls.
 *
 * Exchanged between the @c Potential wrapper and a physics kernel's
 * @c forceImpl. Positions and forces are flat arrays in the [3, nAtoms]
 * ordering of @c AtomMatrix, i.e. element @c axis*nAtoms+atom.
 */

#include <cstddef>

namespace rpmd {

/**
 * @brief Data structure containing input configuration for force calls.
 * @ingroup rpmd
 */
typedef struct {
  const size_t nAtoms; //!< Total number of atoms in the configuration.
  const double *pos;   //!< Pointer to the flat [3, nAtoms] positions.
} ForceInput;

/**
 * @brief Data structure to store results from force calls.
 * @ingroup rpmd
 */
typedef struct {
  double *F;     //!< Pointer to the flat [3, nAtoms] force array.
  double energy; //!< Potential energy of the configuration.
} ForceOut;

} // namespace rpmd
