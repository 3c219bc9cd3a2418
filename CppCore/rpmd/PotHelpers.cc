// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Implementation of utility functions for potential management.
 */

#include "PotHelpers.hpp"
#include "rpmd/errors.hpp"

namespace rpmd {

/**
 * @details
 * Clears the energy and all @c 3*nAtoms force components.
 */
void zeroForceOut(const size_t &nAtoms, ForceOut *efvd) {
  efvd->energy = 0;
  for (size_t idx{0}; idx < 3 * nAtoms; idx++) {
    efvd->F[idx] = 0;
  }
}

/**
 * @details
 * Verifies that the input describes at least one atom and actually points
 * at coordinates.
 *
 * @warning Throws @c rpmd::InvalidInput otherwise.
 */
void checkParams(const ForceInput &params) {
  if (params.nAtoms == 0) {
    throw InvalidInput("Can't work with zero atoms in force call");
  }
  if (params.pos == nullptr) {
    throw InvalidInput("Force call made without positions");
  }
}

} // namespace rpmd
