#pragma once
// MIT License
// Copyright 2023--present rpmd developers
#include "ForceStructs.hpp"
#include <cstddef>

/**
 * @brief Utility templates and functions for potential management.
 *
 * Defines a static per-potential force call counter, plus helpers for
 * structure initialization and validation.
 */

namespace rpmd {

/**
 * @class registry
 * @brief Static force call statistics for a derived potential class.
 *
 * A ring polymer of N beads costs N force calls per time step.
 */
template <typename T> class registry {
public:
  static size_t forceCalls; //!< Global counter for force evaluations.

  /**
   * @brief Increments the force call counter.
   * @return Void.
   */
  static void incrementForceCalls() { ++forceCalls; }

  /**
   * @brief Resets the force call counter, e.g. between trajectories.
   * @return Void.
   */
  static void resetForceCalls() { forceCalls = 0; }
};

template <typename T> size_t registry<T>::forceCalls = 0;

/**
 * @brief Zeroes the members of a ForceOut structure.
 * @param nAtoms The number of atoms.
 * @param efvd The results structure to reset.
 * @return Void.
 */
void zeroForceOut(const size_t &nAtoms, ForceOut *efvd);

/**
 * @brief Validates the input parameters for a potential calculation.
 * @param params The configuration structure to check.
 * @return Void.
 */
void checkParams(const ForceInput &params);

} // namespace rpmd
