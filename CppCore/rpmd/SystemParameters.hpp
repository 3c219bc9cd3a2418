#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Run-wide configuration shared by every rpmd component.
 *
 * A @c SystemParameters value is built once, validated, and then passed by
 * const reference to the constructors of the propagator, the reaction
 * coordinate evaluator and the stepper. It is never mutated afterwards and
 * can be shared freely between independent trajectories.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace rpmd {

/**
 * @brief Functional form used to build the reaction coordinate from the two
 * dividing surfaces.
 */
enum class ReactionCoordinateMode {
  UmbrellaIntegration = 1, //!< xi = s0 / (s0 - s1)
  RecrossingFactor = 2     //!< xi = x s1 + (1 - x) s0
};

/**
 * @brief Parses a mode from its configuration name.
 * @param name Either @c "umbrella-integration" or @c "recrossing-factor".
 * @return The matching mode.
 * @throws rpmd::ConfigurationError for any other name.
 */
ReactionCoordinateMode parse_mode(const std::string &name);

/**
 * @brief Configuration name of a mode.
 * @param mode The mode to name.
 * @return The name accepted by @c parse_mode.
 * @throws rpmd::ConfigurationError if @a mode is not an enumerator.
 */
std::string to_string(ReactionCoordinateMode mode);

/**
 * @brief Rejects values cast into the enumeration from other integers.
 * @param mode The mode to check.
 * @return Void.
 * @throws rpmd::ConfigurationError if @a mode is not an enumerator.
 */
void validate_mode(ReactionCoordinateMode mode);

/**
 * @class SystemParameters
 * @brief Immutable run parameters.
 */
struct SystemParameters {
  double dt{0.0};             //!< Time step.
  double beta{0.0};           //!< Inverse temperature 1/(k_B T).
  std::vector<double> masses; //!< Per-atom mass, one entry per atom.
  ReactionCoordinateMode mode{ReactionCoordinateMode::UmbrellaIntegration};

  /**
   * @brief Number of atoms described by the parameters.
   * @return The length of @c masses.
   */
  [[nodiscard]] size_t natoms() const { return masses.size(); }

  /**
   * @brief Checks every parameter.
   * @return Void.
   * @throws rpmd::ConfigurationError on a non-positive time step,
   * temperature or mass, an empty atom list, or an unrecognized mode.
   */
  void validate() const;

  /**
   * @brief Checks a bead count against the parameters.
   * @param nBeads Number of beads per atom.
   * @return Void.
   * @throws rpmd::ConfigurationError when @a nBeads is zero.
   */
  void validate_beads(size_t nBeads) const;
};

} // namespace rpmd
