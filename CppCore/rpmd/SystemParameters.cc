// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Validation and mode name handling for SystemParameters.
 */

#include <cmath>

#include <fmt/core.h>

#include "rpmd/SystemParameters.hpp"
#include "rpmd/errors.hpp"

namespace rpmd {

ReactionCoordinateMode parse_mode(const std::string &name) {
  if (name == "umbrella-integration") {
    return ReactionCoordinateMode::UmbrellaIntegration;
  }
  if (name == "recrossing-factor") {
    return ReactionCoordinateMode::RecrossingFactor;
  }
  throw ConfigurationError(
      fmt::format("Invalid reaction coordinate mode '{}'", name));
}

void validate_mode(ReactionCoordinateMode mode) {
  switch (mode) {
  case ReactionCoordinateMode::UmbrellaIntegration:
  case ReactionCoordinateMode::RecrossingFactor:
    return;
  }
  throw ConfigurationError(fmt::format("Invalid reaction coordinate mode {}",
                                       static_cast<int>(mode)));
}

std::string to_string(ReactionCoordinateMode mode) {
  validate_mode(mode);
  return mode == ReactionCoordinateMode::UmbrellaIntegration
             ? "umbrella-integration"
             : "recrossing-factor";
}

void SystemParameters::validate() const {
  if (!(dt > 0.0) || !std::isfinite(dt)) {
    throw ConfigurationError(
        fmt::format("Time step must be positive, got {}", dt));
  }
  if (!(beta > 0.0) || !std::isfinite(beta)) {
    throw ConfigurationError(
        fmt::format("Inverse temperature must be positive, got {}", beta));
  }
  if (masses.empty()) {
    throw ConfigurationError("Can't work with zero atoms");
  }
  for (size_t idx{0}; idx < masses.size(); ++idx) {
    if (!(masses[idx] > 0.0)) {
      throw ConfigurationError(fmt::format(
          "Mass of atom {} must be positive, got {}", idx, masses[idx]));
    }
  }
  validate_mode(mode);
}

void SystemParameters::validate_beads(size_t nBeads) const {
  if (nBeads == 0) {
    throw ConfigurationError("Can't work with zero beads per atom");
  }
}

} // namespace rpmd
