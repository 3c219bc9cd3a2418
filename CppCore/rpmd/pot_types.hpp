/**
 * @brief Definitions for the bundled potential energy surface types.
 *
 * The @c PotType enumeration identifies a potential in force-call
 * statistics and in cache keys.
 *
 * @note The bundled models are harmonic and pairwise analytic forms meant
 * for tests and small demonstrations. Production surfaces are provided by
 * the driver through the same @c Potential interface.
 */

#pragma once
// MIT License
// Copyright 2023--present rpmd developers

namespace rpmd {

/**
 * @brief Supported potential energy surface types.
 */
enum class PotType {
  UNKNOWN = 0, //!<  The type is not defined or is invalid.
  Harmonic,    //!<  Isotropic harmonic tether to a fixed point.
  Morse        //!<  Pairwise Morse bond potential.
};

} // namespace rpmd
