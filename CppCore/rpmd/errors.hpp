#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Exception hierarchy for the rpmd core.
 *
 * All errors raised by the library derive from @c rpmd::Error, which is a
 * @c std::runtime_error, so callers may catch at whichever granularity they
 * need.
 */

#include <stdexcept>
#include <string>

namespace rpmd {

/**
 * @class Error
 * @brief Base class for all rpmd exceptions.
 */
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @class ConfigurationError
 * @brief Invalid run parameters (time step, temperature, masses, counts or
 * reaction coordinate mode).
 */
class ConfigurationError : public Error {
public:
  using Error::Error;
};

/**
 * @class InvalidInput
 * @brief An argument passed to an otherwise well configured component is
 * unusable.
 */
class InvalidInput : public Error {
public:
  using Error::Error;
};

/**
 * @class ShapeMismatch
 * @brief Array dimensions disagree with each other or with the run
 * configuration.
 */
class ShapeMismatch : public InvalidInput {
public:
  using InvalidInput::InvalidInput;
};

/**
 * @class NumericalSingularity
 * @brief The reaction coordinate could not be evaluated to a finite value.
 *
 * Only raised by @c rpmd::check_status; the stepper itself reports the
 * condition through @c StepStatus.
 */
class NumericalSingularity : public Error {
public:
  using Error::Error;
};

} // namespace rpmd
