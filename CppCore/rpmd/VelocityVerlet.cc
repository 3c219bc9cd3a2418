// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Implementation of the RPMD velocity Verlet step.
 */

#include <utility>

#include <fmt/core.h>

#include "rpmd/Geometry.hpp"
#include "rpmd/VelocityVerlet.hpp"
#include "rpmd/errors.hpp"

namespace rpmd {

void check_status(StepStatus status) {
  switch (status) {
  case StepStatus::Success:
    return;
  case StepStatus::NumericalSingularity:
    throw NumericalSingularity(
        "Reaction coordinate is not finite; the dividing surfaces coincide");
  }
  throw Error(fmt::format("Unknown step status {}", static_cast<int>(status)));
}

VelocityVerlet::VelocityVerlet(const SystemParameters &params, size_t nBeads,
                               BeadPotentialFn potential,
                               ReactionCoordinate reactionCoordinate)
    : m_params(params), m_beads(nBeads), m_potential(std::move(potential)),
      m_rc(std::move(reactionCoordinate)), m_propagator(params, nBeads),
      m_centroid(types::AtomMatrix::Zero(params.natoms())) {
  if (!m_potential) {
    throw ConfigurationError("VelocityVerlet needs a potential evaluator");
  }
  if (m_rc.mode() != m_params.mode) {
    throw ConfigurationError(fmt::format(
        "Reaction coordinate uses mode {} but the run is configured for {}",
        to_string(m_rc.mode()), to_string(m_params.mode)));
  }
}

StepStatus VelocityVerlet::initialize(SimulationState &state,
                                      double xi_current) {
  state.check_shape(m_params.natoms(), m_beads);
  return refresh(state, xi_current);
}

StepStatus VelocityVerlet::step(SimulationState &state, double xi_current) {
  state.check_shape(m_params.natoms(), m_beads);

  half_kick(state);
  m_propagator.propagate(state.p, state.q);
  const StepStatus status = refresh(state, xi_current);
  half_kick(state);
  state.t += m_params.dt;

  if (status != StepStatus::Success) {
    fmt::print(stderr,
               "Warning: non-finite reaction coordinate xi = {} at t = {}\n",
               state.xi, state.t);
  }
  return status;
}

void VelocityVerlet::half_kick(SimulationState &state) const {
  state.p.add_scaled(state.dVdq, -0.5 * m_params.dt);
}

/**
 * @details
 * The reaction coordinate is evaluated before the potential, matching the
 * order of the step. The potential is free to reallocate its outputs, so
 * their shapes are checked again before the next kick reads them.
 */
StepStatus VelocityVerlet::refresh(SimulationState &state, double xi_current) {
  get_centroid(state.q, m_centroid);
  ReactionCoordinateValue rc = m_rc.evaluate(m_centroid, xi_current);
  const bool finite = rc.finite();
  state.xi = rc.xi;
  state.dxi = std::move(rc.dxi);
  state.d2xi = std::move(rc.d2xi);

  m_potential(state.q, state.V, state.dVdq);
  state.check_shape(m_params.natoms(), m_beads);

  return finite ? StepStatus::Success : StepStatus::NumericalSingularity;
}

} // namespace rpmd
