#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief RPMD velocity Verlet integrator.
 *
 * One call to @c VelocityVerlet::step advances a @c SimulationState by one
 * time step:
 *
 * 1. half kick with the stored potential gradient;
 * 2. drift, with the ring polymer springs propagated exactly;
 * 3. reaction coordinate refresh at the new centroid;
 * 4. potential and gradient refresh at the new positions;
 * 5. half kick with the new gradient;
 * 6. time advance.
 *
 * @note There is no rollback. A driver that wants to retry a step after a
 * failure must restore its own copy of the state.
 */

#include <cstddef>

#include "rpmd/ReactionCoordinate.hpp"
#include "rpmd/RingPolymerPotential.hpp"
#include "rpmd/RingPolymerPropagator.hpp"
#include "rpmd/SimulationState.hpp"
#include "rpmd/SystemParameters.hpp"
#include "rpmd/types/AtomMatrix.hpp"

namespace rpmd {

/**
 * @brief Outcome of a time step.
 */
enum class StepStatus {
  Success = 0,             //!< Step completed with finite values.
  NumericalSingularity = 1 //!< The reaction coordinate is not finite.
};

/**
 * @brief Converts a non-success status into an exception.
 * @param status The status returned by the stepper.
 * @return Void.
 * @throws rpmd::NumericalSingularity unless @a status is @c Success.
 */
void check_status(StepStatus status);

/**
 * @class VelocityVerlet
 * @brief Stateless stepper over a caller-owned @c SimulationState.
 *
 * Owns a transform plan and scratch buffers, so each trajectory needs its
 * own instance.
 */
class VelocityVerlet {
public:
  /**
   * @brief Constructor.
   * @param params Run parameters; validated here.
   * @param nBeads Number of beads per atom.
   * @param potential Ring polymer potential evaluator.
   * @param reactionCoordinate Reaction coordinate evaluator.
   * @throws rpmd::ConfigurationError on invalid parameters or a mode
   * mismatch between @a params and @a reactionCoordinate.
   */
  VelocityVerlet(const SystemParameters &params, size_t nBeads,
                 BeadPotentialFn potential,
                 ReactionCoordinate reactionCoordinate);

  /**
   * @brief Evaluates V, dVdq and the reaction coordinate without moving.
   *
   * Call once on a fresh state so the first half kick sees a valid
   * gradient.
   *
   * @param state State to refresh in place.
   * @param xi_current Reaction coordinate interpolation parameter.
   * @return The status of the reaction coordinate evaluation.
   * @throws rpmd::ShapeMismatch if @a state does not match the
   * configuration.
   */
  StepStatus initialize(SimulationState &state, double xi_current);

  /**
   * @brief Advances @a state by one time step.
   * @param state State to update in place.
   * @param xi_current Reaction coordinate interpolation parameter.
   * @return @c Success, or @c NumericalSingularity when the refreshed
   * reaction coordinate is not finite. The state is fully updated either
   * way.
   * @throws rpmd::ShapeMismatch before any mutation if @a state does not
   * match the configuration; exceptions from the potential propagate.
   */
  StepStatus step(SimulationState &state, double xi_current);

  [[nodiscard]] const SystemParameters &parameters() const {
    return m_params;
  }
  [[nodiscard]] size_t nbeads() const { return m_beads; }

private:
  void half_kick(SimulationState &state) const;
  StepStatus refresh(SimulationState &state, double xi_current);

  SystemParameters m_params;
  size_t m_beads;
  BeadPotentialFn m_potential;
  ReactionCoordinate m_rc;
  FreeRingPolymerPropagator m_propagator;
  types::AtomMatrix m_centroid; //!< Scratch centroid buffer.
};

} // namespace rpmd
