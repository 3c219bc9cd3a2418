#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Reaction coordinate built from two dividing surfaces.
 *
 * The reactants surface @f$s_0@f$ and the transition state surface
 * @f$s_1@f$ are combined in one of two ways, selected by
 * @c ReactionCoordinateMode:
 *
 * - umbrella integration: @f$\xi = s_0/(s_0 - s_1)@f$, which runs from 0
 *   in the reactant asymptote to 1 at the transition state;
 * - recrossing factor: @f$\xi = x s_1 + (1 - x) s_0@f$ for a fixed
 *   interpolation parameter @f$x@f$.
 *
 * Gradients and Hessians are the exact analytic derivatives of these forms.
 */

#include "rpmd/DividingSurface.hpp"
#include "rpmd/SystemParameters.hpp"
#include "rpmd/types/AtomMatrix.hpp"
#include "rpmd/types/HessianTensor.hpp"

namespace rpmd {

/**
 * @brief Reaction coordinate value, gradient and Hessian.
 */
struct ReactionCoordinateValue {
  double xi{0.0};              //!< Value.
  types::AtomMatrix dxi;       //!< Gradient [3, nAtoms].
  types::HessianTensor d2xi;   //!< Hessian [3, nAtoms, 3, nAtoms].

  /**
   * @brief Whether every component is finite.
   * @return False once the value, gradient or Hessian holds NaN or inf.
   */
  [[nodiscard]] bool finite() const;
};

/**
 * @class ReactionCoordinate
 * @brief Evaluates the reaction coordinate at a centroid configuration.
 */
class ReactionCoordinate {
public:
  /**
   * @brief Constructor.
   * @param mode Functional form to use.
   * @param reactants Reactants dividing surface, @f$s_0@f$.
   * @param transitionState Transition state dividing surface, @f$s_1@f$.
   * @throws rpmd::ConfigurationError for an unrecognized @a mode.
   */
  ReactionCoordinate(ReactionCoordinateMode mode, DividingSurface reactants,
                     DividingSurface transitionState);

  /**
   * @brief Constructor taking the mode from the run parameters.
   * @param params Run parameters; only the mode is used.
   * @param reactants Reactants dividing surface, @f$s_0@f$.
   * @param transitionState Transition state dividing surface, @f$s_1@f$.
   */
  ReactionCoordinate(const SystemParameters &params,
                     DividingSurface reactants,
                     DividingSurface transitionState);

  /**
   * @brief Evaluates both surfaces and combines them.
   *
   * In umbrella integration mode a configuration with @f$s_0 = s_1@f$ is
   * not special-cased; the division yields inf or NaN, which callers detect
   * through @c ReactionCoordinateValue::finite.
   *
   * @param centroid Centroid positions [3, nAtoms].
   * @param xi_current Interpolation parameter (recrossing factor mode only).
   * @return The reaction coordinate triple.
   * @throws rpmd::ShapeMismatch if a surface returns mis-shaped arrays.
   */
  ReactionCoordinateValue evaluate(const types::AtomMatrix &centroid,
                                   double xi_current) const;

  /**
   * @brief Umbrella integration combination @f$s_0/(s_0 - s_1)@f$.
   * @param s0 Reactants surface evaluation.
   * @param s1 Transition state surface evaluation.
   * @return Value, gradient (quotient rule) and Hessian.
   */
  static ReactionCoordinateValue
  umbrella_integration(const SurfaceEvaluation &s0,
                       const SurfaceEvaluation &s1);

  /**
   * @brief Recrossing factor combination @f$x s_1 + (1 - x) s_0@f$.
   * @param s0 Reactants surface evaluation.
   * @param s1 Transition state surface evaluation.
   * @param xi_current Interpolation parameter @f$x@f$.
   * @return Value, gradient and Hessian blended alike.
   */
  static ReactionCoordinateValue
  recrossing_factor(const SurfaceEvaluation &s0, const SurfaceEvaluation &s1,
                    double xi_current);

  [[nodiscard]] ReactionCoordinateMode mode() const { return m_mode; }

private:
  ReactionCoordinateMode m_mode;
  DividingSurface m_reactants;
  DividingSurface m_transitionState;
};

} // namespace rpmd
