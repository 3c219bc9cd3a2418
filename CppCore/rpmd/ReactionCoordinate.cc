// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Implementation of the reaction coordinate evaluator.
 */

#include <cmath>
#include <utility>

#include <fmt/core.h>

#include "rpmd/ReactionCoordinate.hpp"
#include "rpmd/errors.hpp"
#include "rpmd/types/adapters/eigen.hpp"

namespace rpmd {

namespace eig = types::adapt::eigen;

/**
 * @details
 * The three callables are evaluated in the order value, gradient, Hessian.
 * The returned arrays are checked against the centroid so that a surface
 * written for a different system is reported instead of read out of bounds.
 */
SurfaceEvaluation
DividingSurface::evaluate(const types::AtomMatrix &centroid) const {
  SurfaceEvaluation out;
  out.value = value(centroid);
  out.gradient = gradient(centroid);
  out.hessian = hessian(centroid);
  if (!out.gradient.same_shape(centroid)) {
    throw ShapeMismatch(fmt::format(
        "Dividing surface gradient is [{}, {}] for a [{}, {}] centroid",
        out.gradient.rows(), out.gradient.cols(), centroid.rows(),
        centroid.cols()));
  }
  if (out.hessian.natoms() != centroid.natoms()) {
    throw ShapeMismatch(fmt::format(
        "Dividing surface Hessian covers {} atoms for a {} atom centroid",
        out.hessian.natoms(), centroid.natoms()));
  }
  return out;
}

bool ReactionCoordinateValue::finite() const {
  return std::isfinite(xi) && dxi.all_finite() && d2xi.all_finite();
}

ReactionCoordinate::ReactionCoordinate(ReactionCoordinateMode mode,
                                       DividingSurface reactants,
                                       DividingSurface transitionState)
    : m_mode(mode), m_reactants(std::move(reactants)),
      m_transitionState(std::move(transitionState)) {
  validate_mode(m_mode);
}

ReactionCoordinate::ReactionCoordinate(const SystemParameters &params,
                                       DividingSurface reactants,
                                       DividingSurface transitionState)
    : ReactionCoordinate(params.mode, std::move(reactants),
                         std::move(transitionState)) {}

ReactionCoordinateValue
ReactionCoordinate::evaluate(const types::AtomMatrix &centroid,
                             double xi_current) const {
  const SurfaceEvaluation s0 = m_reactants.evaluate(centroid);
  const SurfaceEvaluation s1 = m_transitionState.evaluate(centroid);

  switch (m_mode) {
  case ReactionCoordinateMode::UmbrellaIntegration:
    return umbrella_integration(s0, s1);
  case ReactionCoordinateMode::RecrossingFactor:
    return recrossing_factor(s0, s1, xi_current);
  }
  throw ConfigurationError(fmt::format(
      "Invalid mode {} encountered in reaction coordinate evaluation",
      static_cast<int>(m_mode)));
}

/**
 * @details
 * With @f$D = s_0 - s_1@f$ and @f$N_a = s_0\partial_a s_1 - s_1\partial_a
 * s_0@f$, the gradient is @f$N_a/D^2@f$ and differentiating once more gives
 *
 * @f[
 * H_{ab} = \frac{\partial_b N_a\, D - 2 N_a \partial_b D}{D^3}, \qquad
 * \partial_b N_a = s_0 H^{(1)}_{ab} + \partial_b s_0 \partial_a s_1
 *                - \partial_b s_1 \partial_a s_0 - s_1 H^{(0)}_{ab}.
 * @f]
 *
 * The expression is kept in this expanded form.
 */
ReactionCoordinateValue
ReactionCoordinate::umbrella_integration(const SurfaceEvaluation &s0,
                                         const SurfaceEvaluation &s1) {
  const size_t nAtoms = s0.gradient.natoms();
  ReactionCoordinateValue rc{0.0, types::AtomMatrix::Zero(nAtoms),
                             types::HessianTensor(nAtoms)};

  const auto ds0 = eig::asVector(s0.gradient);
  const auto ds1 = eig::asVector(s1.gradient);
  const auto d2s0 = eig::asMatrix(s0.hessian);
  const auto d2s1 = eig::asMatrix(s1.hessian);

  const double denom = s0.value - s1.value;
  const Eigen::VectorXd numer = s0.value * ds1 - s1.value * ds0;

  rc.xi = s0.value / denom;
  eig::asVector(rc.dxi) = numer / (denom * denom);
  eig::asMatrix(rc.d2xi) =
      ((s0.value * d2s1 + ds1 * ds0.transpose() - ds0 * ds1.transpose() -
        s1.value * d2s0) *
           denom -
       2.0 * numer * (ds0 - ds1).transpose()) /
      (denom * denom * denom);
  return rc;
}

ReactionCoordinateValue
ReactionCoordinate::recrossing_factor(const SurfaceEvaluation &s0,
                                      const SurfaceEvaluation &s1,
                                      double xi_current) {
  const size_t nAtoms = s0.gradient.natoms();
  ReactionCoordinateValue rc{0.0, types::AtomMatrix::Zero(nAtoms),
                             types::HessianTensor(nAtoms)};

  rc.xi = xi_current * s1.value + (1 - xi_current) * s0.value;
  eig::asVector(rc.dxi) = xi_current * eig::asVector(s1.gradient) +
                          (1 - xi_current) * eig::asVector(s0.gradient);
  eig::asMatrix(rc.d2xi) = xi_current * eig::asMatrix(s1.hessian) +
                           (1 - xi_current) * eig::asMatrix(s0.hessian);
  return rc;
}

} // namespace rpmd
