#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Type-erased handle around a dividing surface model.
 *
 * A dividing surface is a scalar field over centroid positions. Any type
 * providing
 *
 * @code
 * double value(const AtomMatrix &centroid) const;
 * AtomMatrix gradient(const AtomMatrix &centroid) const;
 * HessianTensor hessian(const AtomMatrix &centroid) const;
 * @endcode
 *
 * can be wrapped; no common base class is needed.
 */

#include <functional>
#include <memory>
#include <utility>

#include "rpmd/types/AtomMatrix.hpp"
#include "rpmd/types/HessianTensor.hpp"

namespace rpmd {

/**
 * @brief Value, gradient and Hessian of one surface at one centroid.
 */
struct SurfaceEvaluation {
  double value{0.0};              //!< Surface value.
  types::AtomMatrix gradient;     //!< Gradient [3, nAtoms].
  types::HessianTensor hessian;   //!< Hessian [3, nAtoms, 3, nAtoms].
};

/**
 * @class DividingSurface
 * @brief Copyable handle dispatching to a wrapped surface implementation.
 */
class DividingSurface final {
public:
  using ValueFn = std::function<double(const types::AtomMatrix &)>;
  using GradientFn =
      std::function<types::AtomMatrix(const types::AtomMatrix &)>;
  using HessianFn =
      std::function<types::HessianTensor(const types::AtomMatrix &)>;

  /**
   * @brief Builds a handle from three callables.
   * @param value Evaluates the surface value.
   * @param gradient Evaluates the gradient.
   * @param hessian Evaluates the Hessian.
   */
  DividingSurface(ValueFn value, GradientFn gradient, HessianFn hessian)
      : m_value(std::move(value)), m_gradient(std::move(gradient)),
        m_hessian(std::move(hessian)) {}

  /**
   * @brief Wraps a surface owned by the caller.
   *
   * The caller @b must keep @a impl alive for the lifetime of the handle
   * and of every copy made from it.
   *
   * @tparam Impl A type exposing @c value, @c gradient and @c hessian.
   * @param impl Reference to the surface object.
   * @return A handle forwarding to @a impl.
   */
  template <typename Impl> static DividingSurface from_impl(const Impl &impl) {
    const Impl *self = &impl;
    return DividingSurface(
        [self](const types::AtomMatrix &c) { return self->value(c); },
        [self](const types::AtomMatrix &c) { return self->gradient(c); },
        [self](const types::AtomMatrix &c) { return self->hessian(c); });
  }

  /**
   * @brief Wraps a surface with shared ownership.
   * @tparam Impl A type exposing @c value, @c gradient and @c hessian.
   * @param impl Shared pointer kept alive by the handle.
   * @return A handle forwarding to @a impl.
   */
  template <typename Impl>
  static DividingSurface from_shared(std::shared_ptr<Impl> impl) {
    return DividingSurface(
        [impl](const types::AtomMatrix &c) { return impl->value(c); },
        [impl](const types::AtomMatrix &c) { return impl->gradient(c); },
        [impl](const types::AtomMatrix &c) { return impl->hessian(c); });
  }

  double value(const types::AtomMatrix &centroid) const {
    return m_value(centroid);
  }

  types::AtomMatrix gradient(const types::AtomMatrix &centroid) const {
    return m_gradient(centroid);
  }

  types::HessianTensor hessian(const types::AtomMatrix &centroid) const {
    return m_hessian(centroid);
  }

  /**
   * @brief Evaluates value, gradient and Hessian together.
   * @param centroid Centroid positions [3, nAtoms].
   * @return The three quantities.
   * @throws rpmd::ShapeMismatch if the surface returns arrays that do not
   * match @a centroid.
   */
  SurfaceEvaluation evaluate(const types::AtomMatrix &centroid) const;

private:
  ValueFn m_value;
  GradientFn m_gradient;
  HessianFn m_hessian;
};

} // namespace rpmd
