#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Dividing surface in the reactant asymptotic region.
 *
 * @f$s_0 = R_\infty - |R_A - R_B|@f$ where @f$R_A@f$ and @f$R_B@f$ are the
 * centers of mass of the two reactant fragments. The surface is zero when
 * the fragments are @f$R_\infty@f$ apart and positive closer in.
 */

#include <cstddef>
#include <vector>

#include "rpmd/types/AtomMatrix.hpp"
#include "rpmd/types/HessianTensor.hpp"

namespace rpmd {
namespace surfaces {

/**
 * @class ReactantsSurface
 * @brief Fragment separation surface @f$s_0@f$.
 */
class ReactantsSurface {
public:
  /**
   * @brief Constructor.
   * @param masses Per-atom masses of the whole system.
   * @param fragmentA Atom indices of the first reactant.
   * @param fragmentB Atom indices of the second reactant.
   * @param Rinf Separation at which the surface is placed.
   * @throws rpmd::ConfigurationError for empty or overlapping fragments,
   * out-of-range indices or a non-positive @a Rinf.
   */
  ReactantsSurface(const std::vector<double> &masses,
                   const std::vector<size_t> &fragmentA,
                   const std::vector<size_t> &fragmentB, double Rinf);

  double value(const types::AtomMatrix &centroid) const;
  types::AtomMatrix gradient(const types::AtomMatrix &centroid) const;
  types::HessianTensor hessian(const types::AtomMatrix &centroid) const;

private:
  void check_centroid(const types::AtomMatrix &centroid) const;

  std::vector<double> m_weights; //!< m_i/M_A on A, -m_i/M_B on B, else 0.
  double m_Rinf;                 //!< Asymptotic separation.
};

} // namespace surfaces
} // namespace rpmd
