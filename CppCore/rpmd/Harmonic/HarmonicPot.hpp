#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Header file for the harmonic tether potential class.
 *
 * Every atom is bound to a common anchor point by an isotropic spring,
 * @f$U = \sum_j \frac{1}{2} k |r_j - r_0|^2@f$.
 */

#include <array>

#include "rpmd/Potential.hpp"

namespace rpmd {

/**
 * @class HarmonicPot
 * @brief Isotropic harmonic well centred on a fixed anchor.
 * @ingroup rpmd_potentials
 */
class HarmonicPot : public Potential<HarmonicPot> {
public:
  /**
   * @brief Constructor.
   * @param k Spring constant.
   * @param anchor Position of the well minimum.
   */
  explicit HarmonicPot(double k = 1.0,
                       std::array<double, 3> anchor = {0.0, 0.0, 0.0})
      : Potential(PotType::Harmonic), m_k{k}, m_anchor{anchor} {}

  /**
   * @brief Computes the forces and energy for a given configuration.
   * @param in Structure containing coordinates.
   * @param out Pointer to the results structure.
   * @return Void.
   */
  void forceImpl(const ForceInput &in, ForceOut *out) const override;

  [[nodiscard]] std::vector<double> get_parameters() const override {
    return {m_k, m_anchor[0], m_anchor[1], m_anchor[2]};
  }

private:
  double m_k;                     //!< Spring constant.
  std::array<double, 3> m_anchor; //!< Well minimum.
};

} // namespace rpmd
