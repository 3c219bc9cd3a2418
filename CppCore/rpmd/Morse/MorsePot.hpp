#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Header file for the pairwise Morse potential class.
 *
 * @f$U = \sum_{i<j} D_e\left(1 - e^{-a(r_{ij} - r_e)}\right)^2@f$, a simple
 * anharmonic bond model with a dissociation limit.
 */

#include "rpmd/Potential.hpp"

namespace rpmd {

/**
 * @class MorsePot
 * @brief Pairwise Morse potential with identical parameters for all pairs.
 * @ingroup rpmd_potentials
 */
class MorsePot : public Potential<MorsePot> {
public:
  /**
   * @brief Constructor.
   * @param de Well depth.
   * @param a Range parameter.
   * @param re Equilibrium separation.
   */
  MorsePot(double de = 1.0, double a = 1.0, double re = 1.0)
      : Potential(PotType::Morse), m_de{de}, m_a{a}, m_re{re} {}

  /**
   * @brief Computes the forces and energy for a given configuration.
   * @param in Structure containing coordinates.
   * @param out Pointer to the results structure.
   * @return Void.
   */
  void forceImpl(const ForceInput &in, ForceOut *out) const override;

  [[nodiscard]] std::vector<double> get_parameters() const override {
    return {m_de, m_a, m_re};
  }

private:
  double m_de; //!< Well depth.
  double m_a;  //!< Inverse range.
  double m_re; //!< Equilibrium bond length.
};

} // namespace rpmd
