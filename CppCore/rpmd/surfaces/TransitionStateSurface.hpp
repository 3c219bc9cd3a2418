#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Dividing surface at the transition state of a bond exchange.
 *
 * @f$s_1 = \sum_{\text{breaking}} (r_{ij} - r^\ddagger_{ij})
 *        - \sum_{\text{forming}} (r_{ij} - r^\ddagger_{ij})@f$,
 * which vanishes at the transition state geometry, is positive on the
 * product side and negative on the reactant side.
 */

#include <cstddef>
#include <vector>

#include "rpmd/types/AtomMatrix.hpp"
#include "rpmd/types/HessianTensor.hpp"

namespace rpmd {
namespace surfaces {

/**
 * @brief A bond and its length at the transition state.
 */
struct BondCoordinate {
  size_t i;         //!< First atom.
  size_t j;         //!< Second atom.
  double r_ts;      //!< Bond length at the transition state.
};

/**
 * @class TransitionStateSurface
 * @brief Bond-difference surface @f$s_1@f$.
 */
class TransitionStateSurface {
public:
  /**
   * @brief Constructor.
   * @param nAtoms Number of atoms in the system.
   * @param forming Bonds formed in the reaction.
   * @param breaking Bonds broken in the reaction.
   * @throws rpmd::ConfigurationError if no bond is given or a bond names an
   * invalid atom pair.
   */
  TransitionStateSurface(size_t nAtoms, std::vector<BondCoordinate> forming,
                         std::vector<BondCoordinate> breaking);

  double value(const types::AtomMatrix &centroid) const;
  types::AtomMatrix gradient(const types::AtomMatrix &centroid) const;
  types::HessianTensor hessian(const types::AtomMatrix &centroid) const;

private:
  void check_centroid(const types::AtomMatrix &centroid) const;

  size_t m_atoms;
  std::vector<BondCoordinate> m_forming;
  std::vector<BondCoordinate> m_breaking;
};

} // namespace surfaces
} // namespace rpmd
