#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Base classes and templates for single configuration potentials.
 *
 * Provides the abstract interface and CRTP template for potential energy
 * surfaces evaluated on one classical configuration. Ring polymers are
 * handled one bead at a time by @c RingPolymerPotential.
 */

// clang-format off
#include <utility>
#include <vector>
#include <stdexcept>
// clang-format on

#include <fmt/core.h>

#include "rpmd/ForceStructs.hpp"
#include "rpmd/PotHelpers.hpp"
#include "rpmd/errors.hpp"
#include "rpmd/pot_types.hpp"
#include "rpmd/types/AtomMatrix.hpp"

namespace rpmd {

using types::AtomMatrix;

/**
 * @class PotentialBase
 * @brief Abstract base class for all potential energy surfaces.
 */
class PotentialBase {
public:
  /**
   * @brief Constructor for PotentialBase.
   * @param inp_type The type of the potential.
   */
  explicit PotentialBase(PotType inp_type) : m_type(inp_type) {}

  virtual ~PotentialBase() = default;

  /**
   * @brief Main interface for potential and force calculation.
   * @param positions The [3, nAtoms] coordinates of one configuration.
   * @return A pair containing the energy and the [3, nAtoms] forces.
   */
  virtual std::pair<double, AtomMatrix>
  operator()(const AtomMatrix &positions) = 0;

  /**
   * @brief Fetches the potential type.
   * @return The potential type.
   */
  [[nodiscard]] PotType get_type() const { return m_type; }

  /**
   * @brief Model parameters that change the energy surface.
   * @return The parameter values, empty for parameter-free surfaces.
   */
  [[nodiscard]] virtual std::vector<double> get_parameters() const {
    return {};
  }

protected:
  PotType m_type; //!< The type of the potential energy surface.
};

/**
 * @class Potential
 * @brief Template class for specific potential implementations.
 *
 * Uses the Curiously Recurring Template Pattern to provide static
 * polymorphism for the internal @c forceImpl call and per-type force call
 * statistics through @c registry.
 */
template <typename Derived>
class Potential : public PotentialBase, public registry<Derived> {
public:
  using PotentialBase::PotentialBase;

  /**
   * @brief Runs @c forceImpl on the flat storage of @a positions.
   * @param positions The [3, nAtoms] coordinates.
   * @return A pair containing the energy and the force matrix.
   * @throws rpmd::ShapeMismatch if @a positions does not have three rows.
   */
  std::pair<double, AtomMatrix>
  operator()(const AtomMatrix &positions) override {
    if (positions.rows() != 3) {
      throw ShapeMismatch(fmt::format(
          "Positions must have 3 rows (axes), got {}", positions.rows()));
    }
    const size_t nAtoms = positions.natoms();
    AtomMatrix forces = AtomMatrix::Zero(nAtoms);

    ForceInput fi{.nAtoms = nAtoms, .pos = positions.data()};
    ForceOut fo{.F = forces.data(), .energy = 0.0};
    checkParams(fi);

    static_cast<Derived *>(this)->forceImpl(fi, &fo);
    registry<Derived>::incrementForceCalls();

    return {fo.energy, forces};
  }

  /**
   * @brief Abstract hook for the actual implementation.
   * @param in Structure containing coordinates.
   * @param out Pointer to the results structure.
   * @return Void.
   */
  virtual void forceImpl(const ForceInput &in, ForceOut *out) const = 0;
};

} // namespace rpmd
