#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Reductions over bead-resolved positions and momenta.
 *
 * Free functions without shared state. Masses are per atom; every bead of
 * an atom carries the same mass.
 */

#include <array>
#include <vector>

#include "rpmd/SimulationState.hpp"
#include "rpmd/SystemParameters.hpp"
#include "rpmd/types/AtomMatrix.hpp"
#include "rpmd/types/BeadArray.hpp"

namespace rpmd {

/**
 * @brief Bead-averaged position of each atom.
 * @param q Positions [3, nAtoms, nBeads].
 * @return Centroid [3, nAtoms].
 */
types::AtomMatrix get_centroid(const types::BeadArray &q);

/**
 * @brief Bead-averaged position of each atom, written into a caller buffer.
 * @param q Positions [3, nAtoms, nBeads].
 * @param centroid Output [3, nAtoms]; resized if needed.
 * @return Void.
 */
void get_centroid(const types::BeadArray &q, types::AtomMatrix &centroid);

/**
 * @brief Center of mass of the ring polymer system.
 *
 * Normalized by the total mass and the bead count, so that the result
 * equals the center of mass of the centroids.
 *
 * @param q Positions [3, nAtoms, nBeads].
 * @param masses Per-atom masses.
 * @return Center of mass.
 * @throws rpmd::ShapeMismatch if @a masses does not match the atom count.
 */
std::array<double, 3> get_center_of_mass(const types::BeadArray &q,
                                         const std::vector<double> &masses);

/**
 * @brief Center of mass of centroid (or classical) positions.
 * @param centroid Positions [3, nAtoms].
 * @param masses Per-atom masses.
 * @return Center of mass.
 */
std::array<double, 3> get_center_of_mass(const types::AtomMatrix &centroid,
                                         const std::vector<double> &masses);

/**
 * @brief Root mean square spread of each atom's beads about its centroid.
 * @param q Positions [3, nAtoms, nBeads].
 * @return One radius per atom.
 */
std::vector<double> get_radius_of_gyration(const types::BeadArray &q);

/**
 * @brief Harmonic spring energy of all ring polymers.
 *
 * @f$\sum_j \frac{1}{2} m_j \omega_n^2 \sum_k |q_{j,k} - q_{j,k-1}|^2@f$
 * with cyclic bead indices and @f$\omega_n = N/\beta@f$.
 *
 * @param q Positions [3, nAtoms, nBeads].
 * @param masses Per-atom masses.
 * @param beta Inverse temperature.
 * @return Ring energy.
 */
double get_ring_polymer_energy(const types::BeadArray &q,
                               const std::vector<double> &masses, double beta);

/**
 * @brief Kinetic energy summed over beads, atoms and axes.
 * @param p Momenta [3, nAtoms, nBeads].
 * @param masses Per-atom masses.
 * @return Kinetic energy.
 */
double get_kinetic_energy(const types::BeadArray &p,
                          const std::vector<double> &masses);

/**
 * @brief Ring polymer Hamiltonian, the quantity conserved by the integrator.
 * @param state State whose @c V is current for its @c q.
 * @param params Run parameters.
 * @return Kinetic plus ring energy plus the sum of bead potentials.
 */
double get_ring_polymer_hamiltonian(const SimulationState &state,
                                    const SystemParameters &params);

} // namespace rpmd
