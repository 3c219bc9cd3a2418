// MIT License
// Copyright 2023--present rpmd developers

#include <cmath>
#include <numeric>

#include <fmt/core.h>

#include "rpmd/Geometry.hpp"
#include "rpmd/errors.hpp"

namespace rpmd {

namespace {

void check_masses(size_t nAtoms, const std::vector<double> &masses) {
  if (masses.size() != nAtoms) {
    throw ShapeMismatch(fmt::format(
        "Got {} masses for a system of {} atoms", masses.size(), nAtoms));
  }
}

} // namespace

types::AtomMatrix get_centroid(const types::BeadArray &q) {
  types::AtomMatrix centroid = types::AtomMatrix::Zero(q.natoms());
  get_centroid(q, centroid);
  return centroid;
}

void get_centroid(const types::BeadArray &q, types::AtomMatrix &centroid) {
  const size_t nAtoms = q.natoms();
  const size_t nBeads = q.nbeads();
  if (centroid.rows() != 3 || centroid.cols() != nAtoms) {
    centroid = types::AtomMatrix::Zero(nAtoms);
  }
  for (size_t i = 0; i < 3; ++i) {
    for (size_t j = 0; j < nAtoms; ++j) {
      const double *ring = q.ring(i, j);
      centroid(i, j) = std::accumulate(ring, ring + nBeads, 0.0) /
                       static_cast<double>(nBeads);
    }
  }
}

std::array<double, 3> get_center_of_mass(const types::BeadArray &q,
                                         const std::vector<double> &masses) {
  check_masses(q.natoms(), masses);
  const double total_mass = std::accumulate(masses.begin(), masses.end(), 0.0);
  std::array<double, 3> cm{0.0, 0.0, 0.0};
  for (size_t i = 0; i < 3; ++i) {
    for (size_t j = 0; j < q.natoms(); ++j) {
      for (size_t k = 0; k < q.nbeads(); ++k) {
        cm[i] += q(i, j, k) * masses[j];
      }
    }
    cm[i] /= total_mass * static_cast<double>(q.nbeads());
  }
  return cm;
}

std::array<double, 3> get_center_of_mass(const types::AtomMatrix &centroid,
                                         const std::vector<double> &masses) {
  check_masses(centroid.natoms(), masses);
  const double total_mass = std::accumulate(masses.begin(), masses.end(), 0.0);
  std::array<double, 3> cm{0.0, 0.0, 0.0};
  for (size_t i = 0; i < 3; ++i) {
    for (size_t j = 0; j < centroid.natoms(); ++j) {
      cm[i] += centroid(i, j) * masses[j];
    }
    cm[i] /= total_mass;
  }
  return cm;
}

std::vector<double> get_radius_of_gyration(const types::BeadArray &q) {
  const types::AtomMatrix centroid = get_centroid(q);
  std::vector<double> radius(q.natoms(), 0.0);
  for (size_t j = 0; j < q.natoms(); ++j) {
    for (size_t i = 0; i < 3; ++i) {
      for (size_t k = 0; k < q.nbeads(); ++k) {
        const double dx = q(i, j, k) - centroid(i, j);
        radius[j] += dx * dx;
      }
    }
    radius[j] = std::sqrt(radius[j] / static_cast<double>(q.nbeads()));
  }
  return radius;
}

/**
 * @details
 * Bead 0 is paired with bead N-1 to close the ring; for a single bead this
 * pairs the bead with itself and the energy vanishes.
 */
double get_ring_polymer_energy(const types::BeadArray &q,
                               const std::vector<double> &masses,
                               double beta) {
  check_masses(q.natoms(), masses);
  const size_t nBeads = q.nbeads();
  const double wn = static_cast<double>(nBeads) / beta;
  double ering = 0.0;
  for (size_t j = 0; j < q.natoms(); ++j) {
    double stretch = 0.0;
    for (size_t k = 0; k < nBeads; ++k) {
      const size_t prev = (k == 0) ? nBeads - 1 : k - 1;
      for (size_t i = 0; i < 3; ++i) {
        const double dx = q(i, j, k) - q(i, j, prev);
        stretch += dx * dx;
      }
    }
    ering += 0.5 * masses[j] * wn * wn * stretch;
  }
  return ering;
}

double get_kinetic_energy(const types::BeadArray &p,
                          const std::vector<double> &masses) {
  check_masses(p.natoms(), masses);
  double ek = 0.0;
  for (size_t i = 0; i < 3; ++i) {
    for (size_t j = 0; j < p.natoms(); ++j) {
      for (size_t k = 0; k < p.nbeads(); ++k) {
        ek += 0.5 * p(i, j, k) * p(i, j, k) / masses[j];
      }
    }
  }
  return ek;
}

double get_ring_polymer_hamiltonian(const SimulationState &state,
                                    const SystemParameters &params) {
  const double potential =
      std::accumulate(state.V.begin(), state.V.end(), 0.0);
  return get_kinetic_energy(state.p, params.masses) +
         get_ring_polymer_energy(state.q, params.masses, params.beta) +
         potential;
}

} // namespace rpmd
