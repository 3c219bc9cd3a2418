// MIT License
// Copyright 2023--present rpmd developers
#include <algorithm>
#include <catch2/catch_all.hpp>
#include <cmath>
#include <memory>

#include "TestSurfaces.hpp"
#include "rpmd/Geometry.hpp"
#include "rpmd/Harmonic/HarmonicPot.hpp"
#include "rpmd/RingPolymerPotential.hpp"
#include "rpmd/VelocityVerlet.hpp"
#include "rpmd/errors.hpp"

using namespace Catch::Matchers;
using rpmd::DividingSurface;
using rpmd::ReactionCoordinate;
using rpmd::ReactionCoordinateMode;
using rpmd::SimulationState;
using rpmd::StepStatus;
using rpmd::SystemParameters;
using rpmd::VelocityVerlet;
using rpmd::testing::LinearSurface;
using rpmd::types::BeadArray;

namespace {

const LinearSurface kReactants{1.0, {0.5, 0.0, 0.0}};
const LinearSurface kTransitionState{-1.0, {0.0, 0.5, 0.0}};

ReactionCoordinate make_rc(ReactionCoordinateMode mode) {
  return ReactionCoordinate(mode, DividingSurface::from_impl(kReactants),
                            DividingSurface::from_impl(kTransitionState));
}

void free_particle(const BeadArray &q, std::vector<double> &V,
                   BeadArray &dVdq) {
  V.assign(q.nbeads(), 0.0);
  dVdq = BeadArray(q.natoms(), q.nbeads());
}

SystemParameters one_atom(double mass, ReactionCoordinateMode mode) {
  return SystemParameters{.dt = 0.01, .beta = 1.0, .masses = {mass},
                          .mode = mode};
}

} // namespace

TEST_CASE("A single free bead moves classically", "[VelocityVerlet]") {
  const auto params = one_atom(2.0, ReactionCoordinateMode::RecrossingFactor);
  VelocityVerlet vv(params, 1, free_particle,
                    make_rc(ReactionCoordinateMode::RecrossingFactor));

  SimulationState state(1, 1);
  state.p(0, 0, 0) = 1.0;
  state.p(1, 0, 0) = -0.4;
  state.q(2, 0, 0) = 0.3;
  REQUIRE(vv.initialize(state, 0.0) == StepStatus::Success);

  const size_t nSteps = 25;
  for (size_t n = 0; n < nSteps; ++n) {
    REQUIRE(vv.step(state, 0.0) == StepStatus::Success);
  }
  const double elapsed = nSteps * params.dt;
  CHECK_THAT(state.t, WithinAbs(elapsed, 1e-14));
  CHECK(state.p(0, 0, 0) == 1.0);
  CHECK(state.p(1, 0, 0) == -0.4);
  CHECK_THAT(state.q(0, 0, 0), WithinAbs(elapsed * 1.0 / 2.0, 1e-13));
  CHECK_THAT(state.q(1, 0, 0), WithinAbs(elapsed * -0.4 / 2.0, 1e-13));
  CHECK_THAT(state.q(2, 0, 0), WithinAbs(0.3, 1e-15));
}

TEST_CASE("Ring polymer Hamiltonian is conserved in a harmonic well",
          "[VelocityVerlet]") {
  const auto params = one_atom(1.0, ReactionCoordinateMode::RecrossingFactor);
  const size_t nBeads = 4;
  auto pot = std::make_shared<rpmd::HarmonicPot>(1.0);
  VelocityVerlet vv(params, nBeads, rpmd::RingPolymerPotential(pot),
                    make_rc(ReactionCoordinateMode::RecrossingFactor));

  SimulationState state(1, nBeads);
  for (size_t k = 0; k < nBeads; ++k) {
    state.q(0, 0, k) = 0.5 + 0.1 * k;
    state.q(1, 0, k) = -0.2 * k;
    state.p(2, 0, k) = 0.3 - 0.2 * k;
  }
  REQUIRE(vv.initialize(state, 0.5) == StepStatus::Success);
  const double h0 = rpmd::get_ring_polymer_hamiltonian(state, params);

  double maxDrift = 0.0;
  for (size_t n = 0; n < 1000; ++n) {
    REQUIRE(vv.step(state, 0.5) == StepStatus::Success);
    const double h = rpmd::get_ring_polymer_hamiltonian(state, params);
    maxDrift = std::max(maxDrift, std::abs(h - h0));
  }
  CHECK(maxDrift < 1e-3 * std::abs(h0));
  CHECK_THAT(state.t, WithinAbs(10.0, 1e-10));
}

TEST_CASE("Initialization fills derived quantities", "[VelocityVerlet]") {
  const auto params = one_atom(1.0, ReactionCoordinateMode::RecrossingFactor);
  auto pot = std::make_shared<rpmd::HarmonicPot>(2.0);
  VelocityVerlet vv(params, 2, rpmd::RingPolymerPotential(pot),
                    make_rc(ReactionCoordinateMode::RecrossingFactor));

  SimulationState state(1, 2);
  state.q(0, 0, 0) = 1.0;
  state.q(0, 0, 1) = 3.0;
  REQUIRE(vv.initialize(state, 0.0) == StepStatus::Success);

  CHECK(state.t == 0.0);
  CHECK_THAT(state.V[0], WithinAbs(1.0, 1e-15));
  CHECK_THAT(state.V[1], WithinAbs(9.0, 1e-15));
  CHECK_THAT(state.dVdq(0, 0, 0), WithinAbs(2.0, 1e-15));
  CHECK_THAT(state.dVdq(0, 0, 1), WithinAbs(6.0, 1e-15));
  // reactants surface at the centroid x = 2
  CHECK_THAT(state.xi, WithinAbs(2.0, 1e-15));
  CHECK(state.dxi[0] == 0.5);
}

TEST_CASE("Umbrella integration is refreshed at the drifted centroid",
          "[VelocityVerlet]") {
  const auto params =
      one_atom(1.0, ReactionCoordinateMode::UmbrellaIntegration);
  const size_t nBeads = 3;
  ReactionCoordinate rc(params, DividingSurface::from_impl(kReactants),
                        DividingSurface::from_impl(kTransitionState));
  REQUIRE(rc.mode() == ReactionCoordinateMode::UmbrellaIntegration);
  auto pot = std::make_shared<rpmd::HarmonicPot>(1.0);
  VelocityVerlet vv(params, nBeads, rpmd::RingPolymerPotential(pot), rc);

  SimulationState state(1, nBeads);
  for (size_t k = 0; k < nBeads; ++k) {
    state.q(0, 0, k) = 0.2 + 0.05 * k;
    state.q(1, 0, k) = -0.1 * k;
    state.p(0, 0, k) = 0.8;
    state.p(1, 0, k) = 0.3 - 0.1 * k;
  }
  REQUIRE(vv.initialize(state, 0.0) == StepStatus::Success);
  const auto before = rpmd::get_centroid(state.q);
  for (size_t n = 0; n < 5; ++n) {
    REQUIRE(vv.step(state, 0.0) == StepStatus::Success);
  }
  const auto centroid = rpmd::get_centroid(state.q);
  REQUIRE(centroid(0, 0) != before(0, 0));

  const double s0 = kReactants.value(centroid);
  const double s1 = kTransitionState.value(centroid);
  CHECK_THAT(state.xi, WithinRel(s0 / (s0 - s1), 1e-14));

  const auto expected = rc.evaluate(centroid, 0.0);
  CHECK(state.xi == expected.xi);
  for (size_t i = 0; i < expected.dxi.size(); ++i) {
    CHECK(state.dxi[i] == expected.dxi[i]);
  }
  for (size_t i = 0; i < expected.d2xi.dim(); ++i) {
    for (size_t j = 0; j < expected.d2xi.dim(); ++j) {
      CHECK(state.d2xi(i, j) == expected.d2xi(i, j));
    }
  }
  // d xi / d x = -s1 b0 / (s0 - s1)^2
  CHECK_THAT(state.dxi(0, 0),
             WithinRel(-s1 * 0.5 / ((s0 - s1) * (s0 - s1)), 1e-13));
}

TEST_CASE("Coinciding surfaces report a singular step", "[VelocityVerlet]") {
  const auto params =
      one_atom(1.0, ReactionCoordinateMode::UmbrellaIntegration);
  VelocityVerlet vv(params, 2, free_particle,
                    ReactionCoordinate(
                        ReactionCoordinateMode::UmbrellaIntegration,
                        DividingSurface::from_impl(kReactants),
                        DividingSurface::from_impl(kReactants)));
  SimulationState state(1, 2);
  const StepStatus status = vv.step(state, 0.0);
  CHECK(status == StepStatus::NumericalSingularity);
  CHECK_FALSE(std::isfinite(state.xi));
  CHECK_THAT(state.t, WithinAbs(params.dt, 1e-15));
  CHECK_THROWS_AS(rpmd::check_status(status), rpmd::NumericalSingularity);
  CHECK_NOTHROW(rpmd::check_status(StepStatus::Success));
}

TEST_CASE("Mis-shaped states are rejected untouched", "[VelocityVerlet]") {
  const auto params = one_atom(1.0, ReactionCoordinateMode::RecrossingFactor);
  VelocityVerlet vv(params, 4, free_particle,
                    make_rc(ReactionCoordinateMode::RecrossingFactor));

  SimulationState state(1, 3);
  state.p.fill(0.25);
  state.t = 1.5;
  CHECK_THROWS_AS(vv.step(state, 0.0), rpmd::ShapeMismatch);
  CHECK(state.t == 1.5);
  CHECK(state.p(0, 0, 2) == 0.25);

  SimulationState twoAtoms(2, 4);
  CHECK_THROWS_AS(vv.initialize(twoAtoms, 0.0), rpmd::ShapeMismatch);
}

TEST_CASE("Integrator configuration errors", "[VelocityVerlet]") {
  const auto params = one_atom(1.0, ReactionCoordinateMode::RecrossingFactor);
  CHECK_THROWS_AS(
      VelocityVerlet(params, 2, free_particle,
                     make_rc(ReactionCoordinateMode::UmbrellaIntegration)),
      rpmd::ConfigurationError);
  CHECK_THROWS_AS(
      VelocityVerlet(params, 2, rpmd::BeadPotentialFn{},
                     make_rc(ReactionCoordinateMode::RecrossingFactor)),
      rpmd::ConfigurationError);
  CHECK_THROWS_AS(
      VelocityVerlet(params, 0, free_particle,
                     make_rc(ReactionCoordinateMode::RecrossingFactor)),
      rpmd::Error);
}
