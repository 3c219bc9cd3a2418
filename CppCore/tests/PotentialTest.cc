// MIT License
// Copyright 2023--present rpmd developers
#include <catch2/catch_all.hpp>
#include <cmath>
#include <memory>
#include <vector>

#include "TestSurfaces.hpp"
#include "rpmd/Harmonic/HarmonicPot.hpp"
#include "rpmd/Morse/MorsePot.hpp"
#include "rpmd/RingPolymerPotential.hpp"
#include "rpmd/errors.hpp"

using namespace Catch::Matchers;
using rpmd::types::AtomMatrix;
using rpmd::types::BeadArray;

TEST_CASE("Harmonic well energy and forces", "[Potential]") {
  rpmd::HarmonicPot pot(3.0, {1.0, 0.0, -1.0});
  AtomMatrix pos{{2.0, 1.0}, {0.5, 0.0}, {-1.0, 0.0}};
  auto [energy, forces] = pot(pos);
  // 0.5 * 3 * (1 + 0.25) + 0.5 * 3 * (0 + 0 + 1)
  CHECK_THAT(energy, WithinAbs(3.375, 1e-14));
  CHECK(forces(0, 0) == -3.0);
  CHECK(forces(1, 0) == -1.5);
  CHECK(forces(2, 0) == 0.0);
  CHECK(forces(2, 1) == -3.0);
  CHECK(pot.get_type() == rpmd::PotType::Harmonic);
}

TEST_CASE("Morse pair potential", "[Potential]") {
  rpmd::MorsePot pot(0.17, 1.04, 1.4);

  SECTION("Equilibrium bond has zero energy and force") {
    AtomMatrix pos{{0.0, 1.4}, {0.0, 0.0}, {0.0, 0.0}};
    auto [energy, forces] = pot(pos);
    CHECK_THAT(energy, WithinAbs(0.0, 1e-15));
    for (size_t i = 0; i < forces.size(); ++i) {
      CHECK_THAT(forces[i], WithinAbs(0.0, 1e-15));
    }
  }

  SECTION("Forces are the negative energy gradient") {
    AtomMatrix pos{{0.1, 1.3, -0.4}, {0.2, -0.1, 1.1}, {0.0, 0.5, 0.3}};
    auto [energy, forces] = pot(pos);
    const auto numeric = rpmd::testing::numerical_gradient(
        [&](const AtomMatrix &x) { return pot(x).first; }, pos);
    for (size_t i = 0; i < forces.size(); ++i) {
      CHECK_THAT(forces[i], WithinAbs(-numeric[i], 1e-8));
    }
    CHECK(energy > 0.0);
  }

  SECTION("Coincident atoms are rejected") {
    AtomMatrix pos(3, 2);
    CHECK_THROWS_AS(pot(pos), rpmd::InvalidInput);
  }
}

TEST_CASE("Positions must be laid out by axis", "[Potential]") {
  rpmd::HarmonicPot pot;
  AtomMatrix wrong(2, 3);
  CHECK_THROWS_AS(pot(wrong), rpmd::ShapeMismatch);
  AtomMatrix empty(3, 0);
  CHECK_THROWS_AS(pot(empty), rpmd::InvalidInput);
}

TEST_CASE("Ring polymer potential evaluates each bead", "[Potential]") {
  auto pot = std::make_shared<rpmd::HarmonicPot>(2.0);
  rpmd::RingPolymerPotential rp(pot);
  CHECK(rp.get_type() == rpmd::PotType::Harmonic);

  const size_t nBeads = 3;
  BeadArray q(2, nBeads);
  for (size_t k = 0; k < nBeads; ++k) {
    q(0, 0, k) = 1.0 + k;
    q(2, 1, k) = -0.5 * k;
  }

  rpmd::registry<rpmd::HarmonicPot>::resetForceCalls();
  std::vector<double> V;
  BeadArray dVdq;
  rp(q, V, dVdq);

  CHECK(rpmd::registry<rpmd::HarmonicPot>::forceCalls == nBeads);
  REQUIRE(V.size() == nBeads);
  REQUIRE(dVdq.same_shape(q));
  for (size_t k = 0; k < nBeads; ++k) {
    const double x = 1.0 + k;
    const double z = -0.5 * k;
    CHECK_THAT(V[k], WithinAbs(x * x + z * z, 1e-14));
    CHECK_THAT(dVdq(0, 0, k), WithinAbs(2.0 * x, 1e-14));
    CHECK_THAT(dVdq(2, 1, k), WithinAbs(2.0 * z, 1e-14));
    CHECK(dVdq(1, 0, k) == 0.0);
  }
}

TEST_CASE("Potentials report their model parameters", "[Potential]") {
  const rpmd::HarmonicPot harmonic(3.0, {1.0, 0.0, -1.0});
  CHECK(harmonic.get_parameters() == std::vector<double>{3.0, 1.0, 0.0, -1.0});
  const rpmd::MorsePot morse(0.17, 1.04, 1.4);
  CHECK(morse.get_parameters() == std::vector<double>{0.17, 1.04, 1.4});
  CHECK(rpmd::MorsePot(0.5).get_parameters() != morse.get_parameters());
}

TEST_CASE("Ring polymer potential needs a potential", "[Potential]") {
  CHECK_THROWS_AS(rpmd::RingPolymerPotential(nullptr), rpmd::InvalidInput);
}
