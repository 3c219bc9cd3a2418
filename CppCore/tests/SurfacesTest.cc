// MIT License
// Copyright 2023--present rpmd developers
#include <catch2/catch_all.hpp>
#include <cmath>

#include "TestSurfaces.hpp"
#include "rpmd/errors.hpp"
#include "rpmd/surfaces/ReactantsSurface.hpp"
#include "rpmd/surfaces/TransitionStateSurface.hpp"

using namespace Catch::Matchers;
using rpmd::surfaces::BondCoordinate;
using rpmd::surfaces::ReactantsSurface;
using rpmd::surfaces::TransitionStateSurface;
using rpmd::types::AtomMatrix;

namespace {

// H + H2 with atom 0 approaching the 1-2 molecule
const std::vector<double> kMasses{1.008, 1.008, 1.008};

AtomMatrix bent_h3() {
  return AtomMatrix{{-2.1, 0.1, 1.5}, {0.3, -0.2, 0.4}, {0.05, 0.0, -0.3}};
}

template <typename Surface>
void check_derivatives(const Surface &surface, const AtomMatrix &x) {
  const AtomMatrix grad = surface.gradient(x);
  const auto numericGrad = rpmd::testing::numerical_gradient(
      [&](const AtomMatrix &c) { return surface.value(c); }, x);
  for (size_t i = 0; i < grad.size(); ++i) {
    CHECK_THAT(grad[i], WithinAbs(numericGrad[i], 1e-8));
  }

  const auto hess = surface.hessian(x);
  const auto numericHess = rpmd::testing::numerical_hessian(
      [&](const AtomMatrix &c) { return surface.gradient(c); }, x);
  for (size_t i = 0; i < hess.dim(); ++i) {
    for (size_t j = 0; j < hess.dim(); ++j) {
      CHECK_THAT(hess(i, j), WithinAbs(numericHess(i, j), 1e-7));
      CHECK_THAT(hess(i, j), WithinAbs(hess(j, i), 1e-14));
    }
  }
}

} // namespace

TEST_CASE("Reactants surface measures the fragment separation",
          "[Surfaces]") {
  ReactantsSurface surface(kMasses, {0}, {1, 2}, 8.0);

  SECTION("Value at a linear geometry") {
    // B centre of mass at x = 1, A at x = -3
    AtomMatrix x{{-3.0, 0.5, 1.5}, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}};
    CHECK_THAT(surface.value(x), WithinAbs(8.0 - 4.0, 1e-14));
  }

  SECTION("Derivatives at a bent geometry") {
    check_derivatives(surface, bent_h3());
  }

  SECTION("Translation leaves the surface unchanged") {
    AtomMatrix x = bent_h3();
    const double s0 = surface.value(x);
    for (size_t j = 0; j < x.natoms(); ++j) {
      x(1, j) += 2.5;
    }
    CHECK_THAT(surface.value(x), WithinAbs(s0, 1e-13));
  }
}

TEST_CASE("Transition state surface combines bond coordinates",
          "[Surfaces]") {
  // forming 0-1, breaking 1-2
  TransitionStateSurface surface(3, {BondCoordinate{0, 1, 1.757}},
                                 {BondCoordinate{1, 2, 1.757}});

  SECTION("Zero at the symmetric saddle geometry") {
    AtomMatrix x{{-1.757, 0.0, 1.757}, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}};
    CHECK_THAT(surface.value(x), WithinAbs(0.0, 1e-14));
  }

  SECTION("Sign follows the breaking bond") {
    AtomMatrix x{{-3.0, 0.0, 1.4}, {0.0, 0.0, 0.0}, {0.0, 0.0, 0.0}};
    // (1.4 - 1.757) - (3.0 - 1.757)
    CHECK_THAT(surface.value(x), WithinAbs(-1.6, 1e-14));
  }

  SECTION("Derivatives at a bent geometry") {
    check_derivatives(surface, bent_h3());
  }
}

TEST_CASE("Dividing surface configuration errors", "[Surfaces]") {
  CHECK_THROWS_AS(ReactantsSurface(kMasses, {}, {1, 2}, 8.0),
                  rpmd::ConfigurationError);
  CHECK_THROWS_AS(ReactantsSurface(kMasses, {0}, {0, 2}, 8.0),
                  rpmd::ConfigurationError);
  CHECK_THROWS_AS(ReactantsSurface(kMasses, {0}, {1, 5}, 8.0),
                  rpmd::ConfigurationError);
  CHECK_THROWS_AS(ReactantsSurface(kMasses, {0}, {1, 2}, -1.0),
                  rpmd::ConfigurationError);
  CHECK_THROWS_AS(TransitionStateSurface(3, {}, {}),
                  rpmd::ConfigurationError);
  CHECK_THROWS_AS(TransitionStateSurface(3, {BondCoordinate{1, 1, 1.0}}, {}),
                  rpmd::ConfigurationError);

  ReactantsSurface reactants(kMasses, {0}, {1, 2}, 8.0);
  TransitionStateSurface ts(3, {BondCoordinate{0, 1, 1.0}}, {});
  const AtomMatrix twoAtoms(3, 2);
  CHECK_THROWS_AS(reactants.value(twoAtoms), rpmd::ShapeMismatch);
  CHECK_THROWS_AS(ts.gradient(twoAtoms), rpmd::ShapeMismatch);
}
