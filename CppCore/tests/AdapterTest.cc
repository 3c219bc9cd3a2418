// MIT License
// Copyright 2023--present rpmd developers
#include <catch2/catch_all.hpp>
#include <stdexcept>

#include "rpmd/types/adapters/eigen.hpp"

#ifdef RPMD_WITH_XTENSOR
#include "rpmd/types/adapters/xtensor.hpp"
#endif

using namespace Catch::Matchers;
using rpmd::types::AtomMatrix;
using rpmd::types::HessianTensor;
namespace eig = rpmd::types::adapt::eigen;

TEST_CASE("Eigen maps share storage", "[Adapters]") {
  AtomMatrix m{{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}};
  auto flat = eig::asVector(m);
  REQUIRE(flat.size() == 6);
  // flat index is axis * nAtoms + atom
  CHECK(flat(1) == 2.0);
  CHECK(flat(4) == 5.0);
  flat(3) = -1.0;
  CHECK(m(1, 1) == -1.0);

  HessianTensor h(2);
  auto mat = eig::asMatrix(h);
  REQUIRE(mat.rows() == 6);
  REQUIRE(mat.cols() == 6);
  mat(1, 4) = 7.0;
  CHECK(h(0, 1, 2, 0) == 7.0);
  CHECK(h(1, 4) == 7.0);
}

TEST_CASE("Eigen conversions", "[Adapters]") {
  AtomMatrix m{{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}};
  Eigen::MatrixXd e = eig::convertToEigen(m);
  REQUIRE(e.rows() == 3);
  REQUIRE(e.cols() == 2);
  CHECK(e(2, 1) == 6.0);

  AtomMatrix back = eig::convertToAtomMatrix(e);
  REQUIRE(back.same_shape(m));
  CHECK(back(1, 0) == 3.0);

  Eigen::MatrixXd square = Eigen::MatrixXd::Identity(3, 3);
  square(0, 2) = 0.5;
  HessianTensor h = eig::convertToHessian(square);
  CHECK(h.natoms() == 1);
  CHECK(h(0, 2) == 0.5);
  CHECK(h(2, 0) == 0.0);
  CHECK_THROWS_AS(eig::convertToHessian(Eigen::MatrixXd::Zero(4, 4)),
                  std::invalid_argument);

  Eigen::Vector3d v(1.0, -2.0, 3.0);
  const auto arr = eig::convertToArray3(v);
  CHECK(arr[1] == -2.0);
  const auto vec = eig::convertToVector<double>(Eigen::VectorXd(v));
  CHECK(vec.size() == 3);
  CHECK(vec[2] == 3.0);
}

TEST_CASE("xtensor conversions", "[Adapters]") {
#ifdef RPMD_WITH_XTENSOR
  namespace xad = rpmd::types::adapt::xtensor;
  AtomMatrix m{{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}};
  auto xm = xad::convertToXtensor(m);
  REQUIRE(xm.shape()[0] == 3);
  CHECK(xm(2, 0) == 5.0);
  CHECK(xad::convertToAtomMatrix(xm)(0, 1) == 2.0);

  rpmd::types::BeadArray beads(2, 3);
  beads(1, 0, 2) = 4.5;
  auto xb = xad::convertToXtensor(beads);
  REQUIRE(xb.shape()[2] == 3);
  CHECK(xb(1, 0, 2) == 4.5);
  CHECK(xad::convertToBeadArray(xb)(1, 0, 2) == 4.5);
#else
  SKIP("Built without RPMD_WITH_XTENSOR");
#endif
}
