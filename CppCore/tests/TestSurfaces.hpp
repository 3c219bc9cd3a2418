#pragma once
// MIT License
// Copyright 2023--present rpmd developers

// Analytic dividing surfaces and finite difference helpers for tests.

#include <functional>
#include <random>
#include <vector>

#include "rpmd/types/AtomMatrix.hpp"
#include "rpmd/types/HessianTensor.hpp"

namespace rpmd::testing {

using types::AtomMatrix;
using types::HessianTensor;

// s(x) = c + b.x + 1/2 x.A.x over the flat centroid coordinates
struct QuadraticSurface {
  double c;
  std::vector<double> b;
  std::vector<double> A; // symmetric, row-major n x n
  size_t nAtoms;

  QuadraticSurface(size_t natoms, unsigned seed, double offset = 0.0)
      : c(offset), b(3 * natoms), A(9 * natoms * natoms), nAtoms(natoms) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<> dis(-1.0, 1.0);
    const size_t n = 3 * natoms;
    for (auto &v : b)
      v = dis(gen);
    for (size_t i = 0; i < n; ++i) {
      for (size_t j = i; j < n; ++j) {
        A[i * n + j] = A[j * n + i] = dis(gen);
      }
    }
  }

  double value(const AtomMatrix &x) const {
    const size_t n = 3 * nAtoms;
    double s = c;
    for (size_t i = 0; i < n; ++i) {
      s += b[i] * x[i];
      for (size_t j = 0; j < n; ++j) {
        s += 0.5 * x[i] * A[i * n + j] * x[j];
      }
    }
    return s;
  }

  AtomMatrix gradient(const AtomMatrix &x) const {
    const size_t n = 3 * nAtoms;
    AtomMatrix g = AtomMatrix::Zero(nAtoms);
    for (size_t i = 0; i < n; ++i) {
      g[i] = b[i];
      for (size_t j = 0; j < n; ++j) {
        g[i] += A[i * n + j] * x[j];
      }
    }
    return g;
  }

  HessianTensor hessian(const AtomMatrix &) const {
    const size_t n = 3 * nAtoms;
    HessianTensor h(nAtoms);
    for (size_t i = 0; i < n; ++i) {
      for (size_t j = 0; j < n; ++j) {
        h(i, j) = A[i * n + j];
      }
    }
    return h;
  }
};

// s(x) = c + b.x, constant gradient and zero Hessian
struct LinearSurface {
  double c;
  std::vector<double> b;

  double value(const AtomMatrix &x) const {
    double s = c;
    for (size_t i = 0; i < b.size(); ++i)
      s += b[i] * x[i];
    return s;
  }

  AtomMatrix gradient(const AtomMatrix &x) const {
    AtomMatrix g = AtomMatrix::Zero(x.natoms());
    for (size_t i = 0; i < b.size(); ++i)
      g[i] = b[i];
    return g;
  }

  HessianTensor hessian(const AtomMatrix &x) const {
    return HessianTensor(x.natoms());
  }
};

// Central difference gradient of a scalar field over flat coordinates
inline AtomMatrix
numerical_gradient(const std::function<double(const AtomMatrix &)> &f,
                   AtomMatrix x, double h = 1e-5) {
  AtomMatrix g = AtomMatrix::Zero(x.natoms());
  for (size_t i = 0; i < x.size(); ++i) {
    const double x0 = x[i];
    x[i] = x0 + h;
    const double fp = f(x);
    x[i] = x0 - h;
    const double fm = f(x);
    x[i] = x0;
    g[i] = (fp - fm) / (2 * h);
  }
  return g;
}

// Central difference Jacobian of a gradient field, i.e. a Hessian
inline HessianTensor
numerical_hessian(const std::function<AtomMatrix(const AtomMatrix &)> &grad,
                  AtomMatrix x, double h = 1e-5) {
  HessianTensor hess(x.natoms());
  for (size_t j = 0; j < x.size(); ++j) {
    const double x0 = x[j];
    x[j] = x0 + h;
    const AtomMatrix gp = grad(x);
    x[j] = x0 - h;
    const AtomMatrix gm = grad(x);
    x[j] = x0;
    for (size_t i = 0; i < x.size(); ++i) {
      hess(i, j) = (gp[i] - gm[i]) / (2 * h);
    }
  }
  return hess;
}

} // namespace rpmd::testing
