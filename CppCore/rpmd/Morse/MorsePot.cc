// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Implementation of the Morse potential methods.
 */

#include <cmath>

#include <fmt/core.h>

#include "rpmd/Morse/MorsePot.hpp"

namespace rpmd {

/**
 * @details
 * Loops over unique pairs. With @f$e = \exp(-a(r - r_e))@f$ the pair
 * energy is @f$D_e(1-e)^2@f$ and @f$dU/dr = 2 D_e a e (1 - e)@f$.
 *
 * @warning Throws @c rpmd::InvalidInput when two atoms coincide.
 */
void MorsePot::forceImpl(const ForceInput &in, ForceOut *out) const {
  const size_t N = in.nAtoms;
  const double *R = in.pos;
  double *F = out->F;
  zeroForceOut(N, out);

  for (size_t i = 0; i + 1 < N; ++i) {
    for (size_t j = i + 1; j < N; ++j) {
      const double dx = R[i] - R[j];
      const double dy = R[N + i] - R[N + j];
      const double dz = R[2 * N + i] - R[2 * N + j];
      const double r = std::sqrt(dx * dx + dy * dy + dz * dz);
      if (r == 0.0) {
        throw InvalidInput(
            fmt::format("Atoms {} and {} coincide in Morse force call", i, j));
      }

      const double e = std::exp(-m_a * (r - m_re));
      out->energy += m_de * (1.0 - e) * (1.0 - e);
      const double dU = 2.0 * m_de * m_a * e * (1.0 - e);

      // F is the negative derivative
      F[i] -= dU * dx / r;
      F[N + i] -= dU * dy / r;
      F[2 * N + i] -= dU * dz / r;
      F[j] += dU * dx / r;
      F[N + j] += dU * dy / r;
      F[2 * N + j] += dU * dz / r;
    }
  }
}

} // namespace rpmd
