// MIT License
// Copyright 2023--present rpmd developers

#include "rpmd/Harmonic/HarmonicPot.hpp"

namespace rpmd {

void HarmonicPot::forceImpl(const ForceInput &in, ForceOut *out) const {
  const size_t N = in.nAtoms;
  zeroForceOut(N, out);
  for (size_t i = 0; i < 3; ++i) {
    for (size_t j = 0; j < N; ++j) {
      const double dx = in.pos[i * N + j] - m_anchor[i];
      out->energy += 0.5 * m_k * dx * dx;
      out->F[i * N + j] = -m_k * dx;
    }
  }
}

} // namespace rpmd
