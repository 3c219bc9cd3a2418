// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Halfcomplex packing around Eigen's FFT module.
 */

#include <algorithm>

#include <fmt/core.h>

#include "rpmd/NormalModeTransform.hpp"
#include "rpmd/errors.hpp"

namespace rpmd {

NormalModeTransform::NormalModeTransform(size_t nBeads)
    : m_beads(nBeads), m_real(nBeads), m_spectrum(nBeads) {
  if (nBeads == 0) {
    throw InvalidInput("Can't plan a normal mode transform over zero beads");
  }
}

/**
 * @details
 * Eigen returns the full conjugate-symmetric spectrum for real input. Only
 * bins @c 0..N/2 are independent; their real parts fill the front of the
 * sequence and the imaginary parts of bins @c 1..(N-1)/2 fill the back in
 * reverse order. The imaginary parts of bin 0 and, for even N, of the
 * Nyquist bin vanish and are not stored.
 */
void NormalModeTransform::forward(double *seq) {
  const size_t n = m_beads;
  if (n == 1) {
    return;
  }
  m_real.assign(seq, seq + n);
  m_fft.fwd(m_spectrum, m_real);
  for (size_t k = 0; k <= n / 2; ++k) {
    seq[k] = m_spectrum[k].real();
  }
  for (size_t k = 1; k <= (n - 1) / 2; ++k) {
    seq[n - k] = m_spectrum[k].imag();
  }
}

void NormalModeTransform::inverse(double *coeffs) {
  const size_t n = m_beads;
  if (n == 1) {
    return;
  }
  m_spectrum.assign(n, std::complex<double>(0.0, 0.0));
  m_spectrum[0] = std::complex<double>(coeffs[0], 0.0);
  for (size_t k = 1; k <= n / 2; ++k) {
    const double im = (k < n - k) ? coeffs[n - k] : 0.0;
    m_spectrum[k] = std::complex<double>(coeffs[k], im);
    m_spectrum[n - k] = std::conj(m_spectrum[k]);
  }
  // Default flags scale the inverse by 1/N
  m_fft.inv(m_real, m_spectrum);
  std::copy(m_real.begin(), m_real.end(), coeffs);
}

std::vector<double>
NormalModeTransform::forward(const std::vector<double> &seq) {
  check_length(seq.size());
  std::vector<double> out(seq);
  forward(out.data());
  return out;
}

std::vector<double>
NormalModeTransform::inverse(const std::vector<double> &coeffs) {
  check_length(coeffs.size());
  std::vector<double> out(coeffs);
  inverse(out.data());
  return out;
}

void NormalModeTransform::check_length(size_t len) const {
  if (len != m_beads) {
    throw ShapeMismatch(fmt::format(
        "Normal mode transform planned for {} beads was given {} values",
        m_beads, len));
  }
}

} // namespace rpmd
