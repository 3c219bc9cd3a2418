#pragma once
// MIT License
// Copyright 2023--present rpmd developers

/**
 * @brief Real discrete Fourier transform over a ring of beads.
 *
 * The transform maps the nBeads values of one coordinate of one atom onto
 * normal mode coefficients and back. Coefficients use the packed
 * "halfcomplex" layout of FFTW's real-to-real transforms:
 *
 * @code
 * [Re X_0, Re X_1, ..., Re X_{N/2}, Im X_{(N+1)/2-1}, ..., Im X_2, Im X_1]
 * @endcode
 *
 * where @c X_k = sum_j x_j exp(-2 pi i j k / N) is unnormalized. The inverse
 * applies the 1/N factor, so @c inverse(forward(x)) reproduces @c x. Index
 * @c k and index @c N-k both hold parts of mode @c k, which is what lets the
 * free ring polymer propagator apply one matrix per frequency to each of
 * them.
 */

#include <complex>
#include <cstddef>
#include <vector>

// clang-format off
#include <unsupported/Eigen/FFT>
// clang-format on

namespace rpmd {

/**
 * @class NormalModeTransform
 * @brief Forward and inverse halfcomplex DFT of fixed length.
 *
 * Holds an @c Eigen::FFT plan and scratch buffers, so an instance must not
 * be shared between threads.
 */
class NormalModeTransform {
public:
  /**
   * @brief Plans transforms of length @a nBeads.
   * @param nBeads Sequence length.
   * @throws rpmd::InvalidInput when @a nBeads is zero.
   */
  explicit NormalModeTransform(size_t nBeads);

  [[nodiscard]] size_t nbeads() const { return m_beads; }

  /**
   * @brief In-place forward transform of @c nbeads() contiguous values.
   * @param seq Pointer to the sequence; overwritten by the coefficients.
   * @return Void.
   */
  void forward(double *seq);

  /**
   * @brief In-place inverse transform of @c nbeads() contiguous values.
   * @param coeffs Pointer to halfcomplex coefficients; overwritten by the
   * real-space sequence.
   * @return Void.
   */
  void inverse(double *coeffs);

  /**
   * @brief Forward transform returning a new vector.
   * @param seq Real-space sequence.
   * @return Halfcomplex coefficients.
   * @throws rpmd::ShapeMismatch if @a seq does not have @c nbeads() entries.
   */
  std::vector<double> forward(const std::vector<double> &seq);

  /**
   * @brief Inverse transform returning a new vector.
   * @param coeffs Halfcomplex coefficients.
   * @return Real-space sequence.
   * @throws rpmd::ShapeMismatch if @a coeffs does not have @c nbeads()
   * entries.
   */
  std::vector<double> inverse(const std::vector<double> &coeffs);

private:
  void check_length(size_t len) const;

  size_t m_beads;                                //!< Transform length.
  Eigen::FFT<double> m_fft;                      //!< Cached kissfft plan.
  std::vector<double> m_real;                    //!< Real-space scratch.
  std::vector<std::complex<double>> m_spectrum;  //!< Full spectrum scratch.
};

} // namespace rpmd
