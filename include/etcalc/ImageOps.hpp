#pragma once
#include "Types.hpp"

namespace etcalc {

// Normalised Gaussian kernel of standard deviation `sigma` samples, truncated at ±4σ
Vector gaussian_kernel(Real sigma);

// Half width (samples) of gaussian_kernel(sigma)
Eigen::Index gaussian_half_width(Real sigma);

// Separable 2D convolution, zero outside `img`, result of the same size
Matrix convolve_separable(const Matrix& img, const Vector& kernel);

// Gaussian blur of `img` (pointing jitter); sigma <= 0 returns the input
Matrix gaussian_blur(const Matrix& img, Real sigma);

// Zero border of `n` samples
Matrix pad(const Matrix& img, Eigen::Index n);

// Sum of factor × factor blocks; dimensions must be multiples of factor
Matrix bin_down(const Matrix& fine, int factor);

} // namespace etcalc
