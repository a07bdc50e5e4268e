#include "etcalc/ImageOps.hpp"
#include "etcalc/Errors.hpp"

#include <cmath>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace etcalc {

namespace {
constexpr double KERNEL_RADIUS = 4.0;   // in sigma
} // anonymous namespace

Eigen::Index gaussian_half_width(Real sigma)
{
    return static_cast<Eigen::Index>(std::ceil(KERNEL_RADIUS * sigma));
}

Vector gaussian_kernel(Real sigma)
{
    if (!(sigma > 0.0))
        throw ConfigurationError("Gaussian kernel: sigma must be positive");
    const Eigen::Index hw = gaussian_half_width(sigma);
    Vector k(2 * hw + 1);
    for (Eigen::Index i = -hw; i <= hw; ++i)
        k[i + hw] = std::exp(-0.5 * (i * i) / (sigma * sigma));
    return k / k.sum();
}

Matrix convolve_separable(const Matrix& img, const Vector& kernel)
{
    const Eigen::Index rows = img.rows(), cols = img.cols();
    const Eigen::Index hw   = kernel.size() / 2;

    /* ---- along rows ------------------------------------------------ */
    Matrix tmp = Matrix::Zero(rows, cols);
    #pragma omp parallel for schedule(static) if (_OPENMP)
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            double sum = 0.0;
            for (Eigen::Index k = -hw; k <= hw; ++k) {
                const Eigen::Index cc = c + k;
                if (cc >= 0 && cc < cols) sum += kernel[hw - k] * img(r, cc);
            }
            tmp(r, c) = sum;
        }
    }

    /* ---- along columns --------------------------------------------- */
    Matrix out = Matrix::Zero(rows, cols);
    #pragma omp parallel for schedule(static) if (_OPENMP)
    for (Eigen::Index c = 0; c < cols; ++c) {
        for (Eigen::Index r = 0; r < rows; ++r) {
            double sum = 0.0;
            for (Eigen::Index k = -hw; k <= hw; ++k) {
                const Eigen::Index rr = r + k;
                if (rr >= 0 && rr < rows) sum += kernel[hw - k] * tmp(rr, c);
            }
            out(r, c) = sum;
        }
    }
    return out;
}

Matrix gaussian_blur(const Matrix& img, Real sigma)
{
    if (sigma <= 0.0) return img;
    return convolve_separable(img, gaussian_kernel(sigma));
}

Matrix pad(const Matrix& img, Eigen::Index n)
{
    Matrix out = Matrix::Zero(img.rows() + 2 * n, img.cols() + 2 * n);
    out.block(n, n, img.rows(), img.cols()) = img;
    return out;
}

Matrix bin_down(const Matrix& fine, int factor)
{
    if (factor < 1)
        throw ConfigurationError("bin_down: factor must be >= 1");
    if (factor == 1) return fine;
    if (fine.rows() % factor != 0 || fine.cols() % factor != 0)
        throw ConfigurationError("bin_down: size is not a multiple of the binning factor");

    Matrix out(fine.rows() / factor, fine.cols() / factor);
    for (Eigen::Index r = 0; r < out.rows(); ++r)
        for (Eigen::Index c = 0; c < out.cols(); ++c)
            out(r, c) = fine.block(r * factor, c * factor, factor, factor).sum();
    return out;
}

} // namespace etcalc
