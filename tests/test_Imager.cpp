#include "etcalc/AiryPSF.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/Imager.hpp"
#include "etcalc/OpticalComponents.hpp"
#include "etcalc/Physics.hpp"
#include "etcalc/Target.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>

using namespace etcalc;

namespace {

const Vector kWl = Vector::LinSpaced(61, 400.0, 700.0);

ImagerParams detector(Eigen::Index n = 32)
{
    ImagerParams p;
    p.quantum_efficiency = SpectralQty::constant(kWl, 0.8);
    p.rows = p.cols = n;
    p.pixel_size_m = 5e-6;
    p.read_noise   = 5.0;
    p.dark_current = 10.0;
    p.f_number     = 10.0;
    p.d_aperture_m = 1.0;
    return p;
}

PsfPtr airy_for(const ImagerParams& p)
{
    AiryParams a;
    a.f_number     = p.f_number;
    a.wl_nm        = 550.0;
    a.d_aperture_m = p.d_aperture_m;
    a.pixel_size_m = p.pixel_size_m;
    a.osf          = 10;
    return std::make_shared<AiryPSF>(a);
}

RadiantPtr star(Real mag = 15.0)
{
    auto t = std::make_unique<BlackBodyTarget>(kWl, 5778.0, mag, "V");
    return std::make_unique<Mirror>(std::move(t), SpectralQty::constant(kWl, 0.9));
}

Imager point_imager(ImagerParams p = detector())
{
    PsfPtr psf = airy_for(p);
    return Imager(star(), std::move(p), std::move(psf));
}

} // namespace

TEST(Imager, ShotNoiseLimitedExtendedSource)
{
    // flat radiance behind a cold mirror, ideal detector
    const Vector wl = Vector::LinSpaced(11, 400.0, 500.0);
    auto make = [&](bool with_mirror) {
        RadiantPtr chain = std::make_unique<FileTarget>(
            SpectralQty::constant(wl, 1.0, units::radiance), wl, TargetSize::Extended);
        if (with_mirror)
            chain = std::make_unique<Mirror>(std::move(chain), SpectralQty::constant(wl, 0.9));
        ImagerParams p;
        p.quantum_efficiency = SpectralQty::constant(wl, 1.0);
        p.rows = p.cols = 8;
        p.pixel_size_m = 1e-5;
        p.f_number     = 5.0;
        p.d_aperture_m = 1.0;
        return Imager(std::move(chain), p, nullptr);
    };
    const Imager plain = make(false);
    const Imager mirrored = make(true);

    EXPECT_NEAR(mirrored.signal_current() / plain.signal_current(), 0.9, 1e-12);
    EXPECT_DOUBLE_EQ(mirrored.background_current(), 0.0);

    // photons: 0.9 · étendue · ∫ λ / (h c) dλ
    const Real etendue  = phys::pi * 1e-10 / 101.0;
    const Real expected = 0.9 * etendue * 45000.0 * 1e-9 / (phys::h * phys::c);
    EXPECT_NEAR(mirrored.signal_current(), expected, 1e-9 * expected);

    const Real t = 100.0 / mirrored.signal_current();
    const SensorResult r = mirrored.compute_snr(t);
    EXPECT_NEAR(r.value, 10.0, 1e-9);
    ASSERT_TRUE(r.pixels.has_value());
    EXPECT_EQ(r.pixels->aperture_pixels, 1);
    EXPECT_NEAR(r.pixels->signal.sum(), 100.0, 1e-9);
}

TEST(Imager, IntegratesOnlyTheConfiguredRange)
{
    const Vector bins = Vector::LinSpaced(11, 400.0, 500.0);
    auto current = [&](const Vector& file_wl) {
        RadiantPtr chain = std::make_unique<FileTarget>(
            SpectralQty::constant(file_wl, 1.0, units::radiance), bins, TargetSize::Extended);
        chain = std::make_unique<Mirror>(std::move(chain),
                                         SpectralQty::constant(bins, 0.9, units::one, Extrapolation::Linear));
        chain = std::make_unique<StrayLight>(std::move(chain),
                                             SpectralQty::constant(file_wl, 1e-3, units::radiance));
        ImagerParams p;
        p.quantum_efficiency = SpectralQty::constant(bins, 1.0, units::one, Extrapolation::Linear);
        p.rows = p.cols = 8;
        p.pixel_size_m = 1e-5;
        p.f_number     = 5.0;
        p.d_aperture_m = 1.0;
        p.wl_bins      = bins;
        const Imager im(std::move(chain), p, nullptr);
        return std::make_pair(im.signal_current(), im.background_current());
    };
    const auto narrow = current(Vector::LinSpaced(11, 400.0, 500.0));
    const auto wide   = current(Vector::LinSpaced(71, 300.0, 1000.0));
    EXPECT_NEAR(wide.first / narrow.first, 1.0, 1e-12);
    EXPECT_NEAR(wide.second / narrow.second, 1.0, 1e-12);

    const Real etendue = phys::pi * 1e-10 / 101.0;
    const Real expected = 0.9 * etendue * 45000.0 * 1e-9 / (phys::h * phys::c);
    EXPECT_NEAR(wide.first, expected, 1e-9 * expected);
}

TEST(Imager, SnrGrowsWithExposureTime)
{
    const Imager im = point_imager();
    Real last = 0.0;
    for (Real t : {0.1, 1.0, 10.0, 100.0, 1000.0}) {
        const Real snr = im.compute_snr(t).value;
        EXPECT_GE(snr, last);
        last = snr;
    }
    EXPECT_GT(last, 0.0);
}

TEST(Imager, ExposureTimeInvertsSnr)
{
    const Imager im = point_imager();
    for (Real t : {0.5, 20.0, 300.0}) {
        const SensorResult snr = im.compute_snr(t);
        const SensorResult back = im.compute_exposure_time(snr.value);
        EXPECT_EQ(back.kind, SensorResult::Kind::ExposureTime);
        EXPECT_EQ(back.unit, units::s);
        EXPECT_NEAR(back.value, t, 1e-8 * t);
    }
}

TEST(Imager, SensitivityRecoversReferenceMagnitude)
{
    const Imager im = point_imager();
    const Real snr = im.compute_snr(60.0).value;
    const SensorResult r = im.compute_sensitivity(60.0, snr);
    EXPECT_NEAR(r.value, 15.0, 1e-6);

    // twice the SNR needs a brighter star
    EXPECT_LT(im.compute_sensitivity(60.0, 2.0 * snr).value, 15.0);
}

TEST(Imager, PixelBreakdownDescribesTheFrame)
{
    const Imager im = point_imager();
    const SensorResult r = im.compute_snr(10.0);
    ASSERT_TRUE(r.pixels.has_value());
    const PixelBreakdown& b = *r.pixels;
    EXPECT_EQ(b.frame_rows, 32);
    EXPECT_EQ(b.frame_cols, 32);
    EXPECT_EQ(b.signal.rows(), b.dark.rows());
    EXPECT_LE(b.row0 + b.signal.rows(), 32);
    EXPECT_NEAR(b.dark.sum(), 10.0 * 10.0 * b.aperture_pixels, 1e-9);
    EXPECT_NEAR(b.read_noise.squaredNorm(), 25.0 * b.aperture_pixels, 1e-9);
}

TEST(Imager, ContainedPixelsGiveASquareAperture)
{
    ImagerParams p = detector(33);
    p.contained_pixels = 9.0;
    const Imager im = point_imager(p);
    const SensorResult r = im.compute_snr(10.0);
    EXPECT_EQ(r.pixels->aperture_pixels, 9);
    EXPECT_EQ(r.pixels->signal.rows(), 3);
}

TEST(Imager, MinApertureIsAtLeastAsGoodAsFwhm)
{
    ImagerParams fwhm = detector();
    ImagerParams best = detector();
    best.contained_energy = ContainedEnergy::parse("min");

    const Real t = 30.0;
    const Real snr_fwhm = point_imager(fwhm).compute_snr(t).value;
    const Real snr_min  = point_imager(best).compute_snr(t).value;
    EXPECT_GE(snr_min, snr_fwhm - 1e-12);

    const Real t_fwhm = point_imager(fwhm).compute_exposure_time(5.0).value;
    const Real t_min  = point_imager(best).compute_exposure_time(5.0).value;
    EXPECT_LE(t_min, t_fwhm + 1e-9);
}

TEST(Imager, MinApertureFollowsTheLimitingMagnitude)
{
    ImagerParams p = detector();
    p.dark_current = 500.0;
    p.read_noise   = 20.0;
    p.contained_energy = ContainedEnergy::parse("min");

    const Real t = 100.0;
    const SensorResult lim = point_imager(p).compute_sensitivity(t, 5.0);
    ASSERT_TRUE(lim.pixels.has_value());

    // a star at the limiting magnitude picks the same aperture and reaches the SNR
    PsfPtr psf = airy_for(p);
    const Imager faint(star(lim.value), p, std::move(psf));
    const SensorResult at_limit = faint.compute_snr(t);
    EXPECT_DOUBLE_EQ(at_limit.pixels->aperture_radius_px, lim.pixels->aperture_radius_px);
    EXPECT_NEAR(at_limit.value, 5.0, 1e-6);

    ImagerParams fwhm = p;
    fwhm.contained_energy = ContainedEnergy::parse("fwhm");
    EXPECT_GE(lim.value, point_imager(fwhm).compute_sensitivity(t, 5.0).value - 0.02);
}

TEST(Imager, SaturationIsReported)
{
    ImagerParams p = detector();
    p.full_well = 1000.0;
    const Imager im = point_imager(p);
    EXPECT_NO_THROW(im.compute_snr(0.01));
    EXPECT_THROW(im.compute_snr(1000.0), SaturationError);
    EXPECT_THROW(im.compute_exposure_time(1e4), SaturationError);
}

TEST(Imager, ConfigurationErrors)
{
    EXPECT_THROW(Imager(star(), detector(), nullptr), ConfigurationError);

    ImagerParams bad_qe = detector();
    bad_qe.quantum_efficiency = SpectralQty::constant(kWl, 0.8, units::K);
    EXPECT_THROW(point_imager(bad_qe), UnitMismatchError);

    const Imager im = point_imager();
    EXPECT_THROW(im.compute_snr(0.0), ConfigurationError);
    EXPECT_THROW(im.compute_exposure_time(-1.0), ConfigurationError);

    auto uncalibrated = std::make_unique<FileTarget>(
        SpectralQty::constant(kWl, 1e-17, units::flux_density), kWl);
    const Imager no_mag(std::move(uncalibrated), detector(), airy_for(detector()));
    EXPECT_THROW(no_mag.compute_sensitivity(10.0, 5.0), ConfigurationError);
}
