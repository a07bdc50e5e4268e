#include "etcalc/Errors.hpp"
#include "etcalc/Heterodyne.hpp"
#include "etcalc/OpticalComponents.hpp"
#include "etcalc/Physics.hpp"
#include "etcalc/Target.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <memory>

using namespace etcalc;

namespace {

// 1.0 .. 2.0 mm
const Vector kWl = Vector::LinSpaced(11, 1.0e6, 2.0e6);
constexpr Real kLine = 1.55e6;

HeterodyneParams receiver()
{
    HeterodyneParams p;
    p.aperture_efficiency  = 0.6;
    p.main_beam_efficiency = 1.0;
    p.receiver_temp_K      = 100.0;
    p.eta_fss              = 1.0;
    p.lambda_line_nm       = kLine;
    p.kappa                = 1.0;
    p.n_eff                = 1.0;
    p.d_aperture_m         = 12.0;
    p.wl_bins              = kWl;
    p.wl_delta_nm          = 10.0;
    return p;
}

RadiantPtr cloud(Real radiance = 1e-22)
{
    return std::make_unique<FileTarget>(SpectralQty::constant(kWl, radiance, units::radiance),
                                        kWl, TargetSize::Extended);
}

} // namespace

TEST(Heterodyne, RadiometerEquation)
{
    EXPECT_DOUBLE_EQ(Heterodyne::radiometer_rms(100.0, 1.0, 1.0, 1.0, 1.0), 100.0);
    EXPECT_DOUBLE_EQ(Heterodyne::radiometer_rms(100.0, 1.0, 1.0, 1e4, 1.0), 1.0);
    // T_signal = 1 K: SNR 0.01 after 1 s, 1 after 10^4 s
    EXPECT_NEAR(1.0 / Heterodyne::radiometer_rms(100.0, 1.0, 1.0, 1.0, 1.0), 0.01, 1e-15);
    EXPECT_NEAR(1.0 / Heterodyne::radiometer_rms(100.0, 1.0, 1.0, 1e4, 1.0), 1.0, 1e-15);
}

TEST(Heterodyne, DoublingTimeImprovesNoiseBySqrtTwo)
{
    const Heterodyne h(cloud(), receiver());
    const SensorResult a = h.compute_snr(100.0);
    const SensorResult b = h.compute_snr(200.0);
    EXPECT_NEAR(b.value / a.value, std::sqrt(2.0), 1e-12);

    ASSERT_TRUE(a.spectra && b.spectra);
    EXPECT_NEAR(b.spectra->t_rms.at(kLine) / a.spectra->t_rms.at(kLine), 1.0 / std::sqrt(2.0), 1e-12);
}

TEST(Heterodyne, RayleighJeansTemperatureOfExtendedSource)
{
    const Heterodyne h(cloud(1e-22), receiver());
    const Real wl_m = kLine * 1e-9;
    // T = I_λ λ⁴ / (2 k c) with I_λ per metre
    const Real expected = 1e-22 * 1e9 * std::pow(wl_m, 4) / (2.0 * phys::k_B * phys::c);
    EXPECT_NEAR(h.t_signal().at(kLine), expected, 1e-9 * expected);
    EXPECT_DOUBLE_EQ(h.t_background().at(kLine), 0.0);
}

TEST(Heterodyne, SnrFollowsTheRadiometerEquation)
{
    const Heterodyne h(cloud(), receiver());
    const Real t = 50.0;
    const Real dnu = h.delta_nu().at(kLine);
    EXPECT_NEAR(dnu, phys::frequency(kLine) / (kLine / 10.0 + 1.0), 1e-6 * dnu);

    const Real expected = h.t_signal().at(kLine) / Heterodyne::radiometer_rms(100.0, 1.0, dnu, t, 1.0);
    EXPECT_NEAR(h.compute_snr(t).value, expected, 1e-9 * expected);
}

TEST(Heterodyne, ExposureTimeInvertsSnr)
{
    const Heterodyne h(cloud(), receiver());
    for (Real t : {1.0, 64.0, 3600.0}) {
        const Real snr = h.compute_snr(t).value;
        EXPECT_NEAR(h.compute_exposure_time(snr).value, t, 1e-9 * t);
    }
}

TEST(Heterodyne, BackgroundRaisesSystemTemperature)
{
    const Heterodyne cold(cloud(), receiver());
    auto chain = std::make_unique<CosmicBackground>(cloud(), kWl);
    const Heterodyne warm(std::move(chain), receiver());
    EXPECT_GT(warm.t_background().at(kLine), 0.0);
    EXPECT_LT(warm.compute_snr(10.0).value, cold.compute_snr(10.0).value);
}

TEST(Heterodyne, EffectiveIntegrationCount)
{
    HeterodyneParams p = receiver();
    p.n_eff.reset();
    EXPECT_NEAR(Heterodyne(cloud(), p).n_eff(), 0.5, 1e-15);
    p.n_on = 4.0;
    EXPECT_NEAR(Heterodyne(cloud(), p).n_eff(), 2.0 / 3.0, 1e-15);
    p.n_eff = 0.9;
    EXPECT_NEAR(Heterodyne(cloud(), p).n_eff(), 0.9, 1e-15);
}

TEST(Heterodyne, PointSourceSensitivity)
{
    const Vector wl = kWl;
    auto target = std::make_unique<FileTarget>(
        SpectralQty::constant(wl, 1e-25, units::flux_density), wl, TargetSize::Point, 10.0);
    const Heterodyne h(std::move(target), receiver());
    const Real snr = h.compute_snr(100.0).value;
    EXPECT_NEAR(h.compute_sensitivity(100.0, snr).value, 10.0, 1e-6);
}

TEST(Heterodyne, InvalidConfiguration)
{
    HeterodyneParams p = receiver();
    p.lambda_line_nm = 3.0e6;
    EXPECT_THROW(Heterodyne(cloud(), p), ConfigurationError);
    p = receiver();
    p.aperture_efficiency = 1.5;
    EXPECT_THROW(Heterodyne(cloud(), p), ConfigurationError);
    const Heterodyne h(cloud(), receiver());
    EXPECT_THROW(h.compute_sensitivity(10.0, 5.0), ConfigurationError);
}
