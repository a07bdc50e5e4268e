#include "etcalc/Target.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/Physics.hpp"

#include <cmath>
#include <map>

namespace etcalc {

/* ---------------------------------------------------------------- */
Target::Target(SpectralQty sfd, Vector wl_bins, TargetSize size, std::optional<Real> mag)
    : sfd_(std::move(sfd)), wl_bins_(std::move(wl_bins)), size_(size), mag_(mag)
{
    if (wl_bins_.size() == 0)
        throw ConfigurationError("Target: empty wavelength grid");
}

SpectralQty Target::background() const
{
    return SpectralQty::constant(wl_bins_, 0.0, units::radiance);
}

/* ---------------------------------------------------------------- *
 *  band zero points, Handbook of Space Astronomy and Astrophysics  *
 * ---------------------------------------------------------------- */
PhotometricBand photometric_band(const std::string& band)
{
    static const std::map<std::string, PhotometricBand> bands = {
        {"U", {366.0,  4.175e-11}},
        {"B", {438.0,  6.32e-11}},
        {"V", {545.0,  3.631e-11}},
        {"R", {641.0,  2.177e-11}},
        {"I", {798.0,  1.126e-11}},
        {"J", {1220.0, 3.15e-12}},
        {"H", {1630.0, 1.14e-12}},
        {"K", {2190.0, 3.96e-13}},
    };
    auto it = bands.find(band);
    if (it == bands.end())
        throw ConfigurationError("Band has to be one of [U, B, V, R, I, J, H, K], got '" +
                                 band + "'");
    return it->second;
}

/* ---------------------------------------------------------------- */
BlackBodyTarget::BlackBodyTarget(const Vector& wl_bins, Real temp_K, Real mag,
                                 const std::string& band)
    : Target(make_sfd(wl_bins, temp_K, mag, band), wl_bins, TargetSize::Point, mag),
      temp_(temp_K)
{
}

SpectralQty BlackBodyTarget::make_sfd(const Vector& wl_bins, Real temp_K,
                                      Real mag, const std::string& band)
{
    if (temp_K <= 0.0)
        throw ConfigurationError("BlackBodyTarget: temperature must be positive");
    const PhotometricBand pb = photometric_band(band);

    // scale the Planck curve so that a 0 mag star matches the band flux
    const Real factor = pb.sfd / phys::planck_radiance(pb.wl, temp_K);
    const Real scale  = factor * std::pow(10.0, -0.4 * mag);

    return SpectralQty::from_function(
        wl_bins, [&](Real l) { return phys::planck_radiance(l, temp_K) * scale; },
        units::flux_density);
}

/* ---------------------------------------------------------------- */
FileTarget::FileTarget(SpectralQty sfd, const Vector& wl_bins, TargetSize size,
                       std::optional<Real> mag)
    : Target(std::move(sfd), wl_bins, size, mag)
{
    const Unit& expected = size == TargetSize::Point ? units::flux_density : units::radiance;
    if (!sfd_.unit().equivalent(expected))
        throw ConfigurationError("FileTarget: expected a spectrum in '" + expected.to_string() +
                                 "', got '" + sfd_.unit().to_string() + "'");
    sfd_ = sfd_.to(expected);
}

} // namespace etcalc
