#pragma once
#include "Radiant.hpp"
#include "Types.hpp"

#include <optional>
#include <string>

namespace etcalc {

// Leaf of the chain: emits the signal, contributes no background
class Target : public IRadiant {
public:
    Target(SpectralQty sfd,
           Vector wl_bins,
           TargetSize size = TargetSize::Point,
           std::optional<Real> mag = std::nullopt);

    SpectralQty signal() const override { return sfd_; }
    SpectralQty background() const override;

    TargetSize size() const override { return size_; }
    Real obstruction() const override { return 0.0; }
    std::optional<Real> magnitude() const override { return mag_; }
    std::string name() const override { return "Target"; }

protected:
    SpectralQty         sfd_;
    Vector              wl_bins_;
    TargetSize          size_;
    std::optional<Real> mag_;
};

// Photometric band used to calibrate a black body to a magnitude
struct PhotometricBand {
    Real wl;    // nm
    Real sfd;   // W / (m² nm) of a 0 mag star
};

// U B V R I J H K zero points; throws ConfigurationError for unknown bands
PhotometricBand photometric_band(const std::string& band);

// Point source with a Planck spectrum scaled to an apparent magnitude
class BlackBodyTarget : public Target {
public:
    BlackBodyTarget(const Vector& wl_bins,
                    Real temp_K = 5778.0,
                    Real mag = 0.0,
                    const std::string& band = "V");

    std::string name() const override { return "BlackBodyTarget"; }

    Real temperature() const noexcept { return temp_; }

private:
    static SpectralQty make_sfd(const Vector& wl_bins, Real temp_K,
                                Real mag, const std::string& band);
    Real temp_;
};

// Target with a tabulated spectrum.  Point sources carry a spectral flux
// density, extended sources a spectral radiance.
class FileTarget : public Target {
public:
    FileTarget(SpectralQty sfd,
               const Vector& wl_bins,
               TargetSize size = TargetSize::Point,
               std::optional<Real> mag = std::nullopt);

    std::string name() const override { return "FileTarget"; }
};

} // namespace etcalc
