#pragma once
#include "OpticalComponent.hpp"
#include "Types.hpp"

#include <optional>
#include <string>

namespace etcalc {

class Mirror : public HotOpticalComponent {
public:
    Mirror(RadiantPtr parent, SpectralQty reflectance, Real temp_K = 0.0,
           std::optional<SpectralQty> emissivity = std::nullopt, Obstruction obstruction = {})
        : HotOpticalComponent(std::move(parent), std::move(reflectance), temp_K,
                              std::move(emissivity), obstruction) {}

    std::string name() const override { return "Mirror"; }
};

class Lens : public HotOpticalComponent {
public:
    Lens(RadiantPtr parent, SpectralQty transmittance, Real temp_K = 0.0,
         std::optional<SpectralQty> emissivity = std::nullopt, Obstruction obstruction = {})
        : HotOpticalComponent(std::move(parent), std::move(transmittance), temp_K,
                              std::move(emissivity), obstruction) {}

    std::string name() const override { return "Lens"; }
};

class BeamSplitter : public HotOpticalComponent {
public:
    BeamSplitter(RadiantPtr parent, SpectralQty transmittance, Real temp_K = 0.0,
                 std::optional<SpectralQty> emissivity = std::nullopt, Obstruction obstruction = {})
        : HotOpticalComponent(std::move(parent), std::move(transmittance), temp_K,
                              std::move(emissivity), obstruction) {}

    std::string name() const override { return "BeamSplitter"; }
};

// Pass band of a named filter
struct FilterBand {
    Real cwl;   // central wavelength, nm
    Real bw;    // band width, nm
};

// U B V R I J H K L M N; throws ConfigurationError for unknown names
FilterBand filter_band(const std::string& band);

class Filter : public HotOpticalComponent {
public:
    Filter(RadiantPtr parent, SpectralQty transmittance, Real temp_K = 0.0,
           std::optional<SpectralQty> emissivity = std::nullopt, Obstruction obstruction = {})
        : HotOpticalComponent(std::move(parent), std::move(transmittance), temp_K,
                              std::move(emissivity), obstruction) {}

    // Ideal band pass: τ = 1 within [start, end], 0 elsewhere, sampled on wl_bins
    static SpectralQty top_hat(const Vector& wl_bins, Real start, Real end);

    static std::unique_ptr<Filter> from_band(RadiantPtr parent, const std::string& band,
                                             const Vector& wl_bins, Real temp_K = 0.0,
                                             std::optional<SpectralQty> emissivity = std::nullopt,
                                             Obstruction obstruction = {});

    static std::unique_ptr<Filter> from_range(RadiantPtr parent, Real start, Real end,
                                              const Vector& wl_bins, Real temp_K = 0.0,
                                              std::optional<SpectralQty> emissivity = std::nullopt,
                                              Obstruction obstruction = {});

    std::string name() const override { return "Filter"; }
};

// Atmospheric transmission with tabulated or grey-body emission
class Atmosphere : public OpticalComponent {
public:
    Atmosphere(RadiantPtr parent, SpectralQty transmittance,
               std::optional<SpectralQty> emission = std::nullopt)
        : OpticalComponent(std::move(parent), std::move(transmittance), std::move(emission)) {}

    // Emission of an atmosphere of temperature T with emissivity 1 - τ
    static std::unique_ptr<Atmosphere> with_temperature(RadiantPtr parent,
                                                        SpectralQty transmittance,
                                                        Real temp_K);

    std::string name() const override { return "Atmosphere"; }
};

// Additional diffuse light (zodiacal light, earth shine, ...)
class StrayLight : public OpticalComponent {
public:
    StrayLight(RadiantPtr parent, SpectralQty emission);

    std::string name() const override { return "StrayLight"; }
};

// Cosmic microwave background as black body radiator
class CosmicBackground : public OpticalComponent {
public:
    CosmicBackground(RadiantPtr parent, const Vector& wl_bins, Real temp_K = 2.725);

    std::string name() const override { return "CosmicBackground"; }
};

} // namespace etcalc
