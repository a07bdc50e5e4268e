#include "etcalc/OpticalComponents.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/Physics.hpp"

#include <map>

namespace etcalc {

/* Bands from Handbook of Space Astronomy and Astrophysics p. 139 */
FilterBand filter_band(const std::string& band)
{
    static const std::map<std::string, FilterBand> bands = {
        {"U", {365.0,   68.0}},  {"B", {440.0,   98.0}},
        {"V", {550.0,   89.0}},  {"R", {700.0,   220.0}},
        {"I", {900.0,   240.0}}, {"J", {1250.0,  300.0}},
        {"H", {1650.0,  400.0}}, {"K", {2200.0,  600.0}},
        {"L", {3600.0,  1200.0}},{"M", {4800.0,  800.0}},
        {"N", {10200.0, 2500.0}},
    };
    auto it = bands.find(band);
    if (it == bands.end())
        throw ConfigurationError("Filter band has to be one of [U, B, V, R, I, J, H, K, L, M, N], "
                                 "got '" + band + "'");
    return it->second;
}

SpectralQty Filter::top_hat(const Vector& wl_bins, Real start, Real end)
{
    if (!(end > start))
        throw ConfigurationError("Filter: end of the pass band must exceed its start");
    Vector v(wl_bins.size());
    for (Eigen::Index i = 0; i < v.size(); ++i)
        v[i] = (wl_bins[i] >= start && wl_bins[i] <= end) ? 1.0 : 0.0;
    return SpectralQty(wl_bins, std::move(v), units::one, Extrapolation::Zero);
}

std::unique_ptr<Filter> Filter::from_band(RadiantPtr parent, const std::string& band,
                                          const Vector& wl_bins, Real temp_K,
                                          std::optional<SpectralQty> emissivity,
                                          Obstruction obstruction)
{
    const FilterBand fb = filter_band(band);
    return from_range(std::move(parent), fb.cwl - fb.bw / 2.0, fb.cwl + fb.bw / 2.0,
                      wl_bins, temp_K, std::move(emissivity), obstruction);
}

std::unique_ptr<Filter> Filter::from_range(RadiantPtr parent, Real start, Real end,
                                           const Vector& wl_bins, Real temp_K,
                                           std::optional<SpectralQty> emissivity,
                                           Obstruction obstruction)
{
    return std::make_unique<Filter>(std::move(parent), top_hat(wl_bins, start, end), temp_K,
                                    std::move(emissivity), obstruction);
}

/* ---------------------------------------------------------------- */
std::unique_ptr<Atmosphere> Atmosphere::with_temperature(RadiantPtr parent,
                                                         SpectralQty transmittance,
                                                         Real temp_K)
{
    auto emission = HotOpticalComponent::thermal_emission(transmittance, std::nullopt, temp_K);
    return std::make_unique<Atmosphere>(std::move(parent), std::move(transmittance),
                                        std::move(emission));
}

/* ---------------------------------------------------------------- */
StrayLight::StrayLight(RadiantPtr parent, SpectralQty emission)
    : OpticalComponent(std::move(parent),
                       SpectralQty::constant(emission.wl(), 1.0, units::one, Extrapolation::Linear),
                       emission.to(units::radiance))
{
}

CosmicBackground::CosmicBackground(RadiantPtr parent, const Vector& wl_bins, Real temp_K)
    : OpticalComponent(std::move(parent),
                       SpectralQty::constant(wl_bins, 1.0, units::one, Extrapolation::Linear),
                       phys::black_body(wl_bins, temp_K))
{
}

} // namespace etcalc
