#include "etcalc/PipelineAssembler.hpp"
#include "etcalc/AiryPSF.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/GriddedPSF.hpp"
#include "etcalc/Heterodyne.hpp"
#include "etcalc/Imager.hpp"
#include "etcalc/Log.hpp"
#include "etcalc/OpticalComponents.hpp"
#include "etcalc/Target.hpp"

#include <sstream>

namespace etcalc {

std::string to_string(ComponentDesc::Type t)
{
    switch (t) {
    case ComponentDesc::Type::Mirror:           return "Mirror";
    case ComponentDesc::Type::Lens:             return "Lens";
    case ComponentDesc::Type::BeamSplitter:     return "BeamSplitter";
    case ComponentDesc::Type::Filter:           return "Filter";
    case ComponentDesc::Type::Atmosphere:       return "Atmosphere";
    case ComponentDesc::Type::StrayLight:       return "StrayLight";
    case ComponentDesc::Type::CosmicBackground: return "CosmicBackground";
    }
    return "Unknown";
}

PipelineAssembler::PipelineAssembler(SceneDescription scene) : scene_(std::move(scene))
{
    if (scene_.common.wl_bins.size() < 2)
        throw ConfigurationError("Scene: the wavelength grid needs at least two points");
    if (!(scene_.common.d_aperture_m > 0.0))
        throw ConfigurationError("Scene: aperture diameter must be positive");
}

/* ---------------------------------------------------------------- *
 *  radiant chain                                                   *
 * ---------------------------------------------------------------- */
RadiantPtr PipelineAssembler::build_target(const TargetDesc& t, const Vector& wl_bins)
{
    switch (t.type) {
    case TargetDesc::Type::BlackBody:
        return std::make_unique<BlackBodyTarget>(wl_bins, t.temp_K, t.mag, t.band);
    case TargetDesc::Type::File:
        if (!t.sfd)
            throw ConfigurationError("FileTarget: missing spectral flux density");
        return std::make_unique<FileTarget>(*t.sfd, wl_bins, t.size, t.file_mag);
    }
    throw ConfigurationError("Unknown target type");
}

RadiantPtr PipelineAssembler::build_component(RadiantPtr parent, const ComponentDesc& c,
                                              const Vector& wl_bins)
{
    const std::string what = to_string(c.type);
    auto curve = [&](const std::optional<SpectralQty>& q, const char* name) -> const SpectralQty& {
        if (!q) throw ConfigurationError(what + ": missing " + name);
        return *q;
    };

    switch (c.type) {
    case ComponentDesc::Type::Mirror:
        return std::make_unique<Mirror>(std::move(parent), curve(c.transreflectivity, "reflectance"),
                                        c.temp_K, c.emissivity, c.obstruction);
    case ComponentDesc::Type::Lens:
        return std::make_unique<Lens>(std::move(parent), curve(c.transreflectivity, "transmittance"),
                                      c.temp_K, c.emissivity, c.obstruction);
    case ComponentDesc::Type::BeamSplitter:
        return std::make_unique<BeamSplitter>(std::move(parent),
                                              curve(c.transreflectivity, "transmittance"),
                                              c.temp_K, c.emissivity, c.obstruction);
    case ComponentDesc::Type::Filter:
        if (c.transreflectivity)
            return std::make_unique<Filter>(std::move(parent), *c.transreflectivity,
                                            c.temp_K, c.emissivity, c.obstruction);
        if (!c.band.empty())
            return Filter::from_band(std::move(parent), c.band, wl_bins,
                                     c.temp_K, c.emissivity, c.obstruction);
        if (c.start_nm && c.end_nm)
            return Filter::from_range(std::move(parent), *c.start_nm, *c.end_nm, wl_bins,
                                      c.temp_K, c.emissivity, c.obstruction);
        throw ConfigurationError("Filter: needs a transmittance, a band or start and end");
    case ComponentDesc::Type::Atmosphere:
        if (c.emission)
            return std::make_unique<Atmosphere>(std::move(parent),
                                                curve(c.transreflectivity, "transmittance"),
                                                *c.emission);
        if (c.temp_K > 0.0)
            return Atmosphere::with_temperature(std::move(parent),
                                                curve(c.transreflectivity, "transmittance"),
                                                c.temp_K);
        return std::make_unique<Atmosphere>(std::move(parent),
                                            curve(c.transreflectivity, "transmittance"));
    case ComponentDesc::Type::StrayLight:
        return std::make_unique<StrayLight>(std::move(parent), curve(c.emission, "emission"));
    case ComponentDesc::Type::CosmicBackground:
        return std::make_unique<CosmicBackground>(std::move(parent), wl_bins, c.temp_K);
    }
    throw ConfigurationError("Unknown optical component type");
}

RadiantPtr PipelineAssembler::build_chain() const
{
    const Vector& wl = scene_.common.wl_bins;
    RadiantPtr node = build_target(scene_.target, wl);
    for (const auto& c : scene_.components) {
        node = build_component(std::move(node), c, wl);
        log::debug("Assembler", "added " + node->name());
    }
    return node;
}

/* ---------------------------------------------------------------- *
 *  detector                                                        *
 * ---------------------------------------------------------------- */
PsfPtr PipelineAssembler::build_psf(const ImagerParams& p, Real obstruction) const
{
    const CommonDesc& cm = scene_.common;
    const Vector& wl = cm.wl_bins;
    const Real central_wl = wl[0] + (wl[wl.size() - 1] - wl[0]) / 2.0;
    const Real jitter = cm.jitter_sigma_arcsec.value_or(0.0);

    if (cm.psf.type == PsfDesc::Type::Airy) {
        AiryParams ap;
        ap.f_number     = p.f_number;
        ap.wl_nm        = central_wl;
        ap.d_aperture_m = cm.d_aperture_m;
        ap.pixel_size_m = p.pixel_size_m;
        ap.osf          = cm.psf.osf;
        ap.jitter_sigma_arcsec = jitter;
        ap.obstruction  = obstruction;
        return std::make_shared<AiryPSF>(ap);
    }

    if (!cm.psf.grid)
        throw ConfigurationError("Gridded PSF without grid data");
    if (obstruction > 0.0)
        log::info("Assembler", "obstruction is ignored for gridded PSFs, it is part of the grid");
    GriddedParams gp;
    gp.f_number     = p.f_number;
    gp.d_aperture_m = cm.d_aperture_m;
    gp.pixel_size_m = p.pixel_size_m;
    gp.osf          = cm.psf.osf;
    gp.jitter_sigma_arcsec = jitter;
    return std::make_shared<GriddedPSF>(*cm.psf.grid, gp,
                                        cm.psf.source.empty() ? "GriddedPSF" : cm.psf.source);
}

SensorPtr PipelineAssembler::build_sensor() const
{
    RadiantPtr chain = build_chain();
    const Real obstruction = chain->obstruction();
    if (obstruction > 1.0)
        throw ConfigurationError("Accumulated obstruction exceeds the aperture");

    std::ostringstream os;
    os << "chain outer element " << chain->name() << ", obstruction " << obstruction;
    log::debug("Assembler", os.str());

    const CommonDesc& cm = scene_.common;
    if (scene_.sensor.type == SensorDesc::Type::Imager) {
        ImagerParams p = scene_.sensor.imager;
        p.d_aperture_m = cm.d_aperture_m;
        p.wl_bins      = cm.wl_bins;
        PsfPtr psf = chain->size() == TargetSize::Point ? build_psf(p, obstruction) : nullptr;
        return std::make_unique<Imager>(std::move(chain), std::move(p), std::move(psf));
    }

    HeterodyneParams p = scene_.sensor.heterodyne;
    p.d_aperture_m = cm.d_aperture_m;
    p.wl_bins      = cm.wl_bins;
    p.wl_delta_nm  = cm.wl_delta_nm;
    return std::make_unique<Heterodyne>(std::move(chain), std::move(p));
}

} // namespace etcalc
