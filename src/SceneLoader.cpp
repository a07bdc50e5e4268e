#include "etcalc/SceneLoader.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/JsonUtils.hpp"
#include "etcalc/Log.hpp"
#include "etcalc/SpectrumLoaders.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <vector>

namespace etcalc {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

[[noreturn]] void fail(const std::string& path, const std::string& msg)
{
    throw ConfigurationError(path + ": " + msg);
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

const json& require(const json& j, const std::string& key, const std::string& path)
{
    if (!j.is_object() || !j.contains(key))
        fail(path, "missing entry '" + key + "'");
    return j.at(key);
}

// Plain number in `canonical`, or {"val": x, "unit": "..."}
Real to_real(const json& v, const std::string& path, const Unit& canonical)
{
    if (v.is_number()) return v.get<Real>();
    if (v.is_object() && v.contains("val") && v.at("val").is_number()) {
        const Real x = v.at("val").get<Real>();
        if (!v.contains("unit")) return x;
        try {
            return x * parse_unit(v.at("unit").get<std::string>()).factor_to(canonical);
        } catch (const UnitMismatchError& e) {
            fail(path, e.what());
        }
    }
    fail(path, "expected a number");
}

Real number(const json& j, const std::string& key, const std::string& path,
            const Unit& canonical = units::one)
{
    return to_real(require(j, key, path), path + "." + key, canonical);
}

std::optional<Real> opt_number(const json& j, const std::string& key, const std::string& path,
                               const Unit& canonical = units::one)
{
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return to_real(j.at(key), path + "." + key, canonical);
}

std::string text(const json& j, const std::string& key, const std::string& path)
{
    const json& v = require(j, key, path);
    if (!v.is_string()) fail(path + "." + key, "expected a string");
    return v.get<std::string>();
}

std::optional<std::string> opt_text(const json& j, const std::string& key, const std::string& path)
{
    if (!j.is_object() || !j.contains(key)) return std::nullopt;
    return text(j, key, path);
}

// Single number or array of numbers
std::vector<Real> number_list(const json& j, const std::string& key, const std::string& path,
                              const Unit& canonical)
{
    std::vector<Real> out;
    if (!j.contains(key)) return out;
    const json& v = j.at(key);
    if (v.is_array()) {
        for (std::size_t i = 0; i < v.size(); ++i)
            out.push_back(to_real(v[i], path + "." + key + "[" + std::to_string(i) + "]", canonical));
    } else {
        out.push_back(to_real(v, path + "." + key, canonical));
    }
    return out;
}

Eigen::Vector2d pair(const json& j, const std::string& path)
{
    if (!j.is_array() || j.size() != 2 || !j[0].is_number() || !j[1].is_number())
        fail(path, "expected two numbers [x, y]");
    return {j[0].get<Real>(), j[1].get<Real>()};
}

Real fraction(const json& j, const std::string& key, const std::string& path)
{
    const Real v = number(j, key, path);
    if (v < 0.0 || v > 1.0) fail(path + "." + key, "must be within [0, 1]");
    return v;
}

} // anonymous namespace

/* ---------------------------------------------------------------- */
SceneLoader::SceneLoader(fs::path base_dir) : base_(std::move(base_dir)) {}

SceneDescription SceneLoader::load_file(const std::string& path)
{
    json j = load_json(path);
    expand_env(j);
    const fs::path dir = fs::path(path).parent_path();
    return SceneLoader(dir.empty() ? fs::path(".") : dir).load(j);
}

std::string SceneLoader::resolve(const std::string& file) const
{
    const fs::path p(file);
    return p.is_absolute() ? p.string() : (base_ / p).string();
}

Vector SceneLoader::wavelength_grid(Real wl_min, Real wl_max, Real wl_delta)
{
    if (!(wl_min > 0.0) || !(wl_max > wl_min))
        throw ConfigurationError("common: wl_min must be positive and below wl_max");
    if (!(wl_delta > 0.0))
        throw ConfigurationError("common: wl_delta must be positive");
    const auto n = static_cast<Eigen::Index>(std::floor((wl_max - wl_min) / wl_delta + 1e-9)) + 1;
    if (n < 2)
        throw ConfigurationError("common: wl_delta leaves fewer than two wavelengths");
    Vector wl(n);
    for (Eigen::Index i = 0; i < n; ++i) wl[i] = wl_min + i * wl_delta;
    return wl;
}

SpectralQty SceneLoader::spectrum(const json& v, const std::string& path, const Vector& wl,
                                  Unit default_unit) const
{
    if (v.is_number())
        return SpectralQty::constant(wl, v.get<Real>(), default_unit, Extrapolation::Linear);
    if (v.is_string())
        return load_spectral_table(resolve(v.get<std::string>()), default_unit);
    if (v.is_object()) {
        Unit unit = default_unit, wl_unit = units::nm;
        try {
            if (auto u = opt_text(v, "unit", path))    unit = parse_unit(*u);
            if (auto u = opt_text(v, "wl_unit", path)) wl_unit = parse_unit(*u);
        } catch (const UnitMismatchError& e) {
            fail(path, e.what());
        }
        const bool count_ratio = unit.dimensionless() &&
                                 default_unit.equivalent(units::electron / units::photon);
        if (!unit.equivalent(default_unit) && !count_ratio)
            fail(path, "unit '" + unit.to_string() + "' is not a '" + default_unit.to_string() + "'");
        if (v.contains("val"))
            return SpectralQty::constant(wl, number(v, "val", path), unit, Extrapolation::Linear);
        return load_spectral_table(resolve(text(v, "file", path)), unit, wl_unit);
    }
    fail(path, "expected a number, a file name or an object with 'file'");
}

/* ---------------------------------------------------------------- *
 *  common                                                          *
 * ---------------------------------------------------------------- */
CommonDesc SceneLoader::common(const json& j) const
{
    const std::string p = "common";
    CommonDesc cm;
    const Real wl_min = number(j, "wl_min", p, units::nm);
    const Real wl_max = number(j, "wl_max", p, units::nm);
    if (j.contains("wl_delta")) {
        cm.wl_delta_nm = number(j, "wl_delta", p, units::nm);
    } else if (j.contains("res")) {
        const Real res = number(j, "res", p);
        if (!(res > 0.0)) fail(p + ".res", "must be positive");
        cm.wl_delta_nm = (wl_min + wl_max) / (2.0 * res);
    } else {
        fail(p, "either 'wl_delta' or 'res' is required");
    }
    cm.wl_bins      = wavelength_grid(wl_min, wl_max, cm.wl_delta_nm);
    cm.d_aperture_m = number(j, "d_aperture", p, units::m);
    if (!(cm.d_aperture_m > 0.0)) fail(p + ".d_aperture", "must be positive");

    cm.jitter_sigma_arcsec = opt_number(j, "jitter_sigma", p);
    if (cm.jitter_sigma_arcsec && *cm.jitter_sigma_arcsec < 0.0)
        fail(p + ".jitter_sigma", "must not be negative");

    cm.exposure_times = number_list(j, "exposure_time", p, units::s);
    cm.snrs           = number_list(j, "snr", p, units::one);
    if (cm.exposure_times.empty() && cm.snrs.empty())
        fail(p, "at least one of 'exposure_time' and 'snr' is required");
    for (Real t : cm.exposure_times)
        if (!(t > 0.0)) fail(p + ".exposure_time", "must be positive");
    for (Real s : cm.snrs)
        if (!(s > 0.0)) fail(p + ".snr", "must be positive");
    return cm;
}

void SceneLoader::psf(const json& j, CommonDesc& cm, const SensorDesc& s) const
{
    const std::string p = "common.psf";
    cm.psf = PsfDesc{};
    if (!j.contains("psf")) return;                       // Airy

    const json& v = j.at("psf");
    std::string type, file;
    if (v.is_string()) {
        file = v.get<std::string>();
        type = lower(file) == "airy" ? "airy" : "";
    } else if (v.is_object()) {
        type = lower(opt_text(v, "type", p).value_or(""));
        file = opt_text(v, "file", p).value_or("");
        if (auto osf = opt_number(v, "osf", p)) {
            if (*osf < 1.0 || std::floor(*osf) != *osf) fail(p + ".osf", "must be a positive integer");
            cm.psf.osf = static_cast<int>(*osf);
        }
    } else {
        fail(p, "expected 'airy', a file name or an object");
    }

    if (type.empty()) {
        const std::string ext = lower(fs::path(file).extension().string());
        type = (ext == ".fits" || ext == ".fit") ? "fits" : "zemax";
    }
    if (type == "airy") return;
    if (file.empty()) fail(p, "a '" + type + "' PSF needs a 'file'");
    if (s.type != SensorDesc::Type::Imager) return;

    const std::string path = resolve(file);
    cm.psf.type   = PsfDesc::Type::Grid;
    cm.psf.source = fs::path(file).filename().string();
    if (type == "fits")
        cm.psf.grid = load_psf_fits(path, s.imager.pixel_size_m, s.imager.f_number, cm.d_aperture_m);
    else if (type == "zemax")
        cm.psf.grid = load_psf_zemax(path);
    else
        fail(p + ".type", "must be one of [airy, fits, zemax]");
}

/* ---------------------------------------------------------------- *
 *  astroscene                                                      *
 * ---------------------------------------------------------------- */
TargetDesc SceneLoader::target(const json& j, const Vector& wl) const
{
    const std::string p = "astroscene.target";
    TargetDesc t;
    const std::string type = text(j, "type", p);
    if (type == "BlackBodyTarget") {
        t.type   = TargetDesc::Type::BlackBody;
        t.temp_K = opt_number(j, "temp", p, units::K).value_or(5778.0);
        t.mag    = opt_number(j, "mag", p).value_or(0.0);
        t.band   = opt_text(j, "band", p).value_or("V");
    } else if (type == "FileTarget") {
        t.type = TargetDesc::Type::File;
        const std::string size = lower(opt_text(j, "size", p).value_or("point"));
        if (size == "point")         t.size = TargetSize::Point;
        else if (size == "extended") t.size = TargetSize::Extended;
        else fail(p + ".size", "must be 'point' or 'extended'");
        const Unit u = t.size == TargetSize::Point ? units::flux_density : units::radiance;
        t.sfd      = spectrum(require(j, "file", p), p + ".file", wl, u);
        t.file_mag = opt_number(j, "mag", p);
    } else {
        fail(p + ".type", "unknown target type '" + type + "'");
    }
    return t;
}

ComponentDesc SceneLoader::component(const json& j, const std::string& p, const Vector& wl) const
{
    static const std::vector<std::pair<std::string, ComponentDesc::Type>> types = {
        {"Mirror", ComponentDesc::Type::Mirror},
        {"Lens", ComponentDesc::Type::Lens},
        {"BeamSplitter", ComponentDesc::Type::BeamSplitter},
        {"Filter", ComponentDesc::Type::Filter},
        {"Atmosphere", ComponentDesc::Type::Atmosphere},
        {"StrayLight", ComponentDesc::Type::StrayLight},
        {"CosmicBackground", ComponentDesc::Type::CosmicBackground},
    };
    const std::string type = text(j, "type", p);
    auto it = std::find_if(types.begin(), types.end(), [&](const auto& e) { return e.first == type; });
    if (it == types.end()) fail(p + ".type", "unknown optical component '" + type + "'");

    ComponentDesc c;
    c.type   = it->second;
    c.temp_K = opt_number(j, "temp", p, units::K).value_or(
        c.type == ComponentDesc::Type::CosmicBackground ? 2.725 : 0.0);
    if (c.temp_K < 0.0) fail(p + ".temp", "must not be negative");

    const char* curve = c.type == ComponentDesc::Type::Mirror ? "reflectance" : "transmittance";
    if (j.contains(curve))
        c.transreflectivity = spectrum(j.at(curve), p + "." + curve, wl, units::one);
    if (j.contains("emissivity"))
        c.emissivity = spectrum(j.at("emissivity"), p + ".emissivity", wl, units::one);
    if (j.contains("emission"))
        c.emission = spectrum(j.at("emission"), p + ".emission", wl, units::radiance);

    if (c.type == ComponentDesc::Type::Filter) {
        c.band     = opt_text(j, "band", p).value_or("");
        c.start_nm = opt_number(j, "start", p, units::nm);
        c.end_nm   = opt_number(j, "end", p, units::nm);
    }

    if (j.contains("obstruction")) {
        c.obstruction.factor     = fraction(j, "obstruction", p);
        c.obstruction.temp_K     = opt_number(j, "obstructor_temp", p, units::K).value_or(0.0);
        c.obstruction.emissivity = j.contains("obstructor_emissivity")
                                 ? fraction(j, "obstructor_emissivity", p) : 1.0;
        const std::string blend = lower(opt_text(j, "obstruction_blend", p).value_or("propagate_then_blend"));
        if (blend == "propagate_then_blend")
            c.obstruction.blend = ObstructionBlend::PropagateThenBlend;
        else if (blend == "blend_then_propagate")
            c.obstruction.blend = ObstructionBlend::BlendThenPropagate;
        else
            fail(p + ".obstruction_blend", "must be 'propagate_then_blend' or 'blend_then_propagate'");
    }
    return c;
}

/* ---------------------------------------------------------------- *
 *  instrument.sensor                                               *
 * ---------------------------------------------------------------- */
SensorDesc SceneLoader::sensor(const json& j, const CommonDesc& cm) const
{
    const std::string p = "instrument.sensor";
    SensorDesc s;
    const std::string type = text(j, "type", p);

    if (type == "Imager") {
        s.type = SensorDesc::Type::Imager;
        ImagerParams& ip = s.imager;
        ip.f_number = number(j, "f_number", p);
        if (!(ip.f_number > 0.0)) fail(p + ".f_number", "must be positive");

        const Eigen::Vector2d geo = pair(require(j, "pixel_geometry", p), p + ".pixel_geometry");
        if (geo.x() < 1.0 || geo.y() < 1.0) fail(p + ".pixel_geometry", "must be positive");
        ip.cols = static_cast<Eigen::Index>(geo.x());
        ip.rows = static_cast<Eigen::Index>(geo.y());
        if (j.contains("center_offset"))
            ip.center_offset_px = pair(j.at("center_offset"), p + ".center_offset");

        const std::string pp = p + ".pixel";
        const json& px = require(j, "pixel", p);
        ip.quantum_efficiency = spectrum(require(px, "quantum_efficiency", pp),
                                         pp + ".quantum_efficiency", cm.wl_bins,
                                         units::electron / units::photon);
        ip.pixel_size_m = number(px, "pixel_size", pp, units::m);
        ip.dark_current = number(px, "dark_current", pp, units::electron_rate);
        ip.read_noise   = number(px, "sigma_read_out", pp, units::electron);
        ip.full_well    = opt_number(px, "well_capacity", pp, units::electron);

        const std::string ap = p + ".photometric_aperture";
        const json& pa = require(j, "photometric_aperture", p);
        try {
            if (auto shape = opt_text(pa, "shape", ap)) ip.shape = parse_aperture_shape(*shape);
            if (pa.contains("contained_energy")) {
                const json& ce = pa.at("contained_energy");
                ip.contained_energy = ce.is_number()
                    ? ContainedEnergy::from_percent(ce.get<Real>())
                    : ContainedEnergy::parse(text(pa, "contained_energy", ap));
            }
        } catch (const ConfigurationError& e) {
            fail(ap, e.what());
        }
        ip.contained_pixels = opt_number(pa, "contained_pixels", ap);
    } else if (type == "Heterodyne") {
        s.type = SensorDesc::Type::Heterodyne;
        HeterodyneParams& hp = s.heterodyne;
        hp.aperture_efficiency  = fraction(j, "aperture_efficiency", p);
        hp.main_beam_efficiency = fraction(j, "main_beam_efficiency", p);
        hp.receiver_temp_K      = number(j, "receiver_temp", p, units::K);
        hp.eta_fss              = fraction(j, "eta_fss", p);
        hp.lambda_line_nm       = number(j, "lambda_line", p, units::nm);
        hp.kappa                = number(j, "kappa", p);
        hp.n_on                 = opt_number(j, "n_on", p);
        hp.n_eff                = opt_number(j, "n_eff", p);
    } else {
        fail(p + ".type", "unknown sensor type '" + type + "'");
    }
    return s;
}

/* ---------------------------------------------------------------- */
SceneDescription SceneLoader::load(const json& scene) const
{
    if (!scene.is_object()) fail("<root>", "expected an object");

    SceneDescription sd;
    sd.common = common(require(scene, "common", "<root>"));
    const Vector& wl = sd.common.wl_bins;

    const json& astro = require(scene, "astroscene", "<root>");
    sd.target = target(require(astro, "target", "astroscene"), wl);

    // optical components from the target outwards
    auto collect = [&](const json& parent, const std::string& p) {
        if (!parent.is_object() || !parent.contains("optical_component")) return;
        const json& oc = parent.at("optical_component");
        const std::string cp = p + ".optical_component";
        if (oc.is_array()) {
            for (std::size_t i = 0; i < oc.size(); ++i)
                sd.components.push_back(component(oc[i], cp + "[" + std::to_string(i) + "]", wl));
        } else {
            sd.components.push_back(component(oc, cp, wl));
        }
    };
    collect(astro, "astroscene");
    if (scene.contains("common_optics")) collect(scene.at("common_optics"), "common_optics");

    const json& instrument = require(scene, "instrument", "<root>");
    collect(instrument, "instrument");
    sd.sensor = sensor(require(instrument, "sensor", "instrument"), sd.common);
    psf(require(scene, "common", "<root>"), sd.common, sd.sensor);

    log::info("SceneLoader", "scene with " + std::to_string(sd.components.size()) +
                             " optical components, " + std::to_string(wl.size()) + " wavelengths");
    return sd;
}

} // namespace etcalc
