#include "etcalc/ReportUtils.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/Log.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using nlohmann::json;

namespace etcalc {

/* ===================================================================== */
/*                           H e l p e r s                               */
/* ===================================================================== */
static json to_std(const Vector& v)
{
    std::vector<double> out(v.data(), v.data() + v.size());
    return out;
}

static json to_rows(const Matrix& m)
{
    json rows = json::array();
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        std::vector<double> row(static_cast<std::size_t>(m.cols()));
        for (Eigen::Index c = 0; c < m.cols(); ++c) row[c] = m(r, c);
        rows.push_back(std::move(row));
    }
    return rows;
}

/* ===================================================================== */
json to_json(const SpectralQty& q)
{
    return {
        {"wl",      to_std(q.wl())},
        {"wl_unit", q.wl_unit().to_string()},
        {"values",  to_std(q.values())},
        {"unit",    q.unit().to_string()}
    };
}

json to_json(const PixelBreakdown& p)
{
    // full frame = zeros with the box placed at (row0, col0)
    return {
        {"frame",  {{"rows", p.frame_rows}, {"cols", p.frame_cols}}},
        {"origin", {{"row", p.row0}, {"col", p.col0}}},
        {"aperture_radius_px", p.aperture_radius_px},
        {"aperture_pixels",    p.aperture_pixels},
        {"unit", "electron"},
        {"signal",     to_rows(p.signal)},
        {"background", to_rows(p.background)},
        {"dark",       to_rows(p.dark)},
        {"read_noise", to_rows(p.read_noise)}
    };
}

json to_json(const ScenarioOutcome& o)
{
    json j;
    j["request"] = to_string(o.scenario.kind);
    if (o.scenario.kind != SensorResult::Kind::ExposureTime) j["exposure_time"] = o.scenario.exposure_time;
    if (o.scenario.kind != SensorResult::Kind::SNR)          j["snr"]           = o.scenario.snr;

    if (!o.ok()) {
        j["status"] = "failed";
        j["error"]  = o.error;
        return j;
    }
    const SensorResult& r = *o.result;
    j["status"]        = "ok";
    j["value"]         = r.value;
    j["unit"]          = r.unit.to_string();
    j["exposure_time"] = r.exposure_time;
    j["snr"]           = r.snr;
    if (r.pixels) j["pixels"] = to_json(*r.pixels);
    if (r.spectra) {
        j["spectra"] = {
            {"t_signal",     to_json(r.spectra->t_signal)},
            {"t_background", to_json(r.spectra->t_background)},
            {"t_rms",        to_json(r.spectra->t_rms)}
        };
    }
    return j;
}

json make_report(const SceneDescription&             scene,
                 const std::string&                  sensor_name,
                 const std::vector<ScenarioOutcome>& outcomes)
{
    const CommonDesc& cm = scene.common;
    json comps = json::array();
    for (const auto& c : scene.components) comps.push_back(to_string(c.type));

    json rep;
    rep["scene"] = {
        {"wl_min",     cm.wl_bins[0]},
        {"wl_max",     cm.wl_bins[cm.wl_bins.size() - 1]},
        {"wl_delta",   cm.wl_delta_nm},
        {"d_aperture", cm.d_aperture_m},
        {"target",     scene.target.type == TargetDesc::Type::BlackBody ? "BlackBodyTarget" : "FileTarget"},
        {"optical_components", comps},
        {"sensor",     sensor_name}
    };
    if (scene.sensor.type == SensorDesc::Type::Imager)
        rep["scene"]["psf"] = cm.psf.type == PsfDesc::Type::Airy ? std::string("airy") : cm.psf.source;

    std::size_t failed = 0;
    json results = json::array();
    for (const auto& o : outcomes) {
        if (!o.ok()) ++failed;
        results.push_back(to_json(o));
    }
    rep["results"] = std::move(results);
    rep["failed"]  = failed;
    return rep;
}

void write_report(const std::string& path, const json& report)
{
    const fs::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) throw ConfigurationError("Cannot create directory " + p.parent_path().string() +
                                         ": " + ec.message());
    }
    std::ofstream f(p);
    if (!f) throw ConfigurationError("Cannot write " + path);
    f << report.dump(2) << '\n';
    if (!f) throw ConfigurationError("Error while writing " + path);
    log::info("Report", "wrote " + path);
}

std::string summary_line(const ScenarioOutcome& o)
{
    const std::string head = describe(o.scenario) + ": ";
    if (!o.ok()) return head + "FAILED (" + o.error + ")";

    const SensorResult& r = *o.result;
    char buf[64];
    switch (r.kind) {
    case SensorResult::Kind::SNR:
        std::snprintf(buf, sizeof buf, "SNR = %.4g", r.value);
        break;
    case SensorResult::Kind::ExposureTime:
        std::snprintf(buf, sizeof buf, "t = %.4g s", r.value);
        break;
    case SensorResult::Kind::Sensitivity:
        std::snprintf(buf, sizeof buf, "limiting magnitude = %.3f mag", r.value);
        break;
    }
    return head + buf;
}

} // namespace etcalc
