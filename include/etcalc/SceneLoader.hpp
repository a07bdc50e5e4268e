#pragma once
#include "SceneDescription.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace etcalc {

/*
 * Turns a JSON scene into a SceneDescription.  Relative file names are
 * resolved against `base_dir`.  Scalars may be given as plain numbers in
 * the canonical unit or as {"val": x, "unit": "..."}; spectra as a number,
 * a file name or {"file": name, "unit": "...", "wl_unit": "..."}.
 * Every problem raises ConfigurationError naming the JSON path.
 */
class SceneLoader {
public:
    explicit SceneLoader(std::filesystem::path base_dir = ".");

    SceneDescription load(const nlohmann::json& scene) const;

    // Reads the file, expands ${VAR} and resolves files next to it
    static SceneDescription load_file(const std::string& path);

    // wl_min .. wl_max in steps of wl_delta (the last point is kept if it fits)
    static Vector wavelength_grid(Real wl_min, Real wl_max, Real wl_delta);

private:
    using json = nlohmann::json;

    CommonDesc    common(const json& j) const;
    TargetDesc    target(const json& j, const Vector& wl) const;
    ComponentDesc component(const json& j, const std::string& path, const Vector& wl) const;
    SensorDesc    sensor(const json& j, const CommonDesc& cm) const;
    void          psf(const json& j, CommonDesc& cm, const SensorDesc& s) const;

    SpectralQty spectrum(const json& v, const std::string& path, const Vector& wl,
                         Unit default_unit) const;
    std::string resolve(const std::string& file) const;

    std::filesystem::path base_;
};

} // namespace etcalc
