#include "etcalc/Errors.hpp"
#include "etcalc/PipelineAssembler.hpp"
#include "etcalc/SceneLoader.hpp"
#include "etcalc/SpectrumLoaders.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace etcalc;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

class SceneLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("etcalc_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);

        write("qe.csv",
              "# detector quantum efficiency\n"
              "wavelength, qe\n"
              "400, 0.6\n"
              "550, 0.9\n"
              "700, 0.7\n");
        write("mirror.dat",
              "0.40 0.92\n"
              "0.70 0.96\n");
    }

    void TearDown() override { fs::remove_all(dir_); }

    void write(const std::string& name, const std::string& text)
    {
        std::ofstream(dir_ / name) << text;
    }

    json imager_scene() const
    {
        return json::parse(R"({
          "common": {
            "wl_min": 400, "wl_max": 700, "wl_delta": 10,
            "d_aperture": {"val": 50, "unit": "cm"},
            "jitter_sigma": 0.0,
            "psf": "airy",
            "exposure_time": [1, 10, 100]
          },
          "astroscene": {
            "target": {"type": "BlackBodyTarget", "temp": 5778, "mag": 14, "band": "V"},
            "optical_component": {"type": "Atmosphere", "transmittance": 0.8, "temp": 270}
          },
          "common_optics": {
            "optical_component": [
              {"type": "Mirror", "reflectance": {"file": "mirror.dat", "wl_unit": "um"},
               "obstruction": 0.1, "obstructor_temp": 280},
              {"type": "Mirror", "reflectance": 0.9, "temp": 280, "emissivity": 0.05}
            ]
          },
          "instrument": {
            "optical_component": {"type": "Filter", "band": "V"},
            "sensor": {
              "type": "Imager",
              "f_number": 12,
              "pixel_geometry": [64, 48],
              "center_offset": [0.5, 0],
              "pixel": {
                "quantum_efficiency": "qe.csv",
                "pixel_size": {"val": 6.5, "unit": "um"},
                "dark_current": 2,
                "sigma_read_out": 4,
                "well_capacity": 60000
              },
              "photometric_aperture": {"shape": "square", "contained_energy": 80}
            }
          }
        })");
    }

    fs::path dir_;
};

} // namespace

TEST_F(SceneLoaderTest, ImagerScene)
{
    const SceneDescription sd = SceneLoader(dir_).load(imager_scene());

    EXPECT_EQ(sd.common.wl_bins.size(), 31);
    EXPECT_DOUBLE_EQ(sd.common.d_aperture_m, 0.5);
    EXPECT_EQ(sd.common.exposure_times.size(), 3u);
    EXPECT_TRUE(sd.common.snrs.empty());
    EXPECT_EQ(sd.common.psf.type, PsfDesc::Type::Airy);

    EXPECT_EQ(sd.target.type, TargetDesc::Type::BlackBody);
    EXPECT_DOUBLE_EQ(sd.target.mag, 14.0);

    // astroscene, common optics, instrument
    ASSERT_EQ(sd.components.size(), 4u);
    EXPECT_EQ(sd.components[0].type, ComponentDesc::Type::Atmosphere);
    EXPECT_EQ(sd.components[1].type, ComponentDesc::Type::Mirror);
    EXPECT_EQ(sd.components[3].type, ComponentDesc::Type::Filter);
    EXPECT_DOUBLE_EQ(sd.components[1].obstruction.factor, 0.1);
    EXPECT_DOUBLE_EQ(sd.components[1].obstruction.temp_K, 280.0);
    ASSERT_TRUE(sd.components[1].transreflectivity.has_value());
    EXPECT_NEAR(sd.components[1].transreflectivity->at(550.0), 0.94, 1e-12);
    EXPECT_EQ(sd.components[3].band, "V");

    const ImagerParams& ip = sd.sensor.imager;
    EXPECT_EQ(sd.sensor.type, SensorDesc::Type::Imager);
    EXPECT_EQ(ip.cols, 64);
    EXPECT_EQ(ip.rows, 48);
    EXPECT_DOUBLE_EQ(ip.center_offset_px.x(), 0.5);
    EXPECT_NEAR(ip.pixel_size_m, 6.5e-6, 1e-18);
    EXPECT_NEAR(ip.quantum_efficiency.at(550.0), 0.9, 1e-12);
    EXPECT_EQ(ip.shape, ApertureShape::Square);
    EXPECT_EQ(ip.contained_energy.kind, ContainedEnergy::Kind::Percent);
    ASSERT_TRUE(ip.full_well.has_value());
    EXPECT_DOUBLE_EQ(*ip.full_well, 60000.0);

    // the description is complete enough to evaluate
    const SensorPtr s = PipelineAssembler(sd).build_sensor();
    EXPECT_GT(s->compute_snr(10.0).value, 0.0);
}

TEST_F(SceneLoaderTest, ResolvingPowerSetsTheStep)
{
    json j = imager_scene();
    j["common"].erase("wl_delta");
    j["common"]["res"] = 55;
    const SceneDescription sd = SceneLoader(dir_).load(j);
    EXPECT_DOUBLE_EQ(sd.common.wl_delta_nm, 10.0);
}

TEST_F(SceneLoaderTest, LoadFileResolvesRelativePaths)
{
    std::ofstream(dir_ / "scene.json") << imager_scene().dump();
    const SceneDescription sd = SceneLoader::load_file((dir_ / "scene.json").string());
    EXPECT_NEAR(sd.sensor.imager.quantum_efficiency.at(400.0), 0.6, 1e-12);
}

TEST_F(SceneLoaderTest, LoadFileExpandsEnvironment)
{
    ::setenv("ETCALC_TEST_QE", "qe.csv", 1);
    json j = imager_scene();
    j["instrument"]["sensor"]["pixel"]["quantum_efficiency"] = "${ETCALC_TEST_QE}";
    std::ofstream(dir_ / "scene.json") << "// detector from the environment\n" << j.dump();
    const SceneDescription sd = SceneLoader::load_file((dir_ / "scene.json").string());
    EXPECT_NEAR(sd.sensor.imager.quantum_efficiency.at(700.0), 0.7, 1e-12);

    ::unsetenv("ETCALC_TEST_QE");
    EXPECT_THROW(SceneLoader::load_file((dir_ / "scene.json").string()), ConfigurationError);
}

TEST_F(SceneLoaderTest, TablesWithNonAsciiHeaders)
{
    // Latin-1 and UTF-8 micro signs in the header lines
    write("mirror.dat",
          "wavelength [\xb5m]\treflectance\n"
          "\xc2\xb5m  R\n"
          "  0.40 0.92\n"
          "\t0.70 0.96\n");
    const SpectralQty q = load_spectral_table((dir_ / "mirror.dat").string(), units::one, units::um);
    ASSERT_EQ(q.size(), 2);
    EXPECT_NEAR(q.at(550.0), 0.94, 1e-12);
}

TEST_F(SceneLoaderTest, ZemaxPsf)
{
    std::string zemax;
    for (int i = 0; i < 21; ++i) {
        if (i == 3)      zemax += "Image grid size: 4 by 4\n";
        else if (i == 5) zemax += "Data area is 8,000 by 8,000 um.\n";
        else if (i == 8) zemax += "Center point is: row 2, column 3\n";
        else             zemax += "header line\n";
    }
    zemax += "0,0\t0,1\t0,0\t0,0\n"
             "0,1\t1,0\t0,1\t0,0\n"
             "0,0\t0,1\t0,0\t0,0\n"
             "0,0\t0,0\t0,0\t0,0\n";
    write("psf.txt", zemax);

    json j = imager_scene();
    j["common"]["psf"] = {{"type", "zemax"}, {"file", "psf.txt"}, {"osf", 4}};
    const SceneDescription sd = SceneLoader(dir_).load(j);

    ASSERT_EQ(sd.common.psf.type, PsfDesc::Type::Grid);
    ASSERT_TRUE(sd.common.psf.grid.has_value());
    EXPECT_EQ(sd.common.psf.osf, 4);
    EXPECT_EQ(sd.common.psf.source, "psf.txt");
    EXPECT_NEAR(sd.common.psf.grid->grid_delta_m, 2e-6, 1e-18);
    EXPECT_EQ(sd.common.psf.grid->centre, Eigen::Vector2d(2.0, 2.0));
    EXPECT_DOUBLE_EQ(sd.common.psf.grid->values(1, 1), 1.0);
}

TEST_F(SceneLoaderTest, HeterodyneScene)
{
    const json j = json::parse(R"json({
      "common": {"wl_min": 1.0e6, "wl_max": 2.0e6, "wl_delta": 1.0e5,
                 "d_aperture": 12, "snr": 5, "exposure_time": [10, 100]},
      "astroscene": {
        "target": {"type": "FileTarget", "size": "extended",
                   "file": {"val": 1e-22, "unit": "W / (m2 nm sr)"}},
        "optical_component": {"type": "CosmicBackground"}
      },
      "instrument": {
        "sensor": {"type": "Heterodyne", "aperture_efficiency": 0.6, "main_beam_efficiency": 0.9,
                   "receiver_temp": 60, "eta_fss": 0.95, "lambda_line": 1.3e6, "kappa": 1.2,
                   "n_on": 4}
      }
    })json");
    const SceneDescription sd = SceneLoader(dir_).load(j);
    EXPECT_EQ(sd.sensor.type, SensorDesc::Type::Heterodyne);
    EXPECT_EQ(sd.target.size, TargetSize::Extended);
    EXPECT_DOUBLE_EQ(sd.components[0].temp_K, 2.725);
    ASSERT_TRUE(sd.sensor.heterodyne.n_on.has_value());
    EXPECT_FALSE(sd.sensor.heterodyne.n_eff.has_value());
    EXPECT_DOUBLE_EQ(sd.sensor.heterodyne.kappa, 1.2);
    EXPECT_EQ(sd.common.snrs.size(), 1u);

    const SensorPtr s = PipelineAssembler(sd).build_sensor();
    EXPECT_GT(s->compute_snr(10.0).value, 0.0);
}

TEST_F(SceneLoaderTest, ErrorsNameTheJsonPath)
{
    json j = imager_scene();
    j["common"].erase("wl_min");
    try {
        SceneLoader(dir_).load(j);
        FAIL() << "expected a ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("wl_min"), std::string::npos);
    }

    j = imager_scene();
    j["instrument"]["sensor"]["pixel"]["dark_current"] = "lots";
    try {
        SceneLoader(dir_).load(j);
        FAIL() << "expected a ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("instrument.sensor.pixel.dark_current"), std::string::npos);
    }
}

TEST_F(SceneLoaderTest, RejectsInvalidEntries)
{
    json j = imager_scene();
    j["common_optics"]["optical_component"][0]["type"] = "Prism";
    EXPECT_THROW(SceneLoader(dir_).load(j), ConfigurationError);

    j = imager_scene();
    j["common"]["d_aperture"] = {{"val", 1}, {"unit", "K"}};
    EXPECT_THROW(SceneLoader(dir_).load(j), ConfigurationError);

    j = imager_scene();
    j["common"].erase("exposure_time");
    EXPECT_THROW(SceneLoader(dir_).load(j), ConfigurationError);

    j = imager_scene();
    j["instrument"]["sensor"]["pixel"]["quantum_efficiency"] = "missing.csv";
    EXPECT_THROW(SceneLoader(dir_).load(j), ConfigurationError);

    j = imager_scene();
    j["instrument"]["sensor"]["photometric_aperture"]["shape"] = "hexagon";
    EXPECT_THROW(SceneLoader(dir_).load(j), ConfigurationError);

    EXPECT_THROW(SceneLoader::wavelength_grid(500, 400, 10), ConfigurationError);
}
