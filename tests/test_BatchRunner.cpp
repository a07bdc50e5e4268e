#include "etcalc/BatchRunner.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/ReportUtils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace etcalc;

namespace {

// SNR = sqrt(t); saturates above 1000 s
class SqrtSensor : public ISensor {
public:
    SensorResult compute_snr(Real t) const override
    {
        ++calls;
        if (t > 1000.0) throw SaturationError("well capacity exceeded");
        SensorResult r;
        r.kind = SensorResult::Kind::SNR;
        r.value = std::sqrt(t);
        r.exposure_time = t;
        r.snr = r.value;
        return r;
    }
    SensorResult compute_exposure_time(Real snr) const override
    {
        ++calls;
        SensorResult r;
        r.kind = SensorResult::Kind::ExposureTime;
        r.value = snr * snr;
        r.unit = units::s;
        r.exposure_time = r.value;
        r.snr = snr;
        return r;
    }
    SensorResult compute_sensitivity(Real t, Real snr) const override
    {
        ++calls;
        if (snr > 100.0) throw std::runtime_error("diverged");
        SensorResult r;
        r.kind = SensorResult::Kind::Sensitivity;
        r.value = 2.5 * std::log10(t / snr);
        r.exposure_time = t;
        r.snr = snr;
        return r;
    }
    std::string name() const override { return "SqrtSensor"; }

    mutable std::atomic<int> calls{0};
};

} // namespace

TEST(BatchRunner, PlanPicksTheRequest)
{
    auto p = BatchRunner::plan({1.0, 4.0}, {});
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[0].kind, SensorResult::Kind::SNR);
    EXPECT_DOUBLE_EQ(p[1].exposure_time, 4.0);

    p = BatchRunner::plan({}, {5.0});
    ASSERT_EQ(p.size(), 1u);
    EXPECT_EQ(p[0].kind, SensorResult::Kind::ExposureTime);
    EXPECT_DOUBLE_EQ(p[0].snr, 5.0);

    p = BatchRunner::plan({100.0}, {3.0, 5.0, 10.0});
    ASSERT_EQ(p.size(), 3u);
    for (const auto& s : p) {
        EXPECT_EQ(s.kind, SensorResult::Kind::Sensitivity);
        EXPECT_DOUBLE_EQ(s.exposure_time, 100.0);
    }
    EXPECT_DOUBLE_EQ(p[2].snr, 10.0);

    p = BatchRunner::plan({10.0, 20.0}, {3.0, 5.0});
    ASSERT_EQ(p.size(), 2u);
    EXPECT_DOUBLE_EQ(p[1].exposure_time, 20.0);
    EXPECT_DOUBLE_EQ(p[1].snr, 5.0);

    EXPECT_THROW(BatchRunner::plan({}, {}), ConfigurationError);
    EXPECT_THROW(BatchRunner::plan({1.0, 2.0}, {3.0, 4.0, 5.0}), ConfigurationError);
}

TEST(BatchRunner, KeepsInputOrderOnManyThreads)
{
    SqrtSensor sensor;
    std::vector<Scenario> sc;
    for (int i = 1; i <= 64; ++i)
        sc.push_back({SensorResult::Kind::SNR, static_cast<Real>(i * i), 0.0});

    const auto out = BatchRunner(sensor, 4).run(sc);
    ASSERT_EQ(out.size(), sc.size());
    for (std::size_t i = 0; i < out.size(); ++i) {
        ASSERT_TRUE(out[i].ok());
        EXPECT_DOUBLE_EQ(out[i].result->value, static_cast<Real>(i + 1));
    }
    EXPECT_EQ(sensor.calls.load(), 64);
}

TEST(BatchRunner, SerialAndParallelAgree)
{
    SqrtSensor sensor;
    const auto sc = BatchRunner::plan({}, {1.0, 2.0, 3.0, 7.0});
    const auto a = BatchRunner(sensor, 1).run(sc);
    const auto b = BatchRunner(sensor, 3).run(sc);
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i)
        EXPECT_DOUBLE_EQ(a[i].result->value, b[i].result->value);
    EXPECT_DOUBLE_EQ(a[3].result->value, 49.0);
}

TEST(BatchRunner, FailuresStayInTheirOutcome)
{
    SqrtSensor sensor;
    const std::vector<Scenario> sc = {
        {SensorResult::Kind::SNR, 100.0, 0.0},
        {SensorResult::Kind::SNR, 5000.0, 0.0},
        {SensorResult::Kind::Sensitivity, 100.0, 500.0},
        {SensorResult::Kind::ExposureTime, 0.0, 10.0},
    };
    const auto out = BatchRunner(sensor, 2).run(sc);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_TRUE(out[0].ok());
    EXPECT_FALSE(out[1].ok());
    EXPECT_NE(out[1].error.find("well capacity"), std::string::npos);
    EXPECT_FALSE(out[2].ok());
    EXPECT_NE(out[2].error.find("internal error"), std::string::npos);
    EXPECT_TRUE(out[3].ok());
    EXPECT_DOUBLE_EQ(out[3].result->value, 100.0);
}

TEST(BatchRunner, SummaryLines)
{
    SqrtSensor sensor;
    const BatchRunner br(sensor, 1);

    EXPECT_EQ(summary_line(br.evaluate({SensorResult::Kind::SNR, 100.0, 0.0})),
              "snr(t = 100 s): SNR = 10");
    EXPECT_EQ(summary_line(br.evaluate({SensorResult::Kind::ExposureTime, 0.0, 10.0})),
              "exposure_time(snr = 10): t = 100 s");
    EXPECT_EQ(summary_line(br.evaluate({SensorResult::Kind::Sensitivity, 1000.0, 10.0})),
              "sensitivity(t = 1000 s, snr = 10): limiting magnitude = 5.000 mag");
    EXPECT_EQ(summary_line(br.evaluate({SensorResult::Kind::SNR, 2000.0, 0.0})),
              "snr(t = 2000 s): FAILED (well capacity exceeded)");
}

TEST(BatchRunner, ReportListsEveryOutcome)
{
    SqrtSensor sensor;
    const auto out = BatchRunner(sensor, 2).run(BatchRunner::plan({25.0, 4000.0}, {}));

    SceneDescription sd;
    sd.common.wl_bins = Vector::LinSpaced(4, 400.0, 700.0);
    sd.common.wl_delta_nm = 100.0;
    sd.common.d_aperture_m = 1.0;
    ComponentDesc mirror;
    mirror.type = ComponentDesc::Type::Mirror;
    sd.components.push_back(mirror);

    const nlohmann::json rep = make_report(sd, sensor.name(), out);
    EXPECT_EQ(rep["scene"]["sensor"], "SqrtSensor");
    EXPECT_EQ(rep["scene"]["psf"], "airy");
    EXPECT_DOUBLE_EQ(rep["scene"]["wl_max"].get<double>(), 700.0);
    EXPECT_EQ(rep["scene"]["optical_components"][0], "Mirror");
    ASSERT_EQ(rep["results"].size(), 2u);
    EXPECT_EQ(rep["results"][0]["status"], "ok");
    EXPECT_DOUBLE_EQ(rep["results"][0]["value"].get<double>(), 5.0);
    EXPECT_EQ(rep["results"][1]["status"], "failed");
    EXPECT_EQ(rep["failed"], 1);

    const auto path = std::filesystem::temp_directory_path() / "etcalc_report" / "out.json";
    write_report(path.string(), rep);
    std::ifstream in(path);
    EXPECT_EQ(nlohmann::json::parse(in), rep);
    std::filesystem::remove_all(path.parent_path());
}
