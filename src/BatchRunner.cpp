#include "etcalc/BatchRunner.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/Log.hpp"
#include "etcalc/ThreadPool.hpp"

#include <algorithm>
#include <cstdio>
#include <future>

namespace etcalc {

std::string describe(const Scenario& s)
{
    char buf[96];
    switch (s.kind) {
    case SensorResult::Kind::SNR:
        std::snprintf(buf, sizeof buf, "snr(t = %g s)", s.exposure_time);
        break;
    case SensorResult::Kind::ExposureTime:
        std::snprintf(buf, sizeof buf, "exposure_time(snr = %g)", s.snr);
        break;
    case SensorResult::Kind::Sensitivity:
        std::snprintf(buf, sizeof buf, "sensitivity(t = %g s, snr = %g)", s.exposure_time, s.snr);
        break;
    }
    return buf;
}

BatchRunner::BatchRunner(const ISensor& sensor, unsigned nthreads)
    : sensor_(sensor), nthreads_(nthreads) {}

std::vector<Scenario> BatchRunner::plan(const std::vector<Real>& exposure_times,
                                        const std::vector<Real>& snrs)
{
    std::vector<Scenario> out;
    if (exposure_times.empty() && snrs.empty())
        throw ConfigurationError("Neither exposure times nor SNRs requested");

    if (snrs.empty()) {
        for (Real t : exposure_times) out.push_back({SensorResult::Kind::SNR, t, 0.0});
    } else if (exposure_times.empty()) {
        for (Real s : snrs) out.push_back({SensorResult::Kind::ExposureTime, 0.0, s});
    } else {
        const std::size_t nt = exposure_times.size(), ns = snrs.size();
        if (nt != ns && nt != 1 && ns != 1)
            throw ConfigurationError("Sensitivity needs as many exposure times as SNRs (got " +
                                     std::to_string(nt) + " and " + std::to_string(ns) + ")");
        const std::size_t n = std::max(nt, ns);
        for (std::size_t i = 0; i < n; ++i)
            out.push_back({SensorResult::Kind::Sensitivity,
                           exposure_times[nt == 1 ? 0 : i],
                           snrs[ns == 1 ? 0 : i]});
    }
    return out;
}

ScenarioOutcome BatchRunner::evaluate(const Scenario& s) const
{
    ScenarioOutcome o;
    o.scenario = s;
    try {
        switch (s.kind) {
        case SensorResult::Kind::SNR:
            o.result = sensor_.compute_snr(s.exposure_time);
            break;
        case SensorResult::Kind::ExposureTime:
            o.result = sensor_.compute_exposure_time(s.snr);
            break;
        case SensorResult::Kind::Sensitivity:
            o.result = sensor_.compute_sensitivity(s.exposure_time, s.snr);
            break;
        }
    } catch (const EtcError& e) {
        o.error = e.what();
        log::error(sensor_.name(), describe(s) + " failed: " + o.error);
    } catch (const std::exception& e) {
        o.error = std::string("internal error: ") + e.what();
        log::error(sensor_.name(), describe(s) + " failed: " + o.error);
    }
    return o;
}

std::vector<ScenarioOutcome> BatchRunner::run(const std::vector<Scenario>& scenarios) const
{
    std::vector<ScenarioOutcome> out;
    out.reserve(scenarios.size());
    if (scenarios.size() <= 1 || nthreads_ == 1) {
        for (const auto& s : scenarios) out.push_back(evaluate(s));
        return out;
    }

    const unsigned n = std::min<unsigned>(nthreads_ ? nthreads_ : std::thread::hardware_concurrency(),
                                          static_cast<unsigned>(scenarios.size()));
    ThreadPool pool(n);
    log::debug("BatchRunner", std::to_string(scenarios.size()) + " scenarios on " +
                              std::to_string(pool.size()) + " threads");

    std::vector<std::future<ScenarioOutcome>> futs;
    futs.reserve(scenarios.size());
    for (const auto& s : scenarios)
        futs.push_back(pool.enqueue([this, s] { return evaluate(s); }));
    for (auto& f : futs) out.push_back(f.get());
    return out;
}

} // namespace etcalc
