#pragma once
#include "Sensor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace etcalc {

// One request to a sensor
struct Scenario {
    SensorResult::Kind kind = SensorResult::Kind::SNR;
    Real exposure_time = 0.0;    // s, SNR and Sensitivity requests
    Real snr           = 0.0;    // ExposureTime and Sensitivity requests
};

struct ScenarioOutcome {
    Scenario                    scenario;
    std::optional<SensorResult> result;
    std::string                 error;     // set when result is empty

    bool ok() const noexcept { return result.has_value(); }
};

std::string describe(const Scenario& s);

/*
 * Evaluates a batch of scenarios against one sensor on a worker pool.
 * The sensor is only read; a failing scenario is reported in its
 * outcome and does not stop the others.  Outcomes keep the input order.
 */
class BatchRunner {
public:
    explicit BatchRunner(const ISensor& sensor, unsigned nthreads = 0);

    // Exposure times only: SNR per time.  SNRs only: time per SNR.
    // Both: sensitivity per (time, snr) pair, a single value is broadcast.
    static std::vector<Scenario> plan(const std::vector<Real>& exposure_times,
                                      const std::vector<Real>& snrs);

    std::vector<ScenarioOutcome> run(const std::vector<Scenario>& scenarios) const;

    // Single scenario in the calling thread
    ScenarioOutcome evaluate(const Scenario& s) const;

private:
    const ISensor& sensor_;
    unsigned       nthreads_;
};

} // namespace etcalc
