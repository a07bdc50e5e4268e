#pragma once
#include "BatchRunner.hpp"
#include "SceneDescription.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace etcalc {

/* --------------------------------------------------------------------- */
/*                     J S O N   r e s u l t   d o c u m e n t           */
/* --------------------------------------------------------------------- */
nlohmann::json to_json(const SpectralQty& q);
nlohmann::json to_json(const PixelBreakdown& p);
nlohmann::json to_json(const ScenarioOutcome& o);

// Scene summary plus one entry per scenario
nlohmann::json make_report(const SceneDescription&            scene,
                           const std::string&                 sensor_name,
                           const std::vector<ScenarioOutcome>& outcomes);

// Pretty printed; ConfigurationError if the file cannot be written
void write_report(const std::string& path, const nlohmann::json& report);

/* --------------------------------------------------------------------- */
/*                       C o n s o l e   s u m m a r y                   */
/* --------------------------------------------------------------------- */
// "exposure_time(snr = 10): t = 123.4 s" or the error message
std::string summary_line(const ScenarioOutcome& o);

} // namespace etcalc
