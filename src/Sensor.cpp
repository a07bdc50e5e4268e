#include "etcalc/Sensor.hpp"

namespace etcalc {

std::string to_string(SensorResult::Kind k)
{
    switch (k) {
    case SensorResult::Kind::SNR:          return "snr";
    case SensorResult::Kind::ExposureTime: return "exposure_time";
    case SensorResult::Kind::Sensitivity:  return "sensitivity";
    }
    return "unknown";
}

} // namespace etcalc
