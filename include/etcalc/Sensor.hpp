#pragma once
#include "Radiant.hpp"
#include "SpectralQty.hpp"
#include "Types.hpp"
#include "Units.hpp"

#include <optional>
#include <string>

namespace etcalc {

// Per pixel electron counts within the bounding box of the photometric aperture
struct PixelBreakdown {
    Matrix signal;        // e-
    Matrix background;    // e-
    Matrix dark;          // e-
    Matrix read_noise;    // e- rms
    Eigen::Index row0 = 0, col0 = 0;           // origin of the box in the full frame
    Eigen::Index frame_rows = 0, frame_cols = 0;
    Real         aperture_radius_px = 0.0;
    Eigen::Index aperture_pixels    = 0;
};

// Spectra of a heterodyne evaluation
struct TemperatureSpectra {
    SpectralQty t_signal;
    SpectralQty t_background;
    SpectralQty t_rms;
};

struct SensorResult {
    enum class Kind { SNR, ExposureTime, Sensitivity };

    Kind kind  = Kind::SNR;
    Real value = 0.0;            // the requested quantity
    Unit unit  = units::one;     // s for exposure times, dimensionless for SNR and magnitudes
    Real exposure_time = 0.0;    // s, given or computed
    Real snr           = 0.0;    // given or computed

    std::optional<PixelBreakdown>     pixels;
    std::optional<TemperatureSpectra> spectra;
};

std::string to_string(SensorResult::Kind k);

/*
 * Detector at the end of the radiant chain.  Sensors own the chain and
 * evaluate it; all three requests are independent and const.
 */
class ISensor {
public:
    virtual ~ISensor() = default;

    virtual SensorResult compute_snr(Real exposure_time) const = 0;
    virtual SensorResult compute_exposure_time(Real snr) const = 0;
    // Limiting magnitude of a flux calibrated target
    virtual SensorResult compute_sensitivity(Real exposure_time, Real snr) const = 0;

    virtual std::string name() const = 0;
};

using SensorPtr = std::unique_ptr<ISensor>;

} // namespace etcalc
