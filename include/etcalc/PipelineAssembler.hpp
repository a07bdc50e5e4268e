#pragma once
#include "PSF.hpp"
#include "SceneDescription.hpp"
#include "Sensor.hpp"

namespace etcalc {

/*
 * Builds the radiant chain (target innermost) and the detector from a
 * scene description.  Every call produces a fresh, independent pipeline.
 */
class PipelineAssembler {
public:
    explicit PipelineAssembler(SceneDescription scene);

    RadiantPtr build_chain() const;
    // Detector on top of a freshly built chain
    SensorPtr  build_sensor() const;

    static RadiantPtr build_target(const TargetDesc& t, const Vector& wl_bins);
    static RadiantPtr build_component(RadiantPtr parent, const ComponentDesc& c,
                                      const Vector& wl_bins);

    // PSF for an imager behind a chain with the given obstruction
    PsfPtr build_psf(const ImagerParams& p, Real obstruction) const;

    const SceneDescription& scene() const noexcept { return scene_; }

private:
    SceneDescription scene_;
};

} // namespace etcalc
