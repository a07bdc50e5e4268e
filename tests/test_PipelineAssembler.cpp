#include "etcalc/Errors.hpp"
#include "etcalc/Heterodyne.hpp"
#include "etcalc/Imager.hpp"
#include "etcalc/PipelineAssembler.hpp"

#include <gtest/gtest.h>

using namespace etcalc;

namespace {

const Vector kWl = Vector::LinSpaced(31, 400.0, 700.0);

SceneDescription imaging_scene()
{
    SceneDescription sd;
    sd.common.wl_bins      = kWl;
    sd.common.wl_delta_nm  = 10.0;
    sd.common.d_aperture_m = 0.5;
    sd.common.exposure_times = {10.0};

    sd.target.type   = TargetDesc::Type::BlackBody;
    sd.target.temp_K = 6000.0;
    sd.target.mag    = 12.0;

    ComponentDesc m1;
    m1.type = ComponentDesc::Type::Mirror;
    m1.transreflectivity = SpectralQty::constant(kWl, 0.95);
    m1.obstruction.factor = 0.1;
    ComponentDesc f;
    f.type = ComponentDesc::Type::Filter;
    f.band = "V";
    sd.components = {m1, m1, f};

    sd.sensor.type = SensorDesc::Type::Imager;
    ImagerParams& ip = sd.sensor.imager;
    ip.quantum_efficiency = SpectralQty::constant(kWl, 0.9);
    ip.rows = ip.cols = 16;
    ip.pixel_size_m = 6e-6;
    ip.f_number = 8.0;
    ip.read_noise = 3.0;
    ip.dark_current = 1.0;
    return sd;
}

} // namespace

TEST(PipelineAssembler, ChainFollowsComponentOrder)
{
    const PipelineAssembler pa(imaging_scene());
    const RadiantPtr chain = pa.build_chain();
    EXPECT_EQ(chain->name(), "Filter");
    EXPECT_NEAR(chain->obstruction(), 0.2, 1e-15);
    ASSERT_TRUE(chain->magnitude().has_value());
    EXPECT_DOUBLE_EQ(*chain->magnitude(), 12.0);
    EXPECT_EQ(chain->size(), TargetSize::Point);

    // outside the V band nothing is left
    EXPECT_NEAR(chain->signal().at(420.0), 0.0, 1e-30);
    EXPECT_GT(chain->signal().at(550.0), 0.0);
}

TEST(PipelineAssembler, EveryCallBuildsAnIndependentChain)
{
    const PipelineAssembler pa(imaging_scene());
    const RadiantPtr a = pa.build_chain();
    const RadiantPtr b = pa.build_chain();
    EXPECT_NE(a.get(), b.get());
    EXPECT_TRUE(a->signal().approx_equal(b->signal(), 1e-15));
}

TEST(PipelineAssembler, ImagerWithAiryPsf)
{
    const PipelineAssembler pa(imaging_scene());
    const SensorPtr s = pa.build_sensor();
    EXPECT_EQ(s->name(), "Imager");
    EXPECT_GT(s->compute_snr(10.0).value, 0.0);

    const PsfPtr psf = pa.build_psf(pa.scene().sensor.imager, 0.2);
    EXPECT_EQ(psf->name(), "AiryPSF");
    EXPECT_EQ(psf->osf(), 10);
}

TEST(PipelineAssembler, GriddedPsfNeedsData)
{
    SceneDescription sd = imaging_scene();
    sd.common.psf.type = PsfDesc::Type::Grid;
    const PipelineAssembler pa(sd);
    EXPECT_THROW(pa.build_sensor(), ConfigurationError);

    PsfGrid g;
    g.values = Matrix::Zero(9, 9);
    g.values(4, 4) = 1.0;
    g.grid_delta_m = 1e-6;
    g.centre = Eigen::Vector2d(4.0, 4.0);
    sd.common.psf.grid   = g;
    sd.common.psf.source = "spot.fits";
    const PipelineAssembler with_grid(sd);
    EXPECT_EQ(with_grid.build_psf(sd.sensor.imager, 0.0)->name(), "spot.fits");
}

TEST(PipelineAssembler, HeterodyneSensor)
{
    SceneDescription sd;
    sd.common.wl_bins      = Vector::LinSpaced(11, 1.0e6, 2.0e6);
    sd.common.wl_delta_nm  = 5.0;
    sd.common.d_aperture_m = 10.0;
    sd.target.type = TargetDesc::Type::File;
    sd.target.size = TargetSize::Extended;
    sd.target.sfd  = SpectralQty::constant(sd.common.wl_bins, 1e-22, units::radiance);
    ComponentDesc cmb;
    cmb.type   = ComponentDesc::Type::CosmicBackground;
    cmb.temp_K = 2.725;
    sd.components = {cmb};
    sd.sensor.type = SensorDesc::Type::Heterodyne;
    sd.sensor.heterodyne.receiver_temp_K = 50.0;
    sd.sensor.heterodyne.lambda_line_nm  = 1.3e6;

    const SensorPtr s = PipelineAssembler(sd).build_sensor();
    EXPECT_EQ(s->name(), "Heterodyne");
    const auto* h = dynamic_cast<const Heterodyne*>(s.get());
    ASSERT_NE(h, nullptr);
    EXPECT_GT(h->t_background().at(1.3e6), 0.0);
}

TEST(PipelineAssembler, MissingCurvesAreReported)
{
    SceneDescription sd = imaging_scene();
    ComponentDesc lens;
    lens.type = ComponentDesc::Type::Lens;
    sd.components.push_back(lens);
    EXPECT_THROW(PipelineAssembler(sd).build_chain(), ConfigurationError);

    sd = imaging_scene();
    sd.target.type = TargetDesc::Type::File;
    EXPECT_THROW(PipelineAssembler(sd).build_chain(), ConfigurationError);

    sd = imaging_scene();
    sd.common.d_aperture_m = 0.0;
    EXPECT_THROW(PipelineAssembler{sd}, ConfigurationError);
}
