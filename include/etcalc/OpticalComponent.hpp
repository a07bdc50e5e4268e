#pragma once
#include "Radiant.hpp"

#include <optional>
#include <string>

namespace etcalc {

// Order in which the obstructor emission enters the background
enum class ObstructionBlend {
    PropagateThenBlend,   // (1-f)·τ·B_in + f·ε_ob·B(T_ob)
    BlendThenPropagate    // τ·[(1-f)·B_in + f·ε_ob·B(T_ob)]
};

struct Obstruction {
    Real             factor     = 0.0;   // A_ob / A_ap, 0..1
    Real             temp_K     = 0.0;   // obstructor temperature
    Real             emissivity = 1.0;   // obstructor emissivity
    ObstructionBlend blend      = ObstructionBlend::PropagateThenBlend;
};

/*
 * Optical component without own thermal model.  It multiplies the incoming
 * radiation by its transreflectivity, removes the obstructed fraction of the
 * signal, blends the obstructor's emission into the background and adds its
 * own (optional) noise radiance.
 */
class OpticalComponent : public IRadiant {
public:
    OpticalComponent(RadiantPtr parent,
                     SpectralQty transreflectivity,
                     std::optional<SpectralQty> noise = std::nullopt,
                     Obstruction obstruction = {});

    SpectralQty signal() const override;
    SpectralQty background() const override;

    TargetSize size() const override { return parent_->size(); }
    Real obstruction() const override { return parent_->obstruction() + obstruction_.factor; }
    std::optional<Real> magnitude() const override { return parent_->magnitude(); }
    std::string name() const override { return "OpticalComponent"; }

    const IRadiant&    parent() const noexcept { return *parent_; }
    const SpectralQty& transreflectivity() const noexcept { return transreflectivity_; }
    const Obstruction& obstruction_spec() const noexcept { return obstruction_; }

protected:
    virtual SpectralQty propagate(const SpectralQty& rad) const;
    virtual const std::optional<SpectralQty>& own_noise() const { return noise_; }

private:
    SpectralQty obstructor_emission(const Vector& wl) const;

    RadiantPtr                 parent_;
    SpectralQty                transreflectivity_;
    std::optional<SpectralQty> noise_;
    Obstruction                obstruction_;
};

/*
 * Optical component with grey-body emission.  The emitted radiance is
 * ε(λ)·B_λ(T) with ε defaulting to 1 - τ(λ).
 */
class HotOpticalComponent : public OpticalComponent {
public:
    HotOpticalComponent(RadiantPtr parent,
                        SpectralQty transreflectivity,
                        Real temp_K,
                        std::optional<SpectralQty> emissivity = std::nullopt,
                        Obstruction obstruction = {});

    std::string name() const override { return "HotOpticalComponent"; }

    Real temperature() const noexcept { return temp_; }

    // Emission of a surface at temp_K; nullopt for temp_K <= 0
    static std::optional<SpectralQty> thermal_emission(const SpectralQty& transreflectivity,
                                                       const std::optional<SpectralQty>& emissivity,
                                                       Real temp_K);

private:
    Real temp_;
};

} // namespace etcalc
