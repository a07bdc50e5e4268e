#include "etcalc/OpticalComponent.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/Log.hpp"
#include "etcalc/Physics.hpp"

#include <sstream>

namespace etcalc {

/* ================================================================ *
 *  OpticalComponent
 * ================================================================ */
OpticalComponent::OpticalComponent(RadiantPtr parent,
                                   SpectralQty transreflectivity,
                                   std::optional<SpectralQty> noise,
                                   Obstruction obstruction)
    : parent_(std::move(parent)),
      transreflectivity_(std::move(transreflectivity)),
      noise_(std::move(noise)),
      obstruction_(obstruction)
{
    if (!parent_)
        throw ConfigurationError("Optical component without parent element");
    if (!transreflectivity_.unit().dimensionless())
        throw UnitMismatchError("Transreflectivity must be dimensionless, got '" +
                                transreflectivity_.unit().to_string() + "'");
    if (obstruction_.factor < 0.0 || obstruction_.factor > 1.0)
        throw ConfigurationError("Obstruction factor must be within [0, 1]");
    if (obstruction_.emissivity < 0.0 || obstruction_.emissivity > 1.0)
        throw ConfigurationError("Obstructor emissivity must be within [0, 1]");
    if (noise_ && !noise_->unit().equivalent(units::radiance))
        throw UnitMismatchError("Component noise must be a spectral radiance, got '" +
                                noise_->unit().to_string() + "'");
}

SpectralQty OpticalComponent::propagate(const SpectralQty& rad) const
{
    return rad * transreflectivity_;
}

SpectralQty OpticalComponent::obstructor_emission(const Vector& wl) const
{
    return phys::black_body(wl, obstruction_.temp_K, obstruction_.emissivity);
}

SpectralQty OpticalComponent::signal() const
{
    const SpectralQty in = parent_->signal();
    log::debug(name(), "calculating signal");
    return propagate(in) * (1.0 - obstruction_.factor);
}

SpectralQty OpticalComponent::background() const
{
    const SpectralQty in = parent_->background();
    log::debug(name(), "calculating background");

    const Real f = obstruction_.factor;
    SpectralQty bg = [&] {
        if (f <= 0.0)
            return propagate(in);
        if (obstruction_.blend == ObstructionBlend::PropagateThenBlend) {
            const SpectralQty p = propagate(in);
            return p * (1.0 - f) + obstructor_emission(p.wl()) * f;
        }
        return propagate(in * (1.0 - f) + obstructor_emission(in.wl()) * f);
    }();

    if (const auto& noise = own_noise())
        bg = bg + *noise;
    return bg;
}

/* ================================================================ *
 *  HotOpticalComponent
 * ================================================================ */
HotOpticalComponent::HotOpticalComponent(RadiantPtr parent,
                                         SpectralQty transreflectivity,
                                         Real temp_K,
                                         std::optional<SpectralQty> emissivity,
                                         Obstruction obstruction)
    : OpticalComponent(std::move(parent),
                       transreflectivity,
                       thermal_emission(transreflectivity, emissivity, temp_K),
                       obstruction),
      temp_(temp_K)
{
}

std::optional<SpectralQty>
HotOpticalComponent::thermal_emission(const SpectralQty& transreflectivity,
                                      const std::optional<SpectralQty>& emissivity,
                                      Real temp_K)
{
    if (temp_K < 0.0)
        throw ConfigurationError("Negative component temperature");
    if (temp_K == 0.0) return std::nullopt;

    const SpectralQty em = emissivity ? *emissivity : 1.0 - transreflectivity;
    if (em.values().minCoeff() < 0.0 || em.values().maxCoeff() > 1.0) {
        std::ostringstream os;
        os << "Emissivity outside [0, 1]: " << em;
        throw ConfigurationError(os.str());
    }
    return phys::grey_body(em, temp_K);
}

} // namespace etcalc
