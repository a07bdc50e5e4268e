#include "etcalc/Physics.hpp"
#include "etcalc/Errors.hpp"

#include <cmath>

namespace etcalc {
namespace phys {

Real planck_radiance(Real wl_nm, Real temp_K)
{
    if (temp_K <= 0.0) return 0.0;
    const Real wl = wl_nm * 1e-9;
    const Real x  = h * c / (wl * k_B * temp_K);
    // W / (m² m sr)  →  W / (m² nm sr)
    return 2.0 * h * c * c / std::pow(wl, 5) / std::expm1(x) * 1e-9;
}

SpectralQty black_body(const Vector& wl, Real temp_K, Real emissivity)
{
    return SpectralQty::from_function(
        wl, [&](Real l) { return emissivity * planck_radiance(l, temp_K); },
        units::radiance);
}

SpectralQty grey_body(const SpectralQty& emissivity, Real temp_K)
{
    if (!emissivity.unit().dimensionless())
        throw UnitMismatchError("Emissivity must be dimensionless, got '" +
                                emissivity.unit().to_string() + "'");
    const Real f  = emissivity.unit().factor_to(units::one);
    const Real fw = emissivity.wl_unit().factor_to(units::nm);
    return emissivity.transform(
        [&](Real l, Real e) { return e * f * planck_radiance(l * fw, temp_K); },
        units::radiance);
}

Real photon_energy(Real wl_nm)
{
    return h * c / (wl_nm * 1e-9);
}

Real frequency(Real wl_nm)
{
    return c / (wl_nm * 1e-9);
}

SpectralQty per_nm_to_per_hz(const SpectralQty& q)
{
    // F_ν = F_λ · λ² / c  with F_λ per metre and λ in metres
    Unit si = q.unit();
    si.scale = 1.0;
    const Real fv = q.unit().factor_to(si);
    const Real fw = q.wl_unit().factor_to(units::m);
    return q.transform(
        [&](Real l, Real v) {
            const Real wl_m = l * fw;
            return v * fv * wl_m * wl_m / c;
        },
        si * units::m / units::Hz);
}

} // namespace phys
} // namespace etcalc
