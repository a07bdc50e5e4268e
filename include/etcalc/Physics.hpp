#pragma once
#include "SpectralQty.hpp"
#include "Types.hpp"

namespace etcalc {
namespace phys {

inline constexpr Real h       = 6.62607015e-34;     // J s
inline constexpr Real c       = 299792458.0;        // m / s
inline constexpr Real k_B     = 1.380649e-23;       // J / K
inline constexpr Real pi      = 3.14159265358979323846;
inline constexpr Real arcsec  = pi / (180.0 * 3600.0);  // rad

// Planck spectral radiance B_λ(T) in W / (m² nm sr), λ in nm.
// Zero for T <= 0.
Real planck_radiance(Real wl_nm, Real temp_K);

// Black body of temperature T sampled on `wl` (nm), scaled by `emissivity`
SpectralQty black_body(const Vector& wl, Real temp_K, Real emissivity = 1.0);

// Grey body: emissivity(λ) · B_λ(T) on the emissivity's own grid
SpectralQty grey_body(const SpectralQty& emissivity, Real temp_K);

// Photon energy h c / λ in J, λ in nm
Real photon_energy(Real wl_nm);

// Convert a per-wavelength density (…/nm) to a per-frequency density (…/Hz)
SpectralQty per_nm_to_per_hz(const SpectralQty& q);

// Frequency in Hz of a wavelength in nm
Real frequency(Real wl_nm);

} // namespace phys
} // namespace etcalc
