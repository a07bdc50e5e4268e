// SpectrumLoaders.hpp
#pragma once
#include "etcalc/GriddedPSF.hpp"
#include "etcalc/SpectralQty.hpp"
#include <string>

namespace etcalc {

// ---------------------------------------------------------------------------
// spectral tables
// ---------------------------------------------------------------------------

// Two-column table (wavelength, value) separated by whitespace, ',' or ';'.
// Lines starting with '#' and non-numeric header lines are skipped; rows
// are sorted by wavelength.
SpectralQty load_spectral_table(const std::string& path,
                                Unit value_unit = units::one,
                                Unit wl_unit    = units::nm,
                                Extrapolation extrapolation = Extrapolation::None);

// ---------------------------------------------------------------------------
// PSF grids
// ---------------------------------------------------------------------------

// Primary image of a FITS file.  Grid spacing from XPIXSZ / YPIXSZ (µm) or
// PSFSCALE (arcsec, needs f_number and aperture), else the pixel size;
// centre from XPSFCTR / YPSFCTR, else the middle of the image.
PsfGrid load_psf_fits(const std::string& path,
                      Real pixel_size_m, Real f_number, Real d_aperture_m);

// Text export of a Zemax FFT / Huygens PSF analysis (UTF-16 or 8 bit)
PsfGrid load_psf_zemax(const std::string& path);

} // namespace etcalc
