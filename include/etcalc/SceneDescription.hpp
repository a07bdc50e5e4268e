#pragma once
#include "GriddedPSF.hpp"
#include "Heterodyne.hpp"
#include "Imager.hpp"
#include "OpticalComponent.hpp"
#include "Radiant.hpp"
#include "SpectralQty.hpp"

#include <optional>
#include <string>
#include <vector>

namespace etcalc {

/*
 * Validated, strongly typed scene.  Spectra and PSF grids are already
 * loaded, every value is in the canonical units (nm, m, K, s).
 */

struct TargetDesc {
    enum class Type { BlackBody, File };
    Type type = Type::BlackBody;

    // BlackBody
    Real        temp_K = 5778.0;
    Real        mag    = 0.0;
    std::string band   = "V";

    // File
    std::optional<SpectralQty> sfd;
    TargetSize                 size = TargetSize::Point;
    std::optional<Real>        file_mag;
};

struct ComponentDesc {
    enum class Type { Mirror, Lens, BeamSplitter, Filter, Atmosphere, StrayLight, CosmicBackground };
    Type type = Type::Mirror;

    std::optional<SpectralQty> transreflectivity;   // reflectance or transmittance
    std::optional<SpectralQty> emissivity;
    std::optional<SpectralQty> emission;            // Atmosphere, StrayLight
    Real temp_K = 0.0;

    // Filter pass band: a named band or an explicit range (nm)
    std::string         band;
    std::optional<Real> start_nm, end_nm;

    Obstruction obstruction;
};

struct PsfDesc {
    enum class Type { Airy, Grid };
    Type                   type = Type::Airy;
    int                    osf  = 10;
    std::optional<PsfGrid> grid;
    std::string            source;      // file the grid was read from
};

struct SensorDesc {
    enum class Type { Imager, Heterodyne };
    Type             type = Type::Imager;
    ImagerParams     imager;
    HeterodyneParams heterodyne;
};

struct CommonDesc {
    Vector              wl_bins;        // nm
    Real                wl_delta_nm  = 0.0;
    Real                d_aperture_m = 0.0;
    std::optional<Real> jitter_sigma_arcsec;
    PsfDesc             psf;
    std::vector<Real>   exposure_times; // s
    std::vector<Real>   snrs;
};

struct SceneDescription {
    CommonDesc                 common;
    TargetDesc                 target;
    std::vector<ComponentDesc> components;   // target outwards
    SensorDesc                 sensor;
};

// Names used in scene files and messages
std::string to_string(ComponentDesc::Type t);

} // namespace etcalc
