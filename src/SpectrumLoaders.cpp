#include "etcalc/SpectrumLoaders.hpp"
#include "etcalc/Errors.hpp"
#include "etcalc/Log.hpp"
#include "etcalc/Physics.hpp"
#include <CCfits/CCfits>
#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>
#include <memory>
#include <numeric>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <valarray>
#include <vector>

namespace etcalc {
namespace {

bool is_space(unsigned char c) { return std::isspace(c) != 0; }

// ----------------------------------------------------------------------------
//  Read an ASCII table of two numeric columns, skip comments and headers
// ----------------------------------------------------------------------------
std::vector<std::array<double, 2>>
read_ascii_table(const std::string& path, char comment_char = '#')
{
    std::ifstream in(path);
    if (!in)
        throw ConfigurationError("Cannot open '" + path + "'");

    std::vector<std::array<double, 2>> rows;
    std::string line;
    while (std::getline(in, line))
    {
        // trim leading whitespace
        auto it = std::find_if_not(line.begin(), line.end(), is_space);
        if (it == line.end()) continue;           // blank line
        if (*it == comment_char) continue;        // comment

        std::replace(line.begin(), line.end(), ',', ' ');
        std::replace(line.begin(), line.end(), ';', ' ');
        std::istringstream ss(line);
        std::array<double, 2> row{};
        if (!(ss >> row[0] >> row[1])) continue;  // header
        rows.push_back(row);
    }
    if (rows.empty())
        throw ConfigurationError("File '" + path + "' contains no valid data");
    return rows;
}

// ----------------------------------------------------------------------------
//  Sort rows by λ ascending and move into Eigen vectors
// ----------------------------------------------------------------------------
void to_eigen(const std::vector<std::array<double, 2>>& rows, Vector& l_out, Vector& v_out)
{
    const std::size_t n = rows.size();
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    std::sort(idx.begin(), idx.end(),
              [&](std::size_t i, std::size_t j) { return rows[i][0] < rows[j][0]; });

    l_out.resize(n);
    v_out.resize(n);
    for (std::size_t k = 0; k < n; ++k) {
        l_out[k] = rows[idx[k]][0];
        v_out[k] = rows[idx[k]][1];
    }
}

// UTF-16 (with BOM) to 8 bit; non-ASCII code units become their low byte
std::string decode_text(const std::string& raw)
{
    if (raw.size() < 2) return raw;
    const auto b0 = static_cast<unsigned char>(raw[0]);
    const auto b1 = static_cast<unsigned char>(raw[1]);
    const bool le = b0 == 0xFF && b1 == 0xFE;
    const bool be = b0 == 0xFE && b1 == 0xFF;
    if (!le && !be) return raw;

    std::string out;
    out.reserve(raw.size() / 2);
    for (std::size_t i = 2; i + 1 < raw.size(); i += 2)
        out.push_back(le ? raw[i] : raw[i + 1]);
    return out;
}

// Decimal comma to decimal point
double parse_number(std::string s)
{
    std::replace(s.begin(), s.end(), ',', '.');
    try {
        return std::stod(s);
    } catch (const std::logic_error&) {
        throw ConfigurationError("Not a number: '" + s + "'");
    }
}

Real length_scale(const std::string& unit)
{
    if (unit == "mm") return 1e-3;
    if (unit == "m")  return 1.0;
    // µm in any encoding
    if (unit.size() >= 2 && unit.back() == 'm') return 1e-6;
    throw ConfigurationError("Unknown length unit '" + unit + "' in PSF file");
}

} // unnamed namespace

// ============================================================================
//  Public loader implementations
// ============================================================================

SpectralQty load_spectral_table(const std::string& path, Unit value_unit, Unit wl_unit,
                                Extrapolation extrapolation)
{
    const auto rows = read_ascii_table(path);
    Vector lambda, values;
    to_eigen(rows, lambda, values);

    for (Eigen::Index i = 1; i < lambda.size(); ++i)
        if (lambda[i] == lambda[i - 1])
            throw ConfigurationError("Duplicate wavelength " + std::to_string(lambda[i]) +
                                     " in '" + path + "'");

    // wavelengths are kept in nm internally
    const Real fw = wl_unit.factor_to(units::nm);
    log::debug("Loader", "read " + std::to_string(lambda.size()) + " samples from '" + path + "'");
    return SpectralQty(lambda * fw, values, value_unit, extrapolation);
}

// ----------------------------------------------------------------------------
PsfGrid load_psf_fits(const std::string& path, Real pixel_size_m, Real f_number, Real d_aperture_m)
{
    std::unique_ptr<CCfits::FITS> f;
    try {
        f = std::make_unique<CCfits::FITS>(path, CCfits::Read, true);
    } catch (const CCfits::FitsException& e) {
        throw ConfigurationError("Cannot read PSF FITS file '" + path + "': " + e.message());
    }
    CCfits::PHDU& img = f->pHDU();
    if (img.axes() != 2)
        throw ConfigurationError("PSF FITS file '" + path + "' must contain a 2D primary image");

    std::valarray<double> data;
    img.read(data);
    const Eigen::Index nx = img.axis(0);      // columns
    const Eigen::Index ny = img.axis(1);      // rows

    PsfGrid grid;
    grid.values.resize(ny, nx);
    for (Eigen::Index y = 0; y < ny; ++y)
        for (Eigen::Index x = 0; x < nx; ++x)
            grid.values(y, x) = data[static_cast<std::size_t>(x + y * nx)];

    auto key = [&img](const std::string& name, double& out) {
        try {
            img.readKey(name, out);
            return true;
        } catch (const CCfits::HDU::NoSuchKeyword&) {
            return false;
        }
    };

    double xpix = 0.0, psfscale = 0.0, xc = 0.0, yc = 0.0;
    if (key("XPIXSZ", xpix)) {
        double ypix = xpix;
        key("YPIXSZ", ypix);
        if (std::abs(ypix - xpix) > 1e-9 * xpix)
            log::warning("Loader", "non-square PSF grid cells in '" + path + "', using XPIXSZ");
        grid.grid_delta_m = xpix * 1e-6;
    } else if (key("PSFSCALE", psfscale)) {
        grid.grid_delta_m = 2.0 * f_number * d_aperture_m * std::tan(psfscale / 2.0 * phys::arcsec);
    } else {
        grid.grid_delta_m = pixel_size_m;
    }

    if (key("XPSFCTR", xc) && key("YPSFCTR", yc))
        grid.centre = {yc, xc};
    else
        grid.centre = {ny / 2.0, nx / 2.0};
    return grid;
}

// ----------------------------------------------------------------------------
PsfGrid load_psf_zemax(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw ConfigurationError("Cannot open '" + path + "'");
    const std::string text = decode_text(std::string(std::istreambuf_iterator<char>(in), {}));

    static const std::regex grid_re(R"(Image grid size:\s*([0-9]+)\s*by\s*([0-9]+))");
    static const std::regex area_re(R"(Data area is\s*([0-9]+,?[0-9]*)\s*by\s*([0-9]+,?[0-9]*)\s*(\S+?)\.?\s*$)");
    static const std::regex ctr_re (R"(Center point is:\D*([0-9]+)\D+([0-9]+))");
    constexpr int kHeaderLines = 21;

    std::istringstream is(text);
    std::string line;
    std::smatch m;
    Eigen::Index n_rows = 0, n_cols = 0;
    Real area_x = 0.0, unit = 0.0;
    int c_row = -1, c_col = -1;

    for (int i = 0; i < kHeaderLines && std::getline(is, line); ++i) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (std::regex_search(line, m, grid_re)) {
            n_cols = std::stol(m[1]);
            n_rows = std::stol(m[2]);
        } else if (std::regex_search(line, m, area_re)) {
            area_x = parse_number(m[1]);
            unit   = length_scale(m[3]);
        } else if (std::regex_search(line, m, ctr_re)) {
            c_row = std::stoi(m[1]);
            c_col = std::stoi(m[2]);
        }
    }
    if (n_rows <= 0 || n_cols <= 0 || unit <= 0.0 || c_row < 0)
        throw ConfigurationError("Incomplete Zemax PSF header in '" + path + "'");

    std::vector<std::vector<double>> rows;
    while (std::getline(is, line)) {
        std::istringstream ls(line);
        std::string cell;
        std::vector<double> row;
        while (std::getline(ls, cell, '\t')) {
            cell.erase(std::remove_if(cell.begin(), cell.end(), is_space), cell.end());
            if (!cell.empty()) row.push_back(parse_number(cell));
        }
        if (!row.empty()) rows.push_back(std::move(row));
    }
    if (static_cast<Eigen::Index>(rows.size()) != n_rows)
        log::warning("Loader", "Not all PSF entries read from '" + path + "'");
    if (rows.empty())
        throw ConfigurationError("Zemax PSF file '" + path + "' contains no data");

    PsfGrid grid;
    grid.values = Matrix::Zero(static_cast<Eigen::Index>(rows.size()), n_cols);
    for (std::size_t r = 0; r < rows.size(); ++r)
        for (std::size_t c = 0; c < rows[r].size() && static_cast<Eigen::Index>(c) < n_cols; ++c)
            grid.values(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rows[r][c];

    grid.grid_delta_m = area_x / static_cast<Real>(n_cols) * unit;
    // Zemax counts rows from the bottom, starting at 1
    grid.centre = {static_cast<Real>(grid.values.rows() - c_row), static_cast<Real>(c_col - 1)};
    return grid;
}

} // namespace etcalc
