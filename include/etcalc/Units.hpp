#pragma once
#include <array>
#include <string>

namespace etcalc {

/*
 * Physical unit as a product of integer powers of seven base dimensions
 * times a scale factor to SI.  Angles and pixels are dimensionless, the
 * solid angle is kept as its own dimension so that radiance and flux
 * density cannot be confused.
 */
struct Unit {
    enum Dim : std::size_t {
        Length = 0, Mass, Time, Temperature, SolidAngle, Electron, Photon, NDims
    };

    std::array<int, NDims> dims {};   // exponents
    double                 scale = 1.0;

    constexpr Unit() = default;
    constexpr Unit(double scale_, std::array<int, NDims> dims_) : dims(dims_), scale(scale_) {}

    bool dimensionless() const;
    bool equivalent(const Unit& other) const;

    // Multiplicative factor converting a value in *this* unit to `target`
    double factor_to(const Unit& target) const;

    Unit pow(int n) const;
    std::string to_string() const;

    bool operator==(const Unit& other) const;
    bool operator!=(const Unit& other) const { return !(*this == other); }
};

constexpr Unit operator*(const Unit& a, const Unit& b)
{
    Unit r;
    for (std::size_t i = 0; i < Unit::NDims; ++i) r.dims[i] = a.dims[i] + b.dims[i];
    r.scale = a.scale * b.scale;
    return r;
}

constexpr Unit operator/(const Unit& a, const Unit& b)
{
    Unit r;
    for (std::size_t i = 0; i < Unit::NDims; ++i) r.dims[i] = a.dims[i] - b.dims[i];
    r.scale = a.scale / b.scale;
    return r;
}

// Scalar with a unit attached
struct Quantity {
    double value = 0.0;
    Unit   unit;

    double to(const Unit& target) const { return value * unit.factor_to(target); }
};

Quantity operator*(const Quantity& a, const Quantity& b);
Quantity operator/(const Quantity& a, const Quantity& b);

// Parse "W / (m2 nm sr)", "W/(m^2 um)", "electron/photon", "" ...
// Throws UnitMismatchError for unknown symbols.
Unit parse_unit(const std::string& text);

namespace units {
    //                             L  M  T  K  sr e  ph
    inline constexpr Unit one       {1.0,   {0, 0, 0, 0, 0, 0, 0}};
    inline constexpr Unit m         {1.0,   {1, 0, 0, 0, 0, 0, 0}};
    inline constexpr Unit nm        {1e-9,  {1, 0, 0, 0, 0, 0, 0}};
    inline constexpr Unit um        {1e-6,  {1, 0, 0, 0, 0, 0, 0}};
    inline constexpr Unit kg        {1.0,   {0, 1, 0, 0, 0, 0, 0}};
    inline constexpr Unit s         {1.0,   {0, 0, 1, 0, 0, 0, 0}};
    inline constexpr Unit Hz        {1.0,   {0, 0, -1, 0, 0, 0, 0}};
    inline constexpr Unit K         {1.0,   {0, 0, 0, 1, 0, 0, 0}};
    inline constexpr Unit sr        {1.0,   {0, 0, 0, 0, 1, 0, 0}};
    inline constexpr Unit electron  {1.0,   {0, 0, 0, 0, 0, 1, 0}};
    inline constexpr Unit photon    {1.0,   {0, 0, 0, 0, 0, 0, 1}};
    inline constexpr Unit J         {1.0,   {2, 1, -2, 0, 0, 0, 0}};
    inline constexpr Unit W         {1.0,   {2, 1, -3, 0, 0, 0, 0}};

    // W / (m^2 nm)
    inline constexpr Unit flux_density   = W / (m * m * nm);
    // W / (m^2 nm sr)
    inline constexpr Unit radiance       = flux_density / sr;
    // W / (m^2 Hz) and W / (m^2 Hz sr)
    inline constexpr Unit flux_density_nu = W / (m * m * Hz);
    inline constexpr Unit radiance_nu     = flux_density_nu / sr;
    // e- / s
    inline constexpr Unit electron_rate  = electron / s;
} // namespace units

} // namespace etcalc
