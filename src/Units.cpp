#include "etcalc/Units.hpp"
#include "etcalc/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>
#include <vector>

namespace etcalc {

static bool close(double a, double b)
{
    return std::abs(a - b) <= 1e-12 * std::max(std::abs(a), std::abs(b));
}

bool Unit::dimensionless() const
{
    for (int d : dims)
        if (d != 0) return false;
    return true;
}

bool Unit::equivalent(const Unit& other) const
{
    return dims == other.dims;
}

double Unit::factor_to(const Unit& target) const
{
    if (!equivalent(target))
        throw UnitMismatchError("Cannot convert '" + to_string() +
                                "' to '" + target.to_string() + "'");
    return scale / target.scale;
}

Unit Unit::pow(int n) const
{
    Unit r;
    for (std::size_t i = 0; i < NDims; ++i) r.dims[i] = dims[i] * n;
    r.scale = std::pow(scale, n);
    return r;
}

bool Unit::operator==(const Unit& other) const
{
    return equivalent(other) && close(scale, other.scale);
}

std::string Unit::to_string() const
{
    /* well-known compound units first ------------------------------ */
    static const std::vector<std::pair<Unit, std::string>> named = {
        {units::one,            ""},
        {units::nm,             "nm"},
        {units::m,              "m"},
        {units::s,              "s"},
        {units::K,              "K"},
        {units::W,              "W"},
        {units::J,              "J"},
        {units::Hz,             "Hz"},
        {units::electron,       "electron"},
        {units::electron_rate,  "electron / s"},
        {units::flux_density,   "W / (m2 nm)"},
        {units::radiance,       "W / (m2 nm sr)"},
        {units::flux_density_nu,"W / (m2 Hz)"},
        {units::radiance_nu,    "W / (m2 Hz sr)"},
    };
    for (const auto& [u, name] : named)
        if (u == *this) return name;

    static const char* sym[NDims] = {"m", "kg", "s", "K", "sr", "electron", "photon"};
    std::ostringstream os;
    if (!close(scale, 1.0)) os << scale;
    for (std::size_t i = 0; i < NDims; ++i) {
        if (dims[i] == 0) continue;
        if (os.tellp() > 0) os << ' ';
        os << sym[i];
        if (dims[i] != 1) os << dims[i];
    }
    return os.str();
}

/* ---------------------------------------------------------------- */
static Unit symbol(const std::string& name)
{
    static const std::vector<std::pair<std::string, Unit>> table = {
        {"1", units::one},  {"m", units::m},   {"nm", units::nm}, {"um", units::um},
        {"mm", Unit(1e-3, {1, 0, 0, 0, 0, 0, 0})}, {"cm", Unit(1e-2, {1, 0, 0, 0, 0, 0, 0})},
        {"kg", units::kg},  {"s", units::s},   {"Hz", units::Hz}, {"K", units::K},
        {"sr", units::sr},  {"W", units::W},   {"J", units::J},
        {"electron", units::electron}, {"e-", units::electron},
        {"photon", units::photon},     {"ph", units::photon},
    };
    for (const auto& [n, u] : table)
        if (n == name) return u;
    throw UnitMismatchError("Unknown unit symbol '" + name + "'");
}

// product of whitespace / '*' separated factors like "m2", "m^2", "nm"
static Unit product(std::string text)
{
    for (char& ch : text)
        if (ch == '(' || ch == ')' || ch == '*') ch = ' ';

    Unit r = units::one;
    std::istringstream is(text);
    std::string tok;
    while (is >> tok) {
        std::size_t split = tok.find('^');
        std::string name = tok.substr(0, split);
        int expo = 1;
        if (split != std::string::npos) {
            const std::string e = tok.substr(split + 1);
            if (e.empty() || e == "-" || e.find_first_not_of("-0123456789") != std::string::npos)
                throw UnitMismatchError("Bad exponent in unit token '" + tok + "'");
            expo = std::stoi(e);
        } else {
            // trailing exponent, optionally negative: "m2", "m-2"
            std::size_t d = tok.find_last_not_of("0123456789");
            if (d != std::string::npos && d + 1 < tok.size()) {
                const bool neg = tok[d] == '-';
                if (neg && d == 0)
                    throw UnitMismatchError("Bad unit token '" + tok + "'");
                name = tok.substr(0, neg ? d : d + 1);
                expo = std::stoi(tok.substr(d + 1)) * (neg ? -1 : 1);
            }
        }
        r = r * symbol(name).pow(expo);
    }
    return r;
}

Unit parse_unit(const std::string& text)
{
    const std::size_t slash = text.find('/');
    if (slash == std::string::npos) return product(text);
    if (text.find('/', slash + 1) != std::string::npos)
        throw UnitMismatchError("Only one '/' allowed in unit '" + text + "'");
    return product(text.substr(0, slash)) / product(text.substr(slash + 1));
}

Quantity operator*(const Quantity& a, const Quantity& b)
{
    return {a.value * b.value, a.unit * b.unit};
}

Quantity operator/(const Quantity& a, const Quantity& b)
{
    return {a.value / b.value, a.unit / b.unit};
}

} // namespace etcalc
