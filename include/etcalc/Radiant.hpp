#pragma once
#include "SpectralQty.hpp"

#include <memory>
#include <optional>
#include <string>

namespace etcalc {

enum class TargetSize { Point, Extended };

/*
 * A node of the radiation transport chain.  The chain is built from the
 * target outwards; each optical component owns its predecessor.
 *
 *   signal()      spectral flux density (point) or radiance (extended)
 *                 of the target as seen behind this node
 *   background()  spectral radiance of everything else
 */
class IRadiant {
public:
    virtual ~IRadiant() = default;

    virtual SpectralQty signal() const = 0;
    virtual SpectralQty background() const = 0;

    virtual TargetSize size() const = 0;

    // Accumulated obstruction factor (A_ob / A_ap) up to this node
    virtual Real obstruction() const = 0;

    // Apparent magnitude the target signal is calibrated to, if any
    virtual std::optional<Real> magnitude() const = 0;

    virtual std::string name() const = 0;
};

using RadiantPtr = std::unique_ptr<IRadiant>;

} // namespace etcalc
