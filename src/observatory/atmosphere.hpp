#pragma once
// observatory/atmosphere.hpp - Atmospheric refraction for low-altitude disks
//
// Near the horizon the lower limb of a planet is lifted more than the upper
// one, so the disk appears flattened along the vertical. The renderer
// reproduces this with a compression factor derived here.

#include <algorithm>
#include <cmath>
#include <numbers>

namespace planetrender {

constexpr double kAtmDegRad = std::numbers::pi / 180.0;

// -----------------------------------------------------------------------
// AtmosphericConditions - snapshot of atmospheric state
// -----------------------------------------------------------------------
struct AtmosphericConditions {
    double temperature_c{10.0};   ///< Air temperature [°C]
    double pressure_hPa{1010.0};  ///< Atmospheric pressure [hPa]
};

// -----------------------------------------------------------------------
// AtmosphericModel - refraction and limb compression
// -----------------------------------------------------------------------
class AtmosphericModel {
public:
    explicit AtmosphericModel(const AtmosphericConditions& cond = {})
        : m_cond(cond) {}

    const AtmosphericConditions& conditions() const { return m_cond; }

    /// Atmospheric refraction [arcsec] for a geometric altitude.
    /// Uses the Saemundsson approximation, zero below -1 degree.
    double refraction_arcsec(double true_alt_deg) const {
        if (true_alt_deg < -1.0) return 0.0;
        // Temperature and pressure correction factor
        double f = (m_cond.pressure_hPa / 1010.0)
                 * (283.0 / (273.0 + m_cond.temperature_c));
        // R is in arcminutes per Saemundsson (1986); multiply by 60 for arcsec
        double R = 1.02 / std::tan((true_alt_deg + 10.3 /
                                     (true_alt_deg + 5.11)) * kAtmDegRad);
        return std::max(R * f * 60.0, 0.0);
    }

    /// Apparent altitude [deg] of a point at the given geometric altitude.
    double apparentAltitude_deg(double true_alt_deg) const {
        return true_alt_deg + refraction_arcsec(true_alt_deg) / 3600.0;
    }

    /// Approximate geometric altitude [deg] for an observed altitude.
    double trueAltitude_deg(double apparent_alt_deg) const {
        double alt = apparent_alt_deg;
        for (int i = 0; i < 4; ++i)
            alt = apparent_alt_deg - refraction_arcsec(alt) / 3600.0;
        return alt;
    }

    /// Ratio between the apparent and geometric height of the upper half of a
    /// disk of angular radius @p radius_deg centred at apparent altitude
    /// @p apparent_alt_deg. 1 means no visible compression.
    double upperLimbFactor(double apparent_alt_deg, double radius_deg) const {
        if (radius_deg <= 0.0) return 1.0;
        double centre = trueAltitude_deg(apparent_alt_deg);
        double upper = apparentAltitude_deg(centre + radius_deg);
        return std::clamp((upper - apparent_alt_deg) / radius_deg, 0.0, 1.0);
    }

private:
    AtmosphericConditions m_cond;
};

} // namespace planetrender
