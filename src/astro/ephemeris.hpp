#pragma once

/// @file ephemeris.hpp
/// @brief Per-instant body and satellite state consumed by the renderer.
///
/// Values are produced by an external ephemeris provider (in this repository,
/// scene files). All angles are in radians, distances in AU unless noted.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace planetrender::astro
{
    /// @brief Apparent state of the target body.
    struct BodyEphemeris
    {
        f64 julian_date = astro_constants::kJ2000;

        f64 angular_radius = 0.0;         ///< Apparent equatorial radius
        f64 pole_inclination = 0.0;       ///< Planetographic latitude of the sub-observer point
        f64 axis_position_angle = 0.0;    ///< Position angle of the north pole, from celestial north
        f64 central_meridian = 0.0;       ///< Longitude of the central meridian
        f64 central_meridian_i = 0.0;     ///< System I (Jupiter, Saturn)
        f64 central_meridian_ii = 0.0;    ///< System II (Jupiter)
        f64 central_meridian_iii = 0.0;   ///< System III (giant planets, magnetic frame)
        f64 subsolar_latitude = 0.0;
        f64 subsolar_longitude = 0.0;

        f64 phase = 1.0;                  ///< Illuminated fraction [0, 1]
        f64 phase_angle = 0.0;            ///< Sun-body-observer angle
        f64 bright_limb_angle = 0.0;      ///< Position angle of the bright limb midpoint
        f64 parallactic_angle = 0.0;      ///< Rotation of celestial north from local zenith direction

        f64 distance = 1.0;               ///< From observer
        f64 distance_from_sun = 1.0;
        f64 elevation = 0.0;              ///< Apparent elevation above the horizon

        bool operator==(const BodyEphemeris&) const = default;
    };

    /// @brief Apparent state of one natural satellite of the target.
    ///
    /// Positions are in equatorial radii of the primary, in the primary's
    /// equatorial frame: x along the projected equator, y along the projected
    /// axis, z away from the observer (or away from the sun for the *_from_sun
    /// variant).
    struct MoonEphemeris
    {
        std::string name;

        Vec3d position{0.0};
        Vec3d position_from_sun{0.0};

        /// @brief Optional angular offset from the primary on a north-up sky
        /// (x towards screen right, y towards north). Overrides @ref position for placement.
        std::optional<Vec2d> sky_offset;

        f64 angular_radius = 0.0;
        f64 magnitude = 99.0;
        f64 radius_km = 0.0;
        f64 distance = 1.0;

        f64 phase = 1.0;
        f64 phase_angle = 0.0;
        f64 elongation = 0.0;             ///< Angular distance from the sun as seen from the observer
        f64 bright_limb_angle = 0.0;
        f64 pole_inclination = 0.0;
        f64 axis_position_angle = 0.0;
        f64 central_meridian = 0.0;
        f64 parallactic_angle = 0.0;

        bool eclipsed = false;            ///< Inside the primary's shadow
        bool occulted = false;            ///< Behind the primary's disk
        bool shadow_transiting = false;   ///< Casting its shadow on the primary
        bool mutual_phenomena = false;    ///< Eclipsed or occulted (in part) by another satellite

        bool operator==(const MoonEphemeris&) const = default;
    };

    using MoonEphemerides = std::vector<MoonEphemeris>;

} // namespace planetrender::astro
