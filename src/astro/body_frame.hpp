#pragma once

/// @file body_frame.hpp
/// @brief Rotations between the planet equatorial frame and sun/observer views.

#include "core/types.hpp"

namespace planetrender::astro
{
    /// @brief Static utility class for body-frame geometry shared by disks, rings and shadows.
    class BodyFrame
    {
    public:
        BodyFrame() = delete;

        /// @brief Rotate a point given in the planet equatorial frame so that it is
        /// seen from another direction.
        ///
        /// First rotates by @p dlon in the x-z plane (about the polar axis), then by
        /// @p dlat in the y-z plane. Units are preserved.
        [[nodiscard]] static Vec3d rotate_from_equator(const Vec3d& p, f64 dlon, f64 dlat);

        /// @brief Inverse of rotate_from_equator().
        [[nodiscard]] static Vec3d rotate_to_equator(const Vec3d& p, f64 dlon, f64 dlat);

        /// @brief Rotate a 2D vector by @p angle (counter-clockwise for y up).
        [[nodiscard]] static Vec2d rotate(const Vec2d& v, f64 angle);

        /// @brief Convert a planetographic (geodetic) latitude to planetocentric.
        [[nodiscard]] static f64 geodetic_to_geocentric(f64 equatorial_radius, f64 polar_radius, f64 latitude);

        /// @brief Inverse of geodetic_to_geocentric().
        [[nodiscard]] static f64 geocentric_to_geodetic(f64 equatorial_radius, f64 polar_radius, f64 latitude);

        /// @brief Normalize an angle to [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);

        /// @brief Sign of a value as -1, 0 or +1.
        [[nodiscard]] static i32 sign(f64 value);
    };

} // namespace planetrender::astro
