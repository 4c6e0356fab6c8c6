#pragma once

/// @file frame_geometry.hpp
/// @brief Per-frame derived geometry of the target disk on the canvas.
///
/// Screen coordinates are canvas pixels with y growing downwards. Body
/// coordinates are in units of the equatorial radius.

#include "planet/render_config.hpp"

#include <optional>

namespace planetrender::planet
{
    /// @brief Planetographic coordinates [rad].
    struct Planetographic
    {
        f64 longitude = 0.0;  ///< [0, 2π)
        f64 latitude = 0.0;   ///< Planetographic (geodetic)
    };

    /// @brief Disk placement, orientation and lighting for one frame.
    struct FrameGeometry
    {
        astro::Target target = astro::Target::Sun;
        const astro::BodyInfo* body = nullptr;

        f64 supersample = 1.0;  ///< Canvas pixels per output pixel
        i32 width = 0;          ///< Canvas width (supersampled)
        i32 height = 0;

        f64 scale = 0.0;        ///< Pixels per equatorial radius
        i32 radius = 0;         ///< Integer disk radius used for rasterization
        Vec2d center{0.0};      ///< Planet centre, whole pixels
        f64 planet_size = 0.0;  ///< Radians per pixel

        f64 north = 0.0;        ///< Rotation of celestial north on the screen
        f64 pole = 0.0;         ///< Planetocentric latitude of the sub-observer point
        f64 axis = 0.0;         ///< Position angle of the rotation axis
        f64 up = 0.0;           ///< axis - north
        f64 rotation = 0.0;     ///< Central meridian used for textures and grid
        f64 subsolar_latitude = 0.0;  ///< Planetocentric
        f64 dlon = 0.0;         ///< Observer to sun longitude difference
        f64 dlat = 0.0;         ///< Observer to sun latitude difference

        f64 axis_ratio = 1.0;   ///< Apparent polar / equatorial radius, <= 1
        f64 oblateness = 1.0;   ///< 1 / axis_ratio, >= 1

        f64 texture_origin = 0.0;  ///< Longitude of the first texture column relative to the limb
        i32 longitude_sign = 1;    ///< -1 for bodies whose longitudes grow eastwards

        Vec3d sun{0.0};         ///< Sub-solar point: screen x, screen y, depth towards the observer [px]

        f64 dist_center = 0.0;  ///< Normalized distance of the centre from the canvas centre
        f64 times_out = 0.0;    ///< Disk radii the centre lies outside the canvas
        bool planet_visible = true;
        bool rings_textures_visible = true;

        /// @brief Derive the geometry of @p request on a canvas supersampled by @p supersample.
        [[nodiscard]] static FrameGeometry compute(const FrameRequest& request, f64 supersample);

        /// @brief Depth value of a disk sample @p dz0 pixels above the sky plane.
        [[nodiscard]] f64 surface_depth(f64 dz0) const { return dz0 / scale; }

        /// @brief True if (x, y) lies on the canvas, widened by @p margin pixels.
        [[nodiscard]] bool is_in_screen(f64 x, f64 y, f64 margin) const;

        /// @brief Planetographic position under a canvas pixel, if it hits the disk.
        [[nodiscard]] std::optional<Planetographic> screen_to_planetographic(f64 x, f64 y) const;

        /// @brief Canvas position of a planetographic point, if it is on the visible hemisphere.
        [[nodiscard]] std::optional<Vec2d> planetographic_to_screen(const Planetographic& point) const;
    };

} // namespace planetrender::planet
