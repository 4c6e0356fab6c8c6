#pragma once

/// @file body.hpp
/// @brief Renderable solar-system bodies and their immutable physical tables.

#include "core/types.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace planetrender::astro
{
    /// @brief Body a frame is centred on. Order matters: Jupiter..Neptune form the giant range.
    enum class Target
    {
        Sun,
        Mercury,
        Venus,
        Earth,
        Mars,
        Jupiter,
        Saturn,
        Uranus,
        Neptune,
        Pluto,
        Moon,
    };

    /// @brief Physical description of a target body.
    struct BodyInfo
    {
        Target target;
        std::string_view name;            ///< English name, also the texture name
        f64 equatorial_radius_km;
        f64 polar_radius_km;
        std::span<const f64> ring_radii_km; ///< Empty when the body has no rings
        u32 textured_ring_count;            ///< Leading ring radii spanned by the ring strip texture
        u32 main_moon_count;                ///< Satellites always drawn in sky mode
    };

    /// @brief Look up the physical table of a target.
    [[nodiscard]] const BodyInfo& get_body_info(Target target);

    /// @brief Parse a target from its English name (case-insensitive).
    [[nodiscard]] std::optional<Target> target_from_name(std::string_view name);

    /// @brief English name of a target.
    [[nodiscard]] std::string_view to_string(Target target);

    /// @brief True for Jupiter, Saturn, Uranus and Neptune.
    [[nodiscard]] bool is_giant_planet(Target target);

    /// @brief True if the target carries a ring system.
    [[nodiscard]] bool has_rings(Target target);

    /// @brief True if the target has satellites worth drawing around it.
    [[nodiscard]] bool has_satellites(Target target);

} // namespace planetrender::astro
