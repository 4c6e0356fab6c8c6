#pragma once

/// @file color.hpp
/// @brief 8-bit RGB colour and the compositing helpers used by every pass.

#include "core/types.hpp"

#include <algorithm>

namespace planetrender::rendering
{
    /// @brief Opaque 8-bit RGB colour.
    struct Rgb
    {
        u8 r = 0;
        u8 g = 0;
        u8 b = 0;

        bool operator==(const Rgb&) const = default;
    };

    namespace colors
    {
        constexpr Rgb kBlack{0, 0, 0};
        constexpr Rgb kWhite{255, 255, 255};
        constexpr Rgb kSunOrange{255, 200, 0};
        constexpr Rgb kAxisBlue{0, 0, 255};
        constexpr Rgb kRingOutline{128, 128, 0};
    }

    /// @brief Clamp an integer to a colour channel.
    [[nodiscard]] constexpr u8 clamp_channel(i32 value)
    {
        return static_cast<u8>(std::clamp(value, 0, 255));
    }

    /// @brief Alpha-composite @p src over @p dst, alpha in [0, 1].
    [[nodiscard]] constexpr Rgb blend(Rgb src, Rgb dst, f64 alpha)
    {
        const auto mix = [alpha](u8 s, u8 d) {
            return clamp_channel(static_cast<i32>(s * alpha + d * (1.0 - alpha)));
        };
        return Rgb{mix(src.r, dst.r), mix(src.g, dst.g), mix(src.b, dst.b)};
    }

    /// @brief Multiply every channel by @p factor (truncating).
    [[nodiscard]] constexpr Rgb scaled(Rgb c, f64 factor)
    {
        return Rgb{clamp_channel(static_cast<i32>(c.r * factor)),
                   clamp_channel(static_cast<i32>(c.g * factor)),
                   clamp_channel(static_cast<i32>(c.b * factor))};
    }

} // namespace planetrender::rendering
