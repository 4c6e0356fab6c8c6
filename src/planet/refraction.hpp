#pragma once

/// @file refraction.hpp
/// @brief Vertical compression of a disk seen through a low, refracting atmosphere.

#include "rendering/canvas.hpp"

namespace planetrender::planet
{
    /// @brief Static utility class applying the refraction warp to a finished frame.
    class Refraction
    {
    public:
        Refraction() = delete;

        /// @brief True if compressing a disk of @p scale pixels per radius by
        /// @p upper_limb_factor moves its limb by more than one pixel.
        [[nodiscard]] static bool is_visible(f64 scale, f64 upper_limb_factor);

        /// @brief Squeeze @p frame by @p upper_limb_factor along the local
        /// vertical, which is rotated @p zenith_angle from the screen y axis,
        /// keeping @p center fixed. Colour and depth are resampled together;
        /// pixels mapping from outside the frame become background.
        [[nodiscard]] static rendering::FrameSnapshot apply(const rendering::FrameSnapshot& frame, Vec2d center,
                                                            f64 upper_limb_factor, f64 zenith_angle,
                                                            rendering::Rgb background);
    };

} // namespace planetrender::planet
