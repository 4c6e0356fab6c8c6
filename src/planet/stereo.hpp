#pragma once

/// @file stereo.hpp
/// @brief Left/right eye views from the depth buffer and their packing into one image.

#include "planet/render_config.hpp"
#include "rendering/canvas.hpp"

#include <array>

namespace planetrender::planet
{
    /// @brief Views of the two eyes, same size as the source frame.
    struct StereoPair
    {
        rendering::Image left;
        rendering::Image right;
    };

    namespace stereo_constants
    {
        /// Dubois (2009) least-squares red-cyan projection, column major:
        /// out.r = m[0] r + m[3] g + m[6] b, out.g = m[1] r + ..., out.b = m[2] r + ...
        constexpr std::array<f64, 9> kDuboisLeft = {0.437, -0.062, -0.048, 0.449, -0.062, -0.050, 0.164, -0.024, -0.017};
        constexpr std::array<f64, 9> kDuboisRight = {-0.011, 0.377, -0.026, -0.032, 0.761, -0.093, -0.007, 0.009, 1.234};
    }

    /// @brief Static utility class for the stereoscopic output modes.
    class Stereo
    {
    public:
        Stereo() = delete;

        /// @brief Horizontal shift of a pixel at @p depth for the left eye [px].
        ///
        /// Depth is converted to pixels with @p scale and clamped to
        /// ±kStereoReferenceDepth; the right eye uses the opposite shift.
        /// Overlay and background depths are not shifted.
        [[nodiscard]] static f64 get_disparity(f64 depth, f64 scale, f64 eye_separation);

        /// @brief Forward-map every non-background pixel to each eye, nearest
        /// surface winning. Holes keep the source pixel.
        [[nodiscard]] static StereoPair derive(const rendering::FrameSnapshot& frame, f64 scale, f64 eye_separation);

        /// @brief Combine the pair into the image of @p mode.
        [[nodiscard]] static rendering::Image pack(const StereoPair& pair, AnaglyphMode mode);

        /// @brief Colour of one Dubois anaglyph pixel.
        [[nodiscard]] static rendering::Rgb combine_dubois(rendering::Rgb left, rendering::Rgb right);
    };

} // namespace planetrender::planet
