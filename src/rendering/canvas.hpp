#pragma once

/// @file canvas.hpp
/// @brief Drawing surface abstraction with an explicit per-pixel depth buffer.
///
/// Depth is measured towards the observer in equatorial radii of the target,
/// relative to the target centre. It is independent of the pixel scale, so a
/// cached raster can be rescaled without touching its depth values.

#include "rendering/image.hpp"

#include <limits>
#include <string_view>
#include <vector>

namespace planetrender::rendering
{
    namespace depth
    {
        /// Depth of pixels nothing has been drawn on.
        constexpr f64 kBackground = std::numeric_limits<f64>::lowest();
        /// Depth of annotations that always stay on top.
        constexpr f64 kOverlay = std::numeric_limits<f64>::max();
    }

    /// @brief Colour + depth copy of a canvas.
    struct FrameSnapshot
    {
        Image color;
        std::vector<f64> depth;
    };

    /// @brief Rectangle in canvas pixels.
    struct ClipRect
    {
        i32 x = 0;
        i32 y = 0;
        i32 width = 0;
        i32 height = 0;
    };

    /// @brief Pixel sink the planet passes draw through.
    ///
    /// Writes outside the current clip rectangle are dropped. Methods named
    /// set_* write unconditionally; plot() and the shape primitives write only
    /// where the new depth is not behind the stored one.
    class Canvas
    {
    public:
        virtual ~Canvas() = default;

        [[nodiscard]] virtual i32 get_width() const = 0;
        [[nodiscard]] virtual i32 get_height() const = 0;

        /// @brief True if (x, y) lies inside the canvas and the clip rectangle.
        [[nodiscard]] virtual bool is_drawable(i32 x, i32 y) const = 0;

        [[nodiscard]] virtual Rgb get_pixel(i32 x, i32 y) const = 0;
        [[nodiscard]] virtual f64 get_depth(i32 x, i32 y) const = 0;
        [[nodiscard]] virtual Rgb get_background() const = 0;

        /// @brief Fill with the background colour and reset depth.
        virtual void clear(Rgb background) = 0;

        /// @brief Write colour and depth.
        virtual void set_pixel(i32 x, i32 y, Rgb color, f64 depth) = 0;

        /// @brief Write colour only, keeping the stored depth.
        virtual void set_color(i32 x, i32 y, Rgb color) = 0;

        /// @brief Depth-tested write, composited with @p alpha in [0, 1].
        /// @return true if the pixel was written.
        virtual bool plot(i32 x, i32 y, Rgb color, f64 depth, f64 alpha = 1.0) = 0;

        virtual void fill_circle(f64 cx, f64 cy, f64 radius, Rgb color, f64 depth, f64 alpha = 1.0) = 0;
        virtual void draw_circle(f64 cx, f64 cy, f64 radius, Rgb color, f64 depth) = 0;
        virtual void draw_line(f64 x0, f64 y0, f64 x1, f64 y1, Rgb color, f64 depth0, f64 depth1) = 0;

        /// @brief Draw text with its baseline-left corner at (x, y).
        virtual void draw_text(f64 x, f64 y, std::string_view text, Rgb color, i32 pixel_size = 1) = 0;

        /// @brief Blit a snapshot scaled by @p scale with its origin at (x, y).
        virtual void draw_snapshot(const FrameSnapshot& snapshot, f64 x, f64 y, f64 scale) = 0;

        [[nodiscard]] virtual FrameSnapshot snapshot() const = 0;

        virtual void set_clip(const ClipRect& clip) = 0;
        virtual void reset_clip() = 0;
    };

} // namespace planetrender::rendering
