#pragma once

/// @file raster_canvas.hpp
/// @brief In-memory Canvas implementation backed by an Image and a depth buffer.

#include "rendering/canvas.hpp"

namespace planetrender::rendering
{
    /// @brief Software canvas used for every render pass.
    class RasterCanvas final : public Canvas
    {
    public:
        RasterCanvas(i32 width, i32 height, Rgb background = colors::kBlack);

        [[nodiscard]] i32 get_width() const override { return m_color.get_width(); }
        [[nodiscard]] i32 get_height() const override { return m_color.get_height(); }
        [[nodiscard]] bool is_drawable(i32 x, i32 y) const override;

        [[nodiscard]] Rgb get_pixel(i32 x, i32 y) const override;
        [[nodiscard]] f64 get_depth(i32 x, i32 y) const override;
        [[nodiscard]] Rgb get_background() const override { return m_background; }

        void clear(Rgb background) override;
        void set_pixel(i32 x, i32 y, Rgb color, f64 depth) override;
        void set_color(i32 x, i32 y, Rgb color) override;
        bool plot(i32 x, i32 y, Rgb color, f64 depth, f64 alpha = 1.0) override;

        void fill_circle(f64 cx, f64 cy, f64 radius, Rgb color, f64 depth, f64 alpha = 1.0) override;
        void draw_circle(f64 cx, f64 cy, f64 radius, Rgb color, f64 depth) override;
        void draw_line(f64 x0, f64 y0, f64 x1, f64 y1, Rgb color, f64 depth0, f64 depth1) override;
        void draw_text(f64 x, f64 y, std::string_view text, Rgb color, i32 pixel_size = 1) override;
        void draw_snapshot(const FrameSnapshot& snapshot, f64 x, f64 y, f64 scale) override;

        [[nodiscard]] FrameSnapshot snapshot() const override;

        void set_clip(const ClipRect& clip) override;
        void reset_clip() override;

        /// @brief Colour buffer.
        [[nodiscard]] const Image& get_image() const { return m_color; }

        /// @brief Replace the colour buffer, keeping depth. Sizes must match.
        void assign_image(Image image);

        /// @brief Resize and clear both buffers.
        void resize(i32 width, i32 height);

    private:
        [[nodiscard]] std::size_t index(i32 x, i32 y) const
        {
            return static_cast<std::size_t>(y) * static_cast<std::size_t>(get_width()) + static_cast<std::size_t>(x);
        }

        Image m_color;
        std::vector<f64> m_depth;
        Rgb m_background;
        ClipRect m_clip;
    };

} // namespace planetrender::rendering
