#pragma once

/// @file image.hpp
/// @brief Owned RGB raster used for textures, snapshots and output frames.

#include "rendering/color.hpp"

#include <span>
#include <vector>

namespace planetrender::rendering
{
    /// @brief Row-major RGB image. Copyable value type.
    class Image
    {
    public:
        Image() = default;
        Image(i32 width, i32 height, Rgb fill = {});

        [[nodiscard]] i32 get_width() const { return m_width; }
        [[nodiscard]] i32 get_height() const { return m_height; }
        [[nodiscard]] bool empty() const { return m_pixels.empty(); }

        [[nodiscard]] bool contains(i32 x, i32 y) const
        {
            return x >= 0 && y >= 0 && x < m_width && y < m_height;
        }

        /// @brief Pixel at (x, y). Coordinates must be inside the image.
        [[nodiscard]] Rgb get(i32 x, i32 y) const { return m_pixels[index(x, y)]; }

        /// @brief Pixel at (x, y) with coordinates clamped to the edges.
        [[nodiscard]] Rgb get_clamped(i32 x, i32 y) const;

        void set(i32 x, i32 y, Rgb color) { m_pixels[index(x, y)] = color; }

        void fill(Rgb color);

        /// @brief Bilinear resample to a new size.
        [[nodiscard]] Image resized(i32 width, i32 height) const;

        /// @brief Colour-inverted copy (255 - channel).
        [[nodiscard]] Image inverted() const;

        [[nodiscard]] std::span<const Rgb> pixels() const { return m_pixels; }

        bool operator==(const Image&) const = default;

    private:
        [[nodiscard]] std::size_t index(i32 x, i32 y) const
        {
            return static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) + static_cast<std::size_t>(x);
        }

        i32 m_width = 0;
        i32 m_height = 0;
        std::vector<Rgb> m_pixels;
    };

} // namespace planetrender::rendering
