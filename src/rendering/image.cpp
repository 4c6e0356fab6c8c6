/// @file image.cpp
/// @brief Image resampling and pixel utilities.

#include "rendering/image.hpp"

#include <algorithm>
#include <cmath>

namespace planetrender::rendering
{

Image::Image(i32 width, i32 height, Rgb fill)
    : m_width{std::max(width, 0)}
    , m_height{std::max(height, 0)}
    , m_pixels(static_cast<std::size_t>(m_width) * static_cast<std::size_t>(m_height), fill)
{
}

Rgb Image::get_clamped(i32 x, i32 y) const
{
    return get(std::clamp(x, 0, m_width - 1), std::clamp(y, 0, m_height - 1));
}

void Image::fill(Rgb color)
{
    std::fill(m_pixels.begin(), m_pixels.end(), color);
}

Image Image::resized(i32 width, i32 height) const
{
    Image out(width, height);
    if (empty() || out.empty())
    {
        return out;
    }

    const f64 sx = static_cast<f64>(m_width) / width;
    const f64 sy = static_cast<f64>(m_height) / height;

    for (i32 y = 0; y < height; ++y)
    {
        const f64 fy = std::max(0.0, (y + 0.5) * sy - 0.5);
        const i32 y0 = std::min(static_cast<i32>(fy), m_height - 1);
        const i32 y1 = std::min(y0 + 1, m_height - 1);
        const f64 ty = fy - y0;

        for (i32 x = 0; x < width; ++x)
        {
            const f64 fx = std::max(0.0, (x + 0.5) * sx - 0.5);
            const i32 x0 = std::min(static_cast<i32>(fx), m_width - 1);
            const i32 x1 = std::min(x0 + 1, m_width - 1);
            const f64 tx = fx - x0;

            const Rgb c00 = get(x0, y0);
            const Rgb c10 = get(x1, y0);
            const Rgb c01 = get(x0, y1);
            const Rgb c11 = get(x1, y1);

            const auto lerp = [tx, ty](u8 a, u8 b, u8 c, u8 d) {
                const f64 top = a + (b - a) * tx;
                const f64 bottom = c + (d - c) * tx;
                return clamp_channel(static_cast<i32>(top + (bottom - top) * ty + 0.5));
            };

            out.set(x, y, Rgb{lerp(c00.r, c10.r, c01.r, c11.r),
                              lerp(c00.g, c10.g, c01.g, c11.g),
                              lerp(c00.b, c10.b, c01.b, c11.b)});
        }
    }
    return out;
}

Image Image::inverted() const
{
    Image out = *this;
    for (auto& p : out.m_pixels)
    {
        p = Rgb{static_cast<u8>(255 - p.r), static_cast<u8>(255 - p.g), static_cast<u8>(255 - p.b)};
    }
    return out;
}

} // namespace planetrender::rendering
