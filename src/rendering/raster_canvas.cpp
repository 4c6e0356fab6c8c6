/// @file raster_canvas.cpp
/// @brief Software rasterization of the Canvas primitives.

#include "rendering/raster_canvas.hpp"
#include "rendering/glyphs.hpp"

#include <algorithm>
#include <cmath>

namespace planetrender::rendering
{

RasterCanvas::RasterCanvas(i32 width, i32 height, Rgb background)
    : m_color(width, height, background)
    , m_depth(static_cast<std::size_t>(std::max(width, 0)) * static_cast<std::size_t>(std::max(height, 0)), depth::kBackground)
    , m_background{background}
    , m_clip{0, 0, m_color.get_width(), m_color.get_height()}
{
}

bool RasterCanvas::is_drawable(i32 x, i32 y) const
{
    return m_color.contains(x, y)
        && x >= m_clip.x && y >= m_clip.y
        && x < m_clip.x + m_clip.width && y < m_clip.y + m_clip.height;
}

Rgb RasterCanvas::get_pixel(i32 x, i32 y) const
{
    return m_color.contains(x, y) ? m_color.get(x, y) : m_background;
}

f64 RasterCanvas::get_depth(i32 x, i32 y) const
{
    return m_color.contains(x, y) ? m_depth[index(x, y)] : depth::kBackground;
}

void RasterCanvas::clear(Rgb background)
{
    m_background = background;
    m_color.fill(background);
    std::fill(m_depth.begin(), m_depth.end(), depth::kBackground);
}

void RasterCanvas::set_pixel(i32 x, i32 y, Rgb color, f64 depth)
{
    if (!is_drawable(x, y))
    {
        return;
    }
    m_color.set(x, y, color);
    m_depth[index(x, y)] = std::isnan(depth) ? 0.0 : depth;
}

void RasterCanvas::set_color(i32 x, i32 y, Rgb color)
{
    if (is_drawable(x, y))
    {
        m_color.set(x, y, color);
    }
}

bool RasterCanvas::plot(i32 x, i32 y, Rgb color, f64 depth, f64 alpha)
{
    if (!is_drawable(x, y))
    {
        return false;
    }

    if (std::isnan(depth))
    {
        depth = 0.0;
    }

    auto& stored = m_depth[index(x, y)];
    if (depth < stored)
    {
        return false;
    }

    m_color.set(x, y, alpha >= 1.0 ? color : blend(color, m_color.get(x, y), std::max(alpha, 0.0)));
    stored = depth;
    return true;
}

// -----------------------------------------------------------------
// Shapes
// -----------------------------------------------------------------

void RasterCanvas::fill_circle(f64 cx, f64 cy, f64 radius, Rgb color, f64 depth, f64 alpha)
{
    const f64 r = std::max(radius, 0.5);
    const f64 r2 = r * r;
    const i32 x0 = static_cast<i32>(std::floor(cx - r));
    const i32 x1 = static_cast<i32>(std::ceil(cx + r));
    const i32 y0 = static_cast<i32>(std::floor(cy - r));
    const i32 y1 = static_cast<i32>(std::ceil(cy + r));

    for (i32 y = y0; y <= y1; ++y)
    {
        const f64 dy = y - cy;
        for (i32 x = x0; x <= x1; ++x)
        {
            const f64 dx = x - cx;
            if (dx * dx + dy * dy <= r2)
            {
                plot(x, y, color, depth, alpha);
            }
        }
    }
}

void RasterCanvas::draw_circle(f64 cx, f64 cy, f64 radius, Rgb color, f64 depth)
{
    const f64 r = std::max(radius, 0.5);
    const i32 x0 = static_cast<i32>(std::floor(cx - r - 1.0));
    const i32 x1 = static_cast<i32>(std::ceil(cx + r + 1.0));
    const i32 y0 = static_cast<i32>(std::floor(cy - r - 1.0));
    const i32 y1 = static_cast<i32>(std::ceil(cy + r + 1.0));

    for (i32 y = y0; y <= y1; ++y)
    {
        for (i32 x = x0; x <= x1; ++x)
        {
            if (std::abs(std::hypot(x - cx, y - cy) - r) < 0.5)
            {
                plot(x, y, color, depth);
            }
        }
    }
}

void RasterCanvas::draw_line(f64 x0, f64 y0, f64 x1, f64 y1, Rgb color, f64 depth0, f64 depth1)
{
    const f64 dx = x1 - x0;
    const f64 dy = y1 - y0;
    const i32 steps = static_cast<i32>(std::ceil(std::max(std::abs(dx), std::abs(dy))));
    if (steps == 0)
    {
        plot(static_cast<i32>(std::lround(x0)), static_cast<i32>(std::lround(y0)), color, std::max(depth0, depth1));
        return;
    }

    for (i32 i = 0; i <= steps; ++i)
    {
        const f64 t = static_cast<f64>(i) / steps;
        plot(static_cast<i32>(std::lround(x0 + dx * t)),
             static_cast<i32>(std::lround(y0 + dy * t)),
             color, depth0 + (depth1 - depth0) * t);
    }
}

void RasterCanvas::draw_text(f64 x, f64 y, std::string_view text, Rgb color, i32 pixel_size)
{
    const i32 size = std::max(pixel_size, 1);
    i32 pen_x = static_cast<i32>(std::lround(x));
    const i32 top = static_cast<i32>(std::lround(y)) - glyphs::kHeight * size + 1;

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\xC2' && i + 1 < text.size() && text[i + 1] == '\xB0')
        {
            c = glyphs::kDegreeSign;
            ++i;
        }

        if (const auto* glyph = glyphs::find(c))
        {
            for (i32 row = 0; row < glyphs::kHeight; ++row)
            {
                for (i32 col = 0; col < glyphs::kWidth; ++col)
                {
                    if (((*glyph)[static_cast<std::size_t>(row)] >> (glyphs::kWidth - 1 - col) & 1) == 0)
                    {
                        continue;
                    }
                    for (i32 sy = 0; sy < size; ++sy)
                    {
                        for (i32 sx = 0; sx < size; ++sx)
                        {
                            set_pixel(pen_x + col * size + sx, top + row * size + sy, color, depth::kOverlay);
                        }
                    }
                }
            }
        }
        pen_x += glyphs::kAdvance * size;
    }
}

// -----------------------------------------------------------------
// Snapshots
// -----------------------------------------------------------------

void RasterCanvas::draw_snapshot(const FrameSnapshot& snapshot, f64 x, f64 y, f64 scale)
{
    const i32 sw = snapshot.color.get_width();
    const i32 sh = snapshot.color.get_height();
    if (sw == 0 || sh == 0 || scale <= 0.0
        || snapshot.depth.size() != static_cast<std::size_t>(sw) * static_cast<std::size_t>(sh))
    {
        return;
    }

    const i32 x0 = std::max(m_clip.x, static_cast<i32>(std::floor(x)));
    const i32 y0 = std::max(m_clip.y, static_cast<i32>(std::floor(y)));
    const i32 x1 = std::min(m_clip.x + m_clip.width, static_cast<i32>(std::ceil(x + sw * scale)));
    const i32 y1 = std::min(m_clip.y + m_clip.height, static_cast<i32>(std::ceil(y + sh * scale)));

    for (i32 dy = y0; dy < y1; ++dy)
    {
        const i32 sy = static_cast<i32>(std::floor((dy + 0.5 - y) / scale));
        if (sy < 0 || sy >= sh)
        {
            continue;
        }
        for (i32 dx = x0; dx < x1; ++dx)
        {
            const i32 sx = static_cast<i32>(std::floor((dx + 0.5 - x) / scale));
            if (sx < 0 || sx >= sw || !m_color.contains(dx, dy))
            {
                continue;
            }
            m_color.set(dx, dy, snapshot.color.get(sx, sy));
            m_depth[index(dx, dy)] = snapshot.depth[static_cast<std::size_t>(sy) * static_cast<std::size_t>(sw) + static_cast<std::size_t>(sx)];
        }
    }
}

FrameSnapshot RasterCanvas::snapshot() const
{
    return FrameSnapshot{m_color, m_depth};
}

void RasterCanvas::set_clip(const ClipRect& clip)
{
    m_clip = clip;
}

void RasterCanvas::reset_clip()
{
    m_clip = ClipRect{0, 0, get_width(), get_height()};
}

void RasterCanvas::assign_image(Image image)
{
    if (image.get_width() == get_width() && image.get_height() == get_height())
    {
        m_color = std::move(image);
    }
}

void RasterCanvas::resize(i32 width, i32 height)
{
    m_color = Image(width, height, m_background);
    m_depth.assign(static_cast<std::size_t>(m_color.get_width()) * static_cast<std::size_t>(m_color.get_height()), depth::kBackground);
    reset_clip();
}

} // namespace planetrender::rendering
