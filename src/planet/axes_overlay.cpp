/// @file axes_overlay.cpp
/// @brief Axis stubs and the orientation cross.

#include "planet/axes_overlay.hpp"
#include "rendering/glyphs.hpp"

#include <algorithm>
#include <cmath>

namespace planetrender::planet
{

using namespace axes_constants;
using rendering::depth::kOverlay;

AxesOverlay::AxesOverlay(const FrameGeometry& geometry, const RenderConfig& config)
    : m_geometry{geometry}
    , m_config{config}
{
}

void AxesOverlay::draw(rendering::Canvas& canvas) const
{
    if (m_geometry.radius <= 0)
    {
        return;
    }
    if (m_config.show_axes)
    {
        draw_pole_axis(canvas);
    }
    if (m_config.show_nsew)
    {
        draw_cross(canvas);
    }
}

void AxesOverlay::draw_pole_axis(rendering::Canvas& canvas) const
{
    const auto& g = m_geometry;
    const f64 angle = astro_constants::kHalfPi - g.up;
    const f64 inner = g.radius + kStubStart * g.supersample;
    const f64 outer = g.radius + kStubEnd * g.supersample;

    const f64 dx0 = std::trunc(inner * std::cos(angle));
    const f64 dy0 = std::trunc(inner * std::sin(angle));
    const f64 dx = std::trunc(outer * std::cos(angle));
    const f64 dy = std::trunc(outer * std::sin(angle));

    const auto color = rendering::colors::kAxisBlue;
    canvas.draw_line(g.center.x - dx, g.center.y - dy, g.center.x - dx0, g.center.y - dy0, color, kOverlay, kOverlay);
    canvas.draw_line(g.center.x + dx, g.center.y + dy, g.center.x + dx0, g.center.y + dy0, color, kOverlay, kOverlay);
}

void AxesOverlay::draw_cross(rendering::Canvas& canvas) const
{
    const auto& g = m_geometry;
    const f64 angle = astro_constants::kHalfPi + g.north;
    const f64 inner = g.radius + kStubStart * g.supersample;
    const f64 outer = g.radius + kStubEnd * g.supersample;

    const f64 dx0 = std::trunc(inner * std::cos(angle));
    const f64 dy0 = std::trunc(inner * std::sin(angle));
    const f64 dx = std::trunc(outer * std::cos(angle));
    const f64 dy = std::trunc(outer * std::sin(angle));

    const auto color = m_config.foreground;
    const f64 x = g.center.x;
    f64 y = g.center.y;
    canvas.draw_line(x - dx, y - dy, x - dx0, y - dy0, color, kOverlay, kOverlay);
    canvas.draw_line(x + dx, y + dy, x + dx0, y + dy0, color, kOverlay, kOverlay);
    canvas.draw_line(x - dy, y + dx, x - dy0, y + dx0, color, kOverlay, kOverlay);
    canvas.draw_line(x + dy, y - dx, x + dy0, y - dx0, color, kOverlay, kOverlay);

    if (!m_config.show_labels)
    {
        return;
    }

    const i32 pixel_size = std::max(1, static_cast<i32>(g.supersample + 0.5));
    const f64 label = g.radius + kLabelDistance * g.supersample;
    const f64 lx = std::trunc(label * std::cos(angle));
    const f64 ly = std::trunc(label * std::sin(angle));
    if (m_config.telescope.invert_vertical)
    {
        y -= rendering::glyphs::kHeight * pixel_size - 2;
    }

    canvas.draw_text(x - 4 - lx, y + 4 - ly, "N", color, pixel_size);
    canvas.draw_text(x - 4 + lx, y + 4 + ly, "S", color, pixel_size);
    canvas.draw_text(x - 3 - ly, y + 5 + lx, "E", color, pixel_size);
    canvas.draw_text(x - 3 + ly, y + 5 - lx, "W", color, pixel_size);
}

} // namespace planetrender::planet
