/// @file ring_renderer.cpp
/// @brief Ring strip preparation, ring shadow on the disk, textured and outline rings.

#include "planet/ring_renderer.hpp"
#include "astro/body_frame.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace planetrender::planet
{

using astro::BodyFrame;
using astro::Target;
using rendering::Canvas;
using rendering::Image;
using rendering::Rgb;
using namespace astro_constants;
using namespace ring_constants;

namespace
{

i32 strip_width(i32 radius)
{
    return std::max(kMinStripWidth, static_cast<i32>(radius / 100.0 + 0.5) * 100);
}

f64 green_fraction(const Image& image, i32 x, i32 y)
{
    return image.get_clamped(x, y).g / 255.0;
}

Image fill_columns(i32 width, i32 height, const std::vector<Rgb>& columns)
{
    Image out(width, height);
    for (i32 x = 0; x < width; ++x)
    {
        for (i32 y = 0; y < height; ++y)
        {
            out.set(x, y, columns[static_cast<std::size_t>(x)]);
        }
    }
    return out;
}

std::optional<RingStrips> load_saturn_strips(rendering::TextureRepository& textures,
                                             const astro::BodyEphemeris& body, bool unlit, i32 width)
{
    const Image* back = textures.find(unlit ? "ringsat_unlitside" : "ringsat_backscattered");
    const Image* forward = unlit ? nullptr : textures.find("ringsat_forwardscattered");
    const Image* color = textures.find("ringsat_color");
    const Image* transparency = textures.find("ringsat_transparency");
    if (back == nullptr || color == nullptr || transparency == nullptr)
    {
        return std::nullopt;
    }

    const i32 offset = unlit ? kUnlitSideOffset : 0;
    const Image back_strip = back->resized(width, kStripHeight);
    const Image color_strip = color->resized(width, kStripHeight);
    const Image opacity_strip = transparency->inverted().resized(width, kStripHeight);
    std::optional<Image> forward_strip;
    if (forward != nullptr)
    {
        forward_strip = forward->resized(width, kStripHeight);
    }

    const f64 forward_weight = std::min(1.0, std::abs(body.phase_angle / kForwardScatterPhase) / kPi);

    std::vector<Rgb> colors(static_cast<std::size_t>(width));
    std::vector<Rgb> opacities(static_cast<std::size_t>(width));
    for (i32 x = 0; x < width; ++x)
    {
        const Rgb c = color_strip.get(x, 0);
        f64 brightness = std::pow(green_fraction(back_strip, x, kStripRow), kStripGamma) * 255.0;
        if (forward_strip)
        {
            const f64 forward_brightness = std::pow(green_fraction(*forward_strip, x, kStripRow), kStripGamma) * 255.0;
            brightness += (forward_brightness - brightness) * forward_weight;
        }

        colors[static_cast<std::size_t>(x)] = Rgb{
            rendering::clamp_channel(offset + static_cast<i32>(c.r / 255.0 * brightness)),
            rendering::clamp_channel(offset + static_cast<i32>(c.g / 255.0 * brightness)),
            rendering::clamp_channel(offset + static_cast<i32>(c.b / 255.0 * brightness))};

        i32 opacity = static_cast<i32>(std::pow(green_fraction(opacity_strip, x, kStripRow), kStripGamma) * 255.0);
        opacity = 192 - ((128 - opacity) * 4) / 3;
        const u8 grey = rendering::clamp_channel(opacity);
        opacities[static_cast<std::size_t>(x)] = Rgb{grey, grey, grey};
    }

    return RingStrips{fill_columns(width, kStripHeight, colors), fill_columns(width, kStripHeight, opacities)};
}

std::optional<RingStrips> load_uranus_strips(rendering::TextureRepository& textures, bool unlit, i32 width)
{
    const Image* color = textures.find("ringura1");
    const Image* transparency = textures.find("ringura2");
    if (color == nullptr || transparency == nullptr || color->empty())
    {
        return std::nullopt;
    }

    Image tinted = *color;
    if (unlit)
    {
        std::vector<Rgb> columns(static_cast<std::size_t>(tinted.get_width()));
        for (i32 x = 0; x < tinted.get_width(); ++x)
        {
            const f64 factor = 1.0 - green_fraction(*transparency, x, kStripRow);
            columns[static_cast<std::size_t>(x)] = rendering::scaled(tinted.get(x, 0), factor);
        }
        tinted = fill_columns(tinted.get_width(), tinted.get_height(), columns);
    }

    return RingStrips{tinted.resized(width, kStripHeight), transparency->resized(width, kStripHeight)};
}

} // anonymous namespace

// -----------------------------------------------------------------
// Setup
// -----------------------------------------------------------------

std::optional<RingStrips> RingRenderer::load_strips(rendering::TextureRepository& textures, Target target,
                                                    const astro::BodyEphemeris& body, i32 radius)
{
    const bool unlit = BodyFrame::sign(body.pole_inclination) != BodyFrame::sign(body.subsolar_latitude);
    const i32 width = strip_width(radius);

    switch (target)
    {
    case Target::Saturn:
        return load_saturn_strips(textures, body, unlit, width);
    case Target::Uranus:
        return load_uranus_strips(textures, unlit, width);
    default:
        return std::nullopt;
    }
}

RingRenderer::RingRenderer(const FrameGeometry& geometry, const RenderConfig& config,
                           const astro::BodyEphemeris& body, rendering::TextureRepository& textures)
    : m_geometry{geometry}
    , m_config{config}
    , m_body{body}
{
    if (is_active() && uses_texture_model()
        && (m_geometry.dist_center < 1.0 || m_geometry.times_out < kMaxTimesOut))
    {
        m_strips = load_strips(textures, m_geometry.target, m_body, m_geometry.radius);
        if (!m_strips)
        {
            PLR_CORE_WARN("Ring strips for {} unavailable, drawing outlines", astro::to_string(m_geometry.target));
        }
    }
}

bool RingRenderer::is_active() const
{
    return astro::has_rings(m_geometry.target) && m_geometry.radius > 0;
}

bool RingRenderer::uses_texture_model() const
{
    return (m_geometry.target == Target::Saturn || m_geometry.target == Target::Uranus)
        && m_config.textures && m_geometry.rings_textures_visible;
}

u32 RingRenderer::get_ring_count() const
{
    const auto& info = *m_geometry.body;
    return std::min<u32>(info.textured_ring_count, static_cast<u32>(info.ring_radii_km.size()));
}

bool RingRenderer::is_inside(f64 x, f64 y) const
{
    return x > 0.0 && x < m_geometry.width - 1.0 && y > 0.0 && y < m_geometry.height - 1.0;
}

bool RingRenderer::is_lit() const
{
    return BodyFrame::sign(m_body.pole_inclination) == BodyFrame::sign(m_body.subsolar_latitude);
}

// -----------------------------------------------------------------
// Passes
// -----------------------------------------------------------------

void RingRenderer::draw_shadow(Canvas& canvas) const
{
    const auto& g = m_geometry;
    if (!m_strips || !(g.dist_center < 1.0 || g.times_out < 1.0) || get_ring_count() < 2)
    {
        return;
    }

    const auto& radii = g.body->ring_radii_km;
    const f64 r = g.radius;
    const f64 km2pix = g.scale / g.body->equatorial_radius_km;
    const f64 rr1 = radii[0] * km2pix;
    const f64 rr2 = radii[get_ring_count() - 1] * km2pix;
    const f64 r2 = g.scale * g.scale;
    const f64 ar2 = g.axis_ratio * g.axis_ratio;
    const i32 texture_width = m_strips->transparency.get_width();

    const f64 factor = (g.target == Target::Saturn && std::abs(g.dlon) > kFineShadowLongitude) ? 3.0 : 1.0;
    std::vector<u8> touched(static_cast<std::size_t>(canvas.get_width()) * static_cast<std::size_t>(canvas.get_height()), 0);

    for (f64 rr3 = rr1; rr3 <= rr2; rr3 += 1.0 / factor)
    {
        const f64 dalfa = kPi / (6.0 * factor * rr3);
        const i32 column = static_cast<i32>(0.5 + (texture_width - 1.0) * (rr3 - rr1) / (rr2 - rr1));
        const f64 opacity = green_fraction(m_strips->transparency, column, kStripRow);

        for (f64 alfa = 0.0; alfa < kTwoPi; alfa += dalfa)
        {
            // Ring sample seen from the sun, dropped onto the planet along the sun direction
            Vec3d pos = BodyFrame::rotate_from_equator(Vec3d{rr3 * std::cos(alfa) / r, 0.0, rr3 * std::sin(alfa) / r},
                                                       0.0, g.subsolar_latitude);
            if (std::abs(pos.x) > 1.0 || std::abs(pos.y) > 1.0 || pos.z < 0.0)
            {
                continue;
            }
            const f64 surface = 1.0 - pos.x * pos.x - pos.y * pos.y * ar2;
            if (surface < 0.0)
            {
                continue;
            }
            pos.z = std::sqrt(surface);

            pos = BodyFrame::rotate_from_equator(pos, 0.0, -g.subsolar_latitude);
            pos = BodyFrame::rotate_from_equator(pos, g.dlon, g.pole);
            if (pos.z < 0.0)
            {
                continue;
            }

            const Vec2d z = Vec2d{pos.x, pos.y} * r;
            if (z.x * z.x + z.y * z.y > r2)
            {
                continue;
            }

            const Vec2d screen = BodyFrame::rotate(z, -g.up);
            const f64 dx = std::trunc(g.center.x + screen.x + 0.5);
            const f64 dy = std::trunc(g.center.y + screen.y + 0.5);
            if (!is_inside(dx, dy))
            {
                continue;
            }

            const i32 px = static_cast<i32>(dx);
            const i32 py = static_cast<i32>(dy);
            const std::size_t index = static_cast<std::size_t>(py) * static_cast<std::size_t>(canvas.get_width()) + static_cast<std::size_t>(px);
            if (touched[index] != 0 || canvas.get_depth(px, py) == rendering::depth::kBackground)
            {
                continue;
            }

            touched[index] = 1;
            canvas.set_color(px, py, rendering::scaled(canvas.get_pixel(px, py), 1.0 - opacity));
        }
    }
}

void RingRenderer::draw(Canvas& canvas) const
{
    if (!is_active())
    {
        return;
    }

    if (m_strips)
    {
        draw_textured(canvas);
    }
    else if (!uses_texture_model() || m_geometry.dist_center < 1.0 || m_geometry.times_out < kMaxTimesOut)
    {
        draw_outline(canvas);
    }
}

void RingRenderer::draw_textured(Canvas& canvas) const
{
    const auto& g = m_geometry;
    if (get_ring_count() < 2)
    {
        return;
    }

    const auto& radii = g.body->ring_radii_km;
    const f64 r = g.radius;
    const f64 km2pix = g.scale / g.body->equatorial_radius_km;
    const f64 rr1 = radii[0] * km2pix;
    const f64 rr2 = radii[get_ring_count() - 1] * km2pix;
    const f64 r2 = g.scale * g.scale;
    const f64 ar2 = g.axis_ratio * g.axis_ratio;
    const f64 cos_sun = std::cos(m_body.subsolar_latitude);
    const f64 sun_axis_ratio = 1.0 + cos_sun * cos_sun * (g.body->polar_radius_km / g.body->equatorial_radius_km - 1.0);
    const f64 sun_ar2 = sun_axis_ratio * sun_axis_ratio;
    const i32 texture_width = m_strips->color.get_width();
    const bool saturn = g.target == Target::Saturn;
    const bool lit = is_lit();
    const f64 fast_limit = canvas.get_width() / 4.0;
    const Rgb background = canvas.get_background();

    std::vector<u8> touched(static_cast<std::size_t>(canvas.get_width()) * static_cast<std::size_t>(canvas.get_height()), 0);

    PLR_CORE_TRACE("Rings: {:.1f}..{:.1f} px, strip width {}", rr1, rr2, texture_width);

    const f64 alpha0 = -g.dlon;
    const f64 alpha1 = kTwoPi - g.dlon;
    for (f64 rr3 = rr1; rr3 <= rr2; rr3 += 1.0)
    {
        const f64 dalfa = kPi / (6.0 * rr3);
        const i32 column = static_cast<i32>(0.5 + (texture_width - 1.0) * (rr3 - rr1) / (rr2 - rr1));
        const f64 opacity = green_fraction(m_strips->transparency, column, kStripRow);
        const Rgb ring = m_strips->color.get_clamped(column, kStripRow);

        for (f64 alfa = alpha0; alfa < alpha1; alfa += dalfa)
        {
            const Vec3d sample{rr3 * std::cos(alfa), 0.0, rr3 * std::sin(alfa)};

            // Lit unless hidden behind the planet as seen from the sun
            const Vec3d from_sun = BodyFrame::rotate_from_equator(sample, 0.0, g.subsolar_latitude);
            const f64 shadow_dist = saturn ? std::sqrt(from_sun.x * from_sun.x + from_sun.y * from_sun.y / ar2) / r : 0.0;
            const bool visible = from_sun.z > 0.0 || from_sun.x * from_sun.x + from_sun.y * from_sun.y / sun_ar2 > r2;

            const Vec3d pos = BodyFrame::rotate_from_equator(sample, g.dlon, g.pole);
            f64 posr = pos.x * pos.x + pos.y * pos.y / ar2;
            if (pos.z < 0.0 && posr < r2 * 0.8)
            {
                continue;
            }

            const Vec2d screen = BodyFrame::rotate(Vec2d{pos.x, pos.y}, -g.up);
            const f64 dx = g.center.x + screen.x;
            const f64 dy = g.center.y + screen.y;

            if (!is_inside(dx, dy))
            {
                if (r > fast_limit)
                {
                    // Skip ahead faster the further off-canvas the sample is
                    f64 rx = 0.0;
                    f64 ry = 0.0;
                    if (dx > canvas.get_width()) rx = dx - canvas.get_width();
                    if (dx < 0.0) rx = -dx;
                    if (dy > canvas.get_height()) ry = dy - canvas.get_height();
                    if (dy < 0.0) ry = -dy;
                    alfa += std::hypot(rx, ry) / r * kPi / 6.0;
                }
                continue;
            }

            const i32 px = static_cast<i32>(dx);
            const i32 py = static_cast<i32>(dy);
            const std::size_t index = static_cast<std::size_t>(py) * static_cast<std::size_t>(canvas.get_width()) + static_cast<std::size_t>(px);
            if (touched[index] != 0)
            {
                continue;
            }

            posr = std::sqrt(posr) / r;
            const f64 depth = pos.z / r;
            const bool off_disk = posr > 0.99 && (posr > 1.0 + 0.5 / r || canvas.get_depth(px, py) == rendering::depth::kBackground);
            if (!off_disk && pos.z <= 0.0)
            {
                continue;
            }

            if (!visible)
            {
                // Ring in the planet shadow
                Rgb shade = background.r < kDarkBackgroundLimit ? rendering::colors::kBlack : background;
                if (saturn && lit && shadow_dist > kRedEdgeInner && shadow_dist < kRedEdgeInner + kRedEdgeWidth)
                {
                    shade = background;
                    shade.r = rendering::clamp_channel(background.r + 32 + static_cast<i32>(128.0 * (shadow_dist - kRedEdgeInner) / kRedEdgeWidth));
                }
                if (canvas.plot(px, py, shade, depth, opacity))
                {
                    touched[index] = 1;
                }
                continue;
            }

            const Rgb dest = canvas.get_pixel(px, py);
            const auto mix = [opacity](u8 src, u8 dst) {
                return static_cast<u8>(std::min(kMaxRingChannel, static_cast<i32>(src * opacity + dst * (1.0 - opacity))));
            };
            if (canvas.plot(px, py, Rgb{mix(ring.r, dest.r), mix(ring.g, dest.g), mix(ring.b, dest.b)}, depth))
            {
                touched[index] = 1;
            }
        }
    }
}

void RingRenderer::draw_outline(Canvas& canvas) const
{
    const auto& g = m_geometry;
    if (g.radius <= 0)
    {
        return;
    }

    const f64 r = g.radius;
    const f64 r2 = r * r;
    const f64 a00 = g.axis_ratio * g.axis_ratio * std::abs(std::sin(m_body.pole_inclination));
    const i32 pole_sign = BodyFrame::sign(g.pole);
    const auto& radii = g.body->ring_radii_km;

    for (u32 i = 0; i < get_ring_count(); ++i)
    {
        const f64 rr1 = radii[i] * r / g.body->equatorial_radius_km;
        const f64 step = std::max(kPi / (rr1 * 4.0), kPi / 50.0);
        const i32 steps = static_cast<i32>(std::ceil(kTwoPi / step));

        bool has_previous = false;
        Vec2d previous{0.0};
        f64 previous_depth = 0.0;

        // The last vertex is alfa = 2 pi again, closing the ellipse
        for (i32 k = 0; k <= steps; ++k)
        {
            const f64 alfa = kTwoPi * k / steps;
            const f64 zpx = rr1 * std::cos(alfa);
            const f64 zpy = rr1 * std::sin(alfa) * a00;
            const f64 rr2 = zpx * zpx + zpy * zpy;
            const bool in_front = pole_sign == BodyFrame::sign(zpy);

            if (!(rr2 > r2 || (rr2 < r2 && in_front)))
            {
                has_previous = false;
                continue;
            }

            const Vec2d screen = Vec2d{g.center.x, g.center.y} + BodyFrame::rotate(Vec2d{zpx, zpy}, -g.up);
            if (!is_inside(screen.x, screen.y))
            {
                has_previous = false;
                continue;
            }

            f64 depth = std::sqrt(std::max(0.0, rr1 * rr1 - rr2)) / r;
            if (!in_front)
            {
                depth = -depth;
            }
            if (has_previous)
            {
                canvas.draw_line(screen.x, screen.y, previous.x, previous.y, rendering::colors::kRingOutline,
                                 depth, previous_depth);
            }
            previous = screen;
            previous_depth = depth;
            has_previous = true;
        }
    }
}

} // namespace planetrender::planet
