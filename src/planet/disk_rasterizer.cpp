/// @file disk_rasterizer.cpp
/// @brief Disk texture mapping, shading, grid and flat fallbacks.

#include "planet/disk_rasterizer.hpp"
#include "planet/illumination.hpp"
#include "planet/sphere_projection.hpp"
#include "astro/body_frame.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <optional>

namespace planetrender::planet
{

using astro::BodyFrame;
using astro::Target;
using rendering::Canvas;
using rendering::Image;
using rendering::Rgb;
using namespace astro_constants;

namespace
{

bool has_mirrored_grid(Target target)
{
    return target == Target::Moon || target == Target::Sun || target == Target::Mercury
        || target == Target::Venus || target == Target::Earth;
}

f64 angular_distance(f64 lon1, f64 lat1, f64 lon2, f64 lat2)
{
    const f64 c = std::sin(lat1) * std::sin(lat2) + std::cos(lat1) * std::cos(lat2) * std::cos(lon1 - lon2);
    return std::acos(std::clamp(c, -1.0, 1.0));
}

f64 sphere_depth(f64 r2, f64 e2, f64 r)
{
    return std::sqrt(std::max(0.0, r2 - e2)) / r;
}

} // anonymous namespace

DiskRasterizer::DiskRasterizer(const FrameGeometry& geometry, const RenderConfig& config,
                               rendering::TextureRepository& textures)
    : m_geometry{geometry}
    , m_config{config}
    , m_textures{textures}
{
}

std::string DiskRasterizer::get_texture_name() const
{
    if (m_geometry.target == Target::Earth && !m_config.earth_texture.empty())
    {
        return m_config.earth_texture;
    }
    return std::string(astro::to_string(m_geometry.target));
}

// -----------------------------------------------------------------
// Textured disk
// -----------------------------------------------------------------

bool DiskRasterizer::draw_textured(Canvas& canvas) const
{
    const auto& g = m_geometry;
    const Image* texture = m_textures.find(get_texture_name());
    if (texture == nullptr || texture->empty())
    {
        return false;
    }

    std::optional<Image> night;
    if (g.target == Target::Earth && m_config.illumination)
    {
        if (const Image* lights = m_textures.find("Earth_night"))
        {
            if (lights->get_width() == texture->get_width() && lights->get_height() == texture->get_height())
            {
                night = *lights;
            }
            else
            {
                night = lights->resized(texture->get_width(), texture->get_height());
            }
        }
    }

    SphereProjection projection;
    projection.center = g.center;
    projection.radius = g.radius;
    projection.up = g.up;
    projection.axis_ratio = g.axis_ratio;
    projection.pole = g.pole;
    projection.texture_origin = g.texture_origin;
    projection.texture_width = texture->get_width();
    projection.texture_height = texture->get_height();
    projection.flip_horizontal = m_config.telescope.invert_horizontal;
    projection.flip_vertical = m_config.telescope.invert_vertical;

    const auto model = ShadingModel::for_target(g.target, m_config.illumination, m_config.earthshine,
                                                m_config.earth_texture.empty(), canvas.get_background());
    const Illumination illumination(model, g.sun, g.radius);
    const bool saturn = g.target == Target::Saturn;

    PLR_CORE_TRACE("Disk: {} r={} px, texture {}x{}", astro::to_string(g.target), g.radius,
                   texture->get_width(), texture->get_height());

    projection.rasterize(canvas.get_width(), canvas.get_height(), true, [&](i32 x, i32 y, const Texel& texel) {
        Rgb color = texture->get(texel.column, texel.row);
        if (saturn && texel.body_r2 > kSaturnLimbStart)
        {
            const f64 boost = (255.0 - color.b) * (texel.body_r2 - kSaturnLimbStart) / (1.0 - kSaturnLimbStart);
            color.b = rendering::clamp_channel(color.b + static_cast<i32>(boost));
        }

        Rgb lights;
        const Rgb* night_texel = nullptr;
        if (night)
        {
            lights = night->get(texel.column, texel.row);
            night_texel = &lights;
        }

        canvas.set_pixel(x, y, illumination.shade(color, x, y, texel.dz0, night_texel), g.surface_depth(texel.dz0));
    });

    return true;
}

// -----------------------------------------------------------------
// Fallbacks
// -----------------------------------------------------------------

void DiskRasterizer::draw_fallback(Canvas& canvas) const
{
    if (m_geometry.scale > kGridMinRadius)
    {
        draw_grid(canvas);
    }
    else
    {
        draw_disk(canvas);
    }
}

void DiskRasterizer::draw_disk(Canvas& canvas) const
{
    const auto& g = m_geometry;
    const i32 r = std::max(g.radius, 1);
    const Rgb color = g.target == Target::Sun ? rendering::colors::kSunOrange : m_config.foreground;
    const f64 r2 = (r + 0.5) * (r + 0.5);
    const f64 scale = std::max(g.scale, 1.0);

    for (i32 y = static_cast<i32>(g.center.y) - r; y <= static_cast<i32>(g.center.y) + r; ++y)
    {
        for (i32 x = static_cast<i32>(g.center.x) - r; x <= static_cast<i32>(g.center.x) + r; ++x)
        {
            const f64 dx = x - g.center.x;
            const f64 dy = y - g.center.y;
            const f64 d2 = dx * dx + dy * dy;
            if (d2 <= r2)
            {
                canvas.plot(x, y, color, std::sqrt(std::max(0.0, r2 - d2)) / scale);
            }
        }
    }
}

void DiskRasterizer::draw_grid(Canvas& canvas) const
{
    const auto& g = m_geometry;
    const Rgb color = m_config.foreground;
    const f64 scale = g.scale;
    const f64 r = std::max(g.radius, 1);
    const f64 r2 = r * r;
    const bool mirrored = has_mirrored_grid(g.target);

    // Longitude origin
    const f64 x1 = std::cos(g.rotation) * std::cos(g.pole);
    const f64 y1 = std::sin(g.rotation) * std::cos(g.pole);
    const f64 z1 = std::sin(g.pole);
    const f64 chord2 = (x1 - 1.0) * (x1 - 1.0) + y1 * y1 + z1 * z1;
    const f64 origin = BodyFrame::normalize_radians(std::acos(std::clamp(1.0 - chord2 / 2.0, -1.0, 1.0)));

    if (g.radius > kGridMinRadius && (origin < kHalfPi || origin > kPi * 1.5))
    {
        const f64 dz = scale * std::cos(origin);
        f64 dx = -dz * std::tan(-g.rotation) / std::cos(g.pole);
        const f64 dy = dz * std::tan(g.pole) * g.axis_ratio;
        if (mirrored)
        {
            dx = -dx;
        }

        const f64 d2 = dx * dx + dy * dy;
        if (d2 < scale * scale)
        {
            // y grows downwards here, so a rotation by -up
            const Vec2d mark = BodyFrame::rotate(Vec2d{dx, dy}, -g.up);
            canvas.draw_circle(g.center.x + mark.x, g.center.y + mark.y, 3.0, color, sphere_depth(1.0, d2 / (scale * scale), 1.0));
        }
    }

    // Meridians and parallels
    const f64 less_lines = scale < 80.0 ? 2.0 : 1.0;
    const f64 delta = less_lines * 5.0 * kDegToRad;
    const f64 b0 = -g.pole;
    f64 a0 = -(g.rotation / (2.0 * delta) - std::trunc(g.rotation / (2.0 * delta))) * 2.0 * delta;
    if (mirrored)
    {
        a0 = -a0;
    }

    const f64 ref_lon = kHalfPi - a0;
    const f64 ref_lat = -b0;
    const f64 b_step = less_lines * kPi / 36.0;
    const f64 min_meridian_b = kPi / 32.0;

    std::array<f64, 40> previous_x{};
    std::array<f64, 40> previous_y{};

    f64 a = -2.0 * delta;
    do
    {
        a += delta;
        previous_x[1] = 0.0;
        previous_y[1] = scale * std::cos(b0);

        f64 b = -b_step;
        std::size_t nn = 0;
        bool started = false;
        bool parallel = true;
        const bool meridian = std::lround(a / delta) % 2 == 0;

        do
        {
            b += b_step;

            const f64 u = angular_distance(a, kHalfPi - b, ref_lon, ref_lat);
            f64 q = scale * std::cos(a + a0) * std::sin(b);
            f64 w = scale * (std::cos(b) * std::cos(b0) + std::sin(b) * std::sin(b0) * std::sin(a + a0)) * g.axis_ratio;
            const f64 e = std::hypot(q, w);
            const f64 t = std::atan2(w, q);
            q = e * std::cos(t + g.up);
            w = e * std::sin(t + g.up);

            if (u <= kHalfPi && b >= 0.0 && nn + 1 < previous_x.size())
            {
                const f64 z = sphere_depth(r2, e * e, r);

                if (started && nn > 0 && b > min_meridian_b && meridian)
                {
                    const f64 prev_z = sphere_depth(r2, previous_x[nn] * previous_x[nn] + previous_y[nn] * previous_y[nn], r);
                    canvas.draw_line(g.center.x + q, g.center.y - w,
                                     g.center.x + previous_x[nn], g.center.y - previous_y[nn], color, z, prev_z);

                    f64 longitude = a + a0 + g.rotation - kHalfPi;
                    if (mirrored)
                    {
                        longitude = -a - a0 + g.rotation + kHalfPi;
                    }
                    i32 deg = static_cast<i32>(BodyFrame::normalize_radians((longitude * kRadToDeg + 1.0) * kDegToRad) * kRadToDeg);
                    deg = 10 * (deg / 10);
                    if (m_config.show_labels && std::abs(b - kHalfPi) < b_step * 0.5 && deg % 20 == 0
                        && g.radius > kGridLabelMinRadius)
                    {
                        canvas.draw_text(g.center.x + std::trunc(q), g.center.y - std::trunc(w),
                                         fmt::format("{}\xC2\xB0", deg), color);
                    }
                }

                if (a > 0.0 && nn > 1 && started && parallel)
                {
                    const f64 prev_z = sphere_depth(r2, previous_x[nn + 1] * previous_x[nn + 1] + previous_y[nn + 1] * previous_y[nn + 1], r);
                    canvas.draw_line(g.center.x + q, g.center.y - w,
                                     g.center.x + previous_x[nn + 1], g.center.y - previous_y[nn + 1], color, z, prev_z);
                }
                started = true;
            }

            ++nn;
            if (nn < previous_x.size())
            {
                previous_x[nn] = q;
                previous_y[nn] = w;
            }
            parallel = !parallel;
        } while (b <= kPi * 0.92);
    } while (a <= kTwoPi);
}

} // namespace planetrender::planet
