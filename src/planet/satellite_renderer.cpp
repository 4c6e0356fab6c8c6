/// @file satellite_renderer.cpp
/// @brief Satellite placement, markers, texture mapping with eclipse tests and transit shadows.

#include "planet/satellite_renderer.hpp"
#include "planet/illumination.hpp"
#include "planet/sphere_projection.hpp"
#include "astro/body_frame.hpp"
#include "core/logger.hpp"
#include "rendering/glyphs.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace planetrender::planet
{

using astro::BodyFrame;
using rendering::Canvas;
using rendering::Rgb;
using namespace astro_constants;
using namespace satellite_constants;

namespace
{

bool is_finite(const Vec3d& v)
{
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/// Marker size of a faint moon relative to the brightest one [px].
f64 magnitude_size(f64 magnitude, f64 brightest)
{
    return std::pow(10.0, (brightest + 1.0 - std::max(magnitude, 1.0)) / 2.5);
}

} // anonymous namespace

// -----------------------------------------------------------------
// SatelliteOrderCache
// -----------------------------------------------------------------

const std::vector<std::size_t>& SatelliteOrderCache::get_order(const astro::MoonEphemerides& moons)
{
    if (m_order.size() != moons.size())
    {
        m_order.resize(moons.size());
        std::iota(m_order.begin(), m_order.end(), std::size_t{0});
        std::stable_sort(m_order.begin(), m_order.end(), [&moons](std::size_t a, std::size_t b) {
            return moons[a].distance > moons[b].distance;
        });
        PLR_CORE_DEBUG("Satellite order rebuilt for {} moons", moons.size());
    }
    return m_order;
}

// -----------------------------------------------------------------
// SatelliteRenderer
// -----------------------------------------------------------------

SatelliteRenderer::SatelliteRenderer(const FrameGeometry& geometry, const FrameRequest& request,
                                     rendering::TextureRepository& textures, std::span<const std::size_t> order)
    : m_geometry{geometry}
    , m_config{request.config}
    , m_body{request.body}
    , m_moons{request.moons}
    , m_textures{textures}
    , m_order{order}
{
    m_sun_size = std::atan2(kSunRadiusKm, m_body.distance_from_sun * kAuKm);
    m_brightest = get_brightest_magnitude(m_moons);
}

f64 SatelliteRenderer::get_brightest_magnitude(const astro::MoonEphemerides& moons)
{
    if (moons.empty())
    {
        return 0.0;
    }
    return std::min_element(moons.begin(), moons.end(), [](const auto& a, const auto& b) {
        return a.magnitude < b.magnitude;
    })->magnitude;
}

Vec2d SatelliteRenderer::get_screen_offset(const astro::MoonEphemeris& moon) const
{
    const auto& g = m_geometry;
    if (moon.sky_offset)
    {
        if (g.planet_size <= 0.0)
        {
            return Vec2d{0.0};
        }
        const Vec2d d = BodyFrame::rotate(*moon.sky_offset, -g.north) / g.planet_size;
        return Vec2d{d.x, -d.y};
    }

    const Vec2d d = BodyFrame::rotate(Vec2d{moon.position.x, moon.position.y}, g.up) * g.scale;
    return Vec2d{d.x, -d.y};
}

f64 SatelliteRenderer::get_depth(const astro::MoonEphemeris& moon) const
{
    const f64 depth = (m_body.distance - moon.distance) * kAuKm / m_geometry.body->equatorial_radius_km;
    return std::isnan(depth) ? 0.0 : depth;
}

bool SatelliteRenderer::is_visible(const Vec2d& position, f64 size) const
{
    const i32 px = static_cast<i32>(position.x + 0.5);
    const i32 py = static_cast<i32>(position.y + 0.5);
    const i32 s = static_cast<i32>(size);
    return px >= -s && px < m_geometry.width + s && py >= -s && py < m_geometry.height + s;
}

// -----------------------------------------------------------------
// Moons
// -----------------------------------------------------------------

std::vector<SatellitePick> SatelliteRenderer::draw(Canvas& canvas) const
{
    std::vector<SatellitePick> picks;
    const auto& g = m_geometry;
    if (!m_config.satellites || !astro::has_satellites(g.target) || m_moons.empty())
    {
        return picks;
    }

    for (std::size_t k = 0; k < m_order.size(); ++k)
    {
        const std::size_t index = m_order[k];
        if (index >= m_moons.size())
        {
            continue;
        }

        const auto& moon = m_moons[index];
        if (!is_finite(moon.position) || !std::isfinite(moon.angular_radius) || moon.angular_radius < 0.0)
        {
            throw std::invalid_argument(fmt::format("invalid ephemeris for satellite '{}'", moon.name));
        }

        const Vec2d offset = get_screen_offset(moon);
        const Vec2d position = g.center + Vec2d{std::trunc(offset.x + 0.5), std::trunc(offset.y + 0.5)};
        const f64 radius = g.planet_size > 0.0 ? moon.angular_radius / g.planet_size : 0.0;
        const f64 depth = get_depth(moon);

        bool visible = is_visible(position, radius);
        if ((moon.eclipsed || moon.occulted) && (!m_config.sky_mode || m_config.textures))
        {
            visible = false;
        }

        if (visible)
        {
            picks.push_back(SatellitePick{index, moon.name, position, radius, depth, moon.distance});
            draw_marker(canvas, moon, index, position, radius, depth);
        }

        if (!m_config.textures || radius <= kMinTexturedRadius)
        {
            continue;
        }

        if (!visible)
        {
            if (moon.eclipsed && !moon.occulted)
            {
                canvas.fill_circle(position.x, position.y, radius + 0.5, rendering::colors::kBlack, depth);
            }
            continue;
        }

        draw_textured(canvas, moon, k, position, radius, depth);
    }

    PLR_CORE_TRACE("Satellites: {} of {} drawn", picks.size(), m_moons.size());
    return picks;
}

void SatelliteRenderer::draw_marker(Canvas& canvas, const astro::MoonEphemeris& moon, std::size_t index,
                                    const Vec2d& position, f64 radius, f64 depth) const
{
    Rgb color = m_config.foreground;
    f64 alpha = m_config.sky_mode ? kSkyMarkerAlpha : 1.0;
    if (moon.phase < 0.5 && moon.elongation - m_sun_size < moon.angular_radius)
    {
        // New moon against the solar glare
        color = m_config.background;
        alpha = 1.0;
    }

    const auto in_screen = [this](const Vec2d& p, f64 margin) {
        return p.x > margin && p.x < m_geometry.width - 1.0 - margin && p.y > margin && p.y < m_geometry.height - 1.0 - margin;
    };

    f64 size = radius;
    if (m_config.textures && !m_config.sky_mode && radius <= kMinTexturedRadius)
    {
        const f64 size2 = magnitude_size(moon.magnitude, m_brightest);
        if (in_screen(position, std::trunc(size2 + 1.0)))
        {
            canvas.fill_circle(position.x, position.y, size2 + 0.5, color, depth, alpha);
        }
    }

    if (m_config.sky_mode && moon.magnitude > 0.0 && size <= kMinTexturedRadius)
    {
        size = std::min(kMinTexturedRadius, magnitude_size(moon.magnitude, m_brightest));
        if (size < kMainMoonMinSize && index < m_geometry.body->main_moon_count)
        {
            size = kMainMoonMinSize;
        }
    }

    if (!m_config.textures || radius <= kMinTexturedRadius)
    {
        const f64 extent = std::trunc(1.5 * size + 1.0);
        canvas.fill_circle(position.x - size + extent / 2.0, position.y - size + extent / 2.0, extent / 2.0,
                           color, depth, alpha);
    }
}

bool SatelliteRenderer::is_eclipsed_sample(const astro::MoonEphemeris& moon, std::size_t order_index, Vec3d sample) const
{
    const auto& g = m_geometry;
    const f64 flattening = g.body->equatorial_radius_km / g.body->polar_radius_km;

    // Planet shadow, with the sample seen from the sun
    const Vec3d p = BodyFrame::rotate_from_equator(sample, g.dlon, -g.dlat);
    if (p.z > 0.0 && p.x * p.x + p.y * p.y * flattening * flattening <= 1.0)
    {
        return true;
    }

    if (!moon.mutual_phenomena || g.planet_size <= 0.0)
    {
        return false;
    }

    for (std::size_t k = 0; k < m_order.size(); ++k)
    {
        if (k == order_index || m_order[k] >= m_moons.size())
        {
            continue;
        }
        const auto& other = m_moons[m_order[k]];
        if (p.z > other.position_from_sun.z)
        {
            const f64 d = std::hypot(other.position_from_sun.x - p.x, other.position_from_sun.y - p.y) * g.scale;
            if (d < other.angular_radius / g.planet_size)
            {
                return true;
            }
        }
    }
    return false;
}

void SatelliteRenderer::draw_textured(Canvas& canvas, const astro::MoonEphemeris& moon, std::size_t order_index,
                                      const Vec2d& position, f64 radius, f64 depth) const
{
    const auto& g = m_geometry;
    const rendering::Image* texture = m_textures.find(moon.name);
    if (texture == nullptr || texture->empty())
    {
        canvas.fill_circle(position.x, position.y, radius + 0.5, m_config.foreground, depth);
        return;
    }

    const f64 north = m_config.north_up ? 0.0 : (m_config.sky_mode ? g.north : moon.parallactic_angle);

    SphereProjection projection;
    projection.center = position;
    projection.radius = radius;
    projection.up = moon.axis_position_angle - north;
    projection.pole = moon.pole_inclination;
    projection.texture_origin = moon.central_meridian - kHalfPi;
    projection.texture_width = texture->get_width();
    projection.texture_height = texture->get_height();

    const f64 sun_offset = radius * std::abs(std::sin(moon.phase_angle));
    const f64 sun_angle = -kHalfPi - moon.bright_limb_angle + north;
    Vec3d sun{position.x + sun_offset * std::cos(sun_angle), position.y + sun_offset * std::sin(sun_angle),
              -radius * std::abs(std::cos(moon.phase_angle))};
    if (moon.phase < 0.5)
    {
        sun.z = -sun.z;
    }

    const Illumination illumination(ShadingModel::for_satellite(m_config.illumination, m_config.earthshine,
                                                                canvas.get_background()),
                                    sun, radius);

    const auto on_texel = [&](i32 x, i32 y, const Texel& texel) {
        const Rgb color = illumination.shade(texture->get(texel.column, texel.row), x, y, texel.dz0, nullptr);
        canvas.plot(x, y, color, depth + texel.dz0 / g.scale);
    };

    const auto intercept = [&](i32 x, i32 y, const Texel& texel) {
        const Vec2d offset = BodyFrame::rotate(Vec2d{x - position.x, position.y - y}, -g.up) / g.scale;
        if (!is_eclipsed_sample(moon, order_index, moon.position + Vec3d{offset.x, offset.y, 0.0}))
        {
            return false;
        }
        canvas.plot(x, y, rendering::colors::kBlack, depth + texel.dz0 / g.scale);
        return true;
    };

    projection.rasterize(canvas.get_width(), canvas.get_height(), !moon.mutual_phenomena, on_texel, intercept);
}

void SatelliteRenderer::draw_labels(Canvas& canvas, const std::vector<SatellitePick>& picks) const
{
    const f64 baseline = (rendering::glyphs::kHeight + 3) * m_geometry.supersample;
    for (const auto& pick : picks)
    {
        canvas.draw_text(pick.position.x, pick.position.y + kLabelOffsetRadii * pick.radius + baseline,
                         pick.name, m_config.foreground);
    }
}

// -----------------------------------------------------------------
// Transit shadows
// -----------------------------------------------------------------

void SatelliteRenderer::draw_shadows(Canvas& canvas) const
{
    const auto& g = m_geometry;
    if (!m_config.satellites || !m_config.textures || !astro::has_satellites(g.target) || g.scale <= kMinShadowScale)
    {
        return;
    }

    std::vector<u8> touched;
    for (const std::size_t index : m_order)
    {
        if (index < m_moons.size() && m_moons[index].shadow_transiting)
        {
            touched.assign(static_cast<std::size_t>(canvas.get_width()) * static_cast<std::size_t>(canvas.get_height()), 0);
            draw_shadow(canvas, m_moons[index], touched);
        }
    }
}

void SatelliteRenderer::draw_shadow(Canvas& canvas, const astro::MoonEphemeris& moon, std::vector<u8>& touched) const
{
    const auto& g = m_geometry;
    const f64 eq = g.body->equatorial_radius_km;
    const f64 radius = g.planet_size > 0.0 ? moon.angular_radius / g.planet_size : 0.0;
    if (moon.eclipsed || moon.occulted || moon.radius_km <= 0.0 || radius <= 0.0)
    {
        return;
    }

    const f64 planet_distance = glm::length(moon.position) * eq - eq;
    if (planet_distance <= 0.0)
    {
        return;
    }
    if (std::atan2(moon.radius_km, planet_distance) < m_sun_size)
    {
        // Antumbra only: too far from the planet to darken it visibly
        return;
    }

    const f64 cone_length = moon.radius_km / std::tan(m_sun_size);
    const f64 rr = g.scale * moon.radius_km / eq;
    const f64 umbra = rr * (1.0 - 0.5 * planet_distance / cone_length);
    const f64 penumbra = 2.0 * (rr - umbra);

    const Vec2d centre = BodyFrame::rotate(Vec2d{moon.position_from_sun.x, -moon.position_from_sun.y}, -g.up) * g.scale;
    if (!is_visible(g.center + centre, umbra))
    {
        return;
    }

    const f64 sampling = std::trunc(umbra + penumbra);
    if (sampling <= 0.0)
    {
        return;
    }
    const f64 sampling2 = sampling * sampling / (g.scale * g.scale);
    const Vec2d centre_axis = BodyFrame::rotate(centre, g.up);
    const f64 falloff = std::max(sampling - umbra, 1e-9);

    const auto shade = [&](bool first, f64 sx, f64 sy) {
        const Vec2d d = (BodyFrame::rotate(Vec2d{sx, sy}, g.up) - centre_axis) / g.scale;
        f64 sdr = d.x * d.x + d.y * d.y;
        if (sdr > sampling2)
        {
            return;
        }
        sdr = first ? sampling : std::sqrt(sdr) * g.scale;

        // Point of the shadow plane dropped onto the planet surface as seen from the sun
        const f64 x = moon.position_from_sun.x + d.x;
        const f64 y = -moon.position_from_sun.y + d.y;
        const f64 r2 = x * x + y * y;
        if (r2 > 1.0)
        {
            return;
        }
        const Vec3d p = BodyFrame::rotate_from_equator(Vec3d{x, y, std::sqrt(1.0 - r2)}, g.dlon, g.dlat);
        if (p.z < 0.0)
        {
            return;
        }

        const Vec2d s = BodyFrame::rotate(Vec2d{p.x, p.y}, -g.up) * g.scale;
        const i32 px = static_cast<i32>(g.center.x + s.x + 0.5);
        const i32 py = static_cast<i32>(g.center.y + s.y + 0.5);
        if (!(px > 0 && px < g.width - 1 && py > 0 && py < g.height - 1))
        {
            return;
        }

        const std::size_t pixel = static_cast<std::size_t>(py) * static_cast<std::size_t>(canvas.get_width()) + static_cast<std::size_t>(px);
        if (touched[pixel] != 0)
        {
            return;
        }

        // Only the planet surface receives the shadow, not rings or moons in front of it
        const f64 stored = canvas.get_depth(px, py);
        const f64 surface = std::sqrt(std::max(0.0, 1.0 - (s.x * s.x + s.y * s.y) / (g.scale * g.scale)));
        if (stored == rendering::depth::kBackground || stored > surface + kSurfaceDepthTolerance)
        {
            return;
        }
        touched[pixel] = 1;

        const f64 intensity = std::max(0.0, kUmbraIntensity + (1.0 - kUmbraIntensity) * (sdr - umbra) / falloff);
        if (intensity < 1.0)
        {
            canvas.set_color(px, py, rendering::scaled(canvas.get_pixel(px, py), intensity));
        }
    };

    for (f64 i = -sampling; i <= sampling; i += kShadowStep)
    {
        const f64 sx = centre.x + i;
        bool first = true;
        for (f64 j = -sampling; j <= 0.0; j += kShadowStep)
        {
            shade(first, sx, centre.y + j);
            first = false;
        }
        first = true;
        for (f64 j = sampling; j > 0.0; j -= kShadowStep)
        {
            shade(first, sx, centre.y + j);
            first = false;
        }
    }
}

} // namespace planetrender::planet
