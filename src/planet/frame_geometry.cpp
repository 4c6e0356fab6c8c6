/// @file frame_geometry.cpp
/// @brief Disk placement, orientation and the screen <-> planetographic transforms.

#include "planet/frame_geometry.hpp"
#include "astro/body_frame.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace planetrender::planet
{

using astro::BodyFrame;
using astro::Target;
using namespace astro_constants;

namespace
{

bool has_mirrored_longitudes(Target target)
{
    return target == Target::Moon || target == Target::Mercury || target == Target::Earth || target == Target::Venus;
}

f64 jupiter_central_meridian(const astro::BodyEphemeris& body, RotationSystem system)
{
    switch (system)
    {
    case RotationSystem::I:
        return body.central_meridian_i;
    case RotationSystem::II:
        return body.central_meridian_ii;
    case RotationSystem::III:
        return body.central_meridian_iii;
    }
    return body.central_meridian;
}

} // anonymous namespace

FrameGeometry FrameGeometry::compute(const FrameRequest& request, f64 supersample)
{
    const auto& config = request.config;
    const auto& ephem = request.body;

    FrameGeometry g;
    g.target = config.target;
    g.body = &astro::get_body_info(config.target);
    g.supersample = supersample;
    g.width = static_cast<i32>(config.width * supersample + 0.5);
    g.height = static_cast<i32>(config.height * supersample + 0.5);

    const f64 eq = g.body->equatorial_radius_km;
    const f64 pol = g.body->polar_radius_km;

    g.scale = config.width * ephem.angular_radius / config.telescope.field_rad() * supersample;
    g.radius = static_cast<i32>(g.scale);
    g.planet_size = g.scale > 0.0 ? ephem.angular_radius / g.scale : 0.0;

    const Vec2d center = config.get_planet_center();
    g.center = Vec2d{std::trunc(center.x * supersample), std::trunc(center.y * supersample)};

    // Orientation
    g.north = config.north_up ? 0.0 : ephem.parallactic_angle;
    g.pole = BodyFrame::geodetic_to_geocentric(eq, pol, ephem.pole_inclination);
    g.axis = ephem.axis_position_angle;
    g.up = g.axis - g.north;
    g.subsolar_latitude = BodyFrame::geodetic_to_geocentric(eq, pol, ephem.subsolar_latitude);

    g.dlon = -(ephem.subsolar_longitude - ephem.central_meridian);
    if (astro::is_giant_planet(g.target))
    {
        g.dlon = ephem.subsolar_longitude - ephem.central_meridian_iii;
    }
    g.dlat = -(g.subsolar_latitude - g.pole);

    const f64 cos_pole = std::cos(ephem.pole_inclination);
    g.axis_ratio = 1.0 + cos_pole * cos_pole * (pol / eq - 1.0);
    g.oblateness = 1.0 / g.axis_ratio;

    // Texture longitudes
    g.rotation = ephem.central_meridian;
    if (g.target == Target::Jupiter && config.great_red_spot)
    {
        g.rotation = jupiter_central_meridian(ephem, config.great_red_spot->system)
                   + config.great_red_spot->get_texture_offset();
    }

    g.texture_origin = g.rotation - kHalfPi;
    if (g.target == Target::Moon || g.target == Target::Mercury || g.target == Target::Earth)
    {
        g.texture_origin = -g.rotation - kHalfPi;
    }
    if (g.target == Target::Venus)
    {
        // Magellan map calibration
        g.texture_origin = -g.texture_origin - kTwoPi / 3.0;
    }
    g.longitude_sign = has_mirrored_longitudes(g.target) ? -1 : 1;

    // Sub-solar point
    const f64 sun_offset = g.radius * std::abs(std::sin(ephem.phase_angle));
    const f64 sun_angle = -kHalfPi - ephem.bright_limb_angle + g.north;
    g.sun.x = g.center.x + sun_offset * std::cos(sun_angle);
    g.sun.y = g.center.y + sun_offset * std::sin(sun_angle);
    g.sun.z = -g.radius * std::abs(std::cos(ephem.phase_angle));
    if (ephem.phase < 0.5)
    {
        g.sun.z = -g.sun.z;
    }

    // Distance from the visible area
    const f64 screen_radius_x = config.width * supersample * 0.5;
    const f64 screen_radius_y = config.height * supersample * 0.5;
    const f64 screen_radius_max = (screen_radius_x + screen_radius_y) * 0.5;
    const f64 dist_x = std::abs(1.0 - g.center.x / screen_radius_x);
    const f64 dist_y = std::abs(1.0 - g.center.y / screen_radius_y);
    g.dist_center = std::min(dist_x, dist_y);
    if (g.dist_center < 1.0)
    {
        g.dist_center = std::max(dist_x, dist_y);
    }

    g.times_out = 0.0;
    if (g.dist_center > 1.0)
    {
        if (g.radius > 0)
        {
            f64 ratio = screen_radius_x / screen_radius_y;
            if (ratio < 1.0)
            {
                ratio = 1.0 / ratio;
            }
            g.times_out = (g.dist_center - 1.0) * screen_radius_max / g.radius / ratio;
        }
        else
        {
            g.times_out = std::numeric_limits<f64>::infinity();
        }
    }

    const f64 r_out = g.radius / supersample;
    g.planet_visible = !(g.center.x / supersample > config.width + r_out
                         || g.center.y / supersample > config.height + r_out
                         || -r_out > g.center.x || -r_out > g.center.y
                         || ephem.angular_radius > kPi / 4.0);
    g.rings_textures_visible = !(2.0 * r_out > config.width);

    return g;
}

bool FrameGeometry::is_in_screen(f64 x, f64 y, f64 margin) const
{
    return x >= -margin && y >= -margin && x < width + margin && y < height + margin;
}

// -----------------------------------------------------------------
// Planetographic transforms
// -----------------------------------------------------------------

std::optional<Planetographic> FrameGeometry::screen_to_planetographic(f64 x, f64 y) const
{
    if (radius <= 0 || body == nullptr)
    {
        return std::nullopt;
    }

    const f64 dx = x - center.x;
    const f64 dy = center.y - y;
    const f64 d2 = dx * dx + dy * dy;
    const f64 r = radius;
    if (d2 > r * r)
    {
        return std::nullopt;
    }

    const f64 rr = std::sqrt(d2) / r;
    const f64 ang = std::atan2(dy, dx);
    const f64 bx = -rr * std::cos(ang - up);
    const f64 by = -rr * std::sin(ang - up) / axis_ratio;
    const f64 b2 = bx * bx + by * by;
    if (b2 > 1.0)
    {
        return std::nullopt;
    }

    const f64 bz = std::sqrt(1.0 - b2);
    const f64 sinp = std::sin(pole);
    const f64 cosp = std::cos(pole);
    const f64 y2 = by * cosp - bz * sinp;
    const f64 z2 = by * sinp + bz * cosp;

    Planetographic out;
    out.longitude = BodyFrame::normalize_radians(rotation + longitude_sign * std::atan2(bx, z2));
    const f64 planetocentric = std::asin(std::clamp(-y2, -1.0, 1.0));
    out.latitude = BodyFrame::geocentric_to_geodetic(body->equatorial_radius_km, body->polar_radius_km, planetocentric);
    return out;
}

std::optional<Vec2d> FrameGeometry::planetographic_to_screen(const Planetographic& point) const
{
    if (radius <= 0 || body == nullptr)
    {
        return std::nullopt;
    }

    const f64 lat = BodyFrame::geodetic_to_geocentric(body->equatorial_radius_km, body->polar_radius_km, point.latitude);
    const f64 a = longitude_sign * (point.longitude - rotation);

    const f64 bx = std::cos(lat) * std::sin(a);
    const f64 z2 = std::cos(lat) * std::cos(a);
    const f64 y2 = -std::sin(lat);

    const f64 sinp = std::sin(pole);
    const f64 cosp = std::cos(pole);
    const f64 by = y2 * cosp + z2 * sinp;
    const f64 bz = -y2 * sinp + z2 * cosp;
    if (bz < 0.0)
    {
        return std::nullopt;
    }

    const Vec2d offset = BodyFrame::rotate(Vec2d{-bx, -by * axis_ratio}, up) * static_cast<f64>(radius);
    return Vec2d{center.x + offset.x, center.y - offset.y};
}

} // namespace planetrender::planet
