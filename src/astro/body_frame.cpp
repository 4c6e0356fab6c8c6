/// @file body_frame.cpp
/// @brief Implementation of body-frame rotations.

#include "astro/body_frame.hpp"

#include <cmath>

namespace planetrender::astro
{

Vec3d BodyFrame::rotate_from_equator(const Vec3d& p, f64 dlon, f64 dlat)
{
    Vec3d out = p;

    // About the polar axis
    f64 radius = std::hypot(out.x, out.z);
    f64 angle = std::atan2(out.z, out.x) + dlon;
    out.x = radius * std::cos(angle);
    out.z = radius * std::sin(angle);

    // Tilt towards the viewer
    radius = std::hypot(out.y, out.z);
    angle = std::atan2(out.y, out.z) + dlat;
    out.z = radius * std::cos(angle);
    out.y = radius * std::sin(angle);

    return out;
}

Vec3d BodyFrame::rotate_to_equator(const Vec3d& p, f64 dlon, f64 dlat)
{
    Vec3d out = p;

    f64 radius = std::hypot(out.y, out.z);
    f64 angle = std::atan2(out.y, out.z) - dlat;
    out.z = radius * std::cos(angle);
    out.y = radius * std::sin(angle);

    radius = std::hypot(out.x, out.z);
    angle = std::atan2(out.z, out.x) - dlon;
    out.x = radius * std::cos(angle);
    out.z = radius * std::sin(angle);

    return out;
}

Vec2d BodyFrame::rotate(const Vec2d& v, f64 angle)
{
    const f64 c = std::cos(angle);
    const f64 s = std::sin(angle);
    return {v.x * c - v.y * s, v.x * s + v.y * c};
}

f64 BodyFrame::geodetic_to_geocentric(f64 equatorial_radius, f64 polar_radius, f64 latitude)
{
    if (equatorial_radius <= 0.0 || std::abs(std::abs(latitude) - astro_constants::kHalfPi) < 1e-12)
    {
        return latitude;
    }
    const f64 ratio = polar_radius / equatorial_radius;
    return std::atan(ratio * ratio * std::tan(latitude));
}

f64 BodyFrame::geocentric_to_geodetic(f64 equatorial_radius, f64 polar_radius, f64 latitude)
{
    if (polar_radius <= 0.0 || std::abs(std::abs(latitude) - astro_constants::kHalfPi) < 1e-12)
    {
        return latitude;
    }
    const f64 ratio = equatorial_radius / polar_radius;
    return std::atan(ratio * ratio * std::tan(latitude));
}

f64 BodyFrame::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

i32 BodyFrame::sign(f64 value)
{
    return (value > 0.0) - (value < 0.0);
}

} // namespace planetrender::astro
