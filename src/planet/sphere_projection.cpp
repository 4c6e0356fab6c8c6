/// @file sphere_projection.cpp
/// @brief Pixel to texel mapping of an orthographically projected sphere.

#include "planet/sphere_projection.hpp"
#include "astro/body_frame.hpp"

namespace planetrender::planet
{

using namespace astro_constants;

std::optional<Texel> SphereProjection::sample(i32 x, i32 y) const
{
    const f64 dx = x - center.x;
    const f64 dy = center.y - y;
    const f64 d2 = dx * dx + dy * dy;
    const f64 r2 = radius * radius;
    if (d2 > r2 || radius <= 0.0)
    {
        return std::nullopt;
    }

    const f64 rr = std::sqrt(d2) / radius;
    const f64 ang = std::atan2(dy, dx);
    const f64 bx = -rr * std::cos(ang - up);
    f64 by = -rr * std::sin(ang - up) / axis_ratio;
    const f64 b2 = bx * bx + by * by;
    if (b2 > 1.0)
    {
        return std::nullopt;
    }

    // Tilt by the sub-observer latitude
    f64 bz = std::sqrt(1.0 - b2);
    const f64 sinp = std::sin(pole);
    const f64 cosp = std::cos(pole);
    const f64 tilted_z = by * sinp + bz * cosp;
    by = by * cosp - bz * sinp;
    bz = tilted_z;

    f64 lon = astro::BodyFrame::normalize_radians(kHalfPi - texture_origin) - std::atan2(bx, bz);
    if (lon < 0.0)
    {
        lon += kTwoPi;
    }
    const f64 lat = std::asin(-by / std::sqrt(bx * bx + by * by + bz * bz));

    Texel texel;
    texel.row = static_cast<i32>(0.5 + (kHalfPi - lat) * (texture_height - 1.0) / kPi);
    texel.column = static_cast<i32>(0.5 + lon * texture_width / kTwoPi);
    if (texel.column >= texture_width)
    {
        texel.column -= texture_width;
    }
    if (flip_horizontal)
    {
        texel.column = texture_width - 1 - texel.column;
    }
    if (flip_vertical)
    {
        texel.row = texture_height - 1 - texel.row;
    }
    texel.dz0 = std::sqrt(r2 - d2);
    texel.body_r2 = b2;
    return texel;
}

Texel SphereProjection::midpoint(const Texel& previous, const Texel& current) const
{
    Texel out;
    out.column = (previous.column + current.column) / 2;
    if (std::abs(previous.column - current.column) > texture_width / 10)
    {
        out.column += texture_width / 2;
        if (out.column >= texture_width)
        {
            out.column -= texture_width;
        }
    }
    out.row = (previous.row + current.row) / 2;
    out.dz0 = (previous.dz0 + current.dz0) / 2.0;
    out.body_r2 = current.body_r2;
    return out;
}

} // namespace planetrender::planet
