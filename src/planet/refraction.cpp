/// @file refraction.cpp
/// @brief Rotate to the local vertical, stretch the sampling, rotate back.

#include "planet/refraction.hpp"
#include "astro/body_frame.hpp"

#include <cmath>

namespace planetrender::planet
{

using rendering::FrameSnapshot;

bool Refraction::is_visible(f64 scale, f64 upper_limb_factor)
{
    return static_cast<i32>(scale * (1.0 - upper_limb_factor) + 0.5) > 1;
}

FrameSnapshot Refraction::apply(const FrameSnapshot& frame, Vec2d center, f64 upper_limb_factor, f64 zenith_angle,
                                rendering::Rgb background)
{
    const i32 width = frame.color.get_width();
    const i32 height = frame.color.get_height();

    FrameSnapshot out;
    out.color = rendering::Image(width, height, background);
    out.depth.assign(frame.depth.size(), rendering::depth::kBackground);
    if (!(upper_limb_factor > 0.0) || frame.depth.size() != static_cast<std::size_t>(width) * static_cast<std::size_t>(height))
    {
        return frame;
    }

    const f64 stretch = 1.0 / upper_limb_factor;
    for (i32 y = 0; y < height; ++y)
    {
        for (i32 x = 0; x < width; ++x)
        {
            // Inverse map: the output pixel samples the source point whose
            // vertical distance from the centre is 1/f times larger
            Vec2d v = astro::BodyFrame::rotate(Vec2d{x - center.x, y - center.y}, zenith_angle);
            v.y *= stretch;
            v = astro::BodyFrame::rotate(v, -zenith_angle);

            const i32 sx = static_cast<i32>(std::floor(center.x + v.x + 0.5));
            const i32 sy = static_cast<i32>(std::floor(center.y + v.y + 0.5));
            if (!frame.color.contains(sx, sy))
            {
                continue;
            }
            out.color.set(x, y, frame.color.get(sx, sy));
            out.depth[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)] =
                frame.depth[static_cast<std::size_t>(sy) * static_cast<std::size_t>(width) + static_cast<std::size_t>(sx)];
        }
    }
    return out;
}

} // namespace planetrender::planet
