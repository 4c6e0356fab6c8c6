/// @file stereo.cpp
/// @brief Eye view derivation and anaglyph packing.

#include "planet/stereo.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace planetrender::planet
{

using namespace stereo_constants;
using rendering::Image;
using rendering::Rgb;

namespace
{

f64 project_channel(const std::array<f64, 9>& m, std::size_t row, Rgb c)
{
    const f64 value = m[row] * c.r + m[row + 3] * c.g + m[row + 6] * c.b;
    return std::clamp(value, 0.0, 255.0);
}

void splat(Image& eye, std::vector<f64>& eye_depth, i32 x, i32 y, Rgb color, f64 depth)
{
    if (!eye.contains(x, y))
    {
        return;
    }
    const std::size_t k = static_cast<std::size_t>(y) * static_cast<std::size_t>(eye.get_width()) + static_cast<std::size_t>(x);
    if (depth < eye_depth[k])
    {
        return;
    }
    eye_depth[k] = depth;
    eye.set(x, y, color);
}

} // anonymous namespace

f64 Stereo::get_disparity(f64 depth, f64 scale, f64 eye_separation)
{
    if (depth == rendering::depth::kBackground || depth == rendering::depth::kOverlay || !std::isfinite(depth))
    {
        return 0.0;
    }
    const f64 z = std::clamp(depth * scale, -kStereoReferenceDepth, kStereoReferenceDepth);
    return z * eye_separation * 0.5;
}

StereoPair Stereo::derive(const rendering::FrameSnapshot& frame, f64 scale, f64 eye_separation)
{
    const i32 width = frame.color.get_width();
    const i32 height = frame.color.get_height();

    StereoPair pair{frame.color, frame.color};
    if (frame.depth.size() != static_cast<std::size_t>(width) * static_cast<std::size_t>(height))
    {
        PLR_CORE_WARN("Stereo: depth buffer does not match the {}x{} frame, eyes left identical", width, height);
        return pair;
    }

    std::vector<f64> left_depth(frame.depth.size(), std::numeric_limits<f64>::lowest());
    std::vector<f64> right_depth(frame.depth.size(), std::numeric_limits<f64>::lowest());

    for (i32 y = 0; y < height; ++y)
    {
        for (i32 x = 0; x < width; ++x)
        {
            const std::size_t k = static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x);
            const f64 depth = frame.depth[k];
            if (depth == rendering::depth::kBackground)
            {
                continue;
            }
            const f64 shift = get_disparity(depth, scale, eye_separation);
            const Rgb color = frame.color.get(x, y);
            splat(pair.left, left_depth, static_cast<i32>(std::floor(x + shift + 0.5)), y, color, depth);
            splat(pair.right, right_depth, static_cast<i32>(std::floor(x - shift + 0.5)), y, color, depth);
        }
    }
    return pair;
}

Rgb Stereo::combine_dubois(Rgb left, Rgb right)
{
    const auto channel = [&](std::size_t row) {
        const f64 sum = project_channel(kDuboisLeft, row, left) + project_channel(kDuboisRight, row, right);
        return rendering::clamp_channel(static_cast<i32>(0.5 + sum));
    };
    return Rgb{channel(0), channel(1), channel(2)};
}

Image Stereo::pack(const StereoPair& pair, AnaglyphMode mode)
{
    const i32 width = pair.left.get_width();
    const i32 height = pair.left.get_height();

    switch (mode)
    {
    case AnaglyphMode::None:
        return pair.left;

    case AnaglyphMode::LeftRight:
    {
        Image out(width * 2, height);
        for (i32 y = 0; y < height; ++y)
        {
            for (i32 x = 0; x < width; ++x)
            {
                out.set(x, y, pair.left.get(x, y));
                out.set(x + width, y, pair.right.get(x, y));
            }
        }
        return out;
    }

    case AnaglyphMode::LeftRightHalfWidth:
    {
        const i32 half = std::max(1, width / 2);
        const Image left = pair.left.resized(half, height);
        const Image right = pair.right.resized(half, height);
        Image out(width, height);
        for (i32 y = 0; y < height; ++y)
        {
            for (i32 x = 0; x < half; ++x)
            {
                out.set(x, y, left.get(x, y));
                if (x + half < width)
                {
                    out.set(x + half, y, right.get(x, y));
                }
            }
        }
        return out;
    }

    case AnaglyphMode::RedCyan:
    {
        Image out(width, height);
        for (i32 y = 0; y < height; ++y)
        {
            for (i32 x = 0; x < width; ++x)
            {
                const Rgb l = pair.left.get(x, y);
                const Rgb r = pair.right.get(x, y);
                out.set(x, y, Rgb{l.r, r.g, r.b});
            }
        }
        return out;
    }

    case AnaglyphMode::DuboisRedCyan:
    {
        Image out(width, height);
        for (i32 y = 0; y < height; ++y)
        {
            for (i32 x = 0; x < width; ++x)
            {
                out.set(x, y, combine_dubois(pair.left.get(x, y), pair.right.get(x, y)));
            }
        }
        return out;
    }
    }
    return pair.left;
}

} // namespace planetrender::planet
