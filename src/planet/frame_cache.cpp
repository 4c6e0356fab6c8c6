/// @file frame_cache.cpp
/// @brief Fast-path eligibility and snapshot resampling.

#include "planet/frame_cache.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace planetrender::planet
{

using namespace cache_constants;
using rendering::FrameSnapshot;

const CachedFrame* FrameCache::find(const FrameRequest& request, f64 scale) const
{
    if (!m_frame)
    {
        return nullptr;
    }

    const auto& config = request.config;
    if (!config.textures || config.target == astro::Target::Sun)
    {
        return nullptr;
    }
    if (!(config.telescope.field_arcsec < kWideField || scale > kMinScale))
    {
        return nullptr;
    }
    if (!(m_frame->scale >= scale && m_frame->scale > kMinScale))
    {
        return nullptr;
    }
    if (!is_similar_for_cache(m_frame->request, request))
    {
        return nullptr;
    }
    return &*m_frame;
}

void FrameCache::store(CachedFrame frame)
{
    PLR_CORE_DEBUG("Frame cache: stored {} at {:.2f} px/radius", astro::to_string(frame.request.config.target), frame.scale);
    m_frame = std::move(frame);
}

i32 FrameCache::get_clip_margin(astro::Target target, f64 scale)
{
    i32 margin = 2 + static_cast<i32>(scale + 1.0);
    if (astro::has_rings(target))
    {
        margin *= kRingedClipFactor;
    }
    return margin;
}

// -----------------------------------------------------------------
// Resampling
// -----------------------------------------------------------------

FrameSnapshot resample(const FrameSnapshot& snapshot, i32 width, i32 height)
{
    const i32 sw = snapshot.color.get_width();
    const i32 sh = snapshot.color.get_height();
    if (sw == width && sh == height)
    {
        return snapshot;
    }

    FrameSnapshot out;
    out.color = snapshot.color.resized(width, height);
    out.depth.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), rendering::depth::kBackground);
    if (sw == 0 || sh == 0 || snapshot.depth.size() != static_cast<std::size_t>(sw) * static_cast<std::size_t>(sh))
    {
        return out;
    }

    const f64 fx = static_cast<f64>(sw) / width;
    const f64 fy = static_cast<f64>(sh) / height;
    for (i32 y = 0; y < height; ++y)
    {
        const i32 sy = std::min(sh - 1, static_cast<i32>((y + 0.5) * fy));
        for (i32 x = 0; x < width; ++x)
        {
            const i32 sx = std::min(sw - 1, static_cast<i32>((x + 0.5) * fx));
            out.depth[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)] =
                snapshot.depth[static_cast<std::size_t>(sy) * static_cast<std::size_t>(sw) + static_cast<std::size_t>(sx)];
        }
    }
    return out;
}

} // namespace planetrender::planet
