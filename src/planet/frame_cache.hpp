#pragma once

/// @file frame_cache.hpp
/// @brief Last full-quality planet raster, reused while only the scale or position changes.

#include "planet/render_config.hpp"
#include "rendering/canvas.hpp"

#include <optional>

namespace planetrender::planet
{
    /// @brief Raster of the planet (disk, rings and transit shadows) at output resolution.
    struct CachedFrame
    {
        FrameRequest request;
        rendering::FrameSnapshot snapshot;
        f64 scale = 0.0;     ///< Output pixels per equatorial radius when rendered
        Vec2d center{0.0};   ///< Planet centre in output pixels when rendered
    };

    namespace cache_constants
    {
        /// Neither the cached nor the requested disk may be smaller than this [px per radius].
        constexpr f64 kMinScale = 2.0;
        /// Fields at least this wide [arcsec] need a larger disk than kMinScale.
        constexpr f64 kWideField = 3600.0;
        /// Blit clip margin multiplier for bodies with rings.
        constexpr i32 kRingedClipFactor = 4;
    }

    /// @brief Single-slot cache owned by the renderer.
    class FrameCache
    {
    public:
        /// @brief Cached frame that can be rescaled to serve @p request at @p scale.
        ///
        /// Requires textures on, a target other than the Sun, a similar request,
        /// a cached scale not below @p scale and both disks above kMinScale
        /// (the requested one only for wide fields).
        [[nodiscard]] const CachedFrame* find(const FrameRequest& request, f64 scale) const;

        void store(CachedFrame frame);

        void clear() { m_frame.reset(); }

        [[nodiscard]] bool empty() const { return !m_frame.has_value(); }

        /// @brief Clip half-size around the planet centre for a blit at @p scale.
        [[nodiscard]] static i32 get_clip_margin(astro::Target target, f64 scale);

    private:
        std::optional<CachedFrame> m_frame;
    };

    /// @brief Resample a snapshot: bilinear colour, nearest-sample depth.
    [[nodiscard]] rendering::FrameSnapshot resample(const rendering::FrameSnapshot& snapshot, i32 width, i32 height);

} // namespace planetrender::planet
