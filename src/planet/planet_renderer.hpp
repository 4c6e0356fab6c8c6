#pragma once

/// @file planet_renderer.hpp
/// @brief Frame orchestrator: runs the render passes in order and owns the caches.
///
/// One instance renders one frame at a time; concurrent calls on the same
/// instance are serialized. Separate instances share nothing but the texture
/// repository they were given, which must then be used from one thread only.

#include "planet/diffraction.hpp"
#include "planet/frame_cache.hpp"
#include "planet/frame_geometry.hpp"
#include "planet/satellite_renderer.hpp"
#include "rendering/exporter.hpp"
#include "rendering/raster_canvas.hpp"
#include "rendering/texture_repository.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace planetrender::planet
{
    /// @brief Body under a screen position.
    struct BodyPick
    {
        std::string name;
        std::optional<std::size_t> moon_index;  ///< Empty for the target itself
        f64 depth = 0.0;
    };

    namespace renderer_constants
    {
        /// Supersampling factor of the high quality mode.
        constexpr f64 kHighQualitySupersample = 1.5;
        /// High quality is turned off for fields wider than this [arcsec] unless forced.
        constexpr f64 kHighQualityMaxField = 3600.0;
        /// Centres further than this many disk radii outside the canvas only get satellites.
        constexpr f64 kSatellitesOnlyTimesOut = 200.0;
        /// Disks smaller than this [px] skip texturing.
        constexpr i32 kMinTexturedRadius = 2;
    }

    /// @brief Renders planetary disks with rings, satellites and optical effects.
    class PlanetRenderer
    {
    public:
        explicit PlanetRenderer(rendering::TextureRepository& textures);

        /// @brief Render one frame.
        /// @throws ConfigError if the request cannot be rendered.
        [[nodiscard]] rendering::RenderedFrame render(const FrameRequest& request);

        /// @brief Forget the cached raster and the satellite order.
        void invalidate_on_date_change();

        /// @brief Planetographic position under an output pixel of the last frame.
        [[nodiscard]] std::optional<Planetographic> screen_to_planetographic(f64 x, f64 y) const;

        /// @brief Output pixel of a planetographic point in the last frame.
        [[nodiscard]] std::optional<Vec2d> planetographic_to_screen(const Planetographic& point) const;

        /// @brief Nearest body drawn under an output pixel of the last frame.
        [[nodiscard]] std::optional<BodyPick> pick_body(f64 x, f64 y) const;

        /// @brief Moons drawn in the last frame, far to near, in output pixels.
        [[nodiscard]] std::vector<SatellitePick> get_satellite_picks() const;

        [[nodiscard]] bool has_cached_frame() const;

    private:
        struct Pass
        {
            const FrameRequest& request;
            FrameGeometry geometry;
            rendering::RasterCanvas canvas;
            f64 output_scale = 0.0;
            f64 upper_limb_factor = 1.0;
        };

        rendering::RenderedFrame render_from_cache(Pass& pass, const CachedFrame& cached);
        rendering::RenderedFrame render_full(Pass& pass, bool fast_grid);
        rendering::RenderedFrame render_satellites_only(Pass& pass);

        std::vector<SatellitePick> draw_satellites(Pass& pass);
        void use_output_resolution(Pass& pass) const;
        void apply_diffraction(rendering::Canvas& canvas, const Telescope& telescope);
        [[nodiscard]] rendering::FrameSnapshot take_output_snapshot(const Pass& pass) const;
        rendering::RenderedFrame finish(Pass& pass);
        void remember(const Pass& pass, std::vector<SatellitePick> picks);

        rendering::TextureRepository& m_textures;
        mutable std::mutex m_mutex;

        FrameCache m_cache;
        SatelliteOrderCache m_order;
        std::optional<DiffractionPattern> m_pattern;
        Telescope m_pattern_telescope;

        // State of the last frame, in output pixels
        std::optional<FrameRequest> m_last_request;
        std::optional<FrameGeometry> m_last_geometry;
        std::vector<SatellitePick> m_last_picks;
    };

} // namespace planetrender::planet
