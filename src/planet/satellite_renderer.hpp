#pragma once

/// @file satellite_renderer.hpp
/// @brief Natural satellites of the target: markers, texture-mapped disks and transit shadows.

#include "planet/frame_geometry.hpp"
#include "rendering/canvas.hpp"
#include "rendering/texture_repository.hpp"

#include <span>
#include <string>
#include <vector>

namespace planetrender::planet
{
    /// @brief Screen record of a drawn satellite, used for picking and labels.
    struct SatellitePick
    {
        std::size_t index = 0;  ///< Position in the request's moon list
        std::string name;
        Vec2d position{0.0};    ///< Canvas pixels
        f64 radius = 0.0;       ///< [px]
        f64 depth = 0.0;        ///< Towards the observer, equatorial radii of the primary
        f64 distance = 0.0;     ///< From the observer [AU]
    };

    /// @brief Drawing order of the moons, furthest first.
    ///
    /// The renderer invalidates the order at every full render. Frames served
    /// from the cache reuse it while the moon count is unchanged, so panning a
    /// cached frame does not reshuffle moons that cross.
    class SatelliteOrderCache
    {
    public:
        /// @brief Indices into @p moons by descending distance.
        [[nodiscard]] const std::vector<std::size_t>& get_order(const astro::MoonEphemerides& moons);

        /// @brief Forget the order before a full render.
        void invalidate() { m_order.clear(); }

        [[nodiscard]] bool empty() const { return m_order.empty(); }

    private:
        std::vector<std::size_t> m_order;
    };

    namespace satellite_constants
    {
        /// Below this projected radius [px] moons are drawn as plain disks.
        constexpr f64 kMinTexturedRadius = 2.0;
        /// Transit shadows are only drawn above this planet scale [px].
        constexpr f64 kMinShadowScale = 10.0;
        /// Sampling step of the shadow plane [px].
        constexpr f64 kShadowStep = 0.5;
        /// Darkening at the umbra edge, rising linearly to 1 at the penumbra edge.
        constexpr f64 kUmbraIntensity = 0.3;
        /// Smallest marker radius of the main moons in sky mode [px].
        constexpr f64 kMainMoonMinSize = 0.5;
        /// Sky-mode marker opacity.
        constexpr f64 kSkyMarkerAlpha = 192.0 / 255.0;
        /// Depth slack when telling the planet surface from bodies in front of it.
        constexpr f64 kSurfaceDepthTolerance = 0.02;
        /// Vertical gap between a moon and its label, in moon radii.
        constexpr f64 kLabelOffsetRadii = 3.0;
    }

    /// @brief Draws the moons of one frame in a fixed far-to-near order.
    class SatelliteRenderer
    {
    public:
        SatelliteRenderer(const FrameGeometry& geometry, const FrameRequest& request,
                          rendering::TextureRepository& textures, std::span<const std::size_t> order);

        /// @brief Darken the planet under each transiting moon's shadow.
        void draw_shadows(rendering::Canvas& canvas) const;

        /// @brief Draw every visible moon.
        /// @return Screen records of the moons drawn, far to near.
        /// @throws std::invalid_argument for a moon with a non-finite position or negative size.
        std::vector<SatellitePick> draw(rendering::Canvas& canvas) const;

        /// @brief Names below each drawn moon.
        void draw_labels(rendering::Canvas& canvas, const std::vector<SatellitePick>& picks) const;

        /// @brief Offset of a moon from the planet centre on the canvas [px], y down.
        [[nodiscard]] Vec2d get_screen_offset(const astro::MoonEphemeris& moon) const;

        /// @brief Depth of a moon relative to the planet centre.
        [[nodiscard]] f64 get_depth(const astro::MoonEphemeris& moon) const;

        /// @brief Smallest magnitude of the set (brightest moon), 0 for none.
        [[nodiscard]] static f64 get_brightest_magnitude(const astro::MoonEphemerides& moons);

    private:
        void draw_marker(rendering::Canvas& canvas, const astro::MoonEphemeris& moon, std::size_t index,
                         const Vec2d& position, f64 radius, f64 depth) const;
        void draw_textured(rendering::Canvas& canvas, const astro::MoonEphemeris& moon, std::size_t order_index,
                           const Vec2d& position, f64 radius, f64 depth) const;
        void draw_shadow(rendering::Canvas& canvas, const astro::MoonEphemeris& moon, std::vector<u8>& touched) const;
        [[nodiscard]] bool is_visible(const Vec2d& position, f64 size) const;
        [[nodiscard]] bool is_eclipsed_sample(const astro::MoonEphemeris& moon, std::size_t order_index, Vec3d sample) const;

        const FrameGeometry& m_geometry;
        const RenderConfig& m_config;
        const astro::BodyEphemeris& m_body;
        const astro::MoonEphemerides& m_moons;
        rendering::TextureRepository& m_textures;
        std::span<const std::size_t> m_order;
        f64 m_sun_size = 0.0;     ///< Solar angular radius seen from the planet [rad]
        f64 m_brightest = 0.0;
    };

} // namespace planetrender::planet
