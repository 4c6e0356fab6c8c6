#pragma once

/// @file ring_renderer.hpp
/// @brief Ring systems of Saturn, Uranus and Neptune: shadow on the disk and the rings themselves.
///
/// Textured rings are built from one-dimensional strips (a column per radius)
/// sampled at kStripRow. Rings are traced as concentric circles in the planet
/// equatorial plane, rotated towards the sun to find the lit part and towards
/// the observer to place them on the canvas.

#include "planet/frame_geometry.hpp"
#include "rendering/canvas.hpp"
#include "rendering/texture_repository.hpp"

#include <optional>

namespace planetrender::planet
{
    /// @brief Colour and transparency per ring radius, resampled to the disk size.
    struct RingStrips
    {
        rendering::Image color;
        rendering::Image transparency;  ///< Green channel holds the opacity 0..255
    };

    namespace ring_constants
    {
        constexpr i32 kStripHeight = 33;
        constexpr i32 kStripRow = 30;
        constexpr i32 kMinStripWidth = 100;
        constexpr f64 kStripGamma = 0.7;
        constexpr i32 kUnlitSideOffset = -128;
        /// Phase angle scale of the back to forward scattering blend.
        constexpr f64 kForwardScatterPhase = 0.78;
        /// Shadow bands are traced three times finer when the sun is this far off the line of sight.
        constexpr f64 kFineShadowLongitude = 6.0 * astro_constants::kDegToRad;
        /// Textured rings are skipped when the planet lies this many radii outside the canvas.
        constexpr f64 kMaxTimesOut = 2.5;
        /// Saturn's reddish glow at the edge of the planet shadow on the rings.
        constexpr f64 kRedEdgeInner = 0.995;
        constexpr f64 kRedEdgeWidth = 0.01;
        constexpr i32 kMaxRingChannel = 254;
        constexpr i32 kDarkBackgroundLimit = 10;
    }

    /// @brief Draws the ring system of the target for one frame.
    class RingRenderer
    {
    public:
        RingRenderer(const FrameGeometry& geometry, const RenderConfig& config,
                     const astro::BodyEphemeris& body, rendering::TextureRepository& textures);

        /// @brief Build the ring strips for @p target from the texture repository.
        ///
        /// Saturn blends a back-scattered and a forward-scattered strip by the
        /// phase angle, or uses the unlit-side strip when the sun and the
        /// observer are on opposite sides of the ring plane. Uranus darkens its
        /// colour strip by the opacity on the unlit side.
        [[nodiscard]] static std::optional<RingStrips> load_strips(rendering::TextureRepository& textures,
                                                                   astro::Target target,
                                                                   const astro::BodyEphemeris& body,
                                                                   i32 radius);

        /// @brief True if the body has rings and they are large enough to draw.
        [[nodiscard]] bool is_active() const;

        /// @brief True if the textured model will be used.
        [[nodiscard]] bool has_textures() const { return m_strips.has_value(); }

        /// @brief Darken disk pixels under the ring shadow, once per pixel.
        void draw_shadow(rendering::Canvas& canvas) const;

        /// @brief Textured rings, or the outline model when no strips are available.
        void draw(rendering::Canvas& canvas) const;

        /// @brief Elliptical ring outlines, used without textures and always for Neptune.
        void draw_outline(rendering::Canvas& canvas) const;

    private:
        void draw_textured(rendering::Canvas& canvas) const;
        [[nodiscard]] bool uses_texture_model() const;
        [[nodiscard]] u32 get_ring_count() const;
        [[nodiscard]] bool is_inside(f64 x, f64 y) const;
        [[nodiscard]] bool is_lit() const;

        const FrameGeometry& m_geometry;
        const RenderConfig& m_config;
        const astro::BodyEphemeris& m_body;
        std::optional<RingStrips> m_strips;
    };

} // namespace planetrender::planet
