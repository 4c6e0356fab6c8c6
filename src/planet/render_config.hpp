#pragma once

/// @file render_config.hpp
/// @brief Per-frame render settings, the frame request and the cache similarity test.

#include "astro/body.hpp"
#include "astro/ephemeris.hpp"
#include "observatory/atmosphere.hpp"
#include "observatory/telescope.hpp"
#include "rendering/color.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace planetrender::planet
{
    /// @brief Thrown for render settings that cannot produce a frame.
    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief Stereoscopic output mode.
    enum class AnaglyphMode
    {
        None,
        RedCyan,             ///< Left eye in red, right eye in green and blue
        DuboisRedCyan,       ///< Least-squares red-cyan projection (Dubois 2009)
        LeftRight,           ///< Eyes side by side, double width
        LeftRightHalfWidth,  ///< Eyes side by side, each squeezed to half width
    };

    /// @brief Depth with zero disparity between the eyes. Depths are clamped to
    /// ±this value before the pair is derived.
    constexpr f64 kStereoReferenceDepth = 100.0;

    /// @brief True for every mode that produces a left/right pair.
    [[nodiscard]] bool is_stereo(AnaglyphMode mode);

    /// @brief True for the modes that keep full colour per eye.
    [[nodiscard]] bool is_true_3d(AnaglyphMode mode);

    [[nodiscard]] std::string_view to_string(AnaglyphMode mode);
    [[nodiscard]] std::optional<AnaglyphMode> anaglyph_from_name(std::string_view name);

    /// @brief Jupiter longitude systems.
    enum class RotationSystem
    {
        I = 1,   ///< Equatorial belts
        II = 2,  ///< Tropical belts, where the Great Red Spot drifts
        III = 3, ///< Magnetic field rotation
    };

    /// @brief Observed Great Red Spot longitude used to align the Jupiter texture.
    struct GreatRedSpot
    {
        f64 longitude = 0.0;  ///< Radians, in @ref system
        RotationSystem system = RotationSystem::II;

        /// @brief Offset added to the central meridian so the texture spot lands on @ref longitude.
        [[nodiscard]] f64 get_texture_offset() const;

        bool operator==(const GreatRedSpot&) const = default;
    };

    /// @brief Vertical squeeze of a disk low over the horizon.
    struct RefractionWarp
    {
        f64 upper_limb_factor = 1.0;  ///< Apparent / geometric height of the upper half, 1 = none
        f64 zenith_angle = 0.0;       ///< Angle of the local vertical on screen [rad]
        bool use_atmosphere = false;  ///< Derive the factor from the body elevation instead
        AtmosphericConditions atmosphere{};

        /// @brief Factor in effect for a body: the explicit one, or the
        /// atmospheric model evaluated at the body elevation.
        [[nodiscard]] f64 get_upper_limb_factor(const astro::BodyEphemeris& body) const;
    };

    /// @brief Everything that controls how a frame is drawn.
    struct RenderConfig
    {
        astro::Target target = astro::Target::Saturn;
        i32 width = 600;
        i32 height = 600;

        bool textures = true;
        bool high_quality = false;        ///< Supersample ×1.5, off for fields over 1°
        bool force_high_quality = false;  ///< Supersample even for wide fields
        bool show_axes = false;           ///< Pole axis stubs
        bool show_nsew = false;           ///< N/S/E/W cross
        bool show_labels = false;         ///< Grid, cross and moon labels
        bool north_up = true;             ///< Ignore the parallactic angle
        bool illumination = true;         ///< Day and night shading
        bool diffraction = false;
        bool earthshine = false;          ///< Dark side of moons lit by their primary
        bool satellites = true;
        bool sky_mode = false;            ///< Plain markers for moons when textures are off

        AnaglyphMode anaglyph = AnaglyphMode::None;
        f64 eye_separation = 0.0;         ///< 0 selects the default of the mode

        rendering::Rgb background = rendering::colors::kBlack;
        rendering::Rgb foreground = rendering::colors::kWhite;

        Telescope telescope{};

        std::optional<Vec2d> planet_center;       ///< Defaults to the canvas centre
        std::optional<GreatRedSpot> great_red_spot;
        RefractionWarp refraction{};

        std::string earth_texture;        ///< Custom Earth map, empty for the default one

        /// @brief Throws ConfigError for settings that cannot be rendered.
        void validate() const;

        /// @brief Planet centre on the canvas in output pixels.
        [[nodiscard]] Vec2d get_planet_center() const;

        /// @brief Eye separation in effect for the stereo mode.
        [[nodiscard]] f64 get_eye_separation() const;
    };

    /// @brief One frame worth of input: settings plus the instant's ephemerides.
    struct FrameRequest
    {
        RenderConfig config;
        astro::BodyEphemeris body;
        astro::MoonEphemerides moons;
    };

    /// @brief True if a raster rendered for @p a can be rescaled to serve @p b.
    ///
    /// Only the settings that change the planet raster take part, the quality
    /// flags included. Overlays, the field of view and the planet position do
    /// not. The telescope pupil takes part only when diffraction is on.
    [[nodiscard]] bool is_similar_for_cache(const FrameRequest& a, const FrameRequest& b);

} // namespace planetrender::planet
