#pragma once

/// @file illumination.hpp
/// @brief Day/night shading of disk and satellite texels.
///
/// The model is empirical: darkening grows with the squared distance between
/// a surface sample and the sub-solar point, with per-body colour tweaks that
/// reproduce the look of spacecraft imagery.

#include "astro/body.hpp"
#include "rendering/color.hpp"

namespace planetrender::planet
{
    namespace illumination_constants
    {
        constexpr f64 kGiantShading = 0.52;        ///< Jupiter..Neptune
        constexpr f64 kTerrestrialShading = 0.45;  ///< Everything else, satellites included
        constexpr f64 kDayNightCutoff = 4.0;       ///< Squared distance (in radii) beyond which no shading applies
        constexpr f64 kRingedBlueFactor = 0.95;    ///< Saturn, Uranus, Neptune
        constexpr f64 kJupiterBlueFactor = 0.85;   ///< Bluer limb, as in HST images
        constexpr f64 kEarthshineLimit = 0.9;      ///< Maximum darkening of a surface lit by its primary
        constexpr f64 kEarthshineFullDepth = 0.33; ///< Sun depth [radii] from which the limit applies fully
        constexpr f64 kEarthshineExponent = 0.2;
        constexpr i32 kEarthDefaultGain = 2;       ///< The default Earth map is stored dark
        constexpr f64 kNightLightsWeight = 0.05;
        constexpr i32 kMinChannel = 1;
        constexpr i32 kMaxChannel = 254;
    }

    /// @brief Shading parameters of one surface.
    struct ShadingModel
    {
        bool enabled = true;              ///< Day and night shading on
        f64 shading = illumination_constants::kTerrestrialShading;
        f64 blue_factor = 1.0;
        bool invert = false;              ///< White background: brighten instead of darken
        bool earthshine = false;
        bool earth_gain = false;
        rendering::Rgb background = rendering::colors::kBlack;

        /// @brief Model for the frame target.
        [[nodiscard]] static ShadingModel for_target(astro::Target target, bool enabled, bool earthshine,
                                                     bool default_earth_texture, rendering::Rgb background);

        /// @brief Model for a satellite of the frame target.
        [[nodiscard]] static ShadingModel for_satellite(bool enabled, bool earthshine, rendering::Rgb background);
    };

    /// @brief Shades texels of a sphere of known radius lit from a known point.
    class Illumination
    {
    public:
        /// @param model   Shading parameters
        /// @param sun     Sub-solar point (screen x, screen y, depth) [px]
        /// @param radius  Sphere radius [px]
        Illumination(const ShadingModel& model, const Vec3d& sun, f64 radius);

        /// @brief Darkening factor at a sample, 0 = fully lit.
        /// @param dz0 Height of the sample towards the observer [px]
        [[nodiscard]] f64 get_darkening(f64 x, f64 y, f64 dz0) const;

        /// @brief Shaded colour of a texel. @p night is the night-lights texel, if any.
        [[nodiscard]] rendering::Rgb shade(rendering::Rgb texel, f64 x, f64 y, f64 dz0,
                                           const rendering::Rgb* night = nullptr) const;

    private:
        ShadingModel m_model;
        Vec3d m_sun;
        f64 m_radius2;
    };

} // namespace planetrender::planet
