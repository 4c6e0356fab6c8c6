/// @file render_config.cpp
/// @brief RenderConfig validation and the cache similarity test.

#include "planet/render_config.hpp"

#include <array>
#include <cmath>

namespace planetrender::planet
{

namespace
{

constexpr i32 kMaxCanvasSize = 16384;

constexpr f64 kSimpleAnaglyphEyeSeparation = 8.0 / kStereoReferenceDepth;
constexpr f64 kTrue3dEyeSeparation = 0.5;

// Texture longitude of the Great Red Spot in the Jupiter map
constexpr f64 kTextureGrsLongitude = (270.0 / 2000.0) * astro_constants::kTwoPi;

struct AnaglyphName
{
    AnaglyphMode mode;
    std::string_view name;
};

constexpr std::array<AnaglyphName, 5> kAnaglyphNames = {{
    {AnaglyphMode::None, "none"},
    {AnaglyphMode::RedCyan, "red-cyan"},
    {AnaglyphMode::DuboisRedCyan, "dubois-red-cyan"},
    {AnaglyphMode::LeftRight, "left-right"},
    {AnaglyphMode::LeftRightHalfWidth, "left-right-half"},
}};

} // anonymous namespace

bool is_stereo(AnaglyphMode mode)
{
    return mode != AnaglyphMode::None;
}

bool is_true_3d(AnaglyphMode mode)
{
    return mode == AnaglyphMode::DuboisRedCyan
        || mode == AnaglyphMode::LeftRight
        || mode == AnaglyphMode::LeftRightHalfWidth;
}

std::string_view to_string(AnaglyphMode mode)
{
    for (const auto& entry : kAnaglyphNames)
    {
        if (entry.mode == mode)
        {
            return entry.name;
        }
    }
    return "none";
}

std::optional<AnaglyphMode> anaglyph_from_name(std::string_view name)
{
    for (const auto& entry : kAnaglyphNames)
    {
        if (entry.name == name)
        {
            return entry.mode;
        }
    }
    return std::nullopt;
}

f64 GreatRedSpot::get_texture_offset() const
{
    return kTextureGrsLongitude - longitude;
}

f64 RefractionWarp::get_upper_limb_factor(const astro::BodyEphemeris& body) const
{
    if (!use_atmosphere)
    {
        return upper_limb_factor;
    }
    const AtmosphericModel model(atmosphere);
    return model.upperLimbFactor(body.elevation * astro_constants::kRadToDeg,
                                 body.angular_radius * astro_constants::kRadToDeg);
}

// -----------------------------------------------------------------
// RenderConfig
// -----------------------------------------------------------------

void RenderConfig::validate() const
{
    const auto target_index = static_cast<i32>(target);
    if (target_index < static_cast<i32>(astro::Target::Sun) || target_index > static_cast<i32>(astro::Target::Moon))
    {
        throw ConfigError("unknown target body");
    }

    if (width <= 0 || height <= 0 || width > kMaxCanvasSize || height > kMaxCanvasSize)
    {
        throw ConfigError("canvas size out of range: " + std::to_string(width) + "x" + std::to_string(height));
    }

    if (!(telescope.field_arcsec > 0.0) || !std::isfinite(telescope.field_arcsec))
    {
        throw ConfigError("telescope field of view must be positive");
    }

    if (!(telescope.aperture_mm > 0.0) || !std::isfinite(telescope.aperture_mm))
    {
        throw ConfigError("telescope aperture must be positive");
    }

    if (telescope.central_obstruction < 0.0 || telescope.central_obstruction >= 1.0)
    {
        throw ConfigError("central obstruction must be a fraction of the aperture");
    }

    if (!(refraction.upper_limb_factor > 0.0) || refraction.upper_limb_factor > 1.0)
    {
        throw ConfigError("upper limb factor must be in (0, 1]");
    }

    if (eye_separation < 0.0 || eye_separation > 5.0)
    {
        throw ConfigError("eye separation must be in [0, 5]");
    }
}

Vec2d RenderConfig::get_planet_center() const
{
    if (planet_center)
    {
        return *planet_center;
    }
    return Vec2d{width * 0.5, height * 0.5};
}

f64 RenderConfig::get_eye_separation() const
{
    if (eye_separation > 0.0)
    {
        return eye_separation;
    }
    return anaglyph == AnaglyphMode::RedCyan ? kSimpleAnaglyphEyeSeparation : kTrue3dEyeSeparation;
}

bool is_similar_for_cache(const FrameRequest& a, const FrameRequest& b)
{
    const auto& ca = a.config;
    const auto& cb = b.config;

    // The convolved raster depends on the pupil
    if (ca.diffraction && cb.diffraction)
    {
        const auto& ta = ca.telescope;
        const auto& tb = cb.telescope;
        if (ta.aperture_mm != tb.aperture_mm || ta.central_obstruction != tb.central_obstruction
            || ta.spider_mm != tb.spider_mm || ta.chromatism_arcsec != tb.chromatism_arcsec)
        {
            return false;
        }
    }

    return ca.target == cb.target
        && ca.textures == cb.textures
        && ca.high_quality == cb.high_quality
        && ca.force_high_quality == cb.force_high_quality
        && ca.width == cb.width
        && ca.height == cb.height
        && ca.diffraction == cb.diffraction
        && ca.illumination == cb.illumination
        && ca.earthshine == cb.earthshine
        && ca.north_up == cb.north_up
        && ca.telescope.invert_horizontal == cb.telescope.invert_horizontal
        && ca.telescope.invert_vertical == cb.telescope.invert_vertical
        && ca.great_red_spot == cb.great_red_spot
        && ca.earth_texture == cb.earth_texture
        && ca.anaglyph == cb.anaglyph
        && ca.background == cb.background
        && ca.foreground == cb.foreground
        && a.body == b.body
        && a.moons == b.moons;
}

} // namespace planetrender::planet
