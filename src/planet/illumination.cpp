/// @file illumination.cpp
/// @brief Empirical day/night shading.

#include "planet/illumination.hpp"

#include <algorithm>
#include <cmath>

namespace planetrender::planet
{

using namespace illumination_constants;
using rendering::Rgb;

ShadingModel ShadingModel::for_target(astro::Target target, bool enabled, bool earthshine,
                                      bool default_earth_texture, Rgb background)
{
    ShadingModel model;
    model.enabled = enabled && target != astro::Target::Sun;
    model.shading = astro::is_giant_planet(target) ? kGiantShading : kTerrestrialShading;
    if (target == astro::Target::Saturn || target == astro::Target::Uranus || target == astro::Target::Neptune)
    {
        model.blue_factor = kRingedBlueFactor;
    }
    else if (target == astro::Target::Jupiter)
    {
        model.blue_factor = kJupiterBlueFactor;
    }
    model.invert = background == rendering::colors::kWhite;
    model.earthshine = earthshine && target == astro::Target::Moon;
    model.earth_gain = default_earth_texture && target == astro::Target::Earth;
    model.background = background;
    return model;
}

ShadingModel ShadingModel::for_satellite(bool enabled, bool earthshine, Rgb background)
{
    ShadingModel model;
    model.enabled = enabled;
    model.invert = background == rendering::colors::kWhite;
    model.earthshine = earthshine;
    model.background = background;
    return model;
}

// -----------------------------------------------------------------
// Illumination
// -----------------------------------------------------------------

Illumination::Illumination(const ShadingModel& model, const Vec3d& sun, f64 radius)
    : m_model{model}
    , m_sun{sun}
    , m_radius2{std::max(radius * radius, 1e-12)}
{
}

f64 Illumination::get_darkening(f64 x, f64 y, f64 dz0) const
{
    const f64 ddx = m_sun.x - x;
    const f64 ddy = m_sun.y - y;
    const f64 ddz = -m_sun.z - dz0;
    const f64 z02 = (ddx * ddx + ddy * ddy + ddz * ddz) / m_radius2;

    f64 ry = 1.0;
    if (z02 <= kDayNightCutoff)
    {
        ry = z02 * m_model.shading;
        if (m_model.invert)
        {
            ry = -ry;
        }
    }

    if (m_model.earthshine && ry > kEarthshineLimit && m_sun.z > 0.0 && z02 <= kDayNightCutoff)
    {
        const f64 depth = m_sun.z / std::sqrt(m_radius2);
        if (depth > kEarthshineFullDepth)
        {
            ry = kEarthshineLimit;
        }
        else
        {
            ry += (kEarthshineLimit - ry) * std::pow(depth * 3.0, kEarthshineExponent);
        }
    }
    return ry;
}

Rgb Illumination::shade(Rgb texel, f64 x, f64 y, f64 dz0, const Rgb* night) const
{
    i32 red = texel.r;
    i32 green = texel.g;
    i32 blue = texel.b;

    if (m_model.enabled)
    {
        f64 ry = get_darkening(x, y, dz0);

        red -= static_cast<i32>(red * ry);
        green -= static_cast<i32>(green * ry);
        ry *= m_model.blue_factor;
        blue -= static_cast<i32>(blue * ry);

        if (m_model.earth_gain)
        {
            red *= kEarthDefaultGain;
            green *= kEarthDefaultGain;
            blue *= kEarthDefaultGain;
        }

        if (night != nullptr)
        {
            const auto lights = [ry](i32 channel) {
                return std::pow(static_cast<f64>(channel), ry + 0.5) * ry * kNightLightsWeight;
            };
            red = static_cast<i32>(red + lights(night->r));
            green = static_cast<i32>(green + lights(night->g));
            blue = static_cast<i32>(blue + lights(night->b));
        }

        red = std::clamp(red, kMinChannel, kMaxChannel);
        green = std::clamp(green, kMinChannel, kMaxChannel);
        blue = std::clamp(blue, kMinChannel, kMaxChannel);
    }

    // Keep surface pixels distinguishable from the background
    const Rgb& bg = m_model.background;
    if (red == bg.r && green == bg.g && blue == bg.b)
    {
        blue = blue < 255 ? blue + 1 : blue - 1;
    }

    return Rgb{static_cast<u8>(red), static_cast<u8>(green), static_cast<u8>(blue)};
}

} // namespace planetrender::planet
