#pragma once

/// @file types.hpp
/// @brief Precision aliases, glm vector types and shared physical constants.

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace planetrender
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for body geometry)
    using Vec2d = glm::dvec2;
    using Vec3d = glm::dvec3;

    // Vector types (float for interactive input)
    using Vec2f = glm::vec2;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kTwoPi       = 2.0 * kPi;
        constexpr f64 kHalfPi      = kPi / 2.0;
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kArcSecToRad = kPi / (180.0 * 3600.0);
        constexpr f64 kRadToArcSec = 180.0 * 3600.0 / kPi;
        constexpr f64 kJ2000       = 2451545.0;     // Julian Date of J2000.0 epoch
        constexpr f64 kAuKm        = 149597870.7;   // Astronomical unit [km]
        constexpr f64 kSunRadiusKm = 696000.0;      // Solar photospheric radius [km]
    }
}
