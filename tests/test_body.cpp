/// @file test_body.cpp
/// @brief Unit tests for the body tables and planetrender::astro::BodyFrame.

#include <doctest/doctest.h>

#include "astro/body.hpp"
#include "astro/body_frame.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace planetrender;
using namespace planetrender::astro;

static constexpr f64 kTol = 1e-9;

// =================================================================
// Body tables
// =================================================================

TEST_CASE("target_from_name is case-insensitive and rejects unknown names")
{
    CHECK(target_from_name("Saturn") == Target::Saturn);
    CHECK(target_from_name("jupiter") == Target::Jupiter);
    CHECK(target_from_name("MOON") == Target::Moon);
    CHECK_FALSE(target_from_name("Vulcan").has_value());
    CHECK_FALSE(target_from_name("").has_value());
}

TEST_CASE("Every target round-trips through its name")
{
    for (i32 i = static_cast<i32>(Target::Sun); i <= static_cast<i32>(Target::Moon); ++i)
    {
        const auto target = static_cast<Target>(i);
        CHECK(target_from_name(to_string(target)) == target);
        CHECK(get_body_info(target).target == target);
    }
}

TEST_CASE("Ring systems: Saturn, Uranus and Neptune only")
{
    CHECK(has_rings(Target::Saturn));
    CHECK(has_rings(Target::Uranus));
    CHECK(has_rings(Target::Neptune));
    CHECK_FALSE(has_rings(Target::Jupiter));
    CHECK_FALSE(has_rings(Target::Mars));

    // Ring radii grow outwards and lie outside the planet
    const auto& saturn = get_body_info(Target::Saturn);
    for (std::size_t i = 1; i < saturn.ring_radii_km.size(); ++i)
    {
        CHECK(saturn.ring_radii_km[i] > saturn.ring_radii_km[i - 1]);
    }
    CHECK(saturn.ring_radii_km.front() > saturn.equatorial_radius_km);
    CHECK(saturn.textured_ring_count <= saturn.ring_radii_km.size());
}

TEST_CASE("Giant planets and satellite hosts")
{
    CHECK(is_giant_planet(Target::Jupiter));
    CHECK(is_giant_planet(Target::Neptune));
    CHECK_FALSE(is_giant_planet(Target::Mars));
    CHECK_FALSE(is_giant_planet(Target::Pluto));

    CHECK(has_satellites(Target::Mars));
    CHECK(has_satellites(Target::Pluto));
    CHECK_FALSE(has_satellites(Target::Earth));
    CHECK_FALSE(has_satellites(Target::Moon));
    CHECK_FALSE(has_satellites(Target::Sun));
}

TEST_CASE("Polar radius never exceeds the equatorial radius")
{
    for (i32 i = static_cast<i32>(Target::Sun); i <= static_cast<i32>(Target::Moon); ++i)
    {
        const auto& info = get_body_info(static_cast<Target>(i));
        CHECK(info.polar_radius_km <= info.equatorial_radius_km);
        CHECK(info.polar_radius_km > 0.0);
    }
}

// =================================================================
// BodyFrame
// =================================================================

TEST_CASE("rotate_to_equator undoes rotate_from_equator")
{
    const Vec3d p{0.3, -0.4, 0.5};
    const Vec3d q = BodyFrame::rotate_to_equator(BodyFrame::rotate_from_equator(p, 0.7, -0.2), 0.7, -0.2);
    CHECK(q.x == doctest::Approx(p.x).epsilon(kTol));
    CHECK(q.y == doctest::Approx(p.y).epsilon(kTol));
    CHECK(q.z == doctest::Approx(p.z).epsilon(kTol));
}

TEST_CASE("rotate_from_equator keeps the vector length")
{
    const Vec3d p{1.0, 2.0, -0.5};
    const Vec3d q = BodyFrame::rotate_from_equator(p, 1.3, 0.4);
    CHECK(glm::length(q) == doctest::Approx(glm::length(p)).epsilon(kTol));
}

TEST_CASE("A quarter turn about the pole moves +x to +z")
{
    const Vec3d q = BodyFrame::rotate_from_equator(Vec3d{1.0, 0.0, 0.0}, astro_constants::kHalfPi, 0.0);
    CHECK(q.x == doctest::Approx(0.0).epsilon(kTol));
    CHECK(q.z == doctest::Approx(1.0).epsilon(kTol));
}

TEST_CASE("2D rotate is counter-clockwise")
{
    const Vec2d v = BodyFrame::rotate(Vec2d{1.0, 0.0}, astro_constants::kHalfPi);
    CHECK(v.x == doctest::Approx(0.0).epsilon(kTol));
    CHECK(v.y == doctest::Approx(1.0).epsilon(kTol));
}

TEST_CASE("Geodetic and geocentric latitudes")
{
    const auto& saturn = get_body_info(Target::Saturn);
    const f64 lat = 40.0 * astro_constants::kDegToRad;
    const f64 centric = BodyFrame::geodetic_to_geocentric(saturn.equatorial_radius_km, saturn.polar_radius_km, lat);

    // On an oblate body the planetocentric latitude is closer to the equator
    CHECK(centric < lat);
    CHECK(BodyFrame::geocentric_to_geodetic(saturn.equatorial_radius_km, saturn.polar_radius_km, centric)
          == doctest::Approx(lat).epsilon(kTol));

    // Poles and spheres are unchanged
    CHECK(BodyFrame::geodetic_to_geocentric(60268.0, 54364.0, astro_constants::kHalfPi) == astro_constants::kHalfPi);
    CHECK(BodyFrame::geodetic_to_geocentric(1000.0, 1000.0, lat) == doctest::Approx(lat).epsilon(kTol));
}

TEST_CASE("normalize_radians maps into [0, 2π)")
{
    CHECK(BodyFrame::normalize_radians(-0.5) == doctest::Approx(astro_constants::kTwoPi - 0.5));
    CHECK(BodyFrame::normalize_radians(astro_constants::kTwoPi + 0.25) == doctest::Approx(0.25));
    CHECK(BodyFrame::normalize_radians(0.0) == 0.0);
}

TEST_CASE("sign")
{
    CHECK(BodyFrame::sign(2.5) == 1);
    CHECK(BodyFrame::sign(-0.1) == -1);
    CHECK(BodyFrame::sign(0.0) == 0);
}
