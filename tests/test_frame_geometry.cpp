/// @file test_frame_geometry.cpp
/// @brief Unit tests for FrameGeometry placement and the planetographic transforms.

#include <doctest/doctest.h>

#include "planet/frame_geometry.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace planetrender;
using namespace planetrender::planet;
using astro::Target;

// =================================================================
// Placement
// =================================================================

TEST_CASE("Disk scale follows the field of view")
{
    const auto request = test::make_request(Target::Mars, 200, 50.0);
    const auto g = FrameGeometry::compute(request, 1.0);

    CHECK(g.width == 200);
    CHECK(g.height == 200);
    CHECK(g.radius == 50);
    CHECK(g.scale == doctest::Approx(50.0).epsilon(1e-6));
    CHECK(g.center.x == doctest::Approx(100.0));
    CHECK(g.center.y == doctest::Approx(100.0));
    CHECK(g.planet_size == doctest::Approx(request.body.angular_radius / g.scale));
    CHECK(g.planet_visible);
}

TEST_CASE("Supersampling scales the canvas and the disk")
{
    const auto request = test::make_request(Target::Mars, 200, 50.0);
    const auto g = FrameGeometry::compute(request, 1.5);

    CHECK(g.width == 300);
    CHECK(g.height == 300);
    CHECK(g.radius == 75);
    CHECK(g.center.x == doctest::Approx(150.0));
}

TEST_CASE("Planet centre is truncated to whole pixels")
{
    auto request = test::make_request(Target::Mars, 200, 20.0);
    request.config.planet_center = Vec2d{10.7, 20.2};
    const auto g = FrameGeometry::compute(request, 1.0);

    CHECK(g.center.x == doctest::Approx(10.0));
    CHECK(g.center.y == doctest::Approx(20.0));
}

TEST_CASE("A disk far off the canvas is not visible")
{
    auto request = test::make_request(Target::Mars, 200, 20.0);
    request.config.planet_center = Vec2d{1000.0, 100.0};
    const auto g = FrameGeometry::compute(request, 1.0);

    CHECK_FALSE(g.planet_visible);
    CHECK(g.dist_center > 1.0);
    CHECK(g.times_out > 1.0);
}

TEST_CASE("Ring textures are dropped once the disk is wider than the canvas")
{
    CHECK(FrameGeometry::compute(test::make_request(Target::Saturn, 200, 60.0), 1.0).rings_textures_visible);
    CHECK_FALSE(FrameGeometry::compute(test::make_request(Target::Saturn, 200, 120.0), 1.0).rings_textures_visible);
}

TEST_CASE("Oblate bodies seen equator-on have their full flattening")
{
    const auto g = FrameGeometry::compute(test::make_request(Target::Saturn, 200, 50.0), 1.0);
    const auto& info = astro::get_body_info(Target::Saturn);

    CHECK(g.axis_ratio == doctest::Approx(info.polar_radius_km / info.equatorial_radius_km));
    CHECK(g.oblateness == doctest::Approx(1.0 / g.axis_ratio));
}

TEST_CASE("Sub-solar point at full phase is in front of the disk centre")
{
    const auto g = FrameGeometry::compute(test::make_request(Target::Mars, 200, 50.0), 1.0);
    CHECK(g.sun.x == doctest::Approx(100.0));
    CHECK(g.sun.y == doctest::Approx(100.0));
    CHECK(g.sun.z == doctest::Approx(-50.0));
}

TEST_CASE("Sub-solar point moves behind the disk at crescent phase")
{
    auto request = test::make_request(Target::Venus, 200, 50.0);
    request.body.phase = 0.2;
    request.body.phase_angle = 2.0;
    const auto g = FrameGeometry::compute(request, 1.0);

    CHECK(g.sun.z > 0.0);
    CHECK(std::hypot(g.sun.x - 100.0, g.sun.y - 100.0) == doctest::Approx(50.0 * std::sin(2.0)).epsilon(1e-6));
}

TEST_CASE("Great Red Spot setting replaces the central meridian on Jupiter")
{
    auto request = test::make_request(Target::Jupiter, 200, 50.0);
    request.body.central_meridian = 0.3;
    request.body.central_meridian_ii = 1.2;
    request.config.great_red_spot = GreatRedSpot{.longitude = (270.0 / 2000.0) * astro_constants::kTwoPi,
                                                 .system = RotationSystem::II};

    const auto g = FrameGeometry::compute(request, 1.0);
    CHECK(g.rotation == doctest::Approx(1.2));
}

// =================================================================
// Planetographic transforms
// =================================================================

TEST_CASE("Disk centre maps to the central meridian on the equator")
{
    auto request = test::make_request(Target::Mars, 200, 50.0);
    request.body.central_meridian = 1.0;
    const auto g = FrameGeometry::compute(request, 1.0);

    const auto point = g.screen_to_planetographic(100.0, 100.0);
    REQUIRE(point.has_value());
    CHECK(point->longitude == doctest::Approx(1.0));
    CHECK(point->latitude == doctest::Approx(0.0));
}

TEST_CASE("North is up when the axis position angle is zero")
{
    const auto g = FrameGeometry::compute(test::make_request(Target::Mars, 200, 50.0), 1.0);

    const auto north = g.screen_to_planetographic(100.0, 70.0);
    const auto south = g.screen_to_planetographic(100.0, 130.0);
    REQUIRE(north.has_value());
    REQUIRE(south.has_value());
    CHECK(north->latitude > 0.0);
    CHECK(south->latitude == doctest::Approx(-north->latitude));
}

TEST_CASE("Pixels off the disk have no planetographic position")
{
    const auto g = FrameGeometry::compute(test::make_request(Target::Mars, 200, 50.0), 1.0);
    CHECK_FALSE(g.screen_to_planetographic(160.0, 100.0).has_value());
    CHECK_FALSE(g.screen_to_planetographic(0.0, 0.0).has_value());
}

TEST_CASE("Screen position of a surface point lands back on that point")
{
    auto request = test::make_request(Target::Saturn, 300, 100.0);
    request.body.pole_inclination = 0.35;
    request.body.axis_position_angle = 0.1;
    request.body.central_meridian = 2.0;
    const auto g = FrameGeometry::compute(request, 1.0);

    for (const Vec2d pixel : {Vec2d{150.0, 150.0}, Vec2d{120.0, 170.0}, Vec2d{190.0, 110.0}})
    {
        const auto point = g.screen_to_planetographic(pixel.x, pixel.y);
        REQUIRE(point.has_value());
        const auto back = g.planetographic_to_screen(*point);
        REQUIRE(back.has_value());
        CHECK(back->x == doctest::Approx(pixel.x).epsilon(1e-6));
        CHECK(back->y == doctest::Approx(pixel.y).epsilon(1e-6));
    }
}

TEST_CASE("Far-side points are not on screen")
{
    auto request = test::make_request(Target::Mars, 200, 50.0);
    request.body.central_meridian = 0.5;
    const auto g = FrameGeometry::compute(request, 1.0);

    const Planetographic far_side{.longitude = 0.5 + astro_constants::kPi, .latitude = 0.0};
    CHECK_FALSE(g.planetographic_to_screen(far_side).has_value());
}
