/// @file test_sphere_projection.cpp
/// @brief Unit tests for the pixel to texel projection of a sphere.

#include <doctest/doctest.h>

#include "planet/sphere_projection.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

using namespace planetrender;
using namespace planetrender::planet;

namespace
{

SphereProjection make_projection()
{
    SphereProjection projection;
    projection.center = Vec2d{50.0, 50.0};
    projection.radius = 20.0;
    projection.texture_width = 360;
    projection.texture_height = 181;
    return projection;
}

} // anonymous namespace

// =================================================================
// sample()
// =================================================================

TEST_CASE("Disk centre samples the middle of the texture")
{
    const auto texel = make_projection().sample(50, 50);
    REQUIRE(texel.has_value());
    CHECK(texel->column == 90);
    CHECK(texel->row == 90);
    CHECK(texel->dz0 == doctest::Approx(20.0));
    CHECK(texel->body_r2 == doctest::Approx(0.0));
}

TEST_CASE("Top of the disk samples the north pole row")
{
    const auto texel = make_projection().sample(50, 30);
    REQUIRE(texel.has_value());
    CHECK(texel->row == 0);
    CHECK(texel->dz0 == doctest::Approx(0.0));
}

TEST_CASE("Texture origin shifts the sampled column")
{
    auto projection = make_projection();
    projection.texture_origin = astro_constants::kHalfPi;
    const auto texel = projection.sample(50, 50);
    REQUIRE(texel.has_value());
    CHECK(texel->column == 0);
}

TEST_CASE("Longitudes just either side of the seam land on neighbouring columns")
{
    auto projection = make_projection();

    // Centre longitude a hair above zero, then a hair below 2 pi
    projection.texture_origin = astro_constants::kHalfPi - 1e-9;
    const auto above = projection.sample(50, 50);
    projection.texture_origin = astro_constants::kHalfPi + 1e-9;
    const auto below = projection.sample(50, 50);
    REQUIRE(above.has_value());
    REQUIRE(below.has_value());
    CHECK(above->column == 0);
    CHECK(below->column == 0);

    // Walking across the seam never jumps by more than one pixel's worth of longitude
    projection.texture_origin = astro_constants::kHalfPi;
    const auto wrapped_step = [](i32 a, i32 b) {
        const i32 d = std::abs(a - b);
        return std::min(d, 360 - d);
    };
    auto previous = projection.sample(45, 50);
    REQUIRE(previous.has_value());
    for (i32 x = 46; x <= 55; ++x)
    {
        const auto texel = projection.sample(x, 50);
        REQUIRE(texel.has_value());
        CHECK(texel->column >= 0);
        CHECK(texel->column < 360);
        CHECK(wrapped_step(previous->column, texel->column) <= 4);
        previous = texel;
    }
    CHECK(projection.sample(49, 50)->column > 350);
    CHECK(projection.sample(51, 50)->column < 10);
}

TEST_CASE("Flips mirror the texel indices")
{
    auto projection = make_projection();
    projection.flip_horizontal = true;
    auto texel = projection.sample(50, 50);
    REQUIRE(texel.has_value());
    CHECK(texel->column == 359 - 90);
    CHECK(texel->row == 90);

    projection.flip_horizontal = false;
    projection.flip_vertical = true;
    texel = projection.sample(50, 30);
    REQUIRE(texel.has_value());
    CHECK(texel->row == 180);
}

TEST_CASE("Pixels outside the disk are not sampled")
{
    const auto projection = make_projection();
    CHECK_FALSE(projection.sample(71, 50).has_value());
    CHECK_FALSE(projection.sample(0, 0).has_value());

    auto empty = make_projection();
    empty.radius = 0.0;
    CHECK_FALSE(empty.sample(50, 50).has_value());
}

// =================================================================
// midpoint()
// =================================================================

TEST_CASE("Midpoint averages texels of the same row")
{
    const auto projection = make_projection();
    const Texel a{.column = 10, .row = 40, .dz0 = 4.0, .body_r2 = 0.1};
    const Texel b{.column = 14, .row = 42, .dz0 = 6.0, .body_r2 = 0.2};

    const Texel mid = projection.midpoint(a, b);
    CHECK(mid.column == 12);
    CHECK(mid.row == 41);
    CHECK(mid.dz0 == doctest::Approx(5.0));
    CHECK(mid.body_r2 == doctest::Approx(0.2));
}

TEST_CASE("Midpoint wraps across the texture seam")
{
    const auto projection = make_projection();
    const Texel a{.column = 350};
    const Texel b{.column = 10};
    CHECK(projection.midpoint(a, b).column == 0);
}

// =================================================================
// rasterize()
// =================================================================

TEST_CASE("Rasterization visits each disk pixel at most once and stays on the disk")
{
    const auto projection = make_projection();

    for (const bool subsample : {false, true})
    {
        std::set<std::pair<i32, i32>> visited;
        bool duplicate = false;
        bool outside = false;

        projection.rasterize(100, 100, subsample, [&](i32 x, i32 y, const Texel&) {
            duplicate |= !visited.emplace(x, y).second;
            const f64 dx = x - 50.0;
            const f64 dy = y - 50.0;
            outside |= dx * dx + dy * dy > 20.0 * 20.0;
        });

        CAPTURE(subsample);
        CHECK_FALSE(duplicate);
        CHECK_FALSE(outside);
        // Close to the area of the disk
        CHECK(static_cast<f64>(visited.size()) > 0.95 * astro_constants::kPi * 400.0);
    }
}

TEST_CASE("Rasterization is clipped to the canvas")
{
    auto projection = make_projection();
    projection.center = Vec2d{0.0, 0.0};

    i32 count = 0;
    bool outside = false;
    projection.rasterize(100, 100, true, [&](i32 x, i32 y, const Texel&) {
        ++count;
        outside |= x < 0 || y < 0;
    });
    CHECK(count > 0);
    CHECK_FALSE(outside);
}

TEST_CASE("Intercepted samples are not passed on")
{
    const auto projection = make_projection();

    i32 drawn = 0;
    i32 intercepted = 0;
    projection.rasterize(100, 100, true,
        [&](i32, i32, const Texel&) { ++drawn; },
        [&](i32 x, i32, const Texel&) {
            if (x < 50)
            {
                ++intercepted;
                return true;
            }
            return false;
        });

    CHECK(intercepted > 0);
    CHECK(drawn > 0);
}
