/// @file test_ring_renderer.cpp
/// @brief Unit tests for ring strips, the ring shadow and the textured and outline rings.

#include <doctest/doctest.h>

#include "planet/disk_rasterizer.hpp"
#include "planet/ring_renderer.hpp"
#include "rendering/raster_canvas.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cmath>

using namespace planetrender;
using namespace planetrender::planet;
using rendering::Image;
using rendering::RasterCanvas;
using rendering::Rgb;
using rendering::TextureRepository;

namespace
{

/// Saturn seen from 23° above the ring plane, sun on the same side.
planet::FrameRequest make_saturn()
{
    auto request = test::make_request(astro::Target::Saturn, 300, 40.0);
    request.body.pole_inclination = 0.4;
    request.body.subsolar_latitude = 0.4;
    return request;
}

void insert_saturn_strips(TextureRepository& textures)
{
    textures.insert("ringsat_backscattered", Image(200, 33, Rgb{180, 180, 180}));
    textures.insert("ringsat_forwardscattered", Image(200, 33, Rgb{90, 90, 90}));
    textures.insert("ringsat_unlitside", Image(200, 33, Rgb{60, 60, 60}));
    textures.insert("ringsat_color", Image(200, 33, Rgb{220, 200, 160}));
    textures.insert("ringsat_transparency", Image(200, 33, Rgb{100, 100, 100}));
}

i32 count_color(const Image& image, Rgb color)
{
    return image.get_width() * image.get_height() - test::count_not(image, color);
}

} // anonymous namespace

// =================================================================
// Strips
// =================================================================

TEST_CASE("Only Saturn and Uranus have ring strips")
{
    TextureRepository textures;
    insert_saturn_strips(textures);
    const auto request = make_saturn();

    CHECK_FALSE(RingRenderer::load_strips(textures, astro::Target::Mars, request.body, 40).has_value());
    CHECK_FALSE(RingRenderer::load_strips(textures, astro::Target::Neptune, request.body, 40).has_value());
    CHECK(RingRenderer::load_strips(textures, astro::Target::Saturn, request.body, 40).has_value());
}

TEST_CASE("Strip width follows the disk radius")
{
    TextureRepository textures;
    insert_saturn_strips(textures);
    const auto request = make_saturn();

    const auto small = RingRenderer::load_strips(textures, astro::Target::Saturn, request.body, 40);
    REQUIRE(small.has_value());
    CHECK(small->color.get_width() == ring_constants::kMinStripWidth);
    CHECK(small->color.get_height() == ring_constants::kStripHeight);
    CHECK(small->transparency.get_width() == ring_constants::kMinStripWidth);

    const auto large = RingRenderer::load_strips(textures, astro::Target::Saturn, request.body, 250);
    REQUIRE(large.has_value());
    CHECK(large->color.get_width() == 300);
}

TEST_CASE("Unlit side of Saturn's rings uses its own strip")
{
    TextureRepository textures;
    textures.insert("ringsat_unlitside", Image(200, 33, Rgb{60, 60, 60}));
    textures.insert("ringsat_color", Image(200, 33, Rgb{255, 255, 255}));
    textures.insert("ringsat_transparency", Image(200, 33, Rgb{100, 100, 100}));

    auto request = make_saturn();
    CHECK_FALSE(RingRenderer::load_strips(textures, astro::Target::Saturn, request.body, 40).has_value());

    request.body.subsolar_latitude = -0.1;
    const auto strips = RingRenderer::load_strips(textures, astro::Target::Saturn, request.body, 40);
    REQUIRE(strips.has_value());
    // Darkened by the unlit-side offset
    CHECK(strips->color.get(50, 0).r < 60);
}

TEST_CASE("Uranus strips come from the colour and opacity textures")
{
    TextureRepository textures;
    textures.insert("ringura1", Image(120, 33, Rgb{100, 110, 120}));
    textures.insert("ringura2", Image(120, 33, Rgb{0, 128, 0}));

    astro::BodyEphemeris body;
    body.pole_inclination = 0.5;
    body.subsolar_latitude = 0.5;
    const auto lit = RingRenderer::load_strips(textures, astro::Target::Uranus, body, 40);
    REQUIRE(lit.has_value());
    CHECK(lit->color.get(10, 0) == Rgb{100, 110, 120});

    body.subsolar_latitude = -0.5;
    const auto unlit = RingRenderer::load_strips(textures, astro::Target::Uranus, body, 40);
    REQUIRE(unlit.has_value());
    CHECK(unlit->color.get(10, 0).b < 120);
}

// =================================================================
// Drawing
// =================================================================

TEST_CASE("Bodies without rings draw nothing")
{
    const auto request = test::make_request(astro::Target::Mars, 300, 40.0);
    const auto geometry = FrameGeometry::compute(request, 1.0);
    TextureRepository textures;
    RasterCanvas canvas(300, 300);

    const RingRenderer rings(geometry, request.config, request.body, textures);
    CHECK_FALSE(rings.is_active());
    rings.draw(canvas);
    CHECK(test::count_not(canvas.get_image(), rendering::colors::kBlack) == 0);
}

TEST_CASE("Missing ring textures fall back to outlines")
{
    const auto request = make_saturn();
    const auto geometry = FrameGeometry::compute(request, 1.0);
    TextureRepository textures;
    RasterCanvas canvas(300, 300);

    const RingRenderer rings(geometry, request.config, request.body, textures);
    REQUIRE(rings.is_active());
    CHECK_FALSE(rings.has_textures());

    rings.draw(canvas);
    CHECK(count_color(canvas.get_image(), rendering::colors::kRingOutline) > 50);
}

TEST_CASE("Ring outlines close back on their first vertex")
{
    const auto request = make_saturn();
    const auto geometry = FrameGeometry::compute(request, 1.0);
    TextureRepository textures;
    RasterCanvas canvas(300, 300);

    RingRenderer(geometry, request.config, request.body, textures).draw_outline(canvas);

    // The outermost ellipse starts at (cx + a, cy) heading down, so the row just
    // above is only reached by the segment that closes it
    const i32 tip = static_cast<i32>(std::lround(150.0 + 140390.0 * geometry.radius / 60268.0));
    bool closed = false;
    for (i32 x = tip - 6; x <= tip + 1; ++x)
    {
        closed = closed || canvas.get_pixel(x, 149) == rendering::colors::kRingOutline;
    }
    CHECK(closed);
}

TEST_CASE("A ringed body at zero phase angle has no terminator and rings passing behind it")
{
    // Sun and observer share the ring plane elevation and the disk is fully lit
    const auto request = make_saturn();
    const auto geometry = FrameGeometry::compute(request, 1.0);
    REQUIRE(geometry.dlon == doctest::Approx(0.0));
    REQUIRE(geometry.dlat == doctest::Approx(0.0));

    TextureRepository textures;
    textures.insert("Saturn", Image(64, 32, Rgb{200, 200, 200}));
    RasterCanvas disk_canvas(300, 300);
    REQUIRE(DiskRasterizer(geometry, request.config, textures).draw_textured(disk_canvas));

    const f64 r = geometry.radius;
    const f64 half_height = r * geometry.axis_ratio;
    const auto at = [](f64 offset) { return static_cast<i32>(std::lround(150.0 + offset)); };
    for (const f64 f : {0.0, 0.5, 0.9})
    {
        CAPTURE(f);
        const Rgb right = disk_canvas.get_pixel(at(f * r), 150);
        const Rgb left = disk_canvas.get_pixel(at(-f * r), 150);
        CHECK(right != rendering::colors::kBlack);
        CHECK(std::abs(right.r - left.r) <= 2);
        CHECK(disk_canvas.get_pixel(150, at(-f * half_height)) != rendering::colors::kBlack);
        CHECK(disk_canvas.get_pixel(150, at(f * half_height)) != rendering::colors::kBlack);
    }

    RasterCanvas ring_canvas(300, 300);
    RingRenderer(geometry, request.config, request.body, textures).draw_outline(ring_canvas);

    i32 min_x = 300;
    i32 max_x = -1;
    i32 max_y = -1;
    i32 far_inside_disk = 0;
    for (i32 y = 0; y < 300; ++y)
    {
        for (i32 x = 0; x < 300; ++x)
        {
            if (ring_canvas.get_pixel(x, y) != rendering::colors::kRingOutline)
            {
                continue;
            }
            min_x = std::min(min_x, x);
            max_x = std::max(max_x, x);
            max_y = std::max(max_y, y);
            const f64 dx = x - 150.0;
            const f64 dy = y - 150.0;
            if (dy < -1.0 && dx * dx + dy * dy < (r - 1.5) * (r - 1.5))
            {
                ++far_inside_disk;
            }
        }
    }

    // The far arc is hidden by the disk and ends at the ansae, well outside the disk's box
    const f64 a = 140390.0 * r / 60268.0;
    CHECK(far_inside_disk == 0);
    CHECK(std::abs(max_x - (150.0 + a)) <= 1.0);
    CHECK(std::abs(min_x - (150.0 - a)) <= 1.0);
    CHECK(max_x - 150.0 > r);
    CHECK(150.0 - min_x > r);

    // The ring ellipse opens by the pole tilt, squeezed like the disk by its oblateness
    const f64 b = a * geometry.axis_ratio * geometry.axis_ratio * std::sin(request.body.pole_inclination);
    CHECK(std::abs(max_y - (150.0 + b)) <= 1.5);
    CHECK(b < half_height);
}

TEST_CASE("Textured rings cover the ansae")
{
    const auto request = make_saturn();
    const auto geometry = FrameGeometry::compute(request, 1.0);
    TextureRepository textures;
    insert_saturn_strips(textures);
    RasterCanvas canvas(300, 300);

    const RingRenderer rings(geometry, request.config, request.body, textures);
    REQUIRE(rings.has_textures());
    rings.draw(canvas);

    // 1.8 equatorial radii east and west of the centre, on the major axis
    CHECK(canvas.get_pixel(222, 150) != rendering::colors::kBlack);
    CHECK(canvas.get_pixel(78, 150) != rendering::colors::kBlack);
    CHECK(count_color(canvas.get_image(), rendering::colors::kRingOutline) == 0);

    // Nothing beyond the outer edge
    CHECK(canvas.get_pixel(250, 150) == rendering::colors::kBlack);
}

TEST_CASE("Ring shadow darkens the disk only")
{
    const auto request = make_saturn();
    const auto geometry = FrameGeometry::compute(request, 1.0);
    TextureRepository textures;
    insert_saturn_strips(textures);
    RasterCanvas canvas(300, 300);

    DiskRasterizer(geometry, request.config, textures).draw_disk(canvas);
    const i32 disk = test::count_not(canvas.get_image(), rendering::colors::kBlack);

    const RingRenderer rings(geometry, request.config, request.body, textures);
    rings.draw_shadow(canvas);

    const i32 lit = count_color(canvas.get_image(), request.config.foreground);
    CHECK(lit < disk);
    CHECK(lit > 0);
    // Sky stays black
    CHECK(canvas.get_pixel(10, 10) == rendering::colors::kBlack);
}
