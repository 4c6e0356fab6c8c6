/// @file test_planet_renderer.cpp
/// @brief Unit tests for the frame orchestrator: fast path, picking and stereo output.

#include <doctest/doctest.h>

#include "planet/planet_renderer.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>

using namespace planetrender;
using namespace planetrender::planet;
using rendering::Image;
using rendering::Rgb;
using rendering::TextureRepository;

namespace
{

constexpr i32 kSize = 300;
constexpr f64 kRadius = 40.0;

FrameRequest make_jupiter()
{
    auto request = test::make_request(astro::Target::Jupiter, kSize, kRadius);
    request.config.illumination = false;
    return request;
}

astro::MoonEphemeris make_moon(const std::string& name, Vec3d position, const FrameRequest& request)
{
    astro::MoonEphemeris moon;
    moon.name = name;
    moon.position = position;
    moon.position_from_sun = position;
    moon.angular_radius = 5.0 * request.body.angular_radius / kRadius;
    moon.radius_km = 1821.0;
    moon.magnitude = 5.0;
    moon.distance = request.body.distance + position.z * 71492.0 / astro_constants::kAuKm;
    return moon;
}

/// Largest per-channel difference between two rasters of the same size.
i32 max_difference(const Image& a, const Image& b)
{
    i32 worst = 0;
    for (i32 y = 0; y < a.get_height(); ++y)
    {
        for (i32 x = 0; x < a.get_width(); ++x)
        {
            const Rgb p = a.get(x, y);
            const Rgb q = b.get(x, y);
            worst = std::max({worst, std::abs(p.r - q.r), std::abs(p.g - q.g), std::abs(p.b - q.b)});
        }
    }
    return worst;
}

/// Texture whose channels change by a fraction of a level per output pixel.
Image make_smooth_texture()
{
    Image image(360, 181);
    for (i32 y = 0; y < image.get_height(); ++y)
    {
        for (i32 x = 0; x < image.get_width(); ++x)
        {
            image.set(x, y, Rgb{static_cast<u8>(100 + x / 12), static_cast<u8>(100 + y / 12), 100});
        }
    }
    return image;
}

/// Blue-dominated pixels carry the colour of the test moon; the planet texture has blue 100.
bool is_moon_pixel(Rgb pixel)
{
    return pixel.b > 150 && pixel.b > pixel.r + 80;
}

i32 count_moon_pixels(const Image& image)
{
    i32 count = 0;
    for (const auto& pixel : image.pixels())
    {
        if (is_moon_pixel(pixel))
        {
            ++count;
        }
    }
    return count;
}

} // anonymous namespace

// =================================================================
// Full renders
// =================================================================

TEST_CASE("Rendering the same request twice gives the same image")
{
    TextureRepository textures;
    textures.insert("Jupiter", test::make_gradient_texture(360, 181));
    PlanetRenderer renderer(textures);

    auto request = make_jupiter();
    request.config.illumination = true;
    const auto first = renderer.render(request);
    renderer.invalidate_on_date_change();
    const auto second = renderer.render(request);

    REQUIRE(first.image.get_width() == kSize);
    REQUIRE(first.image.get_height() == kSize);
    CHECK_FALSE(second.from_cache);
    CHECK(max_difference(first.image, second.image) == 0);
    CHECK(test::count_not(first.image, rendering::colors::kBlack) > 0);
}

TEST_CASE("Invalid settings are rejected with ConfigError")
{
    TextureRepository textures;
    PlanetRenderer renderer(textures);

    auto request = make_jupiter();
    request.config.width = 0;
    CHECK_THROWS_AS((void)renderer.render(request), ConfigError);
}

TEST_CASE("High quality renders come back at the output size")
{
    TextureRepository textures;
    textures.insert("Jupiter", test::make_gradient_texture(360, 181));
    PlanetRenderer renderer(textures);

    auto request = make_jupiter();
    request.config.high_quality = true;
    const auto frame = renderer.render(request);
    CHECK(frame.image.get_width() == kSize);
    CHECK(frame.image.get_height() == kSize);
}

// =================================================================
// Cached raster
// =================================================================

TEST_CASE("Panning is served from the cached raster")
{
    TextureRepository textures;
    textures.insert("Jupiter", test::make_gradient_texture(360, 181));
    PlanetRenderer renderer(textures);

    auto request = make_jupiter();
    const auto full = renderer.render(request);
    CHECK_FALSE(full.from_cache);
    CHECK(renderer.has_cached_frame());

    request.config.planet_center = Vec2d{120.0, 160.0};
    const auto panned = renderer.render(request);
    CHECK(panned.from_cache);

    renderer.invalidate_on_date_change();
    CHECK_FALSE(renderer.has_cached_frame());
    const auto reference = renderer.render(request);
    CHECK_FALSE(reference.from_cache);

    CHECK(max_difference(panned.image, reference.image) <= 2);
}

TEST_CASE("Zooming out is served from the cached raster within two levels")
{
    TextureRepository textures;
    textures.insert("Jupiter", make_smooth_texture());
    PlanetRenderer renderer(textures);

    auto request = make_jupiter();
    (void)renderer.render(request);

    // About 5% smaller disk
    request.config.telescope.field_arcsec *= 1.05;
    const auto zoomed = renderer.render(request);
    CHECK(zoomed.from_cache);

    renderer.invalidate_on_date_change();
    const auto reference = renderer.render(request);
    CHECK_FALSE(reference.from_cache);

    // Disk interior only, the limb is where nearest-neighbour rescaling steps
    const f64 radius = kRadius / 1.05;
    i32 worst = 0;
    i32 compared = 0;
    for (i32 y = 0; y < kSize; ++y)
    {
        for (i32 x = 0; x < kSize; ++x)
        {
            const f64 dx = x - 150.0;
            const f64 dy = y - 150.0;
            if (dx * dx + dy * dy > 0.8 * 0.8 * radius * radius)
            {
                continue;
            }
            const Rgb p = zoomed.image.get(x, y);
            const Rgb q = reference.image.get(x, y);
            worst = std::max({worst, std::abs(p.r - q.r), std::abs(p.g - q.g), std::abs(p.b - q.b)});
            ++compared;
        }
    }
    CHECK(compared > 1000);
    CHECK(worst <= 2);
}

TEST_CASE("Changing the quality flags forces a full render")
{
    TextureRepository textures;
    textures.insert("Jupiter", test::make_gradient_texture(360, 181));
    PlanetRenderer renderer(textures);

    auto request = make_jupiter();
    request.config.high_quality = true;
    (void)renderer.render(request);
    REQUIRE(renderer.has_cached_frame());

    request.config.high_quality = false;
    const auto normal = renderer.render(request);
    CHECK_FALSE(normal.from_cache);

    const auto again = renderer.render(request);
    CHECK(again.from_cache);
}

TEST_CASE("Moons are not baked into the diffracted cached raster")
{
    TextureRepository textures;
    textures.insert("Jupiter", make_smooth_texture());
    textures.insert("Io", Image(64, 32, Rgb{20, 20, 250}));
    PlanetRenderer renderer(textures);

    // Moon in front of the disk, 20 px right of the centre
    auto request = make_jupiter();
    request.config.diffraction = true;
    request.moons = {make_moon("Io", Vec3d{0.5, 0.0, -5.0}, request)};
    const auto full = renderer.render(request);
    REQUIRE(renderer.has_cached_frame());
    REQUIRE(count_moon_pixels(full.image) > 0);

    // Hiding the moons keeps the planet raster, which must not show the moon
    request.config.satellites = false;
    request.config.planet_center = Vec2d{130.0, 150.0};
    const auto panned = renderer.render(request);
    CHECK(panned.from_cache);
    CHECK(count_moon_pixels(panned.image) == 0);

    // With moons shown again the only moon is the one drawn at its new place
    request.config.satellites = true;
    const auto shown = renderer.render(request);
    CHECK(shown.from_cache);
    CHECK(is_moon_pixel(shown.image.get(150, 150)));
    CHECK_FALSE(is_moon_pixel(shown.image.get(170, 150)));
}

TEST_CASE("Untextured frames are not cached")
{
    TextureRepository textures;
    PlanetRenderer renderer(textures);

    auto request = make_jupiter();
    request.config.textures = false;
    (void)renderer.render(request);
    CHECK_FALSE(renderer.has_cached_frame());

    const auto again = renderer.render(request);
    CHECK_FALSE(again.from_cache);
}

// =================================================================
// Queries on the last frame
// =================================================================

TEST_CASE("Queries before the first frame return nothing")
{
    TextureRepository textures;
    PlanetRenderer renderer(textures);

    CHECK_FALSE(renderer.screen_to_planetographic(150.0, 150.0).has_value());
    CHECK_FALSE(renderer.planetographic_to_screen(Planetographic{0.0, 0.0}).has_value());
    CHECK_FALSE(renderer.pick_body(150.0, 150.0).has_value());
    CHECK(renderer.get_satellite_picks().empty());
}

TEST_CASE("Screen positions map to the planet after a render")
{
    TextureRepository textures;
    textures.insert("Jupiter", test::make_gradient_texture(360, 181));
    PlanetRenderer renderer(textures);

    auto request = make_jupiter();
    request.body.central_meridian_ii = 1.0;
    (void)renderer.render(request);

    const auto centre = renderer.screen_to_planetographic(150.0, 150.0);
    REQUIRE(centre.has_value());
    CHECK(centre->latitude == doctest::Approx(0.0).epsilon(1e-6));

    const auto back = renderer.planetographic_to_screen(*centre);
    REQUIRE(back.has_value());
    CHECK(back->x == doctest::Approx(150.0).epsilon(1e-3));
    CHECK(back->y == doctest::Approx(150.0).epsilon(1e-3));

    CHECK_FALSE(renderer.screen_to_planetographic(10.0, 10.0).has_value());
}

TEST_CASE("Picking finds the planet and the moons in front of it")
{
    TextureRepository textures;
    PlanetRenderer renderer(textures);

    auto request = make_jupiter();
    request.config.textures = false;
    request.moons = {make_moon("Io", Vec3d{3.0, 0.0, -1.0}, request)};
    (void)renderer.render(request);

    const auto planet = renderer.pick_body(150.0, 150.0);
    REQUIRE(planet.has_value());
    CHECK(planet->name == "Jupiter");
    CHECK_FALSE(planet->moon_index.has_value());

    const auto picks = renderer.get_satellite_picks();
    REQUIRE(picks.size() == 1);
    CHECK(picks[0].position.x == doctest::Approx(150.0 + 3.0 * kRadius).epsilon(1e-6));
    CHECK(picks[0].position.y == doctest::Approx(150.0).epsilon(1e-6));

    const auto moon = renderer.pick_body(picks[0].position.x, picks[0].position.y);
    REQUIRE(moon.has_value());
    CHECK(moon->name == "Io");
    REQUIRE(moon->moon_index.has_value());
    CHECK(*moon->moon_index == 0);

    CHECK_FALSE(renderer.pick_body(5.0, 5.0).has_value());
}

TEST_CASE("A broken satellite ephemeris does not abort the frame")
{
    TextureRepository textures;
    textures.insert("Jupiter", test::make_gradient_texture(360, 181));
    PlanetRenderer renderer(textures);

    auto request = make_jupiter();
    auto moon = make_moon("Io", Vec3d{3.0, 0.0, -1.0}, request);
    moon.position.x = std::numeric_limits<f64>::quiet_NaN();
    request.moons = {moon};

    rendering::RenderedFrame frame;
    CHECK_NOTHROW(frame = renderer.render(request));
    CHECK(renderer.get_satellite_picks().empty());
    CHECK(test::count_not(frame.image, rendering::colors::kBlack) > 0);
}

// =================================================================
// Stereo output
// =================================================================

TEST_CASE("Stereo frames carry both eye views")
{
    TextureRepository textures;
    textures.insert("Jupiter", test::make_gradient_texture(360, 181));
    PlanetRenderer renderer(textures);

    auto request = make_jupiter();
    request.config.anaglyph = AnaglyphMode::RedCyan;
    const auto frame = renderer.render(request);

    REQUIRE(frame.left.has_value());
    REQUIRE(frame.right.has_value());
    CHECK(frame.left->get_width() == kSize);
    CHECK(frame.right->get_width() == kSize);
    CHECK(frame.image.get_width() == kSize);

    request.config.anaglyph = AnaglyphMode::None;
    renderer.invalidate_on_date_change();
    const auto mono = renderer.render(request);
    CHECK_FALSE(mono.left.has_value());
    CHECK_FALSE(mono.right.has_value());
}
