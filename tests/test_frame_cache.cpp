/// @file test_frame_cache.cpp
/// @brief Unit tests for fast-path eligibility and snapshot resampling.

#include <doctest/doctest.h>

#include "planet/frame_cache.hpp"
#include "test_helpers.hpp"

using namespace planetrender;
using namespace planetrender::planet;
using rendering::FrameSnapshot;
using rendering::Image;
using rendering::Rgb;

namespace
{

CachedFrame make_cached(const FrameRequest& request, f64 scale)
{
    CachedFrame frame;
    frame.request = request;
    frame.snapshot.color = Image(4, 4, Rgb{9, 9, 9});
    frame.snapshot.depth.assign(16, 0.5);
    frame.scale = scale;
    frame.center = request.config.get_planet_center();
    return frame;
}

} // anonymous namespace

// =================================================================
// Eligibility
// =================================================================

TEST_CASE("Empty cache finds nothing")
{
    const FrameCache cache;
    CHECK(cache.empty());
    CHECK(cache.find(test::make_request(astro::Target::Jupiter, 300, 50.0), 40.0) == nullptr);
}

TEST_CASE("Cached raster serves equal or smaller disks")
{
    const auto request = test::make_request(astro::Target::Jupiter, 300, 50.0);
    FrameCache cache;
    cache.store(make_cached(request, 50.0));
    REQUIRE_FALSE(cache.empty());

    auto zoomed_out = request;
    zoomed_out.config.telescope.field_arcsec *= 2.0;
    zoomed_out.config.planet_center = Vec2d{40.0, 80.0};

    const CachedFrame* hit = cache.find(zoomed_out, 25.0);
    REQUIRE(hit != nullptr);
    CHECK(hit->scale == doctest::Approx(50.0));
    CHECK(cache.find(request, 50.0) != nullptr);

    // Upscaling would blur the raster
    CHECK(cache.find(request, 60.0) == nullptr);
}

TEST_CASE("Textures off, the Sun and dissimilar requests bypass the cache")
{
    const auto request = test::make_request(astro::Target::Jupiter, 300, 50.0);
    FrameCache cache;
    cache.store(make_cached(request, 50.0));

    auto untextured = request;
    untextured.config.textures = false;
    CHECK(cache.find(untextured, 40.0) == nullptr);

    auto diffraction = request;
    diffraction.config.diffraction = true;
    CHECK(cache.find(diffraction, 40.0) == nullptr);

    const auto sun = test::make_request(astro::Target::Sun, 300, 50.0);
    cache.store(make_cached(sun, 50.0));
    CHECK(cache.find(sun, 40.0) == nullptr);
}

TEST_CASE("Tiny disks are never served from the cache")
{
    const auto request = test::make_request(astro::Target::Jupiter, 300, 50.0);
    FrameCache cache;

    cache.store(make_cached(request, cache_constants::kMinScale));
    CHECK(cache.find(request, 1.0) == nullptr);

    cache.store(make_cached(request, 50.0));
    CHECK(cache.find(request, 1.0) != nullptr);

    // Wide fields additionally need the requested disk above the minimum
    auto wide = request;
    wide.config.telescope.field_arcsec = cache_constants::kWideField;
    CHECK(cache.find(wide, 1.0) == nullptr);
    CHECK(cache.find(wide, 3.0) != nullptr);
}

TEST_CASE("Storing replaces the previous frame and clear empties the cache")
{
    const auto request = test::make_request(astro::Target::Mars, 300, 50.0);
    FrameCache cache;
    cache.store(make_cached(request, 50.0));
    cache.store(make_cached(request, 30.0));

    CHECK(cache.find(request, 50.0) == nullptr);
    const CachedFrame* hit = cache.find(request, 30.0);
    REQUIRE(hit != nullptr);
    CHECK(hit->scale == doctest::Approx(30.0));

    cache.clear();
    CHECK(cache.empty());
}

TEST_CASE("Clip margin grows for ringed bodies")
{
    CHECK(FrameCache::get_clip_margin(astro::Target::Mars, 10.0) == 13);
    CHECK(FrameCache::get_clip_margin(astro::Target::Saturn, 10.0) == 13 * cache_constants::kRingedClipFactor);
}

// =================================================================
// Resampling
// =================================================================

TEST_CASE("Resampling to the same size is a copy")
{
    FrameSnapshot snapshot;
    snapshot.color = test::make_gradient_texture(5, 5);
    snapshot.depth.assign(25, 0.25);

    const auto out = resample(snapshot, 5, 5);
    CHECK(out.color == snapshot.color);
    CHECK(out.depth == snapshot.depth);
}

TEST_CASE("Depth is resampled by nearest sample")
{
    FrameSnapshot snapshot;
    snapshot.color = Image(4, 4);
    snapshot.depth.resize(16);
    for (std::size_t k = 0; k < 16; ++k)
    {
        snapshot.depth[k] = static_cast<f64>(k);
    }

    const auto out = resample(snapshot, 2, 2);
    REQUIRE(out.depth.size() == 4);
    CHECK(out.depth[0] == doctest::Approx(5.0));   // source (1, 1)
    CHECK(out.depth[1] == doctest::Approx(7.0));   // source (3, 1)
    CHECK(out.depth[3] == doctest::Approx(15.0));  // source (3, 3)
    CHECK(out.color.get_width() == 2);
}

TEST_CASE("Missing depth resamples to background")
{
    FrameSnapshot snapshot;
    snapshot.color = Image(4, 4, Rgb{50, 50, 50});

    const auto out = resample(snapshot, 8, 8);
    CHECK(out.color.get(3, 3) == Rgb{50, 50, 50});
    CHECK(out.depth[0] == rendering::depth::kBackground);
}
