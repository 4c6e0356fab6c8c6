/// @file test_stereo.cpp
/// @brief Unit tests for disparity, eye view derivation and anaglyph packing.

#include <doctest/doctest.h>

#include "planet/stereo.hpp"

using namespace planetrender;
using namespace planetrender::planet;
using rendering::FrameSnapshot;
using rendering::Image;
using rendering::Rgb;

namespace
{

FrameSnapshot make_snapshot(i32 width, i32 height)
{
    FrameSnapshot frame;
    frame.color = Image(width, height);
    frame.depth.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), rendering::depth::kBackground);
    return frame;
}

void put(FrameSnapshot& frame, i32 x, i32 y, Rgb color, f64 depth)
{
    frame.color.set(x, y, color);
    frame.depth[static_cast<std::size_t>(y) * static_cast<std::size_t>(frame.color.get_width()) + static_cast<std::size_t>(x)] = depth;
}

} // anonymous namespace

// =================================================================
// Disparity
// =================================================================

TEST_CASE("Disparity grows with depth and eye separation")
{
    CHECK(Stereo::get_disparity(0.0, 40.0, 0.5) == doctest::Approx(0.0));
    CHECK(Stereo::get_disparity(1.0, 40.0, 0.5) == doctest::Approx(10.0));
    CHECK(Stereo::get_disparity(-1.0, 40.0, 0.5) == doctest::Approx(-10.0));
    CHECK(Stereo::get_disparity(1.0, 40.0, 1.0) == doctest::Approx(20.0));
}

TEST_CASE("Disparity is clamped at the reference depth")
{
    CHECK(Stereo::get_disparity(10.0, 40.0, 1.0) == doctest::Approx(kStereoReferenceDepth * 0.5));
    CHECK(Stereo::get_disparity(-10.0, 40.0, 1.0) == doctest::Approx(-kStereoReferenceDepth * 0.5));
}

TEST_CASE("Background and overlays are not shifted")
{
    CHECK(Stereo::get_disparity(rendering::depth::kBackground, 40.0, 1.0) == 0.0);
    CHECK(Stereo::get_disparity(rendering::depth::kOverlay, 40.0, 1.0) == 0.0);
}

// =================================================================
// Eye views
// =================================================================

TEST_CASE("Near pixels shift in opposite directions for each eye")
{
    auto frame = make_snapshot(20, 5);
    put(frame, 10, 2, Rgb{200, 100, 50}, 0.5);

    // 0.5 * 4 px/radius * 2 / 2 = 2 px
    const auto pair = Stereo::derive(frame, 4.0, 2.0);
    CHECK(pair.left.get(12, 2) == Rgb{200, 100, 50});
    CHECK(pair.right.get(8, 2) == Rgb{200, 100, 50});
    // Hole keeps the source pixel
    CHECK(pair.left.get(10, 2) == Rgb{200, 100, 50});
}

TEST_CASE("Nearest surface wins when shifted pixels collide")
{
    auto frame = make_snapshot(20, 1);
    put(frame, 8, 0, Rgb{255, 0, 0}, 1.0);   // shifted to 10 in the left eye
    put(frame, 10, 0, Rgb{0, 0, 255}, 0.0);  // stays at 10

    const auto pair = Stereo::derive(frame, 2.0, 2.0);
    CHECK(pair.left.get(10, 0) == Rgb{255, 0, 0});
}

TEST_CASE("Mismatched depth buffer leaves both eyes identical")
{
    FrameSnapshot frame;
    frame.color = Image(4, 4, Rgb{7, 7, 7});
    const auto pair = Stereo::derive(frame, 10.0, 1.0);
    CHECK(pair.left == frame.color);
    CHECK(pair.right == frame.color);
}

// =================================================================
// Packing
// =================================================================

TEST_CASE("Red-cyan takes red from the left eye")
{
    const StereoPair pair{Image(2, 2, Rgb{200, 10, 20}), Image(2, 2, Rgb{30, 150, 160})};
    const Image out = Stereo::pack(pair, AnaglyphMode::RedCyan);
    CHECK(out.get(1, 1) == Rgb{200, 150, 160});
}

TEST_CASE("Side by side doubles the width")
{
    const StereoPair pair{Image(3, 2, Rgb{1, 1, 1}), Image(3, 2, Rgb{2, 2, 2})};
    const Image out = Stereo::pack(pair, AnaglyphMode::LeftRight);
    CHECK(out.get_width() == 6);
    CHECK(out.get_height() == 2);
    CHECK(out.get(2, 0) == Rgb{1, 1, 1});
    CHECK(out.get(3, 0) == Rgb{2, 2, 2});
}

TEST_CASE("Half-width side by side keeps the frame size")
{
    const StereoPair pair{Image(8, 2, Rgb{1, 1, 1}), Image(8, 2, Rgb{2, 2, 2})};
    const Image out = Stereo::pack(pair, AnaglyphMode::LeftRightHalfWidth);
    CHECK(out.get_width() == 8);
    CHECK(out.get(0, 0) == Rgb{1, 1, 1});
    CHECK(out.get(7, 1) == Rgb{2, 2, 2});
}

TEST_CASE("Dubois projection of neutral colours")
{
    CHECK(Stereo::combine_dubois(rendering::colors::kBlack, rendering::colors::kBlack) == rendering::colors::kBlack);

    const Rgb white = Stereo::combine_dubois(rendering::colors::kWhite, rendering::colors::kWhite);
    // Left row sums 0.437+0.449+0.164 = 1.05, right row sum is negative: clamped
    CHECK(white.r == 255);
    CHECK(white.b == 255);
}
