/// @file test_refraction.cpp
/// @brief Unit tests for the atmospheric refraction warp of a finished frame.

#include <doctest/doctest.h>

#include "planet/refraction.hpp"

using namespace planetrender;
using namespace planetrender::planet;
using rendering::FrameSnapshot;
using rendering::Image;
using rendering::Rgb;

namespace
{

/// Vertical bar of colour, one row per line, depth equal to the row.
FrameSnapshot make_rows(i32 size)
{
    FrameSnapshot frame;
    frame.color = Image(size, size);
    frame.depth.resize(static_cast<std::size_t>(size) * static_cast<std::size_t>(size));
    for (i32 y = 0; y < size; ++y)
    {
        for (i32 x = 0; x < size; ++x)
        {
            frame.color.set(x, y, Rgb{static_cast<u8>(y), 0, 0});
            frame.depth[static_cast<std::size_t>(y) * static_cast<std::size_t>(size) + static_cast<std::size_t>(x)] = y;
        }
    }
    return frame;
}

} // anonymous namespace

TEST_CASE("Warp is visible only when the limb moves more than a pixel")
{
    CHECK_FALSE(Refraction::is_visible(100.0, 1.0));
    CHECK_FALSE(Refraction::is_visible(100.0, 0.99));
    CHECK(Refraction::is_visible(100.0, 0.9));
    CHECK_FALSE(Refraction::is_visible(5.0, 0.9));
}

TEST_CASE("A factor of one leaves the frame unchanged")
{
    const auto frame = make_rows(21);
    const auto out = Refraction::apply(frame, Vec2d{10.0, 10.0}, 1.0, 0.0, rendering::colors::kBlack);
    CHECK(out.color == frame.color);
    CHECK(out.depth == frame.depth);
}

TEST_CASE("Frame is squeezed towards the centre along the vertical")
{
    const auto frame = make_rows(21);
    const auto out = Refraction::apply(frame, Vec2d{10.0, 10.0}, 0.5, 0.0, rendering::colors::kBlack);

    // Centre row is fixed, row 12 samples row 14
    CHECK(out.color.get(5, 10).r == 10);
    CHECK(out.color.get(5, 12).r == 14);
    CHECK(out.depth[12 * 21 + 5] == doctest::Approx(14.0));

    // Rows sampling beyond the frame become background
    CHECK(out.color.get(5, 20) == rendering::colors::kBlack);
    CHECK(out.depth[20 * 21 + 5] == rendering::depth::kBackground);
}

TEST_CASE("A quarter-turn zenith angle squeezes horizontally")
{
    const auto frame = make_rows(21);
    const auto out = Refraction::apply(frame, Vec2d{10.0, 10.0}, 0.5, astro_constants::kHalfPi, rendering::colors::kBlack);

    // Rows are untouched near the centre column
    CHECK(out.color.get(10, 4).r == 4);
    CHECK(out.color.get(10, 16).r == 16);
}

TEST_CASE("Invalid factor returns the input")
{
    const auto frame = make_rows(5);
    const auto out = Refraction::apply(frame, Vec2d{2.0, 2.0}, 0.0, 0.0, rendering::colors::kBlack);
    CHECK(out.color == frame.color);
}
