/// @file test_diffraction.cpp
/// @brief Unit tests for the telescope point-spread function and the frame convolution.

#include <doctest/doctest.h>

#include "planet/diffraction.hpp"
#include "rendering/raster_canvas.hpp"
#include "test_helpers.hpp"

using namespace planetrender;
using namespace planetrender::planet;
using rendering::Image;
using rendering::Rgb;

namespace
{

Telescope make_large_telescope()
{
    Telescope telescope;
    telescope.aperture_mm = 300.0;  // 5" pattern, 51 samples per side
    telescope.field_arcsec = 5.0;
    return telescope;
}

} // anonymous namespace

// =================================================================
// Pattern
// =================================================================

TEST_CASE("Pattern size follows the aperture")
{
    const auto pattern = Diffraction::compute_pattern(make_large_telescope());
    CHECK(pattern.field_arcsec == 5);
    CHECK(pattern.size == 51);
    CHECK(pattern.intensity.size() == 51u * 51u);
}

TEST_CASE("Pattern peaks at one in the centre")
{
    const auto pattern = Diffraction::compute_pattern(make_large_telescope());
    CHECK(pattern.at(25, 25) == doctest::Approx(1.0));

    bool bounded = true;
    for (const f64 value : pattern.intensity)
    {
        bounded &= value >= 0.0 && value <= 1.0 + 1e-9;
    }
    CHECK(bounded);

    // First dark ring of a 300 mm aperture is at 0.47"
    CHECK(pattern.at(30, 25) < 0.05);
    CHECK(pattern.at(26, 25) > 0.5);
}

TEST_CASE("Pattern is point symmetric and deterministic")
{
    const auto telescope = make_large_telescope();
    const auto a = Diffraction::compute_pattern(telescope);
    const auto b = Diffraction::compute_pattern(telescope);
    CHECK(a.intensity == b.intensity);

    CHECK(a.at(20, 28) == doctest::Approx(a.at(30, 22)).epsilon(1e-9));
    CHECK(a.at(10, 40) == doctest::Approx(a.at(40, 10)).epsilon(1e-9));
}

TEST_CASE("Central obstruction changes the pattern")
{
    auto telescope = make_large_telescope();
    const auto clear = Diffraction::compute_pattern(telescope);
    telescope.central_obstruction = 0.35;
    const auto obstructed = Diffraction::compute_pattern(telescope);

    CHECK(obstructed.at(25, 25) == doctest::Approx(1.0));
    CHECK(obstructed.intensity != clear.intensity);
}

TEST_CASE("Zero aperture degenerates to a single sample")
{
    Telescope telescope;
    telescope.aperture_mm = 0.0;
    const auto pattern = Diffraction::compute_pattern(telescope);
    CHECK(pattern.size == 11);
    CHECK(pattern.at(5, 5) == doctest::Approx(1.0));
    CHECK(pattern.at(4, 5) == doctest::Approx(0.0));
}

// =================================================================
// Convolution
// =================================================================

TEST_CASE("Blank frames stay blank")
{
    const auto telescope = make_large_telescope();
    const auto pattern = Diffraction::compute_pattern(telescope);
    const Image input(40, 40);

    const auto planes = Diffraction::convolve(pattern, input, telescope.field_arcsec, rendering::colors::kBlack);
    const Image output = Diffraction::reassemble(planes, input, 0, rendering::colors::kBlack);
    CHECK(output == input);
}

TEST_CASE("A point source becomes a dimmer blob")
{
    const auto telescope = make_large_telescope();
    const auto pattern = Diffraction::compute_pattern(telescope);
    rendering::RasterCanvas canvas(60, 60);
    canvas.set_pixel(30, 30, rendering::colors::kWhite, 1.0);

    Diffraction::apply(canvas, pattern, telescope);

    const Rgb peak = canvas.get_pixel(30, 30);
    CHECK(peak.r < 255);
    CHECK(peak.r >= diffraction_constants::kBackgroundThreshold);
    CHECK(peak.r == peak.g);
    CHECK(peak.g == peak.b);
    CHECK(canvas.get_pixel(45, 30) == rendering::colors::kBlack);
    // Colour only, the depth buffer is untouched
    CHECK(canvas.get_depth(30, 30) == doctest::Approx(1.0));
}

TEST_CASE("Reassembly shifts red down and blue up")
{
    ChannelPlanes planes;
    planes.width = 3;
    planes.height = 3;
    planes.red.assign(9, 0);
    planes.green.assign(9, 0);
    planes.blue.assign(9, 0);
    planes.red[planes.index(1, 1)] = 200;
    planes.green[planes.index(1, 1)] = 200;
    planes.blue[planes.index(1, 1)] = 200;

    const Image input(3, 3);
    const Image output = Diffraction::reassemble(planes, input, 1, rendering::colors::kBlack);
    CHECK(output.get(1, 0) == Rgb{200, 0, 0});
    CHECK(output.get(1, 1) == Rgb{0, 200, 0});
    CHECK(output.get(1, 2) == Rgb{0, 0, 200});
    CHECK(output.get(0, 0) == rendering::colors::kBlack);
}

TEST_CASE("Mismatched planes leave the frame unchanged")
{
    ChannelPlanes planes;
    planes.width = 2;
    planes.height = 2;
    planes.red.assign(4, 255);
    planes.green.assign(4, 255);
    planes.blue.assign(4, 255);

    const Image input(3, 3, Rgb{1, 2, 3});
    CHECK(Diffraction::reassemble(planes, input, 0, rendering::colors::kBlack) == input);
}
