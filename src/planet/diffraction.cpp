/// @file diffraction.cpp
/// @brief Pupil Fourier sampling and the spread of the frame by the resulting pattern.

#include "planet/diffraction.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace planetrender::planet
{

using namespace diffraction_constants;
using rendering::Image;
using rendering::Rgb;

namespace
{
    struct Tap
    {
        i32 dx = 0;
        i32 dy = 0;
        f64 intensity = 0.0;
    };

    struct PupilMask
    {
        f64 radius = 0.0;
        f64 obstruction = 0.0;  ///< Fraction of the radius
        f64 spider = 0.0;       ///< Fraction of the radius

        [[nodiscard]] bool is_open(f64 x, f64 y) const
        {
            const f64 r = std::sqrt(x * x + y * y);
            return r <= radius && r >= obstruction * radius
                && std::fabs(x) >= spider * radius && std::fabs(y) >= spider * radius;
        }
    };
}

// -----------------------------------------------------------------
// Pattern
// -----------------------------------------------------------------

DiffractionPattern Diffraction::compute_pattern(const Telescope& telescope)
{
    DiffractionPattern pattern;
    pattern.field_arcsec = telescope.diffractionPatternField_arcsec();

    const f64 diameter = telescope.aperture_cm();
    PupilMask mask;
    mask.radius = diameter * 0.5;
    mask.obstruction = std::clamp(telescope.central_obstruction, 0.0, 1.0);
    mask.spider = diameter > 0.0 ? telescope.spider_cm() / diameter : 0.0;

    const i32 resolution = kSamplesPerArcsec * pattern.field_arcsec;
    pattern.size = resolution + 1;
    const std::size_t count = static_cast<std::size_t>(pattern.size) * static_cast<std::size_t>(pattern.size);
    pattern.intensity.assign(count, 0.0);

    if (mask.radius <= 0.0)
    {
        pattern.intensity[static_cast<std::size_t>(pattern.size / 2) * static_cast<std::size_t>(pattern.size)
                          + static_cast<std::size_t>(pattern.size / 2)] = 1.0;
        return pattern;
    }

    // Spatial frequencies per sample, one tenth of an arcsecond apart
    const f64 ct = astro_constants::kTwoPi / (kWavelengthCm * astro_constants::kRadToArcSec);
    std::vector<f64> freq_x(static_cast<std::size_t>(pattern.size));
    std::vector<f64> freq_y(static_cast<std::size_t>(pattern.size));
    for (i32 i = 0; i < pattern.size; ++i)
    {
        freq_x[static_cast<std::size_t>(i)] = ct * (i - resolution / 2) / kSamplesPerArcsec;
        freq_y[static_cast<std::size_t>(i)] = -ct * (i - resolution / 2) / kSamplesPerArcsec;
    }

    std::vector<f64> amplitude(count, 0.0);
    const auto accumulate = [&](f64 x, f64 y) {
        if (!mask.is_open(x, y))
        {
            return;
        }
        for (i32 i = 0; i < pattern.size; ++i)
        {
            const f64 phase_x = x * freq_x[static_cast<std::size_t>(i)];
            f64* row = &amplitude[static_cast<std::size_t>(i) * static_cast<std::size_t>(pattern.size)];
            for (i32 j = 0; j < pattern.size; ++j)
            {
                row[j] += std::cos(phase_x + y * freq_y[static_cast<std::size_t>(j)]);
            }
        }
    };

    // Cartesian reticle over the aperture
    f64 dr = 2.0 * mask.radius / kReticleDivisions;
    for (f64 y = mask.radius; y >= -mask.radius; y -= dr)
    {
        for (f64 x = -mask.radius; x <= mask.radius; x += dr)
        {
            accumulate(x, y);
        }
    }

    // Concentric rings at half the step, each starting a quarter step off the x axis
    dr *= 0.5;
    for (f64 r0 = dr; r0 <= mask.radius; r0 += dr)
    {
        const f64 dt = astro_constants::kTwoPi * dr / (3.0 * r0);
        const f64 end = astro_constants::kTwoPi - dt;
        for (f64 t = dt * 0.25; t <= end; t += dt)
        {
            accumulate(r0 * std::cos(t), r0 * std::sin(t));
        }
    }

    const f64 center = amplitude[static_cast<std::size_t>(resolution / 2) * static_cast<std::size_t>(pattern.size)
                                 + static_cast<std::size_t>(resolution / 2)];
    const f64 norm = center * center;
    for (std::size_t k = 0; k < count; ++k)
    {
        pattern.intensity[k] = norm > 0.0 ? amplitude[k] * amplitude[k] / norm : 0.0;
    }

    PLR_CORE_DEBUG("Diffraction pattern: {} arcsec, {}x{} samples, aperture {:.1f} mm",
                   pattern.field_arcsec, pattern.size, pattern.size, telescope.aperture_mm);
    return pattern;
}

// -----------------------------------------------------------------
// Convolution
// -----------------------------------------------------------------

ChannelPlanes Diffraction::convolve(const DiffractionPattern& pattern, const Image& input, f64 field_arcsec, Rgb background)
{
    ChannelPlanes planes;
    planes.width = input.get_width();
    planes.height = input.get_height();
    const std::size_t count = static_cast<std::size_t>(planes.width) * static_cast<std::size_t>(planes.height);
    planes.red.assign(count, 0);
    planes.green.assign(count, 0);
    planes.blue.assign(count, 0);

    if (count == 0 || pattern.size == 0 || field_arcsec <= 0.0)
    {
        return planes;
    }

    // Pattern sample spacing in canvas pixels
    const f64 sf = pattern.field_arcsec * 0.5 * planes.width / field_arcsec;
    const f64 center = pattern.size * 0.5;
    const i32 block = static_cast<i32>(0.5 + 0.5 * sf / (pattern.field_arcsec * kSamplesPerArcsec));

    // Taps that can never pass the threshold, even on a white pixel, are dropped up front
    std::vector<Tap> taps;
    f64 norm = 0.0;
    for (i32 i = 0; i < pattern.size; ++i)
    {
        const i32 dx = static_cast<i32>(sf * (i - center) / center);
        for (i32 j = 0; j < pattern.size; ++j)
        {
            const f64 amplitude = pattern.at(i, j);
            const f64 intensity = amplitude * amplitude;
            norm += intensity;
            if (3 * static_cast<i32>(255.0 * intensity) > kTapThreshold)
            {
                taps.push_back({dx, static_cast<i32>(sf * (j - center) / center), intensity});
            }
        }
    }

    for (i32 y = 0; y < planes.height; ++y)
    {
        for (i32 x = 0; x < planes.width; ++x)
        {
            const Rgb source = input.get(x, y);
            if (source == background)
            {
                continue;
            }
            for (const Tap& tap : taps)
            {
                const i32 tx = x + tap.dx;
                const i32 ty = y + tap.dy;
                if (tx < block || tx >= planes.width - block || ty < block || ty >= planes.height - block)
                {
                    continue;
                }
                const i32 red = static_cast<i32>(source.r * tap.intensity);
                const i32 green = static_cast<i32>(source.g * tap.intensity);
                const i32 blue = static_cast<i32>(source.b * tap.intensity);
                if (red + green + blue <= kTapThreshold)
                {
                    continue;
                }
                for (i32 by = ty - block; by <= ty + block; ++by)
                {
                    for (i32 bx = tx - block; bx <= tx + block; ++bx)
                    {
                        const std::size_t k = planes.index(bx, by);
                        planes.red[k] += red;
                        planes.green[k] += green;
                        planes.blue[k] += blue;
                    }
                }
            }
        }
    }

    norm *= static_cast<f64>((1 + 2 * block) * (1 + 2 * block));
    if (norm <= 0.0)
    {
        return planes;
    }

    for (std::size_t k = 0; k < count; ++k)
    {
        const i32 red = static_cast<i32>(planes.red[k] / norm);
        const i32 green = static_cast<i32>(planes.green[k] / norm);
        const i32 blue = static_cast<i32>(planes.blue[k] / norm);
        if (red < kBackgroundThreshold && green < kBackgroundThreshold && blue < kBackgroundThreshold)
        {
            planes.red[k] = background.r;
            planes.green[k] = background.g;
            planes.blue[k] = background.b;
            continue;
        }
        planes.red[k] = red;
        planes.green[k] = green;
        planes.blue[k] = blue;
    }
    return planes;
}

// -----------------------------------------------------------------
// Chromatic reassembly
// -----------------------------------------------------------------

Image Diffraction::reassemble(const ChannelPlanes& planes, const Image& input, i32 chromatic_offset, Rgb background)
{
    Image output = input;
    if (planes.width != input.get_width() || planes.height != input.get_height())
    {
        PLR_CORE_WARN("Diffraction planes {}x{} do not match the frame {}x{}", planes.width, planes.height,
                      input.get_width(), input.get_height());
        return output;
    }

    const i32 offset = std::max(chromatic_offset, 0);
    for (i32 y = 0; y < planes.height; ++y)
    {
        for (i32 x = 0; x < planes.width; ++x)
        {
            i32 red = background.r;
            if (y < planes.height - offset)
            {
                red = planes.red[planes.index(x, y + offset)];
            }
            const i32 green = planes.green[planes.index(x, y)];
            i32 blue = background.b;
            if (y >= offset)
            {
                blue = planes.blue[planes.index(x, y - offset)];
            }

            const Rgb color{rendering::clamp_channel(red), rendering::clamp_channel(green), rendering::clamp_channel(blue)};
            if (color.r + color.g + color.b > 0 && color != background)
            {
                output.set(x, y, color);
            }
        }
    }
    return output;
}

void Diffraction::apply(rendering::Canvas& canvas, const DiffractionPattern& pattern, const Telescope& telescope)
{
    const i32 width = canvas.get_width();
    const i32 height = canvas.get_height();
    const Rgb background = canvas.get_background();

    Image input(width, height);
    for (i32 y = 0; y < height; ++y)
    {
        for (i32 x = 0; x < width; ++x)
        {
            input.set(x, y, canvas.get_pixel(x, y));
        }
    }

    const ChannelPlanes planes = convolve(pattern, input, telescope.field_arcsec, background);
    const i32 chromatic_offset =
        telescope.field_arcsec > 0.0
            ? static_cast<i32>(telescope.chromatism_arcsec * 0.5 * width / telescope.field_arcsec)
            : 0;
    const Image output = reassemble(planes, input, chromatic_offset, background);

    for (i32 y = 0; y < height; ++y)
    {
        for (i32 x = 0; x < width; ++x)
        {
            const Rgb color = output.get(x, y);
            if (color != input.get(x, y))
            {
                canvas.set_color(x, y, color);
            }
        }
    }
}

} // namespace planetrender::planet
