#pragma once

/// @file diffraction.hpp
/// @brief Telescope point-spread function and its convolution with the rendered frame.
///
/// The pattern is the squared Fourier amplitude of the entrance pupil, summed
/// over a cartesian reticle and a polar ring grid of the aperture, with the
/// central obstruction and the spider vanes masked out. It spans
/// 1500 / aperture_mm arcseconds sampled ten times per arcsecond.

#include "observatory/telescope.hpp"
#include "rendering/canvas.hpp"

#include <vector>

namespace planetrender::planet
{
    namespace diffraction_constants
    {
        /// Effective visual wavelength [cm].
        constexpr f64 kWavelengthCm = 0.000056;
        /// Aperture divisions per diameter of the cartesian reticle.
        constexpr f64 kReticleDivisions = 16.0;
        /// Pattern samples per arcsecond.
        constexpr i32 kSamplesPerArcsec = 10;
        /// Taps contributing this little (sum of channels) are skipped.
        constexpr i32 kTapThreshold = 5;
        /// Convolved pixels with every channel below this become background.
        constexpr i32 kBackgroundThreshold = 10;
    }

    /// @brief Sampled intensity of the point-spread function.
    struct DiffractionPattern
    {
        i32 field_arcsec = 1;
        i32 size = 0;                 ///< Samples per side, kSamplesPerArcsec * field + 1
        std::vector<f64> intensity;   ///< Indexed [i * size + j], i along x; 1 at the centre

        [[nodiscard]] f64 at(i32 i, i32 j) const
        {
            return intensity[static_cast<std::size_t>(i) * static_cast<std::size_t>(size) + static_cast<std::size_t>(j)];
        }
    };

    /// @brief Per-channel accumulation planes of a convolved image.
    struct ChannelPlanes
    {
        i32 width = 0;
        i32 height = 0;
        std::vector<i32> red;
        std::vector<i32> green;
        std::vector<i32> blue;

        [[nodiscard]] std::size_t index(i32 x, i32 y) const
        {
            return static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x);
        }
    };

    /// @brief Static utility class simulating the telescope optics on a finished frame.
    class Diffraction
    {
    public:
        Diffraction() = delete;

        /// @brief Point-spread function of @p telescope. Deterministic.
        [[nodiscard]] static DiffractionPattern compute_pattern(const Telescope& telescope);

        /// @brief Spread every non-background pixel of @p input by the pattern.
        /// @param field_arcsec Field of view across the image width.
        [[nodiscard]] static ChannelPlanes convolve(const DiffractionPattern& pattern, const rendering::Image& input,
                                                    f64 field_arcsec, rendering::Rgb background);

        /// @brief Rebuild an image from the planes with red shifted down and blue
        /// shifted up by @p chromatic_offset rows. Pixels that come out black or
        /// equal to the background keep their value from @p input.
        [[nodiscard]] static rendering::Image reassemble(const ChannelPlanes& planes, const rendering::Image& input,
                                                         i32 chromatic_offset, rendering::Rgb background);

        /// @brief Convolve the whole canvas in place.
        static void apply(rendering::Canvas& canvas, const DiffractionPattern& pattern, const Telescope& telescope);
    };

} // namespace planetrender::planet
