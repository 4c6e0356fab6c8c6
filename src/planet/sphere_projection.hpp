#pragma once

/// @file sphere_projection.hpp
/// @brief Orthographic mapping of canvas pixels onto an equirectangular texture.
///
/// Shared by the target disk and the textured satellites. rasterize() walks
/// the bounding box row by row; on disks wider than kSubsampleMinRadius it
/// computes every other column and fills the gaps with the midpoint texel of
/// its neighbours, which roughly halves the trigonometry per frame.

#include "core/types.hpp"

#include <cmath>
#include <optional>

namespace planetrender::planet
{
    /// @brief Texture lookup for one canvas pixel.
    struct Texel
    {
        i32 column = 0;
        i32 row = 0;
        f64 dz0 = 0.0;      ///< Height above the sky plane [px]
        f64 body_r2 = 0.0;  ///< Squared distance from the disk centre in body units
    };

    /// @brief Projection of a textured sphere onto the canvas.
    struct SphereProjection
    {
        static constexpr f64 kSubsampleMinRadius = 7.0;

        Vec2d center{0.0};
        f64 radius = 0.0;          ///< [px]
        f64 up = 0.0;              ///< Screen angle of the projected rotation axis
        f64 axis_ratio = 1.0;      ///< Apparent polar / equatorial radius
        f64 pole = 0.0;            ///< Latitude of the sub-observer point
        f64 texture_origin = 0.0;  ///< Longitude origin of the texture
        i32 texture_width = 0;
        i32 texture_height = 0;
        bool flip_horizontal = false;
        bool flip_vertical = false;

        /// @brief Texel under pixel (x, y), or nothing off the disk.
        [[nodiscard]] std::optional<Texel> sample(i32 x, i32 y) const;

        /// @brief Midpoint of two texels of the same row, wrapping across the seam.
        [[nodiscard]] Texel midpoint(const Texel& previous, const Texel& current) const;

        /// @brief Visit every disk pixel inside [0, width) x [0, height).
        ///
        /// @p on_texel(x, y, texel) receives computed and interpolated samples.
        /// @p intercept(x, y, texel) may consume a computed sample before it is
        /// drawn (returning true); interpolation restarts after it.
        template <typename OnTexel, typename Intercept>
        void rasterize(i32 width, i32 height, bool subsample, OnTexel&& on_texel, Intercept&& intercept) const;

        template <typename OnTexel>
        void rasterize(i32 width, i32 height, bool subsample, OnTexel&& on_texel) const
        {
            rasterize(width, height, subsample, on_texel, [](i32, i32, const Texel&) { return false; });
        }
    };

    // -----------------------------------------------------------------
    // Template implementation
    // -----------------------------------------------------------------

    template <typename OnTexel, typename Intercept>
    void SphereProjection::rasterize(i32 width, i32 height, bool subsample, OnTexel&& on_texel, Intercept&& intercept) const
    {
        const i32 x0 = static_cast<i32>(center.x + 0.5 - radius - 1.0);
        const i32 x1 = static_cast<i32>(center.x + 0.5 + radius + 1.0);
        const i32 y0 = static_cast<i32>(center.y + 0.5 - radius - 1.0);
        const i32 y1 = static_cast<i32>(center.y + 0.5 + radius + 1.0);
        const bool interpolate = subsample && radius > kSubsampleMinRadius;

        for (i32 y = y0; y <= y1; ++y)
        {
            if (y < 0 || y >= height)
            {
                continue;
            }

            bool first = true;
            bool active = interpolate;
            Texel previous;
            f64 previous_r = 0.0;

            for (i32 x = x0; x <= x1; ++x)
            {
                if (x < 0 || x >= width)
                {
                    continue;
                }

                const auto texel = sample(x, y);
                if (!texel)
                {
                    continue;
                }

                if (intercept(x, y, *texel))
                {
                    first = true;
                    continue;
                }

                on_texel(x, y, *texel);

                if (!active)
                {
                    continue;
                }

                const f64 body_r = std::sqrt(texel->body_r2);
                if (first)
                {
                    first = false;
                    previous = *texel;
                    ++x;
                }
                else
                {
                    Texel middle = midpoint(previous, *texel);
                    middle.body_r2 = texel->body_r2;
                    on_texel(x - 1, y, middle);

                    // Stop skipping when the next step would cross the limb
                    const f64 next_r = body_r + (body_r - previous_r);
                    if (body_r < 1.0 && next_r > 1.0)
                    {
                        active = false;
                    }
                    else
                    {
                        previous = *texel;
                        ++x;
                    }
                }
                previous_r = body_r;
            }
        }
    }

} // namespace planetrender::planet
