#pragma once

/// @file disk_rasterizer.hpp
/// @brief Textured, illuminated disk of the target body and its plain fallbacks.

#include "planet/frame_geometry.hpp"
#include "rendering/canvas.hpp"
#include "rendering/texture_repository.hpp"

#include <string>

namespace planetrender::planet
{
    /// @brief Draws the target disk for one frame.
    class DiskRasterizer
    {
    public:
        /// Radius [px] above which the fallback is a coordinate grid instead of a filled disk.
        static constexpr f64 kGridMinRadius = 30.0;
        /// Radius [px] above which the grid carries longitude labels.
        static constexpr i32 kGridLabelMinRadius = 100;
        /// Squared body radius where Saturn's bluish limb starts.
        static constexpr f64 kSaturnLimbStart = 0.95;

        DiskRasterizer(const FrameGeometry& geometry, const RenderConfig& config,
                       rendering::TextureRepository& textures);

        /// @brief Texture-map and shade the disk.
        /// @return false if the body texture is not available (nothing is drawn).
        bool draw_textured(rendering::Canvas& canvas) const;

        /// @brief Grid for large disks, filled circle otherwise.
        void draw_fallback(rendering::Canvas& canvas) const;

        /// @brief Meridians and parallels every 5° (10° below 80 px), with the
        /// longitude origin marked and labelled every 20°.
        void draw_grid(rendering::Canvas& canvas) const;

        /// @brief Filled circle of at least 1 px radius, orange for the Sun.
        void draw_disk(rendering::Canvas& canvas) const;

        /// @brief Name of the texture used for the target.
        [[nodiscard]] std::string get_texture_name() const;

    private:
        const FrameGeometry& m_geometry;
        const RenderConfig& m_config;
        rendering::TextureRepository& m_textures;
    };

} // namespace planetrender::planet
