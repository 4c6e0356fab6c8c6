#pragma once

/// @file axes_overlay.hpp
/// @brief Rotation axis stubs and the celestial N/S/E/W cross around the disk.

#include "planet/frame_geometry.hpp"
#include "rendering/canvas.hpp"

namespace planetrender::planet
{
    namespace axes_constants
    {
        /// Gap between the limb and the start of a stub [output px].
        constexpr f64 kStubStart = 2.0;
        /// Distance from the limb to the end of a stub [output px].
        constexpr f64 kStubEnd = 15.0;
        /// Distance from the limb to the cross labels [output px].
        constexpr f64 kLabelDistance = 25.0;
    }

    /// @brief Draws the axis and orientation overlays on top of everything else.
    class AxesOverlay
    {
    public:
        AxesOverlay(const FrameGeometry& geometry, const RenderConfig& config);

        /// @brief Draw whatever the configuration enables. No-op for an empty disk.
        void draw(rendering::Canvas& canvas) const;

    private:
        void draw_pole_axis(rendering::Canvas& canvas) const;
        void draw_cross(rendering::Canvas& canvas) const;

        const FrameGeometry& m_geometry;
        const RenderConfig& m_config;
    };

} // namespace planetrender::planet
