#pragma once

/// @file application.hpp
/// @brief Interactive viewer: window lifecycle, input handling and re-rendering.

#include "core/input.hpp"
#include "core/types.hpp"
#include "core/window.hpp"
#include "planet/planet_renderer.hpp"
#include "rendering/texture_repository.hpp"

#include <chrono>
#include <filesystem>
#include <memory>

namespace planetrender::core
{
    /// @brief Settings of a viewer session.
    struct ViewerOptions
    {
        std::filesystem::path texture_directory = "data/textures";
        std::filesystem::path snapshot_path = "planetrender.png";  ///< Written by the S key
    };

    namespace viewer_constants
    {
        /// Field of view change per wheel notch.
        constexpr f64 kZoomStep = 0.1;
        /// Narrowest field reachable by zooming [arcsec].
        constexpr f64 kMinField = 1.0;
        /// Widest field reachable by zooming [arcsec].
        constexpr f64 kMaxField = 36000.0;
        /// Seconds between title bar refreshes.
        constexpr f64 kTitleInterval = 0.5;
    }

    /// @brief Top-level viewer that owns the window and the renderer and drives the main loop.
    ///
    /// Lifecycle: init() in constructor → run() drives main_loop() → shutdown() in destructor.
    /// Frames are rendered only when the request changes or the window is resized.
    ///
    /// Controls:
    ///   drag      move the planet (served from the frame cache while possible)
    ///   arrows    move the planet while held
    ///   wheel     zoom the field of view
    ///   click     identify the body and planetographic point under the cursor
    ///   T A N L   textures, pole axes, N/S/E/W cross, labels
    ///   H D I M   high quality, diffraction, illumination, satellites
    ///   3         cycle the stereo modes
    ///   C R       re-centre the planet, reset every change
    ///   S         save the current frame as PNG
    ///   Escape    quit
    class Application
    {
    public:
        /// @brief Open the window for @p request and render the first frame.
        Application(planet::FrameRequest request, ViewerOptions options);

        /// @brief Shut down all subsystems in reverse creation order.
        ~Application();

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;
        Application(Application&&) = delete;
        Application& operator=(Application&&) = delete;

        /// @brief Enter the main loop. Returns when the window is closed.
        /// @return false if the window could not be created.
        bool run();

    private:
        void init();
        void main_loop();
        void shutdown();

        /// @return true if the request changed and the frame must be re-rendered.
        bool process_input();
        void pick_at(Vec2f window_pos);
        void draw_frame();
        void save_frame();
        void update_title(f64 render_ms);

        [[nodiscard]] Vec2d window_to_canvas(Vec2f window_pos) const;

        // -----------------------------------------------------------------
        // Subsystems (created in init order, destroyed in reverse)
        // -----------------------------------------------------------------
        std::unique_ptr<Window> m_window;
        std::unique_ptr<Input> m_input;
        std::unique_ptr<rendering::TextureRepository> m_textures;
        std::unique_ptr<planet::PlanetRenderer> m_renderer;

        // -----------------------------------------------------------------
        // Session state
        // -----------------------------------------------------------------
        ViewerOptions m_options;
        planet::FrameRequest m_initial_request;  ///< Restored by R
        planet::FrameRequest m_request;          ///< Edited by input
        planet::FrameRequest m_last_good;        ///< Last request that rendered
        rendering::RenderedFrame m_frame;
        bool m_dirty = true;

        std::chrono::steady_clock::time_point m_last_title_time;
    };

} // namespace planetrender::core
