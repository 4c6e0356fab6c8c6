#pragma once

/// @file window.hpp
/// @brief SDL2 window presenting software-rendered frames through a streaming texture.

#include "core/logger.hpp"
#include "rendering/image.hpp"

#include <SDL2/SDL.h>

#include <cstdint>
#include <functional>
#include <string>

namespace planetrender::core
{
    /// @brief Configuration for window creation.
    /// Use designated initializers: Window w({.title = "planetrender", .width = 800});
    struct WindowConfig
    {
        std::string title = "planetrender";
        uint32_t width = 800;
        uint32_t height = 800;
        bool resizable = true;
        bool vsync = true;
    };

    /// @brief Callback type for receiving raw SDL events from the window.
    using EventCallback = std::function<void(const SDL_Event&)>;

    /// @brief SDL2 window wrapper owning the renderer and the frame texture.
    ///
    /// Frames are uploaded as 24-bit RGB into a streaming texture sized to the
    /// last presented image and stretched to the window. Handles SDL_QUIT,
    /// window close and resize events. Non-copyable.
    class Window
    {
    public:
        /// @brief Create and show the window.
        /// @param config Window configuration (title, dimensions, flags).
        explicit Window(const WindowConfig& config);

        /// @brief Destroy the texture, renderer and window, then shut down SDL.
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;
        Window(Window&&) = delete;
        Window& operator=(Window&&) = delete;

        /// @brief False if SDL, the window or its renderer could not be created.
        [[nodiscard]] bool is_valid() const;

        /// @brief Returns true if the window has been requested to close.
        [[nodiscard]] bool should_close() const;

        /// @brief Request the window to close (e.g., from Escape key).
        void request_close();

        /// @brief Poll all pending SDL events.
        /// Updates internal state for close requests and resize events.
        /// If an event callback is set, it is called for every event.
        void poll_events();

        /// @brief Set a callback to receive all SDL events during poll_events().
        /// @param callback The callback function, or nullptr to clear.
        void set_event_callback(EventCallback callback);

        /// @brief Upload @p image and show it.
        void present(const rendering::Image& image);

        /// @brief Replace the title bar text.
        void set_title(const std::string& title);

        /// @brief Current client area width in pixels.
        [[nodiscard]] uint32_t get_width() const;

        /// @brief Current client area height in pixels.
        [[nodiscard]] uint32_t get_height() const;

        /// @brief Returns true if the window was resized since the last call.
        /// Resets the flag after reading.
        [[nodiscard]] bool was_resized();

    private:
        bool ensure_texture(i32 width, i32 height);

        SDL_Window* m_window = nullptr;
        SDL_Renderer* m_renderer = nullptr;
        SDL_Texture* m_texture = nullptr;
        i32 m_texture_width = 0;
        i32 m_texture_height = 0;
        uint32_t m_width = 0;
        uint32_t m_height = 0;
        bool m_should_close = false;
        bool m_was_resized = false;
        EventCallback m_event_callback;
    };

} // namespace planetrender::core
