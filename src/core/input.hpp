#pragma once

/// @file input.hpp
/// @brief Viewer gestures from SDL2 events: pan, zoom, click and bound key actions.
///
/// Input only tracks gestures. The Application loop reads them and turns
/// them into changes of the frame request and body picks.

#include "core/types.hpp"

#include <SDL2/SDL.h>

#include <array>
#include <optional>
#include <string_view>

namespace planetrender::core
{
    /// @brief Discrete viewer commands bound to keys.
    enum class ViewerAction : u8
    {
        ToggleTextures,
        ToggleAxes,
        ToggleNsew,
        ToggleLabels,
        ToggleHighQuality,
        ToggleDiffraction,
        ToggleIllumination,
        ToggleSatellites,
        CycleStereo,
        Recentre,
        Reset,
        SaveFrame,
        Quit,
        Count
    };

    /// @brief Key bound to an action.
    struct KeyBinding
    {
        ViewerAction action;
        SDL_Scancode key;
        std::string_view label;
    };

    /// @brief Default bindings of the viewer, one key per action.
    inline constexpr std::array<KeyBinding, static_cast<std::size_t>(ViewerAction::Count)> kKeyBindings = {{
        {ViewerAction::ToggleTextures, SDL_SCANCODE_T, "Textures"},
        {ViewerAction::ToggleAxes, SDL_SCANCODE_A, "Pole axes"},
        {ViewerAction::ToggleNsew, SDL_SCANCODE_N, "N/S/E/W cross"},
        {ViewerAction::ToggleLabels, SDL_SCANCODE_L, "Labels"},
        {ViewerAction::ToggleHighQuality, SDL_SCANCODE_H, "High quality"},
        {ViewerAction::ToggleDiffraction, SDL_SCANCODE_D, "Diffraction"},
        {ViewerAction::ToggleIllumination, SDL_SCANCODE_I, "Illumination"},
        {ViewerAction::ToggleSatellites, SDL_SCANCODE_M, "Satellites"},
        {ViewerAction::CycleStereo, SDL_SCANCODE_3, "Stereo mode"},
        {ViewerAction::Recentre, SDL_SCANCODE_C, "Re-centre"},
        {ViewerAction::Reset, SDL_SCANCODE_R, "Reset"},
        {ViewerAction::SaveFrame, SDL_SCANCODE_S, "Save frame"},
        {ViewerAction::Quit, SDL_SCANCODE_ESCAPE, "Quit"},
    }};

    /// @brief Label of @p action in log messages.
    [[nodiscard]] std::string_view to_string(ViewerAction action);

    namespace input_constants
    {
        /// Window pixels moved per frame while an arrow key is held.
        constexpr f32 kKeyPanStep = 4.0f;
        /// Cursor travel [px] below which a press and release count as a click.
        constexpr f32 kClickSlop = 3.0f;
    }

    /// @brief Collects the gestures of one frame from SDL2 events.
    ///
    /// Usage pattern each frame:
    ///   1. Call new_frame() to reset per-frame gestures
    ///   2. For each SDL_Event from Window::poll_events(), call process_event()
    ///   3. Query get_pan_delta(), get_zoom_notches(), get_click() and is_triggered()
    class Input
    {
    public:
        Input() = default;
        ~Input() = default;

        Input(const Input&) = delete;
        Input& operator=(const Input&) = delete;
        Input(Input&&) = delete;
        Input& operator=(Input&&) = delete;

        void process_event(const SDL_Event& event);

        /// @brief Reset per-frame gestures and add the pan of held arrow keys.
        void new_frame();

        /// @brief Planet displacement this frame in window pixels, from dragging and arrow keys.
        [[nodiscard]] Vec2f get_pan_delta() const { return m_pan_delta; }

        /// @brief Wheel notches this frame. Positive zooms in.
        [[nodiscard]] f32 get_zoom_notches() const { return m_zoom_notches; }

        /// @brief Window position of a left click released this frame, if any.
        [[nodiscard]] std::optional<Vec2f> get_click() const { return m_click; }

        /// @brief True if the key bound to @p action went down this frame.
        [[nodiscard]] bool is_triggered(ViewerAction action) const;

    private:
        void on_key(SDL_Scancode key, bool down, bool repeat);

        Vec2f m_pan_delta = {0.0f, 0.0f};
        f32 m_zoom_notches = 0.0f;
        std::optional<Vec2f> m_click;

        bool m_left_button_down = false;
        Vec2f m_press_pos = {0.0f, 0.0f};
        Vec2f m_last_mouse_pos = {0.0f, 0.0f};
        f32 m_drag_travel = 0.0f;

        std::array<bool, static_cast<std::size_t>(ViewerAction::Count)> m_triggered{};
        Vec2f m_arrows_held = {0.0f, 0.0f};  ///< -1, 0 or +1 per axis
    };

} // namespace planetrender::core
