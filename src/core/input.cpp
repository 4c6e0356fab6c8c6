/// @file input.cpp
/// @brief Gesture tracking over SDL2 events.

#include "core/input.hpp"

#include <cmath>

namespace planetrender::core
{

using namespace input_constants;

std::string_view to_string(ViewerAction action)
{
    for (const auto& binding : kKeyBindings)
    {
        if (binding.action == action)
        {
            return binding.label;
        }
    }
    return "Unknown";
}

void Input::new_frame()
{
    m_pan_delta = {m_arrows_held.x * kKeyPanStep, m_arrows_held.y * kKeyPanStep};
    m_zoom_notches = 0.0f;
    m_click.reset();
    m_triggered.fill(false);
}

void Input::process_event(const SDL_Event& event)
{
    switch (event.type)
    {
        case SDL_MOUSEBUTTONDOWN:
        {
            if (event.button.button == SDL_BUTTON_LEFT)
            {
                m_left_button_down = true;
                m_press_pos = {static_cast<f32>(event.button.x), static_cast<f32>(event.button.y)};
                m_last_mouse_pos = m_press_pos;
                m_drag_travel = 0.0f;
            }
            break;
        }

        case SDL_MOUSEBUTTONUP:
        {
            if (event.button.button == SDL_BUTTON_LEFT && m_left_button_down)
            {
                m_left_button_down = false;
                if (m_drag_travel <= kClickSlop)
                {
                    m_click = Vec2f{static_cast<f32>(event.button.x), static_cast<f32>(event.button.y)};
                }
            }
            break;
        }

        case SDL_MOUSEMOTION:
        {
            if (!m_left_button_down)
            {
                break;
            }
            const Vec2f pos = {static_cast<f32>(event.motion.x), static_cast<f32>(event.motion.y)};
            const Vec2f step = pos - m_last_mouse_pos;
            m_last_mouse_pos = pos;
            m_drag_travel += std::abs(step.x) + std::abs(step.y);

            // Small jitter before the slop is exceeded stays a click
            if (m_drag_travel > kClickSlop)
            {
                m_pan_delta += step;
            }
            break;
        }

        case SDL_MOUSEWHEEL:
        {
            // SDL: positive y = scroll up = zoom in
            f32 notches = static_cast<f32>(event.wheel.y);
            if (event.wheel.direction == SDL_MOUSEWHEEL_FLIPPED)
            {
                notches = -notches;
            }
            m_zoom_notches += notches;
            break;
        }

        case SDL_KEYDOWN:
            on_key(event.key.keysym.scancode, true, event.key.repeat != 0);
            break;

        case SDL_KEYUP:
            on_key(event.key.keysym.scancode, false, false);
            break;

        default:
            break;
    }
}

void Input::on_key(SDL_Scancode key, bool down, bool repeat)
{
    const f32 held = down ? 1.0f : 0.0f;
    switch (key)
    {
        case SDL_SCANCODE_LEFT:  m_arrows_held.x = -held; return;
        case SDL_SCANCODE_RIGHT: m_arrows_held.x = held; return;
        case SDL_SCANCODE_UP:    m_arrows_held.y = -held; return;
        case SDL_SCANCODE_DOWN:  m_arrows_held.y = held; return;
        default: break;
    }

    if (!down || repeat)
    {
        return;
    }
    for (const auto& binding : kKeyBindings)
    {
        if (binding.key == key)
        {
            m_triggered[static_cast<std::size_t>(binding.action)] = true;
        }
    }
}

bool Input::is_triggered(ViewerAction action) const
{
    const auto index = static_cast<std::size_t>(action);
    return index < m_triggered.size() && m_triggered[index];
}

} // namespace planetrender::core
