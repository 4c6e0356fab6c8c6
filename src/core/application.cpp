/// @file application.cpp
/// @brief Viewer implementation: init, main loop, input mapping, shutdown.

#include "core/application.hpp"

#include "astro/time_system.hpp"
#include "rendering/exporter.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace planetrender::core
{

namespace
{

using planet::AnaglyphMode;

constexpr std::array<AnaglyphMode, 5> kStereoCycle = {
    AnaglyphMode::None,
    AnaglyphMode::RedCyan,
    AnaglyphMode::DuboisRedCyan,
    AnaglyphMode::LeftRight,
    AnaglyphMode::LeftRightHalfWidth,
};

AnaglyphMode next_stereo_mode(AnaglyphMode mode)
{
    auto it = std::find(kStereoCycle.begin(), kStereoCycle.end(), mode);
    if (it == kStereoCycle.end() || ++it == kStereoCycle.end())
    {
        return kStereoCycle.front();
    }
    return *it;
}

/// Flip a boolean setting when its key went down and log the new state.
bool toggle_on(const Input& input, ViewerAction action, bool& flag)
{
    if (!input.is_triggered(action))
    {
        return false;
    }
    flag = !flag;
    PLR_INFO("{} {}", to_string(action), flag ? "on" : "off");
    return true;
}

} // anonymous namespace

Application::Application(planet::FrameRequest request, ViewerOptions options)
    : m_options{std::move(options)}
    , m_initial_request{request}
    , m_request{request}
    , m_last_good{std::move(request)}
{
    init();
}

Application::~Application()
{
    shutdown();
}

bool Application::run()
{
    if (!m_window || !m_window->is_valid())
    {
        PLR_ERROR("Viewer window unavailable, nothing to show");
        return false;
    }

    PLR_INFO("Entering viewer loop...");
    main_loop();
    PLR_INFO("Viewer loop exited");
    return true;
}

// =================================================================
// Initialization
// =================================================================

void Application::init()
{
    const auto& config = m_request.config;

    // 1. Window sized to the canvas
    m_window = std::make_unique<Window>(WindowConfig{
        .title = fmt::format("planetrender - {}", astro::to_string(config.target)),
        .width = static_cast<uint32_t>(config.width),
        .height = static_cast<uint32_t>(config.height),
    });

    // 2. Input (must exist before setting the event callback)
    m_input = std::make_unique<Input>();

    // Wire SDL events → Input system
    m_window->set_event_callback([this](const SDL_Event& event) {
        m_input->process_event(event);
    });

    // 3. Textures and renderer
    m_textures = std::make_unique<rendering::TextureRepository>(m_options.texture_directory);
    m_renderer = std::make_unique<planet::PlanetRenderer>(*m_textures);

    PLR_INFO("Viewing {} at {} ({:.1f}\" field, {} moon(s))",
             astro::to_string(config.target),
             astro::TimeSystem::format(m_request.body.julian_date),
             config.telescope.field_arcsec,
             m_request.moons.size());

    m_last_title_time = std::chrono::steady_clock::now();
}

void Application::shutdown()
{
    // Reverse creation order: renderer → textures → input → window
    m_renderer.reset();
    m_textures.reset();

    // Clear the event callback before destroying the window
    // (callback captures `this`, which references m_input)
    if (m_window)
    {
        m_window->set_event_callback(nullptr);
    }
    m_input.reset();
    m_window.reset();
}

// =================================================================
// Main loop
// =================================================================

void Application::main_loop()
{
    while (!m_window->should_close())
    {
        // -----------------------------------------------------------------
        // 1. Reset per-frame input state
        // -----------------------------------------------------------------
        m_input->new_frame();

        // -----------------------------------------------------------------
        // 2. Poll SDL events (Window handles SDL_QUIT/resize; callback → Input)
        // -----------------------------------------------------------------
        m_window->poll_events();

        // Skip drawing when minimized (zero extent)
        if (m_window->get_width() == 0 || m_window->get_height() == 0)
        {
            SDL_Delay(50);
            continue;
        }

        if (m_window->was_resized())
        {
            m_request.config.width = static_cast<i32>(m_window->get_width());
            m_request.config.height = static_cast<i32>(m_window->get_height());
            m_dirty = true;
        }

        // -----------------------------------------------------------------
        // 3. Process input → frame request
        // -----------------------------------------------------------------
        if (process_input())
        {
            m_dirty = true;
        }

        // -----------------------------------------------------------------
        // 4. Render only when something changed; idle otherwise
        // -----------------------------------------------------------------
        if (m_dirty)
        {
            draw_frame();
            m_dirty = false;
        }
        else
        {
            SDL_Delay(10);
        }
    }
}

// =================================================================
// Input processing: translates Input state to frame request changes
// =================================================================

bool Application::process_input()
{
    auto& config = m_request.config;
    bool changed = false;

    // -----------------------------------------------------------------
    // Drag and arrow keys → move the planet centre (cache fast path)
    // -----------------------------------------------------------------
    const Vec2f pan = m_input->get_pan_delta();
    if (pan.x != 0.0f || pan.y != 0.0f)
    {
        const f64 sx = static_cast<f64>(config.width) / static_cast<f64>(m_window->get_width());
        const f64 sy = static_cast<f64>(config.height) / static_cast<f64>(m_window->get_height());
        config.planet_center = config.get_planet_center() + Vec2d{pan.x * sx, pan.y * sy};
        changed = true;
    }

    // -----------------------------------------------------------------
    // Scroll wheel → field of view
    //
    // notches > 0 → zoom in (narrower field)
    // -----------------------------------------------------------------
    const f32 notches = m_input->get_zoom_notches();
    if (notches != 0.0f)
    {
        const f64 factor = std::pow(1.0 - viewer_constants::kZoomStep, static_cast<f64>(notches));
        config.telescope.field_arcsec = std::clamp(config.telescope.field_arcsec * factor,
                                                   viewer_constants::kMinField,
                                                   viewer_constants::kMaxField);
        PLR_TRACE("Field {:.1f}\"", config.telescope.field_arcsec);
        changed = true;
    }

    if (const auto click = m_input->get_click())
    {
        pick_at(*click);
    }

    // -----------------------------------------------------------------
    // Display toggles
    // -----------------------------------------------------------------
    changed |= toggle_on(*m_input, ViewerAction::ToggleTextures, config.textures);
    changed |= toggle_on(*m_input, ViewerAction::ToggleAxes, config.show_axes);
    changed |= toggle_on(*m_input, ViewerAction::ToggleNsew, config.show_nsew);
    changed |= toggle_on(*m_input, ViewerAction::ToggleLabels, config.show_labels);
    changed |= toggle_on(*m_input, ViewerAction::ToggleHighQuality, config.high_quality);
    changed |= toggle_on(*m_input, ViewerAction::ToggleDiffraction, config.diffraction);
    changed |= toggle_on(*m_input, ViewerAction::ToggleIllumination, config.illumination);
    changed |= toggle_on(*m_input, ViewerAction::ToggleSatellites, config.satellites);

    if (m_input->is_triggered(ViewerAction::CycleStereo))
    {
        config.anaglyph = next_stereo_mode(config.anaglyph);
        PLR_INFO("Stereo mode: {}", planet::to_string(config.anaglyph));
        changed = true;
    }

    if (m_input->is_triggered(ViewerAction::Recentre))
    {
        config.planet_center.reset();
        changed = true;
    }

    if (m_input->is_triggered(ViewerAction::Reset))
    {
        const i32 width = config.width;
        const i32 height = config.height;
        m_request = m_initial_request;
        m_request.config.width = width;
        m_request.config.height = height;
        PLR_INFO("View reset");
        changed = true;
    }

    if (m_input->is_triggered(ViewerAction::SaveFrame))
    {
        save_frame();
    }

    if (m_input->is_triggered(ViewerAction::Quit))
    {
        m_window->request_close();
    }

    return changed;
}

Vec2d Application::window_to_canvas(Vec2f window_pos) const
{
    const auto& config = m_last_good.config;
    return Vec2d{
        static_cast<f64>(window_pos.x) * config.width / static_cast<f64>(m_window->get_width()),
        static_cast<f64>(window_pos.y) * config.height / static_cast<f64>(m_window->get_height()),
    };
}

void Application::pick_at(Vec2f window_pos)
{
    const Vec2d pos = window_to_canvas(window_pos);

    const auto pick = m_renderer->pick_body(pos.x, pos.y);
    if (!pick)
    {
        PLR_INFO("({:.0f}, {:.0f}): sky", pos.x, pos.y);
        return;
    }

    if (pick->moon_index)
    {
        PLR_INFO("({:.0f}, {:.0f}): {}", pos.x, pos.y, pick->name);
        return;
    }

    if (const auto point = m_renderer->screen_to_planetographic(pos.x, pos.y))
    {
        PLR_INFO("({:.0f}, {:.0f}): {} lon {:.2f}° lat {:.2f}°",
                 pos.x, pos.y, pick->name,
                 point->longitude * astro_constants::kRadToDeg,
                 point->latitude * astro_constants::kRadToDeg);
    }
    else
    {
        PLR_INFO("({:.0f}, {:.0f}): {}", pos.x, pos.y, pick->name);
    }
}

// =================================================================
// Frame rendering
// =================================================================

void Application::draw_frame()
{
    const auto start = std::chrono::steady_clock::now();

    try
    {
        m_frame = m_renderer->render(m_request);
        m_last_good = m_request;
    }
    catch (const planet::ConfigError& e)
    {
        // Keep showing the previous frame and undo the offending change
        PLR_ERROR("Cannot render: {}", e.what());
        m_request = m_last_good;
        return;
    }

    const f64 render_ms = std::chrono::duration<f64, std::milli>(std::chrono::steady_clock::now() - start).count();
    PLR_TRACE("Frame {}x{} in {:.1f} ms{}",
              m_frame.image.get_width(), m_frame.image.get_height(),
              render_ms, m_frame.from_cache ? " (cached)" : "");

    m_window->present(m_frame.image);
    update_title(render_ms);
}

void Application::save_frame()
{
    if (m_frame.image.empty())
    {
        PLR_WARN("No frame to save yet");
        return;
    }

    rendering::PngExporter exporter(m_options.snapshot_path, planet::is_stereo(m_last_good.config.anaglyph));
    if (exporter.write(m_frame))
    {
        PLR_INFO("Frame saved to {}", exporter.get_path().string());
    }
    else
    {
        PLR_ERROR("Failed to save frame to {}", exporter.get_path().string());
    }
}

void Application::update_title(f64 render_ms)
{
    const auto now = std::chrono::steady_clock::now();
    if (std::chrono::duration<f64>(now - m_last_title_time).count() < viewer_constants::kTitleInterval)
    {
        return;
    }
    m_last_title_time = now;

    const auto& config = m_last_good.config;
    m_window->set_title(fmt::format("planetrender - {} - {:.0f}\" field - {:.1f} ms{}",
                                    astro::to_string(config.target),
                                    config.telescope.field_arcsec,
                                    render_ms,
                                    m_frame.from_cache ? " (cached)" : ""));
}

} // namespace planetrender::core
