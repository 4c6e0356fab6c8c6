/// @file window.cpp
/// @brief SDL2 window implementation with a streaming frame texture.

#include "core/window.hpp"

#include <vector>

namespace planetrender::core
{

Window::Window(const WindowConfig& config)
    : m_width{config.width}
    , m_height{config.height}
{
    // -----------------------------------------------------------------
    // Tell SDL we manage our own entry point (no SDL_main hijack)
    // -----------------------------------------------------------------
    SDL_SetMainReady();

    if (SDL_Init(SDL_INIT_VIDEO) != 0)
    {
        PLR_CORE_CRITICAL("SDL_Init failed: {}", SDL_GetError());
        return;
    }

    uint32_t flags = SDL_WINDOW_SHOWN;
    if (config.resizable)
    {
        flags |= SDL_WINDOW_RESIZABLE;
    }

    m_window = SDL_CreateWindow(
        config.title.c_str(),
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        static_cast<int>(config.width),
        static_cast<int>(config.height),
        flags);

    if (m_window == nullptr)
    {
        PLR_CORE_CRITICAL("SDL_CreateWindow failed: {}", SDL_GetError());
        return;
    }

    // -----------------------------------------------------------------
    // Renderer: accelerated if available, software otherwise
    // -----------------------------------------------------------------
    uint32_t renderer_flags = SDL_RENDERER_ACCELERATED;
    if (config.vsync)
    {
        renderer_flags |= SDL_RENDERER_PRESENTVSYNC;
    }

    m_renderer = SDL_CreateRenderer(m_window, -1, renderer_flags);
    if (m_renderer == nullptr)
    {
        PLR_CORE_WARN("Accelerated renderer unavailable ({}), falling back to software", SDL_GetError());
        m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_SOFTWARE);
    }

    if (m_renderer == nullptr)
    {
        PLR_CORE_CRITICAL("SDL_CreateRenderer failed: {}", SDL_GetError());
        return;
    }

    PLR_CORE_INFO("Window created: \"{}\" ({}x{}) [{}{}]",
                  config.title,
                  m_width,
                  m_height,
                  config.resizable ? "resizable" : "fixed",
                  config.vsync ? " | vsync" : "");
}

Window::~Window()
{
    if (m_texture != nullptr)
    {
        SDL_DestroyTexture(m_texture);
    }

    if (m_renderer != nullptr)
    {
        SDL_DestroyRenderer(m_renderer);
    }

    if (m_window != nullptr)
    {
        SDL_DestroyWindow(m_window);
        PLR_CORE_INFO("Window destroyed");
    }

    SDL_Quit();
}

bool Window::is_valid() const
{
    return m_window != nullptr && m_renderer != nullptr;
}

bool Window::should_close() const
{
    return m_should_close;
}

void Window::request_close()
{
    m_should_close = true;
}

void Window::poll_events()
{
    SDL_Event event{};
    while (SDL_PollEvent(&event) != 0)
    {
        switch (event.type)
        {
            case SDL_QUIT:
            {
                m_should_close = true;
                break;
            }

            case SDL_WINDOWEVENT:
            {
                switch (event.window.event)
                {
                    case SDL_WINDOWEVENT_CLOSE:
                    {
                        m_should_close = true;
                        break;
                    }

                    case SDL_WINDOWEVENT_SIZE_CHANGED:
                    {
                        m_width = static_cast<uint32_t>(event.window.data1);
                        m_height = static_cast<uint32_t>(event.window.data2);
                        m_was_resized = true;
                        PLR_CORE_TRACE("Window resized: {}x{}", m_width, m_height);
                        break;
                    }

                    default:
                        break;
                }
                break;
            }

            default:
                break;
        }

        if (m_event_callback)
        {
            m_event_callback(event);
        }
    }
}

void Window::set_event_callback(EventCallback callback)
{
    m_event_callback = std::move(callback);
}

// -----------------------------------------------------------------
// Frame upload
// -----------------------------------------------------------------

bool Window::ensure_texture(i32 width, i32 height)
{
    if (m_texture != nullptr && m_texture_width == width && m_texture_height == height)
    {
        return true;
    }

    if (m_texture != nullptr)
    {
        SDL_DestroyTexture(m_texture);
        m_texture = nullptr;
    }

    m_texture = SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_RGB24, SDL_TEXTUREACCESS_STREAMING, width, height);
    if (m_texture == nullptr)
    {
        PLR_CORE_ERROR("SDL_CreateTexture ({}x{}) failed: {}", width, height, SDL_GetError());
        return false;
    }

    m_texture_width = width;
    m_texture_height = height;
    PLR_CORE_TRACE("Frame texture created: {}x{}", width, height);
    return true;
}

void Window::present(const rendering::Image& image)
{
    if (!is_valid() || image.empty())
    {
        return;
    }

    const i32 width = image.get_width();
    const i32 height = image.get_height();
    if (!ensure_texture(width, height))
    {
        return;
    }

    // Rgb is three packed bytes, matching SDL_PIXELFORMAT_RGB24
    std::vector<uint8_t> bytes;
    bytes.reserve(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 3);
    for (const auto& pixel : image.pixels())
    {
        bytes.push_back(pixel.r);
        bytes.push_back(pixel.g);
        bytes.push_back(pixel.b);
    }

    if (SDL_UpdateTexture(m_texture, nullptr, bytes.data(), width * 3) != 0)
    {
        PLR_CORE_ERROR("SDL_UpdateTexture failed: {}", SDL_GetError());
        return;
    }

    SDL_RenderClear(m_renderer);
    SDL_RenderCopy(m_renderer, m_texture, nullptr, nullptr);
    SDL_RenderPresent(m_renderer);
}

void Window::set_title(const std::string& title)
{
    if (m_window != nullptr)
    {
        SDL_SetWindowTitle(m_window, title.c_str());
    }
}

uint32_t Window::get_width() const
{
    return m_width;
}

uint32_t Window::get_height() const
{
    return m_height;
}

bool Window::was_resized()
{
    bool resized = m_was_resized;
    m_was_resized = false;
    return resized;
}

} // namespace planetrender::core
