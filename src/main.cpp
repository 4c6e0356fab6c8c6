/// @file main.cpp
/// @brief planetrender entry point: render a scene to PNG or open the viewer.
///
/// Usage:
///   planetrender --scene data/scenes/saturn.scene [--textures DIR] [--out FILE]
///                [--width N] [--height N] [--field ARCSEC] [--view]

#include "core/application.hpp"
#include "core/logger.hpp"
#include "planet/planet_renderer.hpp"
#include "rendering/exporter.hpp"
#include "rendering/texture_repository.hpp"
#include "scene/scene_loader.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace
{

using namespace planetrender;

struct CliOptions
{
    std::filesystem::path scene;
    std::filesystem::path textures = "data/textures";
    std::filesystem::path out = "planetrender.png";
    std::optional<i32> width;
    std::optional<i32> height;
    std::optional<f64> field_arcsec;
    bool view = false;
    bool help = false;
};

void print_usage()
{
    PLR_INFO("Usage: planetrender --scene FILE [options]");
    PLR_INFO("  --scene FILE      scene to render (required)");
    PLR_INFO("  --textures DIR    texture directory (default data/textures)");
    PLR_INFO("  --out FILE        PNG output path (default planetrender.png)");
    PLR_INFO("  --width N         canvas width override [px]");
    PLR_INFO("  --height N        canvas height override [px]");
    PLR_INFO("  --field ARCSEC    field of view override [arcsec]");
    PLR_INFO("  --view            open the interactive viewer instead of writing a file");
}

template <typename T>
std::optional<T> parse_number(std::string_view sv)
{
    T value{};
    const auto* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(sv.data(), end, value);
    if (ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

std::optional<CliOptions> parse_arguments(int argc, char** argv)
{
    CliOptions options;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h")
        {
            options.help = true;
            continue;
        }
        if (arg == "--view")
        {
            options.view = true;
            continue;
        }

        // Every other option takes a value
        if (i + 1 >= argc)
        {
            PLR_ERROR("Option {} needs a value", arg);
            return std::nullopt;
        }
        const std::string_view value = argv[++i];

        if (arg == "--scene")
        {
            options.scene = value;
        }
        else if (arg == "--textures")
        {
            options.textures = value;
        }
        else if (arg == "--out")
        {
            options.out = value;
        }
        else if (arg == "--width" || arg == "--height")
        {
            const auto number = parse_number<i32>(value);
            if (!number)
            {
                PLR_ERROR("Option {}: '{}' is not an integer", arg, value);
                return std::nullopt;
            }
            (arg == "--width" ? options.width : options.height) = *number;
        }
        else if (arg == "--field")
        {
            const auto number = parse_number<f64>(value);
            if (!number)
            {
                PLR_ERROR("Option --field: '{}' is not a number", value);
                return std::nullopt;
            }
            options.field_arcsec = *number;
        }
        else
        {
            PLR_ERROR("Unknown option {}", arg);
            return std::nullopt;
        }
    }

    if (!options.help && options.scene.empty())
    {
        PLR_ERROR("--scene is required");
        return std::nullopt;
    }
    return options;
}

int render_to_file(const planet::FrameRequest& request, const CliOptions& options)
{
    rendering::TextureRepository textures(options.textures);
    planet::PlanetRenderer renderer(textures);

    const auto frame = renderer.render(request);

    rendering::PngExporter exporter(options.out, planet::is_stereo(request.config.anaglyph));
    if (!exporter.write(frame))
    {
        PLR_ERROR("Failed to write {}", options.out.string());
        return EXIT_FAILURE;
    }

    PLR_INFO("Wrote {} ({}x{})", options.out.string(), frame.image.get_width(), frame.image.get_height());
    return EXIT_SUCCESS;
}

int run(int argc, char** argv)
{
    const auto options = parse_arguments(argc, argv);
    if (!options)
    {
        print_usage();
        return EXIT_FAILURE;
    }
    if (options->help)
    {
        print_usage();
        return EXIT_SUCCESS;
    }

    auto request = scene::SceneLoader::load(options->scene);
    if (!request)
    {
        PLR_CRITICAL("Cannot load scene {}", options->scene.string());
        return EXIT_FAILURE;
    }

    // Command line overrides
    if (options->width)
    {
        request->config.width = *options->width;
    }
    if (options->height)
    {
        request->config.height = *options->height;
    }
    if (options->field_arcsec)
    {
        request->config.telescope.field_arcsec = *options->field_arcsec;
    }

    try
    {
        request->config.validate();

        if (options->view)
        {
            core::Application app(std::move(*request), core::ViewerOptions{
                .texture_directory = options->textures,
                .snapshot_path = options->out,
            });
            return app.run() ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        return render_to_file(*request, *options);
    }
    catch (const planet::ConfigError& e)
    {
        PLR_CRITICAL("Invalid render settings: {}", e.what());
        return EXIT_FAILURE;
    }
}

} // anonymous namespace

int main(int argc, char** argv)
{
    planetrender::core::Logger::init();
    PLR_INFO("planetrender v0.1.0");

    const int status = run(argc, argv);

    planetrender::core::Logger::shutdown();
    return status;
}
