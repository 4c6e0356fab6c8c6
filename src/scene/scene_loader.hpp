#pragma once

/// @file scene_loader.hpp
/// @brief Loads a frame request (render settings plus ephemerides) from a text scene file.

#include "planet/render_config.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace planetrender::scene
{
    /// @brief Static utility class reading `.scene` files.
    ///
    /// A scene is a list of `key = value` lines grouped in sections:
    ///
    ///   [render]     canvas, flags, colours, stereo and refraction settings
    ///   [telescope]  optics and field of view
    ///   [body]       ephemeris of the target
    ///   [moon]       one satellite; repeat the section for each moon
    ///
    /// Lines before the first section belong to [render]. Blank lines and
    /// lines starting with '#' or ';' are ignored. Angles are given in
    /// degrees, angular sizes in arcseconds and distances in AU; they are
    /// converted to the renderer's units. The epoch is either `julian_date`
    /// or an ISO-8601 `date`. Unknown keys and unparsable values are skipped
    /// with a warning.
    class SceneLoader
    {
    public:
        SceneLoader() = delete;

        /// @brief Read and parse a scene file.
        /// @return The request, or std::nullopt if the file cannot be read or names no valid target.
        [[nodiscard]] static std::optional<planet::FrameRequest> load(const std::filesystem::path& path);

        /// @brief Parse scene text. @p source only labels log messages.
        [[nodiscard]] static std::optional<planet::FrameRequest> parse(std::string_view text, std::string_view source);

    private:
        /// @return false if the key is unknown or its value does not parse.
        static bool apply_render(planet::RenderConfig& config, std::string_view key, std::string_view value);
        static bool apply_telescope(Telescope& telescope, std::string_view key, std::string_view value);
        static bool apply_body(astro::BodyEphemeris& body, std::string_view key, std::string_view value);
        static bool apply_moon(astro::MoonEphemeris& moon, std::string_view key, std::string_view value);

        [[nodiscard]] static std::string_view trim(std::string_view sv);
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
        [[nodiscard]] static std::optional<i32> parse_i32(std::string_view sv);
        [[nodiscard]] static std::optional<bool> parse_bool(std::string_view sv);
        [[nodiscard]] static std::optional<rendering::Rgb> parse_rgb(std::string_view sv);
    };

} // namespace planetrender::scene
