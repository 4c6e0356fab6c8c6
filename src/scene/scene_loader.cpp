/// @file scene_loader.cpp
/// @brief Implementation of the `.scene` text format.

#include "scene/scene_loader.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <array>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

namespace planetrender::scene
{

namespace
{

using astro::BodyEphemeris;
using astro::MoonEphemeris;
using planet::RenderConfig;

constexpr f64 kDeg = astro_constants::kDegToRad;
constexpr f64 kArcsec = astro_constants::kArcSecToRad;

enum class Section
{
    Render,
    Telescope,
    Body,
    Moon,
    Unknown,
};

/// Numeric key stored as value * factor.
template <typename T>
struct ScaledField
{
    std::string_view key;
    f64 T::*member;
    f64 factor;
};

template <typename T>
struct FlagField
{
    std::string_view key;
    bool T::*member;
};

constexpr std::array<FlagField<RenderConfig>, 12> kRenderFlags = {{
    {"textures", &RenderConfig::textures},
    {"high_quality", &RenderConfig::high_quality},
    {"force_high_quality", &RenderConfig::force_high_quality},
    {"show_axes", &RenderConfig::show_axes},
    {"show_nsew", &RenderConfig::show_nsew},
    {"show_labels", &RenderConfig::show_labels},
    {"north_up", &RenderConfig::north_up},
    {"illumination", &RenderConfig::illumination},
    {"diffraction", &RenderConfig::diffraction},
    {"earthshine", &RenderConfig::earthshine},
    {"satellites", &RenderConfig::satellites},
    {"sky_mode", &RenderConfig::sky_mode},
}};

constexpr std::array<ScaledField<Telescope>, 6> kTelescopeFields = {{
    {"aperture_mm", &Telescope::aperture_mm, 1.0},
    {"focal_length_mm", &Telescope::focal_length_mm, 1.0},
    {"central_obstruction", &Telescope::central_obstruction, 1.0},
    {"spider_mm", &Telescope::spider_mm, 1.0},
    {"chromatism_arcsec", &Telescope::chromatism_arcsec, 1.0},
    {"field_arcsec", &Telescope::field_arcsec, 1.0},
}};

constexpr std::array<FlagField<Telescope>, 2> kTelescopeFlags = {{
    {"invert_horizontal", &Telescope::invert_horizontal},
    {"invert_vertical", &Telescope::invert_vertical},
}};

constexpr std::array<ScaledField<BodyEphemeris>, 17> kBodyFields = {{
    {"julian_date", &BodyEphemeris::julian_date, 1.0},
    {"angular_radius_arcsec", &BodyEphemeris::angular_radius, kArcsec},
    {"pole_inclination_deg", &BodyEphemeris::pole_inclination, kDeg},
    {"axis_position_angle_deg", &BodyEphemeris::axis_position_angle, kDeg},
    {"central_meridian_deg", &BodyEphemeris::central_meridian, kDeg},
    {"central_meridian_i_deg", &BodyEphemeris::central_meridian_i, kDeg},
    {"central_meridian_ii_deg", &BodyEphemeris::central_meridian_ii, kDeg},
    {"central_meridian_iii_deg", &BodyEphemeris::central_meridian_iii, kDeg},
    {"subsolar_latitude_deg", &BodyEphemeris::subsolar_latitude, kDeg},
    {"subsolar_longitude_deg", &BodyEphemeris::subsolar_longitude, kDeg},
    {"phase", &BodyEphemeris::phase, 1.0},
    {"phase_angle_deg", &BodyEphemeris::phase_angle, kDeg},
    {"bright_limb_angle_deg", &BodyEphemeris::bright_limb_angle, kDeg},
    {"parallactic_angle_deg", &BodyEphemeris::parallactic_angle, kDeg},
    {"distance_au", &BodyEphemeris::distance, 1.0},
    {"distance_from_sun_au", &BodyEphemeris::distance_from_sun, 1.0},
    {"elevation_deg", &BodyEphemeris::elevation, kDeg},
}};

constexpr std::array<ScaledField<MoonEphemeris>, 12> kMoonFields = {{
    {"angular_radius_arcsec", &MoonEphemeris::angular_radius, kArcsec},
    {"magnitude", &MoonEphemeris::magnitude, 1.0},
    {"radius_km", &MoonEphemeris::radius_km, 1.0},
    {"distance_au", &MoonEphemeris::distance, 1.0},
    {"phase", &MoonEphemeris::phase, 1.0},
    {"phase_angle_deg", &MoonEphemeris::phase_angle, kDeg},
    {"elongation_deg", &MoonEphemeris::elongation, kDeg},
    {"bright_limb_angle_deg", &MoonEphemeris::bright_limb_angle, kDeg},
    {"pole_inclination_deg", &MoonEphemeris::pole_inclination, kDeg},
    {"axis_position_angle_deg", &MoonEphemeris::axis_position_angle, kDeg},
    {"central_meridian_deg", &MoonEphemeris::central_meridian, kDeg},
    {"parallactic_angle_deg", &MoonEphemeris::parallactic_angle, kDeg},
}};

constexpr std::array<FlagField<MoonEphemeris>, 4> kMoonFlags = {{
    {"eclipsed", &MoonEphemeris::eclipsed},
    {"occulted", &MoonEphemeris::occulted},
    {"shadow_transiting", &MoonEphemeris::shadow_transiting},
    {"mutual_phenomena", &MoonEphemeris::mutual_phenomena},
}};

template <typename Field, std::size_t N>
const Field* find_field(const std::array<Field, N>& fields, std::string_view key)
{
    for (const auto& field : fields)
    {
        if (field.key == key)
        {
            return &field;
        }
    }
    return nullptr;
}

Section section_from_name(std::string_view name)
{
    if (name == "render")
    {
        return Section::Render;
    }
    if (name == "telescope")
    {
        return Section::Telescope;
    }
    if (name == "body")
    {
        return Section::Body;
    }
    if (name == "moon")
    {
        return Section::Moon;
    }
    return Section::Unknown;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Load from disk
// -----------------------------------------------------------------

std::optional<planet::FrameRequest> SceneLoader::load(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        PLR_CORE_ERROR("SceneLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return parse(content.str(), path.string());
}

// -----------------------------------------------------------------
// Parse scene text
// -----------------------------------------------------------------

std::optional<planet::FrameRequest> SceneLoader::parse(std::string_view text, std::string_view source)
{
    planet::FrameRequest request;
    auto& config = request.config;
    bool has_target = false;

    Section section = Section::Render;
    MoonEphemeris* moon = nullptr;
    u32 line_number = 0;
    u32 skipped = 0;

    while (!text.empty())
    {
        const std::size_t end = text.find('\n');
        std::string_view line = trim(text.substr(0, end));
        text = end == std::string_view::npos ? std::string_view{} : text.substr(end + 1);
        ++line_number;

        if (line.empty() || line.front() == '#' || line.front() == ';')
        {
            continue;
        }

        if (line.front() == '[')
        {
            if (line.back() != ']')
            {
                PLR_CORE_WARN("SceneLoader: {}:{}: malformed section header: {}", source, line_number, line);
                ++skipped;
                section = Section::Unknown;
                continue;
            }
            const std::string_view name = trim(line.substr(1, line.size() - 2));
            section = section_from_name(name);
            if (section == Section::Unknown)
            {
                PLR_CORE_WARN("SceneLoader: {}:{}: unknown section [{}]", source, line_number, name);
            }
            if (section == Section::Moon)
            {
                moon = &request.moons.emplace_back();
            }
            continue;
        }

        const std::size_t equals = line.find('=');
        if (equals == std::string_view::npos)
        {
            PLR_CORE_WARN("SceneLoader: {}:{}: expected key = value: {}", source, line_number, line);
            ++skipped;
            continue;
        }
        const std::string_view key = trim(line.substr(0, equals));
        const std::string_view value = trim(line.substr(equals + 1));

        bool applied = false;
        switch (section)
        {
        case Section::Render:
            if (key == "target")
            {
                if (const auto target = astro::target_from_name(value))
                {
                    config.target = *target;
                    has_target = true;
                    applied = true;
                }
            }
            else
            {
                applied = apply_render(config, key, value);
            }
            break;
        case Section::Telescope:
            applied = apply_telescope(config.telescope, key, value);
            break;
        case Section::Body:
            applied = apply_body(request.body, key, value);
            break;
        case Section::Moon:
            applied = moon != nullptr && apply_moon(*moon, key, value);
            break;
        case Section::Unknown:
            applied = true;  // Reported once at the header
            break;
        }

        if (!applied)
        {
            PLR_CORE_WARN("SceneLoader: {}:{}: ignoring '{}' = '{}'", source, line_number, key, value);
            ++skipped;
        }
    }

    if (!has_target)
    {
        PLR_CORE_ERROR("SceneLoader: {} does not name a valid target", source);
        return std::nullopt;
    }

    for (std::size_t i = 0; i < request.moons.size(); ++i)
    {
        if (request.moons[i].name.empty())
        {
            request.moons[i].name = "Moon " + std::to_string(i + 1);
        }
    }

    try
    {
        config.validate();
    }
    catch (const planet::ConfigError& e)
    {
        PLR_CORE_ERROR("SceneLoader: {}: {}", source, e.what());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        PLR_CORE_WARN("SceneLoader: Skipped {} lines in {}", skipped, source);
    }

    PLR_CORE_INFO("SceneLoader: Loaded {} with {} moons from {}", astro::to_string(config.target),
                  request.moons.size(), source);
    return request;
}

// -----------------------------------------------------------------
// Sections
// -----------------------------------------------------------------

bool SceneLoader::apply_render(RenderConfig& config, std::string_view key, std::string_view value)
{
    if (const auto* flag = find_field(kRenderFlags, key))
    {
        const auto parsed = parse_bool(value);
        if (parsed)
        {
            config.*(flag->member) = *parsed;
        }
        return parsed.has_value();
    }

    if (key == "width" || key == "height")
    {
        const auto parsed = parse_i32(value);
        if (parsed)
        {
            (key == "width" ? config.width : config.height) = *parsed;
        }
        return parsed.has_value();
    }

    if (key == "background" || key == "foreground")
    {
        const auto parsed = parse_rgb(value);
        if (parsed)
        {
            (key == "background" ? config.background : config.foreground) = *parsed;
        }
        return parsed.has_value();
    }

    if (key == "anaglyph")
    {
        const auto mode = planet::anaglyph_from_name(value);
        if (mode)
        {
            config.anaglyph = *mode;
        }
        return mode.has_value();
    }

    if (key == "earth_texture")
    {
        config.earth_texture = std::string(value);
        return true;
    }

    if (key == "atmospheric_refraction")
    {
        const auto parsed = parse_bool(value);
        if (parsed)
        {
            config.refraction.use_atmosphere = *parsed;
        }
        return parsed.has_value();
    }

    if (key == "grs_system")
    {
        const auto parsed = parse_i32(value);
        if (!parsed || *parsed < 1 || *parsed > 3)
        {
            return false;
        }
        if (!config.great_red_spot)
        {
            config.great_red_spot.emplace();
        }
        config.great_red_spot->system = static_cast<planet::RotationSystem>(*parsed);
        return true;
    }

    const auto number = parse_f64(value);
    if (!number)
    {
        return false;
    }

    if (key == "eye_separation")
    {
        config.eye_separation = *number;
    }
    else if (key == "center_x" || key == "center_y")
    {
        Vec2d center = config.get_planet_center();
        (key == "center_x" ? center.x : center.y) = *number;
        config.planet_center = center;
    }
    else if (key == "grs_longitude_deg")
    {
        if (!config.great_red_spot)
        {
            config.great_red_spot.emplace();
        }
        config.great_red_spot->longitude = *number * kDeg;
    }
    else if (key == "upper_limb_factor")
    {
        config.refraction.upper_limb_factor = *number;
    }
    else if (key == "zenith_angle_deg")
    {
        config.refraction.zenith_angle = *number * kDeg;
    }
    else if (key == "temperature_c")
    {
        config.refraction.atmosphere.temperature_c = *number;
    }
    else if (key == "pressure_hpa")
    {
        config.refraction.atmosphere.pressure_hPa = *number;
    }
    else
    {
        return false;
    }
    return true;
}

bool SceneLoader::apply_telescope(Telescope& telescope, std::string_view key, std::string_view value)
{
    if (key == "name")
    {
        telescope.name = std::string(value);
        return true;
    }

    if (const auto* flag = find_field(kTelescopeFlags, key))
    {
        const auto parsed = parse_bool(value);
        if (parsed)
        {
            telescope.*(flag->member) = *parsed;
        }
        return parsed.has_value();
    }

    if (const auto* field = find_field(kTelescopeFields, key))
    {
        const auto parsed = parse_f64(value);
        if (parsed)
        {
            telescope.*(field->member) = *parsed * field->factor;
        }
        return parsed.has_value();
    }
    return false;
}

bool SceneLoader::apply_body(BodyEphemeris& body, std::string_view key, std::string_view value)
{
    if (key == "date")
    {
        const auto jd = astro::TimeSystem::parse_iso8601(value);
        if (jd)
        {
            body.julian_date = *jd;
        }
        return jd.has_value();
    }

    if (const auto* field = find_field(kBodyFields, key))
    {
        const auto parsed = parse_f64(value);
        if (parsed)
        {
            body.*(field->member) = *parsed * field->factor;
        }
        return parsed.has_value();
    }
    return false;
}

bool SceneLoader::apply_moon(MoonEphemeris& moon, std::string_view key, std::string_view value)
{
    if (key == "name")
    {
        moon.name = std::string(value);
        return true;
    }

    if (const auto* flag = find_field(kMoonFlags, key))
    {
        const auto parsed = parse_bool(value);
        if (parsed)
        {
            moon.*(flag->member) = *parsed;
        }
        return parsed.has_value();
    }

    const auto number = parse_f64(value);
    if (!number)
    {
        return false;
    }

    if (const auto* field = find_field(kMoonFields, key))
    {
        moon.*(field->member) = *number * field->factor;
        return true;
    }

    // Positions in equatorial radii of the primary
    if (key == "x" || key == "y" || key == "z")
    {
        moon.position[key.front() - 'x'] = *number;
    }
    else if (key == "sun_x" || key == "sun_y" || key == "sun_z")
    {
        moon.position_from_sun[key.back() - 'x'] = *number;
    }
    else if (key == "sky_x_arcsec" || key == "sky_y_arcsec")
    {
        Vec2d offset = moon.sky_offset.value_or(Vec2d{0.0});
        offset[key[4] - 'x'] = *number * kArcsec;
        moon.sky_offset = offset;
    }
    else
    {
        return false;
    }
    return true;
}

// -----------------------------------------------------------------
// Utility: value parsing
// -----------------------------------------------------------------

std::string_view SceneLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

std::optional<f64> SceneLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

std::optional<i32> SceneLoader::parse_i32(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    i32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

std::optional<bool> SceneLoader::parse_bool(std::string_view sv)
{
    if (sv == "true" || sv == "yes" || sv == "on" || sv == "1")
    {
        return true;
    }
    if (sv == "false" || sv == "no" || sv == "off" || sv == "0")
    {
        return false;
    }
    return std::nullopt;
}

std::optional<rendering::Rgb> SceneLoader::parse_rgb(std::string_view sv)
{
    std::array<u8, 3> channels{};
    for (std::size_t i = 0; i < channels.size(); ++i)
    {
        const std::size_t comma = sv.find(',');
        if ((comma == std::string_view::npos) != (i == channels.size() - 1))
        {
            return std::nullopt;
        }
        const auto value = parse_i32(trim(sv.substr(0, comma)));
        if (!value || *value < 0 || *value > 255)
        {
            return std::nullopt;
        }
        channels[i] = static_cast<u8>(*value);
        sv = comma == std::string_view::npos ? std::string_view{} : sv.substr(comma + 1);
    }
    return rendering::Rgb{channels[0], channels[1], channels[2]};
}

} // namespace planetrender::scene
