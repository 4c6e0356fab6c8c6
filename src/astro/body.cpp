/// @file body.cpp
/// @brief Body tables: IAU radii and ring radii in kilometres.

#include "astro/body.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace planetrender::astro
{

namespace
{

// Ring radii [km], inner to outer
constexpr std::array<f64, 7> kSaturnRings = {74510.0, 92000.0, 117500.0, 122200.0, 136800.0, 139400.0, 140390.0};
constexpr std::array<f64, 6> kUranusRings = {38000.0, 44720.0, 45665.0, 48300.0, 50020.0, 51150.0};
constexpr std::array<f64, 4> kNeptuneRings = {42900.0, 53000.0, 57200.0, 62930.0};

const std::array<BodyInfo, 11> kBodies = {{
    {Target::Sun,     "Sun",     696000.0, 696000.0, {}, 0, 0},
    {Target::Mercury, "Mercury", 2440.53,  2438.26,  {}, 0, 0},
    {Target::Venus,   "Venus",   6051.8,   6051.8,   {}, 0, 0},
    {Target::Earth,   "Earth",   6378.1366, 6356.7519, {}, 0, 0},
    {Target::Mars,    "Mars",    3396.19,  3376.20,  {}, 0, 2},
    {Target::Jupiter, "Jupiter", 71492.0,  66854.0,  {}, 0, 4},
    {Target::Saturn,  "Saturn",  60268.0,  54364.0,  kSaturnRings, 7, 8},
    {Target::Uranus,  "Uranus",  25559.0,  24973.0,  kUranusRings, 4, 5},
    {Target::Neptune, "Neptune", 24764.0,  24341.0,  kNeptuneRings, 4, 2},
    {Target::Pluto,   "Pluto",   1188.3,   1188.3,   {}, 0, 1},
    {Target::Moon,    "Moon",    1737.4,   1737.4,   {}, 0, 0},
}};

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

const BodyInfo& get_body_info(Target target)
{
    return kBodies[static_cast<std::size_t>(target)];
}

std::optional<Target> target_from_name(std::string_view name)
{
    for (const auto& body : kBodies)
    {
        if (iequals(body.name, name))
        {
            return body.target;
        }
    }
    return std::nullopt;
}

std::string_view to_string(Target target)
{
    return get_body_info(target).name;
}

bool is_giant_planet(Target target)
{
    return target >= Target::Jupiter && target <= Target::Neptune;
}

bool has_rings(Target target)
{
    return !get_body_info(target).ring_radii_km.empty();
}

bool has_satellites(Target target)
{
    return target >= Target::Mars && target <= Target::Pluto;
}

} // namespace planetrender::astro
