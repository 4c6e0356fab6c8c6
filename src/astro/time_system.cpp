/// @file time_system.cpp
/// @brief Implementation of scene epoch utilities.

#include "astro/time_system.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cmath>

namespace planetrender::astro
{

namespace
{

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

i32 days_in_month(i32 year, i32 month)
{
    constexpr i32 kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : kDays[month - 1];
}

} // anonymous namespace

// -----------------------------------------------------------------
// Civil -> Julian Date
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    // January and February count as months 13 and 14 of the previous year
    const bool early = dt.month <= 2;
    const i32 y = early ? dt.year - 1 : dt.year;
    const i32 m = early ? dt.month + 12 : dt.month;

    const i32 century = y / 100;
    const i32 gregorian = 2 - century + century / 4;

    const f64 day = static_cast<f64>(dt.day)
                  + (static_cast<f64>(dt.hour) + static_cast<f64>(dt.minute) / 60.0 + dt.second / 3600.0) / 24.0;

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + day + static_cast<f64>(gregorian) - 1524.5;
}

// -----------------------------------------------------------------
// Julian Date -> civil
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    const f64 shifted = jd + 0.5;
    const f64 whole = std::floor(shifted);
    const f64 fraction = shifted - whole;

    i64 a = static_cast<i64>(whole);
    if (a >= 2299161)
    {
        const i64 alpha = static_cast<i64>(std::floor((static_cast<f64>(a) - 1867216.25) / 36524.25));
        a += 1 + alpha - alpha / 4;
    }

    const i64 b = a + 1524;
    const i64 c = static_cast<i64>(std::floor((static_cast<f64>(b) - 122.1) / 365.25));
    const i64 d = static_cast<i64>(std::floor(365.25 * static_cast<f64>(c)));
    const i64 e = static_cast<i64>(std::floor(static_cast<f64>(b - d) / 30.6001));

    DateTime out;
    out.day = static_cast<i32>(b - d - static_cast<i64>(std::floor(30.6001 * static_cast<f64>(e))));
    out.month = static_cast<i32>(e < 14 ? e - 1 : e - 13);
    out.year = static_cast<i32>(out.month > 2 ? c - 4716 : c - 4715);

    f64 seconds = fraction * 86400.0;
    out.hour = static_cast<i32>(seconds / 3600.0);
    seconds -= out.hour * 3600.0;
    out.minute = static_cast<i32>(seconds / 60.0);
    out.second = seconds - out.minute * 60.0;
    return out;
}

// -----------------------------------------------------------------
// ISO-8601 parsing
// -----------------------------------------------------------------

std::optional<f64> TimeSystem::parse_iso8601(std::string_view text)
{
    while (!text.empty() && (text.back() == 'Z' || text.back() == ' '))
    {
        text.remove_suffix(1);
    }

    if (text.size() < 10 || text[4] != '-' || text[7] != '-')
    {
        return std::nullopt;
    }

    DateTime dt{.hour = 0};
    const auto year = parse_number<i32>(text.substr(0, 4));
    const auto month = parse_number<i32>(text.substr(5, 2));
    const auto day = parse_number<i32>(text.substr(8, 2));
    if (!year || !month || !day)
    {
        return std::nullopt;
    }
    dt.year = *year;
    dt.month = *month;
    dt.day = *day;

    if (dt.month < 1 || dt.month > 12 || dt.day < 1 || dt.day > days_in_month(dt.year, dt.month))
    {
        return std::nullopt;
    }

    if (text.size() > 10)
    {
        if ((text[10] != 'T' && text[10] != ' ') || text.size() < 16 || text[13] != ':')
        {
            return std::nullopt;
        }
        const auto hour = parse_number<i32>(text.substr(11, 2));
        const auto minute = parse_number<i32>(text.substr(14, 2));
        if (!hour || !minute || *hour > 23 || *minute > 59 || *hour < 0 || *minute < 0)
        {
            return std::nullopt;
        }
        dt.hour = *hour;
        dt.minute = *minute;

        if (text.size() > 16)
        {
            if (text[16] != ':')
            {
                return std::nullopt;
            }
            const auto second = parse_number<f64>(text.substr(17));
            if (!second || *second < 0.0 || *second >= 61.0)
            {
                return std::nullopt;
            }
            dt.second = *second;
        }
    }

    return to_julian_date(dt);
}

std::string TimeSystem::format(f64 jd)
{
    const auto dt = from_julian_date(jd);
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d} UTC",
                       dt.year, dt.month, dt.day, dt.hour, dt.minute,
                       static_cast<i32>(dt.second));
}

bool TimeSystem::same_instant(f64 jd_a, f64 jd_b)
{
    constexpr f64 kMillisecondDays = 1.0 / 86400000.0;
    return std::abs(jd_a - jd_b) < kMillisecondDays;
}

} // namespace planetrender::astro
