#pragma once

/// @file time_system.hpp
/// @brief Scene epochs: civil date/time <-> Julian Date, ISO-8601 parsing.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace planetrender::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year = 2000;
        i32 month = 1;
        i32 day = 1;
        i32 hour = 12;
        i32 minute = 0;
        f64 second = 0.0;
    };

    /// @brief Static utility class for the instant a frame is rendered for.
    ///
    /// The renderer keys its satellite ordering and frame cache on the Julian
    /// Date of the ephemeris, so scene files state their epoch as an ISO-8601
    /// string that is converted here (Meeus, Astronomical Algorithms Ch. 7).
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC, Gregorian) to Julian Date.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Parse "YYYY-MM-DD", "YYYY-MM-DDTHH:MM" or "YYYY-MM-DDTHH:MM:SS[.s]".
        /// A space is accepted instead of 'T' and a trailing 'Z' is ignored.
        /// @return Julian Date, or std::nullopt if the text is not a valid date.
        [[nodiscard]] static std::optional<f64> parse_iso8601(std::string_view text);

        /// @brief Format a Julian Date as "YYYY-MM-DD HH:MM:SS UTC".
        [[nodiscard]] static std::string format(f64 jd);

        /// @brief True if two Julian Dates denote the same instant to within a millisecond.
        [[nodiscard]] static bool same_instant(f64 jd_a, f64 jd_b);
    };

} // namespace planetrender::astro
