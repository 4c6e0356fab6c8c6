#pragma once

/// @file glyphs.hpp
/// @brief Built-in 5x7 bitmap font for grid labels and compass marks.

#include "core/types.hpp"

#include <array>

namespace planetrender::rendering::glyphs
{
    constexpr i32 kWidth = 5;
    constexpr i32 kHeight = 7;
    constexpr i32 kAdvance = kWidth + 1;

    /// One byte per row, top row first; bit 4 is the leftmost column.
    using Glyph = std::array<u8, kHeight>;

    /// Code used for the degree sign (UTF-8 "\xC2\xB0" is folded to this).
    constexpr char kDegreeSign = '\x7F';

    /// @brief Bitmap of a character, or nullptr when the font has no glyph for it.
    /// Lowercase letters map to their uppercase glyphs.
    [[nodiscard]] const Glyph* find(char c);

} // namespace planetrender::rendering::glyphs
