#pragma once

/// @file png_io.hpp
/// @brief PNG decoding and encoding of RGB images through libpng.

#include "rendering/image.hpp"

#include <filesystem>
#include <optional>

namespace planetrender::rendering
{
    /// @brief Static utility class wrapping libpng.
    class PngIo
    {
    public:
        PngIo() = delete;

        /// @brief Decode any PNG (palette, grey, alpha are converted) to 8-bit RGB.
        /// @return The image, or std::nullopt if the file is missing or corrupt.
        [[nodiscard]] static std::optional<Image> read(const std::filesystem::path& path);

        /// @brief Encode an RGB image as an 8-bit PNG.
        /// @return true on success; failures are logged.
        [[nodiscard]] static bool write(const std::filesystem::path& path, const Image& image);
    };

} // namespace planetrender::rendering
