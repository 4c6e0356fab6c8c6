#pragma once

/// @file exporter.hpp
/// @brief Rendered frame container and the output sink interface.

#include "rendering/image.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace planetrender::rendering
{
    /// @brief Result of one render call.
    struct RenderedFrame
    {
        Image image;                 ///< Final raster (anaglyph or side-by-side when stereo)
        std::optional<Image> left;   ///< Left eye view, stereo modes only
        std::optional<Image> right;  ///< Right eye view, stereo modes only
        bool from_cache = false;     ///< Produced by rescaling the cached raster
    };

    /// @brief Destination for rendered frames.
    class Exporter
    {
    public:
        virtual ~Exporter() = default;

        /// @return true if the frame was stored.
        [[nodiscard]] virtual bool write(const RenderedFrame& frame) = 0;
    };

    /// @brief Writes frames as PNG files.
    ///
    /// The main raster goes to the configured path. When @p write_eyes is set
    /// and the frame carries a stereo pair, "<stem>_left.png" and
    /// "<stem>_right.png" are written beside it.
    class PngExporter final : public Exporter
    {
    public:
        explicit PngExporter(std::filesystem::path path, bool write_eyes = false);

        [[nodiscard]] bool write(const RenderedFrame& frame) override;

        [[nodiscard]] const std::filesystem::path& get_path() const { return m_path; }

    private:
        [[nodiscard]] std::filesystem::path eye_path(std::string_view suffix) const;

        std::filesystem::path m_path;
        bool m_write_eyes;
    };

} // namespace planetrender::rendering
