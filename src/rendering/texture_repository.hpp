#pragma once

/// @file texture_repository.hpp
/// @brief Memoizing loader for body, moon and ring strip textures.

#include "rendering/image.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace planetrender::rendering
{
    /// @brief Loads "<name>.png" from a texture directory once and keeps it.
    ///
    /// Missing or corrupt files are remembered as absent so the warning is
    /// logged only on the first request.
    class TextureRepository
    {
    public:
        TextureRepository() = default;
        explicit TextureRepository(std::filesystem::path directory);

        /// @brief Texture by name, or nullptr if it cannot be loaded.
        [[nodiscard]] const Image* find(std::string_view name);

        /// @brief Register an in-memory texture under @p name (replaces any cached entry).
        void insert(std::string name, Image image);

        /// @brief Drop every cached entry.
        void clear() { m_cache.clear(); }

        [[nodiscard]] const std::filesystem::path& get_directory() const { return m_directory; }
        [[nodiscard]] std::size_t get_cached_count() const { return m_cache.size(); }

    private:
        std::filesystem::path m_directory;
        std::unordered_map<std::string, std::optional<Image>> m_cache;
    };

} // namespace planetrender::rendering
