/// @file texture_repository.cpp
/// @brief Texture lookup and memoization.

#include "rendering/texture_repository.hpp"
#include "rendering/png_io.hpp"
#include "core/logger.hpp"

namespace planetrender::rendering
{

TextureRepository::TextureRepository(std::filesystem::path directory)
    : m_directory{std::move(directory)}
{
}

const Image* TextureRepository::find(std::string_view name)
{
    const std::string key{name};
    auto it = m_cache.find(key);
    if (it == m_cache.end())
    {
        std::optional<Image> image;
        if (!m_directory.empty())
        {
            const auto path = m_directory / (key + ".png");
            if (std::filesystem::exists(path))
            {
                image = PngIo::read(path);
            }
            else
            {
                PLR_CORE_WARN("TextureRepository: no texture '{}' in '{}'", key, m_directory.string());
            }
        }
        it = m_cache.emplace(key, std::move(image)).first;
    }
    return it->second ? &*it->second : nullptr;
}

void TextureRepository::insert(std::string name, Image image)
{
    m_cache.insert_or_assign(std::move(name), std::optional<Image>{std::move(image)});
}

} // namespace planetrender::rendering
