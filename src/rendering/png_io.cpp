/// @file png_io.cpp
/// @brief libpng reader (simplified API) and writer (classic write struct).

#include "rendering/png_io.hpp"
#include "core/logger.hpp"

#include <png.h>

#include <cstdio>
#include <memory>
#include <vector>

namespace planetrender::rendering
{

namespace
{

struct FileCloser
{
    void operator()(std::FILE* file) const { std::fclose(file); }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

} // anonymous namespace

// -----------------------------------------------------------------
// Read
// -----------------------------------------------------------------

std::optional<Image> PngIo::read(const std::filesystem::path& path)
{
    png_image png{};
    png.version = PNG_IMAGE_VERSION;

    if (png_image_begin_read_from_file(&png, path.string().c_str()) == 0)
    {
        PLR_CORE_WARN("PngIo: cannot read '{}': {}", path.string(), png.message);
        return std::nullopt;
    }

    png.format = PNG_FORMAT_RGB;
    std::vector<png_byte> buffer(PNG_IMAGE_SIZE(png));

    if (png_image_finish_read(&png, nullptr, buffer.data(), 0, nullptr) == 0)
    {
        PLR_CORE_WARN("PngIo: corrupt PNG '{}': {}", path.string(), png.message);
        png_image_free(&png);
        return std::nullopt;
    }

    const auto width = static_cast<i32>(png.width);
    const auto height = static_cast<i32>(png.height);
    Image image(width, height);

    std::size_t offset = 0;
    for (i32 y = 0; y < height; ++y)
    {
        for (i32 x = 0; x < width; ++x)
        {
            image.set(x, y, Rgb{buffer[offset], buffer[offset + 1], buffer[offset + 2]});
            offset += 3;
        }
    }

    PLR_CORE_DEBUG("PngIo: loaded '{}' ({}x{})", path.string(), width, height);
    return image;
}

// -----------------------------------------------------------------
// Write
// -----------------------------------------------------------------

bool PngIo::write(const std::filesystem::path& path, const Image& image)
{
    if (image.empty())
    {
        PLR_CORE_ERROR("PngIo: refusing to write empty image to '{}'", path.string());
        return false;
    }

    FilePtr file(std::fopen(path.string().c_str(), "wb"));
    if (!file)
    {
        PLR_CORE_ERROR("PngIo: cannot open '{}' for writing", path.string());
        return false;
    }

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (png_ptr == nullptr)
    {
        PLR_CORE_ERROR("PngIo: png_create_write_struct failed");
        return false;
    }

    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (info_ptr == nullptr)
    {
        png_destroy_write_struct(&png_ptr, nullptr);
        PLR_CORE_ERROR("PngIo: png_create_info_struct failed");
        return false;
    }

    // Packed RGB rows; libpng only reads through the row pointers.
    const auto width = static_cast<std::size_t>(image.get_width());
    const auto height = static_cast<std::size_t>(image.get_height());
    std::vector<png_byte> rows(width * height * 3);
    std::vector<png_bytep> row_pointers(height);
    for (std::size_t y = 0; y < height; ++y)
    {
        for (std::size_t x = 0; x < width; ++x)
        {
            const Rgb c = image.get(static_cast<i32>(x), static_cast<i32>(y));
            png_byte* px = &rows[(y * width + x) * 3];
            px[0] = c.r;
            px[1] = c.g;
            px[2] = c.b;
        }
        row_pointers[y] = &rows[y * width * 3];
    }

    if (setjmp(png_jmpbuf(png_ptr)))
    {
        png_destroy_write_struct(&png_ptr, &info_ptr);
        PLR_CORE_ERROR("PngIo: libpng error while writing '{}'", path.string());
        return false;
    }

    png_init_io(png_ptr, file.get());
    png_set_IHDR(png_ptr, info_ptr,
                 static_cast<png_uint_32>(width), static_cast<png_uint_32>(height),
                 8, PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    png_set_rows(png_ptr, info_ptr, row_pointers.data());
    png_write_png(png_ptr, info_ptr, PNG_TRANSFORM_IDENTITY, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);

    PLR_CORE_INFO("PngIo: wrote '{}' ({}x{})", path.string(), width, height);
    return true;
}

} // namespace planetrender::rendering
