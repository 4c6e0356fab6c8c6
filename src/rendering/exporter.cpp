/// @file exporter.cpp
/// @brief PNG frame exporter.

#include "rendering/exporter.hpp"
#include "rendering/png_io.hpp"

#include <string>

namespace planetrender::rendering
{

PngExporter::PngExporter(std::filesystem::path path, bool write_eyes)
    : m_path{std::move(path)}
    , m_write_eyes{write_eyes}
{
}

bool PngExporter::write(const RenderedFrame& frame)
{
    bool ok = PngIo::write(m_path, frame.image);

    if (m_write_eyes && frame.left && frame.right)
    {
        ok = PngIo::write(eye_path("_left"), *frame.left) && ok;
        ok = PngIo::write(eye_path("_right"), *frame.right) && ok;
    }
    return ok;
}

std::filesystem::path PngExporter::eye_path(std::string_view suffix) const
{
    auto out = m_path;
    out.replace_filename(m_path.stem().string() + std::string{suffix} + m_path.extension().string());
    return out;
}

} // namespace planetrender::rendering
