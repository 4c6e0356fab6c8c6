/// @file planet_renderer.cpp
/// @brief Pass ordering, fast path and post-processing of a frame.

#include "planet/planet_renderer.hpp"
#include "core/logger.hpp"
#include "planet/axes_overlay.hpp"
#include "planet/disk_rasterizer.hpp"
#include "planet/refraction.hpp"
#include "planet/ring_renderer.hpp"
#include "planet/stereo.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

namespace planetrender::planet
{

using namespace renderer_constants;
using astro::Target;
using rendering::FrameSnapshot;
using rendering::RasterCanvas;
using rendering::RenderedFrame;

namespace
{

bool same_pupil(const Telescope& a, const Telescope& b)
{
    return a.aperture_mm == b.aperture_mm
        && a.central_obstruction == b.central_obstruction
        && a.spider_mm == b.spider_mm;
}

Vec2d truncated(Vec2d v)
{
    return Vec2d{std::trunc(v.x), std::trunc(v.y)};
}

} // anonymous namespace

PlanetRenderer::PlanetRenderer(rendering::TextureRepository& textures)
    : m_textures{textures}
{
}

RenderedFrame PlanetRenderer::render(const FrameRequest& request)
{
    std::lock_guard lock(m_mutex);

    const auto& config = request.config;
    config.validate();

    const f64 field = config.telescope.field_arcsec;
    const f64 scale = config.width * request.body.angular_radius / config.telescope.field_rad();
    const f64 upper_limb_factor = config.refraction.get_upper_limb_factor(request.body);
    const bool refraction = Refraction::is_visible(scale, upper_limb_factor);

    bool high_quality = config.high_quality && config.textures;
    if (!config.force_high_quality && field > kHighQualityMaxField)
    {
        high_quality = false;
    }

    if (const CachedFrame* cached = m_cache.find(request, scale))
    {
        Pass pass{request, FrameGeometry::compute(request, 1.0),
                  RasterCanvas(config.width, config.height, config.background), scale, upper_limb_factor};
        return render_from_cache(pass, *cached);
    }

    bool fast_grid = !config.high_quality && (!config.textures || config.target == Target::Sun)
                  && !config.diffraction && config.anaglyph == AnaglyphMode::None && !refraction;

    const f64 supersample = high_quality ? kHighQualitySupersample : 1.0;
    FrameGeometry geometry = FrameGeometry::compute(request, supersample);
    Pass pass{request, geometry, RasterCanvas(geometry.width, geometry.height, config.background), scale, upper_limb_factor};
    pass.canvas.clear(config.background);

    PLR_CORE_TRACE("Rendering {}: {:.2f} px/radius, supersample {:.1f}", astro::to_string(config.target), scale, supersample);

    if (pass.geometry.dist_center > 1.0 && pass.geometry.times_out > kSatellitesOnlyTimesOut)
    {
        return render_satellites_only(pass);
    }

    if (pass.geometry.radius < kMinTexturedRadius)
    {
        fast_grid = true;
    }
    if (pass.geometry.radius > config.width && !config.high_quality && !config.force_high_quality && config.textures)
    {
        fast_grid = true;
    }
    if (fast_grid && supersample != 1.0)
    {
        use_output_resolution(pass);
    }
    return render_full(pass, fast_grid);
}

// -----------------------------------------------------------------
// Render paths
// -----------------------------------------------------------------

RenderedFrame PlanetRenderer::render_from_cache(Pass& pass, const CachedFrame& cached)
{
    const auto& g = pass.geometry;
    auto& canvas = pass.canvas;
    canvas.clear(pass.request.config.background);

    const f64 image_scale = pass.output_scale / cached.scale;
    const i32 margin = FrameCache::get_clip_margin(g.target, pass.output_scale);
    const i32 cx = static_cast<i32>(g.center.x);
    const i32 cy = static_cast<i32>(g.center.y);
    const i32 x0 = std::max(0, cx - margin);
    const i32 y0 = std::max(0, cy - margin);
    const i32 x1 = std::min(canvas.get_width(), cx + margin + 1);
    const i32 y1 = std::min(canvas.get_height(), cy + margin + 1);

    if (x1 > x0 && y1 > y0)
    {
        canvas.set_clip(rendering::ClipRect{x0, y0, x1 - x0, y1 - y0});
        canvas.draw_snapshot(cached.snapshot, g.center.x - cached.center.x * image_scale,
                             g.center.y - cached.center.y * image_scale, image_scale);
        canvas.reset_clip();
    }

    auto picks = draw_satellites(pass);
    AxesOverlay(g, pass.request.config).draw(canvas);

    remember(pass, std::move(picks));
    RenderedFrame frame = finish(pass);
    frame.from_cache = true;
    PLR_CORE_TRACE("Frame served from cache, rescaled by {:.3f}", image_scale);
    return frame;
}

RenderedFrame PlanetRenderer::render_satellites_only(Pass& pass)
{
    if (pass.geometry.supersample != 1.0)
    {
        use_output_resolution(pass);
    }
    auto picks = draw_satellites(pass);
    remember(pass, std::move(picks));
    return finish(pass);
}

RenderedFrame PlanetRenderer::render_full(Pass& pass, bool fast_grid)
{
    const auto& request = pass.request;
    const auto& config = request.config;
    const auto& g = pass.geometry;
    auto& canvas = pass.canvas;

    m_order.invalidate();

    // Disk
    const DiskRasterizer disk(g, config, m_textures);
    bool disk_drawn = false;
    if (!fast_grid && config.textures && g.radius > kMinTexturedRadius && g.target != Target::Sun)
    {
        disk_drawn = disk.draw_textured(canvas);
        if (!disk_drawn)
        {
            PLR_CORE_WARN("Texture '{}' unavailable, drawing {} without it", disk.get_texture_name(),
                          astro::to_string(g.target));
        }
    }
    if (!disk_drawn && g.planet_visible)
    {
        disk.draw_fallback(canvas);
    }

    // Rings
    RenderConfig ring_config = config;
    if (!g.rings_textures_visible)
    {
        ring_config.textures = false;
    }
    const RingRenderer rings(g, ring_config, request.body, m_textures);
    rings.draw_shadow(canvas);
    rings.draw(canvas);

    if (fast_grid)
    {
        auto picks = draw_satellites(pass);
        AxesOverlay(g, config).draw(canvas);
        remember(pass, std::move(picks));
        return finish(pass);
    }

    // Transit shadows
    {
        const SatelliteRenderer satellites(g, request, m_textures, m_order.get_order(request.moons));
        satellites.draw_shadows(canvas);
    }

    // Planet raster for the fast path
    if ((config.textures || g.target == Target::Sun) && pass.output_scale > cache_constants::kMinScale
        && g.is_in_screen(g.center.x, g.center.y, g.scale))
    {
        FrameSnapshot planet_raster;
        if (config.textures && config.diffraction)
        {
            // Moons are redrawn over the cached raster, so it is convolved without them
            RasterCanvas planet_only = canvas;
            apply_diffraction(planet_only, config.telescope);
            planet_raster = resample(planet_only.snapshot(), config.width, config.height);
        }
        else
        {
            planet_raster = take_output_snapshot(pass);
        }
        m_cache.store(CachedFrame{request, std::move(planet_raster), pass.output_scale,
                                  truncated(config.get_planet_center())});
    }
    else
    {
        m_cache.clear();
    }

    auto picks = draw_satellites(pass);

    if (config.textures && config.diffraction)
    {
        apply_diffraction(canvas, config.telescope);
    }

    AxesOverlay(g, config).draw(canvas);

    if (config.show_labels && !picks.empty())
    {
        const SatelliteRenderer satellites(g, request, m_textures, m_order.get_order(request.moons));
        satellites.draw_labels(canvas, picks);
    }

    remember(pass, std::move(picks));
    return finish(pass);
}

// -----------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------

std::vector<SatellitePick> PlanetRenderer::draw_satellites(Pass& pass)
{
    const SatelliteRenderer satellites(pass.geometry, pass.request, m_textures, m_order.get_order(pass.request.moons));
    try
    {
        return satellites.draw(pass.canvas);
    }
    catch (const std::exception& e)
    {
        PLR_CORE_ERROR("Satellites of {} not drawn: {}", astro::to_string(pass.geometry.target), e.what());
    }
    return {};
}

void PlanetRenderer::use_output_resolution(Pass& pass) const
{
    const auto& config = pass.request.config;
    pass.geometry = FrameGeometry::compute(pass.request, 1.0);
    pass.canvas.resize(config.width, config.height);
    pass.canvas.clear(config.background);
}

void PlanetRenderer::apply_diffraction(rendering::Canvas& canvas, const Telescope& telescope)
{
    if (!m_pattern || !same_pupil(m_pattern_telescope, telescope))
    {
        m_pattern = Diffraction::compute_pattern(telescope);
        m_pattern_telescope = telescope;
    }
    Diffraction::apply(canvas, *m_pattern, telescope);
}

FrameSnapshot PlanetRenderer::take_output_snapshot(const Pass& pass) const
{
    const auto& config = pass.request.config;
    return resample(pass.canvas.snapshot(), config.width, config.height);
}

RenderedFrame PlanetRenderer::finish(Pass& pass)
{
    const auto& config = pass.request.config;
    FrameSnapshot output = take_output_snapshot(pass);

    if (Refraction::is_visible(pass.output_scale, pass.upper_limb_factor))
    {
        output = Refraction::apply(output, truncated(config.get_planet_center()), pass.upper_limb_factor,
                                   config.refraction.zenith_angle, config.background);
    }

    RenderedFrame frame;
    if (is_stereo(config.anaglyph))
    {
        StereoPair pair = Stereo::derive(output, pass.output_scale, config.get_eye_separation());
        frame.image = Stereo::pack(pair, config.anaglyph);
        frame.left = std::move(pair.left);
        frame.right = std::move(pair.right);
    }
    else
    {
        frame.image = std::move(output.color);
    }
    return frame;
}

void PlanetRenderer::remember(const Pass& pass, std::vector<SatellitePick> picks)
{
    const f64 supersample = pass.geometry.supersample;
    for (auto& pick : picks)
    {
        pick.position /= supersample;
        pick.radius /= supersample;
    }
    m_last_picks = std::move(picks);
    m_last_request = pass.request;
    m_last_geometry = supersample == 1.0 ? pass.geometry : FrameGeometry::compute(pass.request, 1.0);
}

// -----------------------------------------------------------------
// Queries on the last frame
// -----------------------------------------------------------------

void PlanetRenderer::invalidate_on_date_change()
{
    std::lock_guard lock(m_mutex);
    m_cache.clear();
    m_order.invalidate();
    PLR_CORE_DEBUG("Date changed: frame cache and satellite order cleared");
}

std::optional<Planetographic> PlanetRenderer::screen_to_planetographic(f64 x, f64 y) const
{
    std::lock_guard lock(m_mutex);
    if (!m_last_geometry)
    {
        return std::nullopt;
    }
    return m_last_geometry->screen_to_planetographic(x, y);
}

std::optional<Vec2d> PlanetRenderer::planetographic_to_screen(const Planetographic& point) const
{
    std::lock_guard lock(m_mutex);
    if (!m_last_geometry)
    {
        return std::nullopt;
    }
    return m_last_geometry->planetographic_to_screen(point);
}

std::optional<BodyPick> PlanetRenderer::pick_body(f64 x, f64 y) const
{
    std::lock_guard lock(m_mutex);
    if (!m_last_geometry || !m_last_request)
    {
        return std::nullopt;
    }

    std::optional<BodyPick> best;
    const auto& g = *m_last_geometry;
    if (g.scale > 0.0 && g.screen_to_planetographic(x, y))
    {
        const f64 dx = (x - g.center.x) / g.scale;
        const f64 dy = (y - g.center.y) / (g.scale * g.axis_ratio);
        best = BodyPick{std::string(astro::to_string(g.target)), std::nullopt,
                        std::sqrt(std::max(0.0, 1.0 - dx * dx - dy * dy))};
    }

    for (const auto& pick : m_last_picks)
    {
        const f64 reach = std::max(pick.radius, 1.0);
        const Vec2d d = Vec2d{x, y} - pick.position;
        if (d.x * d.x + d.y * d.y > reach * reach)
        {
            continue;
        }
        if (!best || pick.depth >= best->depth)
        {
            best = BodyPick{pick.name, pick.index, pick.depth};
        }
    }
    return best;
}

std::vector<SatellitePick> PlanetRenderer::get_satellite_picks() const
{
    std::lock_guard lock(m_mutex);
    return m_last_picks;
}

bool PlanetRenderer::has_cached_frame() const
{
    std::lock_guard lock(m_mutex);
    return !m_cache.empty();
}

} // namespace planetrender::planet
