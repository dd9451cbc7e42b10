/**
 * Atlas assembler
 */

#include "tessera/atlas/assembler.hpp"
#include "tessera/image/normalize.hpp"
#include "tessera/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

namespace tessera::atlas {

namespace {

struct Tile {
    image::Image pixels;
    std::optional<PackError> error;
};

Tile render_tile(const IconRasterizer& rasterizer, const IconSource& source,
                 u32 size, u32 supersample) {
    auto start = std::chrono::steady_clock::now();
    auto result = rasterizer.rasterize(source, size, supersample);
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    logging::get("atlas").debug_fmt("rendered {} at {}px in {}us", source.id, size, elapsed.count());

    if (result.is_err()) {
        return {image::Image(), std::move(result).error()};
    }

    Tile tile{std::move(result).value(), std::nullopt};
    if (tile.pixels.width() != size || tile.pixels.height() != size) {
        tile.error = PackError::unrenderable(
            source.id + ": rasterizer returned a tile of the wrong size");
    }
    return tile;
}

} // anonymous namespace

u32 AtlasAssembler::worker_count(usize icons) const {
    u32 workers = m_options.worker_threads;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return static_cast<u32>(std::min<usize>(workers, std::max<usize>(icons, 1)));
}

PackResult<AssembledAtlas> AtlasAssembler::assemble(const IconSet& icons, const GridConfig& grid) const {
    auto grid_layout = layout(icons.size(), grid);
    if (grid_layout.is_err()) {
        return make_error(std::move(grid_layout).error());
    }

    AssembledAtlas atlas;
    atlas.layout = std::move(grid_layout).value();
    atlas.canvas = image::Image(atlas.layout.canvas.width, atlas.layout.canvas.height);

    if (icons.empty()) {
        return atlas;
    }

    // Render every icon into its own slot; each slot has exactly one writer
    std::vector<Tile> tiles(icons.size());
    const u32 workers = worker_count(icons.size());

    if (workers <= 1) {
        for (usize i = 0; i < icons.size(); ++i) {
            tiles[i] = render_tile(m_rasterizer, icons[i], grid.icon_size, grid.supersample);
        }
    } else {
        std::vector<std::future<void>> tasks;
        tasks.reserve(workers);
        for (u32 w = 0; w < workers; ++w) {
            tasks.push_back(std::async(std::launch::async, [&, w]() {
                for (usize i = w; i < icons.size(); i += workers) {
                    tiles[i] = render_tile(m_rasterizer, icons[i], grid.icon_size, grid.supersample);
                }
            }));
        }
        for (auto& task : tasks) {
            task.get();
        }
    }

    // Paste in set order
    auto& log = logging::get("atlas");
    const image::Image fallback(grid.icon_size, grid.icon_size, m_options.fallback);

    for (const Placement& placement : atlas.layout.placements) {
        Tile& tile = tiles[placement.index];
        const IconSource& source = icons[placement.index];

        if (tile.error) {
            log.warn_fmt("{} ({}): {}; using fallback raster",
                         source.id,
                         source.content ? source.content->describe() : std::string("<none>"),
                         tile.error->message);
            atlas.fallbacks.push_back(source.id);
            atlas.canvas.blit(fallback, placement.pixel_x, placement.pixel_y);
            continue;
        }

        image::normalize_to_white_in_place(tile.pixels);
        atlas.canvas.blit(tile.pixels, placement.pixel_x, placement.pixel_y);
    }

    return atlas;
}

} // namespace tessera::atlas
