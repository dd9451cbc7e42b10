#pragma once

#include "grid.hpp"
#include "icon_source.hpp"
#include "rasterizer.hpp"
#include "tessera/image/image.hpp"
#include <string>
#include <vector>

namespace tessera::atlas {

struct AssemblerOptions {
    // 0 = one worker per hardware thread, 1 = render on the calling thread
    u32 worker_threads{0};

    // Raster used in place of an icon that fails to render
    Color fallback{Color::white()};
};

struct AssembledAtlas {
    image::Image canvas;
    GridLayout layout;

    // Ids of the icons that were replaced by the fallback raster, in set order
    std::vector<std::string> fallbacks;
};

// ============================================================================
// AtlasAssembler - rasterize, normalize and paste every icon of a set
// ============================================================================

class AtlasAssembler {
public:
    explicit AtlasAssembler(const IconRasterizer& rasterizer, AssemblerOptions options = {})
        : m_rasterizer(rasterizer)
        , m_options(options)
    {}

    /**
     * Build the atlas canvas for `icons`.
     *
     * Icons may render on worker threads, each into its own tile; tiles are
     * normalized to white and pasted in set order by the calling thread, so
     * the result does not depend on scheduling. An icon that fails to render
     * is replaced by an opaque fallback tile and listed in `fallbacks`.
     * Grid errors (InvalidConfig) are returned as is.
     */
    [[nodiscard]] PackResult<AssembledAtlas> assemble(const IconSet& icons, const GridConfig& grid) const;

private:
    [[nodiscard]] u32 worker_count(usize icons) const;

    const IconRasterizer& m_rasterizer;
    AssemblerOptions m_options;
};

} // namespace tessera::atlas
