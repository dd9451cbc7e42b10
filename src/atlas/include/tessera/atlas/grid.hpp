#pragma once

#include "tessera/core/error.hpp"
#include <optional>
#include <vector>

namespace tessera::atlas {

// ============================================================================
// Grid configuration
// ============================================================================

// Per-job grid parameters. Supersampling affects rasterization only and
// never the layout.
struct GridConfig {
    u32 columns{20};
    u32 icon_size{32};
    u32 supersample{4};
    std::optional<u32> fixed_rows;
};

// ============================================================================
// Layout
// ============================================================================

struct Placement {
    usize index{0};
    u32 column{0};
    u32 row{0};
    u32 pixel_x{0};
    u32 pixel_y{0};

    bool operator==(const Placement&) const = default;
};

struct GridLayout {
    u32 columns{0};
    u32 rows{0};
    u32 icon_size{0};
    SizeU canvas;
    std::vector<Placement> placements;

    [[nodiscard]] usize count() const noexcept { return placements.size(); }
    [[nodiscard]] bool empty() const noexcept { return placements.empty(); }
};

/**
 * Row-major grid for `count` icons.
 *
 *   column = i mod columns, row = i div columns
 *   pixel  = (column * icon_size, row * icon_size)
 *   rows   = ceil(count / columns), canvas = (columns, rows) * icon_size
 *
 * columns and icon_size must be at least 1 (InvalidConfig otherwise).
 * count == 0 yields rows = 0, an empty canvas and no placements.
 */
[[nodiscard]] PackResult<GridLayout> layout(usize count, u32 columns, u32 icon_size);

/**
 * Same placements on a canvas with exactly `fixed_rows` rows. A count that
 * does not fit in columns * fixed_rows slots is an InvalidConfig error.
 */
[[nodiscard]] PackResult<GridLayout> layout(usize count, u32 columns, u32 icon_size,
                                            std::optional<u32> fixed_rows);

[[nodiscard]] PackResult<GridLayout> layout(usize count, const GridConfig& config);

} // namespace tessera::atlas
