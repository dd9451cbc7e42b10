/**
 * Grid layout engine
 */

#include "tessera/atlas/grid.hpp"
#include <fmt/format.h>
#include <limits>

namespace tessera::atlas {

PackResult<GridLayout> layout(usize count, u32 columns, u32 icon_size) {
    return layout(count, columns, icon_size, std::nullopt);
}

PackResult<GridLayout> layout(usize count, u32 columns, u32 icon_size,
                              std::optional<u32> fixed_rows) {
    if (columns == 0) {
        return make_error(PackError::invalid_config("columns must be at least 1"));
    }
    if (icon_size == 0) {
        return make_error(PackError::invalid_config("icon size must be at least 1"));
    }
    if (fixed_rows && *fixed_rows == 0) {
        return make_error(PackError::invalid_config("fixed row count must be at least 1"));
    }

    const u64 needed_rows = (static_cast<u64>(count) + columns - 1) / columns;
    u64 rows = needed_rows;
    if (fixed_rows) {
        const u64 capacity = static_cast<u64>(columns) * *fixed_rows;
        if (count > capacity) {
            return make_error(PackError::invalid_config(fmt::format(
                "{} icons do not fit a {}x{} grid", count, columns, *fixed_rows)));
        }
        rows = *fixed_rows;
    }

    const u64 width = static_cast<u64>(columns) * icon_size;
    const u64 height = rows * icon_size;
    if (width > std::numeric_limits<u32>::max() || height > std::numeric_limits<u32>::max()) {
        return make_error(PackError::invalid_config(fmt::format(
            "canvas {}x{} is too large", width, height)));
    }

    GridLayout result;
    result.columns = columns;
    result.icon_size = icon_size;

    // Nothing to place, nothing to draw
    if (count == 0) {
        return result;
    }

    result.rows = static_cast<u32>(rows);

    result.canvas = {static_cast<u32>(width), static_cast<u32>(height)};
    result.placements.reserve(count);

    for (usize i = 0; i < count; ++i) {
        Placement p;
        p.index = i;
        p.column = static_cast<u32>(i % columns);
        p.row = static_cast<u32>(i / columns);
        p.pixel_x = p.column * icon_size;
        p.pixel_y = p.row * icon_size;
        result.placements.push_back(p);
    }

    return result;
}

PackResult<GridLayout> layout(usize count, const GridConfig& config) {
    if (config.supersample == 0) {
        return make_error(PackError::invalid_config("supersample factor must be at least 1"));
    }
    return layout(count, config.columns, config.icon_size, config.fixed_rows);
}

} // namespace tessera::atlas
