#pragma once

#include "assembler.hpp"
#include "grid.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace tessera::atlas {

// ============================================================================
// PackerConfig - everything one batch run needs to know
// ============================================================================

struct PackerConfig {
    u32 columns{20};
    std::vector<u32> icon_sizes{16, 24, 32, 64};
    u32 supersample{4};
    std::filesystem::path output_root{"atlases"};

    // When set, every atlas has exactly this many rows
    std::optional<u32> fixed_rows;

    // 0 = hardware concurrency
    u32 worker_threads{0};

    // Number of (category, size) jobs run at the same time
    u32 parallel_jobs{1};

    Color fallback{Color::white()};

    // InvalidConfig for any non-positive parameter or an empty size list
    [[nodiscard]] Result<void, PackError> validate() const;

    // Icons per atlas when rows are fixed
    [[nodiscard]] std::optional<usize> capacity() const;

    [[nodiscard]] GridConfig grid_for(u32 icon_size) const;
    [[nodiscard]] AssemblerOptions assembler_options() const;
};

} // namespace tessera::atlas
