/**
 * Packer configuration
 */

#include "tessera/atlas/config.hpp"
#include <fmt/format.h>

namespace tessera::atlas {

Result<void, PackError> PackerConfig::validate() const {
    if (columns == 0) {
        return make_error(PackError::invalid_config("columns must be at least 1"));
    }
    if (icon_sizes.empty()) {
        return make_error(PackError::invalid_config("no icon sizes given"));
    }
    for (u32 size : icon_sizes) {
        if (size == 0) {
            return make_error(PackError::invalid_config("icon sizes must be at least 1"));
        }
    }
    if (supersample == 0) {
        return make_error(PackError::invalid_config("supersample must be at least 1"));
    }
    if (fixed_rows && *fixed_rows == 0) {
        return make_error(PackError::invalid_config("rows must be at least 1"));
    }
    if (parallel_jobs == 0) {
        return make_error(PackError::invalid_config("parallel jobs must be at least 1"));
    }
    if (output_root.empty()) {
        return make_error(PackError::invalid_config("output directory is empty"));
    }
    return {};
}

std::optional<usize> PackerConfig::capacity() const {
    if (!fixed_rows) {
        return std::nullopt;
    }
    return static_cast<usize>(columns) * *fixed_rows;
}

GridConfig PackerConfig::grid_for(u32 icon_size) const {
    return GridConfig{columns, icon_size, supersample, fixed_rows};
}

AssemblerOptions PackerConfig::assembler_options() const {
    return AssemblerOptions{worker_threads, fallback};
}

} // namespace tessera::atlas
