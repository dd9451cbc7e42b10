#pragma once

#include "tessera/atlas/packer.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace tessera::catalog {

struct Discovery {
    // Sorted by category name
    std::vector<atlas::Category> categories;

    // Categories that could not be turned into an icon set (duplicate
    // identifiers, clashing slugs, unreadable directories)
    std::vector<PackError> rejected;
};

/**
 * Enumerate the categories under `root`.
 *
 * Every immediate sub-directory is a category; .svg files directly under
 * `root` form one more category named after the root itself. Matching is
 * case-insensitive on the extension and does not recurse. The stable icon
 * identifier is the file name without its extension.
 *
 * When `capacity` is set, larger sets keep their first `capacity` icons in
 * identifier order and a warning is logged.
 *
 * A root that is missing or not a directory is a ReadError.
 */
[[nodiscard]] PackResult<Discovery> discover(const std::filesystem::path& root,
                                             std::optional<usize> capacity = std::nullopt);

// True for "*.svg" in any letter case
[[nodiscard]] bool is_svg_file(const std::filesystem::path& path);

} // namespace tessera::catalog
