#pragma once

#include "grid.hpp"
#include "icon_source.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::atlas {

// ============================================================================
// Index file format
//
//   # tessera icon index v1
//   # category: <name>
//   # atlas: <file name>
//   # icon_size: <px>
//   # grid: <columns>x<rows>
//   # canvas: <width>x<height>
//   # count: <n>
//   # supersample: <factor>
//   # fields: index name column row pixel_x pixel_y
//   0<TAB>alarm<TAB>0<TAB>0<TAB>0<TAB>0
//   ...
//
// Lines starting with '#' are metadata; every other non-empty line is one
// tab-separated record, in atlas index order.
// ============================================================================

inline constexpr u32 INDEX_FORMAT_VERSION = 1;

struct IndexHeader {
    std::string category;
    std::string atlas_file;
    u32 supersample{1};
};

struct IndexEntry {
    usize index{0};
    std::string name;
    u32 column{0};
    u32 row{0};
    u32 pixel_x{0};
    u32 pixel_y{0};

    bool operator==(const IndexEntry&) const = default;
};

struct ParsedIndex {
    u32 version{0};
    std::string category;
    std::string atlas_file;
    u32 icon_size{0};
    u32 columns{0};
    u32 rows{0};
    SizeU canvas;
    usize count{0};
    u32 supersample{0};
    std::vector<IndexEntry> entries;
};

// One entry per source, in set order. `icons` and `grid` must describe the
// same atlas (grid.count() == icons.size()).
[[nodiscard]] std::vector<IndexEntry> make_entries(const IconSet& icons, const GridLayout& grid);

[[nodiscard]] std::string write_index(const IconSet& icons, const GridLayout& grid,
                                      const IndexHeader& header);

[[nodiscard]] Result<void, PackError> write_index_file(const std::filesystem::path& path,
                                                       const IconSet& icons,
                                                       const GridLayout& grid,
                                                       const IndexHeader& header);

// ReadError on malformed records or metadata
[[nodiscard]] PackResult<ParsedIndex> parse_index(std::string_view text);

[[nodiscard]] PackResult<ParsedIndex> read_index_file(const std::filesystem::path& path);

} // namespace tessera::atlas
