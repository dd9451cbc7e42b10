/**
 * Icon index writer and reader
 */

#include "tessera/atlas/index.hpp"
#include <charconv>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace tessera::atlas {

namespace {

constexpr std::string_view MAGIC = "tessera icon index v";

template<typename T>
bool parse_unsigned(std::string_view text, T& out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

// "<a>x<b>"
bool parse_pair(std::string_view text, u32& a, u32& b) {
    usize x = text.find('x');
    if (x == std::string_view::npos) return false;
    return parse_unsigned(text.substr(0, x), a) && parse_unsigned(text.substr(x + 1), b);
}

std::string_view trim_spaces(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

PackError line_error(usize line, std::string_view what) {
    return PackError::read_error(fmt::format("index line {}: {}", line, what));
}

} // anonymous namespace

// ============================================================================
// Writing
// ============================================================================

std::vector<IndexEntry> make_entries(const IconSet& icons, const GridLayout& grid) {
    std::vector<IndexEntry> entries;
    entries.reserve(grid.placements.size());

    for (const Placement& p : grid.placements) {
        if (p.index >= icons.size()) {
            break;
        }
        entries.push_back({p.index, icons[p.index].id, p.column, p.row, p.pixel_x, p.pixel_y});
    }
    return entries;
}

std::string write_index(const IconSet& icons, const GridLayout& grid, const IndexHeader& header) {
    fmt::memory_buffer out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "# {}{}\n", MAGIC, INDEX_FORMAT_VERSION);
    fmt::format_to(it, "# category: {}\n", header.category);
    fmt::format_to(it, "# atlas: {}\n", header.atlas_file);
    fmt::format_to(it, "# icon_size: {}\n", grid.icon_size);
    fmt::format_to(it, "# grid: {}x{}\n", grid.columns, grid.rows);
    fmt::format_to(it, "# canvas: {}x{}\n", grid.canvas.width, grid.canvas.height);
    fmt::format_to(it, "# count: {}\n", icons.size());
    fmt::format_to(it, "# supersample: {}\n", header.supersample);
    fmt::format_to(it, "# fields: index name column row pixel_x pixel_y\n");

    for (const IndexEntry& e : make_entries(icons, grid)) {
        fmt::format_to(it, "{}\t{}\t{}\t{}\t{}\t{}\n",
                       e.index, e.name, e.column, e.row, e.pixel_x, e.pixel_y);
    }

    return fmt::to_string(out);
}

Result<void, PackError> write_index_file(const std::filesystem::path& path,
                                         const IconSet& icons,
                                         const GridLayout& grid,
                                         const IndexHeader& header) {
    std::string text = write_index(icons, grid, header);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return make_error(PackError::write_error("cannot create " + path.string()));
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file.close();
    if (!file) {
        return make_error(PackError::write_error("error writing " + path.string()));
    }
    return {};
}

// ============================================================================
// Reading
// ============================================================================

PackResult<ParsedIndex> parse_index(std::string_view text) {
    ParsedIndex index;
    bool has_count = false;
    usize line_number = 0;

    while (!text.empty()) {
        usize newline = text.find('\n');
        std::string_view line = text.substr(0, newline);
        text = (newline == std::string_view::npos) ? std::string_view() : text.substr(newline + 1);
        ++line_number;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (trim_spaces(line).empty()) {
            continue;
        }

        if (line.front() == '#') {
            std::string_view meta = trim_spaces(line.substr(1));

            if (meta.starts_with(MAGIC)) {
                if (!parse_unsigned(meta.substr(MAGIC.size()), index.version)) {
                    return make_error(line_error(line_number, "bad format version"));
                }
                continue;
            }

            usize colon = meta.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            std::string_view key = trim_spaces(meta.substr(0, colon));
            std::string_view value = trim_spaces(meta.substr(colon + 1));

            bool ok = true;
            if (key == "category") {
                index.category = std::string(value);
            } else if (key == "atlas") {
                index.atlas_file = std::string(value);
            } else if (key == "icon_size") {
                ok = parse_unsigned(value, index.icon_size);
            } else if (key == "grid") {
                ok = parse_pair(value, index.columns, index.rows);
            } else if (key == "canvas") {
                ok = parse_pair(value, index.canvas.width, index.canvas.height);
            } else if (key == "count") {
                ok = parse_unsigned(value, index.count);
                has_count = true;
            } else if (key == "supersample") {
                ok = parse_unsigned(value, index.supersample);
            }
            if (!ok) {
                return make_error(line_error(line_number, fmt::format("bad value for {}", key)));
            }
            continue;
        }

        // Record: index name column row pixel_x pixel_y
        std::string_view fields[6];
        usize field_count = 0;
        std::string_view rest = line;
        while (field_count < 6) {
            usize tab = rest.find('\t');
            fields[field_count++] = rest.substr(0, tab);
            if (tab == std::string_view::npos) {
                rest = {};
                break;
            }
            rest = rest.substr(tab + 1);
        }
        if (field_count != 6 || !rest.empty()) {
            return make_error(line_error(line_number, "expected 6 tab-separated fields"));
        }

        IndexEntry entry;
        entry.name = std::string(fields[1]);
        if (!parse_unsigned(fields[0], entry.index) ||
            !parse_unsigned(fields[2], entry.column) ||
            !parse_unsigned(fields[3], entry.row) ||
            !parse_unsigned(fields[4], entry.pixel_x) ||
            !parse_unsigned(fields[5], entry.pixel_y) ||
            entry.name.empty()) {
            return make_error(line_error(line_number, "malformed record"));
        }
        index.entries.push_back(std::move(entry));
    }

    if (has_count && index.count != index.entries.size()) {
        return make_error(PackError::read_error(fmt::format(
            "index declares {} icons but lists {}", index.count, index.entries.size())));
    }
    if (!has_count) {
        index.count = index.entries.size();
    }
    return index;
}

PackResult<ParsedIndex> read_index_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error(PackError::read_error("cannot open " + path.string()));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_index(buffer.str());
}

} // namespace tessera::atlas
