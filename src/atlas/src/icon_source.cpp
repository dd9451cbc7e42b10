/**
 * Icon sources and icon sets
 */

#include "tessera/atlas/icon_source.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace tessera::atlas {

// ============================================================================
// FileContent
// ============================================================================

PackResult<std::string> FileContent::read() const {
    std::ifstream file(m_path, std::ios::binary);
    if (!file) {
        return make_error(PackError::read_error("cannot open " + m_path.string()));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return make_error(PackError::read_error("error reading " + m_path.string()));
    }
    return buffer.str();
}

// ============================================================================
// IconSource
// ============================================================================

IconSource IconSource::from_file(std::string id, std::filesystem::path path) {
    return {std::move(id), std::make_shared<FileContent>(std::move(path))};
}

IconSource IconSource::from_memory(std::string id, std::string markup) {
    return {std::move(id), std::make_shared<MemoryContent>(std::move(markup))};
}

// ============================================================================
// IconSet
// ============================================================================

PackResult<IconSet> IconSet::create(std::vector<IconSource> sources) {
    // Identifiers become fields of the tab-separated index
    for (const IconSource& source : sources) {
        if (source.id.empty()) {
            return make_error(PackError::invalid_config("empty icon identifier"));
        }
        if (source.id.find_first_of("\t\r\n") != std::string::npos) {
            return make_error(PackError::invalid_config(
                "icon identifier \"" + source.id + "\" contains a tab or line break"));
        }
    }

    std::sort(sources.begin(), sources.end(),
              [](const IconSource& a, const IconSource& b) { return a.id < b.id; });

    auto duplicate = std::adjacent_find(sources.begin(), sources.end(),
        [](const IconSource& a, const IconSource& b) { return a.id == b.id; });
    if (duplicate != sources.end()) {
        return make_error(PackError::invalid_config(
            "duplicate icon identifier \"" + duplicate->id + "\""));
    }

    return IconSet(std::move(sources));
}

IconSet IconSet::truncated(usize capacity) const {
    if (capacity >= m_sources.size()) {
        return *this;
    }
    return IconSet(std::vector<IconSource>(m_sources.begin(),
                                           m_sources.begin() + static_cast<isize>(capacity)));
}

} // namespace tessera::atlas
