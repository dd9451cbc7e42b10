#pragma once

#include "tessera/core/error.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace tessera::atlas {

// ============================================================================
// VectorContent - where an icon's markup comes from
// ============================================================================

class VectorContent {
public:
    virtual ~VectorContent() = default;

    // Full markup text; ReadError when unavailable
    [[nodiscard]] virtual PackResult<std::string> read() const = 0;

    // Human-readable origin for log messages
    [[nodiscard]] virtual std::string describe() const = 0;
};

class FileContent : public VectorContent {
public:
    explicit FileContent(std::filesystem::path path) : m_path(std::move(path)) {}

    [[nodiscard]] PackResult<std::string> read() const override;
    [[nodiscard]] std::string describe() const override { return m_path.string(); }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

private:
    std::filesystem::path m_path;
};

class MemoryContent : public VectorContent {
public:
    explicit MemoryContent(std::string markup) : m_markup(std::move(markup)) {}

    [[nodiscard]] PackResult<std::string> read() const override { return m_markup; }
    [[nodiscard]] std::string describe() const override { return "<memory>"; }

private:
    std::string m_markup;
};

// ============================================================================
// IconSource - stable name plus content handle
// ============================================================================

struct IconSource {
    std::string id;
    std::shared_ptr<const VectorContent> content;

    [[nodiscard]] static IconSource from_file(std::string id, std::filesystem::path path);
    [[nodiscard]] static IconSource from_memory(std::string id, std::string markup);
};

// ============================================================================
// IconSet - sources ordered by id, fixed at construction
// ============================================================================

class IconSet {
public:
    IconSet() = default;

    /**
     * Sort `sources` by id (byte-wise) and build the set.
     * Duplicate ids, empty ids and ids containing a tab, CR or LF are an
     * InvalidConfig error.
     */
    [[nodiscard]] static PackResult<IconSet> create(std::vector<IconSource> sources);

    [[nodiscard]] usize size() const noexcept { return m_sources.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_sources.empty(); }

    [[nodiscard]] const IconSource& operator[](usize index) const { return m_sources[index]; }
    [[nodiscard]] const std::vector<IconSource>& sources() const noexcept { return m_sources; }

    [[nodiscard]] auto begin() const { return m_sources.begin(); }
    [[nodiscard]] auto end() const { return m_sources.end(); }

    // First `capacity` sources, order preserved
    [[nodiscard]] IconSet truncated(usize capacity) const;

private:
    explicit IconSet(std::vector<IconSource> sources) : m_sources(std::move(sources)) {}

    std::vector<IconSource> m_sources;
};

} // namespace tessera::atlas
