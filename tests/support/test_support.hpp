#pragma once

#include "tessera/atlas/rasterizer.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

namespace tessera::fixtures {

// ============================================================================
// TempDir - unique scratch directory removed at scope exit
// ============================================================================

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "tessera_";
        if (info) {
            name += info->test_suite_name();
            name += "_";
            name += info->name();
            name += "_";
        }
        name += std::to_string(rd());
        m_path = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    std::filesystem::path operator/(const std::string& child) const { return m_path / child; }

private:
    std::filesystem::path m_path;
};

inline void write_text(const std::filesystem::path& path, std::string_view text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << text;
}

inline std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// ============================================================================
// MarkerRasterizer - tiles filled with an alpha read from the content
//
// Content "alpha:N" renders a size x size tile of (12, 34, 56, N); content
// starting with "fail" is unrenderable. Anything else renders transparent.
// ============================================================================

class MarkerRasterizer : public atlas::IconRasterizer {
public:
    PackResult<image::Image> rasterize(const atlas::IconSource& source, u32 size,
                                       u32 supersample) const override {
        ++m_calls;
        m_last_supersample = supersample;

        auto markup = source.content->read();
        if (markup.is_err()) {
            return make_error(PackError::unrenderable(markup.error().message));
        }
        std::string_view text = markup.value();
        if (text.starts_with("fail")) {
            return make_error(PackError::unrenderable(source.id + ": broken on purpose"));
        }

        image::Image tile(size, size);
        if (text.starts_with("alpha:")) {
            u32 alpha = 0;
            std::string_view digits = text.substr(6);
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), alpha);
            if (ec != std::errc()) {
                alpha = 0;
            }
            tile.fill(Color(12, 34, 56, static_cast<u8>(alpha)));
        }
        return tile;
    }

    [[nodiscard]] usize calls() const { return m_calls.load(); }
    [[nodiscard]] u32 last_supersample() const { return m_last_supersample.load(); }

private:
    mutable std::atomic<usize> m_calls{0};
    mutable std::atomic<u32> m_last_supersample{0};
};

inline std::string alpha_marker(u32 alpha) {
    return "alpha:" + std::to_string(alpha);
}

} // namespace tessera::fixtures
