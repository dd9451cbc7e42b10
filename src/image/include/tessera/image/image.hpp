#pragma once

#include "tessera/core/types.hpp"
#include <vector>

namespace tessera::image {

// ============================================================================
// Image - owned RGBA8 raster, straight (non-premultiplied) alpha
// ============================================================================

class Image {
public:
    static constexpr u32 CHANNELS = 4;

    Image() = default;
    Image(u32 width, u32 height);
    Image(u32 width, u32 height, Color fill_color);

    // Takes ownership of a tightly packed RGBA buffer (width * height * 4 bytes)
    Image(u32 width, u32 height, std::vector<u8> pixels);

    [[nodiscard]] u32 width() const noexcept { return m_width; }
    [[nodiscard]] u32 height() const noexcept { return m_height; }
    [[nodiscard]] SizeU size() const noexcept { return {m_width, m_height}; }
    [[nodiscard]] bool empty() const noexcept { return m_width == 0 || m_height == 0; }

    [[nodiscard]] usize stride() const noexcept { return static_cast<usize>(m_width) * CHANNELS; }
    [[nodiscard]] usize byte_size() const noexcept { return m_pixels.size(); }

    [[nodiscard]] u8* data() noexcept { return m_pixels.data(); }
    [[nodiscard]] const u8* data() const noexcept { return m_pixels.data(); }
    [[nodiscard]] const std::vector<u8>& pixels() const noexcept { return m_pixels; }

    [[nodiscard]] u8* row(u32 y) noexcept { return m_pixels.data() + y * stride(); }
    [[nodiscard]] const u8* row(u32 y) const noexcept { return m_pixels.data() + y * stride(); }

    // Pixel access; out-of-bounds reads return transparent, writes are ignored
    [[nodiscard]] Color pixel(u32 x, u32 y) const;
    void set_pixel(u32 x, u32 y, Color color);

    [[nodiscard]] bool contains(u32 x, u32 y) const noexcept {
        return x < m_width && y < m_height;
    }

    void fill(Color color);

    // Copy `source` with its top-left corner at (x, y). Pixels whose alpha is
    // zero leave the destination untouched; every other pixel is copied
    // verbatim. Parts falling outside this image are clipped.
    void blit(const Image& source, u32 x, u32 y);

    bool operator==(const Image& other) const {
        return m_width == other.m_width && m_height == other.m_height &&
               m_pixels == other.m_pixels;
    }

private:
    u32 m_width{0};
    u32 m_height{0};
    std::vector<u8> m_pixels;
};

} // namespace tessera::image
