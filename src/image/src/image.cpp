/**
 * Image - RGBA8 raster
 */

#include "tessera/image/image.hpp"
#include <algorithm>
#include <cstring>

namespace tessera::image {

Image::Image(u32 width, u32 height)
    : m_width(width)
    , m_height(height)
    , m_pixels(static_cast<usize>(width) * height * CHANNELS, 0)
{
}

Image::Image(u32 width, u32 height, Color fill_color)
    : Image(width, height)
{
    fill(fill_color);
}

Image::Image(u32 width, u32 height, std::vector<u8> pixels)
    : m_width(width)
    , m_height(height)
    , m_pixels(std::move(pixels))
{
    m_pixels.resize(static_cast<usize>(width) * height * CHANNELS, 0);
}

Color Image::pixel(u32 x, u32 y) const {
    if (!contains(x, y)) {
        return Color::transparent();
    }
    const u8* p = row(y) + static_cast<usize>(x) * CHANNELS;
    return {p[0], p[1], p[2], p[3]};
}

void Image::set_pixel(u32 x, u32 y, Color color) {
    if (!contains(x, y)) {
        return;
    }
    u8* p = row(y) + static_cast<usize>(x) * CHANNELS;
    p[0] = color.r;
    p[1] = color.g;
    p[2] = color.b;
    p[3] = color.a;
}

void Image::fill(Color color) {
    for (usize i = 0; i < m_pixels.size(); i += CHANNELS) {
        m_pixels[i + 0] = color.r;
        m_pixels[i + 1] = color.g;
        m_pixels[i + 2] = color.b;
        m_pixels[i + 3] = color.a;
    }
}

void Image::blit(const Image& source, u32 x, u32 y) {
    if (x >= m_width || y >= m_height) {
        return;
    }

    u32 copy_w = std::min(source.width(), m_width - x);
    u32 copy_h = std::min(source.height(), m_height - y);

    for (u32 sy = 0; sy < copy_h; ++sy) {
        const u8* src = source.row(sy);
        u8* dst = row(y + sy) + static_cast<usize>(x) * CHANNELS;

        for (u32 sx = 0; sx < copy_w; ++sx) {
            const u8* sp = src + static_cast<usize>(sx) * CHANNELS;
            if (sp[3] == 0) {
                continue;
            }
            std::memcpy(dst + static_cast<usize>(sx) * CHANNELS, sp, CHANNELS);
        }
    }
}

} // namespace tessera::image
