/**
 * Monochrome-white normalization
 */

#include "tessera/image/normalize.hpp"

namespace tessera::image {

Image normalize_to_white(const Image& source) {
    Image result = source;
    normalize_to_white_in_place(result);
    return result;
}

void normalize_to_white_in_place(Image& image) {
    u8* p = image.data();
    const usize size = image.byte_size();

    for (usize i = 0; i < size; i += Image::CHANNELS) {
        if (p[i + 3] == 0) {
            continue;
        }
        p[i + 0] = 255;
        p[i + 1] = 255;
        p[i + 2] = 255;
    }
}

} // namespace tessera::image
