#pragma once

#include "image.hpp"

namespace tessera::image {

// Recolor every visible pixel to white while keeping its alpha.
// alpha > 0  -> (255, 255, 255, alpha)
// alpha == 0 -> left as is
[[nodiscard]] Image normalize_to_white(const Image& source);

// In-place variant
void normalize_to_white_in_place(Image& image);

} // namespace tessera::image
