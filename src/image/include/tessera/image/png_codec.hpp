#pragma once

#include "image.hpp"
#include "tessera/core/error.hpp"
#include <filesystem>
#include <span>
#include <vector>

namespace tessera::image {

// ============================================================================
// PNG encode / decode (libpng simplified API, 8-bit RGBA)
// ============================================================================

[[nodiscard]] PackResult<std::vector<u8>> encode_png(const Image& image);

[[nodiscard]] PackResult<Image> decode_png(std::span<const u8> bytes);

// Writes `image` to `path`, replacing any existing file
[[nodiscard]] Result<void, PackError> write_png(const std::filesystem::path& path,
                                                const Image& image);

[[nodiscard]] PackResult<Image> read_png(const std::filesystem::path& path);

} // namespace tessera::image
