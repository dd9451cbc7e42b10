/**
 * PNG codec on top of libpng's png_image interface
 */

#include "tessera/image/png_codec.hpp"
#include <png.h>
#include <cstring>
#include <string>

namespace tessera::image {

namespace {

png_image make_rgba_descriptor(u32 width, u32 height) {
    png_image descriptor;
    std::memset(&descriptor, 0, sizeof(descriptor));
    descriptor.version = PNG_IMAGE_VERSION;
    descriptor.format = PNG_FORMAT_RGBA;
    descriptor.width = width;
    descriptor.height = height;
    return descriptor;
}

std::string libpng_message(const png_image& descriptor) {
    return std::string(descriptor.message);
}

// Shared tail of the two decode paths; begin_read has already succeeded
PackResult<Image> finish_read(png_image& descriptor, const std::string& what) {
    descriptor.format = PNG_FORMAT_RGBA;

    std::vector<u8> pixels(PNG_IMAGE_SIZE(descriptor));
    if (!png_image_finish_read(&descriptor, nullptr, pixels.data(), 0, nullptr)) {
        std::string message = what + ": " + libpng_message(descriptor);
        png_image_free(&descriptor);
        return make_error(PackError::read_error(std::move(message)));
    }

    return Image(descriptor.width, descriptor.height, std::move(pixels));
}

} // anonymous namespace

PackResult<std::vector<u8>> encode_png(const Image& image) {
    if (image.empty()) {
        return make_error(PackError::write_error("cannot encode an empty image"));
    }

    png_image descriptor = make_rgba_descriptor(image.width(), image.height());

    png_alloc_size_t size = 0;
    if (!png_image_write_get_memory_size(descriptor, size, 0, image.data(), 0, nullptr)) {
        return make_error(PackError::write_error("PNG size query failed: " +
                                                 libpng_message(descriptor)));
    }

    std::vector<u8> bytes(size);
    if (!png_image_write_to_memory(&descriptor, bytes.data(), &size, 0,
                                   image.data(), 0, nullptr)) {
        return make_error(PackError::write_error("PNG encode failed: " +
                                                 libpng_message(descriptor)));
    }
    bytes.resize(size);
    return bytes;
}

PackResult<Image> decode_png(std::span<const u8> bytes) {
    png_image descriptor;
    std::memset(&descriptor, 0, sizeof(descriptor));
    descriptor.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&descriptor, bytes.data(), bytes.size())) {
        return make_error(PackError::read_error("PNG decode failed: " +
                                                libpng_message(descriptor)));
    }
    return finish_read(descriptor, "PNG decode failed");
}

Result<void, PackError> write_png(const std::filesystem::path& path, const Image& image) {
    if (image.empty()) {
        return make_error(PackError::write_error("cannot write an empty image to " +
                                                 path.string()));
    }

    png_image descriptor = make_rgba_descriptor(image.width(), image.height());
    if (!png_image_write_to_file(&descriptor, path.c_str(), 0, image.data(), 0, nullptr)) {
        return make_error(PackError::write_error("error writing " + path.string() + ": " +
                                                 libpng_message(descriptor)));
    }
    return {};
}

PackResult<Image> read_png(const std::filesystem::path& path) {
    png_image descriptor;
    std::memset(&descriptor, 0, sizeof(descriptor));
    descriptor.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_file(&descriptor, path.c_str())) {
        return make_error(PackError::read_error("error reading " + path.string() + ": " +
                                                libpng_message(descriptor)));
    }
    return finish_read(descriptor, "error reading " + path.string());
}

} // namespace tessera::image
