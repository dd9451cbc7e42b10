/**
 * SVG icon rasterizer on librsvg and cairo
 */

#include "tessera/atlas/rasterizer.hpp"
#include "tessera/image/resample.hpp"
#include <cairo.h>
#include <fmt/format.h>
#include <librsvg/rsvg.h>
#include <memory>

namespace tessera::atlas {

namespace {

struct HandleUnref {
    void operator()(RsvgHandle* handle) const { g_object_unref(handle); }
};
struct SurfaceDestroy {
    void operator()(cairo_surface_t* surface) const { cairo_surface_destroy(surface); }
};
struct ContextDestroy {
    void operator()(cairo_t* cr) const { cairo_destroy(cr); }
};
struct ErrorFree {
    void operator()(GError* error) const { g_error_free(error); }
};

using HandlePtr = std::unique_ptr<RsvgHandle, HandleUnref>;
using SurfacePtr = std::unique_ptr<cairo_surface_t, SurfaceDestroy>;
using ContextPtr = std::unique_ptr<cairo_t, ContextDestroy>;
using ErrorPtr = std::unique_ptr<GError, ErrorFree>;

std::string error_text(GError* raw, std::string_view fallback) {
    ErrorPtr error(raw);
    if (error && error->message) {
        return error->message;
    }
    return std::string(fallback);
}

u8 unpremultiply(u32 channel, u32 alpha) {
    return static_cast<u8>((channel * 255 + alpha / 2) / alpha);
}

// CAIRO_FORMAT_ARGB32 stores native-endian 32-bit words, premultiplied
image::Image copy_surface(cairo_surface_t* surface, u32 width, u32 height) {
    image::Image out(width, height, Color::transparent());
    const unsigned char* data = cairo_image_surface_get_data(surface);
    const int stride = cairo_image_surface_get_stride(surface);

    for (u32 y = 0; y < height; ++y) {
        const auto* words = reinterpret_cast<const u32*>(data + static_cast<isize>(y) * stride);
        for (u32 x = 0; x < width; ++x) {
            const u32 argb = words[x];
            const u32 a = argb >> 24;
            if (a == 0) {
                continue;
            }
            out.set_pixel(x, y, Color(unpremultiply((argb >> 16) & 0xff, a),
                                      unpremultiply((argb >> 8) & 0xff, a),
                                      unpremultiply(argb & 0xff, a),
                                      static_cast<u8>(a)));
        }
    }
    return out;
}

PackResult<image::Image> render(std::string_view id, const std::string& markup, u32 extent) {
    GError* raw_error = nullptr;
    HandlePtr handle(rsvg_handle_new_from_data(reinterpret_cast<const guint8*>(markup.data()),
                                               markup.size(), &raw_error));
    if (!handle) {
        return make_error(PackError::unrenderable(
            fmt::format("{}: {}", id, error_text(raw_error, "cannot parse SVG"))));
    }
    rsvg_handle_set_dpi(handle.get(), 96.0);

    SurfacePtr surface(cairo_image_surface_create(CAIRO_FORMAT_ARGB32,
                                                  static_cast<int>(extent),
                                                  static_cast<int>(extent)));
    if (cairo_surface_status(surface.get()) != CAIRO_STATUS_SUCCESS) {
        return make_error(PackError::unrenderable(fmt::format(
            "{}: {}", id, cairo_status_to_string(cairo_surface_status(surface.get())))));
    }
    ContextPtr cr(cairo_create(surface.get()));

    // The document is fitted into the square viewport, aspect ratio kept
    const RsvgRectangle viewport{0.0, 0.0, static_cast<double>(extent), static_cast<double>(extent)};
    if (!rsvg_handle_render_document(handle.get(), cr.get(), &viewport, &raw_error)) {
        return make_error(PackError::unrenderable(
            fmt::format("{}: {}", id, error_text(raw_error, "cannot render SVG"))));
    }

    const cairo_status_t status = cairo_status(cr.get());
    if (status != CAIRO_STATUS_SUCCESS) {
        return make_error(PackError::unrenderable(
            fmt::format("{}: {}", id, cairo_status_to_string(status))));
    }
    cairo_surface_flush(surface.get());

    return copy_surface(surface.get(), extent, extent);
}

} // anonymous namespace

PackResult<image::Image> SvgRasterizer::rasterize(const IconSource& source,
                                                  u32 size,
                                                  u32 supersample) const {
    if (size == 0 || supersample == 0) {
        return make_error(PackError::invalid_config("icon size and supersample must be at least 1"));
    }
    if (!source.content) {
        return make_error(PackError::unrenderable(fmt::format("{}: no content", source.id)));
    }

    auto markup = source.content->read();
    if (markup.is_err()) {
        // Unreadable input is a per-icon failure
        return make_error(PackError::unrenderable(
            fmt::format("{}: {}", source.id, markup.error().to_string())));
    }
    if (markup.value().empty()) {
        return make_error(PackError::unrenderable(fmt::format("{}: empty document", source.id)));
    }

    const u32 render_size = size * supersample;
    auto rendered = render(source.id, markup.value(), render_size);
    if (rendered.is_err()) {
        return make_error(std::move(rendered).error());
    }

    if (supersample == 1) {
        return std::move(rendered).value();
    }
    return image::resample_lanczos(rendered.value(), size, size);
}

} // namespace tessera::atlas
