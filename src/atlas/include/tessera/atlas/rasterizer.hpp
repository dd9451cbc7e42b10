#pragma once

#include "icon_source.hpp"
#include "tessera/image/image.hpp"

namespace tessera::atlas {

// ============================================================================
// IconRasterizer
// ============================================================================

class IconRasterizer {
public:
    virtual ~IconRasterizer() = default;

    /**
     * Render `source` to exactly `size` x `size` RGBA pixels, drawing at
     * `size * supersample` and filtering down. Parse or render failures
     * are reported as SourceUnrenderable.
     *
     * Called concurrently from worker threads; implementations must not
     * share mutable state between calls.
     */
    [[nodiscard]] virtual PackResult<image::Image> rasterize(const IconSource& source,
                                                             u32 size,
                                                             u32 supersample) const = 0;
};

// ============================================================================
// SvgRasterizer - librsvg into a cairo ARGB32 surface, Lanczos-3 downsampling
// ============================================================================

class SvgRasterizer : public IconRasterizer {
public:
    [[nodiscard]] PackResult<image::Image> rasterize(const IconSource& source,
                                                     u32 size,
                                                     u32 supersample) const override;
};

} // namespace tessera::atlas
