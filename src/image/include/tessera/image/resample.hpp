#pragma once

#include "image.hpp"

namespace tessera::image {

// ============================================================================
// Lanczos resampling
// ============================================================================

// Lanczos window radius in source pixels (before scaling)
inline constexpr int LANCZOS_RADIUS = 3;

// Lanczos-3 kernel value at distance x
[[nodiscard]] f64 lanczos_weight(f64 x);

/**
 * Resample `source` to exactly `width` x `height` with a separable Lanczos-3
 * filter. Filtering happens on premultiplied alpha so transparent pixels do
 * not bleed their color into visible ones; results are clamped to [0, 255].
 * A region whose whole filter support is transparent stays fully transparent.
 */
[[nodiscard]] Image resample_lanczos(const Image& source, u32 width, u32 height);

} // namespace tessera::image
