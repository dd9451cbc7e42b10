/**
 * Lanczos-3 resampler (premultiplied alpha)
 */

#include "tessera/image/resample.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace tessera::image {

namespace {

// One destination sample: contiguous source taps starting at `first`
struct Contribution {
    u32 first{0};
    std::vector<f64> weights;
};

std::vector<Contribution> compute_contributions(u32 src_len, u32 dst_len) {
    std::vector<Contribution> result(dst_len);

    const f64 scale = static_cast<f64>(src_len) / static_cast<f64>(dst_len);
    // Widen the kernel when shrinking so every source pixel contributes
    const f64 filter_scale = std::max(1.0, scale);
    const f64 support = LANCZOS_RADIUS * filter_scale;

    for (u32 i = 0; i < dst_len; ++i) {
        const f64 center = (static_cast<f64>(i) + 0.5) * scale - 0.5;

        i64 left = static_cast<i64>(std::floor(center - support)) + 1;
        i64 right = static_cast<i64>(std::ceil(center + support)) - 1;
        left = std::max<i64>(left, 0);
        right = std::min<i64>(right, static_cast<i64>(src_len) - 1);

        Contribution& c = result[i];
        c.first = static_cast<u32>(left);

        f64 total = 0.0;
        for (i64 j = left; j <= right; ++j) {
            f64 w = lanczos_weight((static_cast<f64>(j) - center) / filter_scale);
            c.weights.push_back(w);
            total += w;
        }

        if (total != 0.0) {
            for (f64& w : c.weights) {
                w /= total;
            }
        }
    }

    return result;
}

u8 clamp_channel(f64 v) {
    return static_cast<u8>(std::clamp(std::lround(v), 0L, 255L));
}

} // anonymous namespace

f64 lanczos_weight(f64 x) {
    x = std::abs(x);
    if (x < 1e-9) {
        return 1.0;
    }
    if (x >= LANCZOS_RADIUS) {
        return 0.0;
    }
    const f64 pi_x = std::numbers::pi * x;
    return LANCZOS_RADIUS * std::sin(pi_x) * std::sin(pi_x / LANCZOS_RADIUS) /
           (pi_x * pi_x);
}

Image resample_lanczos(const Image& source, u32 width, u32 height) {
    if (width == 0 || height == 0) {
        return Image(width, height);
    }
    if (source.empty()) {
        return Image(width, height);
    }
    if (source.width() == width && source.height() == height) {
        return source;
    }

    const u32 sw = source.width();
    const u32 sh = source.height();

    // Premultiply into floating point planes
    std::vector<f64> premul(static_cast<usize>(sw) * sh * 4);
    for (u32 y = 0; y < sh; ++y) {
        const u8* src = source.row(y);
        for (u32 x = 0; x < sw; ++x) {
            const u8* p = src + static_cast<usize>(x) * 4;
            const f64 a = p[3] / 255.0;
            f64* d = &premul[(static_cast<usize>(y) * sw + x) * 4];
            d[0] = p[0] * a;
            d[1] = p[1] * a;
            d[2] = p[2] * a;
            d[3] = p[3];
        }
    }

    // Horizontal pass: sw x sh -> width x sh
    auto horizontal = compute_contributions(sw, width);
    std::vector<f64> tmp(static_cast<usize>(width) * sh * 4, 0.0);
    for (u32 y = 0; y < sh; ++y) {
        for (u32 x = 0; x < width; ++x) {
            const Contribution& c = horizontal[x];
            f64 acc[4] = {0.0, 0.0, 0.0, 0.0};
            for (usize k = 0; k < c.weights.size(); ++k) {
                const f64* s = &premul[(static_cast<usize>(y) * sw + c.first + k) * 4];
                const f64 w = c.weights[k];
                acc[0] += s[0] * w;
                acc[1] += s[1] * w;
                acc[2] += s[2] * w;
                acc[3] += s[3] * w;
            }
            f64* d = &tmp[(static_cast<usize>(y) * width + x) * 4];
            std::copy(acc, acc + 4, d);
        }
    }

    // Vertical pass: width x sh -> width x height, then unpremultiply
    auto vertical = compute_contributions(sh, height);
    Image result(width, height);
    for (u32 y = 0; y < height; ++y) {
        const Contribution& c = vertical[y];
        u8* dst = result.row(y);
        for (u32 x = 0; x < width; ++x) {
            f64 acc[4] = {0.0, 0.0, 0.0, 0.0};
            for (usize k = 0; k < c.weights.size(); ++k) {
                const f64* s = &tmp[((c.first + k) * static_cast<usize>(width) + x) * 4];
                const f64 w = c.weights[k];
                acc[0] += s[0] * w;
                acc[1] += s[1] * w;
                acc[2] += s[2] * w;
                acc[3] += s[3] * w;
            }

            u8* p = dst + static_cast<usize>(x) * 4;
            const u8 alpha = clamp_channel(acc[3]);
            if (alpha == 0) {
                p[0] = p[1] = p[2] = p[3] = 0;
                continue;
            }
            const f64 inv = 255.0 / std::min(acc[3], 255.0);
            p[0] = clamp_channel(acc[0] * inv);
            p[1] = clamp_channel(acc[1] * inv);
            p[2] = clamp_channel(acc[2] * inv);
            p[3] = alpha;
        }
    }

    return result;
}

} // namespace tessera::image
