#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace tessera {

using u8 = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i64 = std::int64_t;
using f64 = double;
using usize = std::size_t;
using isize = std::ptrdiff_t;

// ============================================================================
// Result - value or error, no exceptions across module boundaries
//
//   Result<u32, std::string> r = parse_count(text);
//   if (r.is_err()) return make_error(std::move(r).error());
// ============================================================================

template<typename E>
struct Error {
    E value;

    explicit Error(E e) : value(std::move(e)) {}
};

template<typename E>
Error<std::decay_t<E>> make_error(E&& e) {
    return Error<std::decay_t<E>>(std::forward<E>(e));
}

template<typename T, typename E>
class Result {
public:
    template<typename U = T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result> &&
                                         std::is_constructible_v<T, U&&>>>
    Result(U&& value) : m_data(std::in_place_index<0>, std::forward<U>(value)) {}

    Result(Error<E> error) : m_data(std::in_place_index<1>, std::move(error.value)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_data.index() == 1; }
    [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

    // Precondition: is_ok()
    [[nodiscard]] T& value() & { return std::get<0>(m_data); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_data); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_data)); }

    // Precondition: is_err()
    [[nodiscard]] E& error() & { return std::get<1>(m_data); }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_data); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(m_data)); }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(m_data) : std::move(fallback);
    }

private:
    std::variant<T, E> m_data;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(Error<E> error) : m_error(std::move(error.value)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }
    [[nodiscard]] E&& error() && { return std::move(*m_error); }

private:
    std::optional<E> m_error;
};

// ============================================================================
// Color - 8-bit RGBA, straight (not premultiplied) alpha
// ============================================================================

struct Color {
    u8 r{0};
    u8 g{0};
    u8 b{0};
    u8 a{255};

    constexpr Color() = default;
    constexpr Color(u8 r_, u8 g_, u8 b_, u8 a_ = 255) : r(r_), g(g_), b(b_), a(a_) {}

    // 0xRRGGBB, opaque
    static constexpr Color from_rgb(u32 rgb) {
        return {static_cast<u8>(rgb >> 16), static_cast<u8>(rgb >> 8), static_cast<u8>(rgb)};
    }

    [[nodiscard]] constexpr Color with_alpha(u8 alpha) const { return {r, g, b, alpha}; }

    constexpr bool operator==(const Color&) const = default;

    static constexpr Color black() { return {0, 0, 0}; }
    static constexpr Color white() { return {255, 255, 255}; }
    static constexpr Color transparent() { return {0, 0, 0, 0}; }
};

// ============================================================================
// Size
// ============================================================================

template<typename T>
struct Size {
    T width{};
    T height{};

    constexpr Size() = default;
    constexpr Size(T w, T h) : width(w), height(h) {}

    constexpr bool operator==(const Size&) const = default;

    [[nodiscard]] constexpr bool is_empty() const { return width <= T{} || height <= T{}; }
};

using SizeU = Size<u32>;

} // namespace tessera
