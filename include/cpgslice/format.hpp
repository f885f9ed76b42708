#pragma once

#include "utils.hpp"

#include <array>
#include <format>
#include <string_view>
#include <type_traits>

namespace cpgslice {
    // Types that opt in with `static constexpr bool to_string_formattable` and
    // a to_string() member (edge signatures and the like).
    template <typename T, typename U = std::remove_cvref_t<T>>
    concept to_string_formattable = U::to_string_formattable && requires(U a) {
        { a.to_string() } -> std::convertible_to<std::string_view>;
    };

    // Enums with a `to_string(E)` overload found by ADL (diagnostic_kind,
    // output_mode, ...) format as their name.
    template <typename T, typename U = std::remove_cvref_t<T>>
    concept named_enum = std::is_enum_v<U> && requires(U e) {
        { to_string(e) } -> std::convertible_to<std::string_view>;
    };

    namespace detail {
        template <size_t N>
        struct format_literal {
            std::array<char, N> chars;

            consteval format_literal(const char (&s)[N]) { std::ranges::copy(s, s + N, chars.begin()); }
            constexpr std::string_view view() const { return {chars.data(), N - 1}; }
        };

        template <format_literal Format>
        struct bound_format {
            consteval bound_format() = default;

            template <typename... T>
            constexpr auto operator()(T&&... args) && {
                return std::format(Format.view(), std::forward<T>(args)...);
            }
        };
    }  // namespace detail

    namespace literals {
        // "node {} on line {}"_format(id, line)
        template <detail::format_literal Format>
        inline consteval auto operator""_format() {
            return detail::bound_format<Format>{};
        }
    }  // namespace literals
}  // namespace cpgslice

namespace std {
    template <cpgslice::to_string_formattable T>
    struct formatter<T, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const T& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(val.to_string(), ctx);
        }
    };

    template <cpgslice::named_enum T>
    struct formatter<T, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const T& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(to_string(val), ctx);
        }
    };
}  // namespace std
