/*
Module Name:
- transparent_string_hash.hpp

Abstract:
- Transparent hash and equality for string-like keys.
- Enables heterogeneous lookup in standard containers without temporary allocations.
- The case-insensitive pair backs HTTP header maps: field names compare
  ASCII-case-insensitively while values keep their exact bytes.
- Uses GSL Expects to guard against null char* which would be UB.
*/
#pragma once

// C++ Standard Library
#include <concepts>
#include <cstddef>
#include <functional>
#include <string_view>
#include <type_traits>

// GSL
#include <gsl/gsl>

namespace courier::detail {

// Gates the null check only for char* inputs.
template <class T>
inline constexpr bool is_char_ptr_v
    = std::is_pointer_v<std::remove_cvref_t<T>>
      && std::same_as<std::remove_cv_t<std::remove_pointer_t<std::remove_cvref_t<T>>>, char>;

template <class S>
constexpr std::string_view as_view(const S& s) noexcept
{
    if constexpr (is_char_ptr_v<S>) {
        Expects(s != nullptr); // contract: char* must not be null
    }
    return std::string_view{s};
}

constexpr char ascii_lower(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // namespace courier::detail

namespace courier {

struct TransparentStringHash {
    using is_transparent = void; // opts in to heterogeneous lookup

    template <std::convertible_to<std::string_view> S>
    std::size_t operator()(const S& s) const noexcept
    {
        return std::hash<std::string_view>{}(detail::as_view(s));
    }
};

struct TransparentStringEq {
    using is_transparent = void;

    template <std::convertible_to<std::string_view> A, std::convertible_to<std::string_view> B>
    bool operator()(const A& a, const B& b) const noexcept
    {
        return detail::as_view(a) == detail::as_view(b);
    }
};

// FNV-1a over the lower-cased bytes so "Content-Type" and "content-type" collide.
struct CaseInsensitiveStringHash {
    using is_transparent = void;

    template <std::convertible_to<std::string_view> S>
    std::size_t operator()(const S& s) const noexcept
    {
        std::size_t h = 14695981039346656037ULL;
        for (char c : detail::as_view(s)) {
            h ^= static_cast<unsigned char>(detail::ascii_lower(c));
            h *= 1099511628211ULL;
        }
        return h;
    }
};

struct CaseInsensitiveStringEq {
    using is_transparent = void;

    template <std::convertible_to<std::string_view> A, std::convertible_to<std::string_view> B>
    bool operator()(const A& a, const B& b) const noexcept
    {
        const auto lhs = detail::as_view(a);
        const auto rhs = detail::as_view(b);
        if (lhs.size() != rhs.size())
            return false;
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            if (detail::ascii_lower(lhs[i]) != detail::ascii_lower(rhs[i]))
                return false;
        }
        return true;
    }
};

} // namespace courier
