/*
Module Name:
- encoding.hpp

Abstract:
- Content-Encoding negotiation and decoding for response bodies.
- Only gzip (and its x-gzip alias) is decoded; identity passes through.
*/
#pragma once

// C++ Standard Library
#include <cctype>
#include <string>
#include <string_view>
#include <system_error>

// Project
#include <courier/net/http/error.hpp>

namespace courier::net::encoding {

enum class enc : unsigned {
    none = 0,
    gzip = 1u << 0,
    unknown = 1u << 1,
};

constexpr enc operator|(enc a, enc b)
{
    return static_cast<enc>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}
constexpr enc operator&(enc a, enc b)
{
    return static_cast<enc>(static_cast<unsigned>(a) & static_cast<unsigned>(b));
}

// Implemented in gzip_decoder.cpp
[[nodiscard]] bool gzip_decode(std::string_view in, std::string& out, std::error_code& ec);

[[nodiscard]] inline bool
decode(std::string_view in, enc which, std::string& out, std::error_code& ec)
{
    if (which == enc::none) {
        out.assign(in.begin(), in.end());
        ec = {};
        return true;
    }
    if (which == enc::gzip) {
        return gzip_decode(in, out, ec);
    }
    ec = errc::unsupported_encoding;
    return false;
}

namespace detail {

    inline void trim(std::string_view& sv)
    {
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
    }

    inline bool iequals(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i]))
                != std::tolower(static_cast<unsigned char>(b[i])))
                return false;
        }
        return true;
    }

} // namespace detail

// Parse a Content-Encoding header like: "gzip" or "identity, gzip"
[[nodiscard]] inline enc parse_content_encoding(std::string_view value)
{
    enc result = enc::none;
    while (!value.empty()) {
        const auto comma = value.find(',');
        std::string_view token = (comma == std::string_view::npos) ? value : value.substr(0, comma);
        value = (comma == std::string_view::npos) ? std::string_view{} : value.substr(comma + 1);
        detail::trim(token);
        if (token.empty() || detail::iequals(token, "identity"))
            continue;
        if (detail::iequals(token, "gzip") || detail::iequals(token, "x-gzip"))
            result = result | enc::gzip;
        else
            result = result | enc::unknown;
    }
    return result;
}

} // namespace courier::net::encoding
