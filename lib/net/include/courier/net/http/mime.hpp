/*
Module Name:
- mime.hpp

Abstract:
- Well-known content types and a tolerant Content-Type parser.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

// Project
#include <courier/net/http/error.hpp>

namespace courier::net::mime {

inline constexpr std::string_view application_json = "application/json";
inline constexpr std::string_view form_urlencoded = "application/x-www-form-urlencoded";
inline constexpr std::string_view multipart_form_data = "multipart/form-data";
inline constexpr std::string_view text_plain = "text/plain";
inline constexpr std::string_view octet_stream = "application/octet-stream";

struct media_type {
    std::string type;    // e.g. "application"
    std::string subtype; // e.g. "json"
    std::string charset; // lowercased if present; empty if absent

    [[nodiscard]] std::string to_string() const
    {
        std::string out = type;
        out.push_back('/');
        out += subtype;
        if (!charset.empty()) {
            out += "; charset=";
            out += charset;
        }
        return out;
    }

    // application/json, application/*+json
    [[nodiscard]] bool is_json_like() const noexcept
    {
        if (type != "application")
            return false;
        if (subtype == "json")
            return true;
        return subtype.size() > 5 && subtype.compare(subtype.size() - 5, 5, "+json") == 0;
    }
};

// Parse a Content-Type header (case-insensitive, tolerant of spaces and quoted charset).
[[nodiscard]] std::optional<media_type> parse(std::string_view content_type,
                                              std::error_code& ec);

[[nodiscard]] inline bool is_json(std::string_view content_type)
{
    std::error_code ec;
    if (auto mt = parse(content_type, ec))
        return mt->is_json_like();
    return false;
}

} // namespace courier::net::mime
