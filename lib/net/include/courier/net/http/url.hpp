/*
Module Name:
- url.hpp

Abstract:
- Minimal URL parse and resolve helpers for the transport.
- Resolve supports absolute, scheme-relative, absolute-path, and relative refs.
- Dot-segment removal is a lightweight normalisation for common cases.
- Query is stored with a leading '?' so target() can concatenate cheaply.
- Percent-encoding follows the query-allowed character set: unreserved,
  sub-delims, ':', '@', '/', '?'. '%' is always escaped.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <string_view>
#include <utility>

// Project
#include <courier/utils/attributes.hpp>

namespace courier::net {

struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query; // includes leading '?' when present

    [[nodiscard]] bool is_absolute() const noexcept
    {
        return !scheme.empty();
    }

    [[nodiscard]] bool is_tls() const noexcept
    {
        return scheme == "https";
    }

    [[nodiscard]] std::string authority() const
    {
        std::string out = host;
        if (!port.empty()) {
            out.push_back(':');
            out += port;
        }
        return out;
    }

    [[nodiscard]] std::string target() const
    {
        std::string out = path.empty() ? std::string{"/"} : path;
        out += query; // query already has leading '?'
        return out;
    }

    [[nodiscard]] std::string origin() const
    {
        std::string out = scheme;
        out += "://";
        out += authority();
        return out;
    }
};

[[nodiscard]] inline std::string_view default_port_for_scheme(std::string_view scheme) noexcept
{
    if (scheme == "https")
        return "443";
    if (scheme == "http")
        return "80";
    return {};
}

// Host header value, with :port only when it differs from the scheme default.
[[nodiscard]] inline std::string host_header_value(const Url& u)
{
    if (!u.port.empty() && u.port != default_port_for_scheme(u.scheme))
        return u.authority();
    return u.host;
}

inline Url parse_url(std::string_view s)
{
    Url u;

    // scheme "://"
    auto pos = s.find("://");
    if (pos != std::string_view::npos) {
        u.scheme.assign(s.substr(0, pos));
        for (auto& c : u.scheme) {
            if (c >= 'A' && c <= 'Z')
                c = static_cast<char>(c - 'A' + 'a');
        }
        s.remove_prefix(pos + 3);
    }

    // authority
    if (!u.scheme.empty()) {
        auto end = s.find_first_of("/?#");
        std::string_view auth = (end == std::string_view::npos) ? s : s.substr(0, end);
        s = (end == std::string_view::npos) ? std::string_view{} : s.substr(end);

        // split host[:port] using last ':'
        auto colon = auth.rfind(':');
        if (colon != std::string_view::npos) {
            u.host.assign(auth.substr(0, colon));
            u.port.assign(auth.substr(colon + 1));
        } else {
            u.host.assign(auth);
        }
    }

    // fragments never reach the wire
    if (auto hash = s.find('#'); hash != std::string_view::npos)
        s = s.substr(0, hash);

    // path and optional query (query kept with leading '?')
    auto q = s.find('?');
    if (q == std::string_view::npos) {
        u.path.assign(s.empty() ? std::string_view{"/"} : s);
    } else {
        u.path.assign(s.substr(0, q));
        u.query.assign(s.substr(q));
    }

    if (u.path.empty() || u.path.front() != '/') {
        u.path.insert(u.path.begin(), '/');
    }
    return u;
}

inline Url resolve_url(const Url& base, std::string_view location)
{
    // absolute
    if (location.find("://") != std::string_view::npos) {
        return parse_url(location);
    }

    // scheme-relative: "//host/..."
    if (location.rfind("//", 0) == 0) {
        return parse_url(base.scheme + ":" + std::string(location));
    }

    Url out = base;

    // absolute-path
    if (!location.empty() && location.front() == '/') {
        auto q = location.find('?');
        out.path.assign(location.substr(0, q));
        out.query = (q == std::string_view::npos) ? std::string{} : std::string(location.substr(q));
        return out;
    }

    // relative-path: trim to last '/', then append
    auto last_slash = out.path.rfind('/');
    if (last_slash == std::string::npos) {
        out.path = "/";
    } else {
        out.path.resize(last_slash + 1);
    }
    out.path.append(location);

    // normalise: remove "/./"
    for (;;) {
        auto i = out.path.find("/./");
        if (i == std::string::npos)
            break;
        out.path.erase(i, 2);
    }
    // normalise: collapse "/../"
    for (;;) {
        auto i = out.path.find("/../");
        if (i == std::string::npos)
            break;
        if (i == 0) {
            out.path.erase(0, 3);
            continue;
        }
        auto j = out.path.rfind('/', i - 1);
        if (j == std::string::npos) {
            out.path.erase(0, i + 3);
            break;
        }
        out.path.erase(j, i + 3 - j);
    }

    if (out.path.empty() || out.path.front() != '/') {
        out.path.insert(out.path.begin(), '/');
    }
    out.query.clear();
    if (auto q = out.path.find('?'); q != std::string::npos) {
        out.query = out.path.substr(q);
        out.path.resize(q);
    }
    return out;
}

namespace detail {

    constexpr bool is_unreserved(unsigned char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
            || c == '-' || c == '_' || c == '.' || c == '~';
    }

    // RFC 3986 query characters: unreserved / sub-delims / ":" / "@" / "/" / "?"
    constexpr bool is_query_allowed(unsigned char c) noexcept
    {
        switch (c) {
        case '!':
        case '$':
        case '&':
        case '\'':
        case '(':
        case ')':
        case '*':
        case '+':
        case ',':
        case ';':
        case '=':
        case ':':
        case '@':
        case '/':
        case '?':
            return true;
        default:
            return is_unreserved(c);
        }
    }

    inline void append_escaped(std::string& out, unsigned char c)
    {
        static constexpr char hex[] = "0123456789ABCDEF";
        out.push_back('%');
        out.push_back(hex[(c >> 4) & 0xF]);
        out.push_back(hex[c & 0xF]);
    }

} // namespace detail

// Percent-encode everything outside the query-allowed set. '%' is always
// escaped: the input is raw text, never a partially encoded URL.
[[nodiscard]] inline std::string percent_encode_query(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + s.size() / 4);
    for (unsigned char c : s) {
        if (COURIER_LIKELY(detail::is_query_allowed(c)))
            out.push_back(static_cast<char>(c));
        else
            detail::append_escaped(out, c);
    }
    return out;
}

// Percent-encode a single query item name or value ('&', '=', '+', '#' escaped too).
[[nodiscard]] inline std::string percent_encode_component(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + s.size() / 4);
    for (unsigned char c : s) {
        if (detail::is_query_allowed(c) && c != '&' && c != '=' && c != '+')
            out.push_back(static_cast<char>(c));
        else
            detail::append_escaped(out, c);
    }
    return out;
}

// Append "key=value" to a URL string, using '&' if a query already exists.
inline void append_query(std::string& url, std::string_view key, std::string_view value)
{
    url.push_back(url.find('?') == std::string::npos ? '?' : '&');
    url.append(key);
    url.push_back('=');
    url.append(value);
}

} // namespace courier::net
