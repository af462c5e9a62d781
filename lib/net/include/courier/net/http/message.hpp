/*
Module Name:
- message.hpp

Abstract:
- Transport-level request and response values exchanged between the core and
  a Transport implementation.
- WireRequest is fully resolved (absolute URL, merged headers, credentials) and
  is never mutated after authentication decoration.
- HeaderMap compares field names case-insensitively.
- credential_headers names the headers decoration added; a transport drops
  them (and the standard credential fields) before following a redirect to
  another origin.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Boost.Beast
#include <boost/beast/http/verb.hpp>

// Project
#include <courier/utils/transparent_string_hash.hpp>

namespace courier::net {

using HeaderMap = std::unordered_map<std::string,
                                     std::string,
                                     CaseInsensitiveStringHash,
                                     CaseInsensitiveStringEq>;

enum class HttpMethod {
    get,
    post,
    put,
    delete_,
    patch,
    head,
};

[[nodiscard]] constexpr std::string_view to_string(HttpMethod m) noexcept
{
    switch (m) {
    case HttpMethod::get:
        return "GET";
    case HttpMethod::post:
        return "POST";
    case HttpMethod::put:
        return "PUT";
    case HttpMethod::delete_:
        return "DELETE";
    case HttpMethod::patch:
        return "PATCH";
    case HttpMethod::head:
        return "HEAD";
    }
    return "GET";
}

[[nodiscard]] constexpr boost::beast::http::verb to_verb(HttpMethod m) noexcept
{
    namespace http = boost::beast::http;
    switch (m) {
    case HttpMethod::get:
        return http::verb::get;
    case HttpMethod::post:
        return http::verb::post;
    case HttpMethod::put:
        return http::verb::put;
    case HttpMethod::delete_:
        return http::verb::delete_;
    case HttpMethod::patch:
        return http::verb::patch;
    case HttpMethod::head:
        return http::verb::head;
    }
    return http::verb::get;
}

/// Cache hint carried through to the transport. The core never interprets it.
enum class CachePolicy {
    use_protocol_cache_policy,
    reload_ignoring_local_cache,
    return_cache_data_else_load,
    return_cache_data_dont_load,
};

inline constexpr auto k_default_timeout = std::chrono::milliseconds{30'000};

struct WireRequest {
    std::string url;
    HttpMethod method{HttpMethod::get};
    HeaderMap headers;
    std::chrono::milliseconds timeout{k_default_timeout};
    CachePolicy cache_policy{CachePolicy::use_protocol_cache_policy};
    std::optional<std::string> body;
    std::vector<std::string> credential_headers;

    bool operator==(const WireRequest&) const = default;
};

struct WireResponse {
    int status{0};
    HeaderMap headers;
    std::optional<std::string> body; // absent when the exchange carried no payload (HEAD)

    [[nodiscard]] bool is_success() const noexcept
    {
        return status >= 200 && status <= 299;
    }
};

} // namespace courier::net
