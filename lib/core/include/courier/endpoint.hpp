/*
Module Name:
- endpoint.hpp

Abstract:
- Immutable-by-convention description of one call against an Api.
- url() percent-encodes the path fragment with the query-allowed set and
  appends it to the Api base address; it never fails. Paths and query items
  are raw text: a '%' in them is sent as "%25".
- Query items are kept unencoded and escaped per component when url() runs.
- build_request() is pure: it merges Content-Type, attaches optional
  pagination and lets the Api decorate the result.
- The with_* mutators return *this so an endpoint can be adjusted in one expression.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Project
#include <courier/api.hpp>
#include <courier/net/http/message.hpp>

namespace courier
{

    using QueryItem = std::pair<std::string, std::string>;

    class Endpoint
    {
    public:
        Endpoint(Api api,
                 std::string path,
                 net::HttpMethod method = net::HttpMethod::get,
                 net::HeaderMap headers = {},
                 std::chrono::milliseconds timeout = net::k_default_timeout,
                 net::CachePolicy cache_policy = net::CachePolicy::use_protocol_cache_policy,
                 std::optional<std::string> body = std::nullopt);

        [[nodiscard]] const Api& api() const noexcept
        {
            return api_;
        }
        [[nodiscard]] const std::string& path() const noexcept
        {
            return path_;
        }
        [[nodiscard]] net::HttpMethod method() const noexcept
        {
            return method_;
        }
        [[nodiscard]] const net::HeaderMap& headers() const noexcept
        {
            return headers_;
        }
        [[nodiscard]] std::chrono::milliseconds timeout() const noexcept
        {
            return timeout_;
        }
        [[nodiscard]] net::CachePolicy cache_policy() const noexcept
        {
            return cache_policy_;
        }
        [[nodiscard]] const std::string& content_type() const noexcept
        {
            return content_type_;
        }
        [[nodiscard]] const std::optional<std::string>& body() const noexcept
        {
            return body_;
        }
        [[nodiscard]] const std::vector<QueryItem>& query_items() const noexcept
        {
            return query_items_;
        }

        /// Base address + percent-encoded path + query items. Falls back to the bare base address
        /// when the path cannot be encoded (invalid UTF-8).
        [[nodiscard]] std::string url() const;

        /// Wire request for this endpoint. When both limit and offset are given,
        /// "?limit=L&offset=O" is appended to url() as-is.
        [[nodiscard]] net::WireRequest build_request(std::optional<int> limit = std::nullopt,
                                                     std::optional<int> offset = std::nullopt) const;

        Endpoint& with_method(net::HttpMethod method) noexcept;
        Endpoint& with_headers(net::HeaderMap headers); ///< replaces all headers
        Endpoint& with_timeout(std::chrono::milliseconds timeout) noexcept;
        Endpoint& with_cache_policy(net::CachePolicy policy) noexcept;
        Endpoint& with_content_type(std::string content_type);
        Endpoint& with_body(std::string body);
        Endpoint& with_query_items(const std::vector<QueryItem>& items);

        bool operator==(const Endpoint&) const = default;

    private:
        Api api_;
        std::string path_;
        net::HttpMethod method_;
        net::HeaderMap headers_;
        std::chrono::milliseconds timeout_;
        net::CachePolicy cache_policy_;
        std::string content_type_;
        std::optional<std::string> body_;
        std::vector<QueryItem> query_items_;
    };

} // namespace courier
