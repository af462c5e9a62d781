// C++ Standard Library
#include <utility>

// Project
#include <courier/endpoint.hpp>
#include <courier/net/http/mime.hpp>
#include <courier/net/http/url.hpp>
#include <courier/utils/utf8.hpp>

namespace courier
{

    Endpoint::Endpoint(Api api,
                       std::string path,
                       net::HttpMethod method,
                       net::HeaderMap headers,
                       std::chrono::milliseconds timeout,
                       net::CachePolicy cache_policy,
                       std::optional<std::string> body) :
        api_{ std::move(api) },
        path_{ std::move(path) },
        method_{ method },
        headers_{ std::move(headers) },
        timeout_{ timeout },
        cache_policy_{ cache_policy },
        content_type_{ net::mime::application_json },
        body_{ std::move(body) }
    {
    }

    std::string Endpoint::url() const
    {
        if (!utf8::is_valid(path_))
            return api_.base_address();

        std::string out = api_.base_address() + net::percent_encode_query(path_);
        bool has_query = path_.find('?') != std::string::npos;
        for (const auto& [name, value] : query_items_)
        {
            out.push_back(has_query ? '&' : '?');
            has_query = true;
            out += net::percent_encode_component(name);
            out.push_back('=');
            out += net::percent_encode_component(value);
        }
        return out;
    }

    net::WireRequest Endpoint::build_request(std::optional<int> limit, std::optional<int> offset) const
    {
        net::WireRequest request{
            .url = url(),
            .method = method_,
            .headers = headers_,
            .timeout = timeout_,
            .cache_policy = cache_policy_,
            .body = body_,
        };

        if (limit && offset)
        {
            request.url += "?limit=" + std::to_string(*limit) + "&offset=" + std::to_string(*offset);
        }

        request.headers.insert_or_assign("Content-Type", content_type_);
        return api_.decorate(std::move(request));
    }

    Endpoint& Endpoint::with_method(net::HttpMethod method) noexcept
    {
        method_ = method;
        return *this;
    }

    Endpoint& Endpoint::with_headers(net::HeaderMap headers)
    {
        headers_ = std::move(headers);
        return *this;
    }

    Endpoint& Endpoint::with_timeout(std::chrono::milliseconds timeout) noexcept
    {
        timeout_ = timeout;
        return *this;
    }

    Endpoint& Endpoint::with_cache_policy(net::CachePolicy policy) noexcept
    {
        cache_policy_ = policy;
        return *this;
    }

    Endpoint& Endpoint::with_content_type(std::string content_type)
    {
        content_type_ = std::move(content_type);
        return *this;
    }

    Endpoint& Endpoint::with_body(std::string body)
    {
        body_ = std::move(body);
        return *this;
    }

    Endpoint& Endpoint::with_query_items(const std::vector<QueryItem>& items)
    {
        query_items_.insert(query_items_.end(), items.begin(), items.end());
        return *this;
    }

} // namespace courier
