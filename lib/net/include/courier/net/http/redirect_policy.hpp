/*
Module Name:
- redirect_policy.hpp

Abstract:
- Redirect handling policy for the Beast transport.
- Encodes hop limits and rules: follow_none, safe_only, same_origin, follow_all.
- next_method applies HTTP semantics: 307/308 keep method; 303 becomes GET;
  legacy 301/302 convert POST to GET.
*/
#pragma once

// C++ Standard Library
#include <cstddef>

// Project
#include <courier/net/http/message.hpp>
#include <courier/net/http/url.hpp>

namespace courier::net {

inline constexpr bool is_redirect_status(int s) noexcept
{
    return s == 301 || s == 302 || s == 303 || s == 307 || s == 308;
}

enum class RedirectMode {
    follow_none,
    safe_only,
    same_origin,
    follow_all,
};

class RedirectPolicy {
public:
    explicit RedirectPolicy(std::size_t max_hops = 5,
                            RedirectMode mode = RedirectMode::safe_only) noexcept
        : max_hops_(max_hops)
        , mode_(mode)
    {
    }

    std::size_t max_hops() const noexcept
    {
        return max_hops_;
    }

    RedirectMode mode() const noexcept
    {
        return mode_;
    }

    static HttpMethod next_method(HttpMethod cur, int status) noexcept
    {
        if (status == 307 || status == 308)
            return cur;
        if (status == 303 && cur != HttpMethod::head)
            return HttpMethod::get;
        if (cur == HttpMethod::post)
            return HttpMethod::get;
        return cur;
    }

    // Decide whether to follow a hop from 'from' to 'to' given the resulting method.
    bool allow_hop(const Url& from, const Url& to, HttpMethod resulting) const noexcept
    {
        switch (mode_) {
        case RedirectMode::follow_none:
            return false;
        case RedirectMode::safe_only:
            return resulting == HttpMethod::get || resulting == HttpMethod::head;
        case RedirectMode::same_origin:
            return from.scheme == to.scheme && from.host == to.host && from.port == to.port;
        case RedirectMode::follow_all:
            return true;
        }
        return false;
    }

private:
    std::size_t max_hops_;
    RedirectMode mode_;
};

} // namespace courier::net
