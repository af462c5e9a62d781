// C++ Standard Library
#include <utility>

// Project
#include <courier/api.hpp>
#include <courier/log.hpp>
#include <courier/net/http/url.hpp>

namespace courier
{

    Api::Api(std::string base_address,
             AuthenticationStyle style,
             std::string key_name,
             std::string key_value) :
        base_address_{ std::move(base_address) },
        style_{ style },
        key_name_{ std::move(key_name) },
        key_value_{ std::move(key_value) }
    {
    }

    net::WireRequest Api::decorate(net::WireRequest request) const
    {
        if (style_ == AuthenticationStyle::none)
            return request;

        if (key_value_.empty())
        {
            log::warning("auth",
                         "authentication attempted against " + base_address_
                             + " without a key value; sending the request unauthenticated");
            return request;
        }

        switch (style_)
        {
        case AuthenticationStyle::query_parameter:
            net::append_query(request.url, key_name_, key_value_);
            break;
        case AuthenticationStyle::header:
            request.headers.insert_or_assign(key_name_, key_value_);
            request.credential_headers.push_back(key_name_);
            break;
        case AuthenticationStyle::bearer:
            request.headers.insert_or_assign("Authorization", "Bearer " + key_value_);
            request.credential_headers.emplace_back("Authorization");
            break;
        case AuthenticationStyle::none:
            break;
        }
        return request;
    }

} // namespace courier
