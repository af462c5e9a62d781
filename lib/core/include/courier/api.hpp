/*
Module Name:
- api.hpp

Abstract:
- Immutable description of a remote API: base address plus authentication style.
- decorate() returns a credentialed copy of a wire request; authentication is
  best-effort and never fails (an empty key only logs a warning).
- Header credentials are listed in WireRequest::credential_headers so the
  transport can drop them on a cross-origin redirect.
*/
#pragma once

// C++ Standard Library
#include <string>

// Project
#include <courier/net/http/message.hpp>

namespace courier
{

    enum class AuthenticationStyle
    {
        none,
        query_parameter,
        header,
        bearer,
    };

    class Api
    {
    public:
        explicit Api(std::string base_address,
                     AuthenticationStyle style = AuthenticationStyle::none,
                     std::string key_name = "key",
                     std::string key_value = {});

        [[nodiscard]] const std::string& base_address() const noexcept
        {
            return base_address_;
        }
        [[nodiscard]] AuthenticationStyle authentication_style() const noexcept
        {
            return style_;
        }
        [[nodiscard]] const std::string& authentication_key_name() const noexcept
        {
            return key_name_;
        }
        [[nodiscard]] const std::string& authentication_key_value() const noexcept
        {
            return key_value_;
        }

        /// Attach credentials to a copy of request. Call once per request.
        [[nodiscard]] net::WireRequest decorate(net::WireRequest request) const;

        bool operator==(const Api&) const = default;

    private:
        std::string base_address_;
        AuthenticationStyle style_;
        std::string key_name_;
        std::string key_value_;
    };

} // namespace courier
