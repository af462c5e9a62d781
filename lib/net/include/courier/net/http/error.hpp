/*
Module Name:
- error.hpp

Abstract:
- Defines courier::net error codes and a std::error_category so callers can use
  std::error_code with the transport helpers. Provides make_error_code and enables
  implicit conversion via is_error_code_enum.
- classify() folds any transport-level error code (ours, Asio's, Beast's) into
  the three failure families the executor reports: connection, timeout, cancelled.
*/
#pragma once

// C++ Standard Library
#include <string>
#include <system_error>

// Boost.Asio
#include <boost/asio/error.hpp>

// Boost.Beast
#include <boost/beast/core/error.hpp>

namespace courier::net {

enum class errc {
    unsupported_encoding = 1,
    decompression_failure,
    invalid_content_type,
    invalid_url,
    unsupported_scheme,
    redirect_without_location,
    redirect_not_allowed,
    too_many_redirects,
};

// Category for courier::net errors.
struct error_category_impl final : std::error_category {
    const char* name() const noexcept override
    {
        return "courier.net";
    }
    std::string message(int ev) const override
    {
        switch (static_cast<errc>(ev)) {
        case errc::unsupported_encoding:
            return "unsupported content-encoding";
        case errc::decompression_failure:
            return "decompression failure";
        case errc::invalid_content_type:
            return "invalid content-type";
        case errc::invalid_url:
            return "invalid url";
        case errc::unsupported_scheme:
            return "unsupported url scheme";
        case errc::redirect_without_location:
            return "redirect response missing Location header";
        case errc::redirect_not_allowed:
            return "redirect not allowed by policy";
        case errc::too_many_redirects:
            return "too many redirects";
        }
        return "unknown courier.net error";
    }
};

inline const std::error_category& error_category()
{
    static error_category_impl cat;
    return cat;
}

inline std::error_code make_error_code(errc e) noexcept
{
    return {static_cast<int>(e), error_category()};
}

enum class TransportFailure {
    connection,
    timeout,
    cancelled,
};

[[nodiscard]] inline const char* to_string(TransportFailure f) noexcept
{
    switch (f) {
    case TransportFailure::connection:
        return "connection";
    case TransportFailure::timeout:
        return "timeout";
    case TransportFailure::cancelled:
        return "cancelled";
    }
    return "connection";
}

[[nodiscard]] inline TransportFailure classify(const std::error_code& ec)
{
    // Boost error codes reach us already converted to std::error_code.
    const std::error_code beast_timeout
        = boost::system::error_code{boost::beast::error::timeout};
    const std::error_code asio_timeout
        = boost::system::error_code{boost::asio::error::timed_out};
    const std::error_code asio_aborted
        = boost::system::error_code{boost::asio::error::operation_aborted};

    if (ec == beast_timeout || ec == asio_timeout || ec == std::errc::timed_out)
        return TransportFailure::timeout;
    if (ec == asio_aborted || ec == std::errc::operation_canceled)
        return TransportFailure::cancelled;
    return TransportFailure::connection;
}

} // namespace courier::net

// Enable implicit conversion to std::error_code for courier::net::errc.
namespace std {
template <>
struct is_error_code_enum<courier::net::errc> : true_type {
};
} // namespace std
