/*
Module Name:
- error.hpp

Abstract:
- Error taxonomy of the request executor and streaming session.
- Every failure is a NetworkError carrying a courier::errc code (category "courier")
  and the RequestContext of the request that produced it.
- TransportError keeps the underlying std::error_code so timeouts and cancellation
  stay distinguishable from other connection failures.
*/
#pragma once

// C++ Standard Library
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

// Project
#include <courier/net/http/error.hpp>
#include <courier/net/http/message.hpp>

namespace courier
{

    enum class errc
    {
        transport_failure = 1,
        no_data_or_bad_response,
        decode_failure,
        backend_error,
        precondition_failure,
        unknown_content,
        empty_content,
    };

    [[nodiscard]] const std::error_category& error_category() noexcept;

    [[nodiscard]] inline std::error_code make_error_code(errc e) noexcept
    {
        return { static_cast<int>(e), error_category() };
    }

    /// URL, method and headers of the request an error refers to.
    struct RequestContext
    {
        std::string url;
        net::HttpMethod method{ net::HttpMethod::get };
        net::HeaderMap headers;

        [[nodiscard]] static RequestContext from(const net::WireRequest& request);
    };

    /// Base of every error raised by the executor and delivered by streams.
    class NetworkError : public std::runtime_error
    {
    public:
        NetworkError(errc code, const std::string& what, RequestContext context);

        [[nodiscard]] std::error_code code() const noexcept
        {
            return make_error_code(code_);
        }
        [[nodiscard]] const RequestContext& context() const noexcept
        {
            return context_;
        }

    private:
        errc code_;
        RequestContext context_;
    };

    /// Connection, DNS, TLS, timeout or cancellation failure. Never retried.
    class TransportError final : public NetworkError
    {
    public:
        TransportError(net::TransportFailure failure,
                       std::error_code underlying,
                       RequestContext context);

        [[nodiscard]] net::TransportFailure failure() const noexcept
        {
            return failure_;
        }
        [[nodiscard]] const std::error_code& underlying() const noexcept
        {
            return underlying_;
        }
        [[nodiscard]] bool timed_out() const noexcept
        {
            return failure_ == net::TransportFailure::timeout;
        }
        [[nodiscard]] bool cancelled() const noexcept
        {
            return failure_ == net::TransportFailure::cancelled;
        }

    private:
        net::TransportFailure failure_;
        std::error_code underlying_;
    };

    /// The exchange finished without a usable response or body.
    class BadResponseError final : public NetworkError
    {
    public:
        explicit BadResponseError(RequestContext context, std::optional<int> status = std::nullopt);

        [[nodiscard]] std::optional<int> status() const noexcept
        {
            return status_;
        }

    private:
        std::optional<int> status_;
    };

    /// The body did not match the expected type nor the backend error envelope.
    class DecodeError final : public NetworkError
    {
    public:
        DecodeError(std::string raw_body, std::string detail, RequestContext context);

        [[nodiscard]] const std::string& raw_body() const noexcept
        {
            return raw_body_;
        }
        [[nodiscard]] const std::string& detail() const noexcept
        {
            return detail_;
        }

    private:
        std::string raw_body_;
        std::string detail_;
    };

    /// The server answered with its own {"error": "..."} payload.
    class BackendError final : public NetworkError
    {
    public:
        BackendError(std::string message, RequestContext context);

        [[nodiscard]] const std::string& message() const noexcept
        {
            return message_;
        }
        [[nodiscard]] bool is_record_not_found() const noexcept
        {
            return message_ == "record not found";
        }

    private:
        std::string message_;
    };

    /// The body decoded but the caller's predicate rejected it.
    class PreconditionFailure final : public NetworkError
    {
    public:
        explicit PreconditionFailure(RequestContext context);
    };

    /// Non-fatal streaming event: errc::unknown_content or errc::empty_content.
    class StreamingError final : public NetworkError
    {
    public:
        StreamingError(errc kind, RequestContext context);

        [[nodiscard]] errc kind() const noexcept
        {
            return kind_;
        }

    private:
        errc kind_;
    };

} // namespace courier

namespace std
{
    template <>
    struct is_error_code_enum<courier::errc> : true_type
    {
    };
} // namespace std
