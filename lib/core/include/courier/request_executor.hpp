/*
Module Name:
- request_executor.hpp

Abstract:
- Executes Endpoints and wire requests against a Transport.
- Typed execute<T>: decode the body as T, apply the optional predicate,
  fall back to the {"error": "..."} envelope when decoding fails.
  The HTTP status is not consulted; a non-2xx body either decodes as T or
  surfaces as BackendError / DecodeError.
- Untyped execute: the optional predicate, then a 2xx status check.
- stream<T>: starts a StreamingSession and hands back its EventStream.
- Every failure is logged through courier::log before it is thrown.
- A single exchange may carry a CancelHandle; cancel() on it from any thread
  ends the exchange with a TransportError of kind cancelled.
- Calls are independent; the executor holds no per-call state.
*/
#pragma once

// C++ Standard Library
#include <functional>
#include <memory>
#include <string_view>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

// Project
#include <courier/endpoint.hpp>
#include <courier/error.hpp>
#include <courier/event_stream.hpp>
#include <courier/json.hpp>
#include <courier/log.hpp>
#include <courier/net/http/cancel.hpp>
#include <courier/net/http/message.hpp>
#include <courier/net/http/transport.hpp>
#include <courier/stream_parser.hpp>
#include <courier/streaming_session.hpp>

namespace courier
{

    struct ExecutorOptions
    {
        bool debug_print_bodies{ false }; ///< log every single-exchange body at debug level
    };

    template <class T>
    using Predicate = std::function<bool(const T&)>;

    using CancelHandle = std::shared_ptr<net::CancelSignal>;

    [[nodiscard]] inline CancelHandle make_cancel_handle()
    {
        return std::make_shared<net::CancelSignal>();
    }

    class RequestExecutor
    {
    public:
        RequestExecutor(boost::asio::any_io_executor executor,
                        std::shared_ptr<net::Transport> transport,
                        ExecutorOptions options = {});

        template <class T>
        [[nodiscard]] boost::asio::awaitable<T>
        execute(const Endpoint& endpoint, Predicate<T> predicate = {}, CancelHandle cancel = {})
        {
            co_return co_await execute<T>(endpoint.build_request(), std::move(predicate), std::move(cancel));
        }

        template <class T>
        [[nodiscard]] boost::asio::awaitable<T>
        execute(net::WireRequest request, Predicate<T> predicate = {}, CancelHandle cancel = {})
        {
            const auto context = RequestContext::from(request);
            const auto response = co_await dispatch(request, std::move(cancel));

            if (!response.body)
                raise(BadResponseError{ context, response.status }, "response");

            auto decoded = decode_json<T>(*response.body);
            if (decoded)
            {
                if (predicate && !predicate(*decoded))
                    raise(PreconditionFailure{ context }, "precondition");
                co_return std::move(*decoded);
            }

            DecodeError decode_error{ *response.body, decoded.error(), context };
            log::error(decode_error, "decode");

            if (auto envelope = decode_json<BackendErrorEnvelope>(*response.body))
                raise(BackendError{ std::move(envelope->error), context }, "backend");

            throw decode_error;
        }

        [[nodiscard]] boost::asio::awaitable<void> execute(const Endpoint& endpoint,
                                                           std::function<bool()> predicate = {},
                                                           CancelHandle cancel = {});

        [[nodiscard]] boost::asio::awaitable<void> execute(net::WireRequest request,
                                                           std::function<bool()> predicate = {},
                                                           CancelHandle cancel = {});

        template <class T, StreamParserFor<T> Parser>
        [[nodiscard]] EventStream<T> stream(const Endpoint& endpoint, Parser parser)
        {
            return stream<T>(endpoint.build_request(), std::move(parser));
        }

        template <class T, StreamParserFor<T> Parser>
        [[nodiscard]] EventStream<T> stream(net::WireRequest request, Parser parser)
        {
            auto session = std::make_shared<StreamingSession<T, Parser>>(
                executor_, std::move(request), std::move(parser));
            session->start(*transport_);
            return EventStream<T>{ std::move(session) };
        }

        [[nodiscard]] const ExecutorOptions& options() const noexcept
        {
            return options_;
        }

    private:
        /// The single suspension point. Transport failures become TransportError.
        boost::asio::awaitable<net::WireResponse> dispatch(const net::WireRequest& request, CancelHandle cancel);

        void debug_print(const net::WireResponse& response) const;

        template <class E>
        [[noreturn]] static void raise(const E& error, std::string_view category)
        {
            log::error(error, category);
            throw error;
        }

        boost::asio::any_io_executor executor_;
        std::shared_ptr<net::Transport> transport_;
        ExecutorOptions options_;
    };

} // namespace courier
