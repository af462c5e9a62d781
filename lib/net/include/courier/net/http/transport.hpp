/*
Module Name:
- transport.hpp

Abstract:
- The transport capability the core consumes: one request/response exchange
  as an awaitable, and a long-lived stream driven by callbacks.
- Implementations report exchange failures by throwing std::system_error or
  boost::system::system_error; stream failures arrive through on_complete.
- A single exchange given a CancelSignal fails with operation_aborted once the
  signal fires, whichever phase it is in.
*/
#pragma once

// C++ Standard Library
#include <functional>
#include <memory>
#include <string_view>
#include <system_error>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Project
#include <courier/net/http/cancel.hpp>
#include <courier/net/http/message.hpp>

namespace courier::net {

struct StreamHandlers {
    std::function<void(int status)> on_response;
    std::function<void(std::string_view chunk)> on_chunk;
    std::function<void(std::error_code ec)> on_complete; // exactly once, unless cancelled first
};

// Handle on an open stream. cancel() may be called from any thread, any number of times.
class StreamTask {
public:
    virtual ~StreamTask() = default;
    virtual void cancel() noexcept = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual boost::asio::awaitable<WireResponse>
    send(const WireRequest& request, std::shared_ptr<CancelSignal> cancel = {}) = 0;

    [[nodiscard]] virtual std::shared_ptr<StreamTask> open_stream(const WireRequest& request,
                                                                  StreamHandlers handlers)
        = 0;
};

} // namespace courier::net
