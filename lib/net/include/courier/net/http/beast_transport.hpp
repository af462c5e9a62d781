/*
Module Name:
- beast_transport.hpp

Abstract:
- Default Transport on Boost.Beast: HTTP/1.1 over plain TCP or TLS.
- Keeps a per-origin pool of keep-alive connections for single exchanges;
  every stream gets a dedicated connection that is closed on completion or cancel.
- Redirects follow RedirectPolicy; credential headers are dropped on a hop
  to another origin. gzip bodies are decoded for single exchanges.
- request.timeout bounds every phase: resolve, connect and handshake (each also
  capped by its option), then every write and read.
- Connection-pool state is only touched from strand_; send() runs its
  exchange as a coroutine spawned on the strand.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>

// Project
#include <courier/net/http/message.hpp>
#include <courier/net/http/redirect_policy.hpp>
#include <courier/net/http/transport.hpp>
#include <courier/utils/transparent_string_hash.hpp>

namespace courier::net {

inline constexpr std::size_t k_default_connections_per_host = 4;
inline constexpr auto k_tcp_connect_timeout = std::chrono::milliseconds{30'000};
inline constexpr auto k_handshake_timeout = std::chrono::milliseconds{10'000};
inline constexpr auto k_pool_idle_timeout = std::chrono::seconds{60};

struct BeastTransportOptions {
    std::chrono::milliseconds connect_timeout{k_tcp_connect_timeout};
    std::chrono::milliseconds handshake_timeout{k_handshake_timeout};
    std::string user_agent{"courier/1.0"};
    bool verify_peer{true};
    std::string ca_file; // empty: system default verify paths
    std::size_t max_redirects{5};
    RedirectMode redirect_mode{RedirectMode::safe_only};
    std::size_t connections_per_host{k_default_connections_per_host};
};

// TLS client context configured from the options (verify paths, CA bundle).
[[nodiscard]] boost::asio::ssl::context make_ssl_context(const BeastTransportOptions& options);

class BeastTransport final : public Transport {
public:
    // ssl_context must outlive the transport and every stream it opened.
    BeastTransport(boost::asio::any_io_executor executor,
                   boost::asio::ssl::context& ssl_context,
                   BeastTransportOptions options = {});

    [[nodiscard]] boost::asio::awaitable<WireResponse>
    send(const WireRequest& request, std::shared_ptr<CancelSignal> cancel = {}) override;

    [[nodiscard]] std::shared_ptr<StreamTask> open_stream(const WireRequest& request,
                                                          StreamHandlers handlers) override;

    [[nodiscard]] const BeastTransportOptions& options() const noexcept
    {
        return options_;
    }

    /// Close all pooled connections. Call when no exchange is in flight.
    void shutdown() noexcept;

    struct connection;

private:
    // strand only
    [[nodiscard]] boost::asio::awaitable<WireResponse>
    send_on_strand(WireRequest request, std::shared_ptr<CancelSignal> cancel);
    [[nodiscard]] boost::asio::awaitable<std::shared_ptr<connection>>
    acquire(const Url& url, bool allow_reuse, std::chrono::milliseconds timeout, CancelSignal* cancel);
    void release(const Url& url, std::shared_ptr<connection> conn);

    boost::asio::any_io_executor executor_;
    boost::asio::ssl::context* ssl_context_; // non-null
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    BeastTransportOptions options_;
    RedirectPolicy redirect_policy_;

    // keyed by origin ("scheme://host:port")
    std::unordered_map<std::string,
                       std::vector<std::shared_ptr<connection>>,
                       TransparentStringHash,
                       TransparentStringEq>
        pool_;
};

} // namespace courier::net
