// C++ Standard Library
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.Beast
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

// OpenSSL
#include <openssl/err.h>
#include <openssl/ssl.h>

// GSL
#include <gsl/gsl>

// Project
#include <courier/net/http/beast_transport.hpp>
#include <courier/net/http/encoding.hpp>
#include <courier/net/http/error.hpp>
#include <courier/net/http/url.hpp>

namespace courier::net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

struct BeastTransport::connection {
    using tcp_stream = beast::tcp_stream;
    using ssl_stream = beast::ssl_stream<tcp_stream>;

    std::variant<tcp_stream, ssl_stream> stream;
    beast::flat_buffer buffer;
    std::chrono::steady_clock::time_point last_used;
    bool reused{false};

    explicit connection(tcp_stream s)
        : stream(std::in_place_type<tcp_stream>, std::move(s))
        , last_used(std::chrono::steady_clock::now())
    {
    }

    explicit connection(ssl_stream s)
        : stream(std::in_place_type<ssl_stream>, std::move(s))
        , last_used(std::chrono::steady_clock::now())
    {
    }

    tcp_stream& lowest() noexcept
    {
        return std::visit([](auto& s) -> tcp_stream& { return beast::get_lowest_layer(s); },
                          stream);
    }

    void close() noexcept
    {
        boost::system::error_code ec;
        lowest().socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        lowest().socket().close(ec); // not_connected is expected here
    }
};

namespace {

    using connection = BeastTransport::connection;

    inline constexpr int k_http_version = 11;
    inline constexpr std::uint64_t k_body_limit = 64ULL * 1024 * 1024;
    inline constexpr std::size_t k_stream_chunk_size = 8 * 1024;

    std::string make_pool_key(const Url& u)
    {
        return u.origin();
    }

    Url parse_wire_url(std::string_view s)
    {
        Url u = parse_url(s);
        if (u.scheme != "http" && u.scheme != "https")
            throw std::system_error(make_error_code(errc::unsupported_scheme), std::string(s));
        if (u.host.empty())
            throw std::system_error(make_error_code(errc::invalid_url), std::string(s));
        if (u.port.empty())
            u.port = std::string(default_port_for_scheme(u.scheme));
        return u;
    }

    std::string_view as_view(beast::string_view sv) noexcept
    {
        return {sv.data(), sv.size()};
    }

    http::request<http::string_body> make_request(const WireRequest& wr,
                                                  const Url& url,
                                                  HttpMethod method,
                                                  const BeastTransportOptions& options,
                                                  bool streaming)
    {
        http::request<http::string_body> req{to_verb(method), url.target(), k_http_version};
        req.set(http::field::host, host_header_value(url));
        req.set(http::field::user_agent, options.user_agent);

        // Defaults first; caller headers (set below) can override
        req.set(http::field::accept, "application/json");
        req.set(http::field::accept_encoding, streaming ? "identity" : "gzip");
        if (wr.cache_policy == CachePolicy::reload_ignoring_local_cache)
            req.set(http::field::cache_control, "no-cache");

        for (const auto& [name, value] : wr.headers)
            req.set(name, value);
        if (streaming)
            req.set(http::field::accept_encoding, "identity"); // no streaming decompression

        if (wr.body)
            req.body() = *wr.body;
        req.prepare_payload();
        return req;
    }

    HeaderMap collect_headers(const http::fields& fields)
    {
        HeaderMap out;
        for (const auto& f : fields) {
            std::string name{as_view(f.name_string())};
            const auto value = as_view(f.value());
            auto [it, inserted] = out.try_emplace(std::move(name), value);
            if (!inserted) {
                it->second += ", ";
                it->second += value;
            }
        }
        return out;
    }

    bool is_stale_connection_error(const boost::system::error_code& ec) noexcept
    {
        return ec == http::error::end_of_stream || ec == asio::error::eof
            || ec == asio::error::connection_reset || ec == asio::error::broken_pipe;
    }

    // Before a hop to another origin
    void strip_credentials(WireRequest& wr)
    {
        for (const auto& name : wr.credential_headers)
            wr.headers.erase(name);
        wr.credential_headers.clear();
        wr.headers.erase("Authorization");
        wr.headers.erase("Proxy-Authorization");
        wr.headers.erase("Cookie");
    }

    void throw_if_cancelled(const CancelSignal* cancel)
    {
        if (cancel && cancel->cancelled())
            throw boost::system::system_error(asio::error::operation_aborted);
    }

    // Abort whatever the connection is waiting on. The close runs on the strand.
    void arm_close(CancelSignal* cancel,
                   const asio::any_io_executor& strand,
                   const std::shared_ptr<connection>& conn)
    {
        if (!cancel)
            return;
        cancel->arm([strand, weak = std::weak_ptr<connection>(conn)] {
            asio::post(strand, [weak] {
                if (auto c = weak.lock()) {
                    c->lowest().cancel();
                    c->close();
                }
            });
        });
    }

    asio::awaitable<asio::ip::tcp::resolver::results_type>
    resolve(const asio::any_io_executor& strand,
            const Url& url,
            std::chrono::milliseconds timeout,
            CancelSignal* cancel)
    {
        auto resolver = std::make_shared<asio::ip::tcp::resolver>(strand);
        auto expired = std::make_shared<bool>(false);

        asio::steady_timer deadline{strand};
        deadline.expires_after(timeout);
        deadline.async_wait([resolver, expired](const boost::system::error_code& ec) {
            if (ec)
                return;
            *expired = true;
            resolver->cancel();
        });
        if (cancel) {
            cancel->arm([strand, weak = std::weak_ptr(resolver)] {
                asio::post(strand, [weak] {
                    if (auto r = weak.lock())
                        r->cancel();
                });
            });
        }

        boost::system::error_code ec;
        auto endpoints = co_await resolver->async_resolve(
            url.host, url.port, asio::redirect_error(asio::use_awaitable, ec));
        deadline.cancel();
        if (cancel)
            cancel->disarm();

        throw_if_cancelled(cancel);
        if (*expired)
            throw boost::system::system_error(asio::error::timed_out);
        if (ec)
            throw boost::system::system_error(ec);
        co_return endpoints;
    }

    // strand is the executor the calling coroutine runs on.
    asio::awaitable<std::shared_ptr<connection>> open_connection(asio::any_io_executor strand,
                                                                 asio::ssl::context& ssl_context,
                                                                 const Url& url,
                                                                 const BeastTransportOptions& options,
                                                                 std::chrono::milliseconds timeout,
                                                                 CancelSignal* cancel)
    {
        auto endpoints = co_await resolve(strand, url, timeout, cancel);

        // Establish TCP connection
        auto conn = std::make_shared<connection>(beast::tcp_stream(strand));
        arm_close(cancel, strand, conn);
        {
            auto& tcp = std::get<connection::tcp_stream>(conn->stream);
            tcp.expires_after(std::min(timeout, options.connect_timeout));
            co_await tcp.async_connect(endpoints, asio::use_awaitable);
            tcp.expires_never();
            throw_if_cancelled(cancel);

            // Disable Nagle's algorithm
            tcp.socket().set_option(asio::ip::tcp::no_delay{true});
        }

        if (!url.is_tls())
            co_return conn;

        // Upgrade to TLS
        auto tcp = std::move(std::get<connection::tcp_stream>(conn->stream));
        auto& ssl = conn->stream.emplace<connection::ssl_stream>(std::move(tcp), ssl_context);
        if (!::SSL_set_tlsext_host_name(ssl.native_handle(), url.host.c_str())) {
            throw std::system_error{static_cast<int>(::ERR_get_error()),
                                    asio::error::get_ssl_category(),
                                    "SNI failure"};
        }
        if (options.verify_peer) {
            if (::SSL_set1_host(ssl.native_handle(), url.host.c_str()) != 1) {
                throw std::system_error{static_cast<int>(::ERR_get_error()),
                                        asio::error::get_ssl_category(),
                                        "host name verification setup failed"};
            }
            ssl.set_verify_mode(asio::ssl::verify_peer);
        } else {
            ssl.set_verify_mode(asio::ssl::verify_none);
        }

        beast::get_lowest_layer(ssl).expires_after(std::min(timeout, options.handshake_timeout));
        co_await ssl.async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);
        beast::get_lowest_layer(ssl).expires_never();
        throw_if_cancelled(cancel);

        co_return conn;
    }

    template <class Stream, class Token>
    asio::awaitable<http::response<http::string_body>>
    exchange(Stream& stream,
             beast::flat_buffer& buffer,
             http::request<http::string_body>& req,
             std::chrono::milliseconds timeout,
             Token tok)
    {
        beast::get_lowest_layer(stream).expires_after(timeout);
        co_await http::async_write(stream, req, tok);

        http::response_parser<http::string_body> parser;
        parser.body_limit(k_body_limit);
        if (req.method() == http::verb::head)
            parser.skip(true);

        beast::get_lowest_layer(stream).expires_after(timeout);
        co_await http::async_read(stream, buffer, parser, tok);
        beast::get_lowest_layer(stream).expires_never();
        co_return parser.release();
    }

    template <class Token>
    asio::awaitable<http::response<http::string_body>>
    exchange(connection& conn,
             http::request<http::string_body>& req,
             std::chrono::milliseconds timeout,
             Token tok)
    {
        conn.buffer.clear();
        if (auto* tls = std::get_if<connection::ssl_stream>(&conn.stream))
            co_return co_await exchange(*tls, conn.buffer, req, timeout, tok);
        co_return co_await exchange(std::get<connection::tcp_stream>(conn.stream),
                                    conn.buffer,
                                    req,
                                    timeout,
                                    tok);
    }

    class BeastStreamTask final : public StreamTask,
                                  public std::enable_shared_from_this<BeastStreamTask> {
    public:
        explicit BeastStreamTask(asio::strand<asio::any_io_executor> strand)
            : strand_(std::move(strand))
        {
        }

        void cancel() noexcept override
        {
            try {
                asio::post(strand_, [self = shared_from_this()] {
                    self->cancelled_ = true;
                    if (self->conn_) {
                        self->conn_->lowest().cancel();
                        self->conn_->close();
                    }
                });
            } catch (const std::exception& e) {
                std::cerr << "[BeastTransport] stream cancel failed: " << e.what() << '\n';
            }
        }

        // strand only
        [[nodiscard]] bool cancelled() const noexcept
        {
            return cancelled_;
        }

        void attach(std::shared_ptr<connection> conn) noexcept
        {
            conn_ = std::move(conn);
        }

        [[nodiscard]] const asio::strand<asio::any_io_executor>& strand() const noexcept
        {
            return strand_;
        }

    private:
        asio::strand<asio::any_io_executor> strand_;
        std::shared_ptr<connection> conn_;
        bool cancelled_{false};
    };

    template <class Stream>
    asio::awaitable<void> pump_stream(Stream& stream,
                                      beast::flat_buffer& buffer,
                                      http::request<http::string_body>& req,
                                      std::chrono::milliseconds timeout,
                                      BeastStreamTask& task,
                                      StreamHandlers& handlers)
    {
        beast::get_lowest_layer(stream).expires_after(timeout);
        co_await http::async_write(stream, req, asio::use_awaitable);
        if (task.cancelled())
            co_return;

        http::response_parser<http::buffer_body> parser;
        parser.body_limit(boost::none); // streams are open-ended

        beast::get_lowest_layer(stream).expires_after(timeout);
        co_await http::async_read_header(stream, buffer, parser, asio::use_awaitable);
        if (task.cancelled())
            co_return;

        if (auto ce = parser.get().find(http::field::content_encoding);
            ce != parser.get().end()
            && encoding::parse_content_encoding(as_view(ce->value())) != encoding::enc::none) {
            throw std::system_error(make_error_code(errc::unsupported_encoding));
        }

        if (handlers.on_response)
            handlers.on_response(parser.get().result_int());

        char chunk[k_stream_chunk_size];
        while (!parser.is_done()) {
            parser.get().body().data = chunk;
            parser.get().body().size = sizeof(chunk);

            boost::system::error_code ec;
            beast::get_lowest_layer(stream).expires_after(timeout);
            co_await http::async_read_some(stream,
                                           buffer,
                                           parser,
                                           asio::redirect_error(asio::use_awaitable, ec));
            if (task.cancelled())
                co_return;
            if (ec == http::error::need_buffer)
                ec = {};
            if (ec)
                throw boost::system::system_error(ec);

            const std::size_t n = sizeof(chunk) - parser.get().body().size;
            if (n > 0 && handlers.on_chunk)
                handlers.on_chunk(std::string_view{chunk, n});
            if (task.cancelled())
                co_return;
        }
    }

    asio::awaitable<void> run_stream(std::shared_ptr<BeastStreamTask> task,
                                     WireRequest request,
                                     StreamHandlers handlers,
                                     asio::ssl::context* ssl_context,
                                     BeastTransportOptions options) noexcept
    {
        std::error_code failure;
        std::shared_ptr<connection> conn;
        try {
            const Url url = parse_wire_url(request.url);
            auto req = make_request(request, url, request.method, options, true);

            conn = co_await open_connection(
                task->strand(), *ssl_context, url, options, request.timeout, nullptr);
            if (task->cancelled())
                co_return;
            task->attach(conn);

            if (auto* tls = std::get_if<connection::ssl_stream>(&conn->stream)) {
                co_await pump_stream(*tls, conn->buffer, req, request.timeout, *task, handlers);
            } else {
                co_await pump_stream(std::get<connection::tcp_stream>(conn->stream),
                                     conn->buffer,
                                     req,
                                     request.timeout,
                                     *task,
                                     handlers);
            }
        } catch (const boost::system::system_error& e) {
            failure = e.code();
        } catch (const std::system_error& e) {
            failure = e.code();
        } catch (const std::exception& e) {
            std::cerr << "[BeastTransport] stream failed: " << e.what() << '\n';
            failure = std::make_error_code(std::errc::io_error);
        }

        if (conn)
            conn->close();
        if (task->cancelled())
            co_return;
        task->attach(nullptr);
        if (handlers.on_complete)
            handlers.on_complete(failure);
    }

} // namespace

asio::ssl::context make_ssl_context(const BeastTransportOptions& options)
{
    asio::ssl::context ctx{asio::ssl::context::tlsv12_client};
    if (options.ca_file.empty()) {
        ctx.set_default_verify_paths();
    } else {
        ctx.load_verify_file(options.ca_file);
    }
    ctx.set_verify_mode(options.verify_peer ? asio::ssl::verify_peer : asio::ssl::verify_none);
    return ctx;
}

BeastTransport::BeastTransport(asio::any_io_executor executor,
                               asio::ssl::context& ssl_context,
                               BeastTransportOptions options)
    : executor_{executor}
    , ssl_context_{&ssl_context}
    , strand_{asio::make_strand(executor_)}
    , options_{std::move(options)}
    , redirect_policy_{options_.max_redirects, options_.redirect_mode}
{
    Expects(ssl_context_ != nullptr);
    Expects(options_.connections_per_host > 0);
}

void BeastTransport::shutdown() noexcept
{
    for (auto& [key, vec] : pool_) {
        for (auto& c : vec) {
            if (c)
                c->close();
        }
    }
    pool_.clear();
}

auto BeastTransport::acquire(const Url& url,
                             bool allow_reuse,
                             std::chrono::milliseconds timeout,
                             CancelSignal* cancel) -> asio::awaitable<std::shared_ptr<connection>>
{
    if (allow_reuse) {
        if (auto it = pool_.find(make_pool_key(url)); it != pool_.end()) {
            auto& vec = it->second;
            while (!vec.empty()) {
                auto conn = std::move(vec.back());
                vec.pop_back();
                // Drop idle or closed connections
                if (std::chrono::steady_clock::now() - conn->last_used > k_pool_idle_timeout
                    || !conn->lowest().socket().is_open()) {
                    conn->close();
                    continue;
                }
                conn->reused = true;
                co_return conn;
            }
        }
    }

    co_return co_await open_connection(strand_, *ssl_context_, url, options_, timeout, cancel);
}

void BeastTransport::release(const Url& url, std::shared_ptr<connection> conn)
{
    auto [it, inserted] = pool_.try_emplace(make_pool_key(url));
    auto& vec = it->second;
    if (inserted)
        vec.reserve(options_.connections_per_host);
    if (vec.size() >= options_.connections_per_host || !conn->lowest().socket().is_open()) {
        conn->close();
        return;
    }
    conn->last_used = std::chrono::steady_clock::now();
    conn->reused = false;
    vec.push_back(std::move(conn));
}

auto BeastTransport::send(const WireRequest& request, std::shared_ptr<CancelSignal> cancel)
    -> asio::awaitable<WireResponse>
{
    co_return co_await asio::co_spawn(
        strand_, send_on_strand(request, std::move(cancel)), asio::use_awaitable);
}

auto BeastTransport::send_on_strand(WireRequest request, std::shared_ptr<CancelSignal> cancel)
    -> asio::awaitable<WireResponse>
{
    throw_if_cancelled(cancel.get());
    const auto disarm = gsl::finally([&cancel] {
        if (cancel)
            cancel->disarm();
    });

    Url url = parse_wire_url(request.url);
    HttpMethod method = request.method;
    WireRequest hop_request = request;

    // Hop loop for redirects
    for (std::size_t hop = 0; hop <= redirect_policy_.max_hops(); ++hop) {
        auto req = make_request(hop_request, url, method, options_, false);

        std::optional<http::response<http::string_body>> res;
        std::shared_ptr<connection> conn;
        for (bool allow_reuse = true; !res; allow_reuse = false) {
            conn = co_await acquire(url, allow_reuse, request.timeout, cancel.get());
            arm_close(cancel.get(), strand_, conn);
            const bool reused = conn->reused;
            try {
                res = co_await exchange(*conn, req, request.timeout, asio::use_awaitable);
            } catch (const boost::system::system_error& e) {
                conn->close();
                throw_if_cancelled(cancel.get());
                // A pooled connection the server already closed: retry once on a fresh one
                if (!reused || !is_stale_connection_error(e.code()))
                    throw;
            }
        }

        // Once disarmed a late cancel can no longer reach a pooled connection
        if (cancel) {
            cancel->disarm();
            if (cancel->cancelled()) {
                conn->close();
                throw boost::system::system_error(asio::error::operation_aborted);
            }
        }

        if (res->keep_alive())
            release(url, std::move(conn));
        else
            conn->close();

        const int status = res->result_int();

        if (is_redirect_status(status) && redirect_policy_.mode() != RedirectMode::follow_none) {
            auto loc = res->find(http::field::location);
            if (loc == res->end())
                throw std::system_error(make_error_code(errc::redirect_without_location));

            Url to = resolve_url(url, as_view(loc->value()));
            if (to.scheme != "http" && to.scheme != "https")
                throw std::system_error(make_error_code(errc::unsupported_scheme));
            if (to.port.empty())
                to.port = std::string(default_port_for_scheme(to.scheme));

            const auto next = RedirectPolicy::next_method(method, status);
            if (!redirect_policy_.allow_hop(url, to, next))
                throw std::system_error(make_error_code(errc::redirect_not_allowed));

            if (next != method) {
                hop_request.body.reset();
                hop_request.headers.erase("Content-Type");
            }
            if (to.origin() != url.origin())
                strip_credentials(hop_request);

            method = next;
            url = std::move(to);
            continue;
        }

        WireResponse out;
        out.status = status;
        out.headers = collect_headers(res->base());

        if (method != HttpMethod::head) {
            auto enc = encoding::enc::none;
            if (auto ce = res->find(http::field::content_encoding); ce != res->end())
                enc = encoding::parse_content_encoding(as_view(ce->value()));

            std::string body;
            std::error_code dec_ec;
            if (!encoding::decode(res->body(), enc, body, dec_ec))
                throw std::system_error(dec_ec);
            out.body = std::move(body);
        }
        co_return out;
    }

    throw std::system_error(make_error_code(errc::too_many_redirects));
}

std::shared_ptr<StreamTask> BeastTransport::open_stream(const WireRequest& request,
                                                        StreamHandlers handlers)
{
    auto task = std::make_shared<BeastStreamTask>(asio::make_strand(executor_));
    asio::co_spawn(task->strand(),
                   run_stream(task, request, std::move(handlers), ssl_context_, options_),
                   asio::detached);
    return task;
}

} // namespace courier::net
