#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <zlib.h>

#include <courier/api.hpp>
#include <courier/error.hpp>
#include <courier/net/http/beast_transport.hpp>
#include <courier/request_executor.hpp>
#include <courier/stream_parser.hpp>

#include "test_support.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

using namespace courier;
using namespace std::chrono_literals;
using courier::test::Item;

namespace {

using ServerRequest = http::request<http::string_body>;

// Plain HTTP/1.1 server on 127.0.0.1 answering every request with the raw
// response text its handler returns. An empty answer leaves the request hanging.
class LoopbackServer {
 public:
  using Handler = std::function<std::string(const ServerRequest&)>;

  LoopbackServer(asio::io_context& io, Handler handler)
      : acceptor_{io, {asio::ip::make_address("127.0.0.1"), 0}}, handler_{std::move(handler)} {
    asio::co_spawn(io, accept_loop(), asio::detached);
  }

  std::string url(std::string_view path) const {
    return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + std::string{path};
  }

  std::vector<ServerRequest> requests;

 private:
  asio::awaitable<void> accept_loop() {
    for (;;) {
      boost::system::error_code ec;
      auto socket = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, ec));
      if (ec) co_return;
      asio::co_spawn(acceptor_.get_executor(), serve(std::move(socket)), asio::detached);
    }
  }

  asio::awaitable<void> serve(asio::ip::tcp::socket socket) {
    beast::flat_buffer buffer;
    for (;;) {
      ServerRequest req;
      boost::system::error_code ec;
      co_await http::async_read(socket, buffer, req, asio::redirect_error(asio::use_awaitable, ec));
      if (ec) co_return;
      requests.push_back(req);

      const std::string raw = handler_(req);
      if (raw.empty()) continue;
      co_await asio::async_write(socket, asio::buffer(raw), asio::redirect_error(asio::use_awaitable, ec));
      if (ec || raw.find("Connection: close") != std::string::npos) co_return;
    }
  }

  asio::ip::tcp::acceptor acceptor_;
  Handler handler_;
};

std::string response(int status, std::string_view reason, const std::string& extra_headers, const std::string& body) {
  return "HTTP/1.1 " + std::to_string(status) + " " + std::string{reason} + "\r\n" + extra_headers +
         "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

std::string json_ok(const std::string& body) {
  return response(200, "OK", "Content-Type: application/json\r\n", body);
}

std::string gzip_compress(const std::string& in) {
  z_stream zs{};
  if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    return {};
  }
  std::string out(deflateBound(&zs, static_cast<uLong>(in.size())) + 32, '\0');
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
  zs.avail_in = static_cast<uInt>(in.size());
  zs.next_out = reinterpret_cast<Bytef*>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());
  deflate(&zs, Z_FINISH);
  out.resize(zs.total_out);
  deflateEnd(&zs);
  return out;
}

std::string str(beast::string_view sv) { return {sv.data(), sv.size()}; }

std::string header(const ServerRequest& req, http::field field) {
  const auto it = req.find(field);
  return it == req.end() ? std::string{} : str(it->value());
}

class BeastTransportTest : public ::testing::Test {
 protected:
  // Listens, so TCP connects complete through the backlog, but never accepts.
  std::string silent_https_url(const asio::ip::tcp::acceptor& silent) const {
    return "https://127.0.0.1:" + std::to_string(silent.local_endpoint().port()) + "/items";
  }

  net::WireRequest get(const LoopbackServer& server, std::string_view path) const {
    net::WireRequest r;
    r.url = server.url(path);
    return r;
  }

  net::WireResponse send(const net::WireRequest& request) { return test::run_sync(io, transport->send(request)); }

  asio::io_context io;
  net::BeastTransportOptions options;
  asio::ssl::context ssl{net::make_ssl_context(options)};
  std::shared_ptr<net::BeastTransport> transport =
      std::make_shared<net::BeastTransport>(io.get_executor(), ssl, options);
  test::LogCapture capture;
};

}  // namespace

TEST_F(BeastTransportTest, GetSendsDefaultHeaders) {
  LoopbackServer server{io, [](const ServerRequest&) { return json_ok(R"({"id":1,"name":"a"})"); }};

  const auto res = send(get(server, "/items/1?x=1"));
  EXPECT_EQ(res.status, 200);
  EXPECT_TRUE(res.is_success());
  EXPECT_EQ(res.body, std::optional<std::string>{R"({"id":1,"name":"a"})"});
  EXPECT_EQ(res.headers.at("content-type"), "application/json");

  ASSERT_EQ(server.requests.size(), 1U);
  const auto& seen = server.requests.front();
  EXPECT_EQ(seen.method(), http::verb::get);
  EXPECT_EQ(str(seen.target()), "/items/1?x=1");
  EXPECT_EQ(header(seen, http::field::accept), "application/json");
  EXPECT_EQ(header(seen, http::field::accept_encoding), "gzip");
  EXPECT_EQ(header(seen, http::field::user_agent), "courier/1.0");
  EXPECT_EQ(header(seen, http::field::host), server.url("").substr(7));
}

TEST_F(BeastTransportTest, CallerHeadersAndBodyReachTheServer) {
  LoopbackServer server{io, [](const ServerRequest&) { return json_ok("{}"); }};

  auto request = get(server, "/items");
  request.method = net::HttpMethod::post;
  request.headers.emplace("Accept", "text/plain");
  request.headers.emplace("X-Trace", "42");
  request.cache_policy = net::CachePolicy::reload_ignoring_local_cache;
  request.body = R"({"name":"new"})";
  EXPECT_EQ(send(request).status, 200);

  ASSERT_EQ(server.requests.size(), 1U);
  const auto& seen = server.requests.front();
  EXPECT_EQ(seen.method(), http::verb::post);
  EXPECT_EQ(header(seen, http::field::accept), "text/plain");
  EXPECT_EQ(header(seen, http::field::cache_control), "no-cache");
  EXPECT_EQ(str(seen["X-Trace"]), "42");
  EXPECT_EQ(seen.body(), R"({"name":"new"})");
}

TEST_F(BeastTransportTest, KeepAliveConnectionIsReused) {
  LoopbackServer server{io, [](const ServerRequest&) { return json_ok("{}"); }};
  send(get(server, "/a"));
  send(get(server, "/b"));
  send(get(server, "/c"));
  EXPECT_EQ(server.requests.size(), 3U);
}

TEST_F(BeastTransportTest, HeadHasNoBody) {
  LoopbackServer server{io, [](const ServerRequest&) {
                          return std::string{"HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\n"};
                        }};
  auto request = get(server, "/items");
  request.method = net::HttpMethod::head;
  const auto res = send(request);
  EXPECT_EQ(res.status, 200);
  EXPECT_FALSE(res.body.has_value());
}

TEST_F(BeastTransportTest, GzipBodiesAreDecoded) {
  const std::string payload = R"({"id":9,"name":")" + std::string(2000, 'z') + R"("})";
  LoopbackServer server{io, [&payload](const ServerRequest&) {
                          return response(200, "OK", "Content-Encoding: gzip\r\n", gzip_compress(payload));
                        }};
  EXPECT_EQ(send(get(server, "/big")).body, std::optional<std::string>{payload});
}

TEST_F(BeastTransportTest, RedirectChangesPostToGet) {
  LoopbackServer server{io, [](const ServerRequest& req) {
                          if (req.target() == "/old") return response(302, "Found", "Location: /new\r\n", "");
                          return json_ok(R"({"moved":true})");
                        }};
  auto request = get(server, "/old");
  request.method = net::HttpMethod::post;
  request.body = "payload";

  // safe_only only follows hops that end up as GET or HEAD
  const auto res = send(request);
  EXPECT_EQ(res.status, 200);
  EXPECT_EQ(res.body, std::optional<std::string>{R"({"moved":true})"});
  ASSERT_EQ(server.requests.size(), 2U);
  EXPECT_EQ(server.requests[1].method(), http::verb::get);
  EXPECT_EQ(str(server.requests[1].target()), "/new");
  EXPECT_TRUE(server.requests[1].body().empty());
}

TEST_F(BeastTransportTest, FollowNoneReturnsTheRedirect) {
  options.redirect_mode = net::RedirectMode::follow_none;
  auto strict = std::make_shared<net::BeastTransport>(io.get_executor(), ssl, options);
  LoopbackServer server{io, [](const ServerRequest&) { return response(301, "Moved", "Location: /x\r\n", ""); }};

  const auto res = test::run_sync(io, strict->send(get(server, "/y")));
  EXPECT_EQ(res.status, 301);
  EXPECT_EQ(res.headers.at("Location"), "/x");
  EXPECT_EQ(server.requests.size(), 1U);
}

TEST_F(BeastTransportTest, RedirectLoopIsBounded) {
  LoopbackServer server{io, [](const ServerRequest&) { return response(302, "Found", "Location: /loop\r\n", ""); }};
  EXPECT_THROW(send(get(server, "/loop")), std::system_error);
  EXPECT_EQ(server.requests.size(), options.max_redirects + 1);
}

TEST_F(BeastTransportTest, ExecutorDecodesOverTheWire) {
  LoopbackServer server{io, [](const ServerRequest&) { return json_ok(R"({"id":5,"name":"wire"})"); }};
  RequestExecutor executor{io.get_executor(), transport};
  EXPECT_EQ(test::run_sync(io, executor.execute<Item>(get(server, "/items/5"))), (Item{5, "wire"}));
}

TEST_F(BeastTransportTest, SlowServerTimesOut) {
  LoopbackServer server{io, [](const ServerRequest&) { return std::string{}; }};
  RequestExecutor executor{io.get_executor(), transport};
  auto request = get(server, "/slow");
  request.timeout = 200ms;
  try {
    test::run_sync(io, executor.execute<Item>(request));
    FAIL() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_TRUE(e.timed_out());
  }
}

TEST_F(BeastTransportTest, RefusedConnectionIsAConnectionFailure) {
  std::string url;
  {
    asio::ip::tcp::acceptor closed_soon{io, {asio::ip::make_address("127.0.0.1"), 0}};
    url = "http://127.0.0.1:" + std::to_string(closed_soon.local_endpoint().port()) + "/";
  }
  RequestExecutor executor{io.get_executor(), transport};
  net::WireRequest request;
  request.url = url;
  try {
    test::run_sync(io, executor.execute<Item>(request));
    FAIL() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_EQ(e.failure(), net::TransportFailure::connection);
  }
}

TEST_F(BeastTransportTest, ChunkedStreamEndToEnd) {
  LoopbackServer server{io, [](const ServerRequest&) {
                          const std::string a = "{\"id\":1,\"name\":\"a\"}\n{\"id\":2,";
                          const std::string b = "\"name\":\"b\"}\n";
                          auto chunk = [](const std::string& s) {
                            char size[16];
                            std::snprintf(size, sizeof(size), "%zx", s.size());
                            return std::string{size} + "\r\n" + s + "\r\n";
                          };
                          return "HTTP/1.1 200 OK\r\nContent-Type: application/x-ndjson\r\n"
                                 "Transfer-Encoding: chunked\r\n\r\n" +
                                 chunk(a) + chunk(b) + "0\r\n\r\n";
                        }};
  RequestExecutor executor{io.get_executor(), transport};
  auto stream = executor.stream<Item>(get(server, "/feed"), JsonLinesParser<Item>{});

  const auto events = test::run_sync(io, test::collect(stream));
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(*events[0], (Item{1, "a"}));
  EXPECT_EQ(*events[1], (Item{2, "b"}));

  ASSERT_EQ(server.requests.size(), 1U);
  EXPECT_EQ(header(server.requests.front(), http::field::accept_encoding), "identity");
}

TEST_F(BeastTransportTest, UnsupportedSchemeIsRejected) {
  net::WireRequest request;
  request.url = "ftp://example.com/file";
  EXPECT_THROW(send(request), std::system_error);
}

TEST_F(BeastTransportTest, CrossOriginRedirectDropsCredentials) {
  LoopbackServer other{io, [](const ServerRequest&) { return json_ok("{}"); }};
  LoopbackServer origin{io, [&other](const ServerRequest&) {
                          return response(302, "Found", "Location: " + other.url("/landing") + "\r\n", "");
                        }};
  const Api api{origin.url(""), AuthenticationStyle::header, "X-Api-Key", "secret"};
  auto request = api.decorate(get(origin, "/start"));
  request.headers.emplace("Authorization", "Bearer tok");
  request.headers.emplace("Cookie", "session=1");
  request.headers.emplace("X-Trace", "7");

  EXPECT_EQ(send(request).status, 200);

  ASSERT_EQ(origin.requests.size(), 1U);
  EXPECT_EQ(str(origin.requests[0]["X-Api-Key"]), "secret");
  EXPECT_EQ(header(origin.requests[0], http::field::authorization), "Bearer tok");
  EXPECT_EQ(header(origin.requests[0], http::field::cookie), "session=1");

  ASSERT_EQ(other.requests.size(), 1U);
  const auto& landed = other.requests[0];
  EXPECT_EQ(str(landed.target()), "/landing");
  EXPECT_TRUE(landed.find("X-Api-Key") == landed.end());
  EXPECT_TRUE(landed.find(http::field::authorization) == landed.end());
  EXPECT_TRUE(landed.find(http::field::cookie) == landed.end());
  EXPECT_EQ(str(landed["X-Trace"]), "7");
}

TEST_F(BeastTransportTest, SameOriginRedirectKeepsCredentials) {
  LoopbackServer server{io, [](const ServerRequest& req) {
                          if (req.target() == "/old") return response(301, "Moved", "Location: /new\r\n", "");
                          return json_ok("{}");
                        }};
  const Api api{server.url(""), AuthenticationStyle::bearer, "key", "tok"};
  EXPECT_EQ(send(api.decorate(get(server, "/old"))).status, 200);

  ASSERT_EQ(server.requests.size(), 2U);
  EXPECT_EQ(header(server.requests[1], http::field::authorization), "Bearer tok");
}

TEST_F(BeastTransportTest, CancelAbortsAnExchangeWaitingForTheServer) {
  const auto cancel = make_cancel_handle();
  LoopbackServer server{io, [&cancel](const ServerRequest& req) {
                          if (req.target() == "/hang") {
                            cancel->cancel();  // the request is on the wire and never answered
                            return std::string{};
                          }
                          return json_ok(R"({"id":2,"name":"after"})");
                        }};
  RequestExecutor executor{io.get_executor(), transport};
  auto request = get(server, "/hang");
  request.timeout = 30s;

  const auto started = std::chrono::steady_clock::now();
  try {
    test::run_sync(io, executor.execute<Item>(request, {}, cancel));
    FAIL() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_TRUE(e.cancelled());
  }
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
  EXPECT_EQ(server.requests.size(), 1U);
  EXPECT_EQ(capture.count(log::Level::error, "transport"), 1U);

  // The aborted connection is not pooled; the transport stays usable
  EXPECT_EQ(test::run_sync(io, executor.execute<Item>(get(server, "/next"))), (Item{2, "after"}));
}

TEST_F(BeastTransportTest, CancelFromAnotherThread) {
  LoopbackServer server{io, [](const ServerRequest&) { return std::string{}; }};
  RequestExecutor executor{io.get_executor(), transport};
  auto request = get(server, "/hang");
  request.timeout = 30s;

  const auto cancel = make_cancel_handle();
  std::thread canceller{[cancel] {
    std::this_thread::sleep_for(100ms);
    cancel->cancel();
  }};
  try {
    test::run_sync(io, executor.execute(request, {}, cancel));
    ADD_FAILURE() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_TRUE(e.cancelled());
  }
  canceller.join();
}

TEST_F(BeastTransportTest, CancelledHandleNeverConnects) {
  LoopbackServer server{io, [](const ServerRequest&) { return json_ok("{}"); }};
  const auto cancel = make_cancel_handle();
  cancel->cancel();

  try {
    test::run_sync(io, transport->send(get(server, "/items"), cancel));
    FAIL() << "expected operation_aborted";
  } catch (const boost::system::system_error& e) {
    EXPECT_EQ(e.code(), asio::error::operation_aborted);
  }
  EXPECT_TRUE(server.requests.empty());
}

TEST_F(BeastTransportTest, RequestTimeoutBoundsTheTlsHandshake) {
  ASSERT_GT(options.handshake_timeout, 5s);
  asio::ip::tcp::acceptor silent{io, {asio::ip::make_address("127.0.0.1"), 0}};
  RequestExecutor executor{io.get_executor(), transport};
  net::WireRequest request;
  request.url = silent_https_url(silent);
  request.timeout = 200ms;

  const auto started = std::chrono::steady_clock::now();
  try {
    test::run_sync(io, executor.execute<Item>(request));
    FAIL() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_TRUE(e.timed_out());
  }
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST_F(BeastTransportTest, StreamTimeoutBoundsTheTlsHandshake) {
  asio::ip::tcp::acceptor silent{io, {asio::ip::make_address("127.0.0.1"), 0}};
  RequestExecutor executor{io.get_executor(), transport};
  net::WireRequest request;
  request.url = silent_https_url(silent);
  request.timeout = 200ms;

  const auto started = std::chrono::steady_clock::now();
  auto stream = executor.stream<Item>(request, JsonLinesParser<Item>{});
  const auto events = test::run_sync(io, test::collect(stream));
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

  ASSERT_EQ(events.size(), 1U);
  const auto failure = test::failure_as<TransportError>(events[0]);
  ASSERT_TRUE(failure.has_value());
  EXPECT_TRUE(failure->timed_out());
}
