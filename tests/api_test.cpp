#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <courier/api.hpp>
#include <courier/log.hpp>

#include "test_support.hpp"

using namespace courier;

namespace {
net::WireRequest sample_request(std::string url) {
  net::WireRequest r;
  r.url = std::move(url);
  r.method = net::HttpMethod::post;
  r.headers.emplace("Content-Type", "application/json");
  r.body = R"({"a":1})";
  return r;
}
} // namespace

TEST(Api, NoneStyleLeavesRequestUntouched) {
  const Api api{"https://api.example.com", AuthenticationStyle::none, "key", "secret"};
  const auto original = sample_request("https://api.example.com/items?page=2");
  EXPECT_EQ(api.decorate(original), original);
}

TEST(Api, QueryParameterAppendsWithQuestionMark) {
  const Api api{"https://api.example.com", AuthenticationStyle::query_parameter, "api_key", "s3"};
  const auto decorated = api.decorate(sample_request("https://api.example.com/items"));
  EXPECT_EQ(decorated.url, "https://api.example.com/items?api_key=s3");
}

TEST(Api, QueryParameterAppendsWithAmpersandWhenQueryExists) {
  const Api api{"https://api.example.com", AuthenticationStyle::query_parameter, "api_key", "s3"};
  const auto decorated = api.decorate(sample_request("https://api.example.com/items?page=2"));
  EXPECT_EQ(decorated.url, "https://api.example.com/items?page=2&api_key=s3");
}

TEST(Api, QueryParameterAddsExactlyOneParameter) {
  const Api api{"https://x.test", AuthenticationStyle::query_parameter, "k", "v"};
  const auto decorated = api.decorate(sample_request("https://x.test/a?b=1&c=2"));
  std::size_t n = 0;
  for (std::size_t pos = decorated.url.find("k=v"); pos != std::string::npos;
     pos = decorated.url.find("k=v", pos + 1))
    ++n;
  EXPECT_EQ(n, 1U);
  EXPECT_EQ(decorated.headers, sample_request("").headers);
}

TEST(Api, HeaderStyleSetsNamedHeader) {
  const Api api{"https://x.test", AuthenticationStyle::header, "X-Api-Key", "abc"};
  const auto decorated = api.decorate(sample_request("https://x.test/a"));
  ASSERT_TRUE(decorated.headers.contains("x-api-key"));
  EXPECT_EQ(decorated.headers.at("X-Api-Key"), "abc");
  EXPECT_EQ(decorated.url, "https://x.test/a");
}

TEST(Api, BearerIgnoresKeyName) {
  for (const std::string name : {"key", "X-Token", ""}) {
    const Api api{"https://x.test", AuthenticationStyle::bearer, name, "tok"};
    const auto decorated = api.decorate(sample_request("https://x.test/a"));
    EXPECT_EQ(decorated.headers.at("Authorization"), "Bearer tok") << name;
    EXPECT_EQ(decorated.headers.size(), 2U);
  }
}

TEST(Api, EmptyKeyWarnsAndLeavesRequestUntouched) {
  test::LogCapture capture;
  const Api api{"https://x.test", AuthenticationStyle::bearer};
  const auto original = sample_request("https://x.test/a");
  EXPECT_EQ(api.decorate(original), original);
  EXPECT_EQ(capture.count(log::Level::warning, "auth"), 1U);
}

TEST(Api, DefaultKeyNameIsKey) {
  const Api api{"https://x.test", AuthenticationStyle::query_parameter};
  EXPECT_EQ(api.authentication_key_name(), "key");
}

TEST(Api, HeaderCredentialsAreListedForRedirectStripping) {
  const Api header{"https://x.test", AuthenticationStyle::header, "X-Api-Key", "abc"};
  EXPECT_EQ(header.decorate(sample_request("https://x.test/a")).credential_headers,
            std::vector<std::string>{"X-Api-Key"});

  const Api bearer{"https://x.test", AuthenticationStyle::bearer, "key", "tok"};
  EXPECT_EQ(bearer.decorate(sample_request("https://x.test/a")).credential_headers,
            std::vector<std::string>{"Authorization"});

  const Api query{"https://x.test", AuthenticationStyle::query_parameter, "k", "v"};
  EXPECT_TRUE(query.decorate(sample_request("https://x.test/a")).credential_headers.empty());
}
