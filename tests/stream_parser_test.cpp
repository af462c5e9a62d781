#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <courier/stream_parser.hpp>

#include "test_support.hpp"

using namespace courier;
using courier::test::Item;

static_assert(StreamParserFor<JsonLinesParser<Item>, Item>);
static_assert(StreamParserFor<ServerSentEventsParser<Item>, Item>);

TEST(JsonLinesParser, EmitsCompleteLinesOnly) {
  JsonLinesParser<Item> parser;
  std::string buffer = R"({"id":1,"name":"a"})" "\n" R"({"id":2,)";
  auto first = parser.parse(buffer);
  ASSERT_EQ(first.size(), 1U);
  EXPECT_EQ(first[0].id, 1);

  buffer += R"("name":"b"})" "\r\n\n";
  auto second = parser.parse(buffer);
  ASSERT_EQ(second.size(), 1U);
  EXPECT_EQ(second[0], (Item{2, "b"}));
  EXPECT_FALSE(parser.is_stream_complete(buffer));
}

TEST(JsonLinesParser, BadLineThrowsWithRecord) {
  JsonLinesParser<Item> parser;
  try {
    (void)parser.parse("not json\n");
    FAIL() << "expected StreamParseError";
  } catch (const StreamParseError& e) {
    EXPECT_EQ(e.record(), "not json");
  }
}

TEST(JsonLinesParser, ShorterBufferRestarts) {
  JsonLinesParser<Item> parser;
  EXPECT_EQ(parser.parse(R"({"id":1,"name":"a"})" "\n" R"({"id":2,"name":"b"})" "\n").size(), 2U);
  EXPECT_EQ(parser.parse(R"({"id":3,"name":"c"})" "\n").size(), 1U);
}

TEST(ServerSentEventsParser, DispatchesOnBlankLine) {
  ServerSentEventsParser<Item> parser;
  std::string buffer = ": keep-alive\n"
                       "event: item\n"
                       "data: {\"id\":1,\"name\":\"a\"}\n";
  EXPECT_TRUE(parser.parse(buffer).empty());

  buffer += "\n";
  const auto events = parser.parse(buffer);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0], (Item{1, "a"}));
  EXPECT_FALSE(parser.is_stream_complete(buffer));
}

TEST(ServerSentEventsParser, JoinsMultiLineData) {
  ServerSentEventsParser<Item> parser;
  const auto events = parser.parse("data: {\"id\":5,\r\ndata:\"name\":\"e\"}\r\n\r\n");
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0], (Item{5, "e"}));
}

TEST(ServerSentEventsParser, DoneSentinelCompletesTheStream) {
  ServerSentEventsParser<Item> parser;
  const std::string buffer = "data: {\"id\":1,\"name\":\"a\"}\n\n"
                             "data: [DONE]\n\n"
                             "data: {\"id\":2,\"name\":\"b\"}\n\n";
  const auto events = parser.parse(buffer);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_TRUE(parser.is_stream_complete(buffer));
}

TEST(ServerSentEventsParser, CustomSentinel) {
  ServerSentEventsParser<Item> parser{"end"};
  // "[DONE]" is an ordinary record once another sentinel is configured
  EXPECT_THROW((void)parser.parse("data: [DONE]\n\n"), StreamParseError);

  ServerSentEventsParser<Item> other{"end"};
  EXPECT_TRUE(other.parse("data: end\n\n").empty());
  EXPECT_TRUE(other.is_stream_complete(""));
}
