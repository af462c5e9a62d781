/*
Module Name:
- stream_parser.hpp

Abstract:
- Chunk parser capability consumed by StreamingSession, plus two built-in parsers.
- A parser always receives the whole accumulation since the stream started;
  the session never hands it an offset view. Parsers that extract records
  incrementally therefore remember how far they already consumed.
- JsonLinesParser: one JSON document per line, never completes on its own.
- ServerSentEventsParser: "data:" fields of text/event-stream events,
  completes when an event carries the done sentinel ("[DONE]" by default).
*/
#pragma once

// C++ Standard Library
#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Project
#include <courier/json.hpp>

namespace courier
{

    template <class P, class T>
    concept StreamParserFor = requires(P& parser, std::string_view buffer) {
        { parser.parse(buffer) } -> std::convertible_to<std::vector<T>>;
        { parser.is_stream_complete(buffer) } -> std::convertible_to<bool>;
    };

    /// Raised by the built-in parsers on a record that is not valid JSON for T.
    class StreamParseError final : public std::runtime_error
    {
    public:
        StreamParseError(std::string record, const std::string& detail) :
            std::runtime_error{ "stream record could not be decoded: " + detail },
            record_{ std::move(record) }
        {
        }

        [[nodiscard]] const std::string& record() const noexcept
        {
            return record_;
        }

    private:
        std::string record_;
    };

    namespace detail
    {
        inline std::string_view strip_cr(std::string_view line) noexcept
        {
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            return line;
        }

        inline bool is_blank(std::string_view s) noexcept
        {
            return s.find_first_not_of(" \t\r") == std::string_view::npos;
        }

        template <class T>
        T decode_record(std::string_view record)
        {
            auto decoded = decode_json<T>(record);
            if (!decoded)
                throw StreamParseError(std::string{ record }, decoded.error());
            return std::move(*decoded);
        }
    } // namespace detail

    template <class T>
    class JsonLinesParser
    {
    public:
        std::vector<T> parse(std::string_view buffer)
        {
            if (buffer.size() < consumed_)
                consumed_ = 0; // a fresh accumulation

            std::vector<T> out;
            for (;;)
            {
                const auto eol = buffer.find('\n', consumed_);
                if (eol == std::string_view::npos)
                    break;
                const auto line = detail::strip_cr(buffer.substr(consumed_, eol - consumed_));
                consumed_ = eol + 1;
                if (!detail::is_blank(line))
                    out.push_back(detail::decode_record<T>(line));
            }
            return out;
        }

        bool is_stream_complete(std::string_view) const noexcept
        {
            return false;
        }

    private:
        std::size_t consumed_{ 0 };
    };

    template <class T>
    class ServerSentEventsParser
    {
    public:
        explicit ServerSentEventsParser(std::string done_sentinel = "[DONE]") :
            done_sentinel_{ std::move(done_sentinel) }
        {
        }

        std::vector<T> parse(std::string_view buffer)
        {
            if (buffer.size() < consumed_)
            {
                consumed_ = 0;
                data_.clear();
                has_data_ = false;
                done_ = false;
            }

            std::vector<T> out;
            while (!done_)
            {
                const auto eol = buffer.find('\n', consumed_);
                if (eol == std::string_view::npos)
                    break;
                const auto line = detail::strip_cr(buffer.substr(consumed_, eol - consumed_));
                consumed_ = eol + 1;

                if (line.empty())
                {
                    dispatch(out);
                    continue;
                }
                if (line.front() == ':')
                    continue; // comment

                const auto colon = line.find(':');
                const auto field = line.substr(0, colon);
                auto value = colon == std::string_view::npos ? std::string_view{} : line.substr(colon + 1);
                if (!value.empty() && value.front() == ' ')
                    value.remove_prefix(1);

                // event, id and retry carry nothing the decoded results need
                if (field != "data")
                    continue;
                if (has_data_)
                    data_.push_back('\n');
                data_.append(value);
                has_data_ = true;
            }
            return out;
        }

        bool is_stream_complete(std::string_view) const noexcept
        {
            return done_;
        }

    private:
        void dispatch(std::vector<T>& out)
        {
            if (!has_data_)
                return;
            std::string data = std::exchange(data_, {});
            has_data_ = false;

            if (data == done_sentinel_)
            {
                done_ = true;
                return;
            }
            if (!detail::is_blank(data))
                out.push_back(detail::decode_record<T>(data));
        }

        std::string done_sentinel_;
        std::size_t consumed_{ 0 };
        std::string data_;
        bool has_data_{ false };
        bool done_{ false };
    };

} // namespace courier
