/*
Module Name:
- streaming_session.hpp

Abstract:
- Producer side of a stream: owns the accumulation buffer, the parser and
  the transport task, and turns transport callbacks into ordered events.
- States: idle -> active -> {completed, failed, cancelled}; terminal states are final.
- Per chunk: invalid UTF-8 -> StreamingError(unknown_content), empty ->
  StreamingError(empty_content), both non-fatal. Otherwise the parser sees
  buffer + chunk; its results are queued in order, a parser exception is
  queued and ends the stream, and completion releases the buffer.
- The buffer keeps the whole accumulation while the parser reports the
  stream incomplete, so it grows without bound on streams that never complete.
- Transport callbacks and event delivery run on strand_; state_ and task_
  are guarded by mutex_ so cancel() can reach the transport synchronously.
*/
#pragma once

// C++ Standard Library
#include <chrono>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

// Project
#include <courier/error.hpp>
#include <courier/event_stream.hpp>
#include <courier/log.hpp>
#include <courier/net/http/message.hpp>
#include <courier/net/http/transport.hpp>
#include <courier/stream_parser.hpp>
#include <courier/utils/utf8.hpp>

namespace courier
{

    enum class SessionState
    {
        idle,
        active,
        completed,
        failed,
        cancelled,
    };

    [[nodiscard]] constexpr bool is_terminal(SessionState s) noexcept
    {
        return s == SessionState::completed || s == SessionState::failed || s == SessionState::cancelled;
    }

    template <class T, StreamParserFor<T> Parser>
    class StreamingSession final : public EventSource<T>,
                                   public std::enable_shared_from_this<StreamingSession<T, Parser>>
    {
    public:
        StreamingSession(boost::asio::any_io_executor executor, net::WireRequest request, Parser parser) :
            strand_{ boost::asio::make_strand(executor) },
            signal_{ strand_ },
            request_{ std::move(request) },
            parser_{ std::move(parser) }
        {
            signal_.expires_at(std::chrono::steady_clock::time_point::max());
        }

        /// idle -> active: open the transport stream. No-op unless idle.
        void start(net::Transport& transport)
        {
            {
                std::lock_guard lock{ mutex_ };
                if (state_ != SessionState::idle)
                    return;
                state_ = SessionState::active;
            }

            auto task = transport.open_stream(request_, make_handlers());

            {
                std::lock_guard lock{ mutex_ };
                if (state_ == SessionState::active)
                {
                    task_ = std::move(task);
                    return;
                }
            }
            // Ended (consumer cancel) while the stream was being opened
            if (task)
                task->cancel();
        }

        boost::asio::awaitable<std::optional<StreamResult<T>>> next() override
        {
            co_return co_await boost::asio::co_spawn(strand_, pull(this->shared_from_this()), boost::asio::use_awaitable);
        }

        void cancel() noexcept override
        {
            std::shared_ptr<net::StreamTask> task;
            {
                std::lock_guard lock{ mutex_ };
                if (is_terminal(state_))
                    return;
                state_ = SessionState::cancelled;
                task = std::move(task_);
            }
            if (task)
                task->cancel();

            try
            {
                boost::asio::post(strand_, [self = this->shared_from_this()] {
                    self->events_.clear();
                    self->buffer_.clear();
                    self->close();
                });
            }
            catch (const std::exception& e)
            {
                log::error(e, "stream");
            }
        }

        [[nodiscard]] SessionState state() const
        {
            std::lock_guard lock{ mutex_ };
            return state_;
        }

        /// HTTP status reported by the transport, once the response head arrived.
        [[nodiscard]] std::optional<int> status() const
        {
            std::lock_guard lock{ mutex_ };
            return status_;
        }

    private:
        // Runs on strand_
        static boost::asio::awaitable<std::optional<StreamResult<T>>> pull(std::shared_ptr<StreamingSession> self)
        {
            for (;;)
            {
                if (self->state() == SessionState::cancelled)
                    co_return std::nullopt;
                if (!self->events_.empty())
                {
                    auto event = std::move(self->events_.front());
                    self->events_.pop_front();
                    co_return event;
                }
                if (self->closed_)
                    co_return std::nullopt;

                // Woken by signal_.cancel(); operation_aborted is the expected outcome
                boost::system::error_code ec;
                co_await self->signal_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            }
        }

        net::StreamHandlers make_handlers()
        {
            std::weak_ptr<StreamingSession> weak = this->shared_from_this();
            auto strand = strand_;

            return net::StreamHandlers{
                .on_response =
                    [weak, strand](int status) {
                        boost::asio::post(strand, [weak, status] {
                            if (auto self = weak.lock())
                                self->on_response(status);
                        });
                    },
                .on_chunk =
                    [weak, strand](std::string_view chunk) {
                        boost::asio::post(strand, [weak, data = std::string{ chunk }] {
                            if (auto self = weak.lock())
                                self->on_chunk(data);
                        });
                    },
                .on_complete =
                    [weak, strand](std::error_code ec) {
                        boost::asio::post(strand, [weak, ec] {
                            if (auto self = weak.lock())
                                self->on_complete(ec);
                        });
                    },
            };
        }

        // strand only
        void on_response(int status)
        {
            {
                std::lock_guard lock{ mutex_ };
                status_ = status;
            }
            if (status < 200 || status > 299)
                log::debug("stream", "stream " + request_.url + " answered with status " + std::to_string(status));
        }

        // strand only
        void on_chunk(const std::string& chunk)
        {
            if (state() != SessionState::active)
                return; // late chunk after the stream ended

            if (!utf8::is_valid(chunk))
            {
                report(StreamingError{ errc::unknown_content, RequestContext::from(request_) });
                return;
            }
            if (chunk.empty())
            {
                report(StreamingError{ errc::empty_content, RequestContext::from(request_) });
                return;
            }

            std::string window = buffer_ + chunk;
            bool complete = false;
            try
            {
                auto results = parser_.parse(window);
                for (auto& r : results)
                    events_.emplace_back(std::move(r));
                complete = parser_.is_stream_complete(window);
            }
            catch (const std::exception& e)
            {
                log::error(e, "stream");
                events_.emplace_back(glz::unexpected(std::current_exception()));
                buffer_.clear();
                finish(SessionState::failed, true);
                return;
            }

            if (complete)
            {
                buffer_.clear();
                finish(SessionState::completed, true);
                return;
            }
            buffer_ = std::move(window);
            signal_.cancel();
        }

        // strand only
        void on_complete(std::error_code ec)
        {
            if (state() != SessionState::active)
                return;

            if (ec)
            {
                const auto failure = net::classify(ec);
                report(TransportError{ failure, ec, RequestContext::from(request_) });
                finish(SessionState::failed, false);
                return;
            }
            finish(SessionState::completed, false);
        }

        template <class E>
        void report(const E& error)
        {
            log::error(error, "stream");
            events_.emplace_back(glz::unexpected(std::make_exception_ptr(error)));
            signal_.cancel();
        }

        // strand only. Moves an active session to a terminal state.
        void finish(SessionState terminal, bool cancel_transport)
        {
            std::shared_ptr<net::StreamTask> task;
            {
                std::lock_guard lock{ mutex_ };
                if (state_ != SessionState::active)
                    return;
                state_ = terminal;
                task = std::move(task_);
            }
            // Release the connection when the parser ended the stream first
            if (task && cancel_transport)
                task->cancel();
            close();
        }

        // strand only
        void close()
        {
            closed_ = true;
            signal_.cancel();
        }

        boost::asio::strand<boost::asio::any_io_executor> strand_;
        boost::asio::steady_timer signal_; // write_gate-style wakeup for next()
        net::WireRequest request_;
        Parser parser_;

        // strand only
        std::string buffer_;
        std::deque<StreamResult<T>> events_;
        bool closed_{ false };

        mutable std::mutex mutex_;
        SessionState state_{ SessionState::idle };
        std::shared_ptr<net::StreamTask> task_;
        std::optional<int> status_;
    };

} // namespace courier
