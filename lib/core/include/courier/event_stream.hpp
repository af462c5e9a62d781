/*
Module Name:
- event_stream.hpp

Abstract:
- Consumer side of a stream: an ordered, lazily produced sequence of
  StreamResult<T> events, ended by std::nullopt.
- A failure element holds the exception that describes it; rethrow it
  with std::rethrow_exception to inspect the typed error.
- Destroying or cancelling an EventStream cancels the producer, which in turn
  cancels the transport task.
- Lifetime: cancel posts to the session strand, so the io_context (and the
  executor handed to RequestExecutor) must outlive every EventStream and every
  pending next(). Declare the io_context before any stream in the same scope;
  destroying a stream after its io_context is undefined behaviour.
*/
#pragma once

// C++ Standard Library
#include <exception>
#include <memory>
#include <optional>
#include <utility>

// Boost.Asio
#include <boost/asio/awaitable.hpp>

// Glaze
#include <glaze/util/expected.hpp>

// GSL
#include <gsl/gsl>

namespace courier
{

    template <class T>
    using StreamResult = glz::expected<T, std::exception_ptr>;

    /// Producer of stream events. Implemented by StreamingSession.
    template <class T>
    class EventSource
    {
    public:
        virtual ~EventSource() = default;

        /// Next event, or nullopt once the stream has ended or was cancelled.
        virtual boost::asio::awaitable<std::optional<StreamResult<T>>> next() = 0;

        /// Abandon the stream. Safe to call from any thread, any number of times.
        virtual void cancel() noexcept = 0;
    };

    template <class T>
    class EventStream
    {
    public:
        explicit EventStream(std::shared_ptr<EventSource<T>> source) noexcept :
            source_{ std::move(source) }
        {
            Expects(source_ != nullptr);
        }

        EventStream(EventStream&&) noexcept = default;
        EventStream& operator=(EventStream&& other) noexcept
        {
            if (this != &other)
            {
                cancel();
                source_ = std::move(other.source_);
            }
            return *this;
        }

        EventStream(const EventStream&) = delete;
        EventStream& operator=(const EventStream&) = delete;

        ~EventStream()
        {
            cancel();
        }

        [[nodiscard]] boost::asio::awaitable<std::optional<StreamResult<T>>> next()
        {
            Expects(source_ != nullptr);
            auto source = source_; // keep the producer alive across the suspension
            co_return co_await source->next();
        }

        void cancel() noexcept
        {
            if (source_)
                source_->cancel();
        }

    private:
        std::shared_ptr<EventSource<T>> source_;
    };

} // namespace courier
