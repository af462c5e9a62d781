/*
Module Name:
- log.hpp

Abstract:
- Process-wide, replaceable diagnostic sink.
- error() is invoked on every failure path of the executor and of streams;
  the default sink drops error records and prints warnings and debug records
  to std::cerr as "[courier:<category>] <message>".
- Emitting never throws: a throwing sink is reported on std::cerr and ignored.
*/
#pragma once

// C++ Standard Library
#include <exception>
#include <functional>
#include <string>
#include <string_view>

namespace courier::log
{

    enum class Level
    {
        debug,
        warning,
        error,
    };

    [[nodiscard]] std::string_view to_string(Level level) noexcept;

    struct Record
    {
        Level level;
        std::string_view category;
        std::string_view message;
        const std::exception* error{ nullptr }; ///< set for error records
    };

    using Sink = std::function<void(const Record&)>;

    /// Install a sink; an empty function restores the default.
    void set_sink(Sink sink);
    void reset_sink();

    [[nodiscard]] Sink default_sink();
    [[nodiscard]] Sink stderr_sink(); ///< like default_sink but also prints error records
    [[nodiscard]] Sink null_sink();

    void emit(const Record& record) noexcept;

    inline void error(const std::exception& e, std::string_view category) noexcept
    {
        emit(Record{ .level = Level::error, .category = category, .message = e.what(), .error = &e });
    }

    inline void warning(std::string_view category, std::string_view message) noexcept
    {
        emit(Record{ .level = Level::warning, .category = category, .message = message });
    }

    inline void debug(std::string_view category, std::string_view message) noexcept
    {
        emit(Record{ .level = Level::debug, .category = category, .message = message });
    }

} // namespace courier::log
