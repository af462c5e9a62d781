// C++ Standard Library
#include <iostream>
#include <mutex>
#include <utility>

// Project
#include <courier/log.hpp>

namespace courier::log
{

    namespace
    {
        void write_stderr(const Record& r)
        {
            std::cerr << "[courier:" << r.category << "] ";
            if (r.level != Level::debug)
                std::cerr << to_string(r.level) << ": ";
            std::cerr << r.message << '\n';
        }

        struct SinkSlot
        {
            std::mutex mutex;
            Sink sink{ default_sink() };
        };

        SinkSlot& slot()
        {
            static SinkSlot s;
            return s;
        }
    } // namespace

    std::string_view to_string(Level level) noexcept
    {
        switch (level)
        {
        case Level::debug:
            return "debug";
        case Level::warning:
            return "warning";
        case Level::error:
            return "error";
        }
        return "debug";
    }

    Sink default_sink()
    {
        return [](const Record& r) {
            if (r.level != Level::error)
                write_stderr(r);
        };
    }

    Sink stderr_sink()
    {
        return [](const Record& r) { write_stderr(r); };
    }

    Sink null_sink()
    {
        return [](const Record&) {};
    }

    void set_sink(Sink sink)
    {
        auto& s = slot();
        std::lock_guard lock{ s.mutex };
        s.sink = sink ? std::move(sink) : default_sink();
    }

    void reset_sink()
    {
        set_sink(Sink{});
    }

    void emit(const Record& record) noexcept
    {
        auto& s = slot();
        try
        {
            Sink sink;
            {
                std::lock_guard lock{ s.mutex };
                sink = s.sink;
            }
            sink(record);
        }
        catch (const std::exception& e)
        {
            std::cerr << "[courier:log] sink failed: " << e.what() << '\n';
        }
    }

} // namespace courier::log
