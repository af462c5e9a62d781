/*
Module Name:
- cancel.hpp

Abstract:
- One-shot cancellation shared between the caller of a single exchange and
  the transport serving it.
- The transport installs an abort action for the phase it is waiting on
  (resolve, connect, write/read); cancel() runs it once, from any thread.
- An exchange aborted this way fails with asio::error::operation_aborted.
*/
#pragma once

// C++ Standard Library
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <utility>

namespace courier::net {

class CancelSignal {
public:
    CancelSignal() = default;
    CancelSignal(const CancelSignal&) = delete;
    CancelSignal& operator=(const CancelSignal&) = delete;

    void cancel() noexcept
    {
        std::function<void()> abort;
        {
            std::lock_guard lock{mutex_};
            if (cancelled_)
                return;
            cancelled_ = true;
            abort = std::move(abort_);
        }
        run(abort);
    }

    [[nodiscard]] bool cancelled() const noexcept
    {
        std::lock_guard lock{mutex_};
        return cancelled_;
    }

    // Replace the abort action. Runs it at once when already cancelled.
    void arm(std::function<void()> abort)
    {
        {
            std::lock_guard lock{mutex_};
            if (!cancelled_) {
                abort_ = std::move(abort);
                return;
            }
        }
        run(abort);
    }

    void disarm() noexcept
    {
        std::lock_guard lock{mutex_};
        abort_ = nullptr;
    }

private:
    static void run(const std::function<void()>& abort) noexcept
    {
        if (!abort)
            return;
        try {
            abort();
        } catch (const std::exception& e) {
            std::cerr << "[CancelSignal] abort failed: " << e.what() << '\n';
        }
    }

    mutable std::mutex mutex_;
    bool cancelled_{false};
    std::function<void()> abort_;
};

} // namespace courier::net
