#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace chatvault {

// Shared between a caller and a running workflow. Once cancelled it stays
// cancelled.
//
// A token built over a parent also reports cancelled once the parent is;
// the parent must outlive it.
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(const CancellationToken* parent) : parent_(parent) {}

    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool is_cancelled() const {
        if (parent_ && parent_->is_cancelled()) return true;
        std::lock_guard lock(mutex_);
        return cancelled_;
    }

    // Sleep for `duration` unless cancelled first. Returns true if cancelled.
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        if (!parent_) {
            std::unique_lock lock(mutex_);
            return cv_.wait_for(lock, duration, [this] { return cancelled_; });
        }

        // The parent cannot wake us; poll it between short waits
        using Clock = std::chrono::steady_clock;
        auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(duration);
        for (;;) {
            if (parent_->is_cancelled()) return true;
            auto now = Clock::now();
            if (now >= deadline) return false;
            auto slice = std::min<Clock::duration>(deadline - now, std::chrono::milliseconds(50));
            std::unique_lock lock(mutex_);
            if (cv_.wait_for(lock, slice, [this] { return cancelled_; })) return true;
        }
    }

private:
    const CancellationToken* parent_ = nullptr;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

// Sleep helper for code paths where the token is optional
template<typename Rep, typename Period>
bool sleep_unless_cancelled(const CancellationToken* token,
                            std::chrono::duration<Rep, Period> duration) {
    if (token) return token->wait_for(duration);
    std::this_thread::sleep_for(duration);
    return false;
}

}  // namespace chatvault
