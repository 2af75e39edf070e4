#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace chatvault {

/// One configured bot identity (bot_id, credential token).
struct BotCredential {
    std::string bot_id;
    std::string token;
};

/// Snapshot of one pool entry. Copies handed out by BotPool are never
/// written back; only the pool mutates its own entries.
struct BotEntry {
    std::string bot_id;
    std::string credential_token;
    uint64_t usage_counter = 0;  // selections in the current window
    std::chrono::steady_clock::time_point cooldown_until{};
    bool healthy = true;
    uint32_t consecutive_failures = 0;
};

enum class Purpose { Upload, Download };

const char* purpose_to_string(Purpose purpose);

/// Observed result of one call made with a bot.
struct Outcome {
    enum class Kind { Success, RateLimited, Failure };

    Kind kind = Kind::Success;
    std::chrono::milliseconds retry_after{0};

    static Outcome success() { return {Kind::Success, {}}; }
    static Outcome rate_limited(std::chrono::milliseconds retry_after) {
        return {Kind::RateLimited, retry_after};
    }
    static Outcome failure() { return {Kind::Failure, {}}; }
};

/// Result of select_bot(). On PoolExhausted, retry_at holds the earliest
/// moment a cooling-down bot becomes eligible again; it is empty when no
/// healthy bot remains at all.
struct SelectResult {
    bool success = false;
    BotEntry bot;
    std::optional<std::chrono::steady_clock::time_point> retry_at;
    std::string error_message;
};

/// Pool of bot credentials with usage-balanced selection and backoff.
///
/// Selection picks the eligible entry (healthy, not cooling down) with the
/// lowest usage counter, ties broken by lowest bot_id. The counter is bumped
/// at selection time so concurrent workflows spread across bots before any
/// outcome is known.
///
/// Every entry has its own mutex. The shared mutex only protects the shape
/// of the entry list and is taken exclusively by reconfigure() and by usage
/// window resets.
class BotPool {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct Options {
        uint32_t failure_threshold = 3;
        std::chrono::seconds usage_window{0};  // 0 = counters never reset
    };

    BotPool(const std::vector<BotCredential>& bots, const Options& options,
            Clock clock = nullptr);

    BotPool(const BotPool&) = delete;
    BotPool& operator=(const BotPool&) = delete;

    SelectResult select_bot(Purpose purpose);

    void report_outcome(const std::string& bot_id, const Outcome& outcome);

    /// Current token for a bot, read under the entry lock. Empty optional
    /// if the bot is not configured (e.g. removed by reconfigure()).
    std::optional<std::string> credential_for(const std::string& bot_id) const;

    /// Replace the configured set. Usage and health state of bots present in
    /// both sets is kept, except that unhealthy entries are re-enabled.
    /// Bumps version().
    void reconfigure(const std::vector<BotCredential>& bots);

    /// Re-enable one bot marked unhealthy. Returns false if unknown.
    /// The configured set is unchanged, so version() is not bumped.
    bool restore(const std::string& bot_id);

    /// Copies of all entries, ordered by bot_id.
    std::vector<BotEntry> snapshot() const;

    size_t size() const;
    uint64_t version() const;

    std::chrono::steady_clock::time_point now() const { return clock_(); }

    /// Total order used for ties: all-digit ids first, by numeric value
    /// (leading zeros ignored, then the raw string), then the remaining ids
    /// lexicographically.
    static bool bot_id_less(const std::string& a, const std::string& b);

private:
    struct Slot {
        mutable std::mutex mutex;
        BotEntry entry;
    };

    static bool eligible(const BotEntry& entry, std::chrono::steady_clock::time_point now);
    void maybe_reset_window();
    Slot* find_slot(const std::string& bot_id) const;
    void build_slots(const std::vector<BotCredential>& bots);

    Options options_;
    Clock clock_;

    mutable std::shared_mutex slots_mutex_;
    std::vector<std::unique_ptr<Slot>> slots_;  // sorted by bot_id_less
    uint64_t version_ = 1;

    std::mutex window_mutex_;
    std::chrono::steady_clock::time_point window_start_;
};

}  // namespace chatvault
