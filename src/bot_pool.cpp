#include "chatvault/bot_pool.hpp"
#include "chatvault/log.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace chatvault {

namespace {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Strip leading zeros so digit strings compare by length then lexically
std::string_view trim_zeros(const std::string& s) {
    size_t i = 0;
    while (i + 1 < s.size() && s[i] == '0') ++i;
    return std::string_view(s).substr(i);
}

}  // namespace

const char* purpose_to_string(Purpose purpose) {
    switch (purpose) {
        case Purpose::Upload: return "upload";
        case Purpose::Download: return "download";
    }
    return "unknown";
}

bool BotPool::bot_id_less(const std::string& a, const std::string& b) {
    bool da = all_digits(a);
    bool db = all_digits(b);
    if (da != db) return da;  // numeric ids sort before named ones
    if (da) {
        auto ta = trim_zeros(a);
        auto tb = trim_zeros(b);
        if (ta.size() != tb.size()) return ta.size() < tb.size();
        if (ta != tb) return ta < tb;
    }
    return a < b;
}

BotPool::BotPool(const std::vector<BotCredential>& bots, const Options& options,
                 Clock clock)
    : options_(options)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {
    if (options_.failure_threshold == 0) options_.failure_threshold = 1;
    window_start_ = clock_();
    build_slots(bots);
}

void BotPool::build_slots(const std::vector<BotCredential>& bots) {
    slots_.clear();
    slots_.reserve(bots.size());
    for (const auto& cred : bots) {
        auto slot = std::make_unique<Slot>();
        slot->entry.bot_id = cred.bot_id;
        slot->entry.credential_token = cred.token;
        slots_.push_back(std::move(slot));
    }
    std::sort(slots_.begin(), slots_.end(), [](const auto& a, const auto& b) {
        return bot_id_less(a->entry.bot_id, b->entry.bot_id);
    });
}

bool BotPool::eligible(const BotEntry& entry, std::chrono::steady_clock::time_point now) {
    return entry.healthy && entry.cooldown_until <= now;
}

BotPool::Slot* BotPool::find_slot(const std::string& bot_id) const {
    for (const auto& slot : slots_) {
        if (slot->entry.bot_id == bot_id) return slot.get();
    }
    return nullptr;
}

void BotPool::maybe_reset_window() {
    if (options_.usage_window.count() <= 0) return;

    auto now = clock_();
    {
        std::lock_guard lock(window_mutex_);
        if (now - window_start_ < options_.usage_window) return;
        window_start_ = now;
    }

    std::unique_lock lock(slots_mutex_);
    for (auto& slot : slots_) {
        std::lock_guard entry_lock(slot->mutex);
        slot->entry.usage_counter = 0;
    }
    log_debug("Bot pool: usage window elapsed, counters reset");
}

SelectResult BotPool::select_bot(Purpose purpose) {
    maybe_reset_window();

    SelectResult result;
    std::shared_lock lock(slots_mutex_);

    if (slots_.empty()) {
        result.error_message = "no bots configured";
        return result;
    }

    // Two passes: find the minimum under per-entry locks, then claim it.
    // Another selector may claim the same entry in between; that only
    // skews balance by one and the pass is retried if the entry went bad.
    for (int attempt = 0; attempt < 4; ++attempt) {
        auto now = clock_();
        Slot* best = nullptr;
        uint64_t best_usage = 0;
        std::optional<std::chrono::steady_clock::time_point> earliest;
        bool any_healthy = false;

        for (const auto& slot : slots_) {
            std::lock_guard entry_lock(slot->mutex);
            const auto& e = slot->entry;
            if (!e.healthy) continue;
            any_healthy = true;
            if (e.cooldown_until > now) {
                if (!earliest || e.cooldown_until < *earliest) earliest = e.cooldown_until;
                continue;
            }
            // Slots are sorted by bot id, so strict < keeps the lowest id on ties
            if (!best || e.usage_counter < best_usage) {
                best = slot.get();
                best_usage = e.usage_counter;
            }
        }

        if (!best) {
            if (any_healthy) {
                result.retry_at = earliest;
                result.error_message = "all bots cooling down";
            } else {
                result.error_message = "no healthy bots";
            }
            log_debug("Bot pool exhausted for %s: %s",
                      purpose_to_string(purpose), result.error_message.c_str());
            return result;
        }

        std::lock_guard entry_lock(best->mutex);
        if (!eligible(best->entry, clock_())) continue;
        best->entry.usage_counter++;
        result.success = true;
        result.bot = best->entry;
        return result;
    }

    result.error_message = "bot selection contended";
    return result;
}

void BotPool::report_outcome(const std::string& bot_id, const Outcome& outcome) {
    std::shared_lock lock(slots_mutex_);
    Slot* slot = find_slot(bot_id);
    if (!slot) return;  // removed by reconfigure()

    std::lock_guard entry_lock(slot->mutex);
    auto& e = slot->entry;
    switch (outcome.kind) {
        case Outcome::Kind::Success:
            e.consecutive_failures = 0;
            break;
        case Outcome::Kind::RateLimited: {
            auto until = clock_() + outcome.retry_after;
            if (until > e.cooldown_until) e.cooldown_until = until;
            log_debug("Bot %s rate limited for %lld ms", bot_id.c_str(),
                      static_cast<long long>(outcome.retry_after.count()));
            break;
        }
        case Outcome::Kind::Failure:
            e.consecutive_failures++;
            if (e.healthy && e.consecutive_failures >= options_.failure_threshold) {
                e.healthy = false;
                log_warn("Bot %s marked unhealthy after %u consecutive failures",
                         bot_id.c_str(), e.consecutive_failures);
            }
            break;
    }
}

std::optional<std::string> BotPool::credential_for(const std::string& bot_id) const {
    std::shared_lock lock(slots_mutex_);
    Slot* slot = find_slot(bot_id);
    if (!slot) return std::nullopt;
    std::lock_guard entry_lock(slot->mutex);
    return slot->entry.credential_token;
}

void BotPool::reconfigure(const std::vector<BotCredential>& bots) {
    std::unique_lock lock(slots_mutex_);

    std::vector<std::unique_ptr<Slot>> old = std::move(slots_);
    build_slots(bots);

    for (auto& slot : slots_) {
        for (const auto& prev : old) {
            if (prev->entry.bot_id != slot->entry.bot_id) continue;
            slot->entry.usage_counter = prev->entry.usage_counter;
            slot->entry.cooldown_until = prev->entry.cooldown_until;
            break;
        }
    }

    version_++;
    log_info("Bot pool reconfigured: %zu bots (version %llu)", slots_.size(),
             static_cast<unsigned long long>(version_));
}

bool BotPool::restore(const std::string& bot_id) {
    std::shared_lock lock(slots_mutex_);
    Slot* slot = find_slot(bot_id);
    if (!slot) return false;

    std::lock_guard entry_lock(slot->mutex);
    slot->entry.healthy = true;
    slot->entry.consecutive_failures = 0;
    log_info("Bot %s restored", bot_id.c_str());
    return true;
}

std::vector<BotEntry> BotPool::snapshot() const {
    std::shared_lock lock(slots_mutex_);
    std::vector<BotEntry> out;
    out.reserve(slots_.size());
    for (const auto& slot : slots_) {
        std::lock_guard entry_lock(slot->mutex);
        out.push_back(slot->entry);
    }
    return out;
}

size_t BotPool::size() const {
    std::shared_lock lock(slots_mutex_);
    return slots_.size();
}

uint64_t BotPool::version() const {
    std::shared_lock lock(slots_mutex_);
    return version_;
}

}  // namespace chatvault
