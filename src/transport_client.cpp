#include "chatvault/transport_client.hpp"
#include "chatvault/digest.hpp"
#include "chatvault/log.hpp"

#include <algorithm>

namespace chatvault {

const char* transport_status_to_string(TransportStatus status) {
    switch (status) {
        case TransportStatus::Ok: return "ok";
        case TransportStatus::NotFound: return "not_found";
        case TransportStatus::RateLimited: return "rate_limited";
        case TransportStatus::Transient: return "transient";
        case TransportStatus::Permanent: return "permanent";
        case TransportStatus::Corrupted: return "corrupted";
        case TransportStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ============================================================================
// BotThrottle
// ============================================================================

BotThrottle::Permit BotThrottle::acquire(const std::string& bot_id) {
    std::unique_lock lock(mutex_);
    if (cap_ > 0) {
        released_.wait(lock, [&] { return active_[bot_id] < cap_; });
    }
    active_[bot_id]++;
    return Permit(*this, bot_id);
}

void BotThrottle::release(const std::string& bot_id) {
    {
        std::lock_guard lock(mutex_);
        auto it = active_.find(bot_id);
        if (it != active_.end() && --it->second == 0) active_.erase(it);
    }
    released_.notify_all();
}

size_t BotThrottle::in_flight(const std::string& bot_id) const {
    std::lock_guard lock(mutex_);
    auto it = active_.find(bot_id);
    return it == active_.end() ? 0 : it->second;
}

// ============================================================================
// TransportClient
// ============================================================================

TransportClient::TransportClient(MessageBackend& backend, BotPool& pool, TransportOptions options)
    : backend_(backend)
    , pool_(pool)
    , options_(std::move(options))
    , throttle_(options_.max_per_bot_in_flight) {
    if (options_.read_block_bytes == 0) {
        options_.read_block_bytes = constants::DEFAULT_READ_BLOCK_BYTES;
    }
}

std::string TransportClient::segment_file_name(const std::string& basename, uint32_t index) {
    return basename + ".part" + std::to_string(index);
}

TransportStatus TransportClient::map_status(RemoteStatus status) {
    switch (status) {
        case RemoteStatus::Ok: return TransportStatus::Ok;
        case RemoteStatus::NotFound: return TransportStatus::NotFound;
        case RemoteStatus::RateLimited: return TransportStatus::RateLimited;
        case RemoteStatus::Transient: return TransportStatus::Transient;
        case RemoteStatus::Permanent: return TransportStatus::Permanent;
    }
    return TransportStatus::Permanent;
}

void TransportClient::report(const std::string& bot_id, RemoteStatus status,
                             std::chrono::milliseconds retry_after) {
    switch (status) {
        case RemoteStatus::Ok:
        case RemoteStatus::NotFound:
            pool_.report_outcome(bot_id, Outcome::success());
            break;
        case RemoteStatus::RateLimited:
            pool_.report_outcome(bot_id, Outcome::rate_limited(retry_after));
            break;
        case RemoteStatus::Transient:
            pool_.report_outcome(bot_id, Outcome::failure());
            break;
        case RemoteStatus::Permanent:
            // Request-level rejection; says nothing about the bot itself
            break;
    }
}

// ============================================================================
// Upload
// ============================================================================

SegmentUpload TransportClient::upload_segment(const BotEntry& bot, uint32_t sequence_index,
                                              const std::string& file_name,
                                              std::span<const uint8_t> data,
                                              const std::string& digest) {
    SegmentUpload result;

    auto token = pool_.credential_for(bot.bot_id);
    if (!token) {
        result.error_message = "bot " + bot.bot_id + " is no longer configured";
        return result;
    }

    std::string local_digest = digest.empty() ? sha256_hex(data) : digest;
    SendResult sent;
    {
        auto permit = throttle_.acquire(bot.bot_id);
        sent = backend_.send_document(*token, options_.chat_id, file_name, data);
    }

    result.status = map_status(sent.status);
    result.retry_after = sent.retry_after;
    if (!sent.success) {
        result.error_message = sent.error_message;
        log_debug("Segment %u via bot %s failed (%s): %s", sequence_index, bot.bot_id.c_str(),
                  remote_status_to_string(sent.status), sent.error_message.c_str());
        return result;
    }

    result.message_created = true;
    result.segment.sequence_index = sequence_index;
    result.segment.bot_id = bot.bot_id;
    result.segment.remote_message_id = sent.message_id;
    result.segment.remote_file_token = sent.file_token;
    result.segment.byte_length = data.size();
    result.segment.segment_digest = local_digest;

    if (sent.stored_size != data.size()) {
        result.status = TransportStatus::Corrupted;
        result.error_message = "backend stored " + std::to_string(sent.stored_size) +
                               " bytes, sent " + std::to_string(data.size());
        return result;
    }

    result.success = true;
    result.status = TransportStatus::Ok;
    return result;
}

// ============================================================================
// Download
// ============================================================================

TransportClient::Link TransportClient::resolve_link(const SegmentRef& segment,
                                                    const CancellationToken* cancel) {
    Link link;
    uint32_t attempts = 0;

    for (;;) {
        if (cancel && cancel->is_cancelled()) {
            link.status = TransportStatus::Cancelled;
            link.error_message = "cancelled";
            return link;
        }

        std::string bot_id = segment.bot_id;
        auto token = pool_.credential_for(bot_id);
        if (!token) {
            auto sel = pool_.select_bot(Purpose::Download);
            if (!sel.success) {
                link.status = TransportStatus::Transient;
                link.error_message = "no bot available for download: " + sel.error_message;
                return link;
            }
            bot_id = sel.bot.bot_id;
            token = sel.bot.credential_token;
        }

        LinkResult resolved;
        {
            auto permit = throttle_.acquire(bot_id);
            resolved = backend_.resolve_file(*token, segment.remote_file_token);
        }
        report(bot_id, resolved.status, resolved.retry_after);

        if (resolved.success) {
            link.success = true;
            link.status = TransportStatus::Ok;
            link.url = resolved.url;
            link.bot_id = bot_id;
            link.file_size = resolved.file_size;
            return link;
        }

        link.status = map_status(resolved.status);
        link.retry_after = resolved.retry_after;
        link.bot_id = bot_id;
        link.error_message = resolved.error_message;

        bool retryable = resolved.status == RemoteStatus::RateLimited ||
                         resolved.status == RemoteStatus::Transient;
        if (!retryable || attempts >= options_.max_link_refreshes) {
            return link;
        }
        if (resolved.status == RemoteStatus::RateLimited &&
            resolved.retry_after > options_.max_rate_limit_wait) {
            return link;
        }

        attempts++;
        auto delay = resolved.status == RemoteStatus::RateLimited
            ? resolved.retry_after
            : std::chrono::milliseconds(100 * attempts);
        if (sleep_unless_cancelled(cancel, delay)) {
            link.status = TransportStatus::Cancelled;
            link.error_message = "cancelled";
            return link;
        }
    }
}

SegmentStream TransportClient::resolve_download(const SegmentRef& segment,
                                                const CancellationToken* cancel) {
    SegmentStream stream;

    auto link = resolve_link(segment, cancel);
    stream.bot_id = link.bot_id;
    stream.status = link.status;
    stream.retry_after = link.retry_after;
    if (!link.success) {
        stream.error_message = link.error_message;
        return stream;
    }

    if (link.file_size && *link.file_size != segment.byte_length) {
        stream.status = TransportStatus::Corrupted;
        stream.error_message = "remote object is " + std::to_string(*link.file_size) +
                               " bytes, expected " + std::to_string(segment.byte_length);
        return stream;
    }

    stream.success = true;
    stream.reader = std::make_unique<SegmentReader>(*this, segment, link.bot_id, link.url, cancel);
    return stream;
}

SegmentReader::SegmentReader(TransportClient& transport, SegmentRef segment,
                             std::string bot_id, std::string url,
                             const CancellationToken* cancel)
    : transport_(transport)
    , segment_(std::move(segment))
    , bot_id_(std::move(bot_id))
    , url_(std::move(url))
    , cancel_(cancel) {}

SegmentReader::ReadResult SegmentReader::read(std::vector<uint8_t>& out) {
    ReadResult result;
    out.clear();

    if (offset_ >= segment_.byte_length) {
        result.success = true;
        result.status = TransportStatus::Ok;
        result.eof = true;
        return result;
    }

    const auto& opts = transport_.options();
    uint64_t want = std::min<uint64_t>(opts.read_block_bytes, segment_.byte_length - offset_);

    for (;;) {
        if (cancel_ && cancel_->is_cancelled()) {
            result.status = TransportStatus::Cancelled;
            result.error_message = "cancelled";
            return result;
        }

        FetchResult fetched;
        {
            auto permit = transport_.throttle_.acquire(bot_id_);
            fetched = transport_.backend_.fetch(url_, offset_, want);
        }
        if (fetched.success) {
            result.success = true;
            result.status = TransportStatus::Ok;
            if (fetched.data.empty()) {
                result.eof = true;  // remote object ended early
                return result;
            }
            offset_ += fetched.data.size();
            out = std::move(fetched.data);
            return result;
        }

        if (fetched.link_expired) {
            if (refreshes_ >= opts.max_link_refreshes) {
                result.status = TransportStatus::Transient;
                result.error_message = "link expired " + std::to_string(refreshes_) +
                                       " times: " + fetched.error_message;
                return result;
            }
            refreshes_++;
            log_debug("Segment %u: link expired at offset %llu, re-resolving (%u/%u)",
                      segment_.sequence_index, static_cast<unsigned long long>(offset_),
                      refreshes_, opts.max_link_refreshes);
            auto link = transport_.resolve_link(segment_, cancel_);
            if (!link.success) {
                result.status = link.status;
                result.error_message = link.error_message;
                return result;
            }
            url_ = link.url;
            bot_id_ = link.bot_id;
            continue;
        }

        transport_.report(bot_id_, fetched.status, fetched.retry_after);

        bool retryable = fetched.status == RemoteStatus::RateLimited ||
                         fetched.status == RemoteStatus::Transient;
        if (!retryable || retries_ >= opts.max_link_refreshes ||
            (fetched.status == RemoteStatus::RateLimited &&
             fetched.retry_after > opts.max_rate_limit_wait)) {
            result.status = TransportClient::map_status(fetched.status);
            result.error_message = fetched.error_message;
            return result;
        }

        retries_++;
        auto delay = fetched.status == RemoteStatus::RateLimited
            ? fetched.retry_after
            : std::chrono::milliseconds(100 * retries_);
        if (sleep_unless_cancelled(cancel_, delay)) {
            result.status = TransportStatus::Cancelled;
            result.error_message = "cancelled";
            return result;
        }
    }
}

// ============================================================================
// Delete
// ============================================================================

SegmentDelete TransportClient::delete_segment(const SegmentRef& segment) {
    SegmentDelete result;

    auto token = pool_.credential_for(segment.bot_id);
    if (!token) {
        result.error_message = "credential for bot " + segment.bot_id + " is no longer configured";
        return result;
    }

    DeleteResult deleted;
    {
        auto permit = throttle_.acquire(segment.bot_id);
        deleted = backend_.delete_message(*token, options_.chat_id, segment.remote_message_id);
    }
    report(segment.bot_id, deleted.status, deleted.retry_after);

    result.status = map_status(deleted.status);
    result.retry_after = deleted.retry_after;
    result.success = deleted.status == RemoteStatus::Ok || deleted.status == RemoteStatus::NotFound;
    if (!result.success) {
        result.error_message = deleted.error_message;
    }
    return result;
}

}  // namespace chatvault
