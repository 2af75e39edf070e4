#include "chatvault/vault.hpp"
#include "chatvault/digest.hpp"
#include "chatvault/log.hpp"
#include "chatvault/message_backend.hpp"
#include "chatvault/metadata_store.hpp"
#include "chatvault/metrics.hpp"
#include "chatvault/thread_pool.hpp"
#include "chatvault/transport_client.hpp"

#include <algorithm>
#include <deque>
#include <fstream>
#include <future>
#include <sstream>
#include <thread>

namespace chatvault {

namespace {

void emit(const ProgressCallback& callback, const TransferEvent& event) {
    if (callback) callback(event);
}

VaultError make_error(VaultErrorCode code, std::string message, const std::string& file_id = {}) {
    VaultError error;
    error.code = code;
    error.message = std::move(message);
    error.file_id = file_id;
    return error;
}

VaultError from_store(const std::string& what, StoreStatus status, const std::string& detail,
                      const std::string& file_id = {}) {
    auto code = status == StoreStatus::NotFound ? VaultErrorCode::NotFound
                                                : VaultErrorCode::MetadataUnavailable;
    std::string message = what;
    if (!detail.empty()) message += ": " + detail;
    return make_error(code, message, file_id);
}

std::chrono::milliseconds rate_limit_delay(std::chrono::milliseconds retry_after) {
    if (retry_after.count() > 0) return retry_after;
    return std::chrono::seconds(constants::DEFAULT_RETRY_AFTER_SECONDS);
}

// A worker that threw (or a broken promise) becomes the failure on_error builds
template <typename T, typename OnError>
T get_or(std::future<T>& future, OnError&& on_error) {
    try {
        return future.get();
    } catch (const std::exception& e) {
        return on_error(e.what());
    }
}

}  // namespace

const char* error_code_to_string(VaultErrorCode code) {
    switch (code) {
        case VaultErrorCode::None: return "None";
        case VaultErrorCode::PoolExhausted: return "PoolExhausted";
        case VaultErrorCode::TransportFailure: return "TransportFailure";
        case VaultErrorCode::IntegrityViolation: return "IntegrityViolation";
        case VaultErrorCode::MetadataUnavailable: return "MetadataUnavailable";
        case VaultErrorCode::NotFound: return "NotFound";
        case VaultErrorCode::PartialDelete: return "PartialDelete";
        case VaultErrorCode::DownloadIncomplete: return "DownloadIncomplete";
        case VaultErrorCode::Cancelled: return "Cancelled";
        case VaultErrorCode::InvalidArgument: return "InvalidArgument";
        case VaultErrorCode::PathConflict: return "PathConflict";
    }
    return "Unknown";
}

const char* transfer_phase_to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Started: return "started";
        case TransferPhase::SegmentDone: return "segment_done";
        case TransferPhase::Verifying: return "verifying";
        case TransferPhase::Committed: return "committed";
        case TransferPhase::Completed: return "completed";
        case TransferPhase::Failed: return "failed";
    }
    return "unknown";
}

std::string VaultError::to_string() const {
    std::ostringstream oss;
    oss << error_code_to_string(code);
    if (!message.empty()) oss << ": " << message;

    std::vector<std::string> details;
    if (!file_id.empty()) details.push_back("file " + file_id);
    if (segment_index) details.push_back("segment " + std::to_string(*segment_index));
    if (!bot_id.empty()) details.push_back("bot " + bot_id);
    if (!details.empty()) {
        oss << " [";
        for (size_t i = 0; i < details.size(); ++i) oss << (i ? ", " : "") << details[i];
        oss << "]";
    }

    if (retry_at) {
        auto wait = std::chrono::duration_cast<std::chrono::seconds>(
            *retry_at - std::chrono::steady_clock::now());
        oss << " retry in " << std::max<int64_t>(0, wait.count()) << "s";
    }
    if (!remaining_segments.empty()) {
        oss << " remaining segments:";
        for (auto idx : remaining_segments) oss << " " << idx;
    }
    if (!compensation_failures.empty()) {
        oss << " (orphaned:";
        for (const auto& f : compensation_failures) {
            oss << " segment " << f.sequence_index << " bot " << f.bot_id
                << " message " << f.remote_message_id << ";";
        }
        oss << ")";
    }
    return oss.str();
}

// --- Internal workflow state ---

struct Vault::SegmentOutcome {
    bool success = false;
    SegmentRef segment;
    std::vector<SegmentRef> created;  // every message this segment left behind
    uint32_t rate_limited = 0;
    VaultError error;
};

Vault::SegmentOutcome Vault::lost_segment(const std::string& file_id, const char* what) {
    SegmentOutcome outcome;
    outcome.error = make_error(VaultErrorCode::TransportFailure,
                               std::string("segment worker failed: ") + what, file_id);
    return outcome;
}

struct Vault::SegmentFetch {
    bool success = false;
    std::vector<uint8_t> data;
    VaultErrorCode code = VaultErrorCode::DownloadIncomplete;
    std::string message;
    std::string bot_id;  // credential that served (or failed) the read
};

struct Vault::UploadState {
    FileRecord record;
    std::vector<SegmentRef> created;
    std::deque<std::future<SegmentOutcome>> in_flight;
    TransferEvent event;
    const UploadOptions* options = nullptr;
};

// --- Lifecycle ---

Vault::Vault(const VaultConfig& config) : config_(config) {}

Vault::Vault(const VaultConfig& config,
             std::unique_ptr<MessageBackend> backend,
             std::unique_ptr<MetadataStore> store,
             BotPool::Clock clock)
    : config_(config)
    , clock_(std::move(clock))
    , backend_(std::move(backend))
    , store_(std::move(store)) {}

Vault::~Vault() {
    stop();
}

std::string Vault::start() {
    if (running_) return {};

    auto err = config_.validate();
    if (!err.empty()) return err;

    if (!store_) {
        auto sqlite = std::make_unique<SqliteMetadataStore>(config_.metadata_db);
        err = sqlite->open();
        if (!err.empty()) return "Failed to open metadata store: " + err;
        store_ = std::move(sqlite);
    }

    if (!backend_) {
        try {
            backend_ = MessageBackendFactory::create(config_.backend.type, config_.backend.params);
        } catch (const std::exception& e) {
            return std::string("Failed to create backend: ") + e.what();
        }
    }

    BotPool::Options pool_options;
    pool_options.failure_threshold = config_.failure_threshold;
    pool_options.usage_window = std::chrono::seconds(config_.usage_window_secs);
    pool_ = std::make_unique<BotPool>(config_.bots, pool_options, clock_);

    TransportOptions transport_options;
    transport_options.chat_id = config_.chat_id;
    transport_options.max_link_refreshes = config_.max_link_refreshes;
    transport_options.max_per_bot_in_flight = config_.max_per_bot_in_flight;
    transport_ = std::make_unique<TransportClient>(*backend_, *pool_, transport_options);

    workers_ = std::make_unique<ThreadPool>(config_.worker_threads);
    if (metrics_) metrics_->set_pool(pool_.get());

    running_ = true;
    log_info("Vault started: %zu bots, backend=%s, store=%s, segment size %llu bytes",
             pool_->size(), backend_->type_name().c_str(), store_->type_name().c_str(),
             static_cast<unsigned long long>(config_.max_segment_bytes));
    return {};
}

void Vault::stop() {
    if (!running_.exchange(false)) return;

    if (workers_) workers_->shutdown(true);
    if (metrics_) metrics_->set_pool(nullptr);

    log_debug("Vault stopped");
}

bool Vault::check_running(VaultError& error) const {
    if (running_) return true;
    error = make_error(VaultErrorCode::MetadataUnavailable, "vault is not started");
    return false;
}

Vault::Stats Vault::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

// --- Lookup ---

bool Vault::resolve_record(const std::string& path_or_id, FileRecord& record, VaultError& error) {
    if (looks_like_file_id(path_or_id)) {
        auto lookup = store_->get(path_or_id);
        if (lookup.ok()) {
            record = std::move(lookup.record);
            return true;
        }
        if (lookup.status == StoreStatus::Unavailable) {
            error = from_store("cannot load record", lookup.status, lookup.error_message, path_or_id);
            return false;
        }
        // Not an id after all; try it as a path
    }

    auto path = normalize_path(path_or_id);
    if (!path) {
        error = make_error(VaultErrorCode::NotFound, "no file with id or path '" + path_or_id + "'");
        return false;
    }

    auto found = store_->find_by_path(*path);
    if (found.status == StoreStatus::Unavailable) {
        error = from_store("cannot look up path", found.status, found.error_message);
        return false;
    }
    if (!found.ok() || found.records.empty()) {
        error = make_error(VaultErrorCode::NotFound, "no file at " + *path);
        return false;
    }
    if (found.records.size() > 1) {
        log_debug("Path %s is held by %zu records, using newest %s", path->c_str(),
                  found.records.size(), found.records.front().id.c_str());
    }
    record = std::move(found.records.front());
    return true;
}

StatResult Vault::stat(const std::string& path_or_id) {
    StatResult result;
    if (!check_running(result.error)) return result;
    result.success = resolve_record(path_or_id, result.record, result.error);
    return result;
}

ListResult Vault::list(const std::string& prefix) {
    ListResult result;
    if (!check_running(result.error)) return result;

    auto normalized = normalize_prefix(prefix);
    if (!normalized) {
        result.error = make_error(VaultErrorCode::InvalidArgument, "invalid prefix '" + prefix + "'");
        return result;
    }

    auto listed = store_->list(*normalized);
    if (!listed.ok()) {
        result.error = from_store("cannot list files", listed.status, listed.error_message);
        return result;
    }
    result.success = true;
    result.entries = std::move(listed.entries);
    return result;
}

// ============================================================================
// Upload
// ============================================================================

Vault::SegmentOutcome Vault::upload_one_segment(const std::string& file_id, uint32_t index,
                                                const std::string& file_name,
                                                std::shared_ptr<const std::vector<uint8_t>> data,
                                                const std::string& local_digest,
                                                const CancellationToken* cancel) {
    SegmentOutcome outcome;
    std::span<const uint8_t> bytes(data->data(), data->size());

    auto fail = [&](VaultErrorCode code, std::string message, const std::string& bot_id) {
        outcome.error = make_error(code, std::move(message), file_id);
        outcome.error.segment_index = index;
        outcome.error.bot_id = bot_id;
        return outcome;
    };

    const auto max_pool_wait = std::chrono::seconds(config_.max_pool_wait_secs);
    std::chrono::steady_clock::duration pool_waited{0};
    uint32_t switches = 0;

    // Messages created before a throw stay in outcome.created for compensation
    try {
        for (;;) {
            if (cancel && cancel->is_cancelled()) {
                return fail(VaultErrorCode::Cancelled, "upload cancelled", {});
            }

            auto selected = pool_->select_bot(Purpose::Upload);
            if (!selected.success) {
                if (!selected.retry_at) {
                    return fail(VaultErrorCode::PoolExhausted, selected.error_message, {});
                }
                auto wait = *selected.retry_at - pool_->now();
                if (wait < std::chrono::milliseconds(10)) wait = std::chrono::milliseconds(10);
                if (pool_waited + wait > max_pool_wait) {
                    auto result = fail(VaultErrorCode::PoolExhausted, selected.error_message, {});
                    result.error.retry_at = selected.retry_at;
                    return result;
                }
                pool_waited += wait;
                log_debug("Segment %u of %s: pool exhausted, waiting %lld ms", index, file_id.c_str(),
                          static_cast<long long>(
                              std::chrono::duration_cast<std::chrono::milliseconds>(wait).count()));
                if (sleep_unless_cancelled(cancel, wait)) {
                    return fail(VaultErrorCode::Cancelled, "upload cancelled", {});
                }
                continue;
            }

            const BotEntry& bot = selected.bot;
            auto sent = transport_->upload_segment(bot, index, file_name, bytes, local_digest);
            if (sent.message_created) outcome.created.push_back(sent.segment);

            if (sent.status == TransportStatus::Transient) {
                log_debug("Segment %u of %s: transient error via bot %s, retrying once: %s", index,
                          file_id.c_str(), bot.bot_id.c_str(), sent.error_message.c_str());
                sent = transport_->upload_segment(bot, index, file_name, bytes, local_digest);
                if (sent.message_created) outcome.created.push_back(sent.segment);
            }

            switch (sent.status) {
                case TransportStatus::Ok:
                    pool_->report_outcome(bot.bot_id, Outcome::success());
                    outcome.success = true;
                    outcome.segment = sent.segment;
                    return outcome;

                case TransportStatus::RateLimited: {
                    auto retry_after = rate_limit_delay(sent.retry_after);
                    pool_->report_outcome(bot.bot_id, Outcome::rate_limited(retry_after));
                    outcome.rate_limited++;
                    if (++switches > config_.max_rate_limit_switches) {
                        return fail(VaultErrorCode::TransportFailure,
                                    "rate limited " + std::to_string(switches) + " times: " +
                                        sent.error_message,
                                    bot.bot_id);
                    }
                    log_debug("Segment %u of %s: bot %s rate limited for %lld ms, switching bot",
                              index, file_id.c_str(), bot.bot_id.c_str(),
                              static_cast<long long>(retry_after.count()));
                    continue;
                }

                case TransportStatus::Cancelled:
                    return fail(VaultErrorCode::Cancelled, "upload cancelled", bot.bot_id);

                case TransportStatus::Corrupted:
                    pool_->report_outcome(bot.bot_id, Outcome::failure());
                    return fail(VaultErrorCode::IntegrityViolation, sent.error_message, bot.bot_id);

                case TransportStatus::Transient:
                case TransportStatus::Permanent:
                case TransportStatus::NotFound:
                    pool_->report_outcome(bot.bot_id, Outcome::failure());
                    return fail(VaultErrorCode::TransportFailure,
                                std::string(transport_status_to_string(sent.status)) + ": " +
                                    sent.error_message,
                                bot.bot_id);
            }
        }
    } catch (const std::exception& e) {
        return fail(VaultErrorCode::TransportFailure,
                    std::string("segment upload threw: ") + e.what(), {});
    }
}

UploadResult Vault::fail_upload(UploadState& state, VaultError error) {
    // Let in-flight segments finish so everything they created is known
    while (!state.in_flight.empty()) {
        auto outcome = get_or(state.in_flight.front(), [&](const char* what) {
            return lost_segment(state.record.id, what);
        });
        state.in_flight.pop_front();
        state.created.insert(state.created.end(), outcome.created.begin(), outcome.created.end());
    }

    if (error.file_id.empty()) error.file_id = state.record.id;
    compensate(state.record.id, state.created, error);

    bool cancelled = error.code == VaultErrorCode::Cancelled;
    {
        std::lock_guard lock(stats_mutex_);
        if (cancelled) stats_.uploads_cancelled++;
        else stats_.uploads_failed++;
    }
    if (metrics_) {
        if (cancelled) metrics_->uploads_cancelled().Increment();
        else metrics_->uploads_failure().Increment();
    }

    log_error("Upload of %s failed: %s", state.record.path.c_str(), error.to_string().c_str());

    state.event.phase = TransferPhase::Failed;
    emit(state.options->on_progress, state.event);

    UploadResult result;
    result.error = std::move(error);
    return result;
}

UploadResult Vault::upload(std::istream& in, const std::string& logical_path,
                           const UploadOptions& options) {
    UploadResult result;
    if (!check_running(result.error)) return result;

    auto path = normalize_path(logical_path);
    if (!path) {
        result.error = make_error(VaultErrorCode::InvalidArgument,
                                  "invalid path '" + logical_path + "'");
        return result;
    }

    auto holders = store_->find_by_path(*path);
    if (holders.status == StoreStatus::Unavailable) {
        result.error = from_store("cannot check path", holders.status, holders.error_message);
        return result;
    }
    if (holders.ok() && !holders.records.empty()) {
        result.error = make_error(VaultErrorCode::PathConflict, *path + " already exists",
                                  holders.records.front().id);
        return result;
    }

    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->upload_duration());

    UploadState state;
    state.options = &options;
    state.record.id = generate_file_id();
    state.record.path = *path;
    state.record.segment_size = config_.max_segment_bytes;
    state.record.created_at = from_epoch_seconds(to_epoch_seconds(std::chrono::system_clock::now()));
    state.record.bot_pool_version = pool_->version();
    state.event.file_id = state.record.id;
    state.event.path = state.record.path;

    const std::string basename = state.record.name();
    const uint64_t segment_bytes = config_.max_segment_bytes;
    const size_t fan_out = std::max<size_t>(1, config_.segment_fan_out);

    log_debug("Upload %s -> %s started", state.record.id.c_str(), path->c_str());
    emit(options.on_progress, state.event);

    // Collect the oldest in-flight segment. Returns false if it failed.
    VaultError segment_error;
    auto collect_oldest = [&]() -> bool {
        auto outcome = get_or(state.in_flight.front(), [&](const char* what) {
            return lost_segment(state.record.id, what);
        });
        state.in_flight.pop_front();
        state.created.insert(state.created.end(), outcome.created.begin(), outcome.created.end());
        if (outcome.rate_limited > 0 && metrics_) {
            metrics_->rate_limited_total().Increment(static_cast<double>(outcome.rate_limited));
        }
        if (!outcome.success) {
            segment_error = std::move(outcome.error);
            return false;
        }

        state.event.phase = TransferPhase::SegmentDone;
        state.event.bytes_done += outcome.segment.byte_length;
        state.event.segments_done++;
        state.record.segments.push_back(std::move(outcome.segment));
        {
            std::lock_guard lock(stats_mutex_);
            stats_.segments_uploaded++;
        }
        if (metrics_) metrics_->segments_uploaded_total().Increment();
        emit(options.on_progress, state.event);
        return true;
    };

    DigestState whole;
    uint32_t index = 0;
    bool at_end = false;

    while (!at_end) {
        if (options.cancel && options.cancel->is_cancelled()) {
            return fail_upload(state, make_error(VaultErrorCode::Cancelled, "upload cancelled"));
        }

        auto buffer = std::make_shared<std::vector<uint8_t>>();
        while (buffer->size() < segment_bytes) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(
                constants::DEFAULT_STREAM_BUFFER_SIZE, segment_bytes - buffer->size()));
            size_t old_size = buffer->size();
            buffer->resize(old_size + want);
            in.read(reinterpret_cast<char*>(buffer->data() + old_size),
                    static_cast<std::streamsize>(want));
            auto got = static_cast<size_t>(in.gcount());
            buffer->resize(old_size + got);
            if (got < want) {
                at_end = true;
                break;
            }
        }
        if (in.bad()) {
            return fail_upload(state, make_error(VaultErrorCode::InvalidArgument,
                                                 "error reading input stream"));
        }
        if (buffer->empty()) break;

        whole.update(*buffer);

        while (state.in_flight.size() >= fan_out) {
            if (!collect_oldest()) return fail_upload(state, std::move(segment_error));
        }

        std::string file_name = TransportClient::segment_file_name(basename, index);
        try {
            state.in_flight.push_back(workers_->submit(
                [this, id = state.record.id, index, file_name, buffer, cancel = options.cancel] {
                    std::string local_digest = sha256_hex(*buffer);
                    return upload_one_segment(id, index, file_name, buffer, local_digest, cancel);
                }));
        } catch (const std::exception& e) {
            return fail_upload(state, make_error(VaultErrorCode::TransportFailure,
                                                 std::string("cannot dispatch segment: ") + e.what()));
        }
        index++;
    }

    while (!state.in_flight.empty()) {
        if (!collect_oldest()) return fail_upload(state, std::move(segment_error));
    }

    if (options.cancel && options.cancel->is_cancelled()) {
        return fail_upload(state, make_error(VaultErrorCode::Cancelled, "upload cancelled"));
    }

    // Verifying
    state.event.phase = TransferPhase::Verifying;
    state.event.total_bytes = whole.bytes();
    state.event.total_segments = index;
    emit(options.on_progress, state.event);

    auto& segments = state.record.segments;
    std::sort(segments.begin(), segments.end(),
              [](const SegmentRef& a, const SegmentRef& b) { return a.sequence_index < b.sequence_index; });

    uint64_t stored_bytes = 0;
    for (const auto& seg : segments) stored_bytes += seg.byte_length;
    if (stored_bytes != whole.bytes() || segments.size() != index) {
        return fail_upload(state, make_error(VaultErrorCode::IntegrityViolation,
                                             "segments hold " + std::to_string(stored_bytes) +
                                                 " bytes, read " + std::to_string(whole.bytes())));
    }

    state.record.size_bytes = whole.bytes();
    state.record.digest = whole.finalize();

    // The path may have been taken while segments were in flight
    holders = store_->find_by_path(*path);
    if (holders.ok() && !holders.records.empty()) {
        return fail_upload(state, make_error(VaultErrorCode::PathConflict,
                                             *path + " was created concurrently"));
    }

    auto written = store_->insert(state.record);
    if (!written.ok()) {
        return fail_upload(state, make_error(VaultErrorCode::MetadataUnavailable,
                                             "cannot commit record: " + written.error_message));
    }

    state.event.phase = TransferPhase::Committed;
    emit(options.on_progress, state.event);

    {
        std::lock_guard lock(stats_mutex_);
        stats_.uploads_completed++;
        stats_.bytes_uploaded += state.record.size_bytes;
    }
    if (metrics_) {
        metrics_->uploads_success().Increment();
        metrics_->upload_bytes_total().Increment(static_cast<double>(state.record.size_bytes));
    }

    log_info("Uploaded %s (%llu bytes, %zu segments) as %s", path->c_str(),
             static_cast<unsigned long long>(state.record.size_bytes), segments.size(),
             state.record.id.c_str());

    state.event.phase = TransferPhase::Completed;
    emit(options.on_progress, state.event);

    result.success = true;
    result.record = std::move(state.record);
    return result;
}

void Vault::compensate(const std::string& file_id, const std::vector<SegmentRef>& uploaded,
                       VaultError& error) {
    if (uploaded.empty()) return;

    log_warn("Upload %s aborted, deleting %zu uploaded segment(s)", file_id.c_str(), uploaded.size());

    auto outcomes = delete_segments(uploaded);
    uint64_t failed = 0;
    for (size_t i = 0; i < uploaded.size(); ++i) {
        const auto& seg = uploaded[i];
        if (outcomes[i].success) {
            if (metrics_) metrics_->compensations_success().Increment();
            continue;
        }
        failed++;
        if (metrics_) metrics_->compensations_failure().Increment();
        log_error("Compensation failed for file %s segment %u (bot %s, message %lld): %s",
                  file_id.c_str(), seg.sequence_index, seg.bot_id.c_str(),
                  static_cast<long long>(seg.remote_message_id),
                  outcomes[i].error_message.c_str());
        error.compensation_failures.push_back(CompensationFailure{
            seg.sequence_index, seg.bot_id, seg.remote_message_id, outcomes[i].error_message});
    }

    std::lock_guard lock(stats_mutex_);
    stats_.compensations_run++;
    stats_.compensations_failed += failed;
}

// ============================================================================
// Download
// ============================================================================

Vault::SegmentFetch Vault::fetch_segment(const SegmentRef& seg, const CancellationToken* cancel) {
    SegmentFetch fetched;
    fetched.bot_id = seg.bot_id;

    auto fail = [&](VaultErrorCode code, std::string message) {
        fetched.code = code;
        fetched.message = std::move(message);
        fetched.data.clear();
        return fetched;
    };

    try {
        auto stream = transport_->resolve_download(seg, cancel);
        if (!stream.bot_id.empty()) fetched.bot_id = stream.bot_id;
        if (!stream.success) {
            if (stream.status == TransportStatus::Cancelled) {
                return fail(VaultErrorCode::Cancelled, "download cancelled");
            }
            if (stream.status == TransportStatus::Corrupted) {
                return fail(VaultErrorCode::IntegrityViolation, stream.error_message);
            }
            return fail(VaultErrorCode::DownloadIncomplete,
                        std::string("cannot resolve segment (") +
                            transport_status_to_string(stream.status) + "): " + stream.error_message);
        }

        fetched.data.reserve(seg.byte_length);
        std::vector<uint8_t> block;
        for (;;) {
            auto read = stream.reader->read(block);
            fetched.bot_id = stream.reader->bot_id();
            if (!read.success) {
                if (read.status == TransportStatus::Cancelled) {
                    return fail(VaultErrorCode::Cancelled, "download cancelled");
                }
                return fail(VaultErrorCode::DownloadIncomplete,
                            "read failed at offset " + std::to_string(stream.reader->offset()) +
                                ": " + read.error_message);
            }
            if (read.eof) break;
            fetched.data.insert(fetched.data.end(), block.begin(), block.end());
        }

        if (fetched.data.size() != seg.byte_length) {
            return fail(VaultErrorCode::IntegrityViolation,
                        "segment is " + std::to_string(fetched.data.size()) + " bytes, expected " +
                            std::to_string(seg.byte_length));
        }
        if (!verify_digest(seg.segment_digest, fetched.data)) {
            return fail(VaultErrorCode::IntegrityViolation, "segment digest mismatch");
        }
    } catch (const std::exception& e) {
        return fail(VaultErrorCode::DownloadIncomplete, std::string("segment fetch threw: ") + e.what());
    }

    fetched.success = true;
    return fetched;
}

DownloadResult Vault::download(const std::string& path_or_id, const ByteSink& sink,
                               const DownloadOptions& options) {
    DownloadResult result;
    if (!check_running(result.error)) return result;

    TransferEvent event;

    auto fail = [&](VaultErrorCode code, std::string message,
                    std::optional<uint32_t> segment_index = std::nullopt,
                    const std::string& bot_id = {}) {
        result.success = false;
        result.error = make_error(code, std::move(message), result.file_id);
        result.error.segment_index = segment_index;
        result.error.bot_id = bot_id;
        {
            std::lock_guard lock(stats_mutex_);
            stats_.downloads_failed++;
        }
        if (metrics_) metrics_->downloads_failure().Increment();
        if (code != VaultErrorCode::Cancelled) {
            log_error("Download of %s failed: %s", path_or_id.c_str(),
                      result.error.to_string().c_str());
        }
        event.phase = TransferPhase::Failed;
        emit(options.on_progress, event);
        return result;
    };

    FileRecord record;
    if (!resolve_record(path_or_id, record, result.error)) {
        {
            std::lock_guard lock(stats_mutex_);
            stats_.downloads_failed++;
        }
        if (metrics_) metrics_->downloads_failure().Increment();
        return result;
    }
    result.file_id = record.id;
    result.path = record.path;

    event.file_id = record.id;
    event.path = record.path;
    event.total_bytes = record.size_bytes;
    event.total_segments = static_cast<uint32_t>(record.segments.size());

    if (record.delete_pending()) {
        return fail(VaultErrorCode::DownloadIncomplete,
                    "file has an unfinished delete; some segments are gone");
    }

    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->download_duration());

    emit(options.on_progress, event);

    auto segments = record.segments;
    std::sort(segments.begin(), segments.end(),
              [](const SegmentRef& a, const SegmentRef& b) { return a.sequence_index < b.sequence_index; });

    DigestState whole;
    const size_t read_ahead = std::max<size_t>(1, config_.download_read_ahead);
    const size_t block_bytes = transport_->options().read_block_bytes;

    // Segments are fetched ahead on the workers and handed to the sink in
    // sequence order. `stop` ends outstanding fetches once this returns.
    CancellationToken stop(options.cancel);
    std::deque<std::future<SegmentFetch>> in_flight;
    struct Drain {
        CancellationToken& stop;
        std::deque<std::future<SegmentFetch>>& in_flight;
        ~Drain() {
            stop.cancel();
            for (auto& f : in_flight) {
                if (f.valid()) f.wait();
            }
        }
    } drain{stop, in_flight};

    size_t next = 0;
    auto dispatch = [&] {
        while (next < segments.size() && in_flight.size() < read_ahead) {
            const SegmentRef& seg = segments[next++];
            try {
                in_flight.push_back(workers_->submit([this, seg, &stop] {
                    return fetch_segment(seg, &stop);
                }));
            } catch (const std::exception&) {
                // Pool already stopped; fetch inline
                std::promise<SegmentFetch> done;
                done.set_value(fetch_segment(seg, &stop));
                in_flight.push_back(done.get_future());
            }
        }
    };

    for (const auto& seg : segments) {
        if (options.cancel && options.cancel->is_cancelled()) {
            return fail(VaultErrorCode::Cancelled, "download cancelled");
        }

        dispatch();
        auto fetched = get_or(in_flight.front(), [&](const char* what) {
            SegmentFetch lost;
            lost.message = std::string("segment worker failed: ") + what;
            lost.bot_id = seg.bot_id;
            return lost;
        });
        in_flight.pop_front();

        if (!fetched.success) {
            return fail(fetched.code, fetched.message, seg.sequence_index, fetched.bot_id);
        }

        whole.update(fetched.data);
        for (size_t off = 0; off < fetched.data.size(); off += block_bytes) {
            size_t n = std::min(block_bytes, fetched.data.size() - off);
            if (!sink(std::span<const uint8_t>(fetched.data.data() + off, n))) {
                return fail(VaultErrorCode::Cancelled, "download cancelled by receiver",
                            seg.sequence_index, fetched.bot_id);
            }
            result.bytes_written += n;
            event.bytes_done = result.bytes_written;
        }

        event.phase = TransferPhase::SegmentDone;
        event.segments_done++;
        emit(options.on_progress, event);
    }

    event.phase = TransferPhase::Verifying;
    emit(options.on_progress, event);

    bool intact = whole.bytes() == record.size_bytes && verify_digest(record.digest, whole);
    result.digest = whole.finalize();
    if (!intact) {
        return fail(VaultErrorCode::IntegrityViolation,
                    "file digest " + result.digest + " does not match recorded " + record.digest);
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.downloads_completed++;
        stats_.bytes_downloaded += result.bytes_written;
    }
    if (metrics_) {
        metrics_->downloads_success().Increment();
        metrics_->download_bytes_total().Increment(static_cast<double>(result.bytes_written));
    }

    log_debug("Downloaded %s (%llu bytes)", record.path.c_str(),
              static_cast<unsigned long long>(result.bytes_written));

    event.phase = TransferPhase::Completed;
    emit(options.on_progress, event);

    result.success = true;
    return result;
}

DownloadResult Vault::download_to_file(const std::string& path_or_id,
                                       const std::filesystem::path& local_path,
                                       const DownloadOptions& options) {
    auto partial = local_path;
    partial += ".partial";

    std::error_code ec;
    if (local_path.has_parent_path()) {
        std::filesystem::create_directories(local_path.parent_path(), ec);
    }

    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
        DownloadResult result;
        result.error = make_error(VaultErrorCode::InvalidArgument,
                                  "cannot open " + partial.string() + " for writing");
        return result;
    }

    bool write_failed = false;
    auto result = download(path_or_id, [&](std::span<const uint8_t> data) {
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out) {
            write_failed = true;
            return false;
        }
        return true;
    }, options);
    out.close();

    if (result.success && !out) write_failed = true;
    if (write_failed) {
        result.success = false;
        result.error = make_error(VaultErrorCode::DownloadIncomplete,
                                  "failed writing " + partial.string(), result.file_id);
    }

    if (!result.success) {
        std::filesystem::remove(partial, ec);
        return result;
    }

    std::filesystem::rename(partial, local_path, ec);
    if (ec) {
        std::filesystem::remove(partial, ec);
        result.success = false;
        result.error = make_error(VaultErrorCode::DownloadIncomplete,
                                  "cannot move download into place: " + ec.message(), result.file_id);
    }
    return result;
}

// ============================================================================
// Rename
// ============================================================================

RenameResult Vault::rename(const std::string& id, const std::string& new_path) {
    RenameResult result;
    if (!check_running(result.error)) return result;

    auto path = normalize_path(new_path);
    if (!path) {
        result.error = make_error(VaultErrorCode::InvalidArgument, "invalid path '" + new_path + "'", id);
        return result;
    }

    auto lookup = store_->get(id);
    if (!lookup.ok()) {
        result.error = from_store("cannot load record", lookup.status, lookup.error_message, id);
        return result;
    }
    if (lookup.record.path == *path) {
        result.success = true;
        result.record = std::move(lookup.record);
        return result;
    }

    auto holders = store_->find_by_path(*path);
    if (holders.status == StoreStatus::Unavailable) {
        result.error = from_store("cannot check path", holders.status, holders.error_message, id);
        return result;
    }
    for (const auto& other : holders.records) {
        if (other.id != id) {
            result.error = make_error(VaultErrorCode::PathConflict,
                                      *path + " is held by " + other.id, id);
            return result;
        }
    }

    auto written = store_->update_path(id, *path);
    if (!written.ok()) {
        result.error = from_store("cannot rename", written.status, written.error_message, id);
        return result;
    }

    log_info("Renamed %s: %s -> %s", id.c_str(), lookup.record.path.c_str(), path->c_str());

    result.success = true;
    result.record = std::move(lookup.record);
    result.record.path = *path;
    return result;
}

// ============================================================================
// Delete
// ============================================================================

Vault::DeleteOutcome Vault::delete_with_retry(const SegmentRef& segment) {
    DeleteOutcome outcome;
    const uint32_t attempts = std::max<uint32_t>(1, config_.delete_max_attempts);
    const auto max_wait = std::chrono::seconds(config_.max_pool_wait_secs);

    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        auto deleted = transport_->delete_segment(segment);
        if (deleted.success) {
            outcome.success = true;
            outcome.error_message.clear();
            return outcome;
        }
        outcome.error_message = std::string(transport_status_to_string(deleted.status)) + ": " +
                                deleted.error_message;

        bool retryable = deleted.status == TransportStatus::Transient ||
                         deleted.status == TransportStatus::RateLimited;
        if (!retryable || attempt == attempts) break;

        std::chrono::milliseconds delay(100 * attempt);
        if (deleted.status == TransportStatus::RateLimited) {
            delay = rate_limit_delay(deleted.retry_after);
            if (delay > max_wait) break;
        }
        std::this_thread::sleep_for(delay);
    }
    return outcome;
}

std::vector<Vault::DeleteOutcome> Vault::delete_segments(const std::vector<SegmentRef>& segments) {
    std::vector<DeleteOutcome> outcomes(segments.size());
    const size_t window = std::max<size_t>(1, config_.delete_concurrency);

    auto failed = [](const char* what) {
        DeleteOutcome outcome;
        outcome.error_message = std::string("delete threw: ") + what;
        return outcome;
    };
    auto delete_one = [this, failed](const SegmentRef& seg) {
        try {
            return delete_with_retry(seg);
        } catch (const std::exception& e) {
            return failed(e.what());
        }
    };

    std::deque<std::pair<size_t, std::future<DeleteOutcome>>> in_flight;
    auto collect_oldest = [&] {
        auto& [idx, future] = in_flight.front();
        outcomes[idx] = get_or(future, failed);
        in_flight.pop_front();
    };

    for (size_t i = 0; i < segments.size(); ++i) {
        while (in_flight.size() >= window) collect_oldest();
        try {
            in_flight.emplace_back(i, workers_->submit([delete_one, seg = segments[i]] {
                return delete_one(seg);
            }));
        } catch (const std::exception&) {
            // Pool already stopped; delete inline
            outcomes[i] = delete_one(segments[i]);
        }
    }
    while (!in_flight.empty()) collect_oldest();
    return outcomes;
}

RemoveResult Vault::remove(const std::string& id) {
    RemoveResult result;
    result.file_id = id;
    if (!check_running(result.error)) return result;

    auto lookup = store_->get(id);
    if (!lookup.ok()) {
        result.error = from_store("cannot load record", lookup.status, lookup.error_message, id);
        return result;
    }
    const auto& record = lookup.record;
    auto live = record.live_segments();

    auto outcomes = delete_segments(live);

    std::vector<uint32_t> deleted, remaining;
    const DeleteOutcome* first_failure = nullptr;
    const SegmentRef* first_failed_segment = nullptr;
    for (size_t i = 0; i < live.size(); ++i) {
        if (outcomes[i].success) {
            deleted.push_back(live[i].sequence_index);
        } else {
            remaining.push_back(live[i].sequence_index);
            if (!first_failure) {
                first_failure = &outcomes[i];
                first_failed_segment = &live[i];
            }
        }
    }
    result.segments_deleted = static_cast<uint32_t>(deleted.size());

    if (!remaining.empty()) {
        if (!deleted.empty()) {
            auto marked = store_->mark_segments_deleted(id, deleted);
            if (!marked.ok()) {
                log_error("Cannot record deleted segments of %s: %s", id.c_str(),
                          marked.error_message.c_str());
            }
        }
        result.error = make_error(VaultErrorCode::PartialDelete,
                                  std::to_string(remaining.size()) + " of " +
                                      std::to_string(record.segments.size()) +
                                      " segments could not be deleted: " +
                                      first_failure->error_message,
                                  id);
        result.error.segment_index = first_failed_segment->sequence_index;
        result.error.bot_id = first_failed_segment->bot_id;
        result.error.remaining_segments = std::move(remaining);

        {
            std::lock_guard lock(stats_mutex_);
            stats_.deletes_partial++;
        }
        if (metrics_) metrics_->deletes_partial().Increment();
        log_warn("Delete of %s incomplete: %s", id.c_str(), result.error.to_string().c_str());
        return result;
    }

    // Re-validate before the destructive metadata step
    auto again = store_->get(id);
    if (again.status == StoreStatus::Unavailable) {
        result.error = from_store("cannot re-check record", again.status, again.error_message, id);
        if (metrics_) metrics_->deletes_failure().Increment();
        return result;
    }
    if (again.ok()) {
        auto removed = store_->remove(id);
        if (removed.status == StoreStatus::Unavailable) {
            if (!deleted.empty()) {
                auto marked = store_->mark_segments_deleted(id, deleted);
                if (!marked.ok()) {
                    log_warn("Cannot record deleted segments of %s: %s", id.c_str(),
                             marked.error_message.c_str());
                }
            }
            result.error = from_store("cannot remove record", removed.status, removed.error_message, id);
            if (metrics_) metrics_->deletes_failure().Increment();
            return result;
        }
    } else {
        log_debug("Record %s was removed concurrently", id.c_str());
    }

    {
        std::lock_guard lock(stats_mutex_);
        stats_.deletes_completed++;
    }
    if (metrics_) metrics_->deletes_success().Increment();
    log_info("Deleted %s (%s, %zu segments)", id.c_str(), record.path.c_str(), record.segments.size());

    result.success = true;
    return result;
}

}  // namespace chatvault
