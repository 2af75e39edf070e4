#include "chatvault/metrics.hpp"
#include "chatvault/bot_pool.hpp"
#include "chatvault/log.hpp"

#include <prometheus/text_serializer.h>

#include <fstream>
#include <string_view>

namespace chatvault {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , labels_(labels)
    , registry_(std::make_shared<prometheus::Registry>()) {
    uploads_ = result_counters("chatvault_uploads_total", "Upload workflows finished",
                               {"success", "failure", "cancelled"});
    downloads_ = result_counters("chatvault_downloads_total", "Download workflows finished",
                                 {"success", "failure"});
    deletes_ = result_counters("chatvault_deletes_total", "Hard delete workflows finished",
                               {"success", "partial", "failure"});
    compensations_ = result_counters("chatvault_compensations_total",
                                     "Segment deletes issued to undo aborted uploads",
                                     {"success", "failure"});

    upload_bytes_ = plain_counter("chatvault_upload_bytes_total",
                                  "Bytes committed by successful uploads");
    download_bytes_ = plain_counter("chatvault_download_bytes_total",
                                    "Bytes delivered by verified downloads");
    segments_uploaded_ = plain_counter("chatvault_segments_uploaded_total",
                                       "Segments accepted by the backend");
    rate_limited_ = plain_counter("chatvault_rate_limited_total",
                                  "Segment uploads answered with a rate limit");

    bots_total_ = plain_gauge("chatvault_bots_total", "Configured bots");
    bots_healthy_ = plain_gauge("chatvault_bots_healthy", "Bots not marked unhealthy");
    bots_cooling_down_ = plain_gauge("chatvault_bots_cooling_down",
                                     "Healthy bots inside a rate-limit cooldown");

    upload_duration_ = duration_histogram("chatvault_upload_duration_seconds",
                                          "Upload workflow duration in seconds", 1800);
    download_duration_ = duration_histogram("chatvault_download_duration_seconds",
                                            "Download workflow duration in seconds", 600);
}

MetricsExporter::~MetricsExporter() {
    stop();
}

MetricsExporter::ResultCounters MetricsExporter::result_counters(
    const std::string& name, const std::string& help,
    std::initializer_list<const char*> results) {
    auto& family = prometheus::BuildCounter()
        .Name(name)
        .Help(help)
        .Labels(labels_)
        .Register(*registry_);

    ResultCounters counters;
    for (std::string_view result : results) {
        auto* counter = &family.Add({{"result", std::string(result)}});
        if (result == "success") counters.success = counter;
        else if (result == "failure") counters.failure = counter;
        else if (result == "cancelled") counters.cancelled = counter;
        else if (result == "partial") counters.partial = counter;
    }
    return counters;
}

prometheus::Counter* MetricsExporter::plain_counter(const std::string& name,
                                                    const std::string& help) {
    return &prometheus::BuildCounter()
        .Name(name)
        .Help(help)
        .Labels(labels_)
        .Register(*registry_)
        .Add({});
}

prometheus::Gauge* MetricsExporter::plain_gauge(const std::string& name,
                                                const std::string& help) {
    return &prometheus::BuildGauge()
        .Name(name)
        .Help(help)
        .Labels(labels_)
        .Register(*registry_)
        .Add({});
}

// Roughly logarithmic buckets from 100 ms up to max_bucket seconds
prometheus::Histogram* MetricsExporter::duration_histogram(const std::string& name,
                                                           const std::string& help,
                                                           double max_bucket) {
    prometheus::Histogram::BucketBoundaries buckets;
    for (double b : {0.1, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0, 60.0, 120.0, 300.0, 600.0, 1800.0}) {
        if (b > max_bucket) break;
        buckets.push_back(b);
    }
    return &prometheus::BuildHistogram()
        .Name(name)
        .Help(help)
        .Labels(labels_)
        .Register(*registry_)
        .Add({}, buckets);
}

void MetricsExporter::set_pool(const BotPool* pool) {
    std::lock_guard lock(pool_mutex_);
    pool_ = pool;
}

void MetricsExporter::start() {
    std::lock_guard lock(state_mutex_);
    if (running_) return;
    running_ = true;
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    {
        std::lock_guard lock(state_mutex_);
        if (!running_) return;
        running_ = false;
    }
    wake_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();
    write_file();
}

void MetricsExporter::writer_loop() {
    std::unique_lock lock(state_mutex_);
    while (!wake_.wait_for(lock, write_interval_, [this] { return !running_; })) {
        lock.unlock();
        write_file();
        lock.lock();
    }
}

void MetricsExporter::sample_pool() {
    std::lock_guard lock(pool_mutex_);
    if (!pool_) return;

    auto now = pool_->now();
    auto entries = pool_->snapshot();
    size_t healthy = 0;
    size_t cooling = 0;
    for (const auto& entry : entries) {
        if (!entry.healthy) continue;
        ++healthy;
        if (entry.cooldown_until > now) ++cooling;
    }
    bots_total_->Set(static_cast<double>(entries.size()));
    bots_healthy_->Set(static_cast<double>(healthy));
    bots_cooling_down_->Set(static_cast<double>(cooling));
}

bool MetricsExporter::write_file() {
    sample_pool();
    std::string text = prometheus::TextSerializer().Serialize(registry_->Collect());

    // Staged, then renamed over the previous snapshot
    auto staging = prom_file_path_;
    staging += ".tmp";
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out || !out.write(text.data(), static_cast<std::streamsize>(text.size()))) {
            log_warn("Cannot write metrics file %s", staging.c_str());
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot rename %s to %s: %s", staging.c_str(), prom_file_path_.c_str(),
                 ec.message().c_str());
        std::filesystem::remove(staging, ec);
        return false;
    }
    return true;
}

}  // namespace chatvault
