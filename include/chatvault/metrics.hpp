#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace chatvault {

class BotPool;

/// Observes the elapsed wall time into a histogram when it goes out of scope.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        std::chrono::duration<double> seconds = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(seconds.count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Workflow counters and bot gauges, published as a Prometheus textfile
/// (node_exporter textfile collector format).
///
/// The file is replaced atomically every `write_interval` by a background
/// thread once start() is called; write_file() can also be called directly.
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Pool sampled for the bot gauges (not owned). May be null.
    void set_pool(const BotPool* pool);

    void start();

    /// Joins the writer thread. If it was running, one last snapshot is written.
    void stop();

    bool write_file();

    prometheus::Counter& uploads_success() { return *uploads_.success; }
    prometheus::Counter& uploads_failure() { return *uploads_.failure; }
    prometheus::Counter& uploads_cancelled() { return *uploads_.cancelled; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_; }
    prometheus::Counter& downloads_success() { return *downloads_.success; }
    prometheus::Counter& downloads_failure() { return *downloads_.failure; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_; }
    prometheus::Counter& deletes_success() { return *deletes_.success; }
    prometheus::Counter& deletes_partial() { return *deletes_.partial; }
    prometheus::Counter& deletes_failure() { return *deletes_.failure; }
    prometheus::Counter& segments_uploaded_total() { return *segments_uploaded_; }
    prometheus::Counter& rate_limited_total() { return *rate_limited_; }
    prometheus::Counter& compensations_success() { return *compensations_.success; }
    prometheus::Counter& compensations_failure() { return *compensations_.failure; }

    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& download_duration() { return *download_duration_; }

private:
    // One counter family split by a "result" label; unused results stay null
    struct ResultCounters {
        prometheus::Counter* success = nullptr;
        prometheus::Counter* failure = nullptr;
        prometheus::Counter* cancelled = nullptr;
        prometheus::Counter* partial = nullptr;
    };

    ResultCounters result_counters(const std::string& name, const std::string& help,
                                   std::initializer_list<const char*> results);
    prometheus::Counter* plain_counter(const std::string& name, const std::string& help);
    prometheus::Gauge* plain_gauge(const std::string& name, const std::string& help);
    prometheus::Histogram* duration_histogram(const std::string& name, const std::string& help,
                                              double max_bucket);

    void writer_loop();
    void sample_pool();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;
    std::map<std::string, std::string> labels_;
    std::shared_ptr<prometheus::Registry> registry_;

    std::mutex pool_mutex_;
    const BotPool* pool_ = nullptr;

    ResultCounters uploads_;
    ResultCounters downloads_;
    ResultCounters deletes_;
    ResultCounters compensations_;
    prometheus::Counter* upload_bytes_ = nullptr;
    prometheus::Counter* download_bytes_ = nullptr;
    prometheus::Counter* segments_uploaded_ = nullptr;
    prometheus::Counter* rate_limited_ = nullptr;

    prometheus::Gauge* bots_total_ = nullptr;
    prometheus::Gauge* bots_healthy_ = nullptr;
    prometheus::Gauge* bots_cooling_down_ = nullptr;

    prometheus::Histogram* upload_duration_ = nullptr;
    prometheus::Histogram* download_duration_ = nullptr;

    std::thread writer_thread_;
    std::mutex state_mutex_;
    std::condition_variable wake_;
    bool running_ = false;
};

}  // namespace chatvault
