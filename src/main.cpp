#include "chatvault/bot_pool.hpp"
#include "chatvault/log.hpp"
#include "chatvault/metrics.hpp"
#include "chatvault/vault.hpp"
#include "chatvault/vault_config.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace {

volatile std::sig_atomic_t g_cancel_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_cancel_requested = 1;
}

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_PARTIAL_DELETE = 2;

std::string format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

bool is_secret_key(const std::string& key) {
    return key.find("key") != std::string::npos || key.find("secret") != std::string::npos ||
           key.find("token") != std::string::npos || key.find("credential") != std::string::npos;
}

void print_banner(const chatvault::VaultConfig& config) {
    std::cout << "chatvault starting..." << std::endl;
    std::cout << "  metadata-db: " << config.metadata_db << std::endl;
    std::cout << "  backend-type: " << config.backend.type << std::endl;
    for (auto& [k, v] : config.backend.params) {
        std::cout << "  backend-" << k << ": " << (is_secret_key(k) ? "****" : v) << std::endl;
    }
    std::cout << "  chat-id: " << config.chat_id << std::endl;
    for (const auto& bot : config.bots) {
        std::cout << "  bot " << bot.bot_id << ": " << chatvault::mask_secret(bot.token) << std::endl;
    }
    std::cout << "  segment-size: " << (config.max_segment_bytes / (1024 * 1024)) << " MiB" << std::endl;
    std::cout << "  fan-out: " << config.segment_fan_out << std::endl;
    std::cout << "  worker-threads: " << config.worker_threads << std::endl;
    std::cout << "  read-ahead: " << config.download_read_ahead << std::endl;
    std::cout << "  per-bot-in-flight: " << config.max_per_bot_in_flight << std::endl;
}

// Prints coarse progress to stdout in verbose mode
chatvault::ProgressCallback progress_printer() {
    if (!chatvault::is_verbose()) return nullptr;
    return [](const chatvault::TransferEvent& ev) {
        if (ev.phase != chatvault::TransferPhase::SegmentDone) return;
        if (ev.total_segments > 0) {
            chatvault::log_debug("  %s: segment %u/%u, %llu bytes", ev.path.c_str(), ev.segments_done,
                                 ev.total_segments, static_cast<unsigned long long>(ev.bytes_done));
        } else {
            chatvault::log_debug("  %s: segment %u, %llu bytes", ev.path.c_str(), ev.segments_done,
                                 static_cast<unsigned long long>(ev.bytes_done));
        }
    };
}

int report_error(const char* what, const chatvault::VaultError& error) {
    std::cerr << what << " failed: " << error.to_string() << std::endl;
    return error.code == chatvault::VaultErrorCode::PartialDelete ? EXIT_PARTIAL_DELETE : EXIT_ERROR;
}

int usage_error(const std::string& message) {
    std::cerr << "Error: " << message << " (see --help)" << std::endl;
    return EXIT_ERROR;
}

int run_command(chatvault::Vault& vault, const chatvault::VaultConfig& config,
                const chatvault::CancellationToken& cancel) {
    const auto& cmd = config.command;
    const auto& args = config.command_args;

    if (cmd == "upload") {
        if (args.size() != 2) return usage_error("upload needs <local-file> <remote-path>");
        std::ifstream in(args[0], std::ios::binary);
        if (!in) return usage_error("cannot open " + args[0]);

        chatvault::UploadOptions options;
        options.cancel = &cancel;
        options.on_progress = progress_printer();
        auto result = vault.upload(in, args[1], options);
        if (!result.success) return report_error("upload", result.error);

        std::cout << result.record.id << "  " << result.record.path << "  "
                  << result.record.size_bytes << " bytes  " << result.record.segments.size()
                  << " segment(s)  sha256:" << result.record.digest << std::endl;
        return EXIT_OK;
    }

    if (cmd == "download") {
        if (args.size() != 2) return usage_error("download needs <remote-path|id> <local-file>");

        chatvault::DownloadOptions options;
        options.cancel = &cancel;
        options.on_progress = progress_printer();
        auto result = vault.download_to_file(args[0], args[1], options);
        if (!result.success) return report_error("download", result.error);

        std::cout << result.file_id << "  " << result.path << " -> " << args[1] << "  "
                  << result.bytes_written << " bytes" << std::endl;
        return EXIT_OK;
    }

    if (cmd == "list") {
        if (args.size() > 1) return usage_error("list takes at most one prefix");
        auto result = vault.list(args.empty() ? std::string() : args[0]);
        if (!result.success) return report_error("list", result.error);

        for (const auto& entry : result.entries) {
            std::cout << entry.id << "  " << format_time(entry.created_at) << "  "
                      << entry.size_bytes << "  " << entry.segment_count << "  " << entry.path
                      << std::endl;
        }
        return EXIT_OK;
    }

    if (cmd == "rename") {
        if (args.size() != 2) return usage_error("rename needs <id> <new-path>");
        auto result = vault.rename(args[0], args[1]);
        if (!result.success) return report_error("rename", result.error);
        std::cout << result.record.id << "  " << result.record.path << std::endl;
        return EXIT_OK;
    }

    if (cmd == "delete") {
        if (args.size() != 1) return usage_error("delete needs <id>");
        auto result = vault.remove(args[0]);
        if (!result.success) return report_error("delete", result.error);
        std::cout << "deleted " << result.file_id << " (" << result.segments_deleted
                  << " segment(s) removed)" << std::endl;
        return EXIT_OK;
    }

    if (cmd == "stat") {
        if (args.size() != 1) return usage_error("stat needs <remote-path|id>");
        auto result = vault.stat(args[0]);
        if (!result.success) return report_error("stat", result.error);

        const auto& rec = result.record;
        std::cout << "id:       " << rec.id << "\n"
                  << "path:     " << rec.path << "\n"
                  << "size:     " << rec.size_bytes << "\n"
                  << "sha256:   " << rec.digest << "\n"
                  << "created:  " << format_time(rec.created_at) << "\n";
        if (rec.delete_pending()) std::cout << "state:    delete pending\n";
        for (const auto& seg : rec.segments) {
            std::cout << "  [" << seg.sequence_index << "] bot=" << seg.bot_id
                      << " msg=" << seg.remote_message_id << " " << seg.byte_length << " bytes"
                      << (seg.remote_deleted ? " (deleted)" : "") << "\n";
        }
        std::cout << std::flush;
        return EXIT_OK;
    }

    if (cmd == "bots") {
        auto& pool = vault.pool();
        auto now = pool.now();
        for (const auto& entry : pool.snapshot()) {
            std::string state = entry.healthy ? "healthy" : "unhealthy";
            if (entry.healthy && entry.cooldown_until > now) {
                auto secs = std::chrono::duration_cast<std::chrono::seconds>(entry.cooldown_until - now);
                state = "cooling down " + std::to_string(secs.count()) + "s";
            }
            std::cout << entry.bot_id << "  " << chatvault::mask_secret(entry.credential_token)
                      << "  usage=" << entry.usage_counter << "  failures="
                      << entry.consecutive_failures << "  " << state << std::endl;
        }
        return EXIT_OK;
    }

    return usage_error(cmd.empty() ? "no command given" : "unknown command: " + cmd);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = chatvault::VaultConfig::from_args(argc, argv);
    if (!config_opt) {
        return EXIT_ERROR;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return EXIT_ERROR;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        if (config.log_file.has_parent_path()) {
            std::filesystem::create_directories(config.log_file.parent_path(), ec);
        }
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Cannot open log file " << config.log_file << std::endl;
            return EXIT_ERROR;
        }
        dup2(fileno(log), STDOUT_FILENO);
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    chatvault::set_verbose(config.verbose);
    if (config.verbose) {
        print_banner(config);
    }

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::unique_ptr<chatvault::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<chatvault::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"chat_id", config.chat_id}});
    }

    chatvault::Vault vault(config);
    vault.set_metrics(metrics.get());

    err = vault.start();
    if (!err.empty()) {
        std::cerr << "Failed to start vault: " << err << std::endl;
        return EXIT_ERROR;
    }
    if (metrics) metrics->start();

    // Forward SIGINT/SIGTERM to the running workflow outside signal context
    chatvault::CancellationToken cancel;
    std::atomic<bool> done{false};
    std::thread signal_watcher([&] {
        while (!done.load()) {
            if (g_cancel_requested) {
                cancel.cancel();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    int rc = run_command(vault, config, cancel);

    done = true;
    signal_watcher.join();

    vault.stop();
    if (metrics) metrics->stop();
    return rc;
}
