#pragma once

#include "chatvault/bot_pool.hpp"
#include "chatvault/constants.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chatvault {

/// Configuration for the message backend ("botapi" or "local").
struct BackendConfig {
    std::string type = "botapi";
    std::map<std::string, std::string> params;  // Passed to MessageBackendFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for a Vault and the chatvault CLI.
///
/// Sources in increasing precedence: defaults, JSON file (--config),
/// environment (CHATVAULT_*), command line flags.
struct VaultConfig {
    // Metadata database (SQLite)
    std::filesystem::path metadata_db;

    // Remote side
    BackendConfig backend;
    std::string chat_id;
    std::vector<BotCredential> bots;

    // Chunking
    uint64_t max_segment_bytes = constants::DEFAULT_SEGMENT_BYTES;

    // Concurrency
    size_t segment_fan_out = constants::DEFAULT_SEGMENT_FAN_OUT;
    size_t worker_threads = constants::DEFAULT_WORKER_THREADS;
    size_t delete_concurrency = constants::DEFAULT_DELETE_CONCURRENCY;
    size_t download_read_ahead = constants::DEFAULT_DOWNLOAD_READ_AHEAD;  // segments buffered ahead
    size_t max_per_bot_in_flight = constants::DEFAULT_MAX_PER_BOT_IN_FLIGHT;  // 0 = no cap

    // Bot pool policy
    uint32_t failure_threshold = constants::DEFAULT_FAILURE_THRESHOLD;
    uint64_t usage_window_secs = 0;  // 0 = usage counters never reset
    uint64_t max_pool_wait_secs = constants::DEFAULT_MAX_POOL_WAIT_SECONDS;
    uint32_t max_rate_limit_switches = constants::DEFAULT_MAX_RATE_LIMIT_SWITCHES;

    // Transport policy
    uint32_t max_link_refreshes = constants::DEFAULT_MAX_LINK_REFRESHES;
    uint32_t delete_max_attempts = constants::DEFAULT_DELETE_MAX_ATTEMPTS;
    uint64_t request_timeout_secs = constants::DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    bool verbose = false;
    std::filesystem::path log_file;

    // CLI command and its positional arguments
    std::string command;
    std::vector<std::string> command_args;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<VaultConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Overlay CHATVAULT_* environment variables.
    bool load_env();

    /// Fill in defaults that depend on other fields.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

/// Parse a JSON array of {"bot_id": ..., "token": ...} objects.
/// bot_id may be a string or a number. Returns nullopt on malformed input.
std::optional<std::vector<BotCredential>> parse_bots_json(const std::string& text);

/// "<bot_id>=<token>", or a bare Bot API token "123456:ABC..." whose bot id
/// is the part before the first ':'.
std::optional<BotCredential> parse_bot_flag(const std::string& value);

/// Mask a secret for display: keep the first 4 characters.
std::string mask_secret(const std::string& secret);

}  // namespace chatvault
