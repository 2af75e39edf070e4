#include "chatvault/vault_config.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <set>
#include <stdexcept>

namespace chatvault {

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "botapi") {
        if (params.count("api_url") == 0 || params.at("api_url").empty())
            return "botapi backend requires 'api_url'";
    } else if (type == "local") {
        if (params.count("path") == 0 || params.at("path").empty())
            return "local backend requires 'path'";
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

// --- Helpers ---

namespace {

std::optional<std::vector<BotCredential>> bots_from_json(const nlohmann::json& j) {
    if (!j.is_array()) return std::nullopt;

    std::vector<BotCredential> bots;
    for (const auto& item : j) {
        if (!item.is_object() || !item.contains("bot_id") || !item.contains("token")) {
            return std::nullopt;
        }
        BotCredential cred;
        const auto& id = item["bot_id"];
        if (id.is_string()) {
            cred.bot_id = id.get<std::string>();
        } else if (id.is_number_integer()) {
            cred.bot_id = std::to_string(id.get<int64_t>());
        } else {
            return std::nullopt;
        }
        if (!item["token"].is_string()) return std::nullopt;
        cred.token = item["token"].get<std::string>();
        bots.push_back(std::move(cred));
    }
    return bots;
}

// Throws std::out_of_range rather than wrapping
uint64_t mib_to_bytes(uint64_t mib) {
    constexpr uint64_t MIB = 1024ULL * 1024;
    if (mib > std::numeric_limits<uint64_t>::max() / MIB) {
        throw std::out_of_range("segment size of " + std::to_string(mib) + " MiB");
    }
    return mib * MIB;
}

bool parse_bool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

void print_usage() {
    std::cerr <<
        "Usage: chatvault [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  upload <local-file> <remote-path>     Upload a file\n"
        "  download <remote-path|id> <local-file> Download a file\n"
        "  list [prefix]                         List files (\"root\" or empty lists all)\n"
        "  rename <id> <new-path>                Change the logical path of a file\n"
        "  delete <id>                           Remove a file and its remote messages\n"
        "  stat <remote-path|id>                 Show a file record and its segments\n"
        "  bots                                  Show the bot pool\n"
        "\n"
        "Remote:\n"
        "  --backend <botapi|local>              Message backend (default: botapi)\n"
        "  --api-url <url>                       Bot API server (default: http://localhost:8081)\n"
        "  --local-path <path>                   Root directory for the local backend\n"
        "  --chat-id <id>                        Chat that stores the segments\n"
        "  --bot <id>=<token> | <token>          Add a bot credential (repeatable)\n"
        "  --ca-cert <path>                      CA certificate for SSL\n"
        "  --no-verify-ssl                       Skip SSL verification\n"
        "\n"
        "Options:\n"
        "  --config <path>                       JSON config file\n"
        "  --metadata-db <path>                  SQLite metadata database (default: chatvault.db)\n"
        "  --segment-mb <N>                      Segment size in MiB (default: 256, max 2000)\n"
        "  --segment-bytes <N>                   Segment size in bytes\n"
        "  --fan-out <N>                         Segments in flight per upload (default: 3)\n"
        "  --worker-threads <N>                  Shared worker threads (default: 12)\n"
        "  --delete-concurrency <N>              Deletes in flight per delete (default: 12)\n"
        "  --read-ahead <N>                      Segments fetched ahead per download (default: 2)\n"
        "  --per-bot-in-flight <N>               Backend calls in flight per bot, 0 = no cap (default: 3)\n"
        "  --failure-threshold <N>               Failures before a bot is disabled (default: 3)\n"
        "  --usage-window <secs>                 Reset usage counters every N secs (default: never)\n"
        "  --max-pool-wait <secs>                Longest wait for a cooling bot (default: 60)\n"
        "  --max-rate-limit-switches <N>         Bot switches per segment (default: 8)\n"
        "  --max-link-refreshes <N>              Link re-resolutions per segment (default: 3)\n"
        "  --delete-attempts <N>                 Attempts per segment delete (default: 3)\n"
        "  --request-timeout <secs>              HTTP request timeout (default: 600)\n"
        "  --metrics-file <path>                 Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>             Metrics write interval (default: 15)\n"
        "  --log-file <path>                     Log file path\n"
        "  --verbose                             Verbose output\n"
        "  --help                                Show this help\n"
        "\n"
        "Environment:\n"
        "  CHATVAULT_METADATA_DB, CHATVAULT_API_URL, CHATVAULT_CHAT_ID,\n"
        "  CHATVAULT_BOTS_JSON ([{\"bot_id\":..,\"token\":..}]), or CHATVAULT_BOT_ID + CHATVAULT_BOT_TOKEN\n";
}

}  // namespace

std::optional<std::vector<BotCredential>> parse_bots_json(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    return bots_from_json(j);
}

std::optional<BotCredential> parse_bot_flag(const std::string& value) {
    auto eq = value.find('=');
    if (eq != std::string::npos) {
        if (eq == 0 || eq + 1 >= value.size()) return std::nullopt;
        return BotCredential{value.substr(0, eq), value.substr(eq + 1)};
    }
    auto colon = value.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= value.size()) {
        return std::nullopt;
    }
    return BotCredential{value.substr(0, colon), value};
}

std::string mask_secret(const std::string& secret) {
    if (secret.size() <= 4) return std::string(secret.size(), '*');
    return secret.substr(0, 4) + std::string(secret.size() - 4, '*');
}

// --- VaultConfig ---

std::optional<VaultConfig> VaultConfig::from_args(int argc, char* argv[]) {
    VaultConfig config;

    // JSON and environment sit below the command line, so load them first
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            if (!config.load_json(argv[i + 1])) return std::nullopt;
            break;
        }
    }
    if (!config.load_env()) return std::nullopt;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    bool cli_bots = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--config") {
                if (!next_arg(i, "--config")) return std::nullopt;  // already loaded
            } else if (arg == "--backend") {
                auto* v = next_arg(i, "--backend");
                if (!v) return std::nullopt;
                config.backend.type = v;
            } else if (arg == "--api-url") {
                auto* v = next_arg(i, "--api-url");
                if (!v) return std::nullopt;
                config.backend.params["api_url"] = v;
            } else if (arg == "--local-path") {
                auto* v = next_arg(i, "--local-path");
                if (!v) return std::nullopt;
                config.backend.params["path"] = v;
            } else if (arg == "--ca-cert") {
                auto* v = next_arg(i, "--ca-cert");
                if (!v) return std::nullopt;
                config.backend.params["ca_cert_path"] = v;
            } else if (arg == "--no-verify-ssl") {
                config.backend.params["verify_ssl"] = "false";
            } else if (arg == "--chat-id") {
                auto* v = next_arg(i, "--chat-id");
                if (!v) return std::nullopt;
                config.chat_id = v;
            } else if (arg == "--bot") {
                auto* v = next_arg(i, "--bot");
                if (!v) return std::nullopt;
                auto cred = parse_bot_flag(v);
                if (!cred) {
                    std::cerr << "Error: --bot expects <id>=<token> or a Bot API token\n";
                    return std::nullopt;
                }
                // Bots given on the command line replace configured ones
                if (!cli_bots) {
                    config.bots.clear();
                    cli_bots = true;
                }
                config.bots.push_back(*cred);
            } else if (arg == "--metadata-db") {
                auto* v = next_arg(i, "--metadata-db");
                if (!v) return std::nullopt;
                config.metadata_db = v;
            } else if (arg == "--segment-mb") {
                auto* v = next_arg(i, "--segment-mb");
                if (!v) return std::nullopt;
                config.max_segment_bytes = mib_to_bytes(std::stoull(v));
            } else if (arg == "--segment-bytes") {
                auto* v = next_arg(i, "--segment-bytes");
                if (!v) return std::nullopt;
                config.max_segment_bytes = std::stoull(v);
            } else if (arg == "--fan-out") {
                auto* v = next_arg(i, "--fan-out");
                if (!v) return std::nullopt;
                config.segment_fan_out = std::stoull(v);
            } else if (arg == "--worker-threads") {
                auto* v = next_arg(i, "--worker-threads");
                if (!v) return std::nullopt;
                config.worker_threads = std::stoull(v);
            } else if (arg == "--delete-concurrency") {
                auto* v = next_arg(i, "--delete-concurrency");
                if (!v) return std::nullopt;
                config.delete_concurrency = std::stoull(v);
            } else if (arg == "--read-ahead") {
                auto* v = next_arg(i, "--read-ahead");
                if (!v) return std::nullopt;
                config.download_read_ahead = std::stoull(v);
            } else if (arg == "--per-bot-in-flight") {
                auto* v = next_arg(i, "--per-bot-in-flight");
                if (!v) return std::nullopt;
                config.max_per_bot_in_flight = std::stoull(v);
            } else if (arg == "--failure-threshold") {
                auto* v = next_arg(i, "--failure-threshold");
                if (!v) return std::nullopt;
                config.failure_threshold = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--usage-window") {
                auto* v = next_arg(i, "--usage-window");
                if (!v) return std::nullopt;
                config.usage_window_secs = std::stoull(v);
            } else if (arg == "--max-pool-wait") {
                auto* v = next_arg(i, "--max-pool-wait");
                if (!v) return std::nullopt;
                config.max_pool_wait_secs = std::stoull(v);
            } else if (arg == "--max-rate-limit-switches") {
                auto* v = next_arg(i, "--max-rate-limit-switches");
                if (!v) return std::nullopt;
                config.max_rate_limit_switches = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--max-link-refreshes") {
                auto* v = next_arg(i, "--max-link-refreshes");
                if (!v) return std::nullopt;
                config.max_link_refreshes = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--delete-attempts") {
                auto* v = next_arg(i, "--delete-attempts");
                if (!v) return std::nullopt;
                config.delete_max_attempts = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout_secs = std::stoull(v);
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else if (config.command.empty()) {
                config.command = arg;
            } else {
                config.command_args.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool VaultConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("metadata_db")) metadata_db = j["metadata_db"].get<std::string>();
        if (j.contains("chat_id")) {
            const auto& c = j["chat_id"];
            chat_id = c.is_string() ? c.get<std::string>() : std::to_string(c.get<int64_t>());
        }
        if (j.contains("max_segment_bytes")) max_segment_bytes = j["max_segment_bytes"].get<uint64_t>();
        if (j.contains("max_segment_mb"))
            max_segment_bytes = mib_to_bytes(j["max_segment_mb"].get<uint64_t>());
        if (j.contains("segment_fan_out")) segment_fan_out = j["segment_fan_out"].get<size_t>();
        if (j.contains("worker_threads")) worker_threads = j["worker_threads"].get<size_t>();
        if (j.contains("delete_concurrency")) delete_concurrency = j["delete_concurrency"].get<size_t>();
        if (j.contains("download_read_ahead"))
            download_read_ahead = j["download_read_ahead"].get<size_t>();
        if (j.contains("max_per_bot_in_flight"))
            max_per_bot_in_flight = j["max_per_bot_in_flight"].get<size_t>();
        if (j.contains("failure_threshold")) failure_threshold = j["failure_threshold"].get<uint32_t>();
        if (j.contains("usage_window_secs")) usage_window_secs = j["usage_window_secs"].get<uint64_t>();
        if (j.contains("max_pool_wait_secs")) max_pool_wait_secs = j["max_pool_wait_secs"].get<uint64_t>();
        if (j.contains("max_rate_limit_switches"))
            max_rate_limit_switches = j["max_rate_limit_switches"].get<uint32_t>();
        if (j.contains("max_link_refreshes")) max_link_refreshes = j["max_link_refreshes"].get<uint32_t>();
        if (j.contains("delete_max_attempts")) delete_max_attempts = j["delete_max_attempts"].get<uint32_t>();
        if (j.contains("request_timeout_secs"))
            request_timeout_secs = j["request_timeout_secs"].get<uint64_t>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval_secs"))
            metrics_interval_secs = j["metrics_interval_secs"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();

        if (j.contains("backend") && j["backend"].is_object()) {
            auto& jb = j["backend"];
            if (jb.contains("type")) backend.type = jb["type"].get<std::string>();
            for (auto& [key, val] : jb.items()) {
                if (key == "type") continue;
                if (val.is_string()) {
                    backend.params[key] = val.get<std::string>();
                } else if (val.is_boolean()) {
                    backend.params[key] = val.get<bool>() ? "true" : "false";
                } else {
                    backend.params[key] = val.dump();
                }
            }
        }

        if (j.contains("bots")) {
            auto parsed = bots_from_json(j["bots"]);
            if (!parsed) {
                std::cerr << "Error parsing config: 'bots' must be an array of {bot_id, token}\n";
                return false;
            }
            bots = std::move(*parsed);
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

bool VaultConfig::load_env() {
    if (const char* v = std::getenv("CHATVAULT_METADATA_DB")) metadata_db = v;
    if (const char* v = std::getenv("CHATVAULT_API_URL")) backend.params["api_url"] = v;
    if (const char* v = std::getenv("CHATVAULT_CHAT_ID")) chat_id = v;

    if (const char* v = std::getenv("CHATVAULT_BOTS_JSON")) {
        auto parsed = parse_bots_json(v);
        if (!parsed) {
            std::cerr << "Error: CHATVAULT_BOTS_JSON must be a JSON array of {bot_id, token}\n";
            return false;
        }
        bots = std::move(*parsed);
    } else {
        const char* id = std::getenv("CHATVAULT_BOT_ID");
        const char* token = std::getenv("CHATVAULT_BOT_TOKEN");
        if (id && token) {
            bots = {BotCredential{id, token}};
        }
    }
    return true;
}

void VaultConfig::apply_defaults() {
    if (metadata_db.empty()) {
        metadata_db = "chatvault.db";
    }
    if (backend.type == "botapi") {
        if (backend.params.count("api_url") == 0 || backend.params["api_url"].empty()) {
            backend.params["api_url"] = constants::DEFAULT_API_URL;
        }
        backend.params["request_timeout"] = std::to_string(request_timeout_secs);
    }
    if (worker_threads == 0) worker_threads = 1;
    if (delete_concurrency == 0) delete_concurrency = 1;
    if (download_read_ahead == 0) download_read_ahead = 1;
}

std::string VaultConfig::validate() const {
    if (metadata_db.empty()) return "metadata_db is required (--metadata-db)";
    auto err = backend.validate();
    if (!err.empty()) return "backend: " + err;
    if (chat_id.empty()) return "chat_id is required (--chat-id or CHATVAULT_CHAT_ID)";
    if (bots.empty()) return "at least one bot is required (--bot or CHATVAULT_BOTS_JSON)";

    std::set<std::string> seen;
    for (const auto& bot : bots) {
        if (bot.bot_id.empty()) return "bot with empty bot_id";
        if (bot.token.empty()) return "bot " + bot.bot_id + " has an empty token";
        if (!seen.insert(bot.bot_id).second) return "duplicate bot_id: " + bot.bot_id;
    }

    if (max_segment_bytes == 0) return "max_segment_bytes must be > 0";
    if (max_segment_bytes > constants::MAX_SEGMENT_BYTES_CEILING)
        return "max_segment_bytes must be <= 2000 MiB";
    if (segment_fan_out == 0) return "segment_fan_out must be >= 1";
    if (failure_threshold == 0) return "failure_threshold must be >= 1";
    if (delete_max_attempts == 0) return "delete_max_attempts must be >= 1";
    return {};
}

}  // namespace chatvault
