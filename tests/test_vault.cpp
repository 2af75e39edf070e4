// Test suite for chatvault.
//
// Tests:
//   1. Digest: known vectors, streaming, finalize semantics
//   2. Logical paths and file ids
//   3. VaultConfig: CLI, JSON, environment, defaults, validation
//   4. BotPool: fairness, tie-break, cooldown, exhaustion, health threshold
//   5. ThreadPool
//   6. SqliteMetadataStore
//   7. TransportClient against the local backend (link expiry, idempotent delete)
//      and Bot API reply classification (429 retry_after)
//   8. Vault workflows with the local backend:
//      - Round trips at 0 B, 1 B, one segment, several segments
//      - Upload atomicity and compensation (segment failure, commit failure, cancel)
//      - Rate-limit bot switching, transient retry, pool exhaustion
//      - Integrity violation on tampered segments, download_to_file cleanup
//      - Rename, list by prefix, stat, path conflicts
//      - Partial delete and retry
//   9. Metrics textfile

#include "chatvault/bot_pool.hpp"
#include "chatvault/digest.hpp"
#include "chatvault/file_record.hpp"
#include "chatvault/http_client.hpp"
#include "chatvault/message_backend.hpp"
#include "chatvault/metadata_store.hpp"
#include "chatvault/metrics.hpp"
#include "chatvault/thread_pool.hpp"
#include "chatvault/transport_client.hpp"
#include "chatvault/vault.hpp"
#include "chatvault/vault_config.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace chatvault;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), std::string(msg) + ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

#define ASSERT_CODE(err, expected, msg)                               \
    do {                                                              \
        const VaultError vault_err_ = (err);                          \
        ASSERT_EQ(std::string(error_code_to_string(vault_err_.code)), \
                  std::string(error_code_to_string(expected)),        \
                  std::string(msg) + " [" + vault_err_.to_string() + "]"); \
    } while (0)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

static std::span<const uint8_t> as_bytes(const std::string& s) {
    return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

/// Deterministic pseudo-random content.
static std::string make_data(size_t size, uint32_t seed = 1) {
    std::string out(size, '\0');
    uint32_t x = seed * 2654435761u + 1;
    for (size_t i = 0; i < size; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        out[i] = static_cast<char>(x & 0xFF);
    }
    return out;
}

/// Manually advanced steady clock for the bot pool.
struct SimClock {
    std::shared_ptr<std::atomic<int64_t>> ms = std::make_shared<std::atomic<int64_t>>(0);

    BotPool::Clock clock() const {
        auto counter = ms;
        return [counter] {
            return std::chrono::steady_clock::time_point(std::chrono::hours(1)) +
                   std::chrono::milliseconds(counter->load());
        };
    }
    void advance(std::chrono::milliseconds d) { ms->fetch_add(d.count()); }
};

/// Wraps a real backend; hooks can replace any call's result.
/// Hooks receive the 1-based call number of that operation.
class FlakyBackend : public MessageBackend {
public:
    explicit FlakyBackend(std::unique_ptr<MessageBackend> inner) : inner_(std::move(inner)) {}

    std::function<std::optional<SendResult>(int, const std::string& token)> on_send;
    std::function<std::optional<LinkResult>(int)> on_resolve;
    std::function<std::optional<FetchResult>(int)> on_fetch;
    std::function<std::optional<DeleteResult>(int, int64_t message_id)> on_delete;

    std::atomic<int> send_calls{0};
    std::atomic<int> resolve_calls{0};
    std::atomic<int> fetch_calls{0};
    std::atomic<int> delete_calls{0};

    std::string type_name() const override { return "flaky"; }

    SendResult send_document(const std::string& token, const std::string& chat_id,
                             const std::string& file_name,
                             std::span<const uint8_t> data) override {
        int n = ++send_calls;
        if (on_send) {
            if (auto r = on_send(n, token)) return *r;
        }
        return inner_->send_document(token, chat_id, file_name, data);
    }

    LinkResult resolve_file(const std::string& token, const std::string& file_token) override {
        int n = ++resolve_calls;
        if (on_resolve) {
            if (auto r = on_resolve(n)) return *r;
        }
        return inner_->resolve_file(token, file_token);
    }

    FetchResult fetch(const std::string& url, uint64_t offset, uint64_t length) override {
        int n = ++fetch_calls;
        if (on_fetch) {
            if (auto r = on_fetch(n)) return *r;
        }
        return inner_->fetch(url, offset, length);
    }

    DeleteResult delete_message(const std::string& token, const std::string& chat_id,
                                int64_t message_id) override {
        int n = ++delete_calls;
        if (on_delete) {
            if (auto r = on_delete(n, message_id)) return *r;
        }
        return inner_->delete_message(token, chat_id, message_id);
    }

    bool is_healthy() const override { return inner_->is_healthy(); }

private:
    std::unique_ptr<MessageBackend> inner_;
};

/// Wraps a real store; flags make individual operations unavailable.
class FailingStore : public MetadataStore {
public:
    explicit FailingStore(std::unique_ptr<MetadataStore> inner) : inner_(std::move(inner)) {}

    std::atomic<bool> fail_insert{false};
    std::atomic<bool> fail_reads{false};

    std::string type_name() const override { return "failing"; }

    StoreWrite insert(const FileRecord& record) override {
        if (fail_insert) return StoreWrite{StoreStatus::Unavailable, "database is locked"};
        return inner_->insert(record);
    }
    RecordLookup get(const std::string& id) override {
        if (fail_reads) return RecordLookup{StoreStatus::Unavailable, {}, "disk I/O error"};
        return inner_->get(id);
    }
    RecordList find_by_path(const std::string& path) override {
        if (fail_reads) return RecordList{StoreStatus::Unavailable, {}, "disk I/O error"};
        return inner_->find_by_path(path);
    }
    SummaryList list(const std::string& prefix) override {
        if (fail_reads) return SummaryList{StoreStatus::Unavailable, {}, "disk I/O error"};
        return inner_->list(prefix);
    }
    StoreWrite update_path(const std::string& id, const std::string& new_path) override {
        return inner_->update_path(id, new_path);
    }
    StoreWrite mark_segments_deleted(const std::string& id,
                                     const std::vector<uint32_t>& indices) override {
        return inner_->mark_segments_deleted(id, indices);
    }
    StoreWrite remove(const std::string& id) override { return inner_->remove(id); }
    bool is_healthy() const override { return inner_->is_healthy(); }

private:
    std::unique_ptr<MetadataStore> inner_;
};

static const std::string CHAT_ID = "-1001234567890";

static VaultConfig make_vault_config(const fs::path& dir, size_t num_bots = 2) {
    VaultConfig cfg;
    cfg.metadata_db = dir / "meta.db";
    cfg.backend.type = "local";
    cfg.backend.params["path"] = (dir / "remote").string();
    cfg.chat_id = CHAT_ID;
    for (size_t i = 1; i <= num_bots; ++i) {
        auto id = std::to_string(i);
        cfg.bots.push_back(BotCredential{id, id + ":AAtoken-" + id});
    }
    cfg.max_segment_bytes = 1024;
    cfg.segment_fan_out = 2;
    cfg.worker_threads = 4;
    cfg.delete_concurrency = 4;
    cfg.max_pool_wait_secs = 0;
    return cfg;
}

/// A started Vault over a local backend and SQLite store, both wrapped.
struct Harness {
    fs::path dir;
    VaultConfig config;
    FlakyBackend* backend = nullptr;
    FailingStore* store = nullptr;
    std::unique_ptr<Vault> vault;

    size_t remote_messages() const {
        size_t n = 0;
        std::error_code ec;
        for (const auto& e : fs::directory_iterator(dir / "remote" / CHAT_ID, ec)) {
            if (e.path().extension() == ".bin") ++n;
        }
        return n;
    }

    fs::path message_path(int64_t message_id) const {
        return dir / "remote" / CHAT_ID / (std::to_string(message_id) + ".bin");
    }
};

static Harness make_harness(const std::string& name, size_t num_bots = 2,
                            const std::function<void(VaultConfig&)>& tweak = nullptr,
                            BotPool::Clock clock = nullptr) {
    Harness h;
    h.dir = make_temp_dir("chatvault-" + name);
    h.config = make_vault_config(h.dir, num_bots);
    if (tweak) tweak(h.config);

    auto flaky = std::make_unique<FlakyBackend>(
        MessageBackendFactory::create_local(h.config.backend.params.at("path")));
    h.backend = flaky.get();

    auto sqlite = std::make_unique<SqliteMetadataStore>(h.config.metadata_db);
    auto err = sqlite->open();
    if (!err.empty()) throw std::runtime_error(err);
    auto store = std::make_unique<FailingStore>(std::move(sqlite));
    h.store = store.get();

    h.vault = std::make_unique<Vault>(h.config, std::move(flaky), std::move(store), std::move(clock));
    err = h.vault->start();
    if (!err.empty()) throw std::runtime_error(err);
    return h;
}

static UploadResult upload_string(Vault& vault, const std::string& data, const std::string& path,
                                  const UploadOptions& options = {}) {
    std::istringstream in(data);
    return vault.upload(in, path, options);
}

static DownloadResult download_string(Vault& vault, const std::string& path_or_id,
                                      std::string& out) {
    out.clear();
    return vault.download(path_or_id, [&out](std::span<const uint8_t> d) {
        out.append(reinterpret_cast<const char*>(d.data()), d.size());
        return true;
    });
}

static SendResult rate_limited_send(std::chrono::milliseconds retry_after) {
    SendResult r;
    r.status = RemoteStatus::RateLimited;
    r.retry_after = retry_after;
    r.error_message = "Too Many Requests: retry after " +
                      std::to_string(retry_after.count() / 1000);
    return r;
}

// ---------------------------------------------------------------------------
// 1. Digest
// ---------------------------------------------------------------------------

static void test_digest() {
    std::cout << "\n=== Digest ===" << std::endl;

    {
        TEST(empty_stream_digest);
        DigestState d;
        ASSERT_EQ(d.finalize(), std::string(EMPTY_SHA256), "empty digest");
        ASSERT_EQ(d.bytes(), 0u, "bytes");
        PASS();
    }
    {
        TEST(known_vector_abc);
        ASSERT_EQ(sha256_hex(as_bytes("abc")),
                  std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"),
                  "sha256(abc)");
        PASS();
    }
    {
        TEST(incremental_matches_one_shot);
        auto data = make_data(100000, 7);
        DigestState d;
        size_t pos = 0;
        size_t step = 1;
        while (pos < data.size()) {
            size_t n = std::min(step, data.size() - pos);
            d.update(data.data() + pos, n);
            pos += n;
            step = step * 3 + 1;
        }
        ASSERT_EQ(d.bytes(), data.size(), "byte count");
        ASSERT_EQ(d.finalize(), sha256_hex(as_bytes(data)), "digest");
        PASS();
    }
    {
        TEST(finalize_is_idempotent);
        DigestState d;
        d.update(as_bytes("hello"));
        auto first = d.finalize();
        ASSERT_EQ(d.finalize(), first, "second finalize");
        ASSERT_TRUE(d.finalized(), "finalized flag");
        PASS();
    }
    {
        TEST(update_after_finalize_throws);
        DigestState d;
        d.finalize();
        bool threw = false;
        try {
            d.update(as_bytes("x"));
        } catch (const std::logic_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "update after finalize should throw");
        PASS();
    }
    {
        TEST(verify_stream_and_buffer);
        auto data = make_data(5000, 3);
        auto hex = sha256_hex(as_bytes(data));
        std::istringstream in(data);
        ASSERT_TRUE(verify_digest(hex, in), "stream verifies");

        std::string upper = hex;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        ASSERT_TRUE(verify_digest(upper, as_bytes(data)), "uppercase verifies");

        data[10] ^= 1;
        ASSERT_TRUE(!verify_digest(hex, as_bytes(data)), "changed byte fails");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Paths and ids
// ---------------------------------------------------------------------------

static void test_paths() {
    std::cout << "\n=== Logical paths ===" << std::endl;

    {
        TEST(normalize_path);
        ASSERT_EQ(normalize_path("a/b/c.bin").value_or("?"), "/a/b/c.bin", "leading slash");
        ASSERT_EQ(normalize_path("//a///b/").value_or("?"), "/a/b", "collapse and strip");
        ASSERT_EQ(normalize_path("/x").value_or("?"), "/x", "already normal");
        ASSERT_TRUE(!normalize_path(""), "empty rejected");
        ASSERT_TRUE(!normalize_path("/"), "root rejected");
        ASSERT_TRUE(!normalize_path("///"), "slashes only rejected");
        ASSERT_TRUE(!normalize_path("/a/../b"), "dotdot rejected");
        ASSERT_TRUE(!normalize_path("/a/./b"), "dot rejected");
        ASSERT_TRUE(!normalize_path(std::string("/a\0b", 4)), "NUL rejected");
        ASSERT_EQ(normalize_path("/a/..b/c.").value_or("?"), "/a/..b/c.", "dots inside names ok");
        PASS();
    }
    {
        TEST(normalize_prefix);
        ASSERT_EQ(normalize_prefix("").value_or("?"), "", "empty");
        ASSERT_EQ(normalize_prefix("/").value_or("?"), "", "slash");
        ASSERT_EQ(normalize_prefix("root").value_or("?"), "", "root keyword");
        ASSERT_EQ(normalize_prefix("docs/").value_or("?"), "/docs", "normalised");
        ASSERT_TRUE(!normalize_prefix("/a/.."), "malformed");
        PASS();
    }
    {
        TEST(path_has_prefix);
        ASSERT_TRUE(path_has_prefix("/docs", "/docs"), "exact");
        ASSERT_TRUE(path_has_prefix("/docs/a/b", "/docs"), "beneath");
        ASSERT_TRUE(!path_has_prefix("/docs2/a", "/docs"), "sibling with same stem");
        ASSERT_TRUE(path_has_prefix("/anything", ""), "empty prefix");
        PASS();
    }
    {
        TEST(file_ids);
        auto a = generate_file_id();
        auto b = generate_file_id();
        ASSERT_TRUE(a != b, "ids differ");
        ASSERT_TRUE(looks_like_file_id(a), "generated id recognised");
        ASSERT_EQ(a[14], '4', "uuid version nibble");
        ASSERT_TRUE(!looks_like_file_id("/docs/report.pdf"), "path is not an id");
        ASSERT_TRUE(!looks_like_file_id("0123"), "short string is not an id");
        PASS();
    }
    {
        TEST(record_name_and_parent);
        FileRecord r;
        r.path = "/a/b/c.bin";
        ASSERT_EQ(r.name(), "c.bin", "name");
        ASSERT_EQ(r.parent(), "/a/b", "parent");
        r.path = "/top";
        ASSERT_EQ(r.parent(), "/", "top-level parent");
        PASS();
    }
    {
        TEST(live_segments_and_delete_pending);
        FileRecord r;
        r.segments.resize(3);
        for (uint32_t i = 0; i < 3; ++i) r.segments[i].sequence_index = i;
        ASSERT_TRUE(!r.delete_pending(), "fresh record");
        r.segments[1].remote_deleted = true;
        ASSERT_TRUE(r.delete_pending(), "pending after partial delete");
        auto live = r.live_segments();
        ASSERT_EQ(live.size(), 2u, "live count");
        ASSERT_EQ(live[1].sequence_index, 2u, "live order");
        PASS();
    }
    {
        TEST(epoch_round_trip);
        auto tp = from_epoch_seconds(1700000000);
        ASSERT_EQ(to_epoch_seconds(tp), 1700000000, "epoch");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. VaultConfig
// ---------------------------------------------------------------------------

static void clear_env() {
    for (const char* name : {"CHATVAULT_METADATA_DB", "CHATVAULT_API_URL", "CHATVAULT_CHAT_ID",
                             "CHATVAULT_BOTS_JSON", "CHATVAULT_BOT_ID", "CHATVAULT_BOT_TOKEN"}) {
        unsetenv(name);
    }
}

static void test_config() {
    std::cout << "\n=== VaultConfig ===" << std::endl;
    clear_env();

    {
        TEST(backend_config_validation);
        BackendConfig b;
        b.type = "botapi";
        ASSERT_NOT_EMPTY(b.validate(), "botapi needs api_url");
        b.params["api_url"] = "http://localhost:8081";
        ASSERT_EMPTY(b.validate(), "botapi with api_url");

        BackendConfig l;
        l.type = "local";
        ASSERT_NOT_EMPTY(l.validate(), "local needs path");
        l.params["path"] = "/tmp/x";
        ASSERT_EMPTY(l.validate(), "local with path");

        BackendConfig bad;
        bad.type = "s3";
        ASSERT_NOT_EMPTY(bad.validate(), "unknown type");
        PASS();
    }
    {
        TEST(cli_parsing);
        const char* args[] = {
            "chatvault",
            "--metadata-db", "/tmp/cv.db",
            "--api-url", "http://botapi:8081",
            "--chat-id", "-100555",
            "--bot", "11=11:secret",
            "--bot", "22:other",
            "--segment-mb", "50",
            "--fan-out", "5",
            "--failure-threshold", "4",
            "--verbose",
            "upload", "in.bin", "/dst/in.bin",
        };
        int argc = static_cast<int>(sizeof(args) / sizeof(args[0]));
        auto cfg = VaultConfig::from_args(argc, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->metadata_db.string(), "/tmp/cv.db", "metadata_db");
        ASSERT_EQ(cfg->backend.type, "botapi", "default backend type");
        ASSERT_EQ(cfg->backend.params["api_url"], "http://botapi:8081", "api_url");
        ASSERT_EQ(cfg->chat_id, "-100555", "chat_id");
        ASSERT_EQ(cfg->bots.size(), 2u, "bots");
        ASSERT_EQ(cfg->bots[0].bot_id, "11", "explicit bot id");
        ASSERT_EQ(cfg->bots[0].token, "11:secret", "explicit token");
        ASSERT_EQ(cfg->bots[1].bot_id, "22", "bot id from token");
        ASSERT_EQ(cfg->bots[1].token, "22:other", "bare token kept whole");
        ASSERT_EQ(cfg->max_segment_bytes, 50ULL * 1024 * 1024, "segment size");
        ASSERT_EQ(cfg->segment_fan_out, 5u, "fan-out");
        ASSERT_EQ(cfg->failure_threshold, 4u, "threshold");
        ASSERT_TRUE(cfg->verbose, "verbose");
        ASSERT_EQ(cfg->command, "upload", "command");
        ASSERT_EQ(cfg->command_args.size(), 2u, "command args");
        ASSERT_EQ(cfg->command_args[1], "/dst/in.bin", "remote path");
        ASSERT_EMPTY(cfg->validate(), "valid config");
        PASS();
    }
    {
        TEST(cli_rejects_bad_input);
        const char* unknown[] = {"chatvault", "--bogus", "list"};
        ASSERT_TRUE(!VaultConfig::from_args(3, const_cast<char**>(unknown)), "unknown flag");
        const char* numeric[] = {"chatvault", "--fan-out", "many", "list"};
        ASSERT_TRUE(!VaultConfig::from_args(4, const_cast<char**>(numeric)), "bad number");
        const char* missing[] = {"chatvault", "--chat-id"};
        ASSERT_TRUE(!VaultConfig::from_args(2, const_cast<char**>(missing)), "missing value");
        const char* bot[] = {"chatvault", "--bot", "nocolon", "list"};
        ASSERT_TRUE(!VaultConfig::from_args(4, const_cast<char**>(bot)), "malformed bot");
        PASS();
    }
    {
        TEST(segment_mb_overflow_rejected);
        // 2^44 + 1 MiB wraps to exactly 1 MiB if multiplied unchecked
        const char* huge[] = {"chatvault", "--segment-mb", "17592186044417", "list"};
        ASSERT_TRUE(!VaultConfig::from_args(4, const_cast<char**>(huge)), "wrapping size");
        const char* ceiling[] = {"chatvault", "--segment-mb", "2000", "list"};
        auto cfg = VaultConfig::from_args(4, const_cast<char**>(ceiling));
        ASSERT_TRUE(cfg.has_value(), "ceiling parses");
        ASSERT_EQ(cfg->max_segment_bytes, constants::MAX_SEGMENT_BYTES_CEILING, "ceiling bytes");
        PASS();
    }
    {
        TEST(concurrency_flags);
        const char* args[] = {"chatvault", "--read-ahead", "6", "--per-bot-in-flight", "0", "list"};
        auto cfg = VaultConfig::from_args(6, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->download_read_ahead, 6u, "read ahead");
        ASSERT_EQ(cfg->max_per_bot_in_flight, 0u, "no per-bot cap");

        const char* zero[] = {"chatvault", "--read-ahead", "0", "list"};
        cfg = VaultConfig::from_args(4, const_cast<char**>(zero));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->download_read_ahead, 1u, "read ahead floor");
        ASSERT_EQ(cfg->max_per_bot_in_flight, constants::DEFAULT_MAX_PER_BOT_IN_FLIGHT, "default cap");
        PASS();
    }
    {
        TEST(parse_bot_flag_and_mask);
        auto a = parse_bot_flag("123456:ABC-def");
        ASSERT_TRUE(a.has_value(), "bare token");
        ASSERT_EQ(a->bot_id, "123456", "id from token");
        ASSERT_TRUE(!parse_bot_flag("=x"), "empty id");
        ASSERT_TRUE(!parse_bot_flag("id="), "empty token");
        ASSERT_EQ(mask_secret("123456:ABC"), "1234******", "mask");
        ASSERT_EQ(mask_secret("abc"), "***", "short secret fully masked");
        PASS();
    }
    {
        TEST(parse_bots_json);
        auto bots = parse_bots_json(R"([{"bot_id": 5, "token": "5:a"}, {"bot_id": "x", "token": "b"}])");
        ASSERT_TRUE(bots.has_value(), "parses");
        ASSERT_EQ(bots->size(), 2u, "count");
        ASSERT_EQ((*bots)[0].bot_id, "5", "numeric id");
        ASSERT_EQ((*bots)[1].token, "b", "token");
        ASSERT_TRUE(!parse_bots_json("{\"bot_id\": 1}"), "object rejected");
        ASSERT_TRUE(!parse_bots_json("[{\"bot_id\": 1}]"), "missing token");
        ASSERT_TRUE(!parse_bots_json("not json"), "garbage");
        PASS();
    }

    auto tmpdir = make_temp_dir("chatvault-config");

    {
        TEST(json_then_flags);
        auto json_path = tmpdir / "config.json";
        write_file(json_path, R"({
            "metadata_db": "/var/lib/chatvault/meta.db",
            "chat_id": -100777,
            "max_segment_mb": 10,
            "delete_concurrency": 6,
            "backend": {"type": "botapi", "api_url": "https://api.example", "verify_ssl": false},
            "bots": [{"bot_id": 1, "token": "1:one"}, {"bot_id": 2, "token": "2:two"}]
        })");
        std::string path_str = json_path.string();
        const char* args[] = {"chatvault", "--config", path_str.c_str(), "--fan-out", "9", "bots"};
        auto cfg = VaultConfig::from_args(6, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->metadata_db.string(), "/var/lib/chatvault/meta.db", "db from json");
        ASSERT_EQ(cfg->chat_id, "-100777", "numeric chat id");
        ASSERT_EQ(cfg->max_segment_bytes, 10ULL * 1024 * 1024, "segment from json");
        ASSERT_EQ(cfg->delete_concurrency, 6u, "delete concurrency");
        ASSERT_EQ(cfg->segment_fan_out, 9u, "flag overrides");
        ASSERT_EQ(cfg->backend.params["api_url"], "https://api.example", "api_url");
        ASSERT_EQ(cfg->backend.params["verify_ssl"], "false", "bool param");
        ASSERT_EQ(cfg->bots.size(), 2u, "bots from json");
        ASSERT_EQ(cfg->command, "bots", "command");
        PASS();
    }
    {
        TEST(json_segment_mb_overflow);
        auto json_path = tmpdir / "huge.json";
        write_file(json_path, R"({"max_segment_mb": 17592186044417})");
        std::string path_str = json_path.string();
        const char* args[] = {"chatvault", "--config", path_str.c_str(), "list"};
        ASSERT_TRUE(!VaultConfig::from_args(4, const_cast<char**>(args)), "should fail");
        PASS();
    }
    {
        TEST(bad_json_file);
        auto json_path = tmpdir / "bad.json";
        write_file(json_path, "{ not json");
        std::string path_str = json_path.string();
        const char* args[] = {"chatvault", "--config", path_str.c_str(), "list"};
        ASSERT_TRUE(!VaultConfig::from_args(4, const_cast<char**>(args)), "should fail");
        PASS();
    }
    {
        TEST(environment_overlay);
        setenv("CHATVAULT_CHAT_ID", "env-chat", 1);
        setenv("CHATVAULT_BOTS_JSON", R"([{"bot_id": 7, "token": "7:seven"}])", 1);
        setenv("CHATVAULT_METADATA_DB", "/tmp/env.db", 1);

        const char* args[] = {"chatvault", "list"};
        auto cfg = VaultConfig::from_args(2, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->chat_id, "env-chat", "chat from env");
        ASSERT_EQ(cfg->metadata_db.string(), "/tmp/env.db", "db from env");
        ASSERT_EQ(cfg->bots.size(), 1u, "bots from env");
        ASSERT_EQ(cfg->bots[0].bot_id, "7", "bot id");

        const char* flags[] = {"chatvault", "--chat-id", "flag-chat", "--bot", "8:eight", "list"};
        cfg = VaultConfig::from_args(6, const_cast<char**>(flags));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->chat_id, "flag-chat", "flag beats env");
        ASSERT_EQ(cfg->bots.size(), 1u, "flag bots replace env bots");
        ASSERT_EQ(cfg->bots[0].bot_id, "8", "flag bot");

        clear_env();
        setenv("CHATVAULT_BOT_ID", "42", 1);
        setenv("CHATVAULT_BOT_TOKEN", "42:answer", 1);
        cfg = VaultConfig::from_args(2, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->bots.size(), 1u, "single pair");
        ASSERT_EQ(cfg->bots[0].token, "42:answer", "pair token");

        clear_env();
        setenv("CHATVAULT_BOTS_JSON", "oops", 1);
        ASSERT_TRUE(!VaultConfig::from_args(2, const_cast<char**>(args)), "bad bots json");
        clear_env();
        PASS();
    }
    {
        TEST(defaults_and_validation);
        const char* args[] = {"chatvault", "list"};
        auto cfg = VaultConfig::from_args(2, const_cast<char**>(args));
        ASSERT_TRUE(cfg.has_value(), "should parse");
        ASSERT_EQ(cfg->metadata_db.string(), "chatvault.db", "default db");
        ASSERT_EQ(cfg->backend.params["api_url"], std::string(constants::DEFAULT_API_URL), "default api");
        ASSERT_EQ(cfg->max_segment_bytes, constants::DEFAULT_SEGMENT_BYTES, "default segment");
        ASSERT_NOT_EMPTY(cfg->validate(), "no chat id, no bots");

        VaultConfig v = make_vault_config(tmpdir);
        ASSERT_EMPTY(v.validate(), "harness config valid");

        auto dup = v;
        dup.bots.push_back(dup.bots[0]);
        ASSERT_NOT_EMPTY(dup.validate(), "duplicate bot ids");

        auto empty_token = v;
        empty_token.bots[0].token.clear();
        ASSERT_NOT_EMPTY(empty_token.validate(), "empty token");

        auto big = v;
        big.max_segment_bytes = constants::MAX_SEGMENT_BYTES_CEILING + 1;
        ASSERT_NOT_EMPTY(big.validate(), "segment above ceiling");
        big.max_segment_bytes = constants::MAX_SEGMENT_BYTES_CEILING;
        ASSERT_EMPTY(big.validate(), "segment at ceiling");

        auto zero = v;
        zero.segment_fan_out = 0;
        ASSERT_NOT_EMPTY(zero.validate(), "zero fan-out");
        zero = v;
        zero.failure_threshold = 0;
        ASSERT_NOT_EMPTY(zero.validate(), "zero threshold");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 4. BotPool
// ---------------------------------------------------------------------------

static std::vector<BotCredential> make_bots(const std::vector<std::string>& ids) {
    std::vector<BotCredential> bots;
    for (const auto& id : ids) bots.push_back(BotCredential{id, id + ":tok"});
    return bots;
}

static void test_bot_pool() {
    std::cout << "\n=== BotPool ===" << std::endl;

    {
        TEST(selection_fairness);
        SimClock sim;
        BotPool pool(make_bots({"1", "2", "3", "4"}), BotPool::Options{}, sim.clock());
        for (int i = 0; i < 400; ++i) {
            auto sel = pool.select_bot(Purpose::Upload);
            ASSERT_TRUE(sel.success, "selection should succeed");
            auto snap = pool.snapshot();
            uint64_t lo = UINT64_MAX, hi = 0;
            for (const auto& e : snap) {
                lo = std::min(lo, e.usage_counter);
                hi = std::max(hi, e.usage_counter);
            }
            ASSERT_TRUE(hi - lo <= 1, "usage spread exceeds 1");
        }
        for (const auto& e : pool.snapshot()) ASSERT_EQ(e.usage_counter, 100u, "even usage");
        PASS();
    }
    {
        TEST(tie_break_numeric_ids);
        BotPool pool(make_bots({"10", "9", "100"}), BotPool::Options{});
        ASSERT_EQ(pool.select_bot(Purpose::Upload).bot.bot_id, "9", "lowest numeric id first");
        ASSERT_EQ(pool.select_bot(Purpose::Upload).bot.bot_id, "10", "then 10");
        ASSERT_EQ(pool.select_bot(Purpose::Upload).bot.bot_id, "100", "then 100");
        ASSERT_TRUE(BotPool::bot_id_less("b", "c"), "lexicographic for names");
        ASSERT_TRUE(BotPool::bot_id_less("007", "10"), "leading zeros");
        ASSERT_TRUE(!BotPool::bot_id_less("7", "7"), "irreflexive");
        PASS();
    }
    {
        TEST(tie_break_mixed_ids_is_total);
        std::vector<std::string> ids = {"2", "10", "1a", "07", "7", "b"};
        for (const auto& a : ids) {
            ASSERT_TRUE(!BotPool::bot_id_less(a, a), "irreflexive: " + a);
            for (const auto& b : ids) {
                if (a == b) continue;
                ASSERT_TRUE(BotPool::bot_id_less(a, b) != BotPool::bot_id_less(b, a),
                            "exactly one of " + a + " < " + b + " and " + b + " < " + a);
                for (const auto& c : ids) {
                    if (BotPool::bot_id_less(a, b) && BotPool::bot_id_less(b, c)) {
                        ASSERT_TRUE(BotPool::bot_id_less(a, c), "transitive: " + a + " " + b + " " + c);
                    }
                }
            }
        }
        ASSERT_TRUE(BotPool::bot_id_less("10", "1a"), "numeric ids before named ids");
        ASSERT_TRUE(BotPool::bot_id_less("07", "7"), "equal values fall back to the raw string");

        std::vector<std::vector<std::string>> orders = {
            {"2", "10", "1a"}, {"1a", "10", "2"}, {"10", "1a", "2"}};
        for (const auto& order : orders) {
            BotPool pool(make_bots(order), BotPool::Options{});
            ASSERT_EQ(pool.select_bot(Purpose::Upload).bot.bot_id, "2", "first pick independent of order");
            ASSERT_EQ(pool.select_bot(Purpose::Upload).bot.bot_id, "10", "second pick");
            ASSERT_EQ(pool.select_bot(Purpose::Upload).bot.bot_id, "1a", "named id last");
        }
        PASS();
    }
    {
        TEST(cooldown_respected);
        SimClock sim;
        BotPool pool(make_bots({"1", "2"}), BotPool::Options{}, sim.clock());
        pool.report_outcome("1", Outcome::rate_limited(std::chrono::seconds(30)));
        for (int i = 0; i < 10; ++i) {
            auto sel = pool.select_bot(Purpose::Upload);
            ASSERT_TRUE(sel.success, "bot 2 available");
            ASSERT_EQ(sel.bot.bot_id, "2", "cooling bot never selected");
        }
        sim.advance(std::chrono::seconds(29));
        ASSERT_EQ(pool.select_bot(Purpose::Upload).bot.bot_id, "2", "still cooling at 29s");
        sim.advance(std::chrono::seconds(1));
        ASSERT_EQ(pool.select_bot(Purpose::Upload).bot.bot_id, "1", "eligible again at 30s");
        auto snap = pool.snapshot();
        ASSERT_TRUE(snap[0].healthy, "rate limit never marks unhealthy");
        PASS();
    }
    {
        TEST(pool_exhaustion_reports_retry_at);
        SimClock sim;
        BotPool pool(make_bots({"1", "2"}), BotPool::Options{}, sim.clock());
        pool.report_outcome("1", Outcome::rate_limited(std::chrono::seconds(20)));
        pool.report_outcome("2", Outcome::rate_limited(std::chrono::seconds(5)));
        auto sel = pool.select_bot(Purpose::Download);
        ASSERT_TRUE(!sel.success, "exhausted");
        ASSERT_TRUE(sel.retry_at.has_value(), "retry_at set");
        ASSERT_TRUE(*sel.retry_at == pool.now() + std::chrono::seconds(5), "earliest cooldown");
        PASS();
    }
    {
        TEST(failure_threshold_marks_unhealthy);
        SimClock sim;
        BotPool::Options options;
        options.failure_threshold = 3;
        BotPool pool(make_bots({"1"}), options, sim.clock());
        pool.report_outcome("1", Outcome::failure());
        pool.report_outcome("1", Outcome::failure());
        ASSERT_TRUE(pool.select_bot(Purpose::Upload).success, "healthy below threshold");
        pool.report_outcome("1", Outcome::success());
        pool.report_outcome("1", Outcome::failure());
        pool.report_outcome("1", Outcome::failure());
        ASSERT_TRUE(pool.snapshot()[0].healthy, "success reset the count");
        pool.report_outcome("1", Outcome::failure());
        ASSERT_TRUE(!pool.snapshot()[0].healthy, "unhealthy at threshold");

        auto sel = pool.select_bot(Purpose::Upload);
        ASSERT_TRUE(!sel.success, "no healthy bots");
        ASSERT_TRUE(!sel.retry_at.has_value(), "no retry_at when nothing is healthy");

        sim.advance(std::chrono::hours(24));
        ASSERT_TRUE(!pool.select_bot(Purpose::Upload).success, "time does not heal");
        PASS();
    }
    {
        TEST(restore_and_reconfigure);
        BotPool::Options options;
        options.failure_threshold = 1;
        BotPool pool(make_bots({"1", "2"}), options);
        auto v0 = pool.version();
        pool.report_outcome("1", Outcome::failure());
        ASSERT_TRUE(!pool.snapshot()[0].healthy, "bot 1 down");
        ASSERT_TRUE(pool.restore("1"), "restore known bot");
        ASSERT_TRUE(pool.snapshot()[0].healthy, "bot 1 back");
        ASSERT_TRUE(!pool.restore("99"), "unknown bot");
        ASSERT_EQ(pool.version(), v0, "restoring health keeps the configuration version");

        pool.report_outcome("2", Outcome::failure());
        auto v1 = pool.version();
        pool.reconfigure(make_bots({"2", "3"}));
        ASSERT_TRUE(pool.version() > v1, "reconfigure bumps version");
        ASSERT_EQ(pool.size(), 2u, "new size");
        ASSERT_TRUE(!pool.credential_for("1").has_value(), "removed bot has no credential");
        ASSERT_EQ(pool.credential_for("3").value_or(""), "3:tok", "new bot credential");
        ASSERT_TRUE(pool.snapshot()[0].healthy, "surviving bot re-enabled");
        PASS();
    }
    {
        TEST(usage_window_resets_counters);
        SimClock sim;
        BotPool::Options options;
        options.usage_window = std::chrono::seconds(60);
        BotPool pool(make_bots({"1", "2"}), options, sim.clock());
        for (int i = 0; i < 6; ++i) pool.select_bot(Purpose::Upload);
        ASSERT_EQ(pool.snapshot()[0].usage_counter, 3u, "counted");
        sim.advance(std::chrono::seconds(61));
        pool.select_bot(Purpose::Upload);
        auto snap = pool.snapshot();
        ASSERT_EQ(snap[0].usage_counter + snap[1].usage_counter, 1u, "reset then one selection");
        PASS();
    }
    {
        TEST(concurrent_selection_keeps_balance);
        BotPool pool(make_bots({"1", "2", "3"}), BotPool::Options{});
        std::vector<std::thread> threads;
        for (int t = 0; t < 6; ++t) {
            threads.emplace_back([&pool] {
                for (int i = 0; i < 500; ++i) pool.select_bot(Purpose::Upload);
            });
        }
        for (auto& t : threads) t.join();
        uint64_t total = 0;
        for (const auto& e : pool.snapshot()) total += e.usage_counter;
        ASSERT_EQ(total, 3000u, "every selection counted once");
        PASS();
    }
    {
        TEST(empty_pool);
        BotPool pool({}, BotPool::Options{});
        auto sel = pool.select_bot(Purpose::Upload);
        ASSERT_TRUE(!sel.success, "no bots");
        ASSERT_NOT_EMPTY(sel.error_message, "error message");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. ThreadPool
// ---------------------------------------------------------------------------

static void test_thread_pool() {
    std::cout << "\n=== ThreadPool ===" << std::endl;

    {
        TEST(submit_and_collect);
        ThreadPool pool(4);
        std::vector<std::future<int>> futures;
        for (int i = 0; i < 50; ++i) futures.push_back(pool.submit([i] { return i * i; }));
        int sum = 0;
        for (auto& f : futures) sum += f.get();
        ASSERT_EQ(sum, 40425, "sum of squares");
        PASS();
    }
    {
        TEST(submit_after_shutdown_throws);
        ThreadPool pool(1);
        pool.shutdown(true);
        bool threw = false;
        try {
            pool.submit([] { return 1; });
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "should throw");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. SqliteMetadataStore
// ---------------------------------------------------------------------------

static FileRecord make_record(const std::string& path, uint32_t segments) {
    FileRecord r;
    r.id = generate_file_id();
    r.path = path;
    r.size_bytes = segments * 10ULL;
    r.digest = std::string(64, 'a');
    r.segment_size = 10;
    r.created_at = from_epoch_seconds(1700000000);
    r.bot_pool_version = 1;
    for (uint32_t i = 0; i < segments; ++i) {
        SegmentRef s;
        s.sequence_index = i;
        s.bot_id = std::to_string(i % 2 + 1);
        s.remote_message_id = 100 + i;
        s.remote_file_token = "tok-" + std::to_string(i);
        s.byte_length = 10;
        s.segment_digest = std::string(64, 'b');
        r.segments.push_back(s);
    }
    return r;
}

static void test_metadata_store() {
    std::cout << "\n=== SqliteMetadataStore ===" << std::endl;
    auto tmpdir = make_temp_dir("chatvault-store");

    SqliteMetadataStore store(tmpdir / "sub" / "meta.db");
    {
        TEST(open_creates_schema);
        ASSERT_EMPTY(store.open(), "open");
        ASSERT_TRUE(store.is_healthy(), "healthy");
        PASS();
    }

    auto rec = make_record("/docs/a.txt", 3);
    {
        TEST(insert_and_get);
        ASSERT_TRUE(store.insert(rec).ok(), "insert");
        auto got = store.get(rec.id);
        ASSERT_TRUE(got.ok(), "get");
        ASSERT_EQ(got.record.path, rec.path, "path");
        ASSERT_EQ(got.record.size_bytes, rec.size_bytes, "size");
        ASSERT_EQ(got.record.segments.size(), 3u, "segments");
        ASSERT_EQ(got.record.segments[2].remote_message_id, 102, "message id");
        ASSERT_EQ(got.record.segments[1].bot_id, "2", "bot id");
        ASSERT_EQ(to_epoch_seconds(got.record.created_at), 1700000000, "created_at");
        ASSERT_TRUE(!store.insert(rec).ok(), "duplicate id rejected");
        ASSERT_TRUE(store.get("missing").status == StoreStatus::NotFound, "missing id");
        PASS();
    }
    {
        TEST(list_by_prefix);
        ASSERT_TRUE(store.insert(make_record("/docs/b.txt", 1)).ok(), "insert b");
        ASSERT_TRUE(store.insert(make_record("/docs2/c.txt", 1)).ok(), "insert c");
        ASSERT_TRUE(store.insert(make_record("/docs", 0)).ok(), "insert exact");
        auto docs = store.list("/docs");
        ASSERT_TRUE(docs.ok(), "list");
        ASSERT_EQ(docs.entries.size(), 3u, "/docs, /docs/a, /docs/b");
        ASSERT_EQ(docs.entries[0].path, "/docs", "ordered by path");
        ASSERT_EQ(docs.entries[1].segment_count, 3u, "segment count");
        auto all = store.list("");
        ASSERT_EQ(all.entries.size(), 4u, "everything");
        PASS();
    }
    {
        TEST(find_by_path_and_rename);
        auto found = store.find_by_path("/docs/a.txt");
        ASSERT_TRUE(found.ok(), "found");
        ASSERT_EQ(found.records.size(), 1u, "one holder");
        ASSERT_TRUE(store.update_path(rec.id, "/archive/a.txt").ok(), "rename");
        ASSERT_TRUE(store.find_by_path("/docs/a.txt").status == StoreStatus::NotFound, "old path gone");
        ASSERT_TRUE(store.update_path("missing", "/x").status == StoreStatus::NotFound, "missing row");
        PASS();
    }
    {
        TEST(mark_deleted_and_remove);
        ASSERT_TRUE(store.mark_segments_deleted(rec.id, {0, 2}).ok(), "mark");
        auto got = store.get(rec.id);
        ASSERT_TRUE(got.record.segments[0].remote_deleted, "segment 0 marked");
        ASSERT_TRUE(!got.record.segments[1].remote_deleted, "segment 1 live");
        ASSERT_TRUE(got.record.delete_pending(), "pending");
        ASSERT_TRUE(store.remove(rec.id).ok(), "remove");
        ASSERT_TRUE(store.get(rec.id).status == StoreStatus::NotFound, "gone");
        ASSERT_TRUE(store.remove(rec.id).status == StoreStatus::NotFound, "second remove");
        PASS();
    }
    {
        TEST(reopen_persists);
        SqliteMetadataStore again(tmpdir / "sub" / "meta.db");
        ASSERT_EMPTY(again.open(), "reopen");
        ASSERT_EQ(again.list("").entries.size(), 3u, "rows survive");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 7. TransportClient
// ---------------------------------------------------------------------------

static void test_transport() {
    std::cout << "\n=== TransportClient ===" << std::endl;
    auto tmpdir = make_temp_dir("chatvault-transport");

    FlakyBackend backend(MessageBackendFactory::create_local(tmpdir / "remote"));
    BotPool pool(make_bots({"1", "2"}), BotPool::Options{});
    TransportOptions options;
    options.chat_id = CHAT_ID;
    options.read_block_bytes = 7;
    TransportClient transport(backend, pool, options);

    auto data = make_data(50, 11);
    SegmentRef seg;

    {
        TEST(segment_file_name);
        ASSERT_EQ(TransportClient::segment_file_name("movie.mkv", 3), "movie.mkv.part3", "name");
        PASS();
    }
    {
        TEST(bot_throttle_caps_each_bot);
        BotThrottle throttle(2);
        std::atomic<bool> acquired{false};
        std::thread waiter;
        size_t held_one = 0;
        size_t held_two = 0;
        bool blocked_at_cap = false;
        {
            auto a = throttle.acquire("1");
            auto b = throttle.acquire("1");
            auto c = throttle.acquire("2");  // separate budget
            held_one = throttle.in_flight("1");
            held_two = throttle.in_flight("2");
            waiter = std::thread([&] {
                auto p = throttle.acquire("1");
                acquired = true;
            });
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            blocked_at_cap = !acquired.load();
        }
        waiter.join();
        ASSERT_EQ(held_one, 2u, "two permits for bot 1");
        ASSERT_EQ(held_two, 1u, "one permit for bot 2");
        ASSERT_TRUE(blocked_at_cap, "third permit waits");
        ASSERT_TRUE(acquired.load(), "released permit unblocks");
        ASSERT_EQ(throttle.in_flight("1"), 0u, "all released");

        BotThrottle uncapped(0);
        auto p1 = uncapped.acquire("1");
        auto p2 = uncapped.acquire("1");
        auto p3 = uncapped.acquire("1");
        ASSERT_EQ(uncapped.in_flight("1"), 3u, "no cap");
        PASS();
    }
    {
        TEST(upload_segment);
        auto bot = pool.select_bot(Purpose::Upload).bot;
        auto up = transport.upload_segment(bot, 0, "f.part0", as_bytes(data));
        ASSERT_TRUE(up.success, up.error_message);
        ASSERT_TRUE(up.message_created, "message created");
        ASSERT_EQ(up.segment.byte_length, data.size(), "length");
        ASSERT_EQ(up.segment.segment_digest, sha256_hex(as_bytes(data)), "digest of sent bytes");
        ASSERT_EQ(up.segment.bot_id, "1", "owner");
        seg = up.segment;
        PASS();
    }
    {
        TEST(ranged_read);
        auto stream = transport.resolve_download(seg);
        ASSERT_TRUE(stream.success, stream.error_message);
        std::string got;
        std::vector<uint8_t> block;
        int blocks = 0;
        for (;;) {
            auto r = stream.reader->read(block);
            ASSERT_TRUE(r.success, r.error_message);
            if (r.eof) break;
            ASSERT_TRUE(block.size() <= 7, "block bounded");
            got.append(block.begin(), block.end());
            ++blocks;
        }
        ASSERT_EQ(got, data, "bytes");
        ASSERT_EQ(blocks, 8, "ceil(50/7) blocks");
        PASS();
    }
    {
        TEST(single_link_expiry_completes);
        std::atomic<bool> expired_once{false};
        backend.on_fetch = [&expired_once](int) -> std::optional<FetchResult> {
            if (expired_once.exchange(true)) return std::nullopt;
            FetchResult r;
            r.status = RemoteStatus::NotFound;
            r.link_expired = true;
            r.error_message = "HTTP 410";
            return r;
        };
        auto stream = transport.resolve_download(seg);
        ASSERT_TRUE(stream.success, stream.error_message);
        std::string got;
        std::vector<uint8_t> block;
        for (;;) {
            auto r = stream.reader->read(block);
            ASSERT_TRUE(r.success, r.error_message);
            if (r.eof) break;
            got.append(block.begin(), block.end());
        }
        ASSERT_EQ(got, data, "complete after refresh");
        ASSERT_EQ(stream.reader->link_refreshes(), 1u, "one refresh");
        backend.on_fetch = nullptr;
        PASS();
    }
    {
        TEST(delete_is_idempotent);
        auto first = transport.delete_segment(seg);
        ASSERT_TRUE(first.success, first.error_message);
        ASSERT_TRUE(first.status == TransportStatus::Ok, "first delete ok");
        auto second = transport.delete_segment(seg);
        ASSERT_TRUE(second.success, "second delete succeeds");
        ASSERT_TRUE(second.status == TransportStatus::NotFound, "second is NotFound");
        PASS();
    }
    {
        TEST(delete_with_foreign_bot_refused);
        auto bot = pool.select_bot(Purpose::Upload).bot;
        auto up = transport.upload_segment(bot, 0, "g.part0", as_bytes(data));
        ASSERT_TRUE(up.success, up.error_message);
        auto foreign = up.segment;
        foreign.bot_id = foreign.bot_id == "1" ? "2" : "1";
        auto del = transport.delete_segment(foreign);
        ASSERT_TRUE(!del.success, "other bot cannot delete");
        ASSERT_TRUE(del.status == TransportStatus::Permanent, "permanent");

        auto unknown = up.segment;
        unknown.bot_id = "404";
        del = transport.delete_segment(unknown);
        ASSERT_TRUE(!del.success, "unknown bot");
        ASSERT_TRUE(del.status == TransportStatus::Permanent, "unknown bot is permanent");
        ASSERT_TRUE(transport.delete_segment(up.segment).success, "owner deletes");
        PASS();
    }
    {
        TEST(missing_segment_resolve_fails);
        auto stream = transport.resolve_download(seg);  // deleted above
        ASSERT_TRUE(!stream.success, "resolve of deleted message fails");
        ASSERT_TRUE(stream.status == TransportStatus::NotFound, "not found");
        PASS();
    }
    {
        TEST(resolved_size_mismatch_is_corrupted);
        auto bot = pool.select_bot(Purpose::Upload).bot;
        auto up = transport.upload_segment(bot, 0, "h.part0", as_bytes(data));
        ASSERT_TRUE(up.success, up.error_message);
        auto wrong = up.segment;
        wrong.byte_length = data.size() + 5;
        auto stream = transport.resolve_download(wrong);
        ASSERT_TRUE(!stream.success, "size mismatch");
        ASSERT_TRUE(stream.status == TransportStatus::Corrupted, "corrupted");
        PASS();
    }
    {
        TEST(caller_digest_is_recorded);
        auto bot = pool.select_bot(Purpose::Upload).bot;
        auto digest = sha256_hex(as_bytes(data));
        auto up = transport.upload_segment(bot, 1, "i.part1", as_bytes(data), digest);
        ASSERT_TRUE(up.success, up.error_message);
        ASSERT_EQ(up.segment.segment_digest, digest, "digest passed through");
        ASSERT_EQ(up.segment.sequence_index, 1u, "index");
        PASS();
    }
    {
        TEST(short_store_is_corrupted);
        backend.on_send = [](int, const std::string&) -> std::optional<SendResult> {
            SendResult r;
            r.success = true;
            r.status = RemoteStatus::Ok;
            r.message_id = 9001;
            r.file_token = "truncated";
            r.stored_size = 10;
            return r;
        };
        auto bot = pool.select_bot(Purpose::Upload).bot;
        auto up = transport.upload_segment(bot, 0, "j.part0", as_bytes(data),
                                           sha256_hex(as_bytes(data)));
        backend.on_send = nullptr;
        ASSERT_TRUE(!up.success, "size mismatch fails");
        ASSERT_TRUE(up.status == TransportStatus::Corrupted, "corrupted");
        ASSERT_TRUE(up.message_created, "message reported for cleanup");
        ASSERT_EQ(up.segment.remote_message_id, 9001, "created message id");
        PASS();
    }

    fs::remove_all(tmpdir);
}

static void test_bot_api_replies() {
    std::cout << "\n=== Bot API replies ===" << std::endl;

    {
        TEST(ok_reply);
        auto r = classify_bot_api_reply(200, R"({"ok": true, "result": {"message_id": 5}})");
        ASSERT_TRUE(r.status == RemoteStatus::Ok, "ok");
        PASS();
    }
    {
        TEST(rate_limit_from_parameters);
        auto r = classify_bot_api_reply(429,
            R"({"ok": false, "error_code": 429, "description": "Too Many Requests: retry after 17",
                "parameters": {"retry_after": 17}})");
        ASSERT_TRUE(r.status == RemoteStatus::RateLimited, "rate limited");
        ASSERT_EQ(r.retry_after.count(), 17000, "retry_after ms");
        ASSERT_TRUE(r.description.find("Too Many Requests") != std::string::npos, "description");
        PASS();
    }
    {
        TEST(rate_limit_in_body_only);
        auto r = classify_bot_api_reply(200, R"({"ok": false, "error_code": 429, "description": "slow down"})");
        ASSERT_TRUE(r.status == RemoteStatus::RateLimited, "error_code wins over HTTP status");
        ASSERT_EQ(r.retry_after.count(), 1000, "default retry_after");
        PASS();
    }
    {
        TEST(rate_limit_from_header);
        auto r = classify_bot_api_reply(429, "<html>busy</html>", "9");
        ASSERT_TRUE(r.status == RemoteStatus::RateLimited, "rate limited");
        ASSERT_EQ(r.retry_after.count(), 9000, "header value");
        r = classify_bot_api_reply(429, "", "Wed, 21 Oct 2015 07:28:00 GMT");
        ASSERT_EQ(r.retry_after.count(), 1000, "date form falls back to default");
        PASS();
    }
    {
        TEST(error_classes);
        auto r = classify_bot_api_reply(400,
            R"({"ok": false, "error_code": 400, "description": "Bad Request: message to delete not found"})");
        ASSERT_TRUE(r.status == RemoteStatus::NotFound, "missing message");
        r = classify_bot_api_reply(400,
            R"({"ok": false, "error_code": 400, "description": "Bad Request: chat not found"})");
        ASSERT_TRUE(r.status == RemoteStatus::Permanent, "other 4xx");
        r = classify_bot_api_reply(502, "Bad Gateway");
        ASSERT_TRUE(r.status == RemoteStatus::Transient, "5xx without JSON");
        r = classify_bot_api_reply(500, R"({"ok": false, "error_code": 500, "description": "Internal"})");
        ASSERT_TRUE(r.status == RemoteStatus::Transient, "5xx with JSON");
        r = classify_bot_api_reply(200, "not json");
        ASSERT_TRUE(r.status == RemoteStatus::Permanent, "malformed success");
        PASS();
    }
    {
        TEST(factory_rejects_unknown_type);
        bool threw = false;
        try {
            MessageBackendFactory::create("s3", {});
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "unknown type");
        auto api = MessageBackendFactory::create("botapi", {{"api_url", "http://localhost:8081/"}});
        ASSERT_EQ(api->type_name(), "botapi", "botapi type");
        PASS();
    }
    {
        TEST(token_redacted_in_urls);
        ASSERT_EQ(net::redact_url("https://api.telegram.org/bot12:AAsecret/getFile?file_id=x"),
                  "https://api.telegram.org/bot<redacted>/getFile?file_id=x", "method url");
        ASSERT_EQ(net::redact_url("https://api.telegram.org/file/bot12:AAsecret/documents/f.bin"),
                  "https://api.telegram.org/file/bot<redacted>/documents/f.bin", "file url");
        ASSERT_EQ(net::redact_url("http://localhost:8081/healthz"), "http://localhost:8081/healthz",
                  "no token");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 8. Vault workflows
// ---------------------------------------------------------------------------

static void test_vault_round_trip() {
    std::cout << "\n=== Vault round trip ===" << std::endl;
    auto h = make_harness("roundtrip", 3);

    struct Case {
        const char* name;
        size_t size;
        size_t segments;
    };
    const Case cases[] = {
        {"zero_bytes", 0, 0},
        {"one_byte", 1, 1},
        {"exact_segment", 1024, 1},
        {"segment_plus_one", 1025, 2},
        {"several_segments", 1024 * 5 + 17, 6},
    };

    uint32_t seed = 1;
    for (const auto& c : cases) {
        std::cout << "  round_trip_" << c.name << "... " << std::flush;
        auto data = make_data(c.size, seed++);
        auto path = std::string("/rt/") + c.name + ".bin";

        auto up = upload_string(*h.vault, data, path);
        if (!up.success) { FAIL(up.error.to_string()); return; }
        if (up.record.segments.size() != c.segments) { FAIL("segment count"); return; }
        if (up.record.digest != sha256_hex(as_bytes(data))) { FAIL("stored digest"); return; }
        if (up.record.size_bytes != c.size) { FAIL("stored size"); return; }
        for (size_t i = 0; i < up.record.segments.size(); ++i) {
            if (up.record.segments[i].sequence_index != i) { FAIL("segment order"); return; }
        }

        std::string out;
        auto down = download_string(*h.vault, up.record.id, out);
        if (!down.success) { FAIL(down.error.to_string()); return; }
        if (out != data) { FAIL("bytes differ"); return; }
        if (down.digest != up.record.digest) { FAIL("download digest"); return; }
        PASS();
    }

    {
        TEST(download_by_path_and_stat);
        auto data = make_data(3000, 99);
        auto up = upload_string(*h.vault, data, "docs//report.pdf/");
        ASSERT_TRUE(up.success, up.error.to_string());
        ASSERT_EQ(up.record.path, "/docs/report.pdf", "normalised path");

        std::string out;
        auto down = download_string(*h.vault, "/docs/report.pdf", out);
        ASSERT_TRUE(down.success, down.error.to_string());
        ASSERT_EQ(out, data, "bytes by path");
        ASSERT_EQ(down.file_id, up.record.id, "resolved id");

        auto st = h.vault->stat("docs/report.pdf");
        ASSERT_TRUE(st.success, st.error.to_string());
        ASSERT_EQ(st.record.id, up.record.id, "stat by path");
        st = h.vault->stat(up.record.id);
        ASSERT_TRUE(st.success, st.error.to_string());
        ASSERT_EQ(st.record.segments.size(), 3u, "stat by id");
        PASS();
    }
    {
        TEST(segments_spread_across_bots);
        auto up = upload_string(*h.vault, make_data(1024 * 6, 5), "/spread.bin");
        ASSERT_TRUE(up.success, up.error.to_string());
        std::map<std::string, int> per_bot;
        for (const auto& s : up.record.segments) per_bot[s.bot_id]++;
        ASSERT_EQ(per_bot.size(), 3u, "every bot used");
        PASS();
    }
    {
        TEST(progress_events);
        std::vector<TransferEvent> events;
        UploadOptions options;
        options.on_progress = [&events](const TransferEvent& ev) { events.push_back(ev); };
        auto up = upload_string(*h.vault, make_data(2500, 6), "/progress.bin", options);
        ASSERT_TRUE(up.success, up.error.to_string());
        ASSERT_TRUE(!events.empty(), "events emitted");
        ASSERT_TRUE(events.front().phase == TransferPhase::Started, "first is Started");
        ASSERT_TRUE(events.back().phase == TransferPhase::Completed, "last is Completed");
        int segment_events = 0;
        bool committed = false;
        for (const auto& ev : events) {
            if (ev.phase == TransferPhase::SegmentDone) segment_events++;
            if (ev.phase == TransferPhase::Committed) committed = true;
        }
        ASSERT_EQ(segment_events, 3, "one event per segment");
        ASSERT_TRUE(committed, "Committed emitted");
        ASSERT_EQ(events.back().bytes_done, 2500u, "bytes done");
        PASS();
    }
    {
        TEST(stats_tracked);
        auto s = h.vault->get_stats();
        ASSERT_EQ(s.uploads_completed, 8u, "uploads");
        ASSERT_EQ(s.downloads_completed, 6u, "downloads");
        ASSERT_EQ(s.uploads_failed, 0u, "no failures");
        PASS();
    }

    h.vault->stop();
    fs::remove_all(h.dir);
}

static void test_vault_upload_failures() {
    std::cout << "\n=== Vault upload atomicity ===" << std::endl;

    {
        TEST(permanent_failure_compensates);
        auto h = make_harness("atomic", 2, [](VaultConfig& c) { c.segment_fan_out = 1; });
        h.backend->on_send = [](int n, const std::string&) -> std::optional<SendResult> {
            if (n != 3) return std::nullopt;
            SendResult r;
            r.status = RemoteStatus::Permanent;
            r.error_message = "Bad Request: file is too big";
            return r;
        };
        auto up = upload_string(*h.vault, make_data(1024 * 5, 3), "/atomic.bin");
        ASSERT_TRUE(!up.success, "upload should fail");
        ASSERT_CODE(up.error, VaultErrorCode::TransportFailure, "error code");
        ASSERT_TRUE(up.error.segment_index.has_value(), "segment index reported");
        ASSERT_EQ(*up.error.segment_index, 2u, "third segment");
        ASSERT_NOT_EMPTY(up.error.bot_id, "bot reported");
        ASSERT_NOT_EMPTY(up.error.file_id, "file id reported");
        ASSERT_TRUE(up.error.compensation_failures.empty(), "compensation clean");
        ASSERT_EQ(h.backend->delete_calls.load(), 2, "segments 0 and 1 deleted");
        ASSERT_EQ(h.remote_messages(), 0u, "nothing left remotely");
        ASSERT_EQ(h.vault->list("").entries.size(), 0u, "no record");
        ASSERT_EQ(h.vault->get_stats().compensations_run, 1u, "compensation counted");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
    {
        TEST(commit_failure_compensates);
        auto h = make_harness("commit");
        h.store->fail_insert = true;
        auto up = upload_string(*h.vault, make_data(3000, 4), "/commit.bin");
        ASSERT_TRUE(!up.success, "upload should fail");
        ASSERT_CODE(up.error, VaultErrorCode::MetadataUnavailable, "error code");
        ASSERT_EQ(h.remote_messages(), 0u, "segments removed");
        h.store->fail_insert = false;
        ASSERT_EQ(h.vault->list("").entries.size(), 0u, "no record");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
    {
        TEST(compensation_failure_is_reported_not_escalated);
        auto h = make_harness("orphan", 1, [](VaultConfig& c) { c.segment_fan_out = 1; });
        h.backend->on_send = [](int n, const std::string&) -> std::optional<SendResult> {
            if (n != 2) return std::nullopt;
            SendResult r;
            r.status = RemoteStatus::Permanent;
            r.error_message = "Bad Request: chat not found";
            return r;
        };
        h.backend->on_delete = [](int, int64_t) -> std::optional<DeleteResult> {
            DeleteResult r;
            r.status = RemoteStatus::Permanent;
            r.error_message = "Forbidden: bot was kicked";
            return r;
        };
        auto up = upload_string(*h.vault, make_data(2048, 8), "/orphan.bin");
        ASSERT_TRUE(!up.success, "upload should fail");
        ASSERT_CODE(up.error, VaultErrorCode::TransportFailure, "original error kept");
        ASSERT_EQ(up.error.compensation_failures.size(), 1u, "orphan listed");
        ASSERT_EQ(up.error.compensation_failures[0].sequence_index, 0u, "orphan segment");
        ASSERT_EQ(h.remote_messages(), 1u, "orphan still remote");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
    {
        TEST(throwing_backend_still_compensates);
        auto h = make_harness("throw", 2, [](VaultConfig& c) { c.segment_fan_out = 1; });
        h.backend->on_send = [](int n, const std::string&) -> std::optional<SendResult> {
            if (n == 3) throw std::runtime_error("connection reset by peer");
            return std::nullopt;
        };
        h.backend->on_delete = [](int n, int64_t) -> std::optional<DeleteResult> {
            if (n == 1) throw std::runtime_error("socket closed");
            return std::nullopt;
        };
        auto up = upload_string(*h.vault, make_data(1024 * 4, 12), "/throw.bin");
        ASSERT_TRUE(!up.success, "upload should fail");
        ASSERT_CODE(up.error, VaultErrorCode::TransportFailure, "worker exception becomes a failure");
        ASSERT_TRUE(up.error.message.find("connection reset") != std::string::npos, "cause kept");
        ASSERT_EQ(h.backend->delete_calls.load(), 2, "both created segments compensated");
        ASSERT_EQ(up.error.compensation_failures.size(), 1u, "throwing delete reported as orphan");
        ASSERT_EQ(h.remote_messages(), 1u, "only the orphan remains");
        ASSERT_EQ(h.vault->list("").entries.size(), 0u, "no record");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
    {
        TEST(cancellation_compensates);
        auto h = make_harness("cancel", 2, [](VaultConfig& c) { c.segment_fan_out = 1; });
        CancellationToken cancel;
        h.backend->on_send = [&cancel](int n, const std::string&) -> std::optional<SendResult> {
            if (n == 2) cancel.cancel();
            return std::nullopt;
        };
        UploadOptions options;
        options.cancel = &cancel;
        auto up = upload_string(*h.vault, make_data(1024 * 4, 9), "/cancel.bin", options);
        ASSERT_TRUE(!up.success, "cancelled");
        ASSERT_CODE(up.error, VaultErrorCode::Cancelled, "error code");
        ASSERT_EQ(h.remote_messages(), 0u, "uploaded segments removed");
        ASSERT_EQ(h.vault->list("").entries.size(), 0u, "no record");
        ASSERT_EQ(h.vault->get_stats().uploads_cancelled, 1u, "cancel counted");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
    {
        TEST(invalid_path_and_conflict);
        auto h = make_harness("conflict");
        auto bad = upload_string(*h.vault, "x", "/a/../b");
        ASSERT_CODE(bad.error, VaultErrorCode::InvalidArgument, "invalid path");
        auto first = upload_string(*h.vault, "x", "/same.txt");
        ASSERT_TRUE(first.success, first.error.to_string());
        int sends = h.backend->send_calls;
        auto second = upload_string(*h.vault, "y", "same.txt");
        ASSERT_CODE(second.error, VaultErrorCode::PathConflict, "conflict");
        ASSERT_EQ(h.backend->send_calls.load(), sends, "no remote traffic on conflict");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
}

static void test_vault_bot_policy() {
    std::cout << "\n=== Vault bot policy ===" << std::endl;

    {
        TEST(rate_limit_switches_bot);
        SimClock sim;
        auto h = make_harness("ratelimit", 2, nullptr, sim.clock());
        const std::string bot1_token = h.config.bots[0].token;
        h.backend->on_send = [bot1_token](int, const std::string& token) -> std::optional<SendResult> {
            if (token == bot1_token) return rate_limited_send(std::chrono::seconds(30));
            return std::nullopt;
        };
        auto up = upload_string(*h.vault, "payload", "/rl.bin");
        ASSERT_TRUE(up.success, up.error.to_string());
        ASSERT_EQ(up.record.segments[0].bot_id, "2", "switched to bot 2");

        auto snap = h.vault->pool().snapshot();
        ASSERT_TRUE(snap[0].cooldown_until > h.vault->pool().now(), "bot 1 cooling");
        ASSERT_TRUE(snap[0].healthy, "bot 1 still healthy");

        // Bot 1 stays out until its cooldown passes
        auto next = upload_string(*h.vault, "more", "/rl2.bin");
        ASSERT_TRUE(next.success, next.error.to_string());
        ASSERT_EQ(next.record.segments[0].bot_id, "2", "cooling bot skipped");

        h.backend->on_send = nullptr;
        sim.advance(std::chrono::seconds(31));
        auto later = upload_string(*h.vault, "later", "/rl3.bin");
        ASSERT_TRUE(later.success, later.error.to_string());
        ASSERT_EQ(later.record.segments[0].bot_id, "1", "bot 1 back after cooldown");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
    {
        TEST(pool_exhausted_when_all_cooling);
        SimClock sim;
        auto h = make_harness("exhausted", 1, nullptr, sim.clock());
        h.backend->on_send = [](int, const std::string&) -> std::optional<SendResult> {
            return rate_limited_send(std::chrono::seconds(30));
        };
        auto up = upload_string(*h.vault, "payload", "/ex.bin");
        ASSERT_TRUE(!up.success, "should fail");
        ASSERT_CODE(up.error, VaultErrorCode::PoolExhausted, "error code");
        ASSERT_TRUE(up.error.retry_at.has_value(), "retry_at reported");
        ASSERT_EQ(h.remote_messages(), 0u, "nothing stored");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
    {
        TEST(transient_error_retries_same_bot);
        auto h = make_harness("transient", 2);
        h.backend->on_send = [](int n, const std::string&) -> std::optional<SendResult> {
            if (n != 1) return std::nullopt;
            SendResult r;
            r.status = RemoteStatus::Transient;
            r.error_message = "HTTP 502";
            return r;
        };
        auto up = upload_string(*h.vault, "payload", "/tr.bin");
        ASSERT_TRUE(up.success, up.error.to_string());
        ASSERT_EQ(up.record.segments[0].bot_id, "1", "same bot");
        ASSERT_EQ(h.backend->send_calls.load(), 2, "one retry");
        auto snap = h.vault->pool().snapshot();
        ASSERT_EQ(snap[0].consecutive_failures, 0u, "no failure recorded");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
    {
        TEST(repeated_transient_marks_failure);
        auto h = make_harness("transient2", 1);
        h.backend->on_send = [](int, const std::string&) -> std::optional<SendResult> {
            SendResult r;
            r.status = RemoteStatus::Transient;
            r.error_message = "connection reset";
            return r;
        };
        auto up = upload_string(*h.vault, "payload", "/tr2.bin");
        ASSERT_TRUE(!up.success, "should fail");
        ASSERT_CODE(up.error, VaultErrorCode::TransportFailure, "error code");
        ASSERT_EQ(h.backend->send_calls.load(), 2, "tried twice");
        ASSERT_EQ(h.vault->pool().snapshot()[0].consecutive_failures, 1u, "one failure");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
    {
        TEST(sequential_uploads_are_fair);
        auto h = make_harness("fair", 3, [](VaultConfig& c) { c.max_segment_bytes = 1 << 20; });
        for (int i = 0; i < 30; ++i) {
            auto up = upload_string(*h.vault, make_data(100, i + 1), "/fair/" + std::to_string(i));
            ASSERT_TRUE(up.success, up.error.to_string());
        }
        for (const auto& e : h.vault->pool().snapshot()) {
            ASSERT_EQ(e.usage_counter, 10u, "even usage for bot " + e.bot_id);
        }
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
}

static void test_vault_integrity() {
    std::cout << "\n=== Vault integrity ===" << std::endl;
    auto h = make_harness("integrity");

    auto data = make_data(2500, 21);
    auto up = upload_string(*h.vault, data, "/tamper.bin");
    if (!up.success) { FAIL(up.error.to_string()); return; }

    {
        TEST(link_expiry_during_download);
        std::atomic<bool> expired_once{false};
        h.backend->on_fetch = [&expired_once](int) -> std::optional<FetchResult> {
            if (expired_once.exchange(true)) return std::nullopt;
            FetchResult r;
            r.status = RemoteStatus::NotFound;
            r.link_expired = true;
            r.error_message = "HTTP 403";
            return r;
        };
        int resolves = h.backend->resolve_calls;
        std::string out;
        auto down = download_string(*h.vault, up.record.id, out);
        h.backend->on_fetch = nullptr;
        ASSERT_TRUE(down.success, down.error.to_string());
        ASSERT_EQ(out, data, "bytes intact");
        ASSERT_EQ(h.backend->resolve_calls.load() - resolves, 4, "3 segments + 1 refresh");
        PASS();
    }
    {
        TEST(download_to_file);
        auto target = h.dir / "out" / "tamper.bin";
        auto down = h.vault->download_to_file(up.record.id, target);
        ASSERT_TRUE(down.success, down.error.to_string());
        ASSERT_EQ(read_file(target), data, "file contents");
        ASSERT_TRUE(!fs::exists(target.string() + ".partial"), "no partial file");
        PASS();
    }
    {
        TEST(tampered_segment_is_integrity_violation);
        auto victim = h.message_path(up.record.segments[1].remote_message_id);
        auto content = read_file(victim);
        content[0] = static_cast<char>(content[0] ^ 0xFF);
        write_file(victim, content);

        std::string out;
        auto down = download_string(*h.vault, up.record.id, out);
        ASSERT_TRUE(!down.success, "should fail");
        ASSERT_CODE(down.error, VaultErrorCode::IntegrityViolation, "error code");
        ASSERT_TRUE(down.error.segment_index.has_value(), "segment reported");
        ASSERT_EQ(*down.error.segment_index, 1u, "tampered segment");
        ASSERT_EQ(down.error.bot_id, up.record.segments[1].bot_id, "bot reported");
        PASS();
    }
    {
        TEST(download_to_file_removes_partial);
        auto target = h.dir / "out" / "bad.bin";
        auto down = h.vault->download_to_file(up.record.id, target);
        ASSERT_TRUE(!down.success, "should fail");
        ASSERT_TRUE(!fs::exists(target), "no target");
        ASSERT_TRUE(!fs::exists(target.string() + ".partial"), "no partial");
        PASS();
    }
    {
        TEST(missing_segment_is_download_incomplete);
        auto other = upload_string(*h.vault, data, "/missing.bin");
        ASSERT_TRUE(other.success, other.error.to_string());
        auto victim = h.message_path(other.record.segments[0].remote_message_id);
        fs::remove(victim);
        fs::remove(victim.replace_extension(".json"));

        std::string out;
        auto down = download_string(*h.vault, other.record.id, out);
        ASSERT_TRUE(!down.success, "should fail");
        ASSERT_CODE(down.error, VaultErrorCode::DownloadIncomplete, "error code");
        ASSERT_TRUE(down.error.segment_index.has_value(), "segment reported");
        ASSERT_EQ(*down.error.segment_index, 0u, "first segment");
        ASSERT_TRUE(out.empty(), "nothing delivered");
        ASSERT_TRUE(h.vault->stat(other.record.id).success, "download never removes the record");
        PASS();
    }
    {
        TEST(sink_can_cancel);
        auto fresh = upload_string(*h.vault, data, "/sink.bin");
        ASSERT_TRUE(fresh.success, fresh.error.to_string());
        auto down = h.vault->download(fresh.record.id, [](std::span<const uint8_t>) { return false; });
        ASSERT_CODE(down.error, VaultErrorCode::Cancelled, "sink stop");
        PASS();
    }
    {
        TEST(unknown_file);
        std::string out;
        auto down = download_string(*h.vault, "/does/not/exist", out);
        ASSERT_CODE(down.error, VaultErrorCode::NotFound, "missing path");
        down = download_string(*h.vault, generate_file_id(), out);
        ASSERT_CODE(down.error, VaultErrorCode::NotFound, "missing id");
        PASS();
    }

    h.vault->stop();
    fs::remove_all(h.dir);
}

static void test_vault_concurrency() {
    std::cout << "\n=== Vault concurrency ===" << std::endl;

    {
        TEST(read_ahead_reassembles_in_order);
        auto h = make_harness("ahead", 2, [](VaultConfig& c) {
            c.download_read_ahead = 4;
            c.max_per_bot_in_flight = 0;
        });
        auto data = make_data(1024 * 4 + 100, 31);
        auto up = upload_string(*h.vault, data, "/ahead.bin");
        ASSERT_TRUE(up.success, up.error.to_string());
        ASSERT_EQ(up.record.segments.size(), 5u, "segments");

        // The first fetch is held until three more have started
        std::atomic<int> entered{0};
        std::atomic<bool> overtaken{false};
        h.backend->on_fetch = [&entered, &overtaken](int n) -> std::optional<FetchResult> {
            ++entered;
            if (n == 1) {
                auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
                while (entered.load() < 4 && std::chrono::steady_clock::now() < deadline) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                overtaken = entered.load() >= 4;
            }
            return std::nullopt;
        };

        std::vector<uint32_t> done;
        DownloadOptions options;
        options.on_progress = [&done](const TransferEvent& ev) {
            if (ev.phase == TransferPhase::SegmentDone) done.push_back(ev.segments_done);
        };
        std::string out;
        auto down = h.vault->download(up.record.id, [&out](std::span<const uint8_t> d) {
            out.append(reinterpret_cast<const char*>(d.data()), d.size());
            return true;
        }, options);
        h.backend->on_fetch = nullptr;

        ASSERT_TRUE(down.success, down.error.to_string());
        ASSERT_TRUE(overtaken.load(), "later segments fetched while the first was held");
        ASSERT_EQ(out, data, "bytes in sequence order");
        ASSERT_EQ(down.digest, up.record.digest, "digest");
        ASSERT_EQ(done.size(), 5u, "one event per segment");
        for (size_t i = 0; i < done.size(); ++i) {
            ASSERT_EQ(done[i], i + 1, "events in order");
        }
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
    {
        TEST(stopped_download_drains_read_ahead);
        auto h = make_harness("drain", 2, [](VaultConfig& c) { c.download_read_ahead = 4; });
        auto up = upload_string(*h.vault, make_data(1024 * 5, 32), "/drain.bin");
        ASSERT_TRUE(up.success, up.error.to_string());

        h.backend->on_fetch = [](int n) -> std::optional<FetchResult> {
            if (n > 1) std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return std::nullopt;
        };
        auto down = h.vault->download(up.record.id, [](std::span<const uint8_t>) { return false; });
        int fetches_at_return = h.backend->fetch_calls.load();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        int fetches_later = h.backend->fetch_calls.load();
        h.backend->on_fetch = nullptr;

        ASSERT_CODE(down.error, VaultErrorCode::Cancelled, "receiver stop");
        ASSERT_EQ(fetches_later, fetches_at_return, "no fetch outlives the download");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
    {
        TEST(per_bot_cap_bounds_backend_calls);
        auto h = make_harness("cap", 1, [](VaultConfig& c) {
            c.segment_fan_out = 4;
            c.download_read_ahead = 4;
            c.max_per_bot_in_flight = 1;
        });
        std::atomic<int> active{0};
        std::atomic<int> peak{0};
        auto track = [&active, &peak] {
            int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --active;
        };
        h.backend->on_send = [&track](int, const std::string&) -> std::optional<SendResult> {
            track();
            return std::nullopt;
        };
        h.backend->on_fetch = [&track](int) -> std::optional<FetchResult> {
            track();
            return std::nullopt;
        };

        auto data = make_data(1024 * 4, 33);
        auto up = upload_string(*h.vault, data, "/capped.bin");
        ASSERT_TRUE(up.success, up.error.to_string());
        ASSERT_EQ(h.backend->send_calls.load(), 4, "one send per segment");
        ASSERT_EQ(peak.load(), 1, "one send at a time for the bot");

        std::string out;
        auto down = download_string(*h.vault, up.record.id, out);
        h.backend->on_send = nullptr;
        h.backend->on_fetch = nullptr;
        ASSERT_TRUE(down.success, down.error.to_string());
        ASSERT_EQ(out, data, "bytes");
        ASSERT_EQ(peak.load(), 1, "one fetch at a time for the bot");
        h.vault->stop();
        fs::remove_all(h.dir);
        PASS();
    }
}

static void test_vault_metadata_ops() {
    std::cout << "\n=== Vault rename / list ===" << std::endl;
    auto h = make_harness("meta");

    std::map<std::string, FileRecord> records;
    for (const char* p : {"/docs/a.txt", "/docs/b.txt", "/docs2/c.txt", "/other.txt"}) {
        auto up = upload_string(*h.vault, make_data(300, static_cast<uint32_t>(records.size() + 1)), p);
        if (!up.success) { FAIL(up.error.to_string()); return; }
        records[p] = up.record;
    }

    {
        TEST(list_by_prefix);
        auto docs = h.vault->list("/docs");
        ASSERT_TRUE(docs.success, docs.error.to_string());
        ASSERT_EQ(docs.entries.size(), 2u, "/docs excludes /docs2");
        ASSERT_EQ(docs.entries[0].path, "/docs/a.txt", "ordered");
        ASSERT_EQ(docs.entries[0].size_bytes, 300u, "size");
        ASSERT_EQ(h.vault->list("root").entries.size(), 4u, "root lists all");
        ASSERT_EQ(h.vault->list("/").entries.size(), 4u, "slash lists all");
        ASSERT_EQ(h.vault->list("").entries.size(), 4u, "empty lists all");
        ASSERT_EQ(h.vault->list("/nothing").entries.size(), 0u, "no match");
        ASSERT_CODE(h.vault->list("/a/..").error, VaultErrorCode::InvalidArgument, "bad prefix");
        PASS();
    }
    {
        TEST(rename_keeps_identity);
        const auto& before = records["/docs/a.txt"];
        auto ren = h.vault->rename(before.id, "archive/a.txt");
        ASSERT_TRUE(ren.success, ren.error.to_string());
        ASSERT_EQ(ren.record.path, "/archive/a.txt", "new path");
        auto after = h.vault->stat(before.id);
        ASSERT_TRUE(after.success, after.error.to_string());
        ASSERT_EQ(after.record.id, before.id, "id");
        ASSERT_EQ(after.record.digest, before.digest, "digest");
        ASSERT_EQ(after.record.segments.size(), before.segments.size(), "segments");
        ASSERT_EQ(after.record.segments[0].remote_message_id, before.segments[0].remote_message_id,
                  "segment refs");
        ASSERT_EQ(h.vault->list("/docs").entries.size(), 1u, "moved out of /docs");
        ASSERT_EQ(h.backend->send_calls.load(), 4, "rename sends nothing");
        PASS();
    }
    {
        TEST(rename_errors);
        auto id = records["/docs/b.txt"].id;
        ASSERT_CODE(h.vault->rename(id, "/other.txt").error, VaultErrorCode::PathConflict, "conflict");
        ASSERT_CODE(h.vault->rename(generate_file_id(), "/x").error, VaultErrorCode::NotFound, "missing id");
        ASSERT_CODE(h.vault->rename(id, "..").error, VaultErrorCode::InvalidArgument, "bad path");
        ASSERT_TRUE(h.vault->rename(id, "/docs/b.txt").success, "same path is a no-op");
        PASS();
    }
    {
        TEST(metadata_unavailable);
        h.store->fail_reads = true;
        ASSERT_CODE(h.vault->list("").error, VaultErrorCode::MetadataUnavailable, "list");
        ASSERT_CODE(h.vault->stat(records["/other.txt"].id).error,
                    VaultErrorCode::MetadataUnavailable, "stat");
        h.store->fail_reads = false;
        PASS();
    }

    h.vault->stop();
    {
        TEST(not_started);
        ASSERT_CODE(h.vault->list("").error, VaultErrorCode::MetadataUnavailable, "stopped vault");
        PASS();
    }
    fs::remove_all(h.dir);
}

static void test_vault_delete() {
    std::cout << "\n=== Vault delete ===" << std::endl;
    auto h = make_harness("delete", 3, [](VaultConfig& c) { c.delete_max_attempts = 2; });

    {
        TEST(delete_removes_segments_and_record);
        auto up = upload_string(*h.vault, make_data(3000, 2), "/del.bin");
        ASSERT_TRUE(up.success, up.error.to_string());
        auto before = h.remote_messages();
        auto del = h.vault->remove(up.record.id);
        ASSERT_TRUE(del.success, del.error.to_string());
        ASSERT_EQ(del.segments_deleted, 3u, "three segments");
        ASSERT_EQ(h.remote_messages(), before - 3, "remote messages gone");
        ASSERT_CODE(h.vault->stat(up.record.id).error, VaultErrorCode::NotFound, "record gone");
        ASSERT_CODE(h.vault->remove(up.record.id).error, VaultErrorCode::NotFound, "second delete");
        PASS();
    }
    {
        TEST(partial_delete_keeps_record);
        auto up = upload_string(*h.vault, make_data(3000, 3), "/partial.bin");
        ASSERT_TRUE(up.success, up.error.to_string());
        int64_t stuck = up.record.segments[1].remote_message_id;
        std::atomic<bool> refuse{true};
        h.backend->on_delete = [stuck, &refuse](int, int64_t message_id) -> std::optional<DeleteResult> {
            if (message_id != stuck || !refuse) return std::nullopt;
            DeleteResult r;
            r.status = RemoteStatus::Permanent;
            r.error_message = "Bad Request: message can't be deleted";
            return r;
        };
        h.backend->delete_calls = 0;

        auto del = h.vault->remove(up.record.id);
        ASSERT_TRUE(!del.success, "partial");
        ASSERT_CODE(del.error, VaultErrorCode::PartialDelete, "error code");
        ASSERT_EQ(del.error.remaining_segments.size(), 1u, "one remaining");
        ASSERT_EQ(del.error.remaining_segments[0], 1u, "segment 1 remaining");
        ASSERT_EQ(del.error.bot_id, up.record.segments[1].bot_id, "bot reported");
        ASSERT_TRUE(del.error.to_string().find("remaining segments: 1") != std::string::npos,
                    "to_string lists remaining");
        ASSERT_EQ(h.backend->delete_calls.load(), 3, "permanent error not retried");

        auto st = h.vault->stat(up.record.id);
        ASSERT_TRUE(st.success, "record kept");
        ASSERT_TRUE(st.record.delete_pending(), "marked pending");
        ASSERT_TRUE(st.record.segments[0].remote_deleted, "segment 0 confirmed gone");
        ASSERT_TRUE(!st.record.segments[1].remote_deleted, "segment 1 still live");

        std::string out;
        ASSERT_CODE(download_string(*h.vault, up.record.id, out).error,
                    VaultErrorCode::DownloadIncomplete, "pending record not downloadable");

        refuse = false;
        h.backend->delete_calls = 0;
        auto retry = h.vault->remove(up.record.id);
        ASSERT_TRUE(retry.success, retry.error.to_string());
        ASSERT_EQ(h.backend->delete_calls.load(), 1, "only the remaining segment retried");
        ASSERT_EQ(retry.segments_deleted, 1u, "one deleted");
        ASSERT_CODE(h.vault->stat(up.record.id).error, VaultErrorCode::NotFound, "record gone");
        h.backend->on_delete = nullptr;
        PASS();
    }
    {
        TEST(transient_delete_is_retried);
        auto up = upload_string(*h.vault, "small", "/transient-del.bin");
        ASSERT_TRUE(up.success, up.error.to_string());
        h.backend->delete_calls = 0;
        h.backend->on_delete = [](int n, int64_t) -> std::optional<DeleteResult> {
            if (n != 1) return std::nullopt;
            DeleteResult r;
            r.status = RemoteStatus::Transient;
            r.error_message = "HTTP 503";
            return r;
        };
        auto del = h.vault->remove(up.record.id);
        h.backend->on_delete = nullptr;
        ASSERT_TRUE(del.success, del.error.to_string());
        ASSERT_EQ(h.backend->delete_calls.load(), 2, "retried once");
        PASS();
    }
    {
        TEST(already_absent_segments_count_as_deleted);
        auto up = upload_string(*h.vault, make_data(2048, 4), "/gone.bin");
        ASSERT_TRUE(up.success, up.error.to_string());
        auto victim = h.message_path(up.record.segments[0].remote_message_id);
        fs::remove(victim);
        fs::remove(victim.replace_extension(".json"));
        auto del = h.vault->remove(up.record.id);
        ASSERT_TRUE(del.success, del.error.to_string());
        PASS();
    }

    h.vault->stop();
    fs::remove_all(h.dir);
}

// ---------------------------------------------------------------------------
// 9. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;
    auto tmpdir = make_temp_dir("chatvault-metrics");
    auto prom_path = tmpdir / "chatvault.prom";

    {
        TEST(textfile_written);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {{"chat_id", CHAT_ID}});

        auto cfg = make_vault_config(tmpdir, 2);
        Vault vault(cfg);
        vault.set_metrics(&exporter);
        auto err = vault.start();
        ASSERT_EMPTY(err, "start");

        auto up = upload_string(vault, make_data(2000, 1), "/m.bin");
        ASSERT_TRUE(up.success, up.error.to_string());
        std::string out;
        ASSERT_TRUE(download_string(vault, up.record.id, out).success, "download");

        ASSERT_TRUE(exporter.write_file(), "write");
        auto content = read_file(prom_path);
        for (const char* name : {"chatvault_uploads_total", "chatvault_upload_bytes_total",
                                 "chatvault_downloads_total", "chatvault_segments_uploaded_total",
                                 "chatvault_bots_total", "chatvault_bots_healthy",
                                 "chatvault_upload_duration_seconds"}) {
            ASSERT_TRUE(content.find(name) != std::string::npos,
                        std::string("missing metric ") + name);
        }
        ASSERT_TRUE(content.find("chat_id=\"" + CHAT_ID + "\"") != std::string::npos,
                    "constant label");
        ASSERT_TRUE(!fs::exists(prom_path.string() + ".tmp"), "temp file renamed");
        vault.stop();
        PASS();
    }
    {
        TEST(writer_thread_final_snapshot);
        fs::remove(prom_path);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        exporter.start();
        exporter.stop();
        ASSERT_TRUE(fs::exists(prom_path), "written on stop");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "chatvault test suite" << std::endl;
    std::cout << "====================" << std::endl;

    test_digest();
    test_paths();
    test_config();
    test_bot_pool();
    test_thread_pool();
    test_metadata_store();
    test_transport();
    test_bot_api_replies();
    test_vault_round_trip();
    test_vault_upload_failures();
    test_vault_bot_policy();
    test_vault_integrity();
    test_vault_concurrency();
    test_vault_metadata_ops();
    test_vault_delete();
    test_metrics();

    std::cout << "\n====================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
