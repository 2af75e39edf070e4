#pragma once

#include <cstddef>
#include <cstdint>

namespace chatvault::constants {

// Segment sizing
constexpr uint64_t MAX_SEGMENT_BYTES_CEILING = 2000ULL * 1024 * 1024;  // local Bot API server limit
constexpr uint64_t DEFAULT_SEGMENT_BYTES = 256ULL * 1024 * 1024;       // 256 MiB
constexpr size_t DEFAULT_READ_BLOCK_BYTES = 1024 * 1024;               // 1 MiB ranged reads
constexpr size_t DEFAULT_STREAM_BUFFER_SIZE = 64 * 1024;               // 64 KiB

// Concurrency
constexpr size_t DEFAULT_SEGMENT_FAN_OUT = 3;
constexpr size_t DEFAULT_WORKER_THREADS = 12;
constexpr size_t DEFAULT_DELETE_CONCURRENCY = 12;
constexpr size_t DEFAULT_DOWNLOAD_READ_AHEAD = 2;
constexpr size_t DEFAULT_MAX_PER_BOT_IN_FLIGHT = 3;

// Bot pool policy
constexpr uint32_t DEFAULT_FAILURE_THRESHOLD = 3;
constexpr uint32_t DEFAULT_MAX_RATE_LIMIT_SWITCHES = 8;
constexpr int DEFAULT_MAX_POOL_WAIT_SECONDS = 60;
constexpr int DEFAULT_RETRY_AFTER_SECONDS = 1;

// Transport policy
constexpr uint32_t DEFAULT_MAX_LINK_REFRESHES = 3;
constexpr uint32_t DEFAULT_DELETE_MAX_ATTEMPTS = 3;
constexpr int DEFAULT_MAX_RATE_LIMIT_WAIT_SECONDS = 30;

// HTTP request defaults
constexpr int DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 10;
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 600;
constexpr const char* DEFAULT_API_URL = "http://localhost:8081";

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace chatvault::constants
