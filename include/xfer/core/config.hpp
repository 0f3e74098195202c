// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace xfer::core {

// Chunk event log
constexpr std::size_t EVENT_QUEUE_CAPACITY = 1'000'000;             // Caps memory, never reached in practice
constexpr std::chrono::milliseconds CLOSE_POLL_INTERVAL{100};
constexpr std::size_t EVENT_LOG_BUFFER_SIZE = 256 * 1024;           // 256 KB
constexpr std::size_t EVENT_DRAIN_BATCH = 4096;
constexpr std::string_view CHUNK_LOG_SUFFIX = "-chunks.log";
constexpr std::string_view CHUNK_LOG_HEADER = "Name,Offset,State,StateStartTime";

// Bottleneck heuristics. Unvalidated guesses, kept overridable.
constexpr std::int64_t NEAR_ZERO_NETWORK_QUEUE = 10;                // Upload: "almost nothing" queued for network
constexpr std::int64_t ACTIVE_DISK_QUEUE_THRESHOLD = 10;            // Download: floor for the disk queue
constexpr std::int64_t DISK_DOMINANCE_FACTOR = 5;                   // Download: disk queue vs network queue

// Offline analysis
constexpr std::chrono::seconds LONG_BODY_READ{30};

} // namespace xfer::core
