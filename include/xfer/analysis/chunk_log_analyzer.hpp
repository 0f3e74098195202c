// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/analysis/chunk_log_reader.hpp>
#include <xfer/core/config.hpp>
#include <xfer/core/wait_reason.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace xfer::analysis {

struct AnalyzerConfig {
    std::chrono::nanoseconds long_body_read{core::LONG_BODY_READ};
};

// Time a chunk spent in one state. The last state of a chunk has zero duration.
struct StateSpan {
    core::WaitReason reason;
    std::chrono::system_clock::time_point start;
    std::chrono::nanoseconds duration{0};
};

struct ChunkTimeline {
    std::string name;
    std::int64_t offset{0};
    std::vector<StateSpan> states;  // Chronological
    bool long_body_read{false};     // Slow Body, or any forced re-read
};

struct ChunkLogReport {
    std::size_t record_count{0};
    std::vector<ChunkTimeline> chunks;                   // By name, then offset
    std::vector<std::string> files_with_long_body_reads; // Sorted, distinct
    std::array<std::chrono::nanoseconds, core::NUM_WAIT_REASONS> time_in_state{};

    [[nodiscard]] std::size_t long_body_read_chunks() const noexcept;
};

// Rebuild per-chunk timelines from log records and find slow body transfers
[[nodiscard]] ChunkLogReport analyze(std::span<const ChunkLogRecord> records,
                                     const AnalyzerConfig& config = {});

} // namespace xfer::analysis
