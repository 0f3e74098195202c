// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/core/error.hpp>
#include <xfer/core/wait_reason.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace xfer::analysis {

// One parsed row of a chunk log
struct ChunkLogRecord {
    std::string name;
    std::int64_t offset{0};
    core::WaitReason reason;
    std::chrono::system_clock::time_point start;
};

// Reads the CSV written by ChunkEventLog
class ChunkLogReader {
public:
    [[nodiscard]] static std::expected<std::vector<ChunkLogRecord>, std::error_code>
    read(std::string_view path) noexcept;

    // Parse log text. The first record must be the header.
    [[nodiscard]] static std::expected<std::vector<ChunkLogRecord>, std::error_code>
    parse(std::string_view text) noexcept;

    // Split one CSV record starting at pos, advancing pos past its line break.
    // Quoted fields may hold separators, doubled quotes and line breaks.
    [[nodiscard]] static std::expected<std::vector<std::string>, std::error_code>
    split_record(std::string_view text, std::size_t& pos);
};

} // namespace xfer::analysis
