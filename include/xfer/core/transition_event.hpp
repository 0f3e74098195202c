// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/core/error.hpp>
#include <xfer/core/wait_reason.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace xfer::core {

// One chunk-log row: the chunk entered `reason` at `start`
struct TransitionEvent {
    std::string name;
    std::int64_t offset{0};
    WaitReason reason;
    std::chrono::system_clock::time_point start;
};

// UTC, fixed width, most significant field first: "2026-10-19 07:43:12.123456789".
// Sorting the strings sorts the times.
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point tp);

[[nodiscard]] std::expected<std::chrono::system_clock::time_point, std::error_code>
parse_timestamp(std::string_view text) noexcept;

// Append a CSV field, quoting it only if it holds a separator, quote or line break
void append_csv_field(std::string& out, std::string_view field);

// Append "<name>,<offset>,<state>,<timestamp>\n"
void append_event_line(std::string& out, const TransitionEvent& event);

} // namespace xfer::core
