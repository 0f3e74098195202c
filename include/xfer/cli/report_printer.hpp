// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <xfer/analysis/chunk_log_analyzer.hpp>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace xfer::cli {

// Prints a chunk log report as text
class ReportPrinter {
public:
    explicit ReportPrinter(std::ostream& out, int bar_width = 30) noexcept;

    void print(std::string_view path,
               const analysis::ChunkLogReport& report,
               bool list_chunks) const;

    [[nodiscard]] static std::string format_duration(std::chrono::nanoseconds d);

    // "[=====>      ]" for a share between 0 and 1
    [[nodiscard]] std::string render_bar(double share) const;

private:
    void print_chunk(const analysis::ChunkTimeline& chunk) const;

    std::ostream& out_;
    int bar_width_;
};

} // namespace xfer::cli
