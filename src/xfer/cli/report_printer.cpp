// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/cli/report_printer.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace xfer::cli {

namespace chrono = std::chrono;

ReportPrinter::ReportPrinter(std::ostream& out, int bar_width) noexcept
    : out_(out)
    , bar_width_(std::max(bar_width, 1)) {}

void ReportPrinter::print(std::string_view path,
                          const analysis::ChunkLogReport& report,
                          bool list_chunks) const {
    out_ << path << "\n";
    out_ << "  Records: " << report.record_count
         << "  Chunks: " << report.chunks.size()
         << "  Long body reads: " << report.long_body_read_chunks() << "\n";

    chrono::nanoseconds total{0};
    for (auto d : report.time_in_state) {
        total += d;
    }

    out_ << "  Time waiting, by state:\n";
    for (const auto& reason : core::ALL_WAIT_REASONS) {
        auto d = report.time_in_state[static_cast<std::size_t>(reason.index)];
        if (d.count() == 0) continue;

        double share = total.count() > 0
            ? static_cast<double>(d.count()) / static_cast<double>(total.count())
            : 0.0;
        out_ << std::format("    {:<20} {:>12} {} {:>3}%\n",
                            reason.name, format_duration(d), render_bar(share),
                            static_cast<int>(std::round(share * 100.0)));
    }

    if (!report.files_with_long_body_reads.empty()) {
        out_ << "  Files with at least one long body read:\n";
        for (const auto& name : report.files_with_long_body_reads) {
            out_ << "    " << name << "\n";
        }
    }

    if (list_chunks) {
        for (const auto& chunk : report.chunks) {
            print_chunk(chunk);
        }
    }
    out_ << std::flush;
}

void ReportPrinter::print_chunk(const analysis::ChunkTimeline& chunk) const {
    out_ << "  " << chunk.name << " @ " << chunk.offset
         << (chunk.long_body_read ? "  [long body read]" : "") << "\n";
    for (const auto& state : chunk.states) {
        out_ << std::format("    {:<20} {}\n", state.reason.name, format_duration(state.duration));
    }
}

std::string ReportPrinter::render_bar(double share) const {
    share = std::clamp(share, 0.0, 1.0);
    const int filled = static_cast<int>(std::round(bar_width_ * share));
    const int empty = bar_width_ - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += '>';
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += ']';
    return bar;
}

std::string ReportPrinter::format_duration(chrono::nanoseconds d) {
    if (d < chrono::seconds{1}) {
        return std::format("{}ms", chrono::duration_cast<chrono::milliseconds>(d).count());
    }

    auto total_ms = chrono::duration_cast<chrono::milliseconds>(d).count();
    std::uint64_t seconds = static_cast<std::uint64_t>(total_ms / 1000);
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes;
        return ss.str() + "m " + std::to_string(secs) + "s";
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    ss << secs << "." << std::setfill('0') << std::setw(3) << (total_ms % 1000);
    return ss.str() + "s";
}

} // namespace xfer::cli
