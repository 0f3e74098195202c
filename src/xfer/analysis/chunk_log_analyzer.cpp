// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/analysis/chunk_log_analyzer.hpp>
#include <algorithm>
#include <map>
#include <utility>

namespace xfer::analysis {

namespace {

bool is_reread(core::WaitReason reason) noexcept {
    return reason == core::wait_reason::body_reread_low_memory
        || reason == core::wait_reason::body_reread_slow;
}

} // namespace

std::size_t ChunkLogReport::long_body_read_chunks() const noexcept {
    return static_cast<std::size_t>(std::ranges::count_if(chunks, &ChunkTimeline::long_body_read));
}

ChunkLogReport analyze(std::span<const ChunkLogRecord> records, const AnalyzerConfig& config) {
    ChunkLogReport report;
    report.record_count = records.size();

    std::map<std::pair<std::string, std::int64_t>, ChunkTimeline> by_chunk;
    for (const auto& rec : records) {
        auto [it, inserted] = by_chunk.try_emplace(std::make_pair(rec.name, rec.offset));
        if (inserted) {
            it->second.name = rec.name;
            it->second.offset = rec.offset;
        }
        it->second.states.push_back({rec.reason, rec.start, {}});
    }

    report.chunks.reserve(by_chunk.size());
    for (auto& [key, chunk] : by_chunk) {
        // Rows from different workers can land slightly out of order
        std::ranges::stable_sort(chunk.states, {}, &StateSpan::start);

        for (std::size_t i = 0; i + 1 < chunk.states.size(); ++i) {
            chunk.states[i].duration = chunk.states[i + 1].start - chunk.states[i].start;
        }

        for (const auto& state : chunk.states) {
            report.time_in_state[static_cast<std::size_t>(state.reason.index)] += state.duration;

            if ((state.reason == core::wait_reason::body && state.duration > config.long_body_read)
                || is_reread(state.reason)) {
                chunk.long_body_read = true;
            }
        }

        if (chunk.long_body_read
            && (report.files_with_long_body_reads.empty()
                || report.files_with_long_body_reads.back() != chunk.name)) {
            // Map order is by name, so equal names are adjacent
            report.files_with_long_body_reads.push_back(chunk.name);
        }
        report.chunks.push_back(std::move(chunk));
    }

    return report;
}

} // namespace xfer::analysis
