// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/analysis/chunk_log_reader.hpp>
#include <xfer/core/config.hpp>
#include <xfer/core/transition_event.hpp>
#include <xfer/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace xfer::analysis {

namespace {

constexpr std::size_t FIELD_COUNT = 4;

std::expected<std::int64_t, std::error_code> parse_offset(std::string_view text) noexcept {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(make_error_code(core::ChunkStatusErrc::malformed_record));
    }
    return value;
}

} // namespace

std::expected<std::vector<ChunkLogRecord>, std::error_code>
ChunkLogReader::read(std::string_view path) noexcept {
    try {
        std::ifstream file{std::filesystem::path(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        std::ostringstream contents;
        contents << file.rdbuf();
        if (file.bad()) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }

        auto records = parse(contents.str());
        if (!records) {
            spdlog::error("{}: {}", path, records.error().message());
        }
        return records;
    } catch (const std::exception& e) {
        spdlog::error("cannot read chunk log {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::expected<std::vector<ChunkLogRecord>, std::error_code>
ChunkLogReader::parse(std::string_view text) noexcept {
    auto malformed = std::unexpected(make_error_code(core::ChunkStatusErrc::malformed_record));

    try {
        std::size_t pos = 0;
        std::size_t line = 1;

        auto header = split_record(text, pos);
        if (!header) {
            return std::unexpected(header.error());
        }

        std::string expected_header;
        for (const auto& field : *header) {
            if (!expected_header.empty()) expected_header += ',';
            expected_header += field;
        }
        if (expected_header != core::CHUNK_LOG_HEADER) {
            spdlog::warn("chunk log line 1: unexpected header '{}'", expected_header);
            return malformed;
        }

        std::vector<ChunkLogRecord> records;
        while (pos < text.size()) {
            ++line;
            auto fields = split_record(text, pos);
            if (!fields) {
                spdlog::warn("chunk log line {}: unterminated quoted field", line);
                return std::unexpected(fields.error());
            }
            if (fields->size() == 1 && fields->front().empty()) {
                continue;  // Blank line
            }
            if (fields->size() != FIELD_COUNT) {
                spdlog::warn("chunk log line {}: expected {} fields, got {}", line, FIELD_COUNT, fields->size());
                return malformed;
            }

            auto offset = parse_offset((*fields)[1]);
            auto reason = core::wait_reason_from_name((*fields)[2]);
            auto start = core::parse_timestamp((*fields)[3]);
            if (!offset || !reason || !start) {
                spdlog::warn("chunk log line {}: bad {} field", line,
                             !offset ? "offset" : !reason ? "state" : "time");
                return malformed;
            }

            records.push_back({std::move((*fields)[0]), *offset, *reason, *start});
        }
        return records;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<std::vector<std::string>, std::error_code>
ChunkLogReader::split_record(std::string_view text, std::size_t& pos) {
    std::vector<std::string> fields(1);
    bool quoted = false;

    while (pos < text.size()) {
        char c = text[pos++];

        if (quoted) {
            if (c == '"') {
                if (pos < text.size() && text[pos] == '"') {
                    fields.back() += '"';
                    ++pos;
                } else {
                    quoted = false;
                }
            } else {
                fields.back() += c;
            }
            continue;
        }

        if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.emplace_back();
        } else if (c == '\n') {
            break;
        } else if (c == '\r') {
            if (pos < text.size() && text[pos] == '\n') ++pos;
            break;
        } else {
            fields.back() += c;
        }
    }

    if (quoted) {
        return std::unexpected(make_error_code(core::ChunkStatusErrc::malformed_record));
    }
    return fields;
}

} // namespace xfer::analysis
