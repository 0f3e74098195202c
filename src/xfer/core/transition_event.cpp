// Copyright (c) 2026 changcheng967. All rights reserved.

#include <xfer/core/transition_event.hpp>
#include <charconv>
#include <format>

namespace xfer::core {

namespace chrono = std::chrono;

namespace {

constexpr std::size_t TIMESTAMP_WIDTH = 29;  // "YYYY-MM-DD HH:MM:SS.nnnnnnnnn"

// Parse a fixed-width unsigned field, rejecting signs and short reads
bool parse_field(std::string_view text, std::size_t pos, std::size_t len, unsigned& out) noexcept {
    auto field = text.substr(pos, len);
    if (field.empty() || field.front() < '0' || field.front() > '9') return false;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), out);
    return ec == std::errc{} && ptr == field.data() + field.size();
}

} // namespace

std::string format_timestamp(chrono::system_clock::time_point tp) {
    auto ns = chrono::floor<chrono::nanoseconds>(tp);
    auto day = chrono::floor<chrono::days>(ns);
    chrono::year_month_day ymd{day};
    chrono::hh_mm_ss hms{ns - day};

    return std::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:09}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count(),
                       hms.subseconds().count());
}

std::expected<chrono::system_clock::time_point, std::error_code>
parse_timestamp(std::string_view text) noexcept {
    auto malformed = std::unexpected(make_error_code(ChunkStatusErrc::malformed_record));

    if (text.size() != TIMESTAMP_WIDTH
        || text[4] != '-' || text[7] != '-' || text[10] != ' '
        || text[13] != ':' || text[16] != ':' || text[19] != '.') {
        return malformed;
    }

    unsigned year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, nanos = 0;
    if (!parse_field(text, 0, 4, year) || !parse_field(text, 5, 2, month)
        || !parse_field(text, 8, 2, day) || !parse_field(text, 11, 2, hour)
        || !parse_field(text, 14, 2, minute) || !parse_field(text, 17, 2, second)
        || !parse_field(text, 20, 9, nanos)) {
        return malformed;
    }

    chrono::year_month_day ymd{chrono::year{static_cast<int>(year)},
                               chrono::month{month},
                               chrono::day{day}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 59) {
        return malformed;
    }

    auto tp = chrono::sys_days{ymd}
            + chrono::hours{hour}
            + chrono::minutes{minute}
            + chrono::seconds{second}
            + chrono::nanoseconds{nanos};
    return chrono::time_point_cast<chrono::system_clock::duration>(tp);
}

void append_csv_field(std::string& out, std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        out += field;
        return;
    }

    out += '"';
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
}

void append_event_line(std::string& out, const TransitionEvent& event) {
    append_csv_field(out, event.name);
    out += ',';
    out += std::to_string(event.offset);
    out += ',';
    out += event.reason.name;
    out += ',';
    out += format_timestamp(event.start);
    out += '\n';
}

} // namespace xfer::core
