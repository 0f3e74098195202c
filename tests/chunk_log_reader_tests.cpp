// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <xfer/analysis/chunk_log_reader.hpp>
#include <xfer/core/transition_event.hpp>
#include <xfer/disk/chunk_event_log.hpp>
#include <xfer/disk/error.hpp>
#include <filesystem>
#include <fstream>

using namespace xfer::analysis;
using namespace xfer::core;

namespace fs = std::filesystem;

namespace {

constexpr const char* HEADER = "Name,Offset,State,StateStartTime\n";

} // namespace

TEST_CASE("ChunkLogReader::split_record", "[reader]") {
    SECTION("Plain fields") {
        std::string_view text = "a.bin,0,Body,2026-01-01 00:00:00.000000000\nnext";
        std::size_t pos = 0;
        auto fields = ChunkLogReader::split_record(text, pos);
        REQUIRE(fields.has_value());
        REQUIRE(fields->size() == 4);
        CHECK((*fields)[0] == "a.bin");
        CHECK((*fields)[2] == "Body");
        CHECK(text.substr(pos) == "next");
    }

    SECTION("Quoted separators and doubled quotes") {
        std::string_view text = "\"say \"\"hi\"\", ok\",1\r\n";
        std::size_t pos = 0;
        auto fields = ChunkLogReader::split_record(text, pos);
        REQUIRE(fields.has_value());
        REQUIRE(fields->size() == 2);
        CHECK((*fields)[0] == "say \"hi\", ok");
        CHECK((*fields)[1] == "1");
        CHECK(pos == text.size());
    }

    SECTION("Line break inside quotes") {
        std::string_view text = "\"two\nlines\",2\n";
        std::size_t pos = 0;
        auto fields = ChunkLogReader::split_record(text, pos);
        REQUIRE(fields.has_value());
        CHECK((*fields)[0] == "two\nlines");
    }

    SECTION("Unterminated quote") {
        std::string_view text = "\"open,0\n";
        std::size_t pos = 0;
        auto fields = ChunkLogReader::split_record(text, pos);
        REQUIRE_FALSE(fields.has_value());
        CHECK(fields.error() == ChunkStatusErrc::malformed_record);
    }
}

TEST_CASE("ChunkLogReader::parse", "[reader]") {
    SECTION("Header only") {
        auto records = ChunkLogReader::parse(HEADER);
        REQUIRE(records.has_value());
        CHECK(records->empty());
    }

    SECTION("Rows become records") {
        std::string text = HEADER;
        text += "a.bin,8388608,Worker,2026-05-01 10:00:00.000000000\n";
        text += "\n";
        text += "\"b,c.bin\",0,BodyReRead-TooSlow,2026-05-01 10:00:01.500000000\n";

        auto records = ChunkLogReader::parse(text);
        REQUIRE(records.has_value());
        REQUIRE(records->size() == 2);

        CHECK((*records)[0].name == "a.bin");
        CHECK((*records)[0].offset == 8388608);
        CHECK((*records)[0].reason == wait_reason::worker_slot);
        CHECK((*records)[1].name == "b,c.bin");
        CHECK((*records)[1].reason == wait_reason::body_reread_slow);
        CHECK((*records)[1].start - (*records)[0].start == std::chrono::milliseconds{1500});
    }

    SECTION("Missing trailing newline") {
        std::string text = HEADER;
        text += "a.bin,0,Done,2026-05-01 10:00:00.000000000";
        auto records = ChunkLogReader::parse(text);
        REQUIRE(records.has_value());
        CHECK(records->size() == 1);
    }

    SECTION("Malformed input") {
        auto check_malformed = [](std::string text) {
            auto records = ChunkLogReader::parse(text);
            REQUIRE_FALSE(records.has_value());
            CHECK(records.error() == ChunkStatusErrc::malformed_record);
        };

        check_malformed("Name,Offset,State\n");
        check_malformed(std::string(HEADER) + "a.bin,0,Body\n");
        check_malformed(std::string(HEADER) + "a.bin,zero,Body,2026-05-01 10:00:00.000000000\n");
        check_malformed(std::string(HEADER) + "a.bin,0,Sleeping,2026-05-01 10:00:00.000000000\n");
        check_malformed(std::string(HEADER) + "a.bin,0,Body,yesterday\n");
        check_malformed(std::string(HEADER) + "\"a.bin,0,Body,2026-05-01 10:00:00.000000000\n");
    }
}

TEST_CASE("ChunkLogReader::read", "[reader]") {
    SECTION("Missing file") {
        auto records = ChunkLogReader::read((fs::temp_directory_path() / "xfer_no_such-chunks.log").string());
        REQUIRE_FALSE(records.has_value());
        CHECK(records.error() == xfer::disk::DiskErrc::file_not_found);
    }

    SECTION("Reads what ChunkEventLog wrote") {
        auto path = fs::temp_directory_path() / "xfer_reader_roundtrip-chunks.log";
        auto now = std::chrono::system_clock::now();

        auto log = xfer::disk::ChunkEventLog::open(path.string(), 16, std::chrono::milliseconds{2});
        REQUIRE(log.has_value());
        (*log)->append({"dir/\"odd\", name.bin", 4096, wait_reason::header_response, now});
        (*log)->append({"dir/\"odd\", name.bin", 4096, wait_reason::cancelled, now + std::chrono::seconds{2}});
        REQUIRE_FALSE((*log)->close());

        auto records = ChunkLogReader::read(path.string());
        REQUIRE(records.has_value());
        REQUIRE(records->size() == 2);
        CHECK((*records)[0].name == "dir/\"odd\", name.bin");
        CHECK((*records)[0].offset == 4096);
        CHECK((*records)[0].reason == wait_reason::header_response);
        CHECK((*records)[0].start == now);
        CHECK((*records)[1].reason == wait_reason::cancelled);

        fs::remove(path);
    }
}
