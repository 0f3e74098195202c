// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <xfer/core/config.hpp>
#include <xfer/disk/chunk_event_log.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

using namespace xfer::core;
using namespace xfer::disk;

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds FAST_POLL{2};

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string slurp(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

TransitionEvent make_event(std::string name, std::int64_t offset, WaitReason reason) {
    return {std::move(name), offset, reason, std::chrono::system_clock::now()};
}

} // namespace

TEST_CASE("ChunkEventLog drains everything on close", "[event_log]") {
    auto dir = fs::temp_directory_path() / "xfer_event_log_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    auto path = dir / "job-chunks.log";

    SECTION("K events give K rows plus the header") {
        constexpr int K = 10'000;
        auto log = ChunkEventLog::open(path.string(), EVENT_QUEUE_CAPACITY, FAST_POLL);
        REQUIRE(log.has_value());

        for (int i = 0; i < K; ++i) {
            (*log)->append(make_event("file.bin", static_cast<std::int64_t>(i) * 4096, wait_reason::body));
        }
        REQUIRE_FALSE((*log)->close());
        CHECK((*log)->written() == K);
        CHECK((*log)->dropped() == 0);
        CHECK((*log)->pending() == 0);

        auto contents = slurp(path);
        REQUIRE_FALSE(contents.empty());
        CHECK(contents.back() == '\n');

        auto lines = read_lines(path);
        REQUIRE(lines.size() == K + 1);
        CHECK(lines.front() == CHUNK_LOG_HEADER);
        CHECK(lines[1].starts_with("file.bin,0,Body,"));
        CHECK(lines.back().starts_with("file.bin," + std::to_string((K - 1) * 4096) + ",Body,"));
    }

    SECTION("Events from many threads all arrive") {
        constexpr int THREADS = 8;
        constexpr int PER_THREAD = 1000;
        auto log = ChunkEventLog::open(path.string(), EVENT_QUEUE_CAPACITY, FAST_POLL);
        REQUIRE(log.has_value());

        std::vector<std::thread> threads;
        for (int t = 0; t < THREADS; ++t) {
            threads.emplace_back([&log, t] {
                for (int i = 0; i < PER_THREAD; ++i) {
                    (*log)->append(make_event("t" + std::to_string(t), i, wait_reason::disk_io));
                }
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE_FALSE((*log)->close());
        CHECK(read_lines(path).size() == THREADS * PER_THREAD + 1);
    }

    SECTION("Header only when nothing happened") {
        auto log = ChunkEventLog::open(path.string(), EVENT_QUEUE_CAPACITY, FAST_POLL);
        REQUIRE(log.has_value());
        REQUIRE_FALSE((*log)->close());
        CHECK(slurp(path) == std::string(CHUNK_LOG_HEADER) + "\n");
    }

    SECTION("Previous run's log is replaced") {
        std::ofstream(path) << "stale\nrows\n";
        auto log = ChunkEventLog::open(path.string(), EVENT_QUEUE_CAPACITY, FAST_POLL);
        REQUIRE(log.has_value());
        (*log)->append(make_event("new.bin", 0, wait_reason::chunk_done));
        REQUIRE_FALSE((*log)->close());

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 2);
        CHECK(lines[1].starts_with("new.bin,0,Done,"));
    }

    SECTION("Destructor closes and flushes") {
        {
            auto log = ChunkEventLog::open(path.string(), EVENT_QUEUE_CAPACITY, FAST_POLL);
            REQUIRE(log.has_value());
            (*log)->append(make_event("a.bin", 1, wait_reason::sorting));
            (*log)->append(make_event("a.bin", 1, wait_reason::queue_to_write));
        }
        CHECK(read_lines(path).size() == 3);
    }

    fs::remove_all(dir);
}

TEST_CASE("ChunkEventLog shutdown races", "[event_log]") {
    auto dir = fs::temp_directory_path() / "xfer_event_log_race_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    auto path = dir / "job-chunks.log";

    SECTION("Late event after close is dropped quietly") {
        auto log = ChunkEventLog::open(path.string(), EVENT_QUEUE_CAPACITY, FAST_POLL);
        REQUIRE(log.has_value());
        (*log)->append(make_event("x.bin", 0, wait_reason::body));
        REQUIRE_FALSE((*log)->close());

        REQUIRE_NOTHROW((*log)->append(make_event("x.bin", 0, wait_reason::chunk_done)));
        CHECK((*log)->dropped() == 1);
        CHECK((*log)->written() == 1);
        CHECK(read_lines(path).size() == 2);
    }

    SECTION("Close is idempotent") {
        auto log = ChunkEventLog::open(path.string(), EVENT_QUEUE_CAPACITY, FAST_POLL);
        REQUIRE(log.has_value());
        CHECK_FALSE((*log)->close());
        CHECK_FALSE((*log)->close());
        CHECK((*log)->is_closed());
    }

    SECTION("Full queue drops instead of blocking") {
        auto log = ChunkEventLog::open(path.string(), 1, FAST_POLL);
        REQUIRE(log.has_value());
        for (int i = 0; i < 1000; ++i) {
            (*log)->append(make_event("burst.bin", i, wait_reason::body));
        }
        REQUIRE_FALSE((*log)->close());
        CHECK((*log)->written() + (*log)->dropped() == 1000);
        CHECK(read_lines(path).size() == (*log)->written() + 1);
    }

    fs::remove_all(dir);
}

TEST_CASE("ChunkEventLog::open failures", "[event_log]") {
    SECTION("Directory does not exist") {
        auto path = fs::temp_directory_path() / "xfer_no_such_dir" / "nested" / "job-chunks.log";
        auto log = ChunkEventLog::open(path.string());
        REQUIRE_FALSE(log.has_value());
        CHECK(log.error() == DiskErrc::file_not_found);
    }

    SECTION("Zero capacity") {
        auto path = fs::temp_directory_path() / "xfer_zero_capacity-chunks.log";
        auto log = ChunkEventLog::open(path.string(), 0);
        REQUIRE_FALSE(log.has_value());
        CHECK(log.error() == ChunkStatusErrc::invalid_argument);
    }
}
