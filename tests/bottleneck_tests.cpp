// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <xfer/core/bottleneck.hpp>
#include <xfer/core/config.hpp>

using namespace xfer::core;

namespace {

CountSnapshot make_counts(std::initializer_list<std::pair<WaitReason, std::int64_t>> values) {
    CountSnapshot snap;
    for (const auto& [reason, count] : values) {
        snap[reason] = count;
    }
    return snap;
}

} // namespace

TEST_CASE("BottleneckClassifier::upload_disk_constrained", "[bottleneck]") {
    BottleneckClassifier classifier;

    SECTION("No disk activity - not disk bound, whatever the queue") {
        auto counts = make_counts({{wait_reason::ram_to_schedule, 0},
                                   {wait_reason::disk_io, 0},
                                   {wait_reason::worker_slot, 50}});
        CHECK_FALSE(classifier.disk_constrained(counts, true, false));
    }

    SECTION("Reading disk with an almost empty network queue") {
        auto counts = make_counts({{wait_reason::ram_to_schedule, 1},
                                   {wait_reason::disk_io, 0},
                                   {wait_reason::worker_slot, 5}});
        CHECK(classifier.disk_constrained(counts, true, false));
    }

    SECTION("Only DiskIO counts as reading") {
        auto counts = make_counts({{wait_reason::disk_io, 3},
                                   {wait_reason::worker_slot, 0}});
        CHECK(classifier.upload_disk_constrained(counts));
    }

    SECTION("Network queue at the threshold") {
        auto counts = make_counts({{wait_reason::disk_io, 4},
                                   {wait_reason::worker_slot, NEAR_ZERO_NETWORK_QUEUE}});
        CHECK_FALSE(classifier.upload_disk_constrained(counts));

        counts[wait_reason::worker_slot] = NEAR_ZERO_NETWORK_QUEUE - 1;
        CHECK(classifier.upload_disk_constrained(counts));
    }

    SECTION("Body and other states are ignored") {
        auto counts = make_counts({{wait_reason::body, 500},
                                   {wait_reason::sorting, 500}});
        CHECK_FALSE(classifier.upload_disk_constrained(counts));
    }
}

TEST_CASE("BottleneckClassifier::download_disk_constrained", "[bottleneck]") {
    BottleneckClassifier classifier;

    SECTION("Just over the floor and the ratio") {
        auto counts = make_counts({{wait_reason::sorting, 11},
                                   {wait_reason::queue_to_write, 0},
                                   {wait_reason::worker_slot, 1}});
        CHECK(classifier.disk_constrained(counts, false, true));
    }

    SECTION("At the floor is not enough") {
        auto counts = make_counts({{wait_reason::sorting, 10},
                                   {wait_reason::queue_to_write, 0},
                                   {wait_reason::worker_slot, 1}});
        CHECK_FALSE(classifier.disk_constrained(counts, false, true));
    }

    SECTION("Sorting and Queue add up") {
        auto counts = make_counts({{wait_reason::sorting, 6},
                                   {wait_reason::queue_to_write, 6},
                                   {wait_reason::worker_slot, 2}});
        CHECK(classifier.download_disk_constrained(counts));
    }

    SECTION("Ratio is strict") {
        auto counts = make_counts({{wait_reason::sorting, 50},
                                   {wait_reason::worker_slot, 10}});
        CHECK_FALSE(classifier.download_disk_constrained(counts));

        counts[wait_reason::sorting] = 51;
        CHECK(classifier.download_disk_constrained(counts));
    }

    SECTION("Prior chunks are not blamed on disk") {
        auto counts = make_counts({{wait_reason::prior_chunk, 1000},
                                   {wait_reason::sorting, 5},
                                   {wait_reason::worker_slot, 0}});
        CHECK_FALSE(classifier.download_disk_constrained(counts));
    }
}

TEST_CASE("BottleneckClassifier::disk_constrained dispatch", "[bottleneck]") {
    BottleneckClassifier classifier;
    auto upload_bound = make_counts({{wait_reason::ram_to_schedule, 2}});
    auto download_bound = make_counts({{wait_reason::queue_to_write, 40}});

    SECTION("Neither direction") {
        CHECK_FALSE(classifier.disk_constrained(upload_bound, false, false));
        CHECK_FALSE(classifier.disk_constrained(download_bound, false, false));
    }

    SECTION("Upload wins when both flags are set") {
        CHECK(classifier.disk_constrained(upload_bound, true, true));
        CHECK_FALSE(classifier.disk_constrained(download_bound, true, true));
    }

    SECTION("Download only") {
        CHECK(classifier.disk_constrained(download_bound, false, true));
        CHECK_FALSE(classifier.disk_constrained(upload_bound, false, true));
    }
}

TEST_CASE("BottleneckClassifier custom thresholds", "[bottleneck]") {
    BottleneckThresholds thresholds;
    thresholds.near_zero_network_queue = 2;
    thresholds.active_disk_queue = 3;
    thresholds.disk_dominance_factor = 2;
    BottleneckClassifier classifier(thresholds);

    CHECK(classifier.thresholds().active_disk_queue == 3);

    auto upload = make_counts({{wait_reason::disk_io, 1}, {wait_reason::worker_slot, 5}});
    CHECK_FALSE(classifier.upload_disk_constrained(upload));

    auto download = make_counts({{wait_reason::sorting, 4}, {wait_reason::worker_slot, 1}});
    CHECK(classifier.download_disk_constrained(download));
}
