// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitdl/core/segment.hpp>
#include <splitdl/core/config.hpp>
#include "fake_transport.hpp"

using namespace splitdl::core;
using splitdl::test::FakeResource;
using splitdl::test::FakeTransport;
using splitdl::test::TempDir;

namespace {

void check_plan_covers(const SegmentPlan& plan, std::uint64_t total) {
    std::uint64_t expected_start = 0;
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        CHECK(plan[i].index == i);
        CHECK(plan[i].start == expected_start);
        CHECK(plan[i].end >= plan[i].start);
        sum += plan[i].length();
        expected_start = plan[i].end + 1;
    }
    CHECK(sum == total);
    if (total > 0) {
        CHECK(plan.back().end == total - 1);
    }
}

} // namespace

TEST_CASE("plan_segments splitting math", "[segment]") {
    SECTION("Ten million bytes over four connections") {
        auto plan = plan_segments(10'000'000, 4);
        REQUIRE(plan.size() == 4);
        CHECK(plan[0] == SegmentRange{0, 2'499'999, 0});
        CHECK(plan[1] == SegmentRange{2'500'000, 4'999'999, 1});
        CHECK(plan[2] == SegmentRange{5'000'000, 7'499'999, 2});
        CHECK(plan[3] == SegmentRange{7'500'000, 9'999'999, 3});
    }

    SECTION("Last segment absorbs the remainder") {
        auto plan = plan_segments(103, 4);
        REQUIRE(plan.size() == 4);
        CHECK(plan[0].length() == 25);
        CHECK(plan[3].length() == 28);
        check_plan_covers(plan, 103);
    }

    SECTION("Single connection covers the whole file") {
        auto plan = plan_segments(5'000'000, 1);
        REQUIRE(plan.size() == 1);
        CHECK(plan[0] == SegmentRange{0, 4'999'999, 0});
    }

    SECTION("Fewer bytes than connections") {
        auto plan = plan_segments(3, 8);
        REQUIRE(plan.size() == 3);
        for (const auto& seg : plan) {
            CHECK(seg.length() == 1);
        }
        check_plan_covers(plan, 3);
    }

    SECTION("Empty resource") {
        CHECK(plan_segments(0, 4).empty());
    }

    SECTION("Coverage holds across sizes and counts") {
        auto total = GENERATE(as<std::uint64_t>{}, 1, 2, 7, 1000, 1'048'577, 5'000'000'000);
        auto count = GENERATE(as<std::uint32_t>{}, 1, 2, 3, 8, 32);
        auto plan = plan_segments(total, count);
        CHECK(plan.size() == std::min<std::uint64_t>(total, count));
        check_plan_covers(plan, total);
    }
}

TEST_CASE("Segment downloads its range", "[segment]") {
    TempDir dir;
    const std::string url = "http://fake/file.bin";
    const auto body = splitdl::test::make_body(100'000);

    FakeTransport transport;
    FakeResource res;
    res.body = body;

    auto path = dir.path() / "file.bin";
    splitdl::disk::FileWriter writer;
    REQUIRE(!writer.open_presized(path.string(), body.size()));

    auto progress = std::make_shared<TransferProgress>();
    progress->begin(body.size());

    const RetryPolicy fast{3, std::chrono::milliseconds{1}};

    SECTION("Partial content is written at the segment offset") {
        transport.add(url, res);
        Segment seg({40'000, 59'999, 1}, url, transport, writer, progress, fast);

        CHECK(!seg.run(std::stop_token{}));
        CHECK(seg.state() == SegmentState::completed);
        CHECK(seg.written() == 20'000);
        CHECK(seg.attempts() == 1);
        CHECK(progress->bytes_transferred() == 20'000);
        CHECK(progress->segments_completed() == 1);

        writer.close();
        auto data = splitdl::test::read_file(path);
        REQUIRE(data.size() == body.size());
        CHECK(data.substr(40'000, 20'000) == body.substr(40'000, 20'000));
    }

    SECTION("Full-content reply is trimmed to the range") {
        res.ignore_range = true;
        transport.add(url, res);
        Segment seg({70'000, 99'999, 3}, url, transport, writer, progress, fast);

        CHECK(!seg.run(std::stop_token{}));
        CHECK(seg.written() == 30'000);

        writer.close();
        auto data = splitdl::test::read_file(path);
        CHECK(data.substr(70'000) == body.substr(70'000));
    }

    SECTION("HTTP 416 on every attempt exhausts the retries") {
        res.always_status = 416;
        transport.add(url, res);
        Segment seg({0, 49'999, 0}, url, transport, writer, progress, fast);

        auto ec = seg.run(std::stop_token{});
        CHECK(ec == DownloadErrc::retries_exhausted);
        CHECK(seg.state() == SegmentState::failed);
        CHECK(seg.attempts() == 3);
        CHECK(seg.last_status() == 416);
        CHECK(seg.last_error() == DownloadErrc::invalid_range);
        CHECK(transport.get_calls(url) == 3);
        CHECK(progress->bytes_transferred() == 0);
    }

    SECTION("Transient failure is retried") {
        res.get_statuses = {503};
        transport.add(url, res);
        Segment seg({0, 99'999, 0}, url, transport, writer, progress, fast);

        CHECK(!seg.run(std::stop_token{}));
        CHECK(seg.attempts() == 2);
        CHECK(progress->bytes_transferred() == 100'000);
    }

    SECTION("Retry resumes after the bytes already written") {
        res.short_replies = 1;
        transport.add(url, res);
        Segment seg({0, 63'999, 0}, url, transport, writer, progress, fast);

        CHECK(!seg.run(std::stop_token{}));
        CHECK(seg.attempts() == 2);

        auto ranges = transport.ranges(url);
        REQUIRE(ranges.size() == 2);
        CHECK(ranges[0].first == 0);
        CHECK(ranges[1].first == 32'000);
        CHECK(ranges[1].last == 63'999);

        // Progress never counts the resumed bytes twice
        CHECK(progress->bytes_transferred() == 64'000);

        writer.close();
        CHECK(splitdl::test::read_file(path).substr(0, 64'000) == body.substr(0, 64'000));
    }

    SECTION("Stop before the first attempt") {
        transport.add(url, res);
        std::stop_source stop;
        stop.request_stop();
        Segment seg({0, 99'999, 0}, url, transport, writer, progress, fast);

        CHECK(seg.run(stop.get_token()) == DownloadErrc::cancelled);
        CHECK(seg.state() == SegmentState::cancelled);
        CHECK(transport.get_calls(url) == 0);
    }

    SECTION("Disk errors are not retried") {
        transport.add(url, res);
        writer.close();
        Segment seg({0, 99'999, 0}, url, transport, writer, progress, fast);

        auto ec = seg.run(std::stop_token{});
        CHECK(ec == splitdl::disk::DiskErrc::handle_invalid);
        CHECK(seg.attempts() == 1);
        CHECK(seg.state() == SegmentState::failed);
    }
}
