// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitdl/core/stream_transfer.hpp>
#include "fake_transport.hpp"

using namespace splitdl::core;
using splitdl::test::FakeResource;
using splitdl::test::FakeTransport;
using splitdl::test::TempDir;

TEST_CASE("StreamTransfer writes the whole body", "[stream]") {
    TempDir dir;
    const std::string url = "http://fake/stream.dat";
    const auto body = splitdl::test::make_body(100'003);

    FakeTransport transport;
    FakeResource res;
    res.body = body;
    res.accept_ranges = false;

    auto path = dir.path() / "stream.dat";
    splitdl::disk::FileWriter writer;
    REQUIRE(!writer.open_stream(path.string()));

    auto progress = std::make_shared<TransferProgress>();
    progress->begin(body.size());

    SECTION("Chunks larger than the body") {
        transport.add(url, res);
        StreamTransfer transfer(url, transport, writer, progress, 1024 * 1024);
        CHECK(!transfer.run(std::stop_token{}));
        CHECK(transfer.status() == 200);
        CHECK(transfer.written() == body.size());
        CHECK(progress->bytes_transferred() == body.size());

        writer.close();
        CHECK(splitdl::test::read_file(path) == body);
    }

    SECTION("Progress advances one chunk at a time") {
        transport.add(url, res);
        StreamTransfer transfer(url, transport, writer, progress, 10'000);
        CHECK(!transfer.run(std::stop_token{}));
        CHECK(transfer.written() == body.size());

        writer.close();
        CHECK(splitdl::test::read_file(path) == body);
    }

    SECTION("Non-200 status is terminal and not retried") {
        res.always_status = 500;
        transport.add(url, res);
        StreamTransfer transfer(url, transport, writer, progress, 4096);
        CHECK(transfer.run(std::stop_token{}) == DownloadErrc::server_error);
        CHECK(transfer.status() == 500);
        CHECK(transport.get_calls(url) == 1);
        CHECK(progress->bytes_transferred() == 0);
    }

    SECTION("Partial content status is rejected") {
        res.always_status = 206;
        transport.add(url, res);
        StreamTransfer transfer(url, transport, writer, progress, 4096);
        CHECK(transfer.run(std::stop_token{}));
        CHECK(transfer.written() == 0);
    }

    SECTION("Stop aborts the transfer") {
        res.piece_delay = std::chrono::milliseconds{2};
        transport.add(url, res);
        std::stop_source stop;
        stop.request_stop();
        StreamTransfer transfer(url, transport, writer, progress, 4096);
        CHECK(transfer.run(stop.get_token()) == DownloadErrc::cancelled);
    }

    SECTION("Write failure surfaces as a disk error") {
        transport.add(url, res);
        writer.close();
        StreamTransfer transfer(url, transport, writer, progress, 4096);
        CHECK(transfer.run(std::stop_token{}) == splitdl::disk::DiskErrc::handle_invalid);
    }
}
