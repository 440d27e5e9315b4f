// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <splitdl/core/metadata_prober.hpp>
#include "fake_transport.hpp"

using namespace splitdl::core;
using splitdl::test::FakeResource;
using splitdl::test::FakeTransport;

TEST_CASE("MetadataProber::probe", "[probe]") {
    FakeTransport transport;
    MetadataProber prober(transport);
    const std::string url = "https://fake/files/archive%20v2.zip";

    FakeResource res;
    res.body = splitdl::test::make_body(4096);

    SECTION("Size, range support and URL filename") {
        transport.add(url, res);
        auto meta = prober.probe(url);
        CHECK(meta.total_size == 4096);
        CHECK(meta.supports_ranges);
        CHECK(meta.filename == "archive v2.zip");
        CHECK(!prober.last_error());
    }

    SECTION("Probing twice yields identical metadata") {
        res.disposition = "attachment; filename=\"report.pdf\"";
        transport.add(url, res);
        auto first = prober.probe(url);
        auto second = prober.probe(url);
        CHECK(first == second);
        CHECK(transport.head_calls(url) == 2);
    }

    SECTION("Absent Content-Length means unknown size") {
        res.send_content_length = false;
        transport.add(url, res);
        auto meta = prober.probe(url);
        CHECK(meta.total_size == 0);
        CHECK(meta.supports_ranges);
    }

    SECTION("Disposition name wins over the URL") {
        res.disposition = "attachment; filename=\"server%20name.bin\"";
        transport.add(url, res);
        CHECK(prober.probe(url).filename == "server name.bin");
    }

    SECTION("Transport failure degrades to the stream path") {
        res.head_fails = true;
        transport.add(url, res);
        auto meta = prober.probe(url);
        CHECK(meta.total_size == 0);
        CHECK(!meta.supports_ranges);
        CHECK(meta.filename == "archive v2.zip");
        CHECK(prober.last_error() == DownloadErrc::refused);
    }

    SECTION("Failure with a directory URL falls back to a generated name") {
        const std::string dir_url = "https://fake/listing/";
        auto meta = prober.probe(dir_url);
        CHECK(meta.total_size == 0);
        CHECK(meta.filename.rfind("download_", 0) == 0);
        CHECK(prober.last_error());
    }
}

TEST_CASE("parse_content_disposition", "[probe]") {
    CHECK(parse_content_disposition("attachment; filename=\"a.zip\"") == "a.zip");
    CHECK(parse_content_disposition("attachment; filename=plain.txt") == "plain.txt");
    CHECK(parse_content_disposition("inline; filename='quoted.txt'") == "quoted.txt");
    CHECK(parse_content_disposition("attachment; FILENAME=\"Upper.bin\"") == "Upper.bin");

    SECTION("Extended value has priority") {
        CHECK(parse_content_disposition(
                  "attachment; filename=\"fallback.txt\"; filename*=UTF-8''na%C3%AFve%20file.txt")
              == "na\xC3\xAFve file.txt");
    }

    SECTION("Directory parts are stripped") {
        CHECK(parse_content_disposition("attachment; filename=\"../../etc/passwd\"") == "passwd");
        CHECK(parse_content_disposition("attachment; filename=\"..\"").empty());
    }

    SECTION("Semicolons inside quotes belong to the name") {
        CHECK(parse_content_disposition("attachment; filename=\"a;b.zip\"") == "a;b.zip");
        CHECK(parse_content_disposition("attachment; filename=\"x; y.txt\"; size=10") == "x; y.txt");
    }

    SECTION("No filename parameter") {
        CHECK(parse_content_disposition("attachment").empty());
    }
}

TEST_CASE("resolve_filename order", "[probe]") {
    CHECK(resolve_filename("https://h/x/y.iso", "attachment; filename=z.iso") == "z.iso");
    CHECK(resolve_filename("https://h/x/y.iso", "") == "y.iso");
    CHECK(resolve_filename("https://h/x/", "").rfind("download_", 0) == 0);
    CHECK(generated_filename().rfind("download_", 0) == 0);
}
