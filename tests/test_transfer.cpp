// Transfer engine tests for swiftstore.
//
// Tests:
//   1. ChunkedFileSegmenter planning and iteration
//   2. BoundedRangeReader bounds, blocks and handle lifetime
//   3. HashingUploadPipe digests over every source kind
//   4. ObjectWriter status and ETag verification
//   5. MultipartUploadCoordinator: single-shot, parts, manifest, failures
//   6. Listing cursor and lazy list pagination

#include "test_support.hpp"

#include "swiftstore/storage/byte_source.hpp"
#include "swiftstore/storage/chunk_reader.hpp"
#include "swiftstore/storage/hashing_pipe.hpp"
#include "swiftstore/storage/listing.hpp"
#include "swiftstore/storage/multipart_upload.hpp"
#include "swiftstore/storage/object_writer.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <sstream>

using namespace swiftstore;

// ---------------------------------------------------------------------------
// 1. ChunkedFileSegmenter
// ---------------------------------------------------------------------------

static void test_segmenter() {
    std::cout << "\n=== ChunkedFileSegmenter ===" << std::endl;

    {
        TEST(plan_partitions_range);
        const uint64_t sizes[] = {0, 1, 9, 10, 11, 25, 100, 1023};
        const uint64_t chunks[] = {1, 3, 10, 32, 4096};
        for (uint64_t s : sizes) {
            for (uint64_t c : chunks) {
                auto segments = ChunkedFileSegmenter::plan(s, c);
                ASSERT_EQ(segments.size(), (s + c - 1) / c, "segment count");
                uint64_t expected_start = 0;
                for (const auto& seg : segments) {
                    ASSERT_EQ(seg.start, expected_start, "segments must be contiguous");
                    ASSERT_TRUE(seg.end > seg.start, "segments must be non-empty");
                    ASSERT_TRUE(seg.length() <= c, "segment longer than chunk");
                    expected_start = seg.end;
                }
                ASSERT_EQ(expected_start, s, "segments must cover the whole size");
                if (s > 0) {
                    uint64_t last = s % c == 0 ? c : s % c;
                    ASSERT_EQ(segments.back().length(), last, "last segment length");
                }
            }
        }
        PASS();
    }

    auto tmpdir = make_temp_dir("swiftstore-seg");

    {
        TEST(iterates_file_segments);
        auto path = tmpdir / "data.bin";
        auto payload = make_payload(25);
        write_file(path, payload);

        ChunkedFileSegmenter segmenter(path, 10, 4);
        ASSERT_EQ(segmenter.total_size(), 25u, "total size");
        ASSERT_EQ(segmenter.segment_count(), 3u, "segment count");

        std::vector<Segment> seen;
        std::string reassembled;
        while (auto reader = segmenter.next()) {
            seen.push_back(reader->segment());
            for (auto block = reader->next_block(); !block.empty(); block = reader->next_block()) {
                reassembled.append(reinterpret_cast<const char*>(block.data()), block.size());
            }
        }
        ASSERT_TRUE(seen == ChunkedFileSegmenter::plan(25, 10), "segments should match plan");
        ASSERT_EQ(reassembled, payload, "segments should reassemble to the file");
        ASSERT_TRUE(segmenter.done(), "segmenter should be done");
        ASSERT_TRUE(segmenter.next() == nullptr, "exhausted segmenter yields nothing");
        PASS();
    }
    {
        TEST(exact_multiple_has_no_empty_tail);
        auto path = tmpdir / "exact.bin";
        write_file(path, make_payload(30));

        ChunkedFileSegmenter segmenter(path, 10);
        std::vector<uint64_t> lengths;
        while (auto reader = segmenter.next()) {
            lengths.push_back(reader->segment().length());
        }
        ASSERT_EQ(lengths.size(), 3u, "three segments");
        ASSERT_EQ(lengths.back(), 10u, "last segment is a full chunk");
        PASS();
    }
    {
        TEST(empty_file_yields_nothing);
        auto path = tmpdir / "empty.bin";
        write_file(path, "");
        ChunkedFileSegmenter segmenter(path, 10);
        ASSERT_EQ(segmenter.segment_count(), 0u, "no segments");
        ASSERT_TRUE(segmenter.next() == nullptr, "no reader");
        PASS();
    }
    {
        TEST(zero_chunk_size_rejected);
        auto path = tmpdir / "data.bin";
        ASSERT_THROWS(ChunkedFileSegmenter(path, 0), std::invalid_argument,
                      "chunk size 0 should throw");
        ASSERT_THROWS(ChunkedFileSegmenter::plan(10, 0), std::invalid_argument,
                      "plan with chunk size 0 should throw");
        PASS();
    }
    {
        TEST(missing_file_rejected);
        ASSERT_THROWS(ChunkedFileSegmenter(tmpdir / "nope.bin", 10), StorageError,
                      "missing file should throw StorageError");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 2. BoundedRangeReader
// ---------------------------------------------------------------------------

static void test_range_reader() {
    std::cout << "\n=== BoundedRangeReader ===" << std::endl;

    auto tmpdir = make_temp_dir("swiftstore-range");
    auto path = tmpdir / "data.bin";
    auto payload = make_payload(64);
    write_file(path, payload);

    {
        TEST(blocks_are_clipped_to_range);
        BoundedRangeReader reader(path, 3, 20, 4);
        std::vector<size_t> sizes;
        std::string got;
        for (auto block = reader.next_block(); !block.empty(); block = reader.next_block()) {
            sizes.push_back(block.size());
            got.append(reinterpret_cast<const char*>(block.data()), block.size());
        }
        ASSERT_TRUE((sizes == std::vector<size_t>{4, 4, 4, 4, 1}), "block sizes");
        ASSERT_EQ(got, payload.substr(3, 17), "range content");
        ASSERT_EQ(reader.bytes_read(), 17u, "bytes read");
        PASS();
    }
    {
        TEST(handle_released_at_bound);
        BoundedRangeReader reader(path, 0, 8, 8);
        ASSERT_TRUE(reader.is_open(), "open before reading");
        auto block = reader.next_block();
        ASSERT_EQ(block.size(), 8u, "one full block");
        ASSERT_TRUE(!reader.is_open(), "closed once the bound is reached");
        ASSERT_TRUE(reader.next_block().empty(), "end stays end");
        ASSERT_TRUE(reader.next_block().empty(), "end stays end (again)");
        PASS();
    }
    {
        TEST(empty_range);
        BoundedRangeReader reader(path, 10, 10);
        ASSERT_TRUE(!reader.is_open(), "empty range holds no handle");
        ASSERT_TRUE(reader.next_block().empty(), "no data");
        ASSERT_EQ(reader.size_hint().value_or(99), 0u, "size hint");
        PASS();
    }
    {
        TEST(invalid_arguments);
        ASSERT_THROWS(BoundedRangeReader(path, 10, 5), std::invalid_argument, "end before start");
        ASSERT_THROWS(BoundedRangeReader(path, 0, 5, 0), std::invalid_argument, "zero block size");
        ASSERT_THROWS(BoundedRangeReader(tmpdir / "missing", 0, 5), StorageError, "missing file");
        PASS();
    }
    {
        TEST(short_read_detected);
        auto short_path = tmpdir / "shrinking.bin";
        write_file(short_path, make_payload(100));
        BoundedRangeReader reader(short_path, 0, 100, 8);
        fs::resize_file(short_path, 10);

        bool thrown = false;
        try {
            for (auto block = reader.next_block(); !block.empty(); block = reader.next_block()) {
            }
        } catch (const StorageError&) {
            thrown = true;
        }
        ASSERT_TRUE(thrown, "truncated file should raise StorageError");
        ASSERT_TRUE(!reader.is_open(), "handle released after the error");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 3. HashingUploadPipe
// ---------------------------------------------------------------------------

static std::string drain(ByteSource& source) {
    std::string out;
    for (auto block = source.next_block(); !block.empty(); block = source.next_block()) {
        out.append(reinterpret_cast<const char*>(block.data()), block.size());
    }
    return out;
}

static void test_hashing_pipe() {
    std::cout << "\n=== HashingUploadPipe ===" << std::endl;

    {
        TEST(known_digests);
        BufferSource empty;
        HashingUploadPipe p1(empty);
        drain(p1);
        ASSERT_EQ(p1.hexdigest(), "d41d8cd98f00b204e9800998ecf8427e", "md5 of empty");

        BufferSource abc(std::string("abc"));
        HashingUploadPipe p2(abc);
        drain(p2);
        ASSERT_EQ(p2.hexdigest(), "900150983cd24fb0d6963f7d28e17f72", "md5 of abc");

        BufferSource abc2(std::string("abc"));
        HashingUploadPipe p3(abc2, "sha256");
        drain(p3);
        ASSERT_EQ(p3.hexdigest(),
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                  "sha256 of abc");
        PASS();
    }
    {
        TEST(stream_digest_matches_one_pass);
        auto payload = make_payload(10000);
        std::istringstream in(payload);
        StreamSource source(in, 7);
        HashingUploadPipe pipe(source);
        auto sent = drain(pipe);
        ASSERT_EQ(sent, payload, "bytes pass through unchanged");
        ASSERT_EQ(pipe.bytes_transferred(), payload.size(), "bytes counted");
        ASSERT_EQ(pipe.hexdigest(), md5_hex(payload), "digest equals direct hash");
        PASS();
    }
    {
        TEST(generator_digest_matches_one_pass);
        std::vector<std::string> pieces = {"hello", "", " ", "world", "!"};
        size_t next = 0;
        GeneratorSource source([&](std::vector<uint8_t>& block) {
            if (next >= pieces.size()) return false;
            const auto& p = pieces[next++];
            block.assign(p.begin(), p.end());
            return true;
        });
        HashingUploadPipe pipe(source);
        ASSERT_EQ(drain(pipe), "hello world!", "generator pieces concatenated");
        ASSERT_EQ(pipe.hexdigest(), md5_hex("hello world!"), "digest equals direct hash");
        PASS();
    }
    {
        TEST(range_digest_matches_one_pass);
        auto tmpdir = make_temp_dir("swiftstore-hash");
        auto path = tmpdir / "data.bin";
        auto payload = make_payload(5000);
        write_file(path, payload);

        BoundedRangeReader reader(path, 1000, 3500, 512);
        HashingUploadPipe pipe(reader, "sha1");
        drain(pipe);
        ASSERT_EQ(pipe.bytes_transferred(), 2500u, "bytes counted");
        auto slice = payload.substr(1000, 2500);
        ASSERT_EQ(pipe.hexdigest(),
                  HashingUploadPipe::digest(std::span<const uint8_t>(
                      reinterpret_cast<const uint8_t*>(slice.data()), slice.size()), "sha1"),
                  "digest equals direct hash");
        fs::remove_all(tmpdir);
        PASS();
    }
    {
        TEST(digest_before_drain_rejected);
        BufferSource source(std::string("abc"));
        HashingUploadPipe pipe(source);
        ASSERT_THROWS(pipe.hexdigest(), std::logic_error, "digest before drain should throw");
        PASS();
    }
    {
        TEST(unknown_algorithm_rejected);
        BufferSource source(std::string("abc"));
        ASSERT_THROWS(HashingUploadPipe(source, "no-such-digest"), std::invalid_argument,
                      "unknown algorithm should throw");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. ObjectWriter
// ---------------------------------------------------------------------------

static void test_object_writer() {
    std::cout << "\n=== ObjectWriter ===" << std::endl;

    Container container{"photos"};

    {
        TEST(put_sends_headers_and_body);
        StubTransport transport;
        transport.set_responder(echo_etag);
        ObjectWriter writer(transport);

        BufferSource source(std::string("payload"));
        auto result = writer.put(container, "a b.txt", source, "text/plain",
                                 {{"Owner", "alice"}}, true);

        auto reqs = transport.requests();
        ASSERT_EQ(reqs.size(), 1u, "one request");
        ASSERT_TRUE(reqs[0].method == net::HttpMethod::PUT, "PUT");
        ASSERT_EQ(reqs[0].path, "/photos/a%20b.txt", "quoted path");
        ASSERT_EQ(reqs[0].body, "payload", "body");
        ASSERT_EQ(reqs[0].headers.get("X-Object-Meta-Owner").value_or(""), "alice", "meta header");
        ASSERT_EQ(reqs[0].headers.content_type().value_or(""), "text/plain", "content type");
        ASSERT_EQ(result.bytes_transferred, 7u, "bytes");
        ASSERT_EQ(result.local_hash, md5_hex("payload"), "local hash");
        ASSERT_EQ(result.server_hash, result.local_hash, "server hash");
        PASS();
    }
    {
        TEST(hash_mismatch_carries_both_digests);
        StubTransport transport;
        transport.push(created_with_etag("deadbeef"));
        ObjectWriter writer(transport);

        BufferSource source(std::string("payload"));
        bool thrown = false;
        try {
            writer.put(container, "obj", source, "", {}, true);
        } catch (const ObjectHashMismatchError& e) {
            thrown = true;
            ASSERT_EQ(e.object_name(), "obj", "object name");
            ASSERT_EQ(e.expected(), md5_hex("payload"), "expected is the local digest");
            ASSERT_EQ(e.actual(), "deadbeef", "actual is the server digest");
        }
        ASSERT_TRUE(thrown, "mismatch should throw");
        PASS();
    }
    {
        TEST(quoted_etag_accepted);
        StubTransport transport;
        transport.push(created_with_etag("\"" + md5_hex("x") + "\""));
        ObjectWriter writer(transport);
        BufferSource source(std::string("x"));
        auto result = writer.put(container, "obj", source, "", {}, true);
        ASSERT_EQ(result.server_hash, md5_hex("x"), "quotes stripped");
        PASS();
    }
    {
        TEST(missing_etag);
        StubTransport transport;
        transport.push(status_response(201));
        transport.push(status_response(201));
        ObjectWriter writer(transport);

        BufferSource s1(std::string("x"));
        bool thrown = false;
        try {
            writer.put(container, "obj", s1, "", {}, true);
        } catch (const ObjectHashMismatchError&) {
            FAIL("missing etag is not a mismatch");
            return;
        } catch (const StorageError& e) {
            thrown = std::string(e.what()).find("etag") != std::string::npos;
        }
        ASSERT_TRUE(thrown, "missing etag should throw when verifying");

        BufferSource s2(std::string("x"));
        auto result = writer.put(container, "obj", s2, "", {}, false);
        ASSERT_EQ(result.server_hash, "", "no server hash");
        PASS();
    }
    {
        TEST(status_mapping);
        StubTransport transport;
        transport.push(status_response(417));
        transport.push(status_response(500));
        ObjectWriter writer(transport);

        BufferSource s1(std::string("x"));
        try {
            writer.put(container, "obj", s1, "", {}, true);
            FAIL("417 should throw");
            return;
        } catch (const UnexpectedStatusError&) {
            FAIL("417 has its own message");
            return;
        } catch (const StorageError& e) {
            ASSERT_EQ(std::string(e.what()), "Missing content-type header", "417 message");
        }

        BufferSource s2(std::string("x"));
        try {
            writer.put(container, "obj", s2, "", {}, true);
            FAIL("500 should throw");
            return;
        } catch (const UnexpectedStatusError& e) {
            ASSERT_EQ(e.status(), 500, "status carried");
        }
        PASS();
    }
    {
        TEST(invalid_container_rejected_before_request);
        StubTransport transport;
        ObjectWriter writer(transport);
        BufferSource source(std::string("x"));
        ASSERT_THROWS(writer.put(Container{"a/b"}, "obj", source, "", {}, true),
                      InvalidContainerNameError, "slash in container name");
        ASSERT_EQ(transport.request_count(), 0u, "no request sent");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. MultipartUploadCoordinator
// ---------------------------------------------------------------------------

static void test_multipart() {
    std::cout << "\n=== MultipartUploadCoordinator ===" << std::endl;

    auto tmpdir = make_temp_dir("swiftstore-multipart");
    Container container{"container"};

    {
        TEST(small_file_single_put);
        auto path = tmpdir / "small.txt";
        write_file(path, "hello");

        StubTransport transport;
        transport.set_responder(echo_etag);
        ObjectWriter writer(transport);

        MultipartOptions opts;
        opts.chunk_size = 10;
        MultipartUploadCoordinator coordinator(writer, container, "obj", path, opts);
        auto obj = coordinator.run();

        auto reqs = transport.requests();
        ASSERT_EQ(reqs.size(), 1u, "exactly one PUT");
        ASSERT_EQ(reqs[0].path, "/container/obj", "object path");
        ASSERT_TRUE(!reqs[0].headers.has("X-Object-Manifest"), "no manifest header");
        ASSERT_EQ(reqs[0].body, "hello", "body");
        ASSERT_TRUE(!coordinator.used_multipart(), "single shot");
        ASSERT_TRUE(coordinator.state() == MultipartState::Done, "done");
        ASSERT_EQ(obj.size, 5u, "size");
        ASSERT_EQ(obj.hash, md5_hex("hello"), "hash");
        PASS();
    }
    {
        TEST(large_file_parts_and_manifest);
        auto path = tmpdir / "large.bin";
        auto payload = make_payload(25);
        write_file(path, payload);

        StubTransport transport;
        ObjectWriter writer(transport);

        MultipartOptions opts;
        opts.chunk_size = 10;
        opts.upload.meta_data = {{"origin", "test"}};
        MultipartUploadCoordinator coordinator(writer, container, "obj", path, opts);

        // Coordinator state as seen while each request is in flight
        std::vector<std::string> seen_states;
        std::vector<int64_t> seen_parts;
        transport.set_responder([&](const RecordedRequest& rec) {
            seen_states.push_back(multipart_state_to_string(coordinator.state()));
            seen_parts.push_back(coordinator.current_part() ? int64_t(*coordinator.current_part()) : -1);
            return echo_etag(rec);
        });

        ASSERT_TRUE(coordinator.state() == MultipartState::Idle, "idle before run");
        auto obj = coordinator.run();

        auto reqs = transport.requests();
        ASSERT_EQ(reqs.size(), 4u, "three parts plus manifest");
        const char* part_paths[] = {"/container/obj/00000000",
                                    "/container/obj/00000001",
                                    "/container/obj/00000002"};
        for (size_t i = 0; i < 3; ++i) {
            ASSERT_EQ(reqs[i].path, part_paths[i], "part path");
            ASSERT_EQ(reqs[i].body, payload.substr(i * 10, 10), "part body");
            ASSERT_EQ(reqs[i].headers.content_type().value_or(""), "application/octet-stream",
                      "part content type");
            ASSERT_TRUE(!reqs[i].headers.has("X-Object-Manifest"), "parts carry no manifest");
        }

        const auto& manifest = reqs[3];
        ASSERT_TRUE(manifest.method == net::HttpMethod::PUT, "manifest is a PUT");
        ASSERT_EQ(manifest.path, "/container/obj", "manifest path");
        ASSERT_EQ(manifest.body, "", "manifest body is empty");
        ASSERT_EQ(manifest.headers.get("X-Object-Manifest").value_or(""), "container/obj/",
                  "manifest header");
        ASSERT_EQ(manifest.headers.get("X-Object-Meta-origin").value_or(""), "test",
                  "metadata on manifest");

        ASSERT_TRUE(coordinator.used_multipart(), "multipart");
        ASSERT_TRUE(coordinator.state() == MultipartState::Done, "done");
        ASSERT_TRUE((coordinator.uploaded_parts() ==
                     std::vector<std::string>{"obj/00000000", "obj/00000001", "obj/00000002"}),
                    "uploaded parts");
        ASSERT_TRUE((seen_states == std::vector<std::string>{"uploading_part", "uploading_part",
                                                             "uploading_part", "finalizing"}),
                    "uploading parts, then finalizing");
        ASSERT_TRUE((seen_parts == std::vector<int64_t>{0, 1, 2, -1}), "part index per request");
        ASSERT_TRUE(!coordinator.current_part().has_value(), "no part once done");
        ASSERT_EQ(coordinator.bytes_transferred(), 25u, "bytes across parts");
        ASSERT_EQ(obj.size, 25u, "size is the sum of parts");
        ASSERT_EQ(obj.hash, md5_hex(""), "hash is the manifest etag");
        ASSERT_EQ(obj.meta_data.at("origin"), "test", "metadata kept");
        PASS();
    }
    {
        TEST(threshold_equal_to_size_is_multipart);
        auto path = tmpdir / "exact.bin";
        write_file(path, make_payload(20));

        StubTransport transport;
        transport.set_responder(echo_etag);
        ObjectWriter writer(transport);
        MultipartOptions opts;
        opts.chunk_size = 20;
        MultipartUploadCoordinator coordinator(writer, container, "obj", path, opts);
        coordinator.run();
        ASSERT_EQ(transport.request_count(), 2u, "one part plus manifest");
        PASS();
    }
    {
        TEST(part_failure_stops_upload);
        auto path = tmpdir / "fail.bin";
        write_file(path, make_payload(40));

        StubTransport transport;
        transport.set_responder([](const RecordedRequest& rec) {
            if (rec.path == "/container/obj/00000001") return status_response(500);
            return echo_etag(rec);
        });
        ObjectWriter writer(transport);
        MultipartOptions opts;
        opts.chunk_size = 10;
        MultipartUploadCoordinator coordinator(writer, container, "obj", path, opts);

        try {
            coordinator.run();
            FAIL("part failure should throw");
            return;
        } catch (const UnexpectedStatusError& e) {
            ASSERT_EQ(e.status(), 500, "status carried");
        }
        ASSERT_TRUE(coordinator.state() == MultipartState::Failed, "failed");
        ASSERT_TRUE(coordinator.current_part() == std::optional<uint64_t>(1), "failed part index");
        ASSERT_EQ(coordinator.bytes_transferred(), 10u, "only the first part counted");
        ASSERT_TRUE((coordinator.uploaded_parts() == std::vector<std::string>{"obj/00000000"}),
                    "only the first part reached the server");
        ASSERT_EQ(transport.request_count(), 2u, "no further parts, no manifest");
        PASS();
    }
    {
        TEST(part_hash_mismatch);
        auto path = tmpdir / "mismatch.bin";
        write_file(path, make_payload(30));

        StubTransport transport;
        transport.set_responder([](const RecordedRequest& rec) {
            if (rec.path == "/container/obj/00000002") return created_with_etag("0000");
            return echo_etag(rec);
        });
        ObjectWriter writer(transport);
        MultipartOptions opts;
        opts.chunk_size = 10;
        MultipartUploadCoordinator coordinator(writer, container, "obj", path, opts);

        try {
            coordinator.run();
            FAIL("mismatch should throw");
            return;
        } catch (const ObjectHashMismatchError& e) {
            ASSERT_EQ(e.object_name(), "obj/00000002", "failing part named");
            ASSERT_EQ(e.actual(), "0000", "server digest carried");
        }
        ASSERT_EQ(coordinator.uploaded_parts().size(), 2u, "two parts uploaded");
        PASS();
    }
    {
        TEST(concurrent_parts_keep_names);
        auto path = tmpdir / "concurrent.bin";
        auto payload = make_payload(70);
        write_file(path, payload);

        StubTransport transport;
        transport.set_responder(echo_etag);
        ObjectWriter writer(transport);
        MultipartOptions opts;
        opts.chunk_size = 10;
        opts.concurrency = 3;
        MultipartUploadCoordinator coordinator(writer, container, "obj", path, opts);
        auto obj = coordinator.run();

        auto reqs = transport.requests();
        ASSERT_EQ(reqs.size(), 8u, "seven parts plus manifest");
        std::set<std::string> part_paths;
        for (size_t i = 0; i < 7; ++i) {
            part_paths.insert(reqs[i].path);
            auto index = std::stoul(reqs[i].path.substr(reqs[i].path.size() - 8));
            ASSERT_EQ(reqs[i].body, payload.substr(index * 10, 10), "part body matches index");
        }
        ASSERT_EQ(part_paths.size(), 7u, "every part uploaded once");
        ASSERT_TRUE(reqs[7].headers.has("X-Object-Manifest"), "manifest is last");
        ASSERT_EQ(coordinator.uploaded_parts().front(), "obj/00000000", "parts in index order");
        ASSERT_EQ(coordinator.uploaded_parts().back(), "obj/00000006", "parts in index order");
        ASSERT_EQ(obj.size, 70u, "size");
        PASS();
    }
    {
        TEST(concurrent_failure_surfaces_lowest_index);
        auto path = tmpdir / "concurrent-fail.bin";
        write_file(path, make_payload(100));

        StubTransport transport;
        transport.set_responder([](const RecordedRequest& rec) {
            if (rec.path == "/container/obj/00000001") return status_response(503);
            if (rec.path == "/container/obj/00000003") return status_response(500);
            return echo_etag(rec);
        });
        ObjectWriter writer(transport);
        MultipartOptions opts;
        opts.chunk_size = 10;
        opts.concurrency = 4;
        MultipartUploadCoordinator coordinator(writer, container, "obj", path, opts);

        try {
            coordinator.run();
            FAIL("failure should throw");
            return;
        } catch (const UnexpectedStatusError& e) {
            ASSERT_EQ(e.status(), 503, "lowest failing index wins");
        }
        ASSERT_TRUE(coordinator.current_part() == std::optional<uint64_t>(1),
                    "lowest failing part index");
        ASSERT_EQ(coordinator.bytes_transferred(), 20u, "two successful parts counted");
        ASSERT_EQ(transport.request_count(), 4u, "no batch after the failing one");
        ASSERT_TRUE((coordinator.uploaded_parts() ==
                     std::vector<std::string>{"obj/00000000", "obj/00000002"}),
                    "successful parts of the batch");
        PASS();
    }
    {
        TEST(coordinator_is_one_shot);
        auto path = tmpdir / "small.txt";
        StubTransport transport;
        transport.set_responder(echo_etag);
        ObjectWriter writer(transport);
        MultipartUploadCoordinator coordinator(writer, container, "obj", path);
        coordinator.run();
        ASSERT_THROWS(coordinator.run(), std::logic_error, "second run should throw");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 6. Listing
// ---------------------------------------------------------------------------

static std::string object_page(const std::vector<std::string>& names) {
    std::string body = "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) body += ",";
        body += "{\"name\":\"" + names[i] + "\",\"bytes\":" + std::to_string(i + 1) +
                ",\"hash\":\"h" + names[i] + "\",\"content_type\":\"text/plain\","
                "\"last_modified\":\"2011-01-01T00:00:00.000000\"}";
    }
    return body + "]";
}

static void test_listing() {
    std::cout << "\n=== Listing ===" << std::endl;

    Container container{"docs"};

    {
        TEST(pages_until_no_content);
        auto transport = std::make_shared<StubTransport>();
        transport->push(json_response(200, object_page({"a", "b"})));
        transport->push(json_response(200, object_page({"c", "d"})));
        transport->push(status_response(204));

        LazyList<Object> list(std::make_shared<ObjectPageSource>(*transport, container));
        ASSERT_EQ(transport->request_count(), 0u, "nothing fetched before iteration");

        std::vector<std::string> names;
        for (const auto& obj : list) {
            names.push_back(obj.name);
        }
        ASSERT_TRUE((names == std::vector<std::string>{"a", "b", "c", "d"}), "server order");

        auto reqs = transport->requests();
        ASSERT_EQ(reqs.size(), 3u, "three requests");
        ASSERT_EQ(reqs[0].path, "/docs", "container path");
        ASSERT_TRUE(reqs[0].params.count("marker") == 0, "no marker on first page");
        ASSERT_EQ(reqs[1].params.at("marker"), "b", "marker is last name");
        ASSERT_EQ(reqs[2].params.at("marker"), "d", "marker is last name");
        PASS();
    }
    {
        TEST(cursor_stops_after_exhaustion);
        auto transport = std::make_shared<StubTransport>();
        transport->push(json_response(200, object_page({"a", "b"})));
        transport->push(status_response(204));

        ListingCursor<Object> cursor(std::make_shared<ObjectPageSource>(*transport, container));
        ASSERT_EQ(cursor.next()->name, "a", "first");
        ASSERT_EQ(cursor.next()->name, "b", "second");
        ASSERT_TRUE(!cursor.next().has_value(), "end");
        ASSERT_TRUE(cursor.exhausted(), "exhausted");
        ASSERT_TRUE(!cursor.next().has_value(), "still end");
        ASSERT_EQ(transport->request_count(), 2u, "no request after the terminating page");
        ASSERT_EQ(cursor.pages_fetched(), 2u, "pages fetched");
        PASS();
    }
    {
        TEST(empty_ok_page_terminates);
        auto transport = std::make_shared<StubTransport>();
        transport->push(json_response(200, object_page({"a"})));
        transport->push(json_response(200, "[]"));

        LazyList<Object> list(std::make_shared<ObjectPageSource>(*transport, container));
        auto all = list.to_vector();
        ASSERT_EQ(all.size(), 1u, "one entry");
        ASSERT_EQ(transport->request_count(), 2u, "stops on the empty page");
        PASS();
    }
    {
        TEST(early_stop_and_restart);
        auto transport = std::make_shared<StubTransport>();
        transport->set_responder([](const RecordedRequest& rec) {
            if (rec.params.count("marker") == 0) return json_response(200, object_page({"a", "b"}));
            return status_response(204);
        });

        LazyList<Object> list(std::make_shared<ObjectPageSource>(*transport, container));
        auto it = list.begin();
        ASSERT_EQ(it->name, "a", "first entry");
        ASSERT_EQ(transport->request_count(), 1u, "only the first page fetched");

        std::vector<std::string> names;
        for (const auto& obj : list) names.push_back(obj.name);
        ASSERT_TRUE((names == std::vector<std::string>{"a", "b"}), "restart from the first page");
        auto reqs = transport->requests();
        ASSERT_TRUE(reqs[1].params.count("marker") == 0, "restart omits the marker");
        PASS();
    }
    {
        TEST(entry_fields_decoded);
        auto transport = std::make_shared<StubTransport>();
        transport->push(json_response(200, object_page({"report.txt"})));
        transport->push(status_response(204));

        LazyList<Object> list(std::make_shared<ObjectPageSource>(*transport, container));
        auto all = list.to_vector();
        ASSERT_EQ(all.size(), 1u, "one entry");
        ASSERT_EQ(all[0].size, 1u, "bytes");
        ASSERT_EQ(all[0].hash, "hreport.txt", "hash");
        ASSERT_EQ(all[0].content_type, "text/plain", "content type");
        ASSERT_EQ(all[0].container.name, "docs", "owning container");
        ASSERT_TRUE(all[0].last_modified.has_value(), "last modified parsed");
        ASSERT_EQ(std::chrono::system_clock::to_time_t(*all[0].last_modified), 1293840000,
                  "2011-01-01T00:00:00Z");
        PASS();
    }
    {
        TEST(unexpected_status_and_bad_json);
        auto transport = std::make_shared<StubTransport>();
        transport->push(status_response(500));
        transport->push(json_response(200, "{not json"));

        LazyList<Object> list(std::make_shared<ObjectPageSource>(*transport, container));
        try {
            list.to_vector();
            FAIL("500 should throw");
            return;
        } catch (const UnexpectedStatusError& e) {
            ASSERT_EQ(e.status(), 500, "status carried");
        }
        ASSERT_THROWS(list.to_vector(), MalformedResponseError, "bad JSON should throw");
        PASS();
    }
    {
        TEST(container_listing);
        auto transport = std::make_shared<StubTransport>();
        transport->push(json_response(200, R"([{"name":"alpha","count":3,"bytes":300},)"
                                           R"({"name":"beta","count":0,"bytes":0}])"));
        transport->push(status_response(204));

        LazyList<Container> list(std::make_shared<ContainerPageSource>(*transport));
        auto all = list.to_vector();
        ASSERT_EQ(all.size(), 2u, "two containers");
        ASSERT_EQ(all[0].name, "alpha", "name");
        ASSERT_EQ(all[0].object_count, 3u, "count");
        ASSERT_EQ(all[0].bytes, 300u, "bytes");
        auto reqs = transport->requests();
        ASSERT_EQ(reqs[0].path, "", "account path");
        ASSERT_EQ(reqs[1].params.at("marker"), "beta", "marker");
        PASS();
    }
}

int main() {
    std::cout << "swiftstore transfer test suite" << std::endl;
    std::cout << "==============================" << std::endl;

    test_segmenter();
    test_range_reader();
    test_hashing_pipe();
    test_object_writer();
    test_multipart();
    test_listing();

    return print_summary();
}
