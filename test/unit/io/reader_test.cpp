#include "io/reader.hpp"
#include "test/unit/io/faulty_store.hpp"
#include <array>
#include <catch2/catch.hpp>
#include <string>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::io::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
string makeContent(uint64_t length)
// A recognizable payload
{
    string content;
    for (uint64_t i = 0; i < length; i++)
        content += static_cast<char>('a' + i % 26);
    return content;
}
//---------------------------------------------------------------------------
shared_ptr<FaultyStore> makeStore(const string& content, cloud::MemoryStore::Settings settings = cloud::MemoryStore::Settings())
// A store holding bucket/key
{
    auto memory = make_shared<cloud::MemoryStore>(settings);
    memory->createBucket("bucket");
    memory->put("bucket", "key", content);
    return make_shared<FaultyStore>(memory);
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("reader_range_slices") {
    auto content = makeContent(100);
    auto store = makeStore(content);
    Reader reader(store, "bucket", "key");
    for (uint64_t start : {0, 1, 50, 99}) {
        for (int64_t size : {1, 10, 100}) {
            REQUIRE(reader.seek(static_cast<int64_t>(start)) == start);
            REQUIRE(reader.read(size) == content.substr(start, static_cast<uint64_t>(size)));
        }
    }
}
//---------------------------------------------------------------------------
TEST_CASE("reader_eof_is_idempotent") {
    auto content = makeContent(100);
    auto store = makeStore(content);

    SECTION("read everything") {
        Reader reader(store, "bucket", "key");
        REQUIRE(reader.read() == content);
        REQUIRE(reader.tell() == 100);
        auto calls = store->calls();
        REQUIRE(reader.read(10).empty());
        REQUIRE(reader.read(10).empty());
        REQUIRE(reader.read().empty());
        REQUIRE(store->calls() == calls);
    }
    SECTION("buffered reads") {
        ReaderConfig config;
        config.bufferSize = 16;
        Reader reader(store, "bucket", "key", config);
        string result;
        while (true) {
            auto part = reader.read(7);
            if (part.empty())
                break;
            result += part;
        }
        REQUIRE(result == content);
        auto calls = store->calls();
        REQUIRE(reader.read(7).empty());
        REQUIRE(reader.read(1).empty());
        REQUIRE(store->calls() == calls);
        REQUIRE(store->gets == 1);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("reader_seek") {
    auto content = makeContent(100);
    auto store = makeStore(content);
    Reader reader(store, "bucket", "key");

    SECTION("from the end") {
        REQUIRE(reader.seek(-10, Whence::End) == 90);
        REQUIRE(reader.read() == content.substr(90));
        REQUIRE(reader.tell() == 100);
    }
    SECTION("relative") {
        REQUIRE(reader.read(10) == content.substr(0, 10));
        REQUIRE(reader.seek(5, Whence::Current) == 15);
        REQUIRE(reader.read(5) == content.substr(15, 5));
        REQUIRE(reader.seek(-100, Whence::Current) == 0);
    }
    SECTION("past the end without a request") {
        auto gets = store->gets.load();
        REQUIRE(reader.seek(200) == 100);
        REQUIRE(reader.seek(0, Whence::End) == 100);
        REQUIRE(store->gets == gets);
        REQUIRE(reader.read(5).empty());
        REQUIRE(store->gets == gets);
    }
    SECTION("invalid whence") {
        try {
            reader.seek(0, static_cast<Whence>(7));
            FAIL("accepted an invalid whence");
        } catch (const Error& e) {
            REQUIRE(e.is(Error::Kind::Configuration));
        }
    }
}
//---------------------------------------------------------------------------
TEST_CASE("reader_seek_past_end_unknown_length") {
    auto content = makeContent(100);
    ReaderConfig config;
    config.deferSeek = true;

    SECTION("size from the error") {
        auto store = makeStore(content);
        Reader reader(store, "bucket", "key", config);
        REQUIRE(store->calls() == 0);
        REQUIRE(reader.seek(200) == 100);
        REQUIRE(store->heads == 0);
        REQUIRE(reader.read().empty());
    }
    SECTION("size from a head request") {
        auto store = makeStore(content, {.reportActualSize = false, .pageSize = 1000});
        Reader reader(store, "bucket", "key", config);
        REQUIRE(reader.seek(200) == 100);
        REQUIRE(store->heads == 1);
        REQUIRE(reader.contentLength() == 100);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("reader_empty_object") {
    auto store = makeStore("");
    Reader reader(store, "bucket", "key");
    REQUIRE(reader.tell() == 0);
    REQUIRE(reader.contentLength() == 0);
    REQUIRE(reader.read().empty());
    REQUIRE(reader.read(10).empty());
    REQUIRE(reader.readline().empty());
}
//---------------------------------------------------------------------------
TEST_CASE("reader_defer_seek") {
    auto content = makeContent(30);
    auto store = makeStore(content);
    ReaderConfig config;
    config.deferSeek = true;
    Reader reader(store, "bucket", "key", config);
    REQUIRE(store->calls() == 0);
    REQUIRE(reader.read(5) == content.substr(0, 5));
    REQUIRE(store->gets == 1);
}
//---------------------------------------------------------------------------
TEST_CASE("reader_interrupted_connection") {
    auto content = makeContent(100);
    auto store = makeStore(content);
    store->dropAfter = 10;

    SECTION("single interruption is recovered") {
        store->dropBodies = 1;
        Reader reader(store, "bucket", "key");
        REQUIRE(reader.read() == content);
        REQUIRE(store->gets == 2);
    }
    SECTION("double interruption fails") {
        store->dropBodies = 2;
        Reader reader(store, "bucket", "key");
        try {
            (void) reader.read();
            FAIL("the second interruption was hidden");
        } catch (const Error& e) {
            REQUIRE(e.is(Error::Kind::IOFailure));
            REQUIRE(e.causeKind() == Error::Kind::IncompleteRead);
        }
    }
}
//---------------------------------------------------------------------------
TEST_CASE("reader_readline") {
    string content = "line1\nline2 is longer\n\nlast";
    auto store = makeStore(content);
    ReaderConfig config;
    config.bufferSize = 4;

    SECTION("lines span fills") {
        Reader reader(store, "bucket", "key", config);
        REQUIRE(reader.readline() == "line1\n");
        REQUIRE(reader.tell() == 6);
        REQUIRE(reader.readline() == "line2 is longer\n");
        REQUIRE(reader.readline() == "\n");
        REQUIRE(reader.readline() == "last");
        REQUIRE(reader.readline().empty());
        REQUIRE(reader.tell() == content.size());
    }
    SECTION("mixed with read") {
        Reader reader(store, "bucket", "key", config);
        REQUIRE(reader.read(2) == "li");
        REQUIRE(reader.readline() == "ne1\n");
        REQUIRE(reader.read(5) == "line2");
    }
    SECTION("limit is unsupported") {
        Reader reader(store, "bucket", "key", config);
        try {
            (void) reader.readline(5);
            FAIL("accepted a limit");
        } catch (const Error& e) {
            REQUIRE(e.is(Error::Kind::Unsupported));
        }
    }
}
//---------------------------------------------------------------------------
TEST_CASE("reader_terminator_across_fills") {
    auto store = makeStore("a\r\nb\r\n");
    ReaderConfig config;
    config.bufferSize = 2;
    config.lineTerminator = "\r\n";
    Reader reader(store, "bucket", "key", config);
    REQUIRE(reader.readline() == "a\r\n");
    REQUIRE(reader.tell() == 3);
    REQUIRE(reader.readline() == "b\r\n");
    REQUIRE(reader.readline().empty());

    SECTION("longer terminator") {
        auto longer = makeStore("one<END>two<END>three");
        config.lineTerminator = "<END>";
        config.bufferSize = 3;
        Reader lines(longer, "bucket", "key", config);
        REQUIRE(lines.readline() == "one<END>");
        REQUIRE(lines.readline() == "two<END>");
        REQUIRE(lines.readline() == "three");
        REQUIRE(lines.readline().empty());
    }
}
//---------------------------------------------------------------------------
TEST_CASE("reader_custom_terminator") {
    auto store = makeStore("a\r\nb\nc\r\n");
    ReaderConfig config;
    config.lineTerminator = "\r\n";
    Reader reader(store, "bucket", "key", config);
    REQUIRE(reader.readline() == "a\r\n");
    REQUIRE(reader.readline() == "b\nc\r\n");
    REQUIRE(reader.readline().empty());
}
//---------------------------------------------------------------------------
TEST_CASE("reader_errors") {
    auto store = makeStore(makeContent(10));

    SECTION("missing key") {
        try {
            Reader reader(store, "bucket", "missing");
            FAIL("opened a missing key");
        } catch (const Error& e) {
            REQUIRE(e.is(Error::Kind::IOFailure));
            REQUIRE(string(e.what()).find("key: 'missing'") != string::npos);
            REQUIRE(e.causeAs<cloud::StoreError>()->code() == "NoSuchKey");
        }
    }
    SECTION("malformed content range") {
        store->contentRange = "bytes 0-9";
        try {
            Reader reader(store, "bucket", "key");
            FAIL("accepted a malformed Content-Range");
        } catch (const Error& e) {
            REQUIRE(e.is(Error::Kind::Protocol));
        }
    }
    SECTION("unsupported operations") {
        Reader reader(store, "bucket", "key");
        REQUIRE(reader.seekable());
        REQUIRE(reader.readable());
        REQUIRE_THROWS_AS(reader.truncate(), Error);
        REQUIRE_THROWS_AS(reader.detach(), Error);
    }
    SECTION("closed") {
        Reader reader(store, "bucket", "key");
        reader.close();
        REQUIRE(reader.closed());
        REQUIRE_THROWS_AS(reader.read(1), Error);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("reader_versions_and_readinto") {
    auto memory = make_shared<cloud::MemoryStore>();
    memory->createBucket("bucket");
    auto oldVersion = memory->put("bucket", "key", "old content");
    memory->put("bucket", "key", "new content");

    ReaderConfig config;
    config.versionId = oldVersion;
    Reader old(memory, "bucket", "key", config);
    REQUIRE(old.read() == "old content");
    REQUIRE(old.name() == "key");

    Reader latest(memory, "bucket", "key");
    array<uint8_t, 3> target{};
    REQUIRE(latest.readinto(target) == 3);
    REQUIRE(string(target.begin(), target.end()) == "new");
    REQUIRE(latest.tell() == 3);
}
//---------------------------------------------------------------------------
} // namespace blobstream::io::test
