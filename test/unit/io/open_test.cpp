#include "io/multipart_writer.hpp"
#include "io/open.hpp"
#include "io/singlepart_writer.hpp"
#include "test/unit/io/faulty_store.hpp"
#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
#include <functional>
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
void requireKind(Error::Kind kind, const function<void()>& operation)
// Run the operation and check the kind of the error
{
    try {
        operation();
        FAIL("no error was raised");
    } catch (const Error& e) {
        REQUIRE(e.kind() == kind);
    }
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("open_modes") {
    auto memory = make_shared<cloud::MemoryStore>();
    memory->createBucket("bucket");
    memory->put("bucket", "key", "content");
    auto store = make_shared<FaultyStore>(memory);
    OpenOptions options;

    SECTION("read") {
        auto reader = openReader("bucket", "key", readBinary, options, store);
        REQUIRE(reader->read() == "content");
    }
    SECTION("multipart write") {
        auto writer = openWriter("bucket", "new", writeBinary, options, store);
        REQUIRE(dynamic_cast<MultipartWriter*>(writer.get()));
        writer->write(utils::asBytes("payload"));
        writer->close();
        REQUIRE(memory->content("bucket", "new") == "payload");
        REQUIRE(store->initiates == 1);
    }
    SECTION("single put write") {
        options.multipartUpload = false;
        auto writer = openWriter("bucket", "new", writeBinary, options, store);
        REQUIRE(dynamic_cast<SinglepartWriter*>(writer.get()));
        writer->write(utils::asBytes("payload"));
        writer->close();
        REQUIRE(memory->content("bucket", "new") == "payload");
        REQUIRE(store->initiates == 0);
        REQUIRE(store->puts == 1);
    }
    SECTION("bad modes") {
        for (auto mode : {"r", "w", "rt", "wb", "ab"})
            requireKind(Error::Kind::Unsupported, [&] { (void) openReader("bucket", "key", mode, options, store); });
        for (auto mode : {"r", "w", "rb", "wt"})
            requireKind(Error::Kind::Unsupported, [&] { (void) openWriter("bucket", "key", mode, options, store); });
        requireKind(Error::Kind::Unsupported, [&] { (void) openReader("s3://bucket/key", "r"); });
        REQUIRE(store->calls() == 0);
    }
    SECTION("versions are read only") {
        options.reader.versionId = "v1";
        requireKind(Error::Kind::Configuration, [&] { (void) openWriter("bucket", "key", writeBinary, options, store); });
        requireKind(Error::Kind::Configuration, [&] { (void) openWriter("s3://bucket/key", writeBinary, options); });
        REQUIRE(store->calls() == 0);
    }
}
//---------------------------------------------------------------------------
TEST_CASE("open_consolidate") {
    OpenOptions options;

    SECTION("credentials move into the options") {
        auto uri = consolidate(cloud::Provider::parseUri("s3://id:secret@bucket/key"), options);
        REQUIRE(!uri.accessId);
        REQUIRE(!uri.accessSecret);
        REQUIRE(options.store.credentials->keyId == "id");
        REQUIRE(options.store.credentials->secret == "secret");
        REQUIRE(!options.store.endpoint);
    }
    SECTION("option credentials win") {
        options.store.credentials = cloud::AWS::Secret{"optionId", "optionSecret", ""};
        auto uri = consolidate(cloud::Provider::parseUri("s3://id:secret@bucket/key"), options);
        REQUIRE(!uri.accessId);
        REQUIRE(options.store.credentials->keyId == "optionId");
    }
    SECTION("host becomes the endpoint") {
        auto uri = consolidate(cloud::Provider::parseUri("s3://id:secret@minio:9000@bucket/key"), options);
        REQUIRE(uri.bucketId == "bucket");
        REQUIRE(options.store.endpoint == "https://minio:9000");
    }
    SECTION("option endpoint wins") {
        options.store.endpoint = "http://localhost:9000";
        (void) consolidate(cloud::Provider::parseUri("s3://id:secret@minio:9000@bucket/key"), options);
        REQUIRE(options.store.endpoint == "http://localhost:9000");
    }
}
//---------------------------------------------------------------------------
} // namespace blobstream::io::test
