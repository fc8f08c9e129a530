#include "cloud/memory_store.hpp"
#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
#include <string>
#include <vector>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::cloud::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
template <typename F>
StoreError storeError(F&& call)
// Capture the store error of a call
{
    try {
        call();
    } catch (const StoreError& e) {
        return e;
    }
    FAIL("no store error raised");
    return StoreError(Error::Kind::Client, "", "");
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("memory_store_ranges") {
    MemoryStore store;
    store.createBucket("bucket");
    store.put("bucket", "key", "0123456789");
    ObjectHandle handle{"bucket", "key", nullopt};

    auto whole = store.getObject(handle, nullopt);
    REQUIRE(!whole.contentRange);
    REQUIRE(whole.body->readAll() == "0123456789");

    auto from = store.getObject(handle, ByteRange::from(7));
    REQUIRE(from.contentRange == "bytes 7-9/10");
    REQUIRE(from.body->readAll() == "789");

    auto suffix = store.getObject(handle, ByteRange::suffix(3));
    REQUIRE(suffix.contentRange == "bytes 7-9/10");

    auto longSuffix = store.getObject(handle, ByteRange::suffix(100));
    REQUIRE(longSuffix.contentRange == "bytes 0-9/10");

    auto closed = store.getObject(handle, ByteRange::closed(2, 100));
    REQUIRE(closed.contentRange == "bytes 2-9/10");
    REQUIRE(closed.body->readAll() == "23456789");

    auto beyond = storeError([&] { (void) store.getObject(handle, ByteRange::from(10)); });
    REQUIRE(beyond.is(Error::Kind::RangeNotSatisfiable));
    REQUIRE(beyond.code() == "InvalidRange");
    REQUIRE(beyond.httpStatus() == 416);
    REQUIRE(beyond.actualObjectSize() == 10);

    auto zeroSuffix = storeError([&] { (void) store.getObject(handle, ByteRange::suffix(0)); });
    REQUIRE(zeroSuffix.is(Error::Kind::RangeNotSatisfiable));
}
//---------------------------------------------------------------------------
TEST_CASE("memory_store_without_size_hint") {
    MemoryStore store(MemoryStore::Settings{.reportActualSize = false, .pageSize = 1000});
    store.createBucket("bucket");
    store.put("bucket", "empty", "");
    auto error = storeError([&] { (void) store.getObject({"bucket", "empty", nullopt}, ByteRange::from(0)); });
    REQUIRE(error.is(Error::Kind::RangeNotSatisfiable));
    REQUIRE(!error.actualObjectSize());
    REQUIRE(store.headObject({"bucket", "empty", nullopt}).contentLength == 0);
}
//---------------------------------------------------------------------------
TEST_CASE("memory_store_missing") {
    MemoryStore store;
    store.createBucket("bucket");
    REQUIRE(storeError([&] { (void) store.getObject({"other", "key", nullopt}, nullopt); }).code() == "NoSuchBucket");
    REQUIRE(storeError([&] { (void) store.headObject({"bucket", "key", nullopt}); }).code() == "NoSuchKey");
    REQUIRE(storeError([&] { store.headContainer("other"); }).is(Error::Kind::Client));
    store.put("bucket", "key", "x");
    REQUIRE(storeError([&] { (void) store.headObject({"bucket", "key", "v999"}); }).code() == "NoSuchVersion");
}
//---------------------------------------------------------------------------
TEST_CASE("memory_store_versions") {
    MemoryStore store;
    store.createBucket("bucket");
    auto first = store.put("bucket", "key", "first");
    auto second = store.put("bucket", "key", "second");
    REQUIRE(first != second);
    REQUIRE(store.versions("bucket", "key") == vector<string>{first, second});
    REQUIRE(store.getObject({"bucket", "key", first}, nullopt).body->readAll() == "first");
    REQUIRE(store.getObject({"bucket", "key", nullopt}, nullopt).body->readAll() == "second");
}
//---------------------------------------------------------------------------
TEST_CASE("memory_store_multipart") {
    MemoryStore store;
    store.createBucket("bucket");
    ObjectHandle handle{"bucket", "key", nullopt};
    auto uploadId = store.initiateMultipartUpload(handle);
    REQUIRE(store.pendingUploads() == 1);
    string a = "hello ", b = "world";
    auto etagA = store.uploadPart(handle, uploadId, 1, utils::asBytes(a));
    auto etagB = store.uploadPart(handle, uploadId, 2, utils::asBytes(b));
    REQUIRE(store.pendingParts(uploadId) == vector<string>{a, b});

    REQUIRE(storeError([&] { store.completeMultipartUpload(handle, uploadId, {{2, etagB}, {1, etagA}}); }).code() == "InvalidPartOrder");
    REQUIRE(storeError([&] { store.completeMultipartUpload(handle, uploadId, {{1, "wrong"}}); }).code() == "InvalidPart");
    REQUIRE(storeError([&] { (void) store.uploadPart(handle, uploadId, 0, utils::asBytes(a)); }).code() == "InvalidArgument");

    store.completeMultipartUpload(handle, uploadId, {{1, etagA}, {2, etagB}});
    REQUIRE(store.content("bucket", "key") == "hello world");
    REQUIRE(store.pendingUploads() == 0);
    REQUIRE(store.headObject(handle).etag.ends_with("-2"));
    REQUIRE(storeError([&] { store.abortMultipartUpload(handle, uploadId); }).code() == "NoSuchUpload");
}
//---------------------------------------------------------------------------
TEST_CASE("memory_store_empty_completion") {
    MemoryStore store;
    store.createBucket("bucket");
    ObjectHandle handle{"bucket", "key", nullopt};
    auto uploadId = store.initiateMultipartUpload(handle);
    auto error = storeError([&] { store.completeMultipartUpload(handle, uploadId, {}); });
    REQUIRE(error.is(Error::Kind::StoreRejection));
    REQUIRE(error.code() == "MalformedXML");
    store.abortMultipartUpload(handle, uploadId);
    REQUIRE(store.pendingUploads() == 0);
    REQUIRE(!store.content("bucket", "key"));
}
//---------------------------------------------------------------------------
TEST_CASE("memory_store_listing") {
    MemoryStore store(MemoryStore::Settings{.reportActualSize = true, .pageSize = 2});
    store.createBucket("bucket");
    for (auto key : {"a/1", "a/2", "a/3", "b/1", "a0"})
        store.put("bucket", key, key);

    vector<string> keys;
    optional<string> token;
    auto pages = 0;
    do {
        auto page = store.listObjects("bucket", "a/", token);
        keys.insert(keys.end(), page.keys.begin(), page.keys.end());
        token = page.nextToken;
        pages++;
    } while (token);
    REQUIRE(keys == vector<string>{"a/1", "a/2", "a/3"});
    REQUIRE(pages == 2);
    REQUIRE(store.listObjects("bucket", "", nullopt).keys.size() == 2);
}
//---------------------------------------------------------------------------
TEST_CASE("memory_store_listing_zero_page_size") {
    MemoryStore store(MemoryStore::Settings{.reportActualSize = true, .pageSize = 0});
    store.createBucket("bucket");
    for (auto key : {"a/1", "a/2", "a/3"})
        store.put("bucket", key, key);

    vector<string> keys;
    optional<string> token;
    auto pages = 0;
    do {
        auto page = store.listObjects("bucket", "a/", token);
        REQUIRE(page.keys.size() == 1);
        keys.insert(keys.end(), page.keys.begin(), page.keys.end());
        token = page.nextToken;
        pages++;
    } while (token);
    REQUIRE(keys == vector<string>{"a/1", "a/2", "a/3"});
    REQUIRE(pages == 3);
}
//---------------------------------------------------------------------------
} // namespace blobstream::cloud::test
