#include "cloud/memory_store.hpp"
#include "utils/data_vector.hpp"
#include "utils/utils.hpp"
#include <algorithm>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::cloud {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
string md5Hex(string_view data)
// The hex md5 used as etag
{
    auto md5 = utils::md5Encode(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return utils::hexEncode(reinterpret_cast<const uint8_t*>(md5.data()), md5.size());
}
//---------------------------------------------------------------------------
StoreError noSuchBucket(const string& bucket)
// The missing bucket error
{
    return StoreError(Error::Kind::Client, "NoSuchBucket", "The specified bucket does not exist: " + bucket, 404);
}
//---------------------------------------------------------------------------
StoreError noSuchUpload(const string& uploadId)
// The missing upload error
{
    return StoreError(Error::Kind::Client, "NoSuchUpload", "The specified upload does not exist: " + uploadId, 404);
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
map<string, MemoryStore::Versions>& MemoryStore::bucket(const string& name)
// Find the bucket
{
    auto it = _buckets.find(name);
    if (it == _buckets.end())
        throw noSuchBucket(name);
    return it->second;
}
//---------------------------------------------------------------------------
const MemoryStore::Version& MemoryStore::find(const ObjectHandle& handle) const
// Find the requested version
{
    auto bucketIt = _buckets.find(handle.bucket);
    if (bucketIt == _buckets.end())
        throw noSuchBucket(handle.bucket);
    auto keyIt = bucketIt->second.find(handle.key);
    if (keyIt == bucketIt->second.end() || keyIt->second.empty())
        throw StoreError(Error::Kind::Client, "NoSuchKey", "The specified key does not exist: " + handle.key, 404);
    if (!handle.versionId)
        return keyIt->second.back();
    for (auto& version : keyIt->second)
        if (version.versionId == *handle.versionId)
            return version;
    throw StoreError(Error::Kind::Client, "NoSuchVersion", "The specified version does not exist: " + *handle.versionId, 404);
}
//---------------------------------------------------------------------------
void MemoryStore::store(const string& bucketName, const string& key, string content, string etag)
// Append a version
{
    auto& versions = bucket(bucketName)[key];
    versions.push_back({"v" + to_string(++_counter), move(content), move(etag)});
}
//---------------------------------------------------------------------------
GetResult MemoryStore::getObject(const ObjectHandle& handle, const optional<ByteRange>& range)
// Get an object
{
    lock_guard lock(_mutex);
    auto& version = find(handle);
    uint64_t size = version.content.size();
    if (!range)
        return {make_unique<BufferBody>(version.content), nullopt, size};

    auto notSatisfiable = [&]() {
        return StoreError(Error::Kind::RangeNotSatisfiable, "InvalidRange", "The requested range is not satisfiable", 416, _settings.reportActualSize ? optional<uint64_t>(size) : nullopt);
    };
    uint64_t start, end;
    if (range->isSuffix()) {
        auto length = range->last.value_or(0);
        if (!length || !size)
            throw notSatisfiable();
        start = length >= size ? 0 : size - length;
        end = size - 1;
    } else {
        start = *range->first;
        if (start >= size)
            throw notSatisfiable();
        end = range->last ? min(*range->last, size - 1) : size - 1;
        if (end < start)
            throw notSatisfiable();
    }
    auto contentRange = "bytes " + to_string(start) + "-" + to_string(end) + "/" + to_string(size);
    return {make_unique<BufferBody>(version.content.substr(start, end - start + 1)), move(contentRange), end - start + 1};
}
//---------------------------------------------------------------------------
ObjectInfo MemoryStore::headObject(const ObjectHandle& handle)
// Get the metadata
{
    lock_guard lock(_mutex);
    auto& version = find(handle);
    return {version.content.size(), version.etag};
}
//---------------------------------------------------------------------------
void MemoryStore::putObject(const ObjectHandle& handle, span<const uint8_t> data)
// Put an object
{
    lock_guard lock(_mutex);
    string content(utils::asString(data));
    auto etag = md5Hex(content);
    store(handle.bucket, handle.key, move(content), move(etag));
}
//---------------------------------------------------------------------------
string MemoryStore::initiateMultipartUpload(const ObjectHandle& handle)
// Create an upload
{
    lock_guard lock(_mutex);
    bucket(handle.bucket);
    auto uploadId = "upload-" + to_string(++_counter);
    _uploads.emplace(uploadId, Upload{handle.bucket, handle.key, {}});
    return uploadId;
}
//---------------------------------------------------------------------------
string MemoryStore::uploadPart(const ObjectHandle& /*handle*/, const string& uploadId, uint32_t partNumber, span<const uint8_t> data)
// Upload a part
{
    lock_guard lock(_mutex);
    auto it = _uploads.find(uploadId);
    if (it == _uploads.end())
        throw noSuchUpload(uploadId);
    if (partNumber < 1 || partNumber > 10000)
        throw StoreError(Error::Kind::Client, "InvalidArgument", "Part number must be an integer between 1 and 10000", 400);
    string content(utils::asString(data));
    auto etag = md5Hex(content);
    it->second.parts[partNumber] = {move(content), etag};
    return etag;
}
//---------------------------------------------------------------------------
void MemoryStore::completeMultipartUpload(const ObjectHandle& /*handle*/, const string& uploadId, const vector<CompletedPart>& parts)
// Assemble the parts
{
    lock_guard lock(_mutex);
    auto it = _uploads.find(uploadId);
    if (it == _uploads.end())
        throw noSuchUpload(uploadId);
    if (parts.empty())
        throw StoreError(Error::Kind::StoreRejection, "MalformedXML", "The XML you provided was not well-formed or did not validate against our published schema", 400);

    string content;
    string digests;
    uint32_t previous = 0;
    for (auto& part : parts) {
        if (part.partNumber <= previous)
            throw StoreError(Error::Kind::Client, "InvalidPartOrder", "The list of parts was not in ascending order", 400);
        previous = part.partNumber;
        auto partIt = it->second.parts.find(part.partNumber);
        if (partIt == it->second.parts.end() || partIt->second.second != part.etag)
            throw StoreError(Error::Kind::Client, "InvalidPart", "One or more of the specified parts could not be found", 400);
        content += partIt->second.first;
        digests += utils::md5Encode(reinterpret_cast<const uint8_t*>(partIt->second.first.data()), partIt->second.first.size());
    }
    auto etag = md5Hex(digests) + "-" + to_string(parts.size());
    auto upload = move(it->second);
    _uploads.erase(it);
    store(upload.bucket, upload.key, move(content), move(etag));
}
//---------------------------------------------------------------------------
void MemoryStore::abortMultipartUpload(const ObjectHandle& /*handle*/, const string& uploadId)
// Drop an upload
{
    lock_guard lock(_mutex);
    if (!_uploads.erase(uploadId))
        throw noSuchUpload(uploadId);
}
//---------------------------------------------------------------------------
ListPage MemoryStore::listObjects(const string& bucketName, const string& prefix, const optional<string>& continuationToken)
// List the keys in lexicographic order
{
    lock_guard lock(_mutex);
    auto& keys = bucket(bucketName);
    auto it = continuationToken ? keys.upper_bound(*continuationToken) : keys.lower_bound(prefix);
    ListPage page;
    for (; it != keys.end() && it->first.starts_with(prefix); ++it) {
        if (it->second.empty())
            continue;
        if (page.keys.size() == _settings.pageSize) {
            page.nextToken = page.keys.back();
            break;
        }
        page.keys.push_back(it->first);
    }
    return page;
}
//---------------------------------------------------------------------------
void MemoryStore::headContainer(const string& bucketName)
// Check the bucket
{
    lock_guard lock(_mutex);
    bucket(bucketName);
}
//---------------------------------------------------------------------------
void MemoryStore::createBucket(const string& bucketName)
// Create a bucket
{
    lock_guard lock(_mutex);
    _buckets.try_emplace(bucketName);
}
//---------------------------------------------------------------------------
string MemoryStore::put(const string& bucketName, const string& key, string content)
// Store an object directly
{
    lock_guard lock(_mutex);
    auto etag = md5Hex(content);
    store(bucketName, key, move(content), move(etag));
    return "v" + to_string(_counter);
}
//---------------------------------------------------------------------------
optional<string> MemoryStore::content(const string& bucketName, const string& key) const
// Get the latest content
{
    lock_guard lock(_mutex);
    auto bucketIt = _buckets.find(bucketName);
    if (bucketIt == _buckets.end())
        return nullopt;
    auto keyIt = bucketIt->second.find(key);
    if (keyIt == bucketIt->second.end() || keyIt->second.empty())
        return nullopt;
    return keyIt->second.back().content;
}
//---------------------------------------------------------------------------
vector<string> MemoryStore::versions(const string& bucketName, const string& key) const
// Get the version ids
{
    lock_guard lock(_mutex);
    vector<string> result;
    auto bucketIt = _buckets.find(bucketName);
    if (bucketIt == _buckets.end())
        return result;
    auto keyIt = bucketIt->second.find(key);
    if (keyIt == bucketIt->second.end())
        return result;
    for (auto& version : keyIt->second)
        result.push_back(version.versionId);
    return result;
}
//---------------------------------------------------------------------------
uint64_t MemoryStore::pendingUploads() const
// The number of pending uploads
{
    lock_guard lock(_mutex);
    return _uploads.size();
}
//---------------------------------------------------------------------------
vector<string> MemoryStore::pendingParts(const string& uploadId) const
// The parts of a pending upload
{
    lock_guard lock(_mutex);
    vector<string> result;
    auto it = _uploads.find(uploadId);
    if (it == _uploads.end())
        return result;
    for (auto& part : it->second.parts)
        result.push_back(part.second.first);
    return result;
}
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
