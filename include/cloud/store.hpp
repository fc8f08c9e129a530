#pragma once
#include "network/http_helper.hpp"
#include "utils/error.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
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
namespace blobstream::cloud {
//---------------------------------------------------------------------------
/// Addresses one object, optionally pinned to a version
struct ObjectHandle {
    /// The bucket
    std::string bucket;
    /// The key
    std::string key;
    /// The version
    std::optional<std::string> versionId;

    /// Human readable name
    [[nodiscard]] std::string name() const;
};
//---------------------------------------------------------------------------
/// A HTTP byte range, without first the last value is the suffix length
struct ByteRange {
    /// The first byte
    std::optional<uint64_t> first;
    /// The last byte, inclusive
    std::optional<uint64_t> last;

    /// All bytes from start on
    static ByteRange from(uint64_t start) { return {start, std::nullopt}; }
    /// The last length bytes
    static ByteRange suffix(uint64_t length) { return {std::nullopt, length}; }
    /// The bytes [start, end]
    static ByteRange closed(uint64_t start, uint64_t end) { return {start, end}; }
    /// Is it a suffix range
    [[nodiscard]] bool isSuffix() const { return !first; }
    /// The Range header value
    [[nodiscard]] std::string toString() const { return network::HttpHelper::rangeHeader(first, last); }
};
//---------------------------------------------------------------------------
/// A streaming object body
class ObjectBody {
    public:
    /// The destructor
    virtual ~ObjectBody() = default;
    /// Read up to length bytes, returns 0 at the end, throws IncompleteRead if the stream ends early
    virtual uint64_t read(uint8_t* data, uint64_t length) = 0;
    /// Read the remaining bytes
    std::string readAll();
};
//---------------------------------------------------------------------------
/// A body served from memory
class BufferBody : public ObjectBody {
    /// The content
    std::string _content;
    /// The read offset
    uint64_t _offset;

    public:
    /// The constructor
    explicit BufferBody(std::string content) : _content(std::move(content)), _offset(0) {}
    /// Read up to length bytes
    uint64_t read(uint8_t* data, uint64_t length) override;
};
//---------------------------------------------------------------------------
/// The result of a get
struct GetResult {
    /// The body
    std::unique_ptr<ObjectBody> body;
    /// The raw Content-Range header
    std::optional<std::string> contentRange;
    /// The Content-Length header
    std::optional<uint64_t> contentLength;
};
//---------------------------------------------------------------------------
/// The metadata of an object
struct ObjectInfo {
    /// The length
    uint64_t contentLength = 0;
    /// The etag without quotes
    std::string etag;
};
//---------------------------------------------------------------------------
/// A part of a multipart upload
struct CompletedPart {
    /// The part number, starting at 1
    uint32_t partNumber;
    /// The etag of the uploaded part
    std::string etag;

    bool operator==(const CompletedPart& other) const = default;
};
//---------------------------------------------------------------------------
/// A page of a listing
struct ListPage {
    /// The keys
    std::vector<std::string> keys;
    /// The continuation token for the next page
    std::optional<std::string> nextToken;
};
//---------------------------------------------------------------------------
/// An error reported by the store
class StoreError : public Error {
    /// The machine code, e.g., NoSuchKey
    std::string _code;
    /// The http status, 0 if there is none
    uint16_t _httpStatus;
    /// The object size reported with InvalidRange
    std::optional<uint64_t> _actualObjectSize;

    public:
    /// The constructor
    StoreError(Kind kind, std::string code, const std::string& message, uint16_t httpStatus = 0, std::optional<uint64_t> actualObjectSize = std::nullopt)
        : Error(kind, code + ": " + message), _code(std::move(code)), _httpStatus(httpStatus), _actualObjectSize(actualObjectSize) {}

    /// Get the code
    [[nodiscard]] const std::string& code() const noexcept { return _code; }
    /// Get the http status
    [[nodiscard]] uint16_t httpStatus() const noexcept { return _httpStatus; }
    /// Get the actual object size hint
    [[nodiscard]] std::optional<uint64_t> actualObjectSize() const noexcept { return _actualObjectSize; }
};
//---------------------------------------------------------------------------
/// The abstract object store client
/// Every call blocks; errors are raised as StoreError
class Store {
    public:
    /// The destructor
    virtual ~Store() = default;

    /// Get an object or a range of it
    [[nodiscard]] virtual GetResult getObject(const ObjectHandle& handle, const std::optional<ByteRange>& range) = 0;
    /// Get the metadata of an object
    [[nodiscard]] virtual ObjectInfo headObject(const ObjectHandle& handle) = 0;
    /// Put an object
    virtual void putObject(const ObjectHandle& handle, std::span<const uint8_t> data) = 0;
    /// Initiate a multipart upload, returns the upload id
    [[nodiscard]] virtual std::string initiateMultipartUpload(const ObjectHandle& handle) = 0;
    /// Upload a part, returns the etag
    [[nodiscard]] virtual std::string uploadPart(const ObjectHandle& handle, const std::string& uploadId, uint32_t partNumber, std::span<const uint8_t> data) = 0;
    /// Complete a multipart upload
    virtual void completeMultipartUpload(const ObjectHandle& handle, const std::string& uploadId, const std::vector<CompletedPart>& parts) = 0;
    /// Abort a multipart upload
    virtual void abortMultipartUpload(const ObjectHandle& handle, const std::string& uploadId) = 0;
    /// List a page of keys below the prefix
    [[nodiscard]] virtual ListPage listObjects(const std::string& bucket, const std::string& prefix, const std::optional<std::string>& continuationToken) = 0;
    /// Check that the bucket exists and is accessible
    virtual void headContainer(const std::string& bucket) = 0;
};
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
