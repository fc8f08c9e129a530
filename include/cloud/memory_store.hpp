#pragma once
#include "cloud/store.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
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
/// An in-process store with the S3 semantics for ranges, versions, multipart uploads and listings
class MemoryStore : public Store {
    public:
    /// The settings
    struct Settings {
        /// Report the object size with InvalidRange errors
        bool reportActualSize = true;
        /// The maximum number of keys per listing page
        uint64_t pageSize = 1000;
    };

    private:
    /// A stored version
    struct Version {
        /// The version id
        std::string versionId;
        /// The content
        std::string content;
        /// The etag
        std::string etag;
    };
    /// A pending multipart upload
    struct Upload {
        /// The bucket
        std::string bucket;
        /// The key
        std::string key;
        /// The parts with their etag
        std::map<uint32_t, std::pair<std::string, std::string>> parts;
    };
    /// The versions of a key, the newest last
    using Versions = std::vector<Version>;
    /// The settings
    Settings _settings;
    /// The mutex
    mutable std::mutex _mutex;
    /// The buckets
    std::map<std::string, std::map<std::string, Versions>> _buckets;
    /// The pending uploads
    std::map<std::string, Upload> _uploads;
    /// The id counter for versions and uploads
    uint64_t _counter;

    /// Find a version, throws if missing
    const Version& find(const ObjectHandle& handle) const;
    /// Find a bucket, throws if missing
    std::map<std::string, Versions>& bucket(const std::string& name);
    /// Store a new version
    void store(const std::string& bucketName, const std::string& key, std::string content, std::string etag);

    public:
    /// The constructor
    MemoryStore() : _settings(), _counter(0) {}
    /// The constructor
    explicit MemoryStore(Settings settings) : _settings(settings), _counter(0) {
        if (!_settings.pageSize)
            _settings.pageSize = 1;
    }

    /// Get an object or a range of it
    [[nodiscard]] GetResult getObject(const ObjectHandle& handle, const std::optional<ByteRange>& range) override;
    /// Get the metadata of an object
    [[nodiscard]] ObjectInfo headObject(const ObjectHandle& handle) override;
    /// Put an object
    void putObject(const ObjectHandle& handle, std::span<const uint8_t> data) override;
    /// Initiate a multipart upload
    [[nodiscard]] std::string initiateMultipartUpload(const ObjectHandle& handle) override;
    /// Upload a part
    [[nodiscard]] std::string uploadPart(const ObjectHandle& handle, const std::string& uploadId, uint32_t partNumber, std::span<const uint8_t> data) override;
    /// Complete a multipart upload
    void completeMultipartUpload(const ObjectHandle& handle, const std::string& uploadId, const std::vector<CompletedPart>& parts) override;
    /// Abort a multipart upload
    void abortMultipartUpload(const ObjectHandle& handle, const std::string& uploadId) override;
    /// List a page of keys
    [[nodiscard]] ListPage listObjects(const std::string& bucket, const std::string& prefix, const std::optional<std::string>& continuationToken) override;
    /// Check the bucket
    void headContainer(const std::string& bucket) override;

    /// Create a bucket
    void createBucket(const std::string& bucket);
    /// Store an object directly, returns the version id
    std::string put(const std::string& bucket, const std::string& key, std::string content);
    /// Get the latest content of an object
    [[nodiscard]] std::optional<std::string> content(const std::string& bucket, const std::string& key) const;
    /// Get the version ids of an object, oldest first
    [[nodiscard]] std::vector<std::string> versions(const std::string& bucket, const std::string& key) const;
    /// The number of pending multipart uploads
    [[nodiscard]] uint64_t pendingUploads() const;
    /// The uploaded parts of a pending upload
    [[nodiscard]] std::vector<std::string> pendingParts(const std::string& uploadId) const;
};
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
