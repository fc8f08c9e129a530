#pragma once
#include "cloud/aws.hpp"
#include "cloud/store.hpp"
#include "network/http_connection.hpp"
#include <memory>
#include <span>
#include <string>
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
/// A store client speaking the S3 REST protocol.
/// Every call opens its own connection, so one client may be shared by many threads.
class S3Store : public Store {
    public:
    /// The settings
    struct Settings {
        /// The request settings
        AWS::Settings aws;
        /// The credentials
        AWS::Secret secret;
        /// The socket settings
        network::HttpConnection::TCPSettings tcp;
    };

    private:
    /// The request builder
    AWS _aws;
    /// The socket settings
    network::HttpConnection::TCPSettings _tcp;

    /// Send a request and receive the response header, raises the store error of failed requests
    std::unique_ptr<network::HttpConnection> execute(const std::string& bucket, const utils::Bytes& header, std::span<const uint8_t> body = {}, bool headRequest = false) const;

    public:
    /// The constructor
    explicit S3Store(Settings settings);

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

    /// Map a failed response to the store error
    [[nodiscard]] static StoreError makeError(uint16_t status, std::string_view body);
};
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
