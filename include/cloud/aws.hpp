#pragma once
#include "cloud/store.hpp"
#include "network/http_request.hpp"
#include "network/http_response.hpp"
#include "utils/data_vector.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// Dominik Durner, 2022
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::cloud {
//---------------------------------------------------------------------------
/// Implements the AWS S3 request logic: builds signed requests and parses the responses
class AWS {
    public:
    /// The settings for AWS requests
    struct Settings {
        /// The aws region
        std::string region = "us-east-1";
        /// The custom endpoint, enables path-style requests
        std::string endpoint;
        /// The port
        uint32_t port = 443;
        /// Use tls
        bool https = true;
        /// Send the requester pays header
        bool requesterPays = false;
        /// A fixed x-amz-date, empty uses the current time
        std::string timestamp;
    };

    /// The secret
    struct Secret {
        /// The key id
        std::string keyId;
        /// The secret
        std::string secret;
        /// The session token
        std::string token;
    };

    /// An error document
    struct ErrorInfo {
        /// The code
        std::string code;
        /// The message
        std::string message;
        /// The object size reported with InvalidRange
        std::optional<uint64_t> actualObjectSize;
    };

    /// The fake AMZ timestamp
    static constexpr const char* fakeAMZTimestamp = "21000101T000000Z";

    private:
    /// The settings
    Settings _settings;
    /// The secret
    Secret _secret;

    /// The request path of an object
    [[nodiscard]] std::string objectPath(const ObjectHandle& handle) const;
    /// The request path of a bucket
    [[nodiscard]] std::string bucketPath(const std::string& bucket) const;
    /// Creates the generic http request and signs it
    [[nodiscard]] std::unique_ptr<utils::Bytes> buildRequest(network::HttpRequest& request, const std::string& bucket, std::span<const uint8_t> body = {}) const;

    public:
    /// The constructor
    AWS(Settings settings, Secret secret) : _settings(std::move(settings)), _secret(std::move(secret)) {}

    /// Builds the http request for downloading an object or a range of it
    [[nodiscard]] std::unique_ptr<utils::Bytes> getRequest(const ObjectHandle& handle, const std::optional<ByteRange>& range) const;
    /// Builds the http request for the metadata of an object
    [[nodiscard]] std::unique_ptr<utils::Bytes> headRequest(const ObjectHandle& handle) const;
    /// Builds the http request for putting an object without the object data itself
    [[nodiscard]] std::unique_ptr<utils::Bytes> putRequest(const ObjectHandle& handle, std::span<const uint8_t> object) const;
    /// Builds the http request for creating a multipart upload
    [[nodiscard]] std::unique_ptr<utils::Bytes> createMultiPartRequest(const ObjectHandle& handle) const;
    /// Builds the http request for uploading a part without the part data itself
    [[nodiscard]] std::unique_ptr<utils::Bytes> putPartRequest(const ObjectHandle& handle, const std::string& uploadId, uint32_t partNumber, std::span<const uint8_t> object) const;
    /// Builds the http request for completing a multipart upload, the body is stored in content
    [[nodiscard]] std::unique_ptr<utils::Bytes> completeMultiPartRequest(const ObjectHandle& handle, const std::string& uploadId, const std::vector<CompletedPart>& parts, std::string& content) const;
    /// Builds the http request for aborting a multipart upload
    [[nodiscard]] std::unique_ptr<utils::Bytes> abortMultiPartRequest(const ObjectHandle& handle, const std::string& uploadId) const;
    /// Builds the http request for listing a bucket
    [[nodiscard]] std::unique_ptr<utils::Bytes> listRequest(const std::string& bucket, const std::string& prefix, const std::optional<std::string>& continuationToken) const;
    /// Builds the http request for checking a bucket
    [[nodiscard]] std::unique_ptr<utils::Bytes> headBucketRequest(const std::string& bucket) const;

    /// Get the address of the server
    [[nodiscard]] std::string getAddress(const std::string& bucket) const;
    /// Get the port of the server
    [[nodiscard]] uint32_t getPort() const { return _settings.port; }
    /// Get the settings
    [[nodiscard]] const Settings& getSettings() const { return _settings; }

    /// Get the etag from the response header
    [[nodiscard]] static std::string getETag(const network::HttpResponse& response);
    /// Get the upload id from the multipart request body
    [[nodiscard]] static std::string getUploadId(std::string_view body);
    /// Parse a ListObjectsV2 result
    [[nodiscard]] static ListPage parseListing(std::string_view body);
    /// Parse an error document, the code is empty if the body is none
    [[nodiscard]] static ErrorInfo parseError(std::string_view body);
    /// Resolve the xml entities
    [[nodiscard]] static std::string xmlUnescape(std::string_view value);
    /// Escape the xml special characters
    [[nodiscard]] static std::string xmlEscape(std::string_view value);
};
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
