#pragma once
#include "cloud/aws.hpp"
#include "cloud/store.hpp"
#include "network/http_connection.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
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
/// A parsed s3 uri of the form scheme://[id:secret@][host[:port]@]bucket/key
struct Uri {
    /// The scheme
    std::string scheme;
    /// The bucket
    std::string bucketId;
    /// The key
    std::string keyId;
    /// The port
    uint32_t port = 443;
    /// The host
    std::string host = "s3.amazonaws.com";
    /// A host was given in the uri
    bool ordinaryCallingFormat = false;
    /// The access key id
    std::optional<std::string> accessId;
    /// The secret access key
    std::optional<std::string> accessSecret;
};
//---------------------------------------------------------------------------
/// Implements the uri handling and the creation of stores
class Provider {
    public:
    /// The remote prefixes
    static constexpr std::string_view remoteFile[] = {"s3://", "s3n://", "s3u://", "s3a://"};
    /// The default host
    static constexpr std::string_view defaultHost = "s3.amazonaws.com";
    /// The default port
    static constexpr uint32_t defaultPort = 443;

    /// The options to build a store
    struct StoreOptions {
        /// The credentials, taken from the environment if missing
        std::optional<AWS::Secret> credentials;
        /// The endpoint url, e.g., https://host:port
        std::optional<std::string> endpoint;
        /// The region, taken from the environment if missing
        std::optional<std::string> region;
        /// The socket settings
        network::HttpConnection::TCPSettings tcp;
    };

    /// Is it a remote file?
    [[nodiscard]] static bool isRemoteFile(std::string_view fileName) noexcept;
    /// Parse the uri
    [[nodiscard]] static Uri parseUri(std::string_view uri);
    /// Split an endpoint url into the request settings
    static void parseEndpoint(std::string_view endpoint, AWS::Settings& settings);
    /// Create a store
    [[nodiscard]] static std::shared_ptr<Store> makeStore(const StoreOptions& options);
};
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
