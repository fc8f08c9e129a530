#pragma once
#include "network/http_request.hpp"
#include <cstdint>
#include <string>
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
/// Implements the AWS S3 Signing Logic
/// It follows the v4 docu: https://docs.aws.amazon.com/general/latest/gr/sigv4_signing.html
class AWSSigner {
    public:
    /// Payloads up to this size are hashed, larger ones are sent unsigned
    static constexpr uint64_t signedPayloadLimit = 1 << 10;

    struct StringToSign {
        /// The canonical request
        network::HttpRequest& request;
        /// The region
        std::string region;
        /// The service
        std::string service;
        /// The request sha
        std::string requestSHA;
        /// The signed headers
        std::string signedHeaders;
        /// The payload hash
        std::string payloadHash;
    };

    /// Creates the canonical request from the input, adds the payload headers to the request
    static void encodeCanonicalRequest(network::HttpRequest& request, StringToSign& stringToSign, const uint8_t* bodyData = nullptr, uint64_t bodyLength = 0);
    /// Calculates the signature and adds the Authorization header
    static void signRequest(const std::string& keyId, const std::string& secret, const StringToSign& stringToSign);

    private:
    /// Creates the string to sign
    [[nodiscard]] static std::string createStringToSign(const StringToSign& stringToSign);
};
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
