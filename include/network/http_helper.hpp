#pragma once
#include "network/http_response.hpp"
#include <cstdint>
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
namespace blobstream::network {
//---------------------------------------------------------------------------
/// Implements an helper to frame http responses and to handle byte ranges
class HttpHelper {
    public:
    /// The encoding
    enum class Encoding : uint8_t {
        Unknown,
        /// No body follows the header
        Empty,
        ContentLength,
        ChunkedEncoding,
        /// The body ends when the peer closes the connection
        UntilClose
    };

    struct Info {
        /// The response header
        HttpResponse response;
        /// The announced content length, for head requests the length of the object
        std::optional<uint64_t> length;
        /// The header length
        uint32_t headerLength = 0;
        /// The encoding
        Encoding encoding = Encoding::Unknown;
    };

    /// A parsed Content-Range header
    struct ContentRange {
        /// The first byte
        uint64_t start;
        /// The last byte, inclusive
        uint64_t end;
        /// The total object length
        uint64_t total;
    };

    /// Find the end of the header, returns the header length including the empty line
    [[nodiscard]] static std::optional<uint32_t> findHeaderEnd(std::string_view data);
    /// Detect the protocol of a complete header
    [[nodiscard]] static Info detect(std::string_view header, bool headRequest = false);
    /// Parse the size line of a chunk, nullopt if the line is not complete yet
    [[nodiscard]] static std::optional<std::pair<uint64_t, uint32_t>> parseChunkHeader(std::string_view data);
    /// Parse a Content-Range value of the form "bytes start-end/total"
    [[nodiscard]] static ContentRange parseContentRange(std::string_view value);
    /// Build a Range value, without first the last value is the suffix length
    [[nodiscard]] static std::string rangeHeader(std::optional<uint64_t> first, std::optional<uint64_t> last);
};
//---------------------------------------------------------------------------
} // namespace blobstream::network
