#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// Dominik Durner, 2022
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::utils {
//---------------------------------------------------------------------------
/// Encode url special characters in %HEX
std::string encodeUrlParameters(const std::string& encode);
/// Encode an object key for the url path, keeps the slashes
std::string encodeUrlPath(std::string_view path);
/// Encode everything from binary representation to hex
std::string hexEncode(const uint8_t* input, uint64_t length, bool upper = false);
/// Encode everything from binary representation to base64
std::string base64Encode(const uint8_t* input, uint64_t length);
/// Build sha256 of the data encoded as hex
std::string sha256Encode(const uint8_t* data, uint64_t length);
/// Build the raw md5 digest of the data
std::string md5Encode(const uint8_t* data, uint64_t length);
/// Sign with hmac and return the sha256 signature
std::pair<std::unique_ptr<uint8_t[]>, uint64_t> hmacSign(const uint8_t* keyData, uint64_t keyLength, const uint8_t* msgData, uint64_t msgLength);
//---------------------------------------------------------------------------
} // namespace blobstream::utils
