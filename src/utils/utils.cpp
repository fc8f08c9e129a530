#include "utils/utils.hpp"
#include <cctype>
#include <stdexcept>
#include <utility>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/md5.h>
#include <openssl/params.h>
#include <openssl/sha.h>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// Dominik Durner, 2022
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace blobstream::utils {
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// Frees the digest context on scope exit
using DigestContext = unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
//---------------------------------------------------------------------------
string digest(const EVP_MD* md, const uint8_t* data, uint64_t length)
// Build the raw digest of the data
{
    DigestContext mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestInit_ex(mdctx.get(), md, nullptr) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_DigestUpdate(mdctx.get(), data, length) <= 0)
        throw runtime_error("OpenSSL Error!");

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned digestLength = 0;
    if (EVP_DigestFinal_ex(mdctx.get(), hash, &digestLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    return string(reinterpret_cast<char*>(hash), digestLength);
}
//---------------------------------------------------------------------------
bool unreserved(char c)
// Characters that are never percent encoded
{
    return isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~';
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
string base64Encode(const uint8_t* input, uint64_t length)
// Encodes a string as a base64 string
{
    if (!in_range<int>(length))
        throw runtime_error("Input too large for base64!");
    auto baseLength = 4 * ((length + 2) / 3);
    auto buffer = make_unique<char[]>(baseLength + 1);
    auto encodeLength = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(buffer.get()), input, static_cast<int>(length));
    if (encodeLength < 0 || static_cast<unsigned>(encodeLength) != baseLength)
        throw runtime_error("OpenSSL Error!");
    return string(buffer.get(), static_cast<unsigned>(encodeLength));
}
//---------------------------------------------------------------------------
string hexEncode(const uint8_t* input, uint64_t length, bool upper)
// Encodes a string as a hex string
{
    const char* hex = upper ? "0123456789ABCDEF" : "0123456789abcdef";
    string output;
    output.reserve(length << 1);
    for (auto i = 0u; i < length; i++) {
        output.push_back(hex[input[i] >> 4]);
        output.push_back(hex[input[i] & 15]);
    }
    return output;
}
//---------------------------------------------------------------------------
string encodeUrlParameters(const string& encode)
// Encodes a string for url
{
    string result;
    for (auto c : encode) {
        if (unreserved(c))
            result += c;
        else {
            result += "%";
            result += hexEncode(reinterpret_cast<uint8_t*>(&c), 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string encodeUrlPath(string_view path)
// Encodes an object path, slashes separate the segments
{
    string result;
    result.reserve(path.size());
    for (auto c : path) {
        if (unreserved(c) || c == '/')
            result += c;
        else {
            result += "%";
            result += hexEncode(reinterpret_cast<uint8_t*>(&c), 1, true);
        }
    }
    return result;
}
//---------------------------------------------------------------------------
string sha256Encode(const uint8_t* data, uint64_t length)
// Encodes the data as sha256 hex string
{
    auto hash = digest(EVP_sha256(), data, length);
    return hexEncode(reinterpret_cast<const uint8_t*>(hash.data()), hash.size());
}
//---------------------------------------------------------------------------
string md5Encode(const uint8_t* data, uint64_t length)
// Encodes the data as md5 string
{
    return digest(EVP_md5(), data, length);
}
//---------------------------------------------------------------------------
pair<unique_ptr<uint8_t[]>, uint64_t> hmacSign(const uint8_t* keyData, uint64_t keyLength, const uint8_t* msgData, uint64_t msgLength)
// Encodes the msg with the key with hmac-sha256
{
    unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)> mac(EVP_MAC_fetch(nullptr, "HMAC", nullptr), EVP_MAC_free);
    if (!mac)
        throw runtime_error("OpenSSL Error!");

    OSSL_PARAM params[2];
    string digestName = "SHA2-256";
    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digestName.data(), digestName.size());
    params[1] = OSSL_PARAM_construct_end();

    unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)> mctx(EVP_MAC_CTX_new(mac.get()), EVP_MAC_CTX_free);
    if (!mctx)
        throw runtime_error("OpenSSL Error!");

    if (EVP_MAC_init(mctx.get(), keyData, keyLength, params) <= 0)
        throw runtime_error("OpenSSL Error!");

    if (EVP_MAC_update(mctx.get(), msgData, msgLength) <= 0)
        throw runtime_error("OpenSSL Error!");

    size_t len;
    if (EVP_MAC_final(mctx.get(), nullptr, &len, 0) <= 0)
        throw runtime_error("OpenSSL Error!");

    auto hash = make_unique<uint8_t[]>(len);
    if (EVP_MAC_final(mctx.get(), hash.get(), &len, len) <= 0)
        throw runtime_error("OpenSSL Error!");

    return {move(hash), SHA256_DIGEST_LENGTH};
}
//---------------------------------------------------------------------------
} // namespace blobstream::utils
