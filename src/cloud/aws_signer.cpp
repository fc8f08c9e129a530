#include "cloud/aws_signer.hpp"
#include "utils/error.hpp"
#include "utils/utils.hpp"
#include <algorithm>
#include <map>
#include <sstream>
#include <openssl/md5.h>
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
using namespace std;
//---------------------------------------------------------------------------
static const string& amzDate(const network::HttpRequest& request)
// The request timestamp
{
    auto it = request.headers.find("x-amz-date");
    if (it == request.headers.end())
        throw Error(Error::Kind::Configuration, "missing x-amz-date");
    return it->second;
}
//---------------------------------------------------------------------------
void AWSSigner::encodeCanonicalRequest(network::HttpRequest& request, StringToSign& stringToSign, const uint8_t* bodyData, uint64_t bodyLength)
// Creates the canonical request (task 1)
// https://docs.aws.amazon.com/general/latest/gr/sigv4-create-canonical-request.html
{
    stringstream requestStream;
    // Step 1, canonicalize request method
    requestStream << network::HttpRequest::getRequestMethod(request.method) << "\n";

    // Step 2, canonicalize request path; the path is already RFC 3986 encoded
    requestStream << (request.path.empty() ? "/" : request.path) << "\n";

    // Step 3, canonicalize query, sorted by key
    requestStream << request.queryString() << "\n";

    if (bodyLength <= signedPayloadLimit) {
        // Step 6, create sha256 payload string, earlier because of https://docs.aws.amazon.com/AmazonS3/latest/API/sig-v4-header-based-auth.html
        stringToSign.payloadHash = utils::sha256Encode(bodyData, bodyLength);
        request.headers.emplace("x-amz-content-sha256", stringToSign.payloadHash);

        // Step 6a, content-md5 for uploads
        if (request.method == network::HttpRequest::Method::PUT || request.method == network::HttpRequest::Method::POST) {
            auto md5 = utils::md5Encode(bodyData, bodyLength);
            request.headers.emplace("Content-MD5", utils::base64Encode(reinterpret_cast<const uint8_t*>(md5.data()), MD5_DIGEST_LENGTH));
        }
    } else {
        stringToSign.payloadHash = "UNSIGNED-PAYLOAD";
        request.headers.emplace("x-amz-content-sha256", stringToSign.payloadHash);
    }

    // Step 4, canonicalize headers with lower case names
    map<string, string> sorted;
    for (auto& header : request.headers) {
        string name = header.first;
        transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return tolower(c); });
        sorted.emplace(move(name), header.second);
    }
    for (const auto& h : sorted)
        requestStream << h.first << ":" << h.second << "\n";
    requestStream << "\n";

    // Step 5, create signed headers
    stringToSign.signedHeaders.clear();
    for (auto it = sorted.begin(); it != sorted.end(); ++it) {
        if (it != sorted.begin())
            stringToSign.signedHeaders += ";";
        stringToSign.signedHeaders += it->first;
    }
    requestStream << stringToSign.signedHeaders << "\n";

    // Step 6 continuing
    requestStream << stringToSign.payloadHash;

    // Step 7, create sha256 request string
    auto requestString = requestStream.str();
    stringToSign.requestSHA = utils::sha256Encode(reinterpret_cast<const uint8_t*>(requestString.data()), requestString.length());
}
//---------------------------------------------------------------------------
string AWSSigner::createStringToSign(const StringToSign& stringToSign)
// Creates the string to sign (task 2)
// https://docs.aws.amazon.com/general/latest/gr/sigv4-create-string-to-sign.html
{
    auto& date = amzDate(stringToSign.request);
    stringstream requestStream;
    requestStream << "AWS4-HMAC-SHA256\n";
    requestStream << date << "\n";
    requestStream << date.substr(0, 8) << "/" << stringToSign.region << "/" << stringToSign.service << "/aws4_request\n";
    requestStream << stringToSign.requestSHA;
    return requestStream.str();
}
//---------------------------------------------------------------------------
void AWSSigner::signRequest(const string& keyId, const string& secret, const StringToSign& stringToSign)
// Calculates the signature for AWS signature version 4 (task 3)
// https://docs.aws.amazon.com/general/latest/gr/sigv4-calculate-signature.html
{
    auto hmac = [](const pair<unique_ptr<uint8_t[]>, uint64_t>& key, const string& message) {
        return utils::hmacSign(key.first.get(), key.second, reinterpret_cast<const uint8_t*>(message.data()), message.length());
    };

    // Step 1, build derivedSigningKey
    string kRequest = "aws4_request";
    auto kSecret = "AWS4" + secret;
    auto date = amzDate(stringToSign.request).substr(0, 8);
    auto derivedSigningKey = utils::hmacSign(reinterpret_cast<const uint8_t*>(kSecret.data()), kSecret.length(), reinterpret_cast<const uint8_t*>(date.data()), date.length());
    derivedSigningKey = hmac(derivedSigningKey, stringToSign.region);
    derivedSigningKey = hmac(derivedSigningKey, stringToSign.service);
    derivedSigningKey = hmac(derivedSigningKey, kRequest);

    // Step 2, finally sign the stringToSign with the derivedSigningKey
    auto signingKey = hmac(derivedSigningKey, createStringToSign(stringToSign));
    const auto signature = utils::hexEncode(signingKey.first.get(), signingKey.second);

    // https://docs.aws.amazon.com/general/latest/gr/sigv4-add-signature-to-request.html (task 4)
    stringstream authorization;
    authorization << "AWS4-HMAC-SHA256"
                  << " Credential=" << keyId << "/" << date << "/" << stringToSign.region << "/" << stringToSign.service << "/" << kRequest << ", SignedHeaders=" << stringToSign.signedHeaders << ", Signature=" << signature;
    stringToSign.request.headers.emplace("Authorization", authorization.str());
}
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
