#include "cloud/aws.hpp"
#include "cloud/aws_signer.hpp"
#include "utils/utils.hpp"
#include <charconv>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
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
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
string buildAMZTimestamp()
// Creates the AWS timestamp
{
    stringstream s;
    const auto t = chrono::system_clock::to_time_t(chrono::system_clock::now());
    tm utc{};
    gmtime_r(&t, &utc);
    s << put_time(&utc, "%Y%m%dT%H%M%SZ");
    return s.str();
}
//---------------------------------------------------------------------------
optional<string_view> findTag(string_view body, string_view tag, size_t& pos)
// Find the next <tag>value</tag> starting at pos
{
    auto open = "<" + string(tag) + ">";
    auto close = "</" + string(tag) + ">";
    auto start = body.find(open, pos);
    if (start == body.npos)
        return nullopt;
    start += open.size();
    auto end = body.find(close, start);
    if (end == body.npos)
        return nullopt;
    pos = end + close.size();
    return body.substr(start, end - start);
}
//---------------------------------------------------------------------------
optional<string_view> findTag(string_view body, string_view tag)
// Find the first <tag>value</tag>
{
    size_t pos = 0;
    return findTag(body, tag, pos);
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
string AWS::getAddress(const string& bucket) const
// Gets the address of AWS S3
{
    if (!_settings.endpoint.empty())
        return _settings.endpoint;
    if (bucket.empty())
        return "s3." + _settings.region + ".amazonaws.com";
    return bucket + ".s3." + _settings.region + ".amazonaws.com";
}
//---------------------------------------------------------------------------
string AWS::objectPath(const ObjectHandle& handle) const
// If an endpoint is defined, we use the path-style request. The default is the usage of virtual hosted-style requests.
{
    if (_settings.endpoint.empty())
        return "/" + utils::encodeUrlPath(handle.key);
    return "/" + handle.bucket + "/" + utils::encodeUrlPath(handle.key);
}
//---------------------------------------------------------------------------
string AWS::bucketPath(const string& bucket) const
// The path of the bucket itself
{
    if (_settings.endpoint.empty())
        return "/";
    return "/" + bucket;
}
//---------------------------------------------------------------------------
unique_ptr<utils::Bytes> AWS::buildRequest(network::HttpRequest& request, const string& bucket, span<const uint8_t> body) const
// Creates and signs the request
{
    auto host = getAddress(bucket);
    auto defaultPort = _settings.https ? 443u : 80u;
    if (_settings.port != defaultPort)
        host += ":" + to_string(_settings.port);
    request.headers.emplace("Host", host);
    request.headers.emplace("x-amz-date", _settings.timestamp.empty() ? buildAMZTimestamp() : _settings.timestamp);
    if (_settings.requesterPays)
        request.headers.emplace("x-amz-request-payer", "requester");
    if (!_secret.token.empty())
        request.headers.emplace("x-amz-security-token", _secret.token);
    if (request.method == network::HttpRequest::Method::PUT || request.method == network::HttpRequest::Method::POST)
        request.headers.emplace("Content-Length", to_string(body.size()));

    AWSSigner::StringToSign stringToSign = {.request = request, .region = _settings.region, .service = "s3", .requestSHA = "", .signedHeaders = "", .payloadHash = ""};
    AWSSigner::encodeCanonicalRequest(request, stringToSign, body.data(), body.size());
    AWSSigner::signRequest(_secret.keyId, _secret.secret, stringToSign);
    return network::HttpRequest::serialize(request);
}
//---------------------------------------------------------------------------
unique_ptr<utils::Bytes> AWS::getRequest(const ObjectHandle& handle, const optional<ByteRange>& range) const
// Builds the http request for downloading a blob
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::GET;
    request.path = objectPath(handle);
    if (handle.versionId)
        request.queries.emplace("versionId", *handle.versionId);
    if (range)
        request.headers.emplace("Range", range->toString());
    return buildRequest(request, handle.bucket);
}
//---------------------------------------------------------------------------
unique_ptr<utils::Bytes> AWS::headRequest(const ObjectHandle& handle) const
// Builds the http request for the object metadata
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::HEAD;
    request.path = objectPath(handle);
    if (handle.versionId)
        request.queries.emplace("versionId", *handle.versionId);
    return buildRequest(request, handle.bucket);
}
//---------------------------------------------------------------------------
unique_ptr<utils::Bytes> AWS::putRequest(const ObjectHandle& handle, span<const uint8_t> object) const
// Builds the http request for putting objects without the object data itself
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::PUT;
    request.path = objectPath(handle);
    return buildRequest(request, handle.bucket, object);
}
//---------------------------------------------------------------------------
unique_ptr<utils::Bytes> AWS::createMultiPartRequest(const ObjectHandle& handle) const
// Builds the http request for creating multipart upload objects
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::POST;
    request.path = objectPath(handle);
    request.queries.emplace("uploads", "");
    return buildRequest(request, handle.bucket);
}
//---------------------------------------------------------------------------
unique_ptr<utils::Bytes> AWS::putPartRequest(const ObjectHandle& handle, const string& uploadId, uint32_t partNumber, span<const uint8_t> object) const
// Builds the http request for uploading a part without the part data itself
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::PUT;
    request.path = objectPath(handle);
    request.queries.emplace("partNumber", to_string(partNumber));
    request.queries.emplace("uploadId", uploadId);
    return buildRequest(request, handle.bucket, object);
}
//---------------------------------------------------------------------------
unique_ptr<utils::Bytes> AWS::completeMultiPartRequest(const ObjectHandle& handle, const string& uploadId, const vector<CompletedPart>& parts, string& content) const
// Builds the http request for completing multipart upload objects
{
    content = "<CompleteMultipartUpload>\n";
    for (auto& part : parts) {
        content += "<Part>\n<PartNumber>";
        content += to_string(part.partNumber);
        content += "</PartNumber>\n<ETag>\"";
        content += xmlEscape(part.etag);
        content += "\"</ETag>\n</Part>\n";
    }
    content += "</CompleteMultipartUpload>\n";

    network::HttpRequest request;
    request.method = network::HttpRequest::Method::POST;
    request.path = objectPath(handle);
    request.queries.emplace("uploadId", uploadId);
    return buildRequest(request, handle.bucket, utils::asBytes(content));
}
//---------------------------------------------------------------------------
unique_ptr<utils::Bytes> AWS::abortMultiPartRequest(const ObjectHandle& handle, const string& uploadId) const
// Builds the http request for aborting a multipart upload
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::DELETE;
    request.path = objectPath(handle);
    request.queries.emplace("uploadId", uploadId);
    return buildRequest(request, handle.bucket);
}
//---------------------------------------------------------------------------
unique_ptr<utils::Bytes> AWS::listRequest(const string& bucket, const string& prefix, const optional<string>& continuationToken) const
// Builds the ListObjectsV2 request
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::GET;
    request.path = bucketPath(bucket);
    request.queries.emplace("list-type", "2");
    if (!prefix.empty())
        request.queries.emplace("prefix", prefix);
    if (continuationToken)
        request.queries.emplace("continuation-token", *continuationToken);
    return buildRequest(request, bucket);
}
//---------------------------------------------------------------------------
unique_ptr<utils::Bytes> AWS::headBucketRequest(const string& bucket) const
// Builds the HeadBucket request
{
    network::HttpRequest request;
    request.method = network::HttpRequest::Method::HEAD;
    request.path = bucketPath(bucket);
    return buildRequest(request, bucket);
}
//---------------------------------------------------------------------------
string AWS::getETag(const network::HttpResponse& response)
// Get the etag from the upload header
{
    auto etag = response.header("ETag");
    if (!etag)
        return "";
    auto value = *etag;
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        value = value.substr(1, value.size() - 2);
    return string(value);
}
//---------------------------------------------------------------------------
string AWS::getUploadId(string_view body)
// Get the upload id from the multipart request body
{
    auto uploadId = findTag(body, "UploadId");
    return uploadId ? xmlUnescape(*uploadId) : "";
}
//---------------------------------------------------------------------------
ListPage AWS::parseListing(string_view body)
// Parse the keys and the continuation token
{
    ListPage page;
    size_t pos = 0;
    while (auto contents = findTag(body, "Contents", pos)) {
        if (auto key = findTag(*contents, "Key"))
            page.keys.push_back(xmlUnescape(*key));
    }
    auto truncated = findTag(body, "IsTruncated");
    if (truncated && *truncated == "true") {
        if (auto token = findTag(body, "NextContinuationToken"))
            page.nextToken = xmlUnescape(*token);
    }
    return page;
}
//---------------------------------------------------------------------------
AWS::ErrorInfo AWS::parseError(string_view body)
// Parse the error document
{
    ErrorInfo info;
    auto error = findTag(body, "Error");
    if (!error)
        return info;
    if (auto code = findTag(*error, "Code"))
        info.code = xmlUnescape(*code);
    if (auto message = findTag(*error, "Message"))
        info.message = xmlUnescape(*message);
    if (auto size = findTag(*error, "ActualObjectSize")) {
        uint64_t value;
        auto [ptr, ec] = from_chars(size->data(), size->data() + size->size(), value);
        if (ec == errc() && ptr == size->data() + size->size())
            info.actualObjectSize = value;
    }
    return info;
}
//---------------------------------------------------------------------------
string AWS::xmlUnescape(string_view value)
// Resolve the predefined xml entities
{
    static constexpr pair<string_view, char> entities[] = {{"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}};
    string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size();) {
        if (value[i] == '&') {
            bool replaced = false;
            for (auto& entity : entities) {
                if (value.substr(i).starts_with(entity.first)) {
                    result += entity.second;
                    i += entity.first.size();
                    replaced = true;
                    break;
                }
            }
            if (replaced)
                continue;
        }
        result += value[i++];
    }
    return result;
}
//---------------------------------------------------------------------------
string AWS::xmlEscape(string_view value)
// Escape the xml special characters
{
    string result;
    result.reserve(value.size());
    for (auto c : value) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
