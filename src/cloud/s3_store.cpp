#include "cloud/s3_store.hpp"
#include "utils/log.hpp"
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
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// A body streamed from the connection
class ConnectionBody : public ObjectBody {
    /// The connection
    unique_ptr<network::HttpConnection> _connection;

    public:
    /// The constructor
    explicit ConnectionBody(unique_ptr<network::HttpConnection> connection) : _connection(move(connection)) {}
    /// Read from the socket
    uint64_t read(uint8_t* data, uint64_t length) override { return _connection->readBody(data, length); }
};
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
S3Store::S3Store(Settings settings) : _aws(move(settings.aws), move(settings.secret)), _tcp(settings.tcp)
// The constructor
{
}
//---------------------------------------------------------------------------
StoreError S3Store::makeError(uint16_t status, string_view body)
// Map the response to the error
{
    auto info = AWS::parseError(body);
    if (info.code.empty()) {
        // Head requests carry no error document
        switch (status) {
            case 404: info.code = "NotFound"; break;
            case 403: info.code = "Forbidden"; break;
            case 416: info.code = "InvalidRange"; break;
            default: info.code = to_string(status); break;
        }
        info.message = network::HttpResponse::getResponseCode(network::HttpResponse::getCode(status));
    }
    auto kind = Error::Kind::Client;
    if (status == 416 || info.code == "InvalidRange")
        kind = Error::Kind::RangeNotSatisfiable;
    else if (info.code == "MalformedXML")
        kind = Error::Kind::StoreRejection;
    return StoreError(kind, info.code, info.message, status, info.actualObjectSize);
}
//---------------------------------------------------------------------------
unique_ptr<network::HttpConnection> S3Store::execute(const string& bucket, const utils::Bytes& header, span<const uint8_t> body, bool headRequest) const
// Send the request and check the status
{
    auto& settings = _aws.getSettings();
    auto connection = make_unique<network::HttpConnection>(_aws.getAddress(bucket), settings.port, settings.https, _tcp);
    connection->send(header.span(), body);
    auto& response = connection->receiveHeader(headRequest);
    utils::logger().debug("{} answered with status {}", connection->hostname(), response.status);
    if (!network::HttpResponse::checkSuccess(response.status)) {
        auto status = response.status;
        throw makeError(status, connection->readAll());
    }
    return connection;
}
//---------------------------------------------------------------------------
GetResult S3Store::getObject(const ObjectHandle& handle, const optional<ByteRange>& range)
// Get an object
{
    auto request = _aws.getRequest(handle, range);
    auto connection = execute(handle.bucket, *request);
    GetResult result;
    auto& response = connection->info().response;
    if (auto contentRange = response.header("Content-Range"))
        result.contentRange = string(*contentRange);
    result.contentLength = connection->info().length;
    result.body = make_unique<ConnectionBody>(move(connection));
    return result;
}
//---------------------------------------------------------------------------
ObjectInfo S3Store::headObject(const ObjectHandle& handle)
// Get the metadata
{
    auto request = _aws.headRequest(handle);
    auto connection = execute(handle.bucket, *request, {}, true);
    if (!connection->info().length)
        throw StoreError(Error::Kind::Protocol, "MissingContentLength", "HEAD response without Content-Length for " + handle.name());
    return {*connection->info().length, AWS::getETag(connection->info().response)};
}
//---------------------------------------------------------------------------
void S3Store::putObject(const ObjectHandle& handle, span<const uint8_t> data)
// Put an object
{
    auto request = _aws.putRequest(handle, data);
    auto connection = execute(handle.bucket, *request, data);
    connection->readAll();
}
//---------------------------------------------------------------------------
string S3Store::initiateMultipartUpload(const ObjectHandle& handle)
// Create an upload
{
    auto request = _aws.createMultiPartRequest(handle);
    auto connection = execute(handle.bucket, *request);
    auto uploadId = AWS::getUploadId(connection->readAll());
    if (uploadId.empty())
        throw StoreError(Error::Kind::Protocol, "MissingUploadId", "CreateMultipartUpload response without UploadId for " + handle.name());
    return uploadId;
}
//---------------------------------------------------------------------------
string S3Store::uploadPart(const ObjectHandle& handle, const string& uploadId, uint32_t partNumber, span<const uint8_t> data)
// Upload a part
{
    auto request = _aws.putPartRequest(handle, uploadId, partNumber, data);
    auto connection = execute(handle.bucket, *request, data);
    auto etag = AWS::getETag(connection->info().response);
    connection->readAll();
    if (etag.empty())
        throw StoreError(Error::Kind::Protocol, "MissingETag", "UploadPart response without ETag for " + handle.name());
    return etag;
}
//---------------------------------------------------------------------------
void S3Store::completeMultipartUpload(const ObjectHandle& handle, const string& uploadId, const vector<CompletedPart>& parts)
// Complete the upload
{
    string content;
    auto request = _aws.completeMultiPartRequest(handle, uploadId, parts, content);
    auto connection = execute(handle.bucket, *request, utils::asBytes(content));
    // The store may report a failure with status 200
    auto body = connection->readAll();
    if (body.find("<Error>") != string::npos)
        throw makeError(connection->info().response.status, body);
}
//---------------------------------------------------------------------------
void S3Store::abortMultipartUpload(const ObjectHandle& handle, const string& uploadId)
// Abort the upload
{
    auto request = _aws.abortMultiPartRequest(handle, uploadId);
    auto connection = execute(handle.bucket, *request);
    connection->readAll();
}
//---------------------------------------------------------------------------
ListPage S3Store::listObjects(const string& bucket, const string& prefix, const optional<string>& continuationToken)
// List a page
{
    auto request = _aws.listRequest(bucket, prefix, continuationToken);
    auto connection = execute(bucket, *request);
    return AWS::parseListing(connection->readAll());
}
//---------------------------------------------------------------------------
void S3Store::headContainer(const string& bucket)
// Check the bucket
{
    auto request = _aws.headBucketRequest(bucket);
    execute(bucket, *request, {}, true);
}
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
