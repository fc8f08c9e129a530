#include "cloud/aws.hpp"
#include "cloud/aws_signer.hpp"
#include "network/http_response.hpp"
#include "utils/data_vector.hpp"
#include <catch2/catch.hpp>
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
namespace blobstream::cloud::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
string_view view(const unique_ptr<utils::Bytes>& bytes)
// View the serialized request
{
    return utils::asString(bytes->span());
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
TEST_CASE("aws_virtual_hosted_get") {
    AWS::Settings settings;
    settings.timestamp = AWS::fakeAMZTimestamp;
    AWS aws(settings, {"ABC", "SECRET", ""});

    auto request = aws.getRequest({"bucket", "a/b c.d", nullopt}, ByteRange::from(10));
    string expected = "GET /a/b%20c.d HTTP/1.1\r\n"
                      "Authorization: AWS4-HMAC-SHA256 Credential=ABC/21000101/us-east-1/s3/aws4_request, SignedHeaders=host;range;x-amz-content-sha256;x-amz-date, Signature=9e902d218c32cfef4608f499a1ab0fc391abad174c1866e85b3f0bcf07f74f96\r\n"
                      "Host: bucket.s3.us-east-1.amazonaws.com\r\n"
                      "Range: bytes=10-\r\n"
                      "x-amz-content-sha256: e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855\r\n"
                      "x-amz-date: 21000101T000000Z\r\n\r\n";
    REQUIRE(view(request) == expected);
    REQUIRE(aws.getAddress("bucket") == "bucket.s3.us-east-1.amazonaws.com");
}
//---------------------------------------------------------------------------
TEST_CASE("aws_path_style_part_upload") {
    AWS::Settings settings;
    settings.region = "eu-central-1";
    settings.endpoint = "127.0.0.1";
    settings.port = 9000;
    settings.https = false;
    settings.timestamp = AWS::fakeAMZTimestamp;
    AWS aws(settings, {"minio", "minio123", ""});

    utils::Bytes part(10);
    auto request = aws.putPartRequest({"bucket", "key", nullopt}, "xyz", 1, part.span());
    string expected = "PUT /bucket/key?partNumber=1&uploadId=xyz HTTP/1.1\r\n"
                      "Authorization: AWS4-HMAC-SHA256 Credential=minio/21000101/eu-central-1/s3/aws4_request, SignedHeaders=content-length;content-md5;host;x-amz-content-sha256;x-amz-date, Signature=44fb59a9ae1387b649caa855e966573376a48a928cdaf38bcdce0b54c53ae5e2\r\n"
                      "Content-Length: 10\r\n"
                      "Content-MD5: pjyQzDaErYsKIXamqP6QBQ==\r\n"
                      "Host: 127.0.0.1:9000\r\n"
                      "x-amz-content-sha256: 01d448afd928065458cf670b60f5a594d735af0172c8d67f22a81680132681ca\r\n"
                      "x-amz-date: 21000101T000000Z\r\n\r\n";
    REQUIRE(view(request) == expected);
}
//---------------------------------------------------------------------------
TEST_CASE("aws_list_with_token") {
    AWS::Settings settings;
    settings.region = "eu-central-1";
    settings.endpoint = "127.0.0.1";
    settings.port = 9000;
    settings.https = false;
    settings.timestamp = AWS::fakeAMZTimestamp;
    AWS aws(settings, {"minio", "minio123", "TOKEN"});

    auto request = aws.listRequest("bucket", "dir/", "a/b");
    string expected = "GET /bucket?continuation-token=a%2Fb&list-type=2&prefix=dir%2F HTTP/1.1\r\n"
                      "Authorization: AWS4-HMAC-SHA256 Credential=minio/21000101/eu-central-1/s3/aws4_request, SignedHeaders=host;x-amz-content-sha256;x-amz-date;x-amz-security-token, Signature=1406a8fdc3e5174e15df828203bf37aae67006bd115964d3d7455fdaa29d6de7\r\n"
                      "Host: 127.0.0.1:9000\r\n"
                      "x-amz-content-sha256: e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855\r\n"
                      "x-amz-date: 21000101T000000Z\r\n"
                      "x-amz-security-token: TOKEN\r\n\r\n";
    REQUIRE(view(request) == expected);
}
//---------------------------------------------------------------------------
TEST_CASE("aws_unsigned_payload") {
    AWS::Settings settings;
    settings.timestamp = AWS::fakeAMZTimestamp;
    AWS aws(settings, {"ABC", "SECRET", ""});
    utils::Bytes object(AWSSigner::signedPayloadLimit + 1);
    auto request = string(view(aws.putRequest({"bucket", "big", nullopt}, object.span())));
    REQUIRE(request.find("x-amz-content-sha256: UNSIGNED-PAYLOAD\r\n") != string::npos);
    REQUIRE(request.find("Content-MD5") == string::npos);
    REQUIRE(request.find("Content-Length: 1025\r\n") != string::npos);
}
//---------------------------------------------------------------------------
TEST_CASE("aws_complete_body") {
    AWS::Settings settings;
    settings.timestamp = AWS::fakeAMZTimestamp;
    AWS aws(settings, {"ABC", "SECRET", ""});
    string content;
    auto request = aws.completeMultiPartRequest({"bucket", "key", nullopt}, "upload&1", {{1, "e1"}, {2, "e2"}}, content);
    REQUIRE(content == "<CompleteMultipartUpload>\n<Part>\n<PartNumber>1</PartNumber>\n<ETag>\"e1\"</ETag>\n</Part>\n<Part>\n<PartNumber>2</PartNumber>\n<ETag>\"e2\"</ETag>\n</Part>\n</CompleteMultipartUpload>\n");
    REQUIRE(view(request).starts_with("POST /key?uploadId=upload%261 HTTP/1.1\r\n"));
}
//---------------------------------------------------------------------------
TEST_CASE("aws_response_parsing") {
    auto uploadId = AWS::getUploadId("<InitiateMultipartUploadResult><Bucket>b</Bucket><Key>k</Key><UploadId>id&amp;1</UploadId></InitiateMultipartUploadResult>");
    REQUIRE(uploadId == "id&1");

    auto page = AWS::parseListing("<ListBucketResult><IsTruncated>true</IsTruncated><Contents><Key>a</Key><Size>1</Size></Contents><Contents><Key>b&lt;c</Key></Contents><NextContinuationToken>tok</NextContinuationToken></ListBucketResult>");
    REQUIRE(page.keys == vector<string>{"a", "b<c"});
    REQUIRE(page.nextToken == "tok");
    auto last = AWS::parseListing("<ListBucketResult><IsTruncated>false</IsTruncated><Contents><Key>z</Key></Contents></ListBucketResult>");
    REQUIRE(last.keys.size() == 1);
    REQUIRE(!last.nextToken);

    auto error = AWS::parseError("<?xml version=\"1.0\"?><Error><Code>InvalidRange</Code><Message>The requested range is not satisfiable</Message><ActualObjectSize>42</ActualObjectSize></Error>");
    REQUIRE(error.code == "InvalidRange");
    REQUIRE(error.message == "The requested range is not satisfiable");
    REQUIRE(error.actualObjectSize == 42);

    auto response = network::HttpResponse::deserialize("HTTP/1.1 200 OK\r\nETag: \"d41d8cd98f00b204e9800998ecf8427e\"\r\n\r\n");
    REQUIRE(AWS::getETag(response) == "d41d8cd98f00b204e9800998ecf8427e");
    REQUIRE(AWS::xmlEscape("<a&'\">") == "&lt;a&amp;&apos;&quot;&gt;");
}
//---------------------------------------------------------------------------
TEST_CASE("aws_missing_date") {
    network::HttpRequest request;
    request.headers.emplace("Host", "localhost");
    AWSSigner::StringToSign stringToSign = {.request = request, .region = "us-east-1", .service = "s3", .requestSHA = "", .signedHeaders = "", .payloadHash = ""};
    AWSSigner::encodeCanonicalRequest(request, stringToSign, nullptr, 0);
    REQUIRE_THROWS_AS(AWSSigner::signRequest("id", "secret", stringToSign), Error);
}
//---------------------------------------------------------------------------
} // namespace blobstream::cloud::test
