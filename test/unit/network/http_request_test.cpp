#include "network/http_request.hpp"
#include <catch2/catch.hpp>
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
namespace blobstream::network::test {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
TEST_CASE("http_request") {
    HttpRequest request;
    request.method = HttpRequest::Method::GET;
    request.path = "/test";
    request.type = HttpRequest::Type::HTTP_1_1;
    request.queries.emplace("key2", "value 2");
    request.queries.emplace("key", "value");
    request.queries.emplace("uploads", "");
    request.headers.emplace("Authorization", "test");
    request.headers.emplace("Timestamp", "2024-02-18 00:00:00");

    REQUIRE(request.queryString() == "key=value&key2=value%202&uploads=");
    auto serialize = HttpRequest::serialize(request);
    auto serializeView = string_view(reinterpret_cast<char*>(serialize->data()), serialize->size());
    REQUIRE(serializeView == "GET /test?key=value&key2=value%202&uploads= HTTP/1.1\r\nAuthorization: test\r\nTimestamp: 2024-02-18 00:00:00\r\n\r\n");
}
//---------------------------------------------------------------------------
TEST_CASE("http_request_without_query") {
    HttpRequest request;
    request.method = HttpRequest::Method::HEAD;
    request.path = "/bucket";
    request.headers.emplace("Host", "localhost");
    auto serialize = HttpRequest::serialize(request);
    REQUIRE(string_view(reinterpret_cast<char*>(serialize->data()), serialize->size()) == "HEAD /bucket HTTP/1.1\r\nHost: localhost\r\n\r\n");
}
//---------------------------------------------------------------------------
} // namespace blobstream::network::test
