#include "network/http_request.hpp"
#include "utils/utils.hpp"
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
namespace blobstream::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
string HttpRequest::queryString() const
// Build the encoded query string
{
    string result;
    for (auto it = queries.begin(); it != queries.end(); ++it) {
        if (it != queries.begin())
            result += "&";
        result += utils::encodeUrlParameters(it->first) + "=" + utils::encodeUrlParameters(it->second);
    }
    return result;
}
//---------------------------------------------------------------------------
unique_ptr<utils::Bytes> HttpRequest::serialize(const HttpRequest& request)
// Serialize an http header
{
    string httpHeader = getRequestMethod(request.method);
    httpHeader += " " + request.path;
    if (!request.queries.empty())
        httpHeader += "?" + request.queryString();
    httpHeader += " ";
    httpHeader += getRequestType(request.type);
    httpHeader += "\r\n";
    for (const auto& h : request.headers)
        httpHeader += h.first + ": " + h.second + "\r\n";
    httpHeader += "\r\n";
    auto bytes = utils::asBytes(httpHeader);
    return make_unique<utils::Bytes>(bytes.data(), bytes.data() + bytes.size());
}
//---------------------------------------------------------------------------
} // namespace blobstream::network
