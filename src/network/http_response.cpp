#include "network/http_response.hpp"
#include "utils/error.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
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
static string_view trim(string_view value)
// Strip the surrounding whitespaces
{
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
        value.remove_prefix(1);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
        value.remove_suffix(1);
    return value;
}
//---------------------------------------------------------------------------
optional<string_view> HttpResponse::header(string_view name) const
// Find a header case insensitive
{
    auto sameChar = [](char a, char b) { return tolower(static_cast<unsigned char>(a)) == tolower(static_cast<unsigned char>(b)); };
    for (auto& keyValue : headers) {
        if (keyValue.first.size() == name.size() && equal(keyValue.first.begin(), keyValue.first.end(), name.begin(), name.end(), sameChar))
            return string_view(keyValue.second);
    }
    return nullopt;
}
//---------------------------------------------------------------------------
HttpResponse HttpResponse::deserialize(string_view data)
// Deserialize the http header
{
    static constexpr string_view strHttp1_0 = "HTTP/1.0";
    static constexpr string_view strHttp1_1 = "HTTP/1.1";
    static constexpr string_view strNewline = "\r\n";
    static constexpr char headerSeperator = ':';

    HttpResponse response;

    string_view line;
    auto firstLine = true;
    while (true) {
        auto pos = data.find(strNewline);
        if (pos == data.npos)
            throw Error(Error::Kind::Protocol, "Invalid HttpResponse: Incomplete header!");

        line = data.substr(0, pos);
        data = data.substr(pos + strNewline.size());
        if (line.empty()) {
            if (!firstLine)
                break;
            else
                throw Error(Error::Kind::Protocol, "Invalid HttpResponse: Missing first line!");
        }
        if (firstLine) {
            firstLine = false;
            // the http type
            if (line.starts_with(strHttp1_0)) {
                response.type = Type::HTTP_1_0;
            } else if (line.starts_with(strHttp1_1)) {
                response.type = Type::HTTP_1_1;
            } else {
                throw Error(Error::Kind::Protocol, "Invalid HttpResponse: Needs to be a HTTP type 1.0 or 1.1!");
            }

            string_view httpType = getResponseType(response.type);
            line = trim(line.substr(httpType.size()));

            // the numeric status
            auto [ptr, ec] = from_chars(line.data(), line.data() + line.size(), response.status);
            if (ec != errc() || ptr == line.data())
                throw Error(Error::Kind::Protocol, "Invalid HttpResponse: Missing status code!");
            response.code = getCode(response.status);
        } else {
            // headers
            auto keyPos = line.find(headerSeperator);
            if (keyPos == line.npos)
                throw Error(Error::Kind::Protocol, "Invalid HttpResponse: Headers need key and value!");
            response.headers.emplace(trim(line.substr(0, keyPos)), trim(line.substr(keyPos + 1)));
        }
    }

    return response;
}
//---------------------------------------------------------------------------
} // namespace blobstream::network
