#include "network/http_helper.hpp"
#include "utils/error.hpp"
#include <charconv>
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
using namespace std;
//---------------------------------------------------------------------------
static bool parseNumber(string_view value, uint64_t& result, int base = 10)
// Parse the complete value as number
{
    if (value.empty())
        return false;
    auto [ptr, ec] = from_chars(value.data(), value.data() + value.size(), result, base);
    return ec == errc() && ptr == value.data() + value.size();
}
//---------------------------------------------------------------------------
optional<uint32_t> HttpHelper::findHeaderEnd(string_view data)
// Find the end of the header
{
    static constexpr string_view headerEnd = "\r\n\r\n";
    auto end = data.find(headerEnd);
    if (end == string_view::npos)
        return nullopt;
    return static_cast<uint32_t>(end + headerEnd.size());
}
//---------------------------------------------------------------------------
HttpHelper::Info HttpHelper::detect(string_view header, bool headRequest)
// Detect the protocol
{
    static constexpr string_view transferEncoding = "Transfer-Encoding";
    static constexpr string_view chunkedEncoding = "chunked";
    static constexpr string_view contentLength = "Content-Length";

    auto headerLength = findHeaderEnd(header);
    if (!headerLength)
        throw Error(Error::Kind::Protocol, "Invalid HttpResponse: Incomplete header!");

    Info info;
    info.response = HttpResponse::deserialize(header.substr(0, *headerLength));
    info.headerLength = *headerLength;

    if (auto length = info.response.header(contentLength)) {
        uint64_t value;
        if (!parseNumber(*length, value))
            throw Error(Error::Kind::Protocol, "Invalid Content-Length: " + string(*length));
        info.length = value;
    }

    if (headRequest || HttpResponse::withoutContent(info.response.status)) {
        info.encoding = Encoding::Empty;
    } else if (auto encoding = info.response.header(transferEncoding); encoding && encoding->find(chunkedEncoding) != string_view::npos) {
        info.encoding = Encoding::ChunkedEncoding;
        info.length.reset();
    } else if (info.length) {
        info.encoding = Encoding::ContentLength;
    } else {
        info.encoding = Encoding::UntilClose;
    }
    return info;
}
//---------------------------------------------------------------------------
optional<pair<uint64_t, uint32_t>> HttpHelper::parseChunkHeader(string_view data)
// Parse the chunk size line, returns the size and the length of the line
{
    static constexpr string_view newline = "\r\n";
    auto end = data.find(newline);
    if (end == string_view::npos)
        return nullopt;
    auto line = data.substr(0, end);
    // Drop chunk extensions
    if (auto ext = line.find(';'); ext != string_view::npos)
        line = line.substr(0, ext);
    while (!line.empty() && line.back() == ' ')
        line.remove_suffix(1);
    uint64_t size;
    if (!parseNumber(line, size, 16))
        throw Error(Error::Kind::Protocol, "Invalid chunk size: " + string(line));
    return pair<uint64_t, uint32_t>(size, static_cast<uint32_t>(end + newline.size()));
}
//---------------------------------------------------------------------------
HttpHelper::ContentRange HttpHelper::parseContentRange(string_view value)
// Parse "bytes start-end/total"
{
    static constexpr string_view unit = "bytes ";
    auto fail = [&value]() {
        return Error(Error::Kind::Protocol, "Malformed Content-Range: '" + string(value) + "'");
    };
    if (!value.starts_with(unit))
        throw fail();
    auto range = value.substr(unit.size());
    auto dash = range.find('-');
    auto slash = range.find('/');
    if (dash == string_view::npos || slash == string_view::npos || dash > slash)
        throw fail();

    ContentRange result;
    if (!parseNumber(range.substr(0, dash), result.start) || !parseNumber(range.substr(dash + 1, slash - dash - 1), result.end) || !parseNumber(range.substr(slash + 1), result.total))
        throw fail();
    if (result.end < result.start || result.end >= result.total)
        throw fail();
    return result;
}
//---------------------------------------------------------------------------
string HttpHelper::rangeHeader(optional<uint64_t> first, optional<uint64_t> last)
// Build the range value
{
    string range = "bytes=";
    if (!first)
        return range + "-" + to_string(last.value_or(0));
    range += to_string(*first) + "-";
    if (last)
        range += to_string(*last);
    return range;
}
//---------------------------------------------------------------------------
} // namespace blobstream::network
