#include "cloud/provider.hpp"
#include "cloud/s3_store.hpp"
#include "utils/error.hpp"
#include "utils/log.hpp"
#include <charconv>
#include <cstdlib>
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
static uint32_t parsePort(string_view port, string_view uri)
// Parse a port number
{
    uint32_t result = 0;
    auto [ptr, ec] = from_chars(port.data(), port.data() + port.size(), result);
    if (ec != errc() || ptr != port.data() + port.size() || !result || result > 65535)
        throw Error(Error::Kind::Configuration, "Invalid port '" + string(port) + "' in '" + string(uri) + "'");
    return result;
}
//---------------------------------------------------------------------------
static optional<string> environment(const char* name)
// Read an environment variable
{
    auto value = getenv(name);
    if (!value || !*value)
        return nullopt;
    return string(value);
}
//---------------------------------------------------------------------------
bool Provider::isRemoteFile(string_view fileName) noexcept
// Is it a remote file?
{
    for (auto prefix : remoteFile)
        if (fileName.starts_with(prefix))
            return true;
    return false;
}
//---------------------------------------------------------------------------
Uri Provider::parseUri(string_view uriString)
// Parse [id:secret@][host[:port]@]bucket/key
{
    Uri uri;
    auto schemeEnd = uriString.find("://");
    if (schemeEnd == string_view::npos || !isRemoteFile(uriString))
        throw Error(Error::Kind::Configuration, "Unsupported scheme in '" + string(uriString) + "', expected one of s3, s3n, s3u, s3a");
    uri.scheme = uriString.substr(0, schemeEnd);
    auto rest = uriString.substr(schemeEnd + 3);

    // Credentials, only if the part before the first @ has a colon
    if (auto at = rest.find('@'); at != string_view::npos) {
        auto auth = rest.substr(0, at);
        if (auto colon = auth.find(':'); colon != string_view::npos) {
            uri.accessId = string(auth.substr(0, colon));
            uri.accessSecret = string(auth.substr(colon + 1));
            rest = rest.substr(at + 1);
        }
    }

    auto slash = rest.find('/');
    if (slash == string_view::npos)
        throw Error(Error::Kind::Configuration, "Missing key in '" + string(uriString) + "'");
    auto head = rest.substr(0, slash);
    uri.keyId = rest.substr(slash + 1);

    if (auto at = head.find('@'); at != string_view::npos) {
        uri.ordinaryCallingFormat = true;
        auto hostPort = head.substr(0, at);
        uri.bucketId = head.substr(at + 1);
        if (auto colon = hostPort.find(':'); colon != string_view::npos) {
            uri.host = hostPort.substr(0, colon);
            uri.port = parsePort(hostPort.substr(colon + 1), uriString);
        } else {
            uri.host = hostPort;
        }
    } else {
        uri.bucketId = head;
    }
    if (uri.bucketId.empty())
        throw Error(Error::Kind::Configuration, "Missing bucket in '" + string(uriString) + "'");
    return uri;
}
//---------------------------------------------------------------------------
void Provider::parseEndpoint(string_view endpoint, AWS::Settings& settings)
// Split scheme://host:port
{
    auto original = endpoint;
    settings.https = true;
    if (endpoint.starts_with("https://")) {
        endpoint.remove_prefix(8);
    } else if (endpoint.starts_with("http://")) {
        settings.https = false;
        endpoint.remove_prefix(7);
    }
    if (auto slash = endpoint.find('/'); slash != string_view::npos)
        endpoint = endpoint.substr(0, slash);
    if (endpoint.empty())
        throw Error(Error::Kind::Configuration, "Invalid endpoint '" + string(original) + "'");
    if (auto colon = endpoint.find(':'); colon != string_view::npos) {
        settings.endpoint = endpoint.substr(0, colon);
        settings.port = parsePort(endpoint.substr(colon + 1), original);
    } else {
        settings.endpoint = endpoint;
        settings.port = settings.https ? 443 : 80;
    }
}
//---------------------------------------------------------------------------
shared_ptr<Store> Provider::makeStore(const StoreOptions& options)
// Create a store
{
    S3Store::Settings settings;
    settings.tcp = options.tcp;
    if (options.endpoint)
        parseEndpoint(*options.endpoint, settings.aws);
    if (options.region)
        settings.aws.region = *options.region;
    else if (auto region = environment("AWS_REGION"); region)
        settings.aws.region = *region;
    else if (auto defaultRegion = environment("AWS_DEFAULT_REGION"); defaultRegion)
        settings.aws.region = *defaultRegion;

    if (options.credentials) {
        settings.secret = *options.credentials;
    } else {
        auto keyId = environment("AWS_ACCESS_KEY_ID");
        auto secret = environment("AWS_SECRET_ACCESS_KEY");
        if (!keyId || !secret)
            throw Error(Error::Kind::Configuration, "No credentials given and AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY are not set");
        settings.secret = {*keyId, *secret, environment("AWS_SESSION_TOKEN").value_or("")};
    }
    utils::logger().debug("creating s3 store for {}:{} in {}", settings.aws.endpoint.empty() ? string(defaultHost) : settings.aws.endpoint, settings.aws.port, settings.aws.region);
    return make_shared<S3Store>(move(settings));
}
//---------------------------------------------------------------------------
} // namespace blobstream::cloud
