#pragma once
#include "utils/data_vector.hpp"
#include <cstdint>
#include <map>
#include <memory>
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
/// Implements an helper to serialize http requests
struct HttpRequest {
    /// The method class
    enum class Method : uint8_t {
        GET,
        HEAD,
        PUT,
        POST,
        DELETE
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The queries - need to be RFC 3986 conform
    std::map<std::string, std::string> queries;
    /// The headers - need to be without trailing and leading whitespaces
    std::map<std::string, std::string> headers;
    /// The method
    Method method = Method::GET;
    /// The type
    Type type = Type::HTTP_1_1;
    /// The path - needs to be RFC 3986 conform
    std::string path;

    /// Get the request method
    static constexpr auto getRequestMethod(const Method& method) {
        switch (method) {
            case Method::GET: return "GET";
            case Method::HEAD: return "HEAD";
            case Method::PUT: return "PUT";
            case Method::POST: return "POST";
            case Method::DELETE: return "DELETE";
            default: return "";
        }
    }
    /// Get the request type
    static constexpr auto getRequestType(const Type& type) {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "";
        }
    }
    /// The query string, keys sorted and encoded as for signing
    [[nodiscard]] std::string queryString() const;
    /// Serialize the request header
    [[nodiscard]] static std::unique_ptr<utils::Bytes> serialize(const HttpRequest& request);
};
//---------------------------------------------------------------------------
} // namespace blobstream::network
