#pragma once
#include "network/http_helper.hpp"
#include "utils/data_vector.hpp"
#include <cstdint>
#include <span>
#include <string>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
typedef struct ssl_st SSL;
//---------------------------------------------------------------------------
namespace blobstream::network {
//---------------------------------------------------------------------------
/// A blocking HTTP/1.1 connection over TCP with optional TLS.
/// One request is sent, the response header is received, and the body is streamed
/// to the caller in pieces. The socket is closed on destruction.
class HttpConnection {
    public:
    /// The tcp settings
    struct TCPSettings {
        /// flag for noDelay
        int noDelay = 1;
        /// flag for keepAlive
        int keepAlive = 1;
        /// recv buffer for tcp
        int recvBuffer = 0;
        /// The send and recv timeout in usec
        int timeout = 30 * 1000 * 1000;
        /// Additional connect attempts
        int retryLimit = 2;
        /// Verify the certificate of the peer
        bool verifyPeer = true;
        /// The size of a single recv
        uint64_t chunkSize = 64u << 10;
    };

    private:
    /// The settings
    TCPSettings _settings;
    /// The hostname
    std::string _hostname;
    /// The socket
    int _fd;
    /// The tls session, nullptr for plain connections
    SSL* _ssl;
    /// Received bytes that were not handed out yet
    utils::Bytes _buffer;
    /// The framing of the current response
    HttpHelper::Info _info;
    /// The remaining bytes of the body or of the current chunk
    uint64_t _remaining;
    /// The received body bytes
    uint64_t _received;
    /// A chunk terminator is pending
    bool _chunkPending;
    /// The body was read completely
    bool _bodyDone;

    /// Connect the socket
    void connect(uint32_t port, int retryLimit);
    /// Start tls on the connected socket
    void startTLS();
    /// Receive raw bytes from the socket, returns 0 on close and -1 on error
    int64_t recvRaw(uint8_t* data, uint64_t length);
    /// Receive into the buffer, returns false if the peer closed
    bool fill();
    /// Read body bytes, first from the buffer then from the socket
    int64_t readRaw(uint8_t* data, uint64_t length);
    /// Read the next chunk header, returns false at the last chunk
    bool nextChunk();
    /// Raise an incomplete read
    [[noreturn]] void incomplete(const std::string& reason) const;

    public:
    /// Connect to hostname:port
    HttpConnection(const std::string& hostname, uint32_t port, bool tls, const TCPSettings& settings);
    /// Connect to hostname:port with the default settings
    HttpConnection(const std::string& hostname, uint32_t port, bool tls) : HttpConnection(hostname, port, tls, TCPSettings()) {}
    /// The destructor
    ~HttpConnection();
    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    /// Send a serialized header and the body
    void send(std::span<const uint8_t> header, std::span<const uint8_t> body = {});
    /// Receive the response header and prepare the body framing
    const HttpResponse& receiveHeader(bool headRequest = false);
    /// Read up to length body bytes, returns 0 at the end of the body
    uint64_t readBody(uint8_t* data, uint64_t length);
    /// Read the remaining body
    std::string readAll();

    /// Get the framing info of the response
    [[nodiscard]] const HttpHelper::Info& info() const { return _info; }
    /// Get the hostname
    [[nodiscard]] const std::string& hostname() const { return _hostname; }
};
//---------------------------------------------------------------------------
} // namespace blobstream::network
