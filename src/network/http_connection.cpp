#include "network/http_connection.hpp"
#include "utils/error.hpp"
#include "utils/log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
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
namespace {
//---------------------------------------------------------------------------
/// The maximum size of a response header
constexpr uint64_t maxHeaderSize = 64u << 10;
//---------------------------------------------------------------------------
SSL_CTX* tlsContext()
// The process wide client context, sessions use the system trust store
{
    static unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> context = []() {
        unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> ctx(SSL_CTX_new(TLS_client_method()), SSL_CTX_free);
        if (ctx) {
            SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
            if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1)
                utils::logger().warn("Unable to load the default certificate paths");
        }
        return ctx;
    }();
    return context.get();
}
//---------------------------------------------------------------------------
string sslError()
// The last OpenSSL error as string
{
    char buffer[256];
    ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
    return buffer;
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
HttpConnection::HttpConnection(const string& hostname, uint32_t port, bool tls, const TCPSettings& settings)
    : _settings(settings), _hostname(hostname), _fd(-1), _ssl(nullptr), _remaining(0), _received(0), _chunkPending(false), _bodyDone(true)
// The constructor
{
    connect(port, _settings.retryLimit);
    if (tls) {
        try {
            startTLS();
        } catch (const Error& /*error*/) {
            if (_ssl)
                SSL_free(_ssl);
            ::close(_fd);
            throw;
        }
    }
}
//---------------------------------------------------------------------------
HttpConnection::~HttpConnection()
// The destructor
{
    if (_ssl) {
        SSL_shutdown(_ssl);
        SSL_free(_ssl);
    }
    if (_fd >= 0)
        ::close(_fd);
}
//---------------------------------------------------------------------------
void HttpConnection::connect(uint32_t port, int retryLimit)
// Creates a new socket connection
{
    struct addrinfo hints = {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* temp;
    auto portString = to_string(port);
    if (auto res = getaddrinfo(_hostname.c_str(), portString.c_str(), &hints, &temp); res != 0)
        throw Error(Error::Kind::Transport, "hostname getaddrinfo error for " + _hostname + ": " + gai_strerror(res));
    unique_ptr<addrinfo, decltype(&freeaddrinfo)> addresses(temp, freeaddrinfo);

    string lastError;
    for (auto* addr = addresses.get(); addr; addr = addr->ai_next) {
        auto fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
        if (fd == -1) {
            lastError = "Socket creation error! " + string(strerror(errno));
            continue;
        }

        auto fail = [fd](const char* what) {
            ::close(fd);
            throw Error(Error::Kind::Transport, string("Socket creation error! - ") + what);
        };

        // Keep Alive
        if (_settings.keepAlive > 0 && setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &_settings.keepAlive, sizeof(_settings.keepAlive)))
            fail("keep alive error");
        // No Delay
        if (_settings.noDelay > 0 && setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &_settings.noDelay, sizeof(_settings.noDelay)))
            fail("nodelay error");
        // Recv buffer
        if (_settings.recvBuffer > 0 && setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &_settings.recvBuffer, sizeof(_settings.recvBuffer)))
            fail("recvbuf error");
        // Timeouts
        if (_settings.timeout > 0) {
            struct timeval tv;
            tv.tv_sec = _settings.timeout / (1000 * 1000);
            tv.tv_usec = _settings.timeout % (1000 * 1000);
            if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&tv), sizeof tv))
                fail("recv timeout error");
            if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&tv), sizeof tv))
                fail("send timeout error");
        }

        if (::connect(fd, addr->ai_addr, addr->ai_addrlen) == 0) {
            _fd = fd;
            return;
        }
        lastError = "Socket connect error! " + string(strerror(errno));
        ::close(fd);
    }

    if (retryLimit > 0) {
        utils::logger().debug("connecting to {}:{} failed ({}), retrying", _hostname, port, lastError);
        return connect(port, retryLimit - 1);
    }
    throw Error(Error::Kind::Transport, lastError + " (" + _hostname + ":" + portString + ")");
}
//---------------------------------------------------------------------------
void HttpConnection::startTLS()
// SSL/TLS connect
{
    auto ctx = tlsContext();
    if (!ctx)
        throw Error(Error::Kind::Transport, "TLS context creation failed: " + sslError());
    _ssl = SSL_new(ctx);
    if (!_ssl)
        throw Error(Error::Kind::Transport, "TLS session creation failed: " + sslError());
    SSL_set_verify(_ssl, _settings.verifyPeer ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);
    // Server name indication and host name check
    SSL_set_tlsext_host_name(_ssl, _hostname.c_str());
    if (_settings.verifyPeer && SSL_set1_host(_ssl, _hostname.c_str()) != 1)
        throw Error(Error::Kind::Transport, "TLS host verification setup failed: " + sslError());
    SSL_set_fd(_ssl, _fd);
    if (SSL_connect(_ssl) != 1)
        throw Error(Error::Kind::Transport, "TLS handshake with " + _hostname + " failed: " + sslError());
}
//---------------------------------------------------------------------------
void HttpConnection::send(span<const uint8_t> header, span<const uint8_t> body)
// Send the request
{
    auto sendAll = [this](span<const uint8_t> data) {
        uint64_t written = 0;
        while (written < data.size()) {
            auto remaining = data.size() - written;
            int64_t result;
            if (_ssl) {
                result = SSL_write(_ssl, data.data() + written, static_cast<int>(min<uint64_t>(remaining, 1u << 30)));
            } else {
                result = ::send(_fd, data.data() + written, remaining, MSG_NOSIGNAL);
                if (result < 0 && errno == EINTR)
                    continue;
            }
            if (result <= 0)
                throw Error(Error::Kind::Transport, "Send to " + _hostname + " failed" + (_ssl ? ": " + sslError() : ": " + string(strerror(errno))));
            written += static_cast<uint64_t>(result);
        }
    };
    sendAll(header);
    if (!body.empty())
        sendAll(body);
}
//---------------------------------------------------------------------------
int64_t HttpConnection::recvRaw(uint8_t* data, uint64_t length)
// Receive from the socket
{
    length = min(length, _settings.chunkSize);
    if (_ssl) {
        auto result = SSL_read(_ssl, data, static_cast<int>(length));
        if (result > 0)
            return result;
        return SSL_get_error(_ssl, result) == SSL_ERROR_ZERO_RETURN ? 0 : -1;
    }
    while (true) {
        auto result = ::recv(_fd, data, length, 0);
        if (result < 0 && errno == EINTR)
            continue;
        return result;
    }
}
//---------------------------------------------------------------------------
bool HttpConnection::fill()
// Receive into the buffer
{
    auto offset = _buffer.size();
    _buffer.resize(offset + _settings.chunkSize);
    auto result = recvRaw(_buffer.data() + offset, _settings.chunkSize);
    _buffer.resize(offset + static_cast<uint64_t>(max<int64_t>(result, 0)));
    if (result < 0)
        throw Error(Error::Kind::IncompleteRead, "Receive from " + _hostname + " failed: " + string(strerror(errno)));
    return result > 0;
}
//---------------------------------------------------------------------------
const HttpResponse& HttpConnection::receiveHeader(bool headRequest)
// Receive the header
{
    _buffer.clear();
    optional<uint32_t> headerLength;
    while (!(headerLength = HttpHelper::findHeaderEnd(utils::asString(_buffer.span())))) {
        if (_buffer.size() > maxHeaderSize)
            throw Error(Error::Kind::Protocol, "Response header from " + _hostname + " exceeds the maximum size");
        bool open;
        try {
            open = fill();
        } catch (const Error& error) {
            throw Error(Error::Kind::Transport, error.what(), current_exception());
        }
        if (!open)
            throw Error(Error::Kind::Transport, "Connection closed by " + _hostname + " before the response header");
    }

    _info = HttpHelper::detect(utils::asString(_buffer.span()), headRequest);
    _buffer.erasePrefix(*headerLength);
    _received = 0;
    _chunkPending = false;
    _remaining = _info.encoding == HttpHelper::Encoding::ContentLength ? *_info.length : 0;
    _bodyDone = _info.encoding == HttpHelper::Encoding::Empty || (_info.encoding == HttpHelper::Encoding::ContentLength && !_remaining);
    return _info.response;
}
//---------------------------------------------------------------------------
int64_t HttpConnection::readRaw(uint8_t* data, uint64_t length)
// Read buffered bytes first
{
    if (!_buffer.empty()) {
        auto count = min(length, _buffer.size());
        memcpy(data, _buffer.cdata(), count);
        _buffer.erasePrefix(count);
        return static_cast<int64_t>(count);
    }
    return recvRaw(data, length);
}
//---------------------------------------------------------------------------
void HttpConnection::incomplete(const string& reason) const
// Raise an incomplete read
{
    throw Error(Error::Kind::IncompleteRead, "Incomplete read from " + _hostname + " after " + to_string(_received) + " bytes: " + reason);
}
//---------------------------------------------------------------------------
bool HttpConnection::nextChunk()
// Read the next chunk header
{
    // Terminator of the previous chunk
    if (_chunkPending) {
        while (_buffer.size() < 2)
            if (!fill())
                incomplete("connection closed in chunk terminator");
        if (utils::asString(_buffer.span()).substr(0, 2) != "\r\n")
            throw Error(Error::Kind::Protocol, "Invalid chunk terminator from " + _hostname);
        _buffer.erasePrefix(2);
        _chunkPending = false;
    }

    optional<pair<uint64_t, uint32_t>> chunk;
    while (!(chunk = HttpHelper::parseChunkHeader(utils::asString(_buffer.span()))))
        if (!fill())
            incomplete("connection closed in chunk header");
    _buffer.erasePrefix(chunk->second);

    if (chunk->first == 0) {
        // Skip trailers up to the final empty line
        while (true) {
            auto view = utils::asString(_buffer.span());
            auto end = view.find("\r\n");
            if (end == string_view::npos) {
                if (!fill())
                    return false;
                continue;
            }
            _buffer.erasePrefix(end + 2);
            if (end == 0)
                return false;
        }
    }
    _remaining = chunk->first;
    return true;
}
//---------------------------------------------------------------------------
uint64_t HttpConnection::readBody(uint8_t* data, uint64_t length)
// Read body bytes
{
    if (_bodyDone || !length)
        return 0;

    int64_t result = 0;
    try {
        switch (_info.encoding) {
            case HttpHelper::Encoding::ContentLength: {
                result = readRaw(data, min(length, _remaining));
                if (result <= 0)
                    incomplete("expected " + to_string(*_info.length) + " bytes");
                _remaining -= static_cast<uint64_t>(result);
                _bodyDone = !_remaining;
                break;
            }
            case HttpHelper::Encoding::ChunkedEncoding: {
                if (!_remaining && !nextChunk()) {
                    _bodyDone = true;
                    return 0;
                }
                result = readRaw(data, min(length, _remaining));
                if (result <= 0)
                    incomplete("connection closed in chunk");
                _remaining -= static_cast<uint64_t>(result);
                _chunkPending = !_remaining;
                break;
            }
            case HttpHelper::Encoding::UntilClose: {
                result = readRaw(data, length);
                if (result < 0)
                    incomplete(strerror(errno));
                _bodyDone = !result;
                break;
            }
            default:
                _bodyDone = true;
                return 0;
        }
    } catch (const Error& /*error*/) {
        _bodyDone = true;
        throw;
    }
    _received += static_cast<uint64_t>(result);
    return static_cast<uint64_t>(result);
}
//---------------------------------------------------------------------------
string HttpConnection::readAll()
// Read the remaining body
{
    string result;
    if (_info.length)
        result.reserve(*_info.length);
    auto buffer = make_unique<uint8_t[]>(_settings.chunkSize);
    while (auto count = readBody(buffer.get(), _settings.chunkSize))
        result.append(reinterpret_cast<const char*>(buffer.get()), count);
    return result;
}
//---------------------------------------------------------------------------
} // namespace blobstream::network
