#pragma once
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream {
//---------------------------------------------------------------------------
/// The error raised by all blobstream components
/// The kind tells the caller what went wrong, the cause keeps the original failure for introspection
class Error : public std::runtime_error {
    public:
    /// The error kinds
    enum class Kind : uint8_t {
        /// Bad argument or mode combination, unreachable destination
        Configuration,
        /// Endpoint unreachable or connection failure, usually transient
        Transport,
        /// Terminal I/O failure, e.g., exhausted retries
        IOFailure,
        /// The requested byte range starts beyond the object
        RangeNotSatisfiable,
        /// Malformed response metadata
        Protocol,
        /// The connection was dropped in the middle of a body
        IncompleteRead,
        /// The store rejected the request (missing key, forbidden, throttled, ...)
        Client,
        /// The store refused a well-formed request, e.g., an empty multipart completion
        StoreRejection,
        /// The operation is not supported
        Unsupported
    };

    private:
    /// The kind
    Kind _kind;
    /// The original failure
    std::exception_ptr _cause;

    public:
    /// The constructor
    Error(Kind kind, const std::string& message, std::exception_ptr cause = nullptr) : std::runtime_error(message), _kind(kind), _cause(std::move(cause)) {}

    /// Get the kind
    [[nodiscard]] Kind kind() const noexcept { return _kind; }
    /// Check the kind
    [[nodiscard]] bool is(Kind kind) const noexcept { return _kind == kind; }
    /// Get the cause
    [[nodiscard]] std::exception_ptr cause() const noexcept { return _cause; }
    /// Get the kind of the cause, if the cause is an error
    [[nodiscard]] std::optional<Kind> causeKind() const;

    /// Get a copy of the cause if it is of type E
    template <typename E>
    [[nodiscard]] std::optional<E> causeAs() const {
        if (!_cause)
            return std::nullopt;
        try {
            std::rethrow_exception(_cause);
        } catch (const E& cause) {
            return cause;
        } catch (const std::exception& /*other*/) {
            return std::nullopt;
        }
    }

    /// Get the name of the kind
    [[nodiscard]] static constexpr std::string_view kindName(Kind kind) noexcept {
        switch (kind) {
            case Kind::Configuration: return "Configuration";
            case Kind::Transport: return "Transport";
            case Kind::IOFailure: return "IOFailure";
            case Kind::RangeNotSatisfiable: return "RangeNotSatisfiable";
            case Kind::Protocol: return "Protocol";
            case Kind::IncompleteRead: return "IncompleteRead";
            case Kind::Client: return "Client";
            case Kind::StoreRejection: return "StoreRejection";
            case Kind::Unsupported: return "Unsupported";
            default: return "Unknown";
        }
    }
};
//---------------------------------------------------------------------------
} // namespace blobstream
