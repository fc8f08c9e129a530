#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::utils {
//---------------------------------------------------------------------------
/// A bounded multi-producer multi-consumer queue
/// Producers block while the queue is full, consumers block while it is empty
template <typename T>
class BlockingQueue {
    /// The mutex
    std::mutex _mutex;
    /// Signaled when an element was pushed or the queue closed
    std::condition_variable _notEmpty;
    /// Signaled when an element was popped or the queue closed
    std::condition_variable _notFull;
    /// The elements
    std::deque<T> _elements;
    /// The capacity
    uint64_t _capacity;
    /// Closed for producers
    bool _closed;

    public:
    /// The constructor
    explicit BlockingQueue(uint64_t capacity) : _capacity(capacity ? capacity : 1), _closed(false) {}

    /// Push an element, blocks while full, returns false if the queue was closed
    bool push(T element) {
        std::unique_lock lock(_mutex);
        _notFull.wait(lock, [this] { return _closed || _elements.size() < _capacity; });
        if (_closed)
            return false;
        _elements.push_back(std::move(element));
        lock.unlock();
        _notEmpty.notify_one();
        return true;
    }

    /// Pop an element, blocks while empty, returns nullopt once closed and drained
    std::optional<T> pop() {
        std::unique_lock lock(_mutex);
        _notEmpty.wait(lock, [this] { return _closed || !_elements.empty(); });
        if (_elements.empty())
            return std::nullopt;
        auto element = std::move(_elements.front());
        _elements.pop_front();
        lock.unlock();
        _notFull.notify_one();
        return element;
    }

    /// Close the queue, remaining elements can still be popped
    void close() {
        {
            std::lock_guard lock(_mutex);
            _closed = true;
        }
        _notEmpty.notify_all();
        _notFull.notify_all();
    }

    /// Close the queue and drop the remaining elements
    void cancel() {
        {
            std::lock_guard lock(_mutex);
            _closed = true;
            _elements.clear();
        }
        _notEmpty.notify_all();
        _notFull.notify_all();
    }

    /// Is the queue closed
    [[nodiscard]] bool closed() {
        std::lock_guard lock(_mutex);
        return _closed;
    }

    /// The number of queued elements
    [[nodiscard]] uint64_t size() {
        std::lock_guard lock(_mutex);
        return _elements.size();
    }
};
//---------------------------------------------------------------------------
} // namespace blobstream::utils
