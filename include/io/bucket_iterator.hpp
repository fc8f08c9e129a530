#pragma once
#include "cloud/store.hpp"
#include "utils/blocking_queue.hpp"
#include "utils/error.hpp"
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
//---------------------------------------------------------------------------
// BlobStream - Streaming I/O for Cloud Object Storage
// The BlobStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace blobstream::io {
//---------------------------------------------------------------------------
/// The options of a bucket iteration
struct IterOptions {
    /// The default number of download threads
    static constexpr unsigned defaultWorkers = 16;
    /// The default number of extra attempts per key
    static constexpr unsigned defaultRetries = 3;
    /// The default capacity of the key and result queues
    static constexpr uint64_t defaultQueueDepth = 64;

    /// Only list keys below the prefix
    std::string prefix;
    /// Filter the keys, empty accepts all
    std::function<bool(const std::string&)> acceptKey;
    /// Stop after this many results
    std::optional<uint64_t> keyLimit;
    /// The number of download threads
    unsigned workers = defaultWorkers;
    /// The number of extra attempts per key
    unsigned retries = defaultRetries;
    /// The capacity of the key and result queues
    uint64_t queueDepth = defaultQueueDepth;
    /// The error kinds that are retried per key
    std::vector<Error::Kind> retryable = {Error::Kind::Client, Error::Kind::Transport};
};
//---------------------------------------------------------------------------
/// Lists a bucket and downloads the objects in parallel
/// A single pass, lazy sequence of (key, content) pairs in completion order
class BucketIterator {
    public:
    /// A (key, content) pair
    using value_type = std::pair<std::string, std::string>;

    private:
    /// A downloaded object or the failure of the pipeline
    struct Result {
        /// The key
        std::string key;
        /// The content
        std::string content;
        /// The failure
        std::exception_ptr error;
    };

    /// The store
    std::shared_ptr<cloud::Store> _store;
    /// The bucket
    std::string _bucket;
    /// The options
    IterOptions _options;
    /// The listed keys
    utils::BlockingQueue<std::string> _keys;
    /// The downloaded objects
    utils::BlockingQueue<Result> _results;
    /// The listing thread
    std::thread _lister;
    /// The download threads
    std::vector<std::thread> _workers;
    /// The number of running download threads
    std::atomic<unsigned> _running;
    /// The pipeline was started
    bool _started;
    /// The sequence ended
    bool _done;
    /// The number of yielded results
    uint64_t _yielded;
    /// The number of yielded bytes
    uint64_t _totalSize;

    /// Start the threads
    void start();
    /// Stop the threads and discard pending results
    void shutdown();
    /// The listing loop
    void list();
    /// The download loop
    void work();
    /// Download one key with retries
    [[nodiscard]] std::string download(const std::string& key);

    public:
    /// The constructor, does not touch the store before the first next()
    BucketIterator(std::shared_ptr<cloud::Store> store, std::string bucket, IterOptions options = IterOptions());
    /// The destructor, tears the pipeline down
    ~BucketIterator();

    BucketIterator(const BucketIterator&) = delete;
    BucketIterator& operator=(const BucketIterator&) = delete;

    /// The next result, nullopt at the end
    [[nodiscard]] std::optional<value_type> next();
    /// The number of yielded results
    [[nodiscard]] uint64_t yielded() const { return _yielded; }

    /// An input iterator over the results
    class iterator {
        public:
        using iterator_category = std::input_iterator_tag;
        using value_type = BucketIterator::value_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        private:
        /// The sequence, nullptr at the end
        BucketIterator* _source;
        /// The current result
        std::optional<value_type> _current;

        public:

        /// The end iterator
        iterator() : _source(nullptr), _current() {}
        /// The begin iterator, fetches the first result
        explicit iterator(BucketIterator* source) : _source(source), _current(source->next()) {
            if (!_current)
                _source = nullptr;
        }

        /// Access the result
        reference operator*() const { return *_current; }
        /// Access the result
        pointer operator->() const { return &*_current; }
        /// Advance
        iterator& operator++() {
            _current = _source->next();
            if (!_current)
                _source = nullptr;
            return *this;
        }
        /// Advance
        void operator++(int) { ++*this; }
        /// Compare, only the end is meaningful
        bool operator==(const iterator& other) const { return _source == other._source; }
    };

    /// Begin the iteration
    [[nodiscard]] iterator begin() { return iterator(this); }
    /// The end
    [[nodiscard]] iterator end() { return iterator(); }
};
//---------------------------------------------------------------------------
/// Iterate over the objects of a bucket
[[nodiscard]] BucketIterator iterBucket(std::shared_ptr<cloud::Store> store, const std::string& bucket, IterOptions options = IterOptions());
//---------------------------------------------------------------------------
} // namespace blobstream::io
