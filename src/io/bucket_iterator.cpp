#include "io/bucket_iterator.hpp"
#include "utils/log.hpp"
#include <algorithm>
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
using namespace std;
//---------------------------------------------------------------------------
BucketIterator::BucketIterator(shared_ptr<cloud::Store> store, string bucket, IterOptions options)
    : _store(move(store)), _bucket(move(bucket)), _options(move(options)), _keys(_options.queueDepth), _results(_options.queueDepth), _lister(), _workers(), _running(0), _started(false), _done(false), _yielded(0), _totalSize(0)
// The constructor
{
    if (!_store)
        throw Error(Error::Kind::Configuration, "BucketIterator requires a store");
    if (!_options.workers)
        _options.workers = 1;
}
//---------------------------------------------------------------------------
BucketIterator::~BucketIterator()
// The destructor
{
    shutdown();
}
//---------------------------------------------------------------------------
void BucketIterator::start()
// Start the lister and the workers
{
    _started = true;
    _running = _options.workers;
    _lister = thread([this] { list(); });
    _workers.reserve(_options.workers);
    for (auto i = 0u; i < _options.workers; i++)
        _workers.emplace_back([this] { work(); });
}
//---------------------------------------------------------------------------
void BucketIterator::shutdown()
// Stop all threads, pending results are discarded
{
    if (_done)
        return;
    _done = true;
    _keys.cancel();
    _results.cancel();
    if (_lister.joinable())
        _lister.join();
    for (auto& worker : _workers)
        worker.join();
    _workers.clear();
    if (_started)
        utils::logger().info("processed {} keys, total size {}", _yielded, _totalSize);
}
//---------------------------------------------------------------------------
void BucketIterator::list()
// List the keys page by page
{
    try {
        optional<string> token;
        do {
            auto page = _store->listObjects(_bucket, _options.prefix, token);
            for (auto& key : page.keys) {
                if (_options.acceptKey && !_options.acceptKey(key))
                    continue;
                if (!_keys.push(key))
                    return;
            }
            token = move(page.nextToken);
        } while (token);
    } catch (const exception& e) {
        utils::logger().error("listing bucket {} failed: {}", _bucket, e.what());
        _results.push({{}, {}, current_exception()});
        _keys.cancel();
        return;
    }
    _keys.close();
}
//---------------------------------------------------------------------------
string BucketIterator::download(const string& key)
// Download one key, fails on the last attempt
{
    cloud::ObjectHandle handle{_bucket, key, nullopt};
    for (auto attempt = 0u;; attempt++) {
        try {
            auto result = _store->getObject(handle, nullopt);
            return result.body->readAll();
        } catch (const Error& error) {
            auto retryable = find(_options.retryable.begin(), _options.retryable.end(), error.kind()) != _options.retryable.end();
            if (!retryable || attempt >= _options.retries)
                throw;
            utils::logger().warn("download of {} failed ({}), attempt {} of {}", key, error.what(), attempt + 1, _options.retries + 1);
        }
    }
}
//---------------------------------------------------------------------------
void BucketIterator::work()
// Download keys until the key queue is drained
{
    while (auto key = _keys.pop()) {
        try {
            auto content = download(*key);
            if (!_results.push({move(*key), move(content), nullptr}))
                break;
        } catch (const exception& e) {
            utils::logger().error("download of {} failed: {}", *key, e.what());
            _results.push({move(*key), {}, current_exception()});
            _keys.cancel();
            break;
        }
    }
    if (--_running == 0)
        _results.close();
}
//---------------------------------------------------------------------------
optional<BucketIterator::value_type> BucketIterator::next()
// The next result
{
    if (_done)
        return nullopt;
    if (_options.keyLimit && *_options.keyLimit == 0) {
        shutdown();
        return nullopt;
    }
    if (!_started)
        start();

    auto result = _results.pop();
    if (!result) {
        shutdown();
        return nullopt;
    }
    if (result->error) {
        shutdown();
        rethrow_exception(result->error);
    }

    utils::logger().debug("yielding key #{}: {}, size {} (total {:.1f}MB)", _yielded, result->key, result->content.size(), static_cast<double>(_totalSize) / (1024.0 * 1024.0));
    _yielded++;
    _totalSize += result->content.size();
    value_type value{move(result->key), move(result->content)};
    if (_options.keyLimit && _yielded >= *_options.keyLimit)
        shutdown();
    return value;
}
//---------------------------------------------------------------------------
BucketIterator iterBucket(shared_ptr<cloud::Store> store, const string& bucket, IterOptions options)
// Iterate over a bucket
{
    return BucketIterator(move(store), bucket, move(options));
}
//---------------------------------------------------------------------------
} // namespace blobstream::io
