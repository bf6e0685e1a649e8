#include "stream/upload_stream.hpp"
#include <algorithm>
#include <stdexcept>
//---------------------------------------------------------------------------
// UploadStream - Throttled Chunked Upload Source Library
// UploadStream Authors, 2024
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace uploadstream::stream {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
UploadStream::UploadStream(Source source, const Config& config, ProgressCallback onProgress, CancelCallback shouldCancel)
    : _source(move(source)), _config(config), _onProgress(move(onProgress)), _shouldCancel(move(shouldCancel)), _offset(0), _uploaded(0), _cancelled(false), _retired(false), _pauseGate(), _rateLimiter(), _digest(config.digest)
// The constructor
{
    _config.validate();
    _rateLimiter.setMaxSpeed(_config.maxSpeed);
}
//---------------------------------------------------------------------------
uint64_t UploadStream::read(uint8_t* data, uint64_t capacity)
// Produces the next chunk
{
    if (_retired.load(memory_order_acquire) || _cancelled.load(memory_order_acquire))
        return 0;
    if (!capacity)
        throw runtime_error("Empty read buffer!");

    // The predicate does not latch, it is asked again on the next read
    if (_shouldCancel && _shouldCancel())
        return 0;

    _pauseGate.wait();
    if (_cancelled.load(memory_order_acquire))
        return 0;

    auto length = readSource(data, min(_config.chunkSize, capacity));
    if (!length)
        return 0;

    _uploaded.fetch_add(length, memory_order_acq_rel);
    _digest.update(data, length);
    if (_onProgress)
        _onProgress(length);
    _rateLimiter.throttle(length);
    return length;
}
//---------------------------------------------------------------------------
uint64_t UploadStream::readSource(uint8_t* data, uint64_t length)
// Reads from the classified source
{
    switch (_source.kind()) {
        case Source::Kind::Empty:
            return 0;
        case Source::Kind::Stream:
            // Any 0 of the handle is the final end of the stream
            return _source.handle()->read(data, length);
        case Source::Kind::Buffer: {
            auto count = _source.buffer()->copy(_offset, data, length);
            _offset += count;
            return count;
        }
    }
    return 0;
}
//---------------------------------------------------------------------------
void UploadStream::cancel()
// Latches the cancellation and closes a streaming source
{
    auto expected = false;
    if (!_cancelled.compare_exchange_strong(expected, true, memory_order_acq_rel))
        return;
    if (auto handle = _source.handle())
        handle->close();
}
//---------------------------------------------------------------------------
void UploadStream::reset()
// Rewinds to the first byte
{
    if (auto handle = _source.handle(); handle && !handle->closed()) {
        if (!handle->rewind())
            throw runtime_error("Stream source cannot be rewound!");
    }
    rewindState();
}
//---------------------------------------------------------------------------
void UploadStream::retire()
// Resets and disables all further reads
{
    rewindState();
    _retired.store(true, memory_order_release);
}
//---------------------------------------------------------------------------
void UploadStream::rewindState()
// Resets offset, counters, window and digest
{
    _offset = 0;
    _uploaded.store(0, memory_order_release);
    _rateLimiter.reset();
    _digest.reset();
}
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
