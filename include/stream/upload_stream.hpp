#pragma once
#include "stream/config.hpp"
#include "stream/pause_gate.hpp"
#include "stream/rate_limiter.hpp"
#include "stream/source.hpp"
#include "utils/digest.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
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
/// The pull-based body of an upload.
/// The transport repeatedly calls read and forwards the produced chunks; a
/// return value of 0 always means that nothing more will be produced.
///
/// A single thread reads. Any other thread may pause, resume, cancel, change
/// the speed and observe the counters while a read is in flight. Cancellation
/// never interrupts a read that is already waiting on the pause gate or the
/// rate limiter; the read after it returns 0.
class UploadStream {
    public:
    /// Receives the size of every produced chunk, called on the reading thread
    using ProgressCallback = std::function<void(uint64_t)>;
    /// Polled before every read, true stops the upload
    using CancelCallback = std::function<bool()>;

    private:
    /// The source
    Source _source;
    /// The config
    Config _config;
    /// The progress callback
    ProgressCallback _onProgress;
    /// The cancel predicate
    CancelCallback _shouldCancel;
    /// The next unread buffer position
    uint64_t _offset;
    /// The produced bytes
    std::atomic<uint64_t> _uploaded;
    /// The cancel latch
    std::atomic<bool> _cancelled;
    /// The retire latch
    std::atomic<bool> _retired;
    /// The pause gate
    PauseGate _pauseGate;
    /// The rate limiter
    RateLimiter _rateLimiter;
    /// The payload digest
    utils::Digest _digest;

    public:
    /// The constructor
    explicit UploadStream(Source source, const Config& config = Config(), ProgressCallback onProgress = nullptr, CancelCallback shouldCancel = nullptr);
    /// The constructor with default config
    UploadStream(Source source, ProgressCallback onProgress, CancelCallback shouldCancel = nullptr) : UploadStream(std::move(source), Config(), std::move(onProgress), std::move(shouldCancel)) {}

    /// Produce the next chunk of at most chunkSize bytes into data, returns the written bytes
    uint64_t read(uint8_t* data, uint64_t capacity);
    /// Produce the next chunk into the span
    uint64_t read(std::span<uint8_t> data) { return read(data.data(), data.size()); }
    /// The stream is read-only, written data is dropped
    void write(std::span<const uint8_t> /*data*/) {}

    /// Stop the upload and close a streaming source
    void cancel();
    /// Suspend reading
    void pause() { _pauseGate.pause(); }
    /// Continue reading
    void resume() { _pauseGate.resume(); }
    /// Rewind to the first byte, counters and digest restart
    void reset();
    /// Reset the counters and disable all further reads
    void retire();
    /// Change the bandwidth ceiling in bytes/s, 0 is unlimited
    void setMaxSpeed(double maxSpeed) { _rateLimiter.setMaxSpeed(maxSpeed); }

    /// The produced bytes since construction or the last reset
    [[nodiscard]] uint64_t uploaded() const { return _uploaded.load(std::memory_order_acquire); }
    /// Is cancelled
    [[nodiscard]] bool cancelled() const { return _cancelled.load(std::memory_order_acquire); }
    /// Is paused
    [[nodiscard]] bool paused() const { return _pauseGate.paused(); }
    /// Is retired
    [[nodiscard]] bool retired() const { return _retired.load(std::memory_order_acquire); }
    /// The chunk size
    [[nodiscard]] uint64_t chunkSize() const { return _config.chunkSize; }
    /// The bandwidth ceiling
    [[nodiscard]] double maxSpeed() const { return _rateLimiter.maxSpeed(); }
    /// The total body length if known, e.g. for a Content-Length header
    [[nodiscard]] std::optional<uint64_t> contentLength() const { return _source.size(); }
    /// The source kind
    [[nodiscard]] Source::Kind sourceKind() const { return _source.kind(); }
    /// The raw payload digest of the produced bytes, empty without digest
    [[nodiscard]] std::string digest() const { return _digest.finish(); }

    private:
    /// Read from the classified source
    uint64_t readSource(uint8_t* data, uint64_t length);
    /// Reset offset, counters, window and digest
    void rewindState();
};
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
