#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
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
/// Bounds the average throughput with a rolling one second accounting window.
/// Each window starts with the first chunk after the previous window elapsed;
/// bytes of a finished window are not carried over.
class RateLimiter {
    public:
    /// The clock
    using clock = std::chrono::steady_clock;
    /// The accounting window
    static constexpr std::chrono::nanoseconds window = std::chrono::seconds(1);

    private:
    /// The ceiling in bytes/s, 0 is unlimited
    std::atomic<double> _maxSpeed;
    /// The start of the current window
    clock::time_point _windowStart;
    /// The bytes accounted in the current window
    uint64_t _bytesInWindow;

    public:
    /// The constructor
    explicit RateLimiter(double maxSpeed = 0);

    /// Set the ceiling, may be called from any thread
    void setMaxSpeed(double maxSpeed);
    /// Get the ceiling
    [[nodiscard]] double maxSpeed() const { return _maxSpeed.load(std::memory_order_relaxed); }
    /// Is a ceiling set
    [[nodiscard]] bool limited() const { return maxSpeed() > 0; }

    /// Account bytes produced at now; returns how long to wait before releasing them
    [[nodiscard]] std::chrono::nanoseconds account(uint64_t bytes, clock::time_point now);
    /// Account bytes and sleep the calling thread until the ceiling allows them
    void throttle(uint64_t bytes);
    /// Drop the window state
    void reset();

    /// The bytes accounted in the current window
    [[nodiscard]] constexpr uint64_t bytesInWindow() const { return _bytesInWindow; }
};
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
