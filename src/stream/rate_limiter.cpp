#include "stream/rate_limiter.hpp"
#include <cmath>
#include <stdexcept>
#include <thread>
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
RateLimiter::RateLimiter(double maxSpeed) : _maxSpeed(0), _windowStart(), _bytesInWindow(0)
// The constructor
{
    setMaxSpeed(maxSpeed);
}
//---------------------------------------------------------------------------
void RateLimiter::setMaxSpeed(double maxSpeed)
// Sets the ceiling
{
    if (!isfinite(maxSpeed) || maxSpeed < 0)
        throw runtime_error("Invalid max speed!");
    _maxSpeed.store(maxSpeed, memory_order_relaxed);
}
//---------------------------------------------------------------------------
chrono::nanoseconds RateLimiter::account(uint64_t bytes, clock::time_point now)
// Accounts bytes and computes the wait
{
    auto elapsed = chrono::duration_cast<chrono::nanoseconds>(now - _windowStart);
    if (elapsed >= window) {
        _bytesInWindow = 0;
        _windowStart = now;
        elapsed = chrono::nanoseconds::zero();
    }
    _bytesInWindow += bytes;

    auto speed = maxSpeed();
    if (speed <= 0)
        return chrono::nanoseconds::zero();

    // Time needed to release all bytes of the window at the ceiling
    auto target = chrono::nanoseconds(llround(static_cast<double>(_bytesInWindow) * 1e9 / speed));
    auto wait = target - elapsed;
    return wait > chrono::nanoseconds::zero() ? wait : chrono::nanoseconds::zero();
}
//---------------------------------------------------------------------------
void RateLimiter::throttle(uint64_t bytes)
// Accounts bytes and sleeps
{
    auto wait = account(bytes, clock::now());
    if (wait > chrono::nanoseconds::zero())
        this_thread::sleep_for(wait);
}
//---------------------------------------------------------------------------
void RateLimiter::reset()
// Drops the window state
{
    _windowStart = clock::time_point();
    _bytesInWindow = 0;
}
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
