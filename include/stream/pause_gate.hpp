#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
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
/// Suspends the reading thread while paused; resume wakes it up
class PauseGate {
    private:
    /// The mutex guarding the transitions
    std::mutex _mutex;
    /// The resume signal
    std::condition_variable _resumed;
    /// The paused flag
    std::atomic<bool> _paused;

    public:
    /// The constructor
    PauseGate() : _paused(false) {}

    /// Pause
    void pause() {
        std::unique_lock lock(_mutex);
        _paused.store(true, std::memory_order_release);
    }
    /// Resume and wake up waiting readers
    void resume() {
        {
            std::unique_lock lock(_mutex);
            _paused.store(false, std::memory_order_release);
        }
        _resumed.notify_all();
    }
    /// Is paused
    [[nodiscard]] bool paused() const {
        return _paused.load(std::memory_order_acquire);
    }
    /// Block while paused; returns true if the caller had to wait
    bool wait() {
        if (!paused())
            return false;
        std::unique_lock lock(_mutex);
        // The mutex is released while sleeping, so resume can flip the flag
        _resumed.wait(lock, [this] { return !_paused.load(std::memory_order_acquire); });
        return true;
    }
};
//---------------------------------------------------------------------------
} // namespace uploadstream::stream
