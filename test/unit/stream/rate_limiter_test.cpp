#include "stream/pause_gate.hpp"
#include "stream/rate_limiter.hpp"
#include <catch2/catch.hpp>
#include <atomic>
#include <chrono>
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
namespace uploadstream::stream::test {
//---------------------------------------------------------------------------
using namespace std;
using namespace std::chrono_literals;
//---------------------------------------------------------------------------
TEST_CASE("rate_limiter") {
    RateLimiter limiter(1000);
    REQUIRE(limiter.limited());
    auto start = RateLimiter::clock::now();

    // 100 bytes at 1000 B/s need 100 ms
    REQUIRE(limiter.account(100, start) == 100ms);
    // 200 bytes need 200 ms, 100 ms of them already passed
    REQUIRE(limiter.account(100, start + 100ms) == 100ms);
    // 1000 bytes fill the whole window
    REQUIRE(limiter.account(800, start + 200ms) == 800ms);
    REQUIRE(limiter.bytesInWindow() == 1000);
    // A new window starts once a second passed
    REQUIRE(limiter.account(100, start + 1000ms) == 100ms);
    REQUIRE(limiter.bytesInWindow() == 100);
    // Slow producers never wait
    REQUIRE(limiter.account(100, start + 1900ms) == 0ms);

    limiter.reset();
    REQUIRE(limiter.bytesInWindow() == 0);
    REQUIRE(limiter.account(500, start + 1950ms) == 500ms);
}
//---------------------------------------------------------------------------
TEST_CASE("rate_limiter_burst") {
    RateLimiter limiter(1000);
    auto start = RateLimiter::clock::now();
    // A single chunk larger than the window budget waits for all of it
    REQUIRE(limiter.account(3000, start) == 3000ms);
    REQUIRE(limiter.account(100, start + 3000ms) == 100ms);
}
//---------------------------------------------------------------------------
TEST_CASE("rate_limiter_unlimited") {
    RateLimiter limiter;
    REQUIRE(!limiter.limited());
    auto start = RateLimiter::clock::now();
    REQUIRE(limiter.account(1000000, start) == 0ms);

    limiter.setMaxSpeed(500);
    REQUIRE(limiter.maxSpeed() == 500);
    REQUIRE(limiter.account(500, start + 1500ms) == 1000ms);

    limiter.setMaxSpeed(0);
    REQUIRE(limiter.account(500, start + 1600ms) == 0ms);

    REQUIRE_THROWS_AS(limiter.setMaxSpeed(-1), runtime_error);
    REQUIRE_THROWS_AS(RateLimiter(-5), runtime_error);
}
//---------------------------------------------------------------------------
TEST_CASE("pause_gate") {
    PauseGate gate;
    REQUIRE(!gate.paused());
    REQUIRE(!gate.wait());

    gate.pause();
    REQUIRE(gate.paused());

    atomic<bool> passed = false;
    atomic<bool> waited = false;
    thread waiter([&] {
        waited = gate.wait();
        passed = true;
    });
    this_thread::sleep_for(100ms);
    REQUIRE(!passed.load());

    gate.resume();
    waiter.join();
    REQUIRE(passed.load());
    REQUIRE(waited.load());
    REQUIRE(!gate.paused());
}
//---------------------------------------------------------------------------
} // namespace uploadstream::stream::test
