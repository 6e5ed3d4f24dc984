/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "observer/latest_block.hpp"

#include <thread>

#include <gtest/gtest.h>

using attestor::observer::LatestBlock;
using namespace std::chrono_literals;

TEST(LatestBlockTest, KeepsMaximum) {
  LatestBlock latest;
  EXPECT_EQ(latest.get(), std::nullopt);
  EXPECT_TRUE(latest.update(10));
  EXPECT_FALSE(latest.update(10));
  EXPECT_FALSE(latest.update(7));
  EXPECT_EQ(latest.get(), 10);
  EXPECT_TRUE(latest.update(11));
  EXPECT_EQ(latest.get(), 11);
}

TEST(LatestBlockTest, WaitTimesOut) {
  LatestBlock latest;
  latest.update(3);
  // consume the wakeup of the first update
  EXPECT_EQ(latest.wait(0ms), 3);

  auto begin = std::chrono::steady_clock::now();
  EXPECT_EQ(latest.wait(20ms), 3);
  EXPECT_GE(std::chrono::steady_clock::now() - begin, 20ms);
}

/**
 * @given a reader waiting on the slot
 * @when another thread publishes a new block
 * @then the reader returns with that block before the timeout
 */
TEST(LatestBlockTest, UpdateWakesReader) {
  LatestBlock latest;
  std::thread writer{[&] {
    std::this_thread::sleep_for(10ms);
    latest.update(42);
  }};
  auto begin = std::chrono::steady_clock::now();
  auto seen = latest.wait(10s);
  writer.join();
  EXPECT_EQ(seen, 42);
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
}

TEST(LatestBlockTest, WakeUpReleasesReader) {
  LatestBlock latest;
  std::thread waker{[&] {
    std::this_thread::sleep_for(10ms);
    latest.wakeUp();
  }};
  auto begin = std::chrono::steady_clock::now();
  EXPECT_EQ(latest.wait(10s), std::nullopt);
  waker.join();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
}
