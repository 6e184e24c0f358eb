#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "rpc/endpoint_pool.hpp"
#include "rpc/rate_limiter.hpp"

using namespace std::chrono;

TEST(rate_limiter, window_caps_requests_per_second) {
  RateLimiter limiter(3, milliseconds(0));
  CancelSignal cancel;

  std::vector<steady_clock::time_point> at;
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(limiter.acquire(cancel));
    at.push_back(steady_clock::now());
    EXPECT_LE(limiter.window_count(), 3u);
  }
  // 第 4 个请求必须等第 1 个滑出窗口, 第 5 个等第 2 个
  EXPECT_GE(duration_cast<milliseconds>(at[3] - at[0]).count(), 995);
  EXPECT_GE(duration_cast<milliseconds>(at[4] - at[1]).count(), 995);
}

TEST(rate_limiter, minimum_spacing_between_requests) {
  RateLimiter limiter(100, milliseconds(40));
  CancelSignal cancel;

  auto start = steady_clock::now();
  for (int i = 0; i < 3; ++i)
    ASSERT_TRUE(limiter.acquire(cancel));
  EXPECT_GE(duration_cast<milliseconds>(steady_clock::now() - start).count(), 79);
}

TEST(rate_limiter, cancel_interrupts_wait) {
  RateLimiter limiter(1, milliseconds(0));
  CancelSignal cancel;
  ASSERT_TRUE(limiter.acquire(cancel));

  std::thread canceller([&cancel] {
    std::this_thread::sleep_for(milliseconds(20));
    cancel.cancel();
  });
  auto start = steady_clock::now();
  EXPECT_FALSE(limiter.acquire(cancel));
  EXPECT_LT(duration_cast<milliseconds>(steady_clock::now() - start).count(), 900);
  canceller.join();
}

TEST(rate_limiter, reset_clears_window) {
  RateLimiter limiter(1, milliseconds(0));
  CancelSignal cancel;
  ASSERT_TRUE(limiter.acquire(cancel));
  limiter.reset();
  EXPECT_EQ(limiter.window_count(), 0u);

  auto start = steady_clock::now();
  ASSERT_TRUE(limiter.acquire(cancel));
  EXPECT_LT(duration_cast<milliseconds>(steady_clock::now() - start).count(), 500);
}

TEST(backoff_state, grows_geometrically_and_caps) {
  BackoffState backoff(500);
  EXPECT_EQ(backoff.on_throttled(3.0, 60000), 1500);
  EXPECT_EQ(backoff.consecutive_throttles, 1);
  EXPECT_EQ(backoff.on_throttled(3.0, 60000), 18000);
  EXPECT_EQ(backoff.on_throttled(3.0, 60000), 60000);
  EXPECT_EQ(backoff.consecutive_throttles, 3);
  EXPECT_LE(backoff.current_delay_ms, 60000);
}

TEST(backoff_state, reset_restores_base) {
  BackoffState backoff(500);
  backoff.on_throttled(3.0, 60000);
  backoff.on_throttled(3.0, 60000);
  backoff.reset();
  EXPECT_EQ(backoff.current_delay_ms, 500);
  EXPECT_EQ(backoff.consecutive_throttles, 0);
  EXPECT_EQ(backoff.attempt, 0);
  EXPECT_EQ(backoff.on_throttled(3.0, 60000), 1500);
}

TEST(endpoint_pool, rotates_round_robin) {
  EndpointPool pool({"https://a", "https://b", "https://c"});
  EXPECT_EQ(pool.current().url, "https://a");
  EXPECT_EQ(pool.rotate_from(0).url, "https://b");
  EXPECT_EQ(pool.rotate_from(1).url, "https://c");
  EXPECT_EQ(pool.rotate_from(2).url, "https://a");
  EXPECT_EQ(pool.rotations(), 3u);
}

TEST(endpoint_pool, stale_rotation_does_not_advance_twice) {
  EndpointPool pool({"https://a", "https://b", "https://c"});
  auto seen = pool.current();
  EXPECT_EQ(pool.rotate_from(seen.index).url, "https://b");
  // 第二个观察者看到的仍是旧 index
  EXPECT_EQ(pool.rotate_from(seen.index).url, "https://b");
  EXPECT_EQ(pool.rotations(), 1u);
}

TEST(endpoint_pool, rejects_empty_list) {
  EXPECT_THROW(EndpointPool(std::vector<std::string>{}), std::invalid_argument);
}
