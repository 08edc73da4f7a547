#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include <rt_bsa/source/update_fifo.hpp>

using namespace rt_bsa;

namespace {
TelemetryEvent value_event(double value) {
  TelemetryEvent e;
  e.kind = TelemetryEvent::Kind::VALUE;
  e.address = "CH";
  e.value = value;
  e.nanoseconds = static_cast<uint64_t>(value);
  return e;
}
}  // namespace

TEST(UpdateFifoTest, PopsOldestFirst) {
  UpdateFifo fifo(8);
  fifo.push(value_event(1));
  fifo.push(value_event(2));
  fifo.push(value_event(3));
  EXPECT_EQ(fifo.size(), 3u);

  TelemetryEvent out;
  ASSERT_TRUE(fifo.try_pop(out));
  EXPECT_DOUBLE_EQ(out.value, 1.0);
  ASSERT_TRUE(fifo.try_pop(out));
  EXPECT_DOUBLE_EQ(out.value, 2.0);
  ASSERT_TRUE(fifo.try_pop(out));
  EXPECT_DOUBLE_EQ(out.value, 3.0);
  EXPECT_FALSE(fifo.try_pop(out));
}

TEST(UpdateFifoTest, FullQueueDropsOldest) {
  UpdateFifo fifo(2);
  EXPECT_FALSE(fifo.push(value_event(1)));
  EXPECT_FALSE(fifo.push(value_event(2)));
  EXPECT_TRUE(fifo.push(value_event(3)));
  EXPECT_EQ(fifo.overflow_drop_old_count(), 1u);

  TelemetryEvent out;
  ASSERT_TRUE(fifo.try_pop(out));
  EXPECT_DOUBLE_EQ(out.value, 2.0);
}

TEST(UpdateFifoTest, ShrinkingDropsOldest) {
  UpdateFifo fifo(4);
  for (int i = 0; i < 4; ++i) fifo.push(value_event(i));
  fifo.set_max_size(2);
  EXPECT_EQ(fifo.size(), 2u);
  EXPECT_EQ(fifo.overflow_drop_old_count(), 2u);

  TelemetryEvent out;
  ASSERT_TRUE(fifo.try_pop(out));
  EXPECT_DOUBLE_EQ(out.value, 2.0);
}

TEST(UpdateFifoTest, WaitTimesOutWhenEmpty) {
  UpdateFifo fifo;
  TelemetryEvent out;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(fifo.wait_and_pop(out, 20));
  EXPECT_GE(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(15));
}

TEST(UpdateFifoTest, WaitWakesOnPush) {
  UpdateFifo fifo;
  std::thread producer([&fifo] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    fifo.push(value_event(42));
  });

  TelemetryEvent out;
  EXPECT_TRUE(fifo.wait_and_pop(out, 2000));
  EXPECT_DOUBLE_EQ(out.value, 42.0);
  producer.join();
}

TEST(UpdateFifoTest, ClearEmptiesQueue) {
  UpdateFifo fifo;
  fifo.push(value_event(1));
  fifo.clear();
  EXPECT_EQ(fifo.size(), 0u);
}
