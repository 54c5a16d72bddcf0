#include "polywatch/core/lockfree_queue.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace polywatch;

TEST(BoundedMPSCQueueTest, PushPopPreservesOrder) {
  BoundedMPSCQueue<int> queue(16);

  for (int i = 0; i < 10; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  for (int i = 0; i < 10; ++i) {
    auto value = queue.try_pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, i);
  }
  EXPECT_TRUE(queue.empty());
}

TEST(BoundedMPSCQueueTest, EmptyQueue_PopsNothing) {
  BoundedMPSCQueue<std::string> queue(8);
  EXPECT_FALSE(queue.try_pop().has_value());
  EXPECT_TRUE(queue.empty());
}

TEST(BoundedMPSCQueueTest, CapacityRoundsUpToPowerOfTwo) {
  BoundedMPSCQueue<int> queue(100);
  EXPECT_EQ(queue.capacity(), 128u);
}

TEST(BoundedMPSCQueueTest, FullQueue_RejectsPush) {
  BoundedMPSCQueue<int> queue(4);
  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  EXPECT_FALSE(queue.push(99));

  ASSERT_TRUE(queue.try_pop().has_value());
  EXPECT_TRUE(queue.push(99));
}

TEST(BoundedMPSCQueueTest, PopBulk_RespectsLimit) {
  BoundedMPSCQueue<std::string> queue(16);
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(queue.push(std::to_string(i)));
  }

  std::vector<std::string> out;
  EXPECT_EQ(queue.pop_bulk(out, 3), 3u);
  EXPECT_EQ(out, (std::vector<std::string>{"0", "1", "2"}));
  EXPECT_EQ(queue.pop_bulk(out, 10), 2u);
  EXPECT_EQ(out.size(), 5u);
}

TEST(BoundedMPSCQueueTest, ConcurrentProducers_DeliverEverything) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 5000;
  BoundedMPSCQueue<int> queue(256);
  std::atomic<int> finished{0};

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&] {
      for (int i = 1; i <= kPerProducer; ++i) {
        while (!queue.push(i)) {
          std::this_thread::yield();
        }
      }
      finished.fetch_add(1);
    });
  }

  long long sum = 0;
  int received = 0;
  while (finished.load() < kProducers || !queue.empty()) {
    if (auto value = queue.try_pop()) {
      sum += *value;
      ++received;
    } else {
      std::this_thread::yield();
    }
  }
  for (auto& t : producers) {
    t.join();
  }

  EXPECT_EQ(received, kProducers * kPerProducer);
  EXPECT_EQ(sum, static_cast<long long>(kProducers) * kPerProducer *
                     (kPerProducer + 1) / 2);
}
