#include <functional>
#include <queue>
#include <vector>

#include "compasslevel/estimators/async_compass_level.hpp"
#include "gtest/gtest.h"

namespace cl = compasslevel;

TEST(QueuedSample, OldestTimestampComesFirst) {
  std::priority_queue<cl::QueuedSample, std::vector<cl::QueuedSample>,
                      std::greater<>>
      queue;
  std::uint64_t sequence = 0;
  for (const std::int64_t t : {30, 10, 20, 0}) {
    queue.push({.timestamp_ns = t,
                .sequence = sequence++,
                .sample = cl::Sample::Gyroscope(t, Eigen::Vector3d::Zero())});
  }

  std::vector<std::int64_t> order;
  while (!queue.empty()) {
    order.push_back(queue.top().timestamp_ns);
    queue.pop();
  }
  EXPECT_EQ(order, (std::vector<std::int64_t>{0, 10, 20, 30}));
}

TEST(QueuedSample, EqualTimestampsKeepPushOrder) {
  std::priority_queue<cl::QueuedSample, std::vector<cl::QueuedSample>,
                      std::greater<>>
      queue;
  const std::vector<cl::SensorKind> kinds = {
      cl::SensorKind::kGyroscope, cl::SensorKind::kAccelerometer,
      cl::SensorKind::kMagnetometer, cl::SensorKind::kGyroscope};
  std::uint64_t sequence = 0;
  for (const auto kind : kinds) {
    queue.push({.timestamp_ns = 5,
                .sequence = sequence++,
                .sample = {.kind = kind, .timestamp_ns = 5}});
  }

  std::vector<cl::SensorKind> order;
  while (!queue.empty()) {
    order.push_back(queue.top().sample.kind);
    queue.pop();
  }
  EXPECT_EQ(order, kinds);
}
