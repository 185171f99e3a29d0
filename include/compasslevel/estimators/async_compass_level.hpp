#ifndef COMPASSLEVEL_ESTIMATORS_ASYNC_COMPASS_LEVEL_HPP_
#define COMPASSLEVEL_ESTIMATORS_ASYNC_COMPASS_LEVEL_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "compasslevel/estimators/compass_level.hpp"

namespace compasslevel {

// Entry of the intake queue
struct QueuedSample {
  std::int64_t timestamp_ns;
  std::uint64_t sequence;  // Keeps push order for equal timestamps
  Sample sample;

  // For priority_queue: smallest timestamp (oldest data) is on top
  bool operator>(const QueuedSample& other) const {
    if (timestamp_ns != other.timestamp_ns) {
      return timestamp_ns > other.timestamp_ns;
    }
    return sequence > other.sequence;
  }
};

/// Runs a CompassLevel on a worker thread. Sensor callbacks push samples from
/// any thread; renderers read the latest readout without blocking the worker.
class AsyncCompassLevel : public Module {
 public:
  explicit AsyncCompassLevel(
      std::shared_ptr<CompassLevel::Config> config =
          std::make_shared<CompassLevel::Config>(),
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ~AsyncCompassLevel() override;

  AsyncCompassLevel(const AsyncCompassLevel&) = delete;
  AsyncCompassLevel& operator=(const AsyncCompassLevel&) = delete;

  void start();

  // Blocks until the queue is empty AND the worker is idle. Returns at once
  // when no worker is running.
  void wait();

  // ---------------------------------------------------------------------------
  // Ingestion (sensor threads)
  // ---------------------------------------------------------------------------
  void push(const Sample& sample);

  // ---------------------------------------------------------------------------
  // Query (render thread)
  // ---------------------------------------------------------------------------
  [[nodiscard]] AttitudeReadout snapshot() const;

  // ---------------------------------------------------------------------------
  // Shell controls, applied immediately
  // ---------------------------------------------------------------------------
  void markSensorUnavailable(SensorKind kind);

  std::error_code setSimulatedAttitude(double heading_deg, double roll_deg,
                                       double pitch_deg);

  void clearSimulation();

  /// Samples the worker dropped because CompassLevel returned an error
  [[nodiscard]] std::uint64_t rejectedSamples() const {
    return rejected_samples_.load();
  }

 private:
  void workerLoop();

  // Must be called with core_mutex_ held
  void commitReadout();

  // Threading primitives
  std::atomic<bool> running_ = false;
  std::jthread worker_;

  std::mutex queue_mutex_;
  std::condition_variable cv_;
  std::priority_queue<QueuedSample, std::vector<QueuedSample>, std::greater<>>
      queue_;
  std::uint64_t next_sequence_ = 0;

  std::condition_variable drain_cv_;
  bool busy_ = false;

  std::mutex core_mutex_;  // Serializes all mutation of core_
  CompassLevel core_;

  mutable std::shared_mutex state_mutex_;  // Many readers (renderers), one
                                           // writer
  AttitudeReadout committed_readout_;

  std::atomic<std::uint64_t> rejected_samples_ = 0;
};

}  // namespace compasslevel

#endif  // COMPASSLEVEL_ESTIMATORS_ASYNC_COMPASS_LEVEL_HPP_
