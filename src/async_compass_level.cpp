#include "compasslevel/estimators/async_compass_level.hpp"

#include <utility>

namespace compasslevel {

AsyncCompassLevel::AsyncCompassLevel(
    std::shared_ptr<CompassLevel::Config> config,
    std::shared_ptr<spdlog::logger> logger)
    : Module("AsyncEstimator", CompassLevel::kName, std::move(logger)),
      core_(std::move(config)),
      committed_readout_(core_.readout()) {}

AsyncCompassLevel::~AsyncCompassLevel() {
  {
    std::lock_guard lock(queue_mutex_);
    running_ = false;
  }
  cv_.notify_all();
  drain_cv_.notify_all();
  // Join before core_ goes away
  if (worker_.joinable()) {
    worker_.join();
  }
}

void AsyncCompassLevel::start() {
  if (worker_.joinable()) {
    logger()->warn("Worker already running");
    return;
  }
  running_ = true;
  worker_ = std::jthread(&AsyncCompassLevel::workerLoop, this);
}

void AsyncCompassLevel::wait() {
  std::unique_lock lock(queue_mutex_);
  if (!running_) {
    if (!queue_.empty()) {
      logger()->warn("No worker running, {} samples stay queued",
                     queue_.size());
    }
    return;
  }
  // Wait until the queue is empty AND the worker has finished the last job
  drain_cv_.wait(lock,
                 [this] { return (queue_.empty() && !busy_) || !running_; });
}

void AsyncCompassLevel::push(const Sample& sample) {
  {
    std::lock_guard lock(queue_mutex_);
    queue_.push(QueuedSample{.timestamp_ns = sample.timestamp_ns,
                             .sequence = next_sequence_++,
                             .sample = sample});
  }
  cv_.notify_one();  // Wake up the worker
}

AttitudeReadout AsyncCompassLevel::snapshot() const {
  std::shared_lock lock(state_mutex_);  // Reader lock
  return committed_readout_;
}

void AsyncCompassLevel::markSensorUnavailable(SensorKind kind) {
  std::lock_guard lock(core_mutex_);
  core_.markSensorUnavailable(kind);
  commitReadout();
}

std::error_code AsyncCompassLevel::setSimulatedAttitude(double heading_deg,
                                                        double roll_deg,
                                                        double pitch_deg) {
  std::lock_guard lock(core_mutex_);
  if (auto ec = core_.setSimulatedAttitude(heading_deg, roll_deg, pitch_deg)) {
    return ec;
  }
  commitReadout();
  return {};
}

void AsyncCompassLevel::clearSimulation() {
  std::lock_guard lock(core_mutex_);
  core_.clearSimulation();
  commitReadout();
}

void AsyncCompassLevel::commitReadout() {
  auto readout = core_.readout();
  std::unique_lock lock(state_mutex_);  // Writer lock
  committed_readout_ = std::move(readout);
}

void AsyncCompassLevel::workerLoop() {
  while (running_) {
    std::unique_lock lock(queue_mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

    if (!running_) {
      break;
    }

    // Extract the oldest sample
    busy_ = true;
    const auto packet = queue_.top();
    queue_.pop();
    lock.unlock();  // Release lock while processing

    {
      std::lock_guard core_lock(core_mutex_);
      if (auto update = core_.onSample(packet.sample); !update) {
        ++rejected_samples_;
        logger()->error("Dropped {}: {}", packet.sample,
                        update.error().message());
      } else {
        commitReadout();
      }
    }

    lock.lock();
    busy_ = false;
    if (queue_.empty()) {
      drain_cv_.notify_all();
    }
  }
}

}  // namespace compasslevel
