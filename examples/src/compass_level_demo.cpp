#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string_view>
#include <tuple>

#include "compasslevel/estimators/async_compass_level.hpp"
#include "compasslevel/extensions/json_loader.hpp"
#include "compasslevel/extensions/pretty_printer.hpp"
#include "compasslevel/simulator/sensor_simulator.hpp"
#include "spdlog/spdlog.h"

namespace cl = compasslevel;

static constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warning", "error", "critical", "off"};

struct DemoConfig : public cl::ReflectiveConfigBase<DemoConfig> {
  std::string_view name() const override { return "DemoConfig"; }

  std::string log_level = "info";
  double duration_s = 10.0;
  double render_period_s = 0.5;
  double step_s = 0.01;

  bool simulate_second_half = false;
  double simulated_heading_deg = 0.0;
  double simulated_roll_deg = 0.0;
  double simulated_pitch_deg = 0.0;

  std::shared_ptr<cl::CompassLevel::Config> compass_level =
      std::make_shared<cl::CompassLevel::Config>();
  std::shared_ptr<cl::SensorSimulator::Config> simulator =
      std::make_shared<cl::SensorSimulator::Config>();

  static constexpr auto kDescriptors = std::make_tuple(
      Describe("log_level", &DemoConfig::log_level,
               cl::StrProperties{.desc = "spdlog level",
                                 .non_empty = true,
                                 .choices = kLogLevels}),
      Describe("duration_s", &DemoConfig::duration_s,
               cl::F64Properties{.desc = "Simulated time (seconds)",
                                 .bounds = cl::Bounds<double>::Positive()}),
      Describe("render_period_s", &DemoConfig::render_period_s,
               cl::F64Properties{.desc = "Time between two readouts (seconds)",
                                 .bounds = cl::Bounds<double>::Positive()}),
      Describe("step_s", &DemoConfig::step_s,
               cl::F64Properties{.desc = "Simulator step (seconds)",
                                 .bounds = cl::Bounds<double>::Positive()}),
      Describe("simulate_second_half", &DemoConfig::simulate_second_half,
               cl::Properties{
                   .desc = "Override the sensors for the second half"}),
      Describe("simulated_heading_deg", &DemoConfig::simulated_heading_deg,
               cl::F64Properties{
                   .desc = "Simulated heading (degrees)",
                   .bounds = cl::CompassLevel::kSimulatedHeadingBounds}),
      Describe("simulated_roll_deg", &DemoConfig::simulated_roll_deg,
               cl::F64Properties{
                   .desc = "Simulated roll (degrees)",
                   .bounds = cl::CompassLevel::kSimulatedTiltBounds}),
      Describe("simulated_pitch_deg", &DemoConfig::simulated_pitch_deg,
               cl::F64Properties{
                   .desc = "Simulated pitch (degrees)",
                   .bounds = cl::CompassLevel::kSimulatedTiltBounds}),
      Describe("compass_level", &DemoConfig::compass_level,
               cl::Properties{.desc = "Compass and level configuration"}),
      Describe("simulator", &DemoConfig::simulator,
               cl::Properties{.desc = "Sensor simulator configuration"}));
};

int main(int argc, char** argv) {
  const std::string_view config_file = argc > 1 ? argv[1] : CONFIG_FILE;

  auto loader = cl::JsonLoader::FromFile(config_file);
  if (!loader) {
    spdlog::error("Failed to load JSON config from file: {}", config_file);
    return -1;
  }

  DemoConfig cfg;
  if (auto res = cfg.accept(*loader); res.ec) {
    spdlog::error("Failed to load DemoConfig from JSON: {} for {}",
                  res.ec.message(), res.key);
    return -1;
  }

  spdlog::set_level(spdlog::level::from_str(cfg.log_level));

  auto printer = cl::PrettyPrinter(std::cout);
  std::ignore = cfg.accept(printer);

  cl::SensorSimulator sim(cfg.simulator);
  cl::AsyncCompassLevel level(cfg.compass_level);
  level.start();

  const auto num_steps =
      static_cast<std::int64_t>(std::llround(cfg.duration_s / cfg.step_s));
  const auto steps_per_frame = std::max<std::int64_t>(
      std::llround(cfg.render_period_s / cfg.step_s), 1);

  spdlog::info("Running {} steps of {} s", num_steps, cfg.step_s);
  for (std::int64_t i = 1; i <= num_steps; ++i) {
    if (cfg.simulate_second_half && i == num_steps / 2) {
      if (auto ec = level.setSimulatedAttitude(cfg.simulated_heading_deg,
                                               cfg.simulated_roll_deg,
                                               cfg.simulated_pitch_deg)) {
        spdlog::error("Cannot simulate attitude: {}", ec.message());
      }
    }

    auto samples = sim.step(cfg.step_s);
    if (!samples) {
      spdlog::error("Simulator step failed: {}", samples.error().message());
      return -1;
    }
    for (const auto& sample : *samples) {
      level.push(sample);
    }

    // "Render" one frame
    if (i % steps_per_frame == 0) {
      level.wait();
      const auto readout = level.snapshot();
      spdlog::info("t={:.2f} s {} | true heading {:.1f} deg",
                   static_cast<double>(sim.now_ns()) / cl::kNanosPerSecond,
                   readout, sim.trueHeading());
    }
  }

  level.wait();
  spdlog::info("Done. Final readout: {} ({} samples rejected)",
               level.snapshot(), level.rejectedSamples());
  return 0;
}
