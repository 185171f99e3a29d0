#ifndef COMPASSLEVEL_BASE_MODULE_HPP_
#define COMPASSLEVEL_BASE_MODULE_HPP_

#include <memory>
#include <string>
#include <string_view>

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace compasslevel {

namespace detail {

// Registered logger of that name, created on first use with the sinks and
// level of the default logger
inline std::shared_ptr<spdlog::logger> SharedLogger(const std::string& name) {
  if (auto registered = spdlog::get(name)) {
    return registered;
  }
  const auto& sinks = spdlog::default_logger_raw()->sinks();
  auto created =
      std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  created->set_level(spdlog::get_level());
  spdlog::register_logger(created);
  return created;
}

}  // namespace detail

/// Common base of the processing blocks. Each block logs through a logger
/// named "<Kind>.<Name>", e.g. "Estimator.Heading", so levels can be tuned
/// per block. An injected logger replaces the shared one.
class Module {
 public:
  Module(std::string_view kind, std::string_view name,
         std::shared_ptr<spdlog::logger> logger = nullptr)
      : logger_(logger ? std::move(logger)
                       : detail::SharedLogger(
                             fmt::format("{}.{}", kind, name))) {}

  virtual ~Module() = default;

  [[nodiscard]] const std::string& name() const { return logger_->name(); }

  [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const {
    return logger_;
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace compasslevel

#endif  // COMPASSLEVEL_BASE_MODULE_HPP_
