#ifndef COMPASSLEVEL_CORE_COMMON_HPP_
#define COMPASSLEVEL_CORE_COMMON_HPP_

#include <string>
#include <system_error>
#include <type_traits>

#include "Eigen/Core"  // IWYU pragma: keep

namespace compasslevel {

template <typename Derived>
concept Vector3Like = static_cast<bool>(Derived::IsVectorAtCompileTime) &&
                      Derived::RowsAtCompileTime == 3;

template <typename Derived>
concept Matrix3Like = static_cast<bool>(Derived::RowsAtCompileTime == 3 &&
                                        Derived::ColsAtCompileTime == 3);

enum class CompassLevelErrc {
  // Numerics
  kNumericallyNonFinite = 1,
  kPhysicallyInvalid,
  kOutOfBounds,
  kDegenerateInput,

  // Sample stream
  kTimestampOutOfOrder,
  kUnknownSensorType,

  // Configuration
  kConfigKeyMissing,
  kConfigTypeMismatch,
  kConfigSizeMismatch,
  kEmptyValueNotAllowed,
  kConfigValueUninitialized,
  kInvalidChoice,
};

namespace detail {

class ErrcCategory final : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override {
    return "compasslevel_error";
  }

  [[nodiscard]] std::string message(int ev) const override {
    switch (static_cast<CompassLevelErrc>(ev)) {
      case CompassLevelErrc::kNumericallyNonFinite:
        return "Input contains NaN or infinity";
      case CompassLevelErrc::kPhysicallyInvalid:
        return "Physically invalid value";
      case CompassLevelErrc::kOutOfBounds:
        return "Value out of bounds";
      case CompassLevelErrc::kDegenerateInput:
        return "Gravity and magnetic field do not define a heading";
      case CompassLevelErrc::kTimestampOutOfOrder:
        return "Sample is older than the previous one";
      case CompassLevelErrc::kUnknownSensorType:
        return "Unknown sensor type";
      case CompassLevelErrc::kConfigKeyMissing:
        return "Required configuration key missing";
      case CompassLevelErrc::kConfigTypeMismatch:
        return "Configuration value has the wrong type";
      case CompassLevelErrc::kConfigSizeMismatch:
        return "Configuration array has the wrong size";
      case CompassLevelErrc::kEmptyValueNotAllowed:
        return "Empty value not allowed";
      case CompassLevelErrc::kConfigValueUninitialized:
        return "Nested configuration is null";
      case CompassLevelErrc::kInvalidChoice:
        return "Value is not one of the allowed choices";
    }
    return "Unrecognized error " + std::to_string(ev);
  }

  [[nodiscard]] std::error_condition default_error_condition(
      int ev) const noexcept override {
    switch (static_cast<CompassLevelErrc>(ev)) {
      case CompassLevelErrc::kOutOfBounds:
        return std::errc::result_out_of_range;
      case CompassLevelErrc::kInvalidChoice:
        return std::errc::invalid_argument;
      default:
        return {ev, *this};
    }
  }
};

}  // namespace detail

inline const std::error_category& CompassLevelCategory() {
  static const detail::ErrcCategory category;
  return category;
}

// Found by argument-dependent lookup, which lets CompassLevelErrc convert
// implicitly to std::error_code
inline std::error_code make_error_code(CompassLevelErrc e) {
  return {static_cast<int>(e), CompassLevelCategory()};
}

}  // namespace compasslevel

template <>
struct std::is_error_code_enum<compasslevel::CompassLevelErrc>
    : std::true_type {};

static_assert(std::is_convertible_v<compasslevel::CompassLevelErrc,
                                    std::error_code>);

#endif  // COMPASSLEVEL_CORE_COMMON_HPP_
