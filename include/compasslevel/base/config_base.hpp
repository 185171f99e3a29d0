#ifndef COMPASSLEVEL_BASE_CONFIG_BASE_HPP_
#define COMPASSLEVEL_BASE_CONFIG_BASE_HPP_

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <memory>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "Eigen/Core"
#include "compasslevel/core/common.hpp"

namespace compasslevel {

enum class Edge {
  kNone,    // Unbounded on this side
  kClosed,  // The limit itself is admissible
  kOpen,    // The limit itself is not
};

template <typename T>
struct Limit {
  Edge edge = Edge::kNone;
  T value{};
};

/// Admissible range of a numeric parameter
template <typename T>
struct Bounds {
  Limit<T> lower;
  Limit<T> upper;

  [[nodiscard]] constexpr bool contains(T val) const {
    const bool above_lower =
        lower.edge == Edge::kNone ||
        (lower.edge == Edge::kClosed ? val >= lower.value : val > lower.value);
    const bool below_upper =
        upper.edge == Edge::kNone ||
        (upper.edge == Edge::kClosed ? val <= upper.value : val < upper.value);
    return above_lower && below_upper;
  }

  template <std::ranges::input_range R>
  [[nodiscard]] bool containsAll(const R& values) const {
    return std::ranges::all_of(values, [this](T v) { return contains(v); });
  }

  static constexpr Bounds Positive() {
    return {.lower = {Edge::kOpen, T(0)}};
  }

  static constexpr Bounds NonNegative() {
    return {.lower = {Edge::kClosed, T(0)}};
  }

  static constexpr Bounds AtLeast(T lower) {
    return {.lower = {Edge::kClosed, lower}};
  }

  static constexpr Bounds OpenInterval(T lower, T upper) {
    return {.lower = {Edge::kOpen, lower}, .upper = {Edge::kOpen, upper}};
  }

  static constexpr Bounds ClosedInterval(T lower, T upper) {
    return {.lower = {Edge::kClosed, lower}, .upper = {Edge::kClosed, upper}};
  }

  // [lower, upper), e.g. a compass heading
  static constexpr Bounds HalfOpenInterval(T lower, T upper) {
    return {.lower = {Edge::kClosed, lower}, .upper = {Edge::kOpen, upper}};
  }
};

struct Properties {
  std::string_view desc;

  /// Loading fails with kConfigKeyMissing when the key is absent
  bool required = false;
};

template <typename T>
struct NumericProperties {
  std::string_view desc;
  bool required = false;
  Bounds<T> bounds = {};
};

struct StrProperties {
  std::string_view desc;
  bool required = false;
  bool non_empty = false;

  /// If not empty, the value must be one of these
  std::span<const std::string_view> choices = {};
};

using F64Properties = NumericProperties<double>;
using I64Properties = NumericProperties<std::int64_t>;

struct ConfigBase;

/// Outcome of visiting a config; key names the field that failed
struct VisitResult {
  std::error_code ec;
  std::string_view key;
};

/// Visits every field of a config, with write access. Eigen vectors are seen
/// as spans and nested configs as (possibly null) pointers.
struct ConfigVisitor {
  virtual ~ConfigVisitor() = default;

  virtual VisitResult visit(std::string_view key, double& value,
                            const F64Properties& props) = 0;

  virtual VisitResult visit(std::string_view key, std::int64_t& value,
                            const I64Properties& props) = 0;

  virtual VisitResult visit(std::string_view key, bool& value,
                            const Properties& props) = 0;

  virtual VisitResult visit(std::string_view key, std::string& value,
                            const StrProperties& props) = 0;

  virtual VisitResult visit(std::string_view key, std::span<double> values,
                            const F64Properties& props) = 0;

  virtual VisitResult visit(std::string_view key, ConfigBase* child,
                            const Properties& props) = 0;
};

/// Read-only counterpart of ConfigVisitor
struct ConstConfigVisitor {
  virtual ~ConstConfigVisitor() = default;

  virtual VisitResult visit(std::string_view key, double value,
                            const F64Properties& props) = 0;

  virtual VisitResult visit(std::string_view key, std::int64_t value,
                            const I64Properties& props) = 0;

  virtual VisitResult visit(std::string_view key, bool value,
                            const Properties& props) = 0;

  virtual VisitResult visit(std::string_view key, std::string_view value,
                            const StrProperties& props) = 0;

  virtual VisitResult visit(std::string_view key,
                            std::span<const double> values,
                            const F64Properties& props) = 0;

  virtual VisitResult visit(std::string_view key, const ConfigBase* child,
                            const Properties& props) = 0;
};

namespace detail {

template <typename T>
VisitResult Validate(std::string_view key, T value,
                     const NumericProperties<T>& props) {
  if (!props.bounds.contains(value)) {
    return {make_error_code(CompassLevelErrc::kOutOfBounds), key};
  }
  return {};
}

inline VisitResult Validate(std::string_view key,
                            const std::vector<double>& values,
                            const F64Properties& props) {
  if (!props.bounds.containsAll(values)) {
    return {make_error_code(CompassLevelErrc::kOutOfBounds), key};
  }
  return {};
}

inline VisitResult Validate(std::string_view /*key*/, bool /*value*/,
                            const Properties& /*props*/) {
  return {};
}

inline VisitResult Validate(std::string_view key, const std::string& value,
                            const StrProperties& props) {
  if (props.non_empty && value.empty()) {
    return {make_error_code(CompassLevelErrc::kEmptyValueNotAllowed), key};
  }
  if (!props.choices.empty() &&
      std::ranges::find(props.choices, std::string_view(value)) ==
          props.choices.end()) {
    return {make_error_code(CompassLevelErrc::kInvalidChoice), key};
  }
  return {};
}

}  // namespace detail

/// Base for visitors that fill a config from some document.
///
/// Each value is read into a copy, validated against its properties and only
/// then written back, so a failed load leaves the field as it was. Absent
/// keys keep their current value unless the field is required.
class LoaderVisitor : public ConfigVisitor {
 public:
  VisitResult visit(std::string_view key, double& value,
                    const F64Properties& props) final {
    return stage(key, value, props);
  }

  VisitResult visit(std::string_view key, std::int64_t& value,
                    const I64Properties& props) final {
    return stage(key, value, props);
  }

  VisitResult visit(std::string_view key, bool& value,
                    const Properties& props) final {
    return stage(key, value, props);
  }

  VisitResult visit(std::string_view key, std::string& value,
                    const StrProperties& props) final {
    return stage(key, value, props);
  }

  VisitResult visit(std::string_view key, std::span<double> values,
                    const F64Properties& props) final {
    std::vector<double> staged(values.begin(), values.end());
    if (auto res = read(key, std::span(staged), props.required); res.ec) {
      return res;
    }
    if (auto res = detail::Validate(key, staged, props); res.ec) {
      return res;
    }
    std::ranges::copy(staged, values.begin());
    return {};
  }

  VisitResult visit(std::string_view key, ConfigBase* child,
                    const Properties& props) final {
    if (child == nullptr) {
      return {make_error_code(CompassLevelErrc::kConfigValueUninitialized),
              key};
    }
    return descend(key, *child, props.required);
  }

 protected:
  // Each read leaves the value untouched when the key is absent
  virtual VisitResult read(std::string_view key, double& value,
                           bool required) = 0;

  virtual VisitResult read(std::string_view key, std::int64_t& value,
                           bool required) = 0;

  virtual VisitResult read(std::string_view key, bool& value,
                           bool required) = 0;

  virtual VisitResult read(std::string_view key, std::string& value,
                           bool required) = 0;

  // The document must hold exactly values.size() elements
  virtual VisitResult read(std::string_view key, std::span<double> values,
                           bool required) = 0;

  /// Loads child from the section stored under key
  virtual VisitResult descend(std::string_view key, ConfigBase& child,
                              bool required) = 0;

 private:
  template <typename T, typename Props>
  VisitResult stage(std::string_view key, T& value, const Props& props) {
    T staged = value;
    if (auto res = read(key, staged, props.required); res.ec) {
      return res;
    }
    if (auto res = detail::Validate(key, staged, props); res.ec) {
      return res;
    }
    value = std::move(staged);
    return {};
  }
};

struct ConfigBase {
  virtual ~ConfigBase() = default;

  // Type name of the config, e.g. "HeadingEstimatorConfig"
  [[nodiscard]] virtual std::string_view name() const = 0;

  virtual VisitResult accept(ConfigVisitor& visitor) = 0;

  [[nodiscard]] virtual VisitResult accept(
      ConstConfigVisitor& visitor) const = 0;
};

template <typename Class, typename T, typename Props>
struct ParamDescriptor {
  std::string_view name;
  T Class::* member;
  Props props;
};

template <typename Class, typename T, typename Props>
  requires(!std::is_member_function_pointer_v<T Class::*>)
constexpr auto Describe(std::string_view name, T Class::* member, Props props) {
  return ParamDescriptor<Class, T, Props>{name, member, props};
}

namespace detail {

template <typename T>
struct IsSharedPtr : std::false_type {};

template <typename T>
struct IsSharedPtr<std::shared_ptr<T>> : std::true_type {};

template <typename T>
concept EigenVector = std::derived_from<T, Eigen::MatrixBase<T>> &&
                      static_cast<bool>(T::IsVectorAtCompileTime);

}  // namespace detail

/// CRTP base that implements accept() from Derived::kDescriptors, a tuple of
/// Describe() entries. Fields are visited in declaration order and visiting
/// stops at the first failure.
template <typename Derived>
struct ReflectiveConfigBase : ConfigBase {
  VisitResult accept(ConfigVisitor& visitor) override {
    return VisitFields(static_cast<Derived&>(*this), visitor);
  }

  VisitResult accept(ConstConfigVisitor& visitor) const override {
    return VisitFields(static_cast<const Derived&>(*this), visitor);
  }

 private:
  template <typename Self, typename Visitor>
  static VisitResult VisitFields(Self& self, Visitor& visitor) {
    VisitResult result;
    std::apply(
        [&](const auto&... field) {
          static_cast<void>(
              (... && !(result = visitor.visit(field.name,
                                               AsVisitable(self.*(field.member)),
                                               field.props))
                           .ec));
        },
        Derived::kDescriptors);
    return result;
  }

  // Maps a member onto the type its visitor overload takes
  template <typename T>
  static decltype(auto) AsVisitable(T& member) {
    using Plain = std::remove_cv_t<T>;
    constexpr bool kReadOnly = std::is_const_v<T>;
    if constexpr (detail::EigenVector<Plain>) {
      static_assert(Plain::InnerStrideAtCompileTime == 1,
                    "Vector fields must be contiguous");
      return std::span(member.data(), static_cast<std::size_t>(member.size()));
    } else if constexpr (detail::IsSharedPtr<Plain>::value) {
      using Child = std::conditional_t<kReadOnly, const ConfigBase, ConfigBase>;
      return static_cast<Child*>(member.get());
    } else if constexpr (std::same_as<Plain, std::string> && kReadOnly) {
      return std::string_view(member);
    } else {
      return member;
    }
  }
};

}  // namespace compasslevel

#endif  // COMPASSLEVEL_BASE_CONFIG_BASE_HPP_
