#include "compasslevel/extensions/pretty_printer.hpp"

#include "compasslevel/core/definitions.hpp"
#include "fmt/format.h"
#include "fmt/ostream.h"
#include "fmt/ranges.h"

// Interval notation, quoted because a bracketed pair is not a YAML scalar
template <typename T>
struct fmt::formatter<compasslevel::Bounds<T>> : fmt::NoSpecifierFormatter {
  template <typename FormatContext>
  auto format(const compasslevel::Bounds<T>& bounds, FormatContext& ctx) const {
    using compasslevel::Edge;
    auto out = ctx.out();
    switch (bounds.lower.edge) {
      case Edge::kNone:
        out = fmt::format_to(out, "\"(-inf, ");
        break;
      case Edge::kClosed:
        out = fmt::format_to(out, "\"[{}, ", bounds.lower.value);
        break;
      case Edge::kOpen:
        out = fmt::format_to(out, "\"({}, ", bounds.lower.value);
        break;
    }
    switch (bounds.upper.edge) {
      case Edge::kNone:
        out = fmt::format_to(out, "inf)\"");
        break;
      case Edge::kClosed:
        out = fmt::format_to(out, "{}]\"", bounds.upper.value);
        break;
      case Edge::kOpen:
        out = fmt::format_to(out, "{})\"", bounds.upper.value);
        break;
    }
    return out;
  }
};

namespace compasslevel {

namespace {

void PrintExtras(std::ostream& /*os*/, const std::string& /*pad*/,
                 const Properties& /*props*/) {}

void PrintExtras(std::ostream& os, const std::string& pad,
                 const StrProperties& props) {
  fmt::print(os, "{}non_empty: {}\n", pad, props.non_empty);
  if (!props.choices.empty()) {
    fmt::print(os, "{}choices: {}\n", pad, props.choices);
  }
}

template <typename T>
void PrintExtras(std::ostream& os, const std::string& pad,
                 const NumericProperties<T>& props) {
  fmt::print(os, "{}bounds: {}\n", pad, props.bounds);
}

}  // namespace

PrettyPrinter::PrettyPrinter(std::ostream& os, const PrintOptions& options)
    : os_(os), options_(options) {}

std::string PrettyPrinter::indent(int depth) const {
  return std::string(static_cast<std::size_t>(depth * options_.indent_width),
                     ' ');
}

template <typename T, typename Props>
VisitResult PrettyPrinter::print(std::string_view key, const T& value,
                                 const Props& props) {
  if (!options_.show_details) {
    fmt::print(os_, "{}{}: {}\n", indent(depth_), key, value);
    return {};
  }

  const std::string pad = indent(depth_ + 1);
  fmt::print(os_, "{}{}:\n", indent(depth_), key);
  fmt::print(os_, "{}value: {}\n", pad, value);
  fmt::print(os_, "{}description: {}\n", pad, props.desc);
  fmt::print(os_, "{}required: {}\n", pad, props.required);
  PrintExtras(os_, pad, props);
  return {};
}

VisitResult PrettyPrinter::visit(std::string_view key, double value,
                                 const F64Properties& props) {
  return print(key, value, props);
}

VisitResult PrettyPrinter::visit(std::string_view key, std::int64_t value,
                                 const I64Properties& props) {
  return print(key, value, props);
}

VisitResult PrettyPrinter::visit(std::string_view key, bool value,
                                 const Properties& props) {
  return print(key, value, props);
}

VisitResult PrettyPrinter::visit(std::string_view key, std::string_view value,
                                 const StrProperties& props) {
  return print(key, value, props);
}

VisitResult PrettyPrinter::visit(std::string_view key,
                                 std::span<const double> values,
                                 const F64Properties& props) {
  return print(key, values, props);
}

VisitResult PrettyPrinter::visit(std::string_view key, const ConfigBase* child,
                                 const Properties& /*props*/) {
  if (child == nullptr) {
    fmt::print(os_, "{}{}: null\n", indent(depth_), key);
    return {};
  }

  // Nested configs open a block; their metadata is not printed
  fmt::print(os_, "{}{}:\n", indent(depth_), key);
  ++depth_;
  const VisitResult result = child->accept(*this);
  --depth_;
  return result;
}

}  // namespace compasslevel
