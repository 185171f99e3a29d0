#ifndef COMPASSLEVEL_EXTENSIONS_PRETTY_PRINTER_HPP_
#define COMPASSLEVEL_EXTENSIONS_PRETTY_PRINTER_HPP_

#include <ostream>
#include <string>

#include "compasslevel/base/config_base.hpp"

namespace compasslevel {

struct PrintOptions {
  bool show_details = false;
  int indent_width = 2;
};

/// Writes a config tree as YAML-like text, one key per line. With
/// show_details every value becomes a mapping that also lists its metadata.
class PrettyPrinter final : public ConstConfigVisitor {
 public:
  explicit PrettyPrinter(std::ostream& os, const PrintOptions& options = {});

  VisitResult visit(std::string_view key, double value,
                    const F64Properties& props) override;

  VisitResult visit(std::string_view key, std::int64_t value,
                    const I64Properties& props) override;

  VisitResult visit(std::string_view key, bool value,
                    const Properties& props) override;

  VisitResult visit(std::string_view key, std::string_view value,
                    const StrProperties& props) override;

  VisitResult visit(std::string_view key, std::span<const double> values,
                    const F64Properties& props) override;

  VisitResult visit(std::string_view key, const ConfigBase* child,
                    const Properties& props) override;

 private:
  template <typename T, typename Props>
  VisitResult print(std::string_view key, const T& value, const Props& props);

  [[nodiscard]] std::string indent(int depth) const;

  std::ostream& os_;
  PrintOptions options_;
  int depth_ = 0;
};

}  // namespace compasslevel

#endif  // COMPASSLEVEL_EXTENSIONS_PRETTY_PRINTER_HPP_
