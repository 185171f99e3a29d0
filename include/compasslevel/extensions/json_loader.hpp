#ifndef COMPASSLEVEL_EXTENSIONS_JSON_LOADER_HPP_
#define COMPASSLEVEL_EXTENSIONS_JSON_LOADER_HPP_

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include "compasslevel/base/config_base.hpp"
#include "nlohmann/json_fwd.hpp"

namespace compasslevel {

/// Fills configs from a JSON document. Keys a config does not declare are
/// ignored; integers are accepted where a double is expected.
class JsonLoader final : public LoaderVisitor {
 public:
  // Both return nullptr if the document cannot be read or parsed
  static std::shared_ptr<JsonLoader> FromFile(
      const std::filesystem::path& path);
  static std::shared_ptr<JsonLoader> FromString(std::string_view str);

  ~JsonLoader() override;

  JsonLoader(const JsonLoader&) = delete;
  JsonLoader& operator=(const JsonLoader&) = delete;

 protected:
  VisitResult read(std::string_view key, double& value,
                   bool required) override;

  VisitResult read(std::string_view key, std::int64_t& value,
                   bool required) override;

  VisitResult read(std::string_view key, bool& value, bool required) override;

  VisitResult read(std::string_view key, std::string& value,
                   bool required) override;

  VisitResult read(std::string_view key, std::span<double> values,
                   bool required) override;

  VisitResult descend(std::string_view key, ConfigBase& child,
                      bool required) override;

 private:
  explicit JsonLoader(std::unique_ptr<nlohmann::json> document);

  // Member of the section being loaded, nullptr if absent
  [[nodiscard]] const nlohmann::json* find(std::string_view key) const;

  template <typename T>
  VisitResult readScalar(std::string_view key, T& value, bool required) const;

  std::unique_ptr<nlohmann::json> document_;
  std::vector<const nlohmann::json*> sections_;  // Innermost last
};

}  // namespace compasslevel

#endif  // COMPASSLEVEL_EXTENSIONS_JSON_LOADER_HPP_
