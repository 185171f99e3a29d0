#include "compasslevel/extensions/json_loader.hpp"

#include <fstream>
#include <string>
#include <utility>

#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"

namespace compasslevel {

using nlohmann::json;

namespace {

VisitResult Failure(CompassLevelErrc errc, std::string_view key) {
  return {make_error_code(errc), key};
}

VisitResult Absent(std::string_view key, bool required) {
  return required ? Failure(CompassLevelErrc::kConfigKeyMissing, key)
                  : VisitResult{};
}

// Each Extract leaves out untouched and returns false on a type mismatch
bool Extract(const json& node, double& out) {
  if (!node.is_number()) {
    return false;
  }
  out = node.get<double>();
  return true;
}

bool Extract(const json& node, std::int64_t& out) {
  if (!node.is_number_integer()) {
    return false;
  }
  out = node.get<std::int64_t>();
  return true;
}

bool Extract(const json& node, bool& out) {
  if (!node.is_boolean()) {
    return false;
  }
  out = node.get<bool>();
  return true;
}

bool Extract(const json& node, std::string& out) {
  if (!node.is_string()) {
    return false;
  }
  out = node.get<std::string>();
  return true;
}

std::shared_ptr<JsonLoader> Discarded(std::string_view source) {
  spdlog::error("Failed to parse JSON configuration from {}", source);
  return nullptr;
}

}  // namespace

JsonLoader::JsonLoader(std::unique_ptr<json> document)
    : document_(std::move(document)), sections_{document_.get()} {}

JsonLoader::~JsonLoader() = default;

std::shared_ptr<JsonLoader> JsonLoader::FromString(std::string_view str) {
  auto document = std::make_unique<json>(json::parse(str, nullptr, false));
  if (document->is_discarded()) {
    return Discarded("string");
  }
  return std::shared_ptr<JsonLoader>(new JsonLoader(std::move(document)));
}

std::shared_ptr<JsonLoader> JsonLoader::FromFile(
    const std::filesystem::path& path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    spdlog::error("Failed to open configuration file {}", path.string());
    return nullptr;
  }
  auto document = std::make_unique<json>(json::parse(ifs, nullptr, false));
  if (document->is_discarded()) {
    return Discarded(path.string());
  }
  return std::shared_ptr<JsonLoader>(new JsonLoader(std::move(document)));
}

const json* JsonLoader::find(std::string_view key) const {
  const json& section = *sections_.back();
  const auto it = section.find(std::string(key));
  return it == section.end() ? nullptr : &*it;
}

template <typename T>
VisitResult JsonLoader::readScalar(std::string_view key, T& value,
                                   bool required) const {
  const json* node = find(key);
  if (node == nullptr) {
    return Absent(key, required);
  }
  if (!Extract(*node, value)) {
    return Failure(CompassLevelErrc::kConfigTypeMismatch, key);
  }
  return {};
}

VisitResult JsonLoader::read(std::string_view key, double& value,
                             bool required) {
  return readScalar(key, value, required);
}

VisitResult JsonLoader::read(std::string_view key, std::int64_t& value,
                             bool required) {
  return readScalar(key, value, required);
}

VisitResult JsonLoader::read(std::string_view key, bool& value,
                             bool required) {
  return readScalar(key, value, required);
}

VisitResult JsonLoader::read(std::string_view key, std::string& value,
                             bool required) {
  return readScalar(key, value, required);
}

VisitResult JsonLoader::read(std::string_view key, std::span<double> values,
                             bool required) {
  const json* node = find(key);
  if (node == nullptr) {
    return Absent(key, required);
  }
  if (!node->is_array()) {
    return Failure(CompassLevelErrc::kConfigTypeMismatch, key);
  }
  if (node->size() != values.size()) {
    return Failure(CompassLevelErrc::kConfigSizeMismatch, key);
  }

  std::size_t i = 0;
  for (const auto& element : *node) {
    if (!Extract(element, values[i++])) {
      return Failure(CompassLevelErrc::kConfigTypeMismatch, key);
    }
  }
  return {};
}

VisitResult JsonLoader::descend(std::string_view key, ConfigBase& child,
                                bool required) {
  const json* node = find(key);
  if (node == nullptr) {
    return Absent(key, required);
  }
  if (!node->is_object()) {
    return Failure(CompassLevelErrc::kConfigTypeMismatch, key);
  }

  sections_.push_back(node);
  const VisitResult result = child.accept(*this);
  sections_.pop_back();
  return result;
}

}  // namespace compasslevel
