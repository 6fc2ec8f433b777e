/**
 * @file property_codec.cpp
 * @brief JSON encoding of property values
 */

#include "graph/property_codec.h"

#include <limits>
#include <type_traits>
#include <utility>
#include <variant>

namespace graphvault::graph {

using json = nlohmann::json;
using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

json ScalarToJson(const ScalarValue& value) {
  return std::visit(
      [](const auto& scalar) -> json {
        using T = std::decay_t<decltype(scalar)>;
        if constexpr (std::is_same_v<T, Timestamp>) {
          return json{{kTimestampTag, scalar.iso8601}};
        } else {
          return json(scalar);
        }
      },
      value);
}

bool IsTaggedTimestamp(const json& value) {
  return value.is_object() && value.size() == 1 && value.contains(kTimestampTag) && value[kTimestampTag].is_string();
}

Error Unsupported(const std::string& key, const std::string& what) {
  return MakeError(ErrorCode::kSnapshotUnsupportedValue,
                   "Property '" + key + "' holds " + what + " (only scalars and lists of scalars are supported)");
}

Expected<ScalarValue, Error> ScalarFromJson(const json& value, const std::string& key) {
  switch (value.type()) {
    case json::value_t::string:
      return ScalarValue(value.get<std::string>());
    case json::value_t::boolean:
      return ScalarValue(value.get<bool>());
    case json::value_t::number_integer:
      return ScalarValue(value.get<int64_t>());
    case json::value_t::number_unsigned: {
      auto unsigned_value = value.get<uint64_t>();
      if (unsigned_value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return MakeUnexpected(MakeError(ErrorCode::kSnapshotUnsupportedValue,
                                        "Property '" + key + "' integer exceeds 64-bit signed range"));
      }
      return ScalarValue(static_cast<int64_t>(unsigned_value));
    }
    case json::value_t::number_float:
      return ScalarValue(value.get<double>());
    case json::value_t::object:
      if (IsTaggedTimestamp(value)) {
        return ScalarValue(Timestamp{value[kTimestampTag].get<std::string>()});
      }
      return MakeUnexpected(Unsupported(key, "a nested map"));
    case json::value_t::null:
      return MakeUnexpected(Unsupported(key, "null"));
    case json::value_t::array:
      return MakeUnexpected(Unsupported(key, "a nested list"));
    default:
      return MakeUnexpected(Unsupported(key, "a binary or discarded value"));
  }
}

}  // namespace

json PropertyValueToJson(const PropertyValue& value) {
  return std::visit(
      [](const auto& alternative) -> json {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, ScalarList>) {
          json array = json::array();
          for (const auto& item : alternative) {
            array.push_back(ScalarToJson(item));
          }
          return array;
        } else if constexpr (std::is_same_v<T, Timestamp>) {
          return json{{kTimestampTag, alternative.iso8601}};
        } else {
          return json(alternative);
        }
      },
      value);
}

Expected<PropertyValue, Error> PropertyValueFromJson(const json& value, const std::string& key) {
  if (value.is_array()) {
    ScalarList list;
    list.reserve(value.size());
    for (const auto& item : value) {
      auto scalar = ScalarFromJson(item, key);
      if (!scalar) {
        return MakeUnexpected(scalar.error());
      }
      // A stored list holds one element type
      if (!list.empty() && scalar->index() != list.front().index()) {
        return MakeUnexpected(Unsupported(key, "a list of mixed element types"));
      }
      list.push_back(std::move(*scalar));
    }
    return PropertyValue(std::move(list));
  }

  auto scalar = ScalarFromJson(value, key);
  if (!scalar) {
    return MakeUnexpected(scalar.error());
  }
  return std::visit([](auto&& alternative) { return PropertyValue(std::forward<decltype(alternative)>(alternative)); },
                    std::move(*scalar));
}

json PropertyMapToJson(const PropertyMap& properties) {
  json object = json::object();
  for (const auto& [key, value] : properties) {
    object[key] = PropertyValueToJson(value);
  }
  return object;
}

Expected<PropertyMap, Error> PropertyMapFromJson(const json& object) {
  if (object.is_null()) {
    return PropertyMap{};
  }
  if (!object.is_object()) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotUnsupportedValue, "Property map must be a JSON object"));
  }

  PropertyMap properties;
  for (const auto& [key, value] : object.items()) {
    auto decoded = PropertyValueFromJson(value, key);
    if (!decoded) {
      return MakeUnexpected(decoded.error());
    }
    properties.emplace(key, std::move(*decoded));
  }
  return properties;
}

}  // namespace graphvault::graph
