#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace resolver::model {

/*
  Typed record schema.

  The set of scored fields is fixed at compile time. Anything else a source
  provides travels in Record::attributes and is never normalized or scored.
*/
enum class FieldType : std::uint8_t {
  kName       = 0,
  kEmail      = 1,
  kPhone      = 2,
  kAddress    = 3,
  kPostalCode = 4,
};

inline constexpr std::size_t kFieldCount = 5;

inline constexpr std::array<FieldType, kFieldCount> kAllFields = {
    FieldType::kName, FieldType::kEmail, FieldType::kPhone, FieldType::kAddress, FieldType::kPostalCode,
};

constexpr std::size_t Index(FieldType field) {
  return static_cast<std::size_t>(field);
}

constexpr std::string_view ToString(FieldType field) {
  switch (field) {
    case FieldType::kName:
      return "name";
    case FieldType::kEmail:
      return "email";
    case FieldType::kPhone:
      return "phone";
    case FieldType::kAddress:
      return "address";
    case FieldType::kPostalCode:
      return "postal_code";
  }
  return "unknown";
}

inline std::optional<FieldType> FieldFromString(std::string_view name) {
  for (auto field : kAllFields) {
    if (ToString(field) == name) return field;
  }
  return std::nullopt;
}

} // namespace resolver::model
