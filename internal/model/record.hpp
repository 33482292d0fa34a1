#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>

#include "internal/model/field.hpp"

namespace resolver::model {

/*
  Raw input record.

  Immutable once ingested. The id is the only structural requirement;
  every typed field is optional.

  attributes is the extension point for source columns outside the typed
  schema. They are carried to the output untouched.
*/
struct Record {
  std::string id;

  std::optional<std::string> name;
  std::optional<std::string> email;
  std::optional<std::string> phone;
  std::optional<std::string> address;
  std::optional<std::string> postal_code;

  std::map<std::string, std::string> attributes;
};

inline const std::optional<std::string>& RawValue(const Record& record, FieldType field) {
  switch (field) {
    case FieldType::kName:
      return record.name;
    case FieldType::kEmail:
      return record.email;
    case FieldType::kPhone:
      return record.phone;
    case FieldType::kAddress:
      return record.address;
    case FieldType::kPostalCode:
    default:
      return record.postal_code;
  }
}

inline std::optional<std::string>& MutableRawValue(Record& record, FieldType field) {
  switch (field) {
    case FieldType::kName:
      return record.name;
    case FieldType::kEmail:
      return record.email;
    case FieldType::kPhone:
      return record.phone;
    case FieldType::kAddress:
      return record.address;
    case FieldType::kPostalCode:
    default:
      return record.postal_code;
  }
}

struct NormalizedField {
  std::string raw;
  std::string value;

  // false when the raw value was absent or normalized to an empty string
  bool present = false;
};

/*
  Normalized view of a Record.

  Derived deterministically from the raw values; the source record is
  referenced by id only.
*/
struct NormalizedRecord {
  std::string                                 id;
  std::array<NormalizedField, kFieldCount>    fields;
  std::map<std::string, std::string>          attributes;

  const NormalizedField& Field(FieldType field) const {
    return fields[Index(field)];
  }

  NormalizedField& MutableField(FieldType field) {
    return fields[Index(field)];
  }

  const std::string& Value(FieldType field) const {
    return fields[Index(field)].value;
  }

  bool Has(FieldType field) const {
    return fields[Index(field)].present;
  }
};

} // namespace resolver::model
