#include "internal/normalize/normalizer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using resolver::model::FieldType;
using resolver::normalize::Normalizer;

Normalizer MakeNormalizer() {
  resolver::config::NormalizationOptions options;
  options.phone_country_code    = "1";
  options.phone_national_length = 10;
  return Normalizer(options);
}

void TestNameDropsHonorificsAndPunctuation() {
  assert(resolver::normalize::NormalizeName("  Dr. John  O'Neil Jr. ") == "john oneil");
  assert(resolver::normalize::NormalizeName("SMITH-JONES, Mary") == "smith jones mary");
  assert(resolver::normalize::NormalizeName("Henry VIII iii") == "henry viii");
}

void TestNameFallsBackWhenOnlyHonorificsRemain() {
  assert(resolver::normalize::NormalizeName(" Mr. ") == "mr.");
  assert(resolver::normalize::NormalizeName("") == "");
}

void TestEmailIsTrimmedAndLowercased() {
  assert(resolver::normalize::NormalizeEmail("  John.Doe+news@Example.COM ") == "john.doe+news@example.com");
}

void TestPhoneKeepsDigitsAndDropsCountryCode() {
  const auto normalizer = MakeNormalizer();
  assert(normalizer.Normalize(FieldType::kPhone, "+1 (555) 123-4567") == "5551234567");
  assert(normalizer.Normalize(FieldType::kPhone, "001 555 123 4567") == "5551234567");
  assert(normalizer.Normalize(FieldType::kPhone, "555.123.4567") == "5551234567");

  // wrong length: the leading 1 is part of the number
  assert(normalizer.Normalize(FieldType::kPhone, "1 555 1234") == "15551234");

  // no digits at all
  assert(normalizer.Normalize(FieldType::kPhone, " EXT ") == "ext");
}

void TestPhoneWithoutCountryCodeConfigKeepsAllDigits() {
  const Normalizer plain;
  assert(plain.Normalize(FieldType::kPhone, "+1 (555) 123-4567") == "15551234567");
}

void TestAddressExpandsAbbreviations() {
  assert(resolver::normalize::NormalizeAddress("12 N. Main St., Apt 4") == "12 north main street apartment 4");
  assert(resolver::normalize::NormalizeAddress("400 Oak Ave  Ste 2B") == "400 oak avenue suite 2b");
  assert(resolver::normalize::NormalizeAddress("9 Elm Blvd SW") == "9 elm boulevard southwest");
}

void TestPostalCodeKeepsAlphanumerics() {
  assert(resolver::normalize::NormalizePostalCode("SW1A 1AA") == "sw1a1aa");
  assert(resolver::normalize::NormalizePostalCode("90210-1234") == "902101234");
}

void TestNormalizationIsIdempotent() {
  const auto                     normalizer = MakeNormalizer();
  const std::vector<std::string> inputs     = {
      "  Dr. John  O'Neil Jr. ", "Mr.", "JOHN.DOE@EXAMPLE.COM ", "+1 (555) 123-4567", "12 N. Main St., Apt 4", "SW1A 1AA", "", "   ", "---", "Ms",
  };

  for (auto field : resolver::model::kAllFields) {
    for (const auto& input : inputs) {
      const auto once  = normalizer.Normalize(field, input);
      const auto twice = normalizer.Normalize(field, once);
      assert(once == twice);
    }
  }
}

void TestNormalizeRecordTracksPresence() {
  const auto normalizer = MakeNormalizer();

  resolver::model::Record record;
  record.id          = "7";
  record.name        = "Jane Doe";
  record.phone       = "   ";
  record.postal_code = "02139";
  record.attributes  = {{"source", "crm"}};

  const auto normalized = normalizer.NormalizeRecord(record);
  assert(normalized.id == "7");
  assert(normalized.Has(FieldType::kName));
  assert(normalized.Value(FieldType::kName) == "jane doe");
  assert(normalized.Field(FieldType::kName).raw == "Jane Doe");

  // whitespace only normalizes to nothing
  assert(!normalized.Has(FieldType::kPhone));
  assert(normalized.Field(FieldType::kPhone).raw == "   ");

  assert(!normalized.Has(FieldType::kEmail));
  assert(normalized.Field(FieldType::kEmail).raw.empty());

  assert(normalized.Value(FieldType::kPostalCode) == "02139");
  assert(normalized.attributes.at("source") == "crm");
}

} // namespace

int main() {
  TestNameDropsHonorificsAndPunctuation();
  TestNameFallsBackWhenOnlyHonorificsRemain();
  TestEmailIsTrimmedAndLowercased();
  TestPhoneKeepsDigitsAndDropsCountryCode();
  TestPhoneWithoutCountryCodeConfigKeepsAllDigits();
  TestAddressExpandsAbbreviations();
  TestPostalCodeKeepsAlphanumerics();
  TestNormalizationIsIdempotent();
  TestNormalizeRecordTracksPresence();

  std::cout << "resolver_unit_normalizer: pass\n";
  return 0;
}
