#pragma once

#include <string>
#include <string_view>

#include "internal/config/resolution_config.hpp"
#include "internal/model/field.hpp"
#include "internal/model/record.hpp"

namespace resolver::normalize {

/*
  Field normalizer.

  Pure function of (field, raw value). Total: every input yields a string,
  possibly empty. Applying Normalize twice gives the same result as once.

  When a field rule strips everything from an input that had visible
  content, the trimmed lowercase input is returned instead so a value is
  never silently lost.
*/
class Normalizer {
 public:
  explicit Normalizer(config::NormalizationOptions options = {});

  std::string Normalize(model::FieldType field, std::string_view raw) const;

  model::NormalizedRecord NormalizeRecord(const model::Record& record) const;

 private:
  std::string NormalizePhone(std::string_view raw) const;

  config::NormalizationOptions options_;
};

std::string NormalizeName(std::string_view raw);
std::string NormalizeEmail(std::string_view raw);
std::string NormalizeAddress(std::string_view raw);
std::string NormalizePostalCode(std::string_view raw);

} // namespace resolver::normalize
