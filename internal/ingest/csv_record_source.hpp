#pragma once

#include <string>

#include "config/config.pb.h"
#include "record_source.hpp"

namespace resolver::ingest {

/*
  CSV file source backed by the Arrow CSV reader.

  Column mapping comes from CsvSourceConfig. An empty column name falls
  back to the field's own name ("id", "name", "email", ...), and such a
  default column may be absent from the file. An explicitly configured
  column that is missing from the header is a ConfigurationError.

  Mapped columns are read as strings so leading zeros in phones and postal
  codes survive. Empty cells are absent values.
*/
class CsvRecordSource final : public RecordSource {
 public:
  explicit CsvRecordSource(resolver::runtime::config::CsvSourceConfig config);

  std::vector<model::Record> LoadRecords() override;

  std::string Name() const override {
    return "csv";
  }

 private:
  resolver::runtime::config::CsvSourceConfig config_;
};

} // namespace resolver::ingest
