#include "csv_record_source.hpp"

#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <arrow/scalar.h>
#include <arrow/table.h>

#include <array>
#include <limits>
#include <optional>
#include <set>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace resolver::ingest {

namespace {

template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

struct ColumnSpec {
  std::string name;
  bool        required = false;
};

ColumnSpec Column(const std::string& configured, std::string_view fallback) {
  if (configured.empty()) return {std::string(fallback), false};
  return {configured, true};
}

// Column index in the table, nullopt when an optional column is absent.
std::optional<int> Resolve(const arrow::Table& table, const ColumnSpec& spec) {
  const int index = table.schema()->GetFieldIndex(spec.name);
  if (index >= 0) return index;
  if (spec.required) throw util::ConfigurationError("csv column '" + spec.name + "' not found in header");
  return std::nullopt;
}

// Header names only; every data row is skipped.
std::vector<std::string> HeaderNames(const std::string& path, arrow::csv::ReadOptions read_options, const arrow::csv::ParseOptions& parse_options) {
  read_options.skip_rows_after_names = std::numeric_limits<int32_t>::max();

  auto input  = Unwrap(arrow::io::ReadableFile::Open(path));
  auto reader = Unwrap(arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options, parse_options,
                                                     arrow::csv::ConvertOptions::Defaults()));
  return Unwrap(reader->Read())->ColumnNames();
}

std::optional<std::string> CellText(const arrow::ChunkedArray& column, int64_t row) {
  auto scalar = Unwrap(column.GetScalar(row));
  if (!scalar->is_valid) return std::nullopt;
  auto text = scalar->ToString();
  if (text.empty()) return std::nullopt;
  return text;
}

} // namespace

CsvRecordSource::CsvRecordSource(resolver::runtime::config::CsvSourceConfig config) : config_(std::move(config)) {
  if (config_.path().empty()) throw util::ConfigurationError("source.csv.path must be set");
  if (config_.delimiter().size() > 1) throw util::ConfigurationError("source.csv.delimiter must be a single character");
}

std::vector<model::Record> CsvRecordSource::LoadRecords() {
  const ColumnSpec id_spec = Column(config_.id_column(), "id");

  std::array<ColumnSpec, model::kFieldCount> field_specs;
  field_specs[model::Index(model::FieldType::kName)]       = Column(config_.name_column(), "name");
  field_specs[model::Index(model::FieldType::kEmail)]      = Column(config_.email_column(), "email");
  field_specs[model::Index(model::FieldType::kPhone)]      = Column(config_.phone_column(), "phone");
  field_specs[model::Index(model::FieldType::kAddress)]    = Column(config_.address_column(), "address");
  field_specs[model::Index(model::FieldType::kPostalCode)] = Column(config_.postal_code_column(), "postal_code");

  auto read_options  = arrow::csv::ReadOptions::Defaults();
  auto parse_options = arrow::csv::ParseOptions::Defaults();
  if (!config_.delimiter().empty()) parse_options.delimiter = config_.delimiter()[0];

  // every column is text, so attributes keep their exact spelling
  auto convert_options                = arrow::csv::ConvertOptions::Defaults();
  convert_options.null_values         = {""};
  convert_options.strings_can_be_null = true;
  for (const auto& name : HeaderNames(config_.path(), read_options, parse_options)) convert_options.column_types[name] = arrow::utf8();

  auto input = Unwrap(arrow::io::ReadableFile::Open(config_.path()));
  auto reader = Unwrap(arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options, parse_options, convert_options));
  auto table  = Unwrap(reader->Read());

  const auto id_index = Resolve(*table, id_spec);
  if (!id_index) throw util::ConfigurationError("csv file '" + config_.path() + "' has no '" + id_spec.name + "' column");

  std::array<std::optional<int>, model::kFieldCount> field_index;
  std::set<int>                                      mapped = {*id_index};
  for (auto field : model::kAllFields) {
    field_index[model::Index(field)] = Resolve(*table, field_specs[model::Index(field)]);
    if (field_index[model::Index(field)]) mapped.insert(*field_index[model::Index(field)]);
  }

  std::vector<model::Record> records;
  records.reserve(static_cast<std::size_t>(table->num_rows()));

  for (int64_t row = 0; row < table->num_rows(); ++row) {
    model::Record record;
    record.id = CellText(*table->column(*id_index), row).value_or("");

    for (auto field : model::kAllFields) {
      if (const auto& index = field_index[model::Index(field)]) {
        model::MutableRawValue(record, field) = CellText(*table->column(*index), row);
      }
    }

    if (config_.keep_unmapped_columns()) {
      for (int c = 0; c < table->num_columns(); ++c) {
        if (mapped.contains(c)) continue;
        if (auto text = CellText(*table->column(c), row)) record.attributes.emplace(table->schema()->field(c)->name(), std::move(*text));
      }
    }

    records.push_back(std::move(record));
  }

  RESOLVER_LOG_INFO("records loaded", {observability::StringField("source", Name()), observability::StringField("path", config_.path()),
                                       observability::IntField("records", static_cast<std::int64_t>(records.size()))});
  return records;
}

} // namespace resolver::ingest
