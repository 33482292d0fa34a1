#include "internal/ingest/csv_record_source.hpp"

#include <assert.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;
using resolver::ingest::CsvRecordSource;
using resolver::runtime::config::CsvSourceConfig;

fs::path WriteCsv(const std::string& name, const std::string& content) {
  const auto path = fs::temp_directory_path() / name;
  std::ofstream out(path, std::ios::trunc);
  out << content;
  return path;
}

void TestDefaultColumnsAndStringValues() {
  const auto path = WriteCsv("resolver_csv_defaults.csv",
                             "id,name,phone,postal_code,source,score\n"
                             "007,Ada Lovelace,0123456789,02134,crm,12\n"
                             "8,Charles Babbage,,,erp,\n");

  CsvSourceConfig config;
  config.set_path(path.string());
  config.set_keep_unmapped_columns(true);

  auto records = CsvRecordSource(config).LoadRecords();
  assert(records.size() == 2);

  // leading zeros survive because columns are read as text
  assert(records[0].id == "007");
  assert(records[0].phone == std::optional<std::string>("0123456789"));
  assert(records[0].postal_code == std::optional<std::string>("02134"));
  assert(records[0].name == std::optional<std::string>("Ada Lovelace"));
  // email and address columns are absent from the file
  assert(!records[0].email.has_value());
  assert(!records[0].address.has_value());

  assert(records[0].attributes.at("source") == "crm");
  assert(records[0].attributes.at("score") == "12");

  // empty cells are absent values
  assert(!records[1].phone.has_value());
  assert(!records[1].postal_code.has_value());
  assert(records[1].attributes.at("source") == "erp");
  assert(!records[1].attributes.contains("score"));

  fs::remove(path);
}

void TestAttributesKeepTheirSpelling() {
  const auto path = WriteCsv("resolver_csv_attributes.csv",
                             "id,name,account,amount,ratio\n"
                             "1,Ada Lovelace,0042,1.50,1e3\n"
                             "2,Charles Babbage,0100,2.00,0.5\n");

  CsvSourceConfig config;
  config.set_path(path.string());
  config.set_keep_unmapped_columns(true);

  auto records = CsvRecordSource(config).LoadRecords();
  assert(records.size() == 2);
  assert(records[0].attributes.at("account") == "0042");
  assert(records[0].attributes.at("amount") == "1.50");
  assert(records[0].attributes.at("ratio") == "1e3");
  assert(records[1].attributes.at("account") == "0100");
  assert(records[1].attributes.at("amount") == "2.00");

  fs::remove(path);
}

void TestExplicitMappingAndDelimiter() {
  const auto path = WriteCsv("resolver_csv_mapped.csv",
                             "customer_id;full_name;mail;extra\n"
                             "c-1;Grace Hopper;grace@navy.mil;x\n");

  CsvSourceConfig config;
  config.set_path(path.string());
  config.set_delimiter(";");
  config.set_id_column("customer_id");
  config.set_name_column("full_name");
  config.set_email_column("mail");

  auto records = CsvRecordSource(config).LoadRecords();
  assert(records.size() == 1);
  assert(records[0].id == "c-1");
  assert(records[0].name == std::optional<std::string>("Grace Hopper"));
  assert(records[0].email == std::optional<std::string>("grace@navy.mil"));
  // unmapped columns are dropped unless asked for
  assert(records[0].attributes.empty());

  fs::remove(path);
}

void TestMissingExplicitColumnIsAConfigurationError() {
  const auto path = WriteCsv("resolver_csv_missing.csv", "id,name\n1,Ada\n");

  CsvSourceConfig config;
  config.set_path(path.string());
  config.set_phone_column("telephone");

  bool threw = false;
  try {
    (void)CsvRecordSource(config).LoadRecords();
  } catch (const resolver::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);

  fs::remove(path);
}

void TestRowWithoutIdStillLoads() {
  const auto path = WriteCsv("resolver_csv_no_id.csv", "id,name\n,Nameless\n2,Named\n");

  CsvSourceConfig config;
  config.set_path(path.string());

  // the engine rejects id-less records; the source only reads them
  auto records = CsvRecordSource(config).LoadRecords();
  assert(records.size() == 2);
  assert(records[0].id.empty());
  assert(records[1].id == "2");

  fs::remove(path);
}

void TestInvalidSourceSettings() {
  bool threw = false;
  try {
    CsvRecordSource source{CsvSourceConfig{}};
  } catch (const resolver::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);

  CsvSourceConfig config;
  config.set_path("records.csv");
  config.set_delimiter("||");
  threw = false;
  try {
    CsvRecordSource source(config);
  } catch (const resolver::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);

  config.set_delimiter(",");
  config.set_path("/nonexistent-dir/records.csv");
  threw = false;
  try {
    (void)CsvRecordSource(config).LoadRecords();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaultColumnsAndStringValues();
  TestAttributesKeepTheirSpelling();
  TestExplicitMappingAndDelimiter();
  TestMissingExplicitColumnIsAConfigurationError();
  TestRowWithoutIdStillLoads();
  TestInvalidSourceSettings();

  std::cout << "resolver_unit_csv_record_source: pass\n";
  return 0;
}
