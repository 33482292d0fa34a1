#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

#if RESOLVER_DB_SQLITE
#include <sqlite3.h>

#include "internal/db/sqlite/sqlite_db.hpp"
#endif

namespace {

namespace fs = std::filesystem;
using resolver::config::ConfigLoader;
using resolver::model::Record;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string Yaml(const std::string& database, const std::string& export_path, const std::string& mode) {
  return R"(logging:
  level: warn
runtime:
  worker_threads: 2
source:
  repository: {}
database:
)" + database + R"(
persistence:
  write_normalized: true
  write_edges: true
graph_export:
  graph_json_path: ")" + export_path + R"("
  include_masters: true
normalization:
  phone_country_code: "1"
  phone_national_length: 10
blocking:
  rules:
    - name: phone
      parts:
        - field: FIELD_PHONE
    - name: email
      parts:
        - field: FIELD_EMAIL
  catch_all_max_size: 100
  catch_all_overflow: CATCH_ALL_OVERFLOW_WARN
scoring:
  fields:
    - field: FIELD_NAME
      metric: jaro_winkler
      weight: 0.4
    - field: FIELD_EMAIL
      metric: exact
      weight: 0.3
    - field: FIELD_PHONE
      metric: exact
      weight: 0.3
  low_threshold: 0.5
  missing_field_policy: MISSING_FIELD_POLICY_RENORMALIZE
clustering:
  high_threshold: 0.8
  seed: 2024
resolution:
  mode: )" + mode + "\n";
}

Record Make(const std::string& id, const std::string& name, const std::string& email, const std::string& phone) {
  Record record;
  record.id = id;
  record.name = name;
  if (!email.empty()) record.email = email;
  if (!phone.empty()) record.phone = phone;
  return record;
}

std::vector<Record> Customers() {
  auto first = Make("1", "Katherine Johnson", "kj@nasa.gov", "+1 (757) 555-0101");
  first.attributes["source"] = "crm";
  auto second = Make("2", "Katherine G Johnson", "KJ@nasa.gov", "757-555-0101");
  second.attributes["source"] = "billing";
  return {
      first,
      second,
      Make("3", "Kathrine Johnson", "", "7575550101"),
      Make("4", "Dorothy Vaughan", "dv@nasa.gov", "757-555-0199"),
      Make("5", "Mary Jackson", "mj@nasa.gov", ""),
  };
}

void Seed(resolver::db::Repository& repo) {
  auto tx = repo.Begin();
  for (const auto& record : Customers()) assert(repo.InsertRecord(*tx, record));
  tx->Commit();
}

std::string ReadFile(const fs::path& path) {
  std::ifstream     in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

resolver::core::RunResult RunOnce(resolver::factory::Application& app) {
  const auto records = app.source->LoadRecords();
  auto       result  = app.engine->Run(records);
  app.writer->Write(result);
  if (app.exporter) app.exporter->WriteFile(app.export_path, result);
  return result;
}

void TestMergeRunAgainstMemoryRepository() {
  const auto export_path = fs::temp_directory_path() / ("entity_resolver_e2e_" + std::to_string(NowMs()) + ".json");
  auto       config      = ConfigLoader::LoadFromYamlString(Yaml("  memory: {}", export_path.string(), "RESOLUTION_MODE_MERGE"));

  auto app = resolver::factory::Build(config);
  assert(app.source->Name() == "repository");
  Seed(*app.repository);

  const auto result = RunOnce(app);
  assert(result.stats.input_records == 5);
  assert(result.stats.clusters == 1);
  assert(result.clusters.clusters[0].members == (std::vector<std::string>{"1", "2", "3"}));
  assert(result.stats.singletons == 2);

  const auto& master = result.resolution.masters.at(0);
  assert(master.Value(resolver::model::FieldType::kPhone).value == "7575550101");
  assert(master.Value(resolver::model::FieldType::kEmail).value == "kj@nasa.gov");

  // merge: three members collapse into one master record
  auto                  tx = app.repository->Begin();
  std::set<std::string> stored;
  for (const auto& record : app.repository->ListRecords(*tx)) stored.insert(record.id);
  assert(stored == (std::set<std::string>{master.id, "4", "5"}));

  auto merged = app.repository->GetRecord(*tx, master.id);
  assert(merged.has_value());
  assert(merged->attributes.at("source") == "crm");

  assert(app.repository->ListMasterEntities(*tx).size() == 1);
  assert(app.repository->ListAssignments(*tx).size() == 3);
  assert(app.repository->ListEdges(*tx).size() == result.stats.edges);
  auto normalized = app.repository->GetNormalizedValue(*tx, "2", resolver::model::FieldType::kEmail);
  assert(normalized.has_value());
  assert(normalized->value == "kj@nasa.gov");
  tx->Rollback();

  const auto json = ReadFile(export_path);
  assert(json.find("\"MasterEntity\"") != std::string::npos);
  assert(json.find("\"RESOLVES_TO\"") != std::string::npos);
  assert(json.find(master.id) != std::string::npos);
  fs::remove(export_path);
}

void TestLinkRunIsRepeatable() {
  const auto export_path = fs::temp_directory_path() / ("entity_resolver_e2e_link_" + std::to_string(NowMs()) + ".json");
  auto       config      = ConfigLoader::LoadFromYamlString(Yaml("  memory: {}", export_path.string(), "RESOLUTION_MODE_LINK"));

  auto app = resolver::factory::Build(config);
  Seed(*app.repository);

  const auto first  = RunOnce(app);
  const auto second = RunOnce(app);

  // link mode leaves the records in place, so a rerun sees the same input
  assert(second.stats.input_records == 5);
  assert(first.resolution.masters.at(0).id == second.resolution.masters.at(0).id);
  assert(first.graph.EdgeCount() == second.graph.EdgeCount());
  assert(ReadFile(export_path).find("\"SAME_AS\"") != std::string::npos);

  auto tx = app.repository->Begin();
  assert(app.repository->ListRecords(*tx).size() == 5);
  assert(app.repository->ListSameAsLinks(*tx).size() == 3);
  tx->Rollback();

  fs::remove(export_path);
}

void TestInvalidConfigurationFailsBeforeLoading() {
  auto config = ConfigLoader::LoadFromYamlString(Yaml("  memory: {}", "/tmp/unused.json", "RESOLUTION_MODE_MERGE"));
  config.mutable_scoring()->mutable_fields(0)->set_weight(0.9);

  bool threw = false;
  try {
    (void)resolver::factory::Build(config);
  } catch (const resolver::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

#if RESOLVER_DB_SQLITE
int64_t CountRows(const std::string& db_path, const std::string& sql) {
  resolver::db::sqlite::SqliteDB db(db_path, false);
  auto                           st = db.Prepare(sql);
  assert(st.Ok());
  return st.Step() == SQLITE_ROW ? sqlite3_column_int64(st.Get(), 0) : -1;
}

void AssertViewsConsistent(const std::string& db_path) {
  assert(CountRows(db_path, "SELECT COUNT(*) FROM (SELECT Node_ID FROM nodes_view GROUP BY Node_ID HAVING COUNT(*) > 1);") == 0);
  assert(CountRows(db_path,
                   "SELECT COUNT(*) FROM relationships_view r"
                   " WHERE r.Source_ID NOT IN (SELECT Node_ID FROM nodes_view) OR r.Target_ID NOT IN (SELECT Node_ID FROM nodes_view);") == 0);
}

fs::path SqlitePath(const std::string& tag) {
  return fs::temp_directory_path() / ("entity_resolver_e2e_" + tag + "_" + std::to_string(NowMs()) + ".db");
}

void TestMergeRunAgainstSqliteViews() {
  const auto db_path     = SqlitePath("merge");
  const auto export_path = fs::temp_directory_path() / ("entity_resolver_e2e_sqlite_" + std::to_string(NowMs()) + ".json");
  auto       config      = ConfigLoader::LoadFromYamlString(
      Yaml("  sqlite:\n    path: \"" + db_path.string() + "\"\n    wal_mode: false", export_path.string(), "RESOLUTION_MODE_MERGE"));

  {
    auto app = resolver::factory::Build(config);
    Seed(*app.repository);
    const auto result = RunOnce(app);
    assert(result.stats.clusters == 1);
    assert(result.stats.edges >= 3);
  }

  // what the visualization front end queries; the merged record shows up
  // once, as its master, and edges of the removed members are gone
  assert(CountRows(db_path.string(), "SELECT COUNT(*) FROM nodes_view;") == 3);
  assert(CountRows(db_path.string(), "SELECT COUNT(*) FROM nodes_view WHERE Label='Observation';") == 2);
  assert(CountRows(db_path.string(), "SELECT COUNT(*) FROM nodes_view WHERE Label='MasterEntity';") == 1);
  assert(CountRows(db_path.string(), "SELECT COUNT(*) FROM relationships_view;") == 0);
  AssertViewsConsistent(db_path.string());

  // the tables still hold the run for audit
  assert(CountRows(db_path.string(), "SELECT COUNT(*) FROM assignments;") == 3);
  assert(CountRows(db_path.string(), "SELECT COUNT(*) FROM similarity_edges;") >= 3);

  fs::remove(db_path);
  fs::remove(export_path);
}

void TestLinkRunAgainstSqliteViews() {
  const auto db_path     = SqlitePath("link");
  const auto export_path = fs::temp_directory_path() / ("entity_resolver_e2e_sqlite_link_" + std::to_string(NowMs()) + ".json");
  auto       config      = ConfigLoader::LoadFromYamlString(
      Yaml("  sqlite:\n    path: \"" + db_path.string() + "\"\n    wal_mode: false", export_path.string(), "RESOLUTION_MODE_LINK"));

  std::size_t edges = 0;
  {
    auto app = resolver::factory::Build(config);
    Seed(*app.repository);
    edges = RunOnce(app).stats.edges;
  }

  assert(CountRows(db_path.string(), "SELECT COUNT(*) FROM nodes_view WHERE Label='Observation';") == 5);
  assert(CountRows(db_path.string(), "SELECT COUNT(*) FROM nodes_view WHERE Label='MasterEntity';") == 1);
  assert(CountRows(db_path.string(), "SELECT COUNT(*) FROM relationships_view WHERE Relationship_Type='RESOLVES_TO';") == 3);
  assert(CountRows(db_path.string(), "SELECT COUNT(*) FROM relationships_view WHERE Relationship_Type='SAME_AS';") == 3);
  assert(CountRows(db_path.string(), "SELECT COUNT(*) FROM relationships_view WHERE Relationship_Type='SIMILAR_TO';") ==
         static_cast<int64_t>(edges));
  AssertViewsConsistent(db_path.string());

  fs::remove(db_path);
  fs::remove(export_path);
}
#endif

} // namespace

int main() {
  TestMergeRunAgainstMemoryRepository();
  TestLinkRunIsRepeatable();
  TestInvalidConfigurationFailsBeforeLoading();
#if RESOLVER_DB_SQLITE
  TestMergeRunAgainstSqliteViews();
  TestLinkRunAgainstSqliteViews();
#endif

  std::cout << "resolver_integration_end_to_end: pass\n";
  return 0;
}
