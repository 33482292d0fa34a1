#include "internal/exporter/graph_exporter.hpp"

#include <assert.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace {

using resolver::config::ResolutionConfig;
using resolver::config::ResolutionMode;
using resolver::core::ResolutionEngine;
using resolver::core::RunResult;
using resolver::exporter::ExportOptions;
using resolver::exporter::GraphExporter;
using resolver::model::FieldType;
using resolver::model::Record;

Record Make(const std::string& id, const std::string& name, const std::string& email) {
  Record record;
  record.id    = id;
  record.name  = name;
  record.email = email;
  return record;
}

RunResult RunSample(ResolutionMode mode) {
  ResolutionConfig config;
  config.blocking.rules              = {{"email", {{FieldType::kEmail, 0}}}};
  config.blocking.catch_all_max_size = 10;
  config.scoring.fields              = {
      {FieldType::kName, resolver::config::Metric::kJaroWinkler, 0.5},
      {FieldType::kEmail, resolver::config::Metric::kExact, 0.5},
  };
  config.scoring.low_threshold     = 0.5;
  config.clustering.high_threshold = 0.8;
  config.clustering.seed           = 11;
  config.mode                      = mode;
  config.worker_threads            = 1;

  auto extra = Make("3", "Lee Wong", "lee@example.org");
  extra.attributes["source"] = "crm";

  return ResolutionEngine(config).Run({
      Make("1", "Grace Hopper", "grace@navy.mil"),
      Make("2", "Grace M Hopper", "GRACE@navy.mil"),
      extra,
  });
}

std::map<std::string, int> LabelCounts(const resolver::v1::GraphElements& elements) {
  std::map<std::string, int> counts;
  for (const auto& node : elements.nodes()) ++counts[node.data().label()];
  for (const auto& edge : elements.edges()) ++counts[edge.data().label()];
  return counts;
}

void TestMergeRunElements() {
  const auto result   = RunSample(ResolutionMode::kMerge);
  const auto elements = GraphExporter(ExportOptions{}).Build(result);

  auto counts = LabelCounts(elements);
  assert(counts["Observation"] == 3);
  assert(counts["MasterEntity"] == 1);
  assert(counts["SIMILAR_TO"] == 1);
  assert(counts["RESOLVES_TO"] == 2);
  assert(counts["SAME_AS"] == 0);

  const auto& master_id = result.resolution.masters.at(0).id;
  for (const auto& node : elements.nodes()) {
    const auto& data = node.data();
    if (data.id() == "1" || data.id() == "2") {
      assert(data.cluster_id() != 0);
      assert(data.master_id() == master_id);
      // observations carry raw values
      assert(data.properties().at("email").find('@') != std::string::npos);
    }
    if (data.id() == "3") {
      assert(data.cluster_id() == 0);
      assert(data.master_id().empty());
      assert(data.properties().at("source") == "crm");
    }
    if (data.label() == "MasterEntity") {
      assert(data.id() == master_id);
      assert(data.properties().at("email") == "grace@navy.mil");
    }
  }

  for (const auto& edge : elements.edges()) {
    const auto& data = edge.data();
    if (data.label() == "SIMILAR_TO") {
      assert(data.source() == "1");
      assert(data.target() == "2");
      assert(data.id() == "SIMILAR_TO:1|2");
      assert(data.field_scores().at("email") == 1.0);
      assert(data.field_scores().count("phone") == 0);
    }
    if (data.label() == "RESOLVES_TO") assert(data.target() == master_id);
  }
}

void TestLinkRunWithoutMasters() {
  const auto result   = RunSample(ResolutionMode::kLink);
  const auto elements = GraphExporter(ExportOptions{false}).Build(result);

  auto counts = LabelCounts(elements);
  assert(counts["Observation"] == 3);
  assert(counts["MasterEntity"] == 0);
  assert(counts["RESOLVES_TO"] == 0);
  assert(counts["SAME_AS"] == 1);
}

void TestJsonFile() {
  const auto result = RunSample(ResolutionMode::kMerge);
  const auto path   = std::filesystem::temp_directory_path() / "resolver_graph_exporter_test.json";

  GraphExporter(ExportOptions{}).WriteFile(path.string(), result);

  std::ifstream     in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  const auto json = buffer.str();
  assert(json.find("\"nodes\"") != std::string::npos);
  assert(json.find("\"edges\"") != std::string::npos);
  assert(json.find("\"cluster_id\"") != std::string::npos);
  assert(json.find("\"field_scores\"") != std::string::npos);
  assert(json.find("SIMILAR_TO:1|2") != std::string::npos);

  std::filesystem::remove(path);
}

void TestUnwritablePathThrows() {
  const auto result = RunSample(ResolutionMode::kLink);
  bool       threw  = false;
  try {
    GraphExporter(ExportOptions{}).WriteFile("/nonexistent-dir/graph.json", result);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMergeRunElements();
  TestLinkRunWithoutMasters();
  TestJsonFile();
  TestUnwritablePathThrows();

  std::cout << "resolver_unit_graph_exporter: pass\n";
  return 0;
}
