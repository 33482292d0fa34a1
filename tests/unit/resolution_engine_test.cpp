#include "internal/core/resolution_engine.hpp"

#include <assert.h>

#include <cmath>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using resolver::config::CatchAllOverflow;
using resolver::config::Metric;
using resolver::config::MissingFieldPolicy;
using resolver::config::ResolutionConfig;
using resolver::config::ResolutionMode;
using resolver::core::ResolutionEngine;
using resolver::core::RunResult;
using resolver::model::FieldType;
using resolver::model::Record;

Record Make(const std::string& id, std::optional<std::string> name, std::optional<std::string> phone = std::nullopt,
            std::optional<std::string> postal = std::nullopt, std::optional<std::string> address = std::nullopt) {
  Record record;
  record.id          = id;
  record.name        = std::move(name);
  record.phone       = std::move(phone);
  record.postal_code = std::move(postal);
  record.address     = std::move(address);
  return record;
}

// phone + postal blocking, name-heavy scoring
ResolutionConfig PhonePostalConfig(ResolutionMode mode) {
  ResolutionConfig config;
  config.normalization.phone_country_code    = "1";
  config.normalization.phone_national_length = 10;

  config.blocking.rules              = {{"phone_postal", {{FieldType::kPhone, 0}, {FieldType::kPostalCode, 0}}}};
  config.blocking.catch_all_max_size = 10;
  config.blocking.catch_all_overflow = CatchAllOverflow::kWarn;

  config.scoring.fields = {
      {FieldType::kName, Metric::kJaroWinkler, 0.4},
      {FieldType::kPhone, Metric::kExact, 0.3},
      {FieldType::kPostalCode, Metric::kExact, 0.3},
  };
  config.scoring.low_threshold        = 0.5;
  config.scoring.missing_field_policy = MissingFieldPolicy::kRenormalize;

  config.clustering.high_threshold = 0.85;
  config.clustering.seed           = 42;
  config.mode                      = mode;
  config.worker_threads            = 2;
  return config;
}

std::vector<Record> SmithVariants() {
  return {
      Make("1", "Jonathan Smith", "555-123-4567", "90210"),  Make("2", "Jonathan Smith", "(555) 123 4567", "90210"),
      Make("3", "Jonathon Smith", "555.123.4567", "90210"),  Make("4", "Jonathan Smyth", "5551234567", "90210"),
      Make("5", "Jonathn Smith", "+1 555 123 4567", "90210"),
  };
}

std::set<std::string> Ids(const std::vector<Record>& records) {
  std::set<std::string> out;
  for (const auto& record : records) out.insert(record.id);
  return out;
}

void TestSpellingVariantsCollapseIntoOneMaster() {
  ResolutionEngine engine(PhonePostalConfig(ResolutionMode::kMerge));
  const auto       result = engine.Run(SmithVariants());

  assert(result.stats.input_records == 5);
  assert(result.stats.accepted_records == 5);
  assert(result.stats.comparisons == 10);
  assert(result.stats.edges == 10);
  assert(result.clusters.clusters.size() == 1);
  assert(result.clusters.clusters[0].members == (std::vector<std::string>{"1", "2", "3", "4", "5"}));
  assert(result.clusters.singletons.empty());

  assert(result.resolution.masters.size() == 1);
  const auto& master = result.resolution.masters[0];
  assert(master.Value(FieldType::kName).value == "jonathan smith");
  assert(master.Value(FieldType::kName).representative == "Jonathan Smith");
  assert(master.Value(FieldType::kPhone).value == "5551234567");
  assert(master.Value(FieldType::kPostalCode).value == "90210");
  assert(master.member_ids.size() == 5);

  // one merged record replaces the five inputs
  assert(result.resolution.resolved_records.size() == 1);
  assert(result.resolution.resolved_records[0].id == master.id);
  assert(result.resolution.discarded_ids.size() == 5);
  assert(result.resolution.assignments.size() == 5);
  for (const auto& assignment : result.resolution.assignments) assert(assignment.master_id == master.id);
}

void TestUnrelatedRecordsStaySingletons() {
  const std::vector<Record> records = {
      Make("1", "Maria Garcia", "555-000-1111", "10001"),
      Make("2", "Maria Garcia", "555-999-2222", "94105"),
  };

  {
    ResolutionEngine engine(PhonePostalConfig(ResolutionMode::kMerge));
    const auto       result = engine.Run(records);
    assert(result.stats.comparisons == 0);
    assert(result.stats.edges == 0);
    assert(result.clusters.clusters.empty());
    assert(result.clusters.singletons == (std::vector<std::string>{"1", "2"}));
    assert(result.resolution.masters.empty());
    assert(Ids(result.resolution.resolved_records) == (std::set<std::string>{"1", "2"}));
  }

  {
    auto config                          = PhonePostalConfig(ResolutionMode::kMerge);
    config.clustering.promote_singletons = true;
    ResolutionEngine engine(config);
    const auto       result = engine.Run(records);
    assert(result.clusters.clusters.size() == 2);
    assert(result.resolution.masters.size() == 2);
    assert(result.resolution.resolved_records.size() == 2);
  }
}

/*
  Four records in one postal block. No pair is close to certain, yet the
  group is dense enough that modularity keeps it together:

      1-2 .583  1-3 .417  1-4 .667  2-3 .333  2-4 .583  3-4 .417
*/
ResolutionConfig PostalConfig() {
  ResolutionConfig config;
  config.blocking.rules              = {{"postal", {{FieldType::kPostalCode, 0}}}};
  config.blocking.catch_all_max_size = 10;
  config.blocking.catch_all_overflow = CatchAllOverflow::kWarn;

  config.scoring.fields = {
      {FieldType::kName, Metric::kTokenJaccard, 0.5},
      {FieldType::kPhone, Metric::kExact, 0.25},
      {FieldType::kAddress, Metric::kTokenJaccard, 0.25},
  };
  config.scoring.low_threshold        = 0.3;
  config.scoring.missing_field_policy = MissingFieldPolicy::kZero;

  config.clustering.high_threshold = 0.4;
  config.clustering.seed           = 7;
  config.mode                      = ResolutionMode::kLink;
  config.worker_threads            = 1;
  return config;
}

std::vector<Record> PetrovaFamily() {
  return {
      Make("r1", "Anna Petrova", "5550001", "10001", "1 Elm Street"),
      Make("r2", "Anna Petrova Ivanova", "5550001", "10001", "9 Oak Road"),
      Make("r3", "Petrova Ivanova", "5550002", "10001", "1 Elm Street"),
      Make("r4", "Anna Ivanova", "5550001", "10001", "1 Elm Street"),
  };
}

void TestCommunityWithoutStrongEdges() {
  ResolutionEngine engine(PostalConfig());
  const auto       result = engine.Run(PetrovaFamily());

  assert(result.stats.edges == 6);
  for (const auto& edge : result.graph.AllEdges()) assert(edge.score < 0.9);

  const auto* edge = result.graph.Edge("r1", "r4");
  assert(edge != nullptr);
  assert(std::fabs(edge->score - 2.0 / 3.0) < 1e-9);

  assert(result.clusters.clusters.size() == 1);
  assert(result.clusters.clusters[0].members.size() == 4);
  assert(result.clusters.singletons.empty());
}

/*
  Five records whose names overlap only with their neighbours in the chain:

      r1-r2 .70  r2-r3 .70  r3-r4 .70  r4-r5 .70
      r1-r3 .52  r2-r4 .52  r3-r5 .52

  r1 and r5 share no edge and no pair is an obvious match.
*/
ResolutionConfig ChainConfig() {
  ResolutionConfig config;
  config.blocking.rules              = {{"postal", {{FieldType::kPostalCode, 0}}}};
  config.blocking.catch_all_max_size = 10;
  config.blocking.catch_all_overflow = CatchAllOverflow::kWarn;

  config.scoring.fields = {
      {FieldType::kName, Metric::kTokenJaccard, 0.6},
      {FieldType::kPostalCode, Metric::kExact, 0.4},
  };
  config.scoring.low_threshold        = 0.45;
  config.scoring.missing_field_policy = MissingFieldPolicy::kZero;

  config.clustering.high_threshold = 0.5;
  config.clustering.seed           = 42;
  config.mode                      = ResolutionMode::kMerge;
  config.worker_threads            = 1;
  return config;
}

std::vector<Record> ChainedFamily() {
  return {
      Make("r1", "Anna Maria Petrova", std::nullopt, "10001"),
      Make("r2", "Maria Petrova Ivanova", std::nullopt, "10001"),
      Make("r3", "Petrova Ivanova Sokolova", std::nullopt, "10001"),
      Make("r4", "Ivanova Sokolova Orlova", std::nullopt, "10001"),
      Make("r5", "Sokolova Orlova Volkova", std::nullopt, "10001"),
  };
}

void TestChainedFamilyBecomesOneCluster() {
  ResolutionEngine engine(ChainConfig());
  const auto       result = engine.Run(ChainedFamily());

  assert(result.stats.comparisons == 10);
  assert(result.stats.edges == 7);
  assert(result.graph.Edge("r1", "r5") == nullptr);
  assert(result.graph.Edge("r1", "r4") == nullptr);
  assert(result.graph.Edge("r2", "r5") == nullptr);

  // matching pair by pair at a confident level links nothing
  std::size_t confident = 0;
  for (const auto& edge : result.graph.AllEdges()) {
    if (edge.score >= 0.9) ++confident;
  }
  assert(confident == 0);

  assert(result.clusters.clusters.size() == 1);
  assert(result.clusters.clusters[0].members == (std::vector<std::string>{"r1", "r2", "r3", "r4", "r5"}));
  assert(result.clusters.singletons.empty());
  assert(result.resolution.masters.size() == 1);
  assert(result.resolution.masters[0].member_ids.size() == 5);
  assert(result.resolution.resolved_records.size() == 1);
}

void TestHigherResolutionSplitsTheChain() {
  auto config                          = ChainConfig();
  config.clustering.louvain_resolution = 1.0;
  ResolutionEngine engine(config);

  const auto result = engine.Run(ChainedFamily());
  assert(result.clusters.clusters.size() == 2);
  assert(result.clusters.clusters[0].members == (std::vector<std::string>{"r1", "r2", "r3"}));
  assert(result.clusters.clusters[1].members == (std::vector<std::string>{"r4", "r5"}));
}

void TestLinkModeKeepsEveryRecord() {
  ResolutionEngine engine(PhonePostalConfig(ResolutionMode::kLink));
  auto             records = SmithVariants();
  records.push_back(Make("6", "Somebody Else", "555-777-8888", "60601"));
  const auto result = engine.Run(records);

  assert(result.resolution.resolved_records.size() == 6);
  assert(Ids(result.resolution.resolved_records) == Ids(records));
  assert(result.resolution.discarded_ids.empty());
  // C(5, 2) links inside the one cluster
  assert(result.resolution.same_as_links.size() == 10);
  assert(result.resolution.assignments.size() == 5);
}

void TestMergeCountsClustersPlusSingletons() {
  ResolutionEngine engine(PhonePostalConfig(ResolutionMode::kMerge));
  auto             records = SmithVariants();
  records.push_back(Make("6", "Somebody Else", "555-777-8888", "60601"));
  records.push_back(Make("7", "Another Person", "555-777-9999", "60601"));
  const auto result = engine.Run(records);

  assert(result.resolution.resolved_records.size() == result.stats.clusters + result.stats.singletons);
  assert(result.resolution.resolved_records.size() == 3);
}

void TestRunsAreReproducible() {
  auto config = PostalConfig();
  config.worker_threads = 4;

  ResolutionEngine engine(config);
  const auto       first  = engine.Run(PetrovaFamily());
  const auto       second = engine.Run(PetrovaFamily());

  assert(first.clusters.clusters.size() == second.clusters.clusters.size());
  for (std::size_t i = 0; i < first.clusters.clusters.size(); ++i) {
    assert(first.clusters.clusters[i].members == second.clusters.clusters[i].members);
  }
  assert(first.resolution.masters.size() == second.resolution.masters.size());
  for (std::size_t i = 0; i < first.resolution.masters.size(); ++i) {
    assert(first.resolution.masters[i].id == second.resolution.masters[i].id);
  }

  const auto a = first.graph.AllEdges();
  const auto b = second.graph.AllEdges();
  assert(a.size() == b.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    assert(a[i].left_id == b[i].left_id);
    assert(a[i].right_id == b[i].right_id);
    assert(a[i].score == b[i].score);
  }
}

void TestMalformedRecordsAreRejectedNotFatal() {
  ResolutionEngine engine(PhonePostalConfig(ResolutionMode::kMerge));
  auto             records = SmithVariants();
  records.insert(records.begin() + 1, Make("", "No Id", "5551234567", "90210"));
  records.push_back(Make("3", "Duplicate Three", "5551234567", "90210"));
  const auto result = engine.Run(records);

  assert(result.stats.input_records == 7);
  assert(result.stats.accepted_records == 5);
  assert(result.rejections.size() == 2);
  assert(result.rejections[0].position == 1);
  assert(result.rejections[0].record_id.empty());
  assert(result.rejections[1].position == 6);
  assert(result.rejections[1].record_id == "3");

  // the first record with id 3 survives
  bool found = false;
  for (const auto& record : result.records) {
    if (record.id == "3") {
      assert(record.name == std::optional<std::string>("Jonathon Smith"));
      found = true;
    }
  }
  assert(found);
}

void TestCatchAllOverflowIsReported() {
  auto config                          = PhonePostalConfig(ResolutionMode::kLink);
  config.blocking.catch_all_max_size   = 1;
  config.blocking.catch_all_overflow   = CatchAllOverflow::kWarn;
  ResolutionEngine engine(config);

  // neither record has a phone, so both land in the catch-all block
  const auto result = engine.Run({Make("1", "Kim Park", std::nullopt, "30301"), Make("2", "Kim Park", std::nullopt, "30301")});
  assert(result.warnings.size() == 1);
  assert(result.warnings[0].block_size == 2);
  assert(result.warnings[0].limit == 1);
  // warn still compares the block
  assert(result.stats.comparisons == 1);
}

void TestVerifiedClusteringRuns() {
  auto config                          = PostalConfig();
  config.clustering.verify_determinism = true;
  config.clustering.verification_runs  = 3;
  ResolutionEngine engine(config);

  const auto result = engine.Run(PetrovaFamily());
  assert(result.clusters.clusters.size() == 1);
}

void TestInvalidConfigFailsBeforeAnyRecord() {
  auto config                        = PhonePostalConfig(ResolutionMode::kMerge);
  config.scoring.fields[0].weight    = 0.9;

  bool threw = false;
  try {
    ResolutionEngine engine(config);
  } catch (const resolver::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyInput() {
  ResolutionEngine engine(PhonePostalConfig(ResolutionMode::kMerge));
  const auto       result = engine.Run({});
  assert(result.stats.input_records == 0);
  assert(result.graph.NodeCount() == 0);
  assert(result.clusters.clusters.empty());
  assert(result.resolution.resolved_records.empty());
}

} // namespace

int main() {
  TestSpellingVariantsCollapseIntoOneMaster();
  TestUnrelatedRecordsStaySingletons();
  TestCommunityWithoutStrongEdges();
  TestChainedFamilyBecomesOneCluster();
  TestHigherResolutionSplitsTheChain();
  TestLinkModeKeepsEveryRecord();
  TestMergeCountsClustersPlusSingletons();
  TestRunsAreReproducible();
  TestMalformedRecordsAreRejectedNotFatal();
  TestCatchAllOverflowIsReported();
  TestVerifiedClusteringRuns();
  TestInvalidConfigFailsBeforeAnyRecord();
  TestEmptyInput();

  std::cout << "resolver_unit_resolution_engine: pass\n";
  return 0;
}
