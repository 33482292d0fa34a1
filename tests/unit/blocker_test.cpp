#include "internal/blocking/blocker.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/normalize/normalizer.hpp"

namespace {

using resolver::blocking::Blocker;
using resolver::blocking::kCatchAllKey;
using resolver::config::BlockingOptions;
using resolver::config::CatchAllOverflow;
using resolver::model::FieldType;
using resolver::model::NormalizedRecord;

BlockingOptions MakeOptions(std::size_t catch_all_max_size, CatchAllOverflow overflow) {
  BlockingOptions options;
  options.rules = {
      {"phone", {{FieldType::kPhone, 0}}},
      {"pn", {{FieldType::kPostalCode, 0}, {FieldType::kName, 2}}},
  };
  options.catch_all_max_size = catch_all_max_size;
  options.catch_all_overflow = overflow;
  return options;
}

NormalizedRecord Make(const std::string& id, std::optional<std::string> name, std::optional<std::string> phone, std::optional<std::string> postal) {
  resolver::model::Record record;
  record.id          = id;
  record.name        = std::move(name);
  record.phone       = std::move(phone);
  record.postal_code = std::move(postal);
  return resolver::normalize::Normalizer().NormalizeRecord(record);
}

void TestKeysAreSortedAndPrefixed() {
  const Blocker blocker(MakeOptions(10, CatchAllOverflow::kWarn));

  const auto keys = blocker.KeysFor(Make("1", "John Smith", "555-1234", "90210"));
  assert(keys.size() == 2);
  assert(keys[0] == "phone:5551234");
  assert(keys[1] == "pn:90210|jo");
}

void TestRuleNeedsEveryPart() {
  const Blocker blocker(MakeOptions(10, CatchAllOverflow::kWarn));

  const auto keys = blocker.KeysFor(Make("1", std::nullopt, "555-1234", "90210"));
  assert(keys.size() == 1);
  assert(keys[0] == "phone:5551234");
}

void TestRecordWithoutKeyGoesToCatchAll() {
  const Blocker blocker(MakeOptions(10, CatchAllOverflow::kWarn));

  const auto keys = blocker.KeysFor(Make("1", "John", std::nullopt, std::nullopt));
  assert(keys.size() == 1);
  assert(keys[0] == kCatchAllKey);
}

void TestBlocksGroupRecordsByKey() {
  const Blocker blocker(MakeOptions(10, CatchAllOverflow::kWarn));

  const std::vector<NormalizedRecord> records = {
      Make("1", "John Smith", "5551234", "90210"),
      Make("2", "Jon Smith", "5551234", std::nullopt),
      Make("3", "Anna", std::nullopt, std::nullopt),
      Make("4", "Joanna Smith", std::nullopt, "90210"),
      Make("5", "Bob", std::nullopt, std::nullopt),
  };
  const auto result = blocker.Block(records, 7);

  assert(!result.warning.has_value());
  assert(result.keys_of.size() == records.size());
  assert(result.blocks.size() == 3);

  assert(result.blocks[0].key == kCatchAllKey);
  assert((result.blocks[0].members == std::vector<std::size_t>{2, 4}));
  assert(result.blocks[1].key == "phone:5551234");
  assert((result.blocks[1].members == std::vector<std::size_t>{0, 1}));
  assert(result.blocks[2].key == "pn:90210|jo");
  assert((result.blocks[2].members == std::vector<std::size_t>{0, 3}));
}

void TestEveryPairSharingAKeyLandsInACommonBlock() {
  const Blocker blocker(MakeOptions(10, CatchAllOverflow::kWarn));

  const std::vector<NormalizedRecord> records = {
      Make("1", "John Smith", "5551234", "90210"), Make("2", "Jon Smith", "5551234", "10001"), Make("3", "Joe", "5559999", "90210"),
      Make("4", "Jo", std::nullopt, "90210"),      Make("5", "Al", std::nullopt, std::nullopt), Make("6", "Bo", std::nullopt, std::nullopt),
  };
  const auto result = blocker.Block(records, 7);

  std::set<std::pair<std::size_t, std::size_t>> covered;
  for (const auto& block : result.blocks) {
    for (std::size_t i = 0; i < block.members.size(); ++i) {
      for (std::size_t j = i + 1; j < block.members.size(); ++j) covered.insert({block.members[i], block.members[j]});
    }
  }

  for (std::size_t a = 0; a < records.size(); ++a) {
    for (std::size_t b = a + 1; b < records.size(); ++b) {
      const auto& ka     = result.keys_of[a];
      const auto& kb     = result.keys_of[b];
      const bool  shared = std::any_of(ka.begin(), ka.end(), [&](const auto& k) { return std::find(kb.begin(), kb.end(), k) != kb.end(); });
      if (shared) assert(covered.contains({a, b}));
    }
  }
}

void TestFirstSharedKey() {
  const std::vector<std::string> a = {"a", "b", "c"};
  const std::vector<std::string> b = {"b", "c"};
  assert(resolver::blocking::IsFirstSharedKey(a, b, "b"));
  assert(!resolver::blocking::IsFirstSharedKey(a, b, "c"));
  assert(!resolver::blocking::IsFirstSharedKey(a, {"d"}, "a"));
}

std::vector<NormalizedRecord> KeylessRecords(std::size_t n) {
  std::vector<NormalizedRecord> records;
  for (std::size_t i = 0; i < n; ++i) records.push_back(Make(std::to_string(i + 1), "Name " + std::to_string(i), std::nullopt, std::nullopt));
  return records;
}

void TestCatchAllOverflowWarnComparesEverything() {
  const Blocker blocker(MakeOptions(3, CatchAllOverflow::kWarn));
  const auto    result = blocker.Block(KeylessRecords(5), 7);

  assert(result.warning.has_value());
  assert(result.warning->block_key == kCatchAllKey);
  assert(result.warning->block_size == 5);
  assert(result.warning->limit == 3);
  assert(result.warning->policy == CatchAllOverflow::kWarn);
  assert(result.blocks.size() == 1);
  assert(result.blocks[0].members.size() == 5);
}

void TestCatchAllOverflowSkipDropsTheBlock() {
  const Blocker blocker(MakeOptions(3, CatchAllOverflow::kSkip));
  const auto    result = blocker.Block(KeylessRecords(5), 7);

  assert(result.warning.has_value());
  assert(result.blocks.empty());
}

void TestCatchAllOverflowSampleIsSeeded() {
  const Blocker blocker(MakeOptions(3, CatchAllOverflow::kSample));
  const auto    first  = blocker.Block(KeylessRecords(8), 11);
  const auto    second = blocker.Block(KeylessRecords(8), 11);

  assert(first.warning.has_value());
  assert(first.blocks.size() == 1);
  assert(first.blocks[0].members.size() == 3);
  assert(std::is_sorted(first.blocks[0].members.begin(), first.blocks[0].members.end()));
  assert(first.blocks[0].members == second.blocks[0].members);
}

void TestCatchAllAtLimitIsNotAWarning() {
  const Blocker blocker(MakeOptions(5, CatchAllOverflow::kSkip));
  const auto    result = blocker.Block(KeylessRecords(5), 7);

  assert(!result.warning.has_value());
  assert(result.blocks.size() == 1);
}

} // namespace

int main() {
  TestKeysAreSortedAndPrefixed();
  TestRuleNeedsEveryPart();
  TestRecordWithoutKeyGoesToCatchAll();
  TestBlocksGroupRecordsByKey();
  TestEveryPairSharingAKeyLandsInACommonBlock();
  TestFirstSharedKey();
  TestCatchAllOverflowWarnComparesEverything();
  TestCatchAllOverflowSkipDropsTheBlock();
  TestCatchAllOverflowSampleIsSeeded();
  TestCatchAllAtLimitIsNotAWarning();

  std::cout << "resolver_unit_blocker: pass\n";
  return 0;
}
