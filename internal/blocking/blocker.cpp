#include "blocker.hpp"

#include <algorithm>
#include <map>
#include <random>

#include "internal/observability/logging.hpp"

namespace resolver::blocking {

namespace {

std::string_view PolicyName(config::CatchAllOverflow policy) {
  switch (policy) {
    case config::CatchAllOverflow::kWarn:
      return "warn";
    case config::CatchAllOverflow::kSkip:
      return "skip";
    case config::CatchAllOverflow::kSample:
      return "sample";
  }
  return "unknown";
}

std::vector<std::size_t> SampleMembers(const std::vector<std::size_t>& members, std::size_t limit, std::uint64_t seed) {
  std::vector<std::size_t> shuffled = members;
  std::mt19937_64          rng(seed);
  for (std::size_t i = shuffled.size(); i > 1; --i) {
    const std::size_t j = static_cast<std::size_t>(rng() % i);
    std::swap(shuffled[i - 1], shuffled[j]);
  }
  shuffled.resize(limit);
  std::sort(shuffled.begin(), shuffled.end());
  return shuffled;
}

} // namespace

Blocker::Blocker(config::BlockingOptions options) : options_(std::move(options)) {
}

std::optional<std::string> Blocker::KeyFor(const config::BlockKeyRule& rule, const model::NormalizedRecord& record) const {
  std::string key = rule.name;
  key.push_back(':');
  bool first = true;
  for (const auto& part : rule.parts) {
    if (!record.Has(part.field)) return std::nullopt;

    const auto& value = record.Value(part.field);
    if (!first) key.push_back('|');
    first = false;
    if (part.prefix_length == 0 || part.prefix_length >= value.size()) {
      key += value;
    } else {
      key.append(value, 0, part.prefix_length);
    }
  }
  return key;
}

std::vector<std::string> Blocker::KeysFor(const model::NormalizedRecord& record) const {
  std::vector<std::string> keys;
  for (const auto& rule : options_.rules) {
    if (auto key = KeyFor(rule, record)) keys.push_back(std::move(*key));
  }
  std::sort(keys.begin(), keys.end());
  keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

  if (keys.empty()) keys.emplace_back(kCatchAllKey);
  return keys;
}

BlockingResult Blocker::Block(const std::vector<model::NormalizedRecord>& records, std::uint64_t seed) const {
  BlockingResult result;
  result.keys_of.reserve(records.size());

  std::map<std::string, std::vector<std::size_t>> grouped;
  for (std::size_t i = 0; i < records.size(); ++i) {
    auto keys = KeysFor(records[i]);
    for (const auto& key : keys) grouped[key].push_back(i);
    result.keys_of.push_back(std::move(keys));
  }

  for (auto& [key, members] : grouped) {
    if (key == kCatchAllKey && members.size() > options_.catch_all_max_size) {
      BlockingExhaustionWarning warning;
      warning.block_key  = key;
      warning.block_size = members.size();
      warning.limit      = options_.catch_all_max_size;
      warning.policy     = options_.catch_all_overflow;
      warning.message    = "catch-all block holds " + std::to_string(members.size()) + " records, above the limit of " +
                        std::to_string(options_.catch_all_max_size) + "; overflow policy " + std::string(PolicyName(warning.policy));

      RESOLVER_LOG_WARN("blocking exhaustion",
                        {observability::StringField("block", key), observability::IntField("size", static_cast<std::int64_t>(members.size())),
                         observability::IntField("limit", static_cast<std::int64_t>(options_.catch_all_max_size)),
                         observability::StringField("policy", PolicyName(warning.policy))});
      result.warning = std::move(warning);

      if (options_.catch_all_overflow == config::CatchAllOverflow::kSkip) {
        continue;
      }
      if (options_.catch_all_overflow == config::CatchAllOverflow::kSample) {
        members = SampleMembers(members, options_.catch_all_max_size, seed);
      }
    }
    result.blocks.push_back(CandidateBlock{key, std::move(members)});
  }
  return result;
}

bool IsFirstSharedKey(const std::vector<std::string>& a, const std::vector<std::string>& b, std::string_view key) {
  auto ia = a.begin();
  auto ib = b.begin();
  while (ia != a.end() && ib != b.end()) {
    if (*ia < *ib) {
      ++ia;
    } else if (*ib < *ia) {
      ++ib;
    } else {
      return *ia == key;
    }
  }
  return false;
}

} // namespace resolver::blocking
