#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/config/resolution_config.hpp"
#include "internal/model/record.hpp"

namespace resolver::blocking {

inline constexpr std::string_view kCatchAllKey = "__catch_all__";

/*
  Raised (as a value, not an exception) when the catch-all block grows past
  blocking.catch_all_max_size. Logged and returned with the run result.
*/
struct BlockingExhaustionWarning {
  std::string              block_key;
  std::size_t              block_size = 0;
  std::size_t              limit      = 0;
  config::CatchAllOverflow policy     = config::CatchAllOverflow::kWarn;
  std::string              message;
};

struct CandidateBlock {
  std::string              key;
  std::vector<std::size_t> members; // indexes into the blocked record list, ascending
};

struct BlockingResult {
  std::vector<CandidateBlock>              blocks;  // sorted by key
  std::vector<std::vector<std::string>>    keys_of; // per record, sorted
  std::optional<BlockingExhaustionWarning> warning;
};

/*
  Blocker

  Derives candidate-reduction keys from normalized values. Two records are
  compared only when they share at least one key.
*/
class Blocker {
 public:
  explicit Blocker(config::BlockingOptions options);

  // Sorted, de-duplicated keys. Never empty: falls back to the catch-all key.
  std::vector<std::string> KeysFor(const model::NormalizedRecord& record) const;

  /*
    Groups records by key. records must already be in natural id order;
    member indexes follow that order. seed drives the catch-all sample
    policy.
  */
  BlockingResult Block(const std::vector<model::NormalizedRecord>& records, std::uint64_t seed) const;

 private:
  std::optional<std::string> KeyFor(const config::BlockKeyRule& rule, const model::NormalizedRecord& record) const;

  config::BlockingOptions options_;
};

/*
  True when key is the smallest key both sorted key lists share. A pair that
  shares several blocks is scored only in the first one.
*/
bool IsFirstSharedKey(const std::vector<std::string>& a, const std::vector<std::string>& b, std::string_view key);

} // namespace resolver::blocking
