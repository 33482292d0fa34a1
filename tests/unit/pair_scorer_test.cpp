#include "internal/scoring/pair_scorer.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <optional>
#include <string>

#include "internal/normalize/normalizer.hpp"

namespace {

using resolver::config::Metric;
using resolver::config::MissingFieldPolicy;
using resolver::config::ScoringOptions;
using resolver::model::FieldType;
using resolver::model::NormalizedRecord;
using resolver::scoring::PairScorer;

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

ScoringOptions MakeOptions(MissingFieldPolicy policy, double low_threshold = 0.0) {
  ScoringOptions options;
  options.fields = {
      {FieldType::kName, Metric::kJaroWinkler, 0.5},
      {FieldType::kEmail, Metric::kExact, 0.3},
      {FieldType::kPhone, Metric::kExact, 0.2},
  };
  options.low_threshold        = low_threshold;
  options.missing_field_policy = policy;
  return options;
}

NormalizedRecord Make(const std::string& id, std::optional<std::string> name, std::optional<std::string> email, std::optional<std::string> phone) {
  resolver::model::Record record;
  record.id    = id;
  record.name  = std::move(name);
  record.email = std::move(email);
  record.phone = std::move(phone);
  return resolver::normalize::Normalizer().NormalizeRecord(record);
}

void TestIdenticalRecordsScoreOne() {
  const PairScorer scorer(MakeOptions(MissingFieldPolicy::kRenormalize));
  const auto       a = Make("1", "Ann Lee", "ann@x.com", "555");
  const auto       b = Make("2", "ann lee", "ANN@x.com", "5-5-5");

  const auto edge = scorer.Score(a, b);
  assert(Near(edge.score, 1.0));
  assert(edge.FieldScore(FieldType::kName).has_value());
  assert(!edge.FieldScore(FieldType::kAddress).has_value());
}

void TestScoreIsSymmetricAndOrdersIds() {
  const PairScorer scorer(MakeOptions(MissingFieldPolicy::kRenormalize));
  const auto       a = Make("10", "Jonathan Smith", "jon@x.com", "555");
  const auto       b = Make("9", "Jonathon Smyth", "jon@y.com", "555");

  const auto ab = scorer.Score(a, b);
  const auto ba = scorer.Score(b, a);
  assert(ab.left_id == "9");
  assert(ab.right_id == "10");
  assert(ba.left_id == "9");
  assert(ab.score == ba.score);
  for (auto field : resolver::model::kAllFields) assert(ab.FieldScore(field) == ba.FieldScore(field));
}

void TestRenormalizeIgnoresMissingFields() {
  const PairScorer scorer(MakeOptions(MissingFieldPolicy::kRenormalize));
  const auto       a = Make("1", "Ann Lee", std::nullopt, "555");
  const auto       b = Make("2", "Ann Lee", "ann@x.com", "999");

  // name 1.0 * 0.5, phone 0.0 * 0.2, email absent -> (0.5) / (0.7)
  const auto edge = scorer.Score(a, b);
  assert(Near(edge.score, 0.5 / 0.7));
  assert(!edge.FieldScore(FieldType::kEmail).has_value());
  assert(edge.FieldScore(FieldType::kPhone) == 0.0);
}

void TestZeroPolicyCountsMissingFieldsAsZero() {
  const PairScorer scorer(MakeOptions(MissingFieldPolicy::kZero));
  const auto       a = Make("1", "Ann Lee", std::nullopt, "555");
  const auto       b = Make("2", "Ann Lee", "ann@x.com", "999");

  const auto edge = scorer.Score(a, b);
  assert(Near(edge.score, 0.5));
}

void TestNothingInCommonScoresZero() {
  const PairScorer scorer(MakeOptions(MissingFieldPolicy::kRenormalize));
  const auto       a = Make("1", "Ann Lee", std::nullopt, std::nullopt);
  const auto       b = Make("2", std::nullopt, "ann@x.com", std::nullopt);

  assert(scorer.Score(a, b).score == 0.0);
}

void TestLowThresholdFiltersCandidates() {
  const PairScorer scorer(MakeOptions(MissingFieldPolicy::kRenormalize, 0.8));
  const auto       a = Make("1", "Ann Lee", "ann@x.com", "555");
  const auto       b = Make("2", "Ann Lee", "ann@x.com", "555");
  const auto       c = Make("3", "Bob Stone", "bob@x.com", "777");

  assert(scorer.ScoreCandidate(a, b).has_value());
  assert(!scorer.ScoreCandidate(a, c).has_value());
}

} // namespace

int main() {
  TestIdenticalRecordsScoreOne();
  TestScoreIsSymmetricAndOrdersIds();
  TestRenormalizeIgnoresMissingFields();
  TestZeroPolicyCountsMissingFieldsAsZero();
  TestNothingInCommonScoresZero();
  TestLowThresholdFiltersCandidates();

  std::cout << "resolver_unit_pair_scorer: pass\n";
  return 0;
}
