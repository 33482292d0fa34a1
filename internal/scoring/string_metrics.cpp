#include "string_metrics.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace resolver::scoring {

namespace {

constexpr double      kWinklerScale     = 0.1;
constexpr std::size_t kWinklerPrefixMax = 4;

std::set<std::string_view> TokenSet(std::string_view text) {
  std::set<std::string_view> tokens;
  std::size_t                pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && text[pos] == ' ') ++pos;
    const std::size_t start = pos;
    while (pos < text.size() && text[pos] != ' ') ++pos;
    if (pos > start) tokens.insert(text.substr(start, pos - start));
  }
  return tokens;
}

} // namespace

std::size_t LevenshteinDistance(std::string_view a, std::string_view b) {
  const std::size_t m = a.size();
  const std::size_t n = b.size();

  if (m == 0) return n;
  if (n == 0) return m;

  // two rows
  std::vector<std::size_t> prev(n + 1);
  std::vector<std::size_t> curr(n + 1);
  for (std::size_t j = 0; j <= n; ++j) prev[j] = j;

  for (std::size_t i = 1; i <= m; ++i) {
    curr[0] = i;
    for (std::size_t j = 1; j <= n; ++j) {
      const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      curr[j]                = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, curr);
  }
  return prev[n];
}

double LevenshteinSimilarity(std::string_view a, std::string_view b) {
  const std::size_t max_len = std::max(a.size(), b.size());
  if (max_len == 0) return 1.0;
  return 1.0 - static_cast<double>(LevenshteinDistance(a, b)) / static_cast<double>(max_len);
}

double JaroSimilarity(std::string_view a, std::string_view b) {
  if (a.empty() && b.empty()) return 1.0;
  if (a.empty() || b.empty()) return 0.0;

  const std::size_t window = std::max<std::size_t>(std::max(a.size(), b.size()) / 2, 1) - 1;

  std::vector<bool> a_matched(a.size(), false);
  std::vector<bool> b_matched(b.size(), false);
  std::size_t       matches = 0;

  for (std::size_t i = 0; i < a.size(); ++i) {
    const std::size_t lo = i > window ? i - window : 0;
    const std::size_t hi = std::min(i + window + 1, b.size());
    for (std::size_t j = lo; j < hi; ++j) {
      if (b_matched[j] || a[i] != b[j]) continue;
      a_matched[i] = true;
      b_matched[j] = true;
      ++matches;
      break;
    }
  }
  if (matches == 0) return 0.0;

  std::size_t transpositions = 0;
  std::size_t k              = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!a_matched[i]) continue;
    while (!b_matched[k]) ++k;
    if (a[i] != b[k]) ++transpositions;
    ++k;
  }

  const double m = static_cast<double>(matches);
  const double t = static_cast<double>(transpositions) / 2.0;
  return (m / static_cast<double>(a.size()) + m / static_cast<double>(b.size()) + (m - t) / m) / 3.0;
}

double JaroWinklerSimilarity(std::string_view a, std::string_view b) {
  const double jaro = JaroSimilarity(a, b);

  std::size_t prefix = 0;
  const auto  limit  = std::min({a.size(), b.size(), kWinklerPrefixMax});
  while (prefix < limit && a[prefix] == b[prefix]) ++prefix;

  return jaro + static_cast<double>(prefix) * kWinklerScale * (1.0 - jaro);
}

double ExactSimilarity(std::string_view a, std::string_view b) {
  return a == b ? 1.0 : 0.0;
}

double TokenJaccardSimilarity(std::string_view a, std::string_view b) {
  const auto ta = TokenSet(a);
  const auto tb = TokenSet(b);
  if (ta.empty() && tb.empty()) return 1.0;

  std::size_t shared = 0;
  for (const auto& token : ta) {
    if (tb.contains(token)) ++shared;
  }
  const std::size_t total = ta.size() + tb.size() - shared;
  return static_cast<double>(shared) / static_cast<double>(total);
}

double Similarity(config::Metric metric, std::string_view a, std::string_view b) {
  if (b < a) std::swap(a, b);

  switch (metric) {
    case config::Metric::kJaroWinkler:
      return JaroWinklerSimilarity(a, b);
    case config::Metric::kLevenshtein:
      return LevenshteinSimilarity(a, b);
    case config::Metric::kExact:
      return ExactSimilarity(a, b);
    case config::Metric::kTokenJaccard:
      return TokenJaccardSimilarity(a, b);
  }
  return 0.0;
}

} // namespace resolver::scoring
