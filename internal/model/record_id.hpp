#pragma once

#include <algorithm>
#include <string>
#include <string_view>

namespace resolver::model {

/*
  Natural record id order.

  Ids made only of digits sort first, numerically (ties on equal numbers by
  raw text). All other ids follow in lexicographic order. Used wherever
  "lowest record id" decides a tie.
*/
inline bool IsAllDigits(std::string_view id) {
  return !id.empty() && std::all_of(id.begin(), id.end(), [](char c) { return c >= '0' && c <= '9'; });
}

inline int CompareRecordIds(std::string_view a, std::string_view b) {
  const bool a_digits = IsAllDigits(a);
  const bool b_digits = IsAllDigits(b);
  if (a_digits != b_digits) return a_digits ? -1 : 1;
  if (a_digits) {
    const auto strip = [](std::string_view s) {
      const auto first = s.find_first_not_of('0');
      return first == std::string_view::npos ? std::string_view{} : s.substr(first);
    };
    auto sa = strip(a);
    auto sb = strip(b);
    if (sa.size() != sb.size()) return sa.size() < sb.size() ? -1 : 1;
    if (const int c = sa.compare(sb); c != 0) return c < 0 ? -1 : 1;
    // numerically equal, fall through to a total order on the raw text
  }
  const int c = a.compare(b);
  return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

struct RecordIdLess {
  bool operator()(std::string_view a, std::string_view b) const {
    return CompareRecordIds(a, b) < 0;
  }
};

} // namespace resolver::model
