#pragma once

#include <cstddef>
#include <string_view>

#include "internal/config/resolution_config.hpp"

namespace resolver::scoring {

/*
  String similarity metrics.

  Every similarity is in [0, 1]; 1 means identical. Two empty strings are
  identical. Computed byte-wise on already normalized values.
*/

std::size_t LevenshteinDistance(std::string_view a, std::string_view b);

// 1 - distance / max(len(a), len(b))
double LevenshteinSimilarity(std::string_view a, std::string_view b);

double JaroSimilarity(std::string_view a, std::string_view b);

// Jaro with the Winkler common-prefix boost (scale 0.1, prefix capped at 4).
double JaroWinklerSimilarity(std::string_view a, std::string_view b);

double ExactSimilarity(std::string_view a, std::string_view b);

// |A n B| / |A u B| over whitespace separated token sets
double TokenJaccardSimilarity(std::string_view a, std::string_view b);

/*
  Dispatches on metric. The arguments are put in a canonical order first so
  the result never depends on which side of the pair a value came from.
*/
double Similarity(config::Metric metric, std::string_view a, std::string_view b);

} // namespace resolver::scoring
