#pragma once

#include <string>

#include "internal/core/resolution_engine.hpp"
#include "resolver/v1/graph.pb.h"

namespace resolver::exporter {

inline constexpr const char* kObservationLabel  = "Observation";
inline constexpr const char* kMasterEntityLabel = "MasterEntity";
inline constexpr const char* kSimilarTo         = "SIMILAR_TO";
inline constexpr const char* kSameAs            = "SAME_AS";
inline constexpr const char* kResolvesTo        = "RESOLVES_TO";

struct ExportOptions {
  bool include_masters = true;
};

/*
  GraphExporter

  Turns a RunResult into the element list the visualization front end
  renders:

      Observation nodes   one per accepted input record
      MasterEntity nodes  one per master (include_masters)
      SIMILAR_TO edges    every similarity edge, with field scores
      SAME_AS edges       link mode pairs
      RESOLVES_TO edges   record -> master (include_masters)

  Serialized as protobuf JSON with the proto field names.
*/
class GraphExporter {
 public:
  explicit GraphExporter(ExportOptions options);

  resolver::v1::GraphElements Build(const core::RunResult& result) const;

  static std::string ToJson(const resolver::v1::GraphElements& elements);

  void WriteFile(const std::string& path, const core::RunResult& result) const;

 private:
  ExportOptions options_;
};

} // namespace resolver::exporter
