#pragma once

#include <string>
#include <vector>

#include "internal/model/record.hpp"

namespace resolver::ingest {

/*
  Boundary to wherever raw records live.

  Sources do not validate records; ids are checked by the engine so that
  malformed rows become rejections instead of aborting the load.
*/
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  virtual std::vector<model::Record> LoadRecords() = 0;

  virtual std::string Name() const = 0;
};

} // namespace resolver::ingest
