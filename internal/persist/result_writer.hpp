#pragma once

#include <memory>

#include "internal/core/resolution_engine.hpp"
#include "internal/db/api/repository.hpp"

namespace resolver::persist {

struct WriteOptions {
  bool write_normalized = false;
  bool write_edges      = false;
};

/*
  ResultWriter

  Persists one RunResult in a single repository transaction:

      normalized values (optional)
      similarity edges (optional)
      clusters, master entities, assignments
      same-as links (link mode)
      records: every accepted input id is deleted and the resolved
               records inserted, so merge mode replaces N members by
               their master record

  Any failed write throws PersistenceError. The transaction is rolled
  back and nothing from the run is left behind.
*/
class ResultWriter {
 public:
  ResultWriter(std::shared_ptr<db::Repository> repository, WriteOptions options);

  void Write(const core::RunResult& result);

 private:
  std::shared_ptr<db::Repository> repository_;
  WriteOptions                    options_;
};

} // namespace resolver::persist
