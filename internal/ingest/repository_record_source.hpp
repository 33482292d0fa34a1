#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "record_source.hpp"

namespace resolver::ingest {

// Reads the records table of the configured repository.
class RepositoryRecordSource final : public RecordSource {
 public:
  explicit RepositoryRecordSource(std::shared_ptr<db::Repository> repository);

  std::vector<model::Record> LoadRecords() override;

  std::string Name() const override {
    return "repository";
  }

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace resolver::ingest
