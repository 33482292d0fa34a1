#include "repository_record_source.hpp"

#include "internal/observability/logging.hpp"

namespace resolver::ingest {

RepositoryRecordSource::RepositoryRecordSource(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<model::Record> RepositoryRecordSource::LoadRecords() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListRecords(*tx);
  tx->Rollback();

  RESOLVER_LOG_INFO("records loaded", {observability::StringField("source", Name()),
                                       observability::IntField("records", static_cast<std::int64_t>(records.size()))});
  return records;
}

} // namespace resolver::ingest
