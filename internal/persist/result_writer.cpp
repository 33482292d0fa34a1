#include "result_writer.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace resolver::persist {

namespace {

void Check(const db::Result& r, const std::string& step) {
  if (!r) throw util::PersistenceError(step + " failed: " + r.Describe());
}

} // namespace

ResultWriter::ResultWriter(std::shared_ptr<db::Repository> repository, WriteOptions options)
    : repository_(std::move(repository)), options_(options) {
}

void ResultWriter::Write(const core::RunResult& result) {
  observability::SpanScope span("resolver.persist");

  auto tx = repository_->Begin();

  if (options_.write_normalized) {
    for (const auto& [id, record] : result.graph.Nodes()) {
      for (auto field : model::kAllFields) {
        Check(repository_->UpsertNormalizedValue(*tx, id, field, record.Field(field)), "write normalized value");
      }
    }
  }

  if (options_.write_edges) {
    Check(repository_->ReplaceEdges(*tx, result.graph.AllEdges()), "replace edges");
  }

  Check(repository_->ReplaceClusters(*tx, result.clusters.clusters), "replace clusters");
  Check(repository_->ReplaceMasterEntities(*tx, result.resolution.masters), "replace master entities");
  Check(repository_->ReplaceAssignments(*tx, result.resolution.assignments), "replace assignments");
  Check(repository_->ReplaceSameAsLinks(*tx, result.resolution.same_as_links), "replace same-as links");

  std::vector<std::string> input_ids;
  input_ids.reserve(result.records.size());
  for (const auto& record : result.records) input_ids.push_back(record.id);
  Check(repository_->DeleteRecords(*tx, input_ids), "delete records");

  for (const auto& record : result.resolution.resolved_records) {
    Check(repository_->InsertRecord(*tx, record), "insert record " + record.id);
  }

  try {
    tx->Commit();
  } catch (const std::exception& e) {
    throw util::PersistenceError(std::string("commit failed: ") + e.what());
  }

  span.SetAttribute("records", static_cast<std::int64_t>(result.resolution.resolved_records.size()));
  RESOLVER_LOG_INFO("run persisted", {observability::IntField("records", static_cast<std::int64_t>(result.resolution.resolved_records.size())),
                                      observability::IntField("masters", static_cast<std::int64_t>(result.resolution.masters.size())),
                                      observability::BoolField("normalized", options_.write_normalized),
                                      observability::BoolField("edges", options_.write_edges)});
}

} // namespace resolver::persist
