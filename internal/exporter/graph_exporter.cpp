#include "graph_exporter.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <map>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace resolver::exporter {

namespace {

std::string EdgeId(std::string_view label, const std::string& source, const std::string& target) {
  return std::string(label) + ":" + source + "|" + target;
}

} // namespace

GraphExporter::GraphExporter(ExportOptions options) : options_(options) {
}

resolver::v1::GraphElements GraphExporter::Build(const core::RunResult& result) const {
  resolver::v1::GraphElements elements;

  std::map<std::string, std::string, model::RecordIdLess> master_of;
  for (const auto& a : result.resolution.assignments) master_of.emplace(a.record_id, a.master_id);

  // ------------------------------------------------------------------
  // Nodes
  // ------------------------------------------------------------------
  for (const auto& record : result.records) {
    auto* data = elements.add_nodes()->mutable_data();
    data->set_id(record.id);
    data->set_label(kObservationLabel);
    data->set_name(record.name.value_or(""));

    if (auto it = result.clusters.cluster_of.find(record.id); it != result.clusters.cluster_of.end()) data->set_cluster_id(it->second);
    if (auto it = master_of.find(record.id); it != master_of.end()) data->set_master_id(it->second);

    auto& properties = *data->mutable_properties();
    for (auto field : model::kAllFields) {
      if (const auto& raw = model::RawValue(record, field)) properties[std::string(model::ToString(field))] = *raw;
    }
    for (const auto& [key, value] : record.attributes) properties.insert({key, value});
  }

  if (options_.include_masters) {
    for (const auto& master : result.resolution.masters) {
      auto* data = elements.add_nodes()->mutable_data();
      data->set_id(master.id);
      data->set_label(kMasterEntityLabel);
      data->set_name(master.Value(model::FieldType::kName).representative);
      data->set_cluster_id(master.cluster_id);
      data->set_master_id(master.id);

      auto& properties = *data->mutable_properties();
      for (auto field : model::kAllFields) {
        const auto& value = master.Value(field);
        if (!value.value.empty()) properties[std::string(model::ToString(field))] = value.value;
      }
    }
  }

  // ------------------------------------------------------------------
  // Edges
  // ------------------------------------------------------------------
  for (const auto& edge : result.graph.AllEdges()) {
    auto* data = elements.add_edges()->mutable_data();
    data->set_id(EdgeId(kSimilarTo, edge.left_id, edge.right_id));
    data->set_source(edge.left_id);
    data->set_target(edge.right_id);
    data->set_label(kSimilarTo);
    data->set_score(edge.score);

    auto& field_scores = *data->mutable_field_scores();
    for (auto field : model::kAllFields) {
      if (const auto& score = edge.FieldScore(field)) field_scores[std::string(model::ToString(field))] = *score;
    }
  }

  for (const auto& link : result.resolution.same_as_links) {
    auto* data = elements.add_edges()->mutable_data();
    data->set_id(EdgeId(kSameAs, link.left_id, link.right_id));
    data->set_source(link.left_id);
    data->set_target(link.right_id);
    data->set_label(kSameAs);
  }

  if (options_.include_masters) {
    for (const auto& a : result.resolution.assignments) {
      auto* data = elements.add_edges()->mutable_data();
      data->set_id(EdgeId(kResolvesTo, a.record_id, a.master_id));
      data->set_source(a.record_id);
      data->set_target(a.master_id);
      data->set_label(kResolvesTo);
    }
  }

  return elements;
}

std::string GraphExporter::ToJson(const resolver::v1::GraphElements& elements) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(elements, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize graph elements: " + std::string(status.message()));
  }
  return json;
}

void GraphExporter::WriteFile(const std::string& path, const core::RunResult& result) const {
  const auto elements = Build(result);

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("cannot open graph export file: " + path);
  out << ToJson(elements);
  if (!out) throw std::runtime_error("failed writing graph export file: " + path);

  RESOLVER_LOG_INFO("graph exported", {observability::StringField("path", path), observability::IntField("nodes", elements.nodes_size()),
                                       observability::IntField("edges", elements.edges_size())});
}

} // namespace resolver::exporter
