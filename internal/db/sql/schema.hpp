#pragma once

#include <string>
#include <vector>

namespace resolver::db::sql {

/*
  Bootstrap schema.

  Tables hold the input records and the result of the last run. The two
  views are what the graph visualization front end queries by default:

      nodes_view          (Node_ID, Label, Name)
      relationships_view  (Source_ID, Target_ID, Relationship_Type, Score)

  Kept in a SQLite/Postgres compatible subset except for column types.
*/

// a merged record is listed once, as its master
inline constexpr const char* kNodesView =
    "CREATE VIEW nodes_view AS"
    " SELECT r.id AS Node_ID, 'Observation' AS Label, COALESCE(r.name, '') AS Name FROM records r"
    " WHERE NOT EXISTS (SELECT 1 FROM master_entities m WHERE m.id = r.id)"
    " UNION ALL"
    " SELECT m.id AS Node_ID, 'MasterEntity' AS Label, COALESCE(v.value, '') AS Name"
    " FROM master_entities m LEFT JOIN master_values v ON v.master_id = m.id AND v.field = 'name';";

// edges touching records removed by a merge are hidden
inline constexpr const char* kRelationshipsView =
    "CREATE VIEW relationships_view AS"
    " SELECT e.Source_ID, e.Target_ID, e.Relationship_Type, e.Score FROM ("
    " SELECT left_id AS Source_ID, right_id AS Target_ID, 'SIMILAR_TO' AS Relationship_Type, score AS Score FROM similarity_edges"
    " UNION ALL"
    " SELECT left_id, right_id, 'SAME_AS', NULL FROM same_as_links"
    " UNION ALL"
    " SELECT record_id, master_id, 'RESOLVES_TO', NULL FROM assignments"
    ") e"
    " WHERE e.Source_ID IN (SELECT Node_ID FROM nodes_view) AND e.Target_ID IN (SELECT Node_ID FROM nodes_view);";

// relationships_view reads nodes_view, so it is dropped first
inline std::vector<std::string> ViewStatements() {
  return {
      "DROP VIEW IF EXISTS relationships_view;",
      "DROP VIEW IF EXISTS nodes_view;",
      kNodesView,
      kRelationshipsView,
  };
}

inline std::vector<std::string> SqliteSchema() {
  std::vector<std::string> schema = {
      "CREATE TABLE IF NOT EXISTS records (id TEXT PRIMARY KEY, name TEXT, email TEXT, phone TEXT, address TEXT, postal_code TEXT);",
      "CREATE TABLE IF NOT EXISTS record_attributes (record_id TEXT NOT NULL REFERENCES records(id) ON DELETE CASCADE, key TEXT NOT NULL, value TEXT NOT NULL, PRIMARY KEY (record_id, key));",
      "CREATE TABLE IF NOT EXISTS normalized_values (record_id TEXT NOT NULL, field TEXT NOT NULL, raw_value TEXT NOT NULL, normalized_value TEXT NOT NULL, present INTEGER NOT NULL, PRIMARY KEY (record_id, field));",
      "CREATE TABLE IF NOT EXISTS similarity_edges (left_id TEXT NOT NULL, right_id TEXT NOT NULL, score REAL NOT NULL, PRIMARY KEY (left_id, right_id));",
      "CREATE TABLE IF NOT EXISTS edge_field_scores (left_id TEXT NOT NULL, right_id TEXT NOT NULL, field TEXT NOT NULL, score REAL NOT NULL, PRIMARY KEY (left_id, right_id, field), FOREIGN KEY (left_id, right_id) REFERENCES similarity_edges(left_id, right_id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS clusters (cluster_id INTEGER PRIMARY KEY);",
      "CREATE TABLE IF NOT EXISTS cluster_members (cluster_id INTEGER NOT NULL REFERENCES clusters(cluster_id) ON DELETE CASCADE, record_id TEXT NOT NULL, PRIMARY KEY (cluster_id, record_id));",
      "CREATE TABLE IF NOT EXISTS master_entities (id TEXT PRIMARY KEY, cluster_id INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS master_values (master_id TEXT NOT NULL REFERENCES master_entities(id) ON DELETE CASCADE, field TEXT NOT NULL, value TEXT NOT NULL, representative TEXT NOT NULL, source_record_id TEXT NOT NULL, PRIMARY KEY (master_id, field));",
      "CREATE TABLE IF NOT EXISTS master_members (master_id TEXT NOT NULL REFERENCES master_entities(id) ON DELETE CASCADE, record_id TEXT NOT NULL, PRIMARY KEY (master_id, record_id));",
      "CREATE TABLE IF NOT EXISTS assignments (record_id TEXT PRIMARY KEY, master_id TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS same_as_links (left_id TEXT NOT NULL, right_id TEXT NOT NULL, cluster_id INTEGER NOT NULL, PRIMARY KEY (left_id, right_id));",
  };
  const auto views = ViewStatements();
  schema.insert(schema.end(), views.begin(), views.end());
  return schema;
}

inline std::vector<std::string> PostgresSchema() {
  std::vector<std::string> schema = {
      "CREATE TABLE IF NOT EXISTS records (id TEXT PRIMARY KEY, name TEXT, email TEXT, phone TEXT, address TEXT, postal_code TEXT);",
      "CREATE TABLE IF NOT EXISTS record_attributes (record_id TEXT NOT NULL REFERENCES records(id) ON DELETE CASCADE, key TEXT NOT NULL, value TEXT NOT NULL, PRIMARY KEY (record_id, key));",
      "CREATE TABLE IF NOT EXISTS normalized_values (record_id TEXT NOT NULL, field TEXT NOT NULL, raw_value TEXT NOT NULL, normalized_value TEXT NOT NULL, present BOOLEAN NOT NULL, PRIMARY KEY (record_id, field));",
      "CREATE TABLE IF NOT EXISTS similarity_edges (left_id TEXT NOT NULL, right_id TEXT NOT NULL, score DOUBLE PRECISION NOT NULL, PRIMARY KEY (left_id, right_id));",
      "CREATE TABLE IF NOT EXISTS edge_field_scores (left_id TEXT NOT NULL, right_id TEXT NOT NULL, field TEXT NOT NULL, score DOUBLE PRECISION NOT NULL, PRIMARY KEY (left_id, right_id, field), FOREIGN KEY (left_id, right_id) REFERENCES similarity_edges(left_id, right_id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS clusters (cluster_id BIGINT PRIMARY KEY);",
      "CREATE TABLE IF NOT EXISTS cluster_members (cluster_id BIGINT NOT NULL REFERENCES clusters(cluster_id) ON DELETE CASCADE, record_id TEXT NOT NULL, PRIMARY KEY (cluster_id, record_id));",
      "CREATE TABLE IF NOT EXISTS master_entities (id TEXT PRIMARY KEY, cluster_id BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS master_values (master_id TEXT NOT NULL REFERENCES master_entities(id) ON DELETE CASCADE, field TEXT NOT NULL, value TEXT NOT NULL, representative TEXT NOT NULL, source_record_id TEXT NOT NULL, PRIMARY KEY (master_id, field));",
      "CREATE TABLE IF NOT EXISTS master_members (master_id TEXT NOT NULL REFERENCES master_entities(id) ON DELETE CASCADE, record_id TEXT NOT NULL, PRIMARY KEY (master_id, record_id));",
      "CREATE TABLE IF NOT EXISTS assignments (record_id TEXT PRIMARY KEY, master_id TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS same_as_links (left_id TEXT NOT NULL, right_id TEXT NOT NULL, cluster_id BIGINT NOT NULL, PRIMARY KEY (left_id, right_id));",
  };
  const auto views = ViewStatements();
  schema.insert(schema.end(), views.begin(), views.end());
  return schema;
}

} // namespace resolver::db::sql
