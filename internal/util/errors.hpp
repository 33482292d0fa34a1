#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace resolver::util {

/*
  Central error types.

  ConfigurationError aborts a run before any record is touched.
  MalformedRecordError is caught per record and turned into a rejection.
  ClusteringNondeterminismError is only raised in verification mode.
  PersistenceError wraps a failed repository write.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedRecordError : public std::runtime_error {
 public:
  MalformedRecordError(std::size_t position, const std::string& msg) : std::runtime_error(msg), position_(position) {
  }

  // Position of the record in the ingested sequence.
  std::size_t Position() const {
    return position_;
  }

 private:
  std::size_t position_;
};

class ClusteringNondeterminismError : public std::runtime_error {
 public:
  explicit ClusteringNondeterminismError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace resolver::util
