#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace resolver::util {

/*
  RFC 4122 version 4 ids drawn from a seeded engine: the same seed yields
  the same id sequence, so master entity ids are reproducible across runs.
*/
class SeededUuidGenerator {
 public:
  explicit SeededUuidGenerator(std::uint64_t seed) : engine_(seed) {
  }

  // Lowercase 8-4-4-4-12 form.
  std::string Next();

 private:
  std::mt19937_64 engine_;
};

} // namespace resolver::util
