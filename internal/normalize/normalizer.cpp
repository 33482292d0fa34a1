#include "normalizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace resolver::normalize {

namespace {

bool IsAsciiPunct(unsigned char c) {
  return c < 0x80 && std::ispunct(c);
}

bool IsAsciiSpace(unsigned char c) {
  return c < 0x80 && std::isspace(c);
}

std::string Lower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c); });
  return out;
}

std::string_view Trim(std::string_view in) {
  while (!in.empty() && IsAsciiSpace(static_cast<unsigned char>(in.front()))) in.remove_prefix(1);
  while (!in.empty() && IsAsciiSpace(static_cast<unsigned char>(in.back()))) in.remove_suffix(1);
  return in;
}

// lowercase, drop apostrophes, every other punctuation mark becomes a space
std::string PunctuationToSpaces(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (unsigned char c : raw) {
    if (c == '\'') continue;
    if (IsAsciiPunct(c) || IsAsciiSpace(c)) {
      out.push_back(' ');
    } else {
      out.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c));
    }
  }
  return out;
}

std::vector<std::string> Tokens(const std::string& text) {
  std::vector<std::string> tokens;
  std::istringstream       in(text);
  std::string              token;
  while (in >> token) tokens.push_back(token);
  return tokens;
}

std::string Join(const std::vector<std::string>& tokens) {
  std::string out;
  for (const auto& token : tokens) {
    if (!out.empty()) out.push_back(' ');
    out += token;
  }
  return out;
}

std::string Fallback(std::string_view raw, std::string normalized) {
  if (!normalized.empty()) return normalized;
  return Lower(Trim(raw));
}

const std::unordered_set<std::string>& NameNoiseTokens() {
  static const std::unordered_set<std::string> tokens = {
      "mr", "mrs", "ms", "miss", "mx", "dr", "prof", "rev", "sir", "madam", "jr", "sr", "ii", "iii", "iv",
  };
  return tokens;
}

const std::unordered_map<std::string, std::string>& AddressAbbreviations() {
  static const std::unordered_map<std::string, std::string> table = {
      {"st", "street"},    {"str", "street"},     {"ave", "avenue"},   {"av", "avenue"},     {"rd", "road"},
      {"blvd", "boulevard"}, {"ln", "lane"},      {"dr", "drive"},     {"ct", "court"},      {"pl", "place"},
      {"sq", "square"},    {"hwy", "highway"},    {"pkwy", "parkway"}, {"cir", "circle"},    {"ter", "terrace"},
      {"apt", "apartment"}, {"ste", "suite"},     {"fl", "floor"},     {"bldg", "building"}, {"n", "north"},
      {"s", "south"},      {"e", "east"},         {"w", "west"},       {"ne", "northeast"},  {"nw", "northwest"},
      {"se", "southeast"}, {"sw", "southwest"},
  };
  return table;
}

} // namespace

std::string NormalizeName(std::string_view raw) {
  std::vector<std::string> kept;
  for (auto& token : Tokens(PunctuationToSpaces(raw))) {
    if (!NameNoiseTokens().contains(token)) kept.push_back(std::move(token));
  }
  return Fallback(raw, Join(kept));
}

std::string NormalizeEmail(std::string_view raw) {
  return Lower(Trim(raw));
}

std::string NormalizeAddress(std::string_view raw) {
  auto tokens = Tokens(PunctuationToSpaces(raw));
  for (auto& token : tokens) {
    if (auto it = AddressAbbreviations().find(token); it != AddressAbbreviations().end()) {
      token = it->second;
    }
  }
  return Fallback(raw, Join(tokens));
}

std::string NormalizePostalCode(std::string_view raw) {
  std::string out;
  for (unsigned char c : raw) {
    if (c < 0x80 && std::isalnum(c)) out.push_back(static_cast<char>(std::tolower(c)));
  }
  return Fallback(raw, std::move(out));
}

Normalizer::Normalizer(config::NormalizationOptions options) : options_(std::move(options)) {
}

std::string Normalizer::NormalizePhone(std::string_view raw) const {
  std::string digits;
  for (unsigned char c : raw) {
    if (c >= '0' && c <= '9') digits.push_back(static_cast<char>(c));
  }

  const auto& cc = options_.phone_country_code;
  if (!cc.empty() && options_.phone_national_length > 0) {
    std::string_view candidate = digits;
    if (candidate.size() == cc.size() + options_.phone_national_length + 2 && candidate.starts_with("00")) {
      candidate.remove_prefix(2);
    }
    if (candidate.size() == cc.size() + options_.phone_national_length && candidate.starts_with(cc)) {
      digits = std::string(candidate.substr(cc.size()));
    }
  }
  return Fallback(raw, std::move(digits));
}

std::string Normalizer::Normalize(model::FieldType field, std::string_view raw) const {
  switch (field) {
    case model::FieldType::kName:
      return NormalizeName(raw);
    case model::FieldType::kEmail:
      return NormalizeEmail(raw);
    case model::FieldType::kPhone:
      return NormalizePhone(raw);
    case model::FieldType::kAddress:
      return NormalizeAddress(raw);
    case model::FieldType::kPostalCode:
      return NormalizePostalCode(raw);
  }
  return Lower(Trim(raw));
}

model::NormalizedRecord Normalizer::NormalizeRecord(const model::Record& record) const {
  model::NormalizedRecord out;
  out.id         = record.id;
  out.attributes = record.attributes;
  for (auto field : model::kAllFields) {
    const auto& raw = model::RawValue(record, field);
    if (!raw) continue;

    auto& slot   = out.MutableField(field);
    slot.raw     = *raw;
    slot.value   = Normalize(field, *raw);
    slot.present = !slot.value.empty();
  }
  return out;
}

} // namespace resolver::normalize
