// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace svcnet {
namespace util {

namespace {

// Parses a whole string as a long; nullopt on garbage, whitespace or overflow
std::optional<long> ParseWholeLong(const std::string& str) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long value = std::stol(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = ParseWholeLong(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = ParseWholeLong(str);
  if (!value || *value < 1 || *value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<std::pair<uint16_t, uint16_t>> SafeParsePortRange(const std::string& str) {
  size_t dash = str.find('-');
  if (dash == std::string::npos) {
    return std::nullopt;
  }

  auto start = SafeParsePort(str.substr(0, dash));
  auto end = SafeParsePort(str.substr(dash + 1));
  if (!start || !end || *start > *end) {
    return std::nullopt;
  }
  return std::make_pair(*start, *end);
}

std::vector<std::string> SplitString(const std::string& str, char delimiter) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (pos <= str.length()) {
    size_t next = str.find(delimiter, pos);
    if (next == std::string::npos) {
      next = str.length();
    }
    if (next > pos) {
      parts.push_back(str.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return parts;
}

} // namespace util
} // namespace svcnet
