// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and config-file values
 - Returns std::nullopt on any parsing error (no exceptions thrown)

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParsePort: Parse port number (1-65535)
 - SafeParsePortRange: Parse "<start>-<end>" host port range
 - SplitString: Split a delimited list, dropping empty items
*/

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace svcnet {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("9650") -> 9650
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 *   SafeParsePort("99999") -> std::nullopt (out of range)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse an inclusive port range "<start>-<end>"
 *
 * Both bounds must be valid ports and start must not exceed end.
 *
 * Examples:
 *   SafeParsePortRange("9650-9750") -> {9650, 9750}
 *   SafeParsePortRange("9650") -> std::nullopt (missing end)
 *   SafeParsePortRange("9750-9650") -> std::nullopt (reversed)
 */
std::optional<std::pair<uint16_t, uint16_t>> SafeParsePortRange(const std::string& str);

/**
 * Split on a delimiter, skipping empty items
 *
 * Example:
 *   SplitString("graph,,docker", ',') -> {"graph", "docker"}
 */
std::vector<std::string> SplitString(const std::string& str, char delimiter);

} // namespace util
} // namespace svcnet
