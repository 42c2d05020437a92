#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace betme {

std::string bytesToHex(const unsigned char* data, std::size_t len);
std::vector<unsigned char> hexToBytes(const std::string& hex);
std::string trim(const std::string& value);

// Whole-string decimal parsing. Throws std::invalid_argument naming `what` on signs,
// trailing characters or out-of-range values.
std::uint64_t parseUnsigned(const std::string& text, const std::string& what);
std::int64_t parseSigned(const std::string& text, const std::string& what);

// Lowercase hex SHA-256 digest.
std::string sha256Hex(const std::string& data);

} // namespace betme
