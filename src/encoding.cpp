#include "encoding.hpp"

#include "picosha2.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace betme {

std::string bytesToHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::vector<unsigned char> hexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string must have even length");
    }

    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            throw std::invalid_argument("hex string contains a non-hex character");
        }
        unsigned int byte = 0;
        std::istringstream iss(hex.substr(i, 2));
        iss >> std::hex >> byte;
        out.push_back(static_cast<unsigned char>(byte));
    }
    return out;
}

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

std::uint64_t parseUnsigned(const std::string& text, const std::string& what) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        throw std::invalid_argument(what + " must be an unsigned integer: " + text);
    }
    std::size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed, 10);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + " is out of range: " + text);
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(what + " must be an unsigned integer: " + text);
    }
    return static_cast<std::uint64_t>(value);
}

std::int64_t parseSigned(const std::string& text, const std::string& what) {
    std::size_t start = (!text.empty() && text.front() == '-') ? 1 : 0;
    if (text.size() <= start || !std::isdigit(static_cast<unsigned char>(text[start]))) {
        throw std::invalid_argument(what + " must be an integer: " + text);
    }
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed, 10);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(what + " is out of range: " + text);
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(what + " must be an integer: " + text);
    }
    return static_cast<std::int64_t>(value);
}

std::string sha256Hex(const std::string& data) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

} // namespace betme
