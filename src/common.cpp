#include "blast/common.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace blast {

// Utility functions
std::string hash_to_hex(const Hash256& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : hash) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

namespace {

int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

Hash256 hex_to_hash(const std::string& hex) {
    Hash256 hash;
    if (hex.length() != hash.size() * 2) {
        throw std::invalid_argument("Invalid hex string length");
    }
    for (size_t i = 0; i < hash.size(); ++i) {
        int high = hex_digit_value(hex[i * 2]);
        int low = hex_digit_value(hex[i * 2 + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex digit in hash string");
        }
        hash[i] = static_cast<byte>((high << 4) | low);
    }
    return hash;
}

// ContentHash implementation
std::string ContentHash::to_string() const {
    return hash_to_hex(hash);
}

ContentHash ContentHash::from_string(const std::string& str) {
    return ContentHash(hex_to_hash(str));
}

} // namespace blast
