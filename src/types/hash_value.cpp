#include "types/hash_value.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace authtree {

std::string bytes_to_hex(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) {
        oss << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(data[i]);
    }
    return oss.str();
}

bool HashValue::is_zero() const {
    for (uint8_t b : bytes_) {
        if (b != 0) {
            return false;
        }
    }
    return true;
}

std::string HashValue::to_hex() const {
    return bytes_to_hex(bytes_.data(), LEN);
}

HashValue HashValue::from_hex(const std::string& hex) {
    if (hex.length() != LEN * 2) {
        throw std::invalid_argument("Invalid hex string length for HashValue");
    }

    std::array<uint8_t, LEN> bytes;
    for (size_t i = 0; i < LEN; ++i) {
        bytes[i] = static_cast<uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
    }
    return HashValue(bytes);
}

std::ostream& operator<<(std::ostream& os, const HashValue& value) {
    return os << value.to_hex();
}

} // namespace authtree
