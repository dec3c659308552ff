#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace authtree {

/**
 * HashValue - 32-byte output of a collision-resistant hash function
 *
 * The default value (all zeros) stands for a node that was never written.
 */
class HashValue {
public:
    static constexpr size_t LEN = 32;

    HashValue() : bytes_{} {}
    explicit HashValue(const std::array<uint8_t, LEN>& bytes) : bytes_(bytes) {}

    static HashValue zero() { return HashValue(); }

    const std::array<uint8_t, LEN>& bytes() const { return bytes_; }
    uint8_t* data() { return bytes_.data(); }
    const uint8_t* data() const { return bytes_.data(); }
    static constexpr size_t size() { return LEN; }

    bool is_zero() const;

    bool operator==(const HashValue& rhs) const { return bytes_ == rhs.bytes_; }
    bool operator!=(const HashValue& rhs) const { return bytes_ != rhs.bytes_; }

    std::string to_hex() const;
    static HashValue from_hex(const std::string& hex);

    friend std::ostream& operator<<(std::ostream& os, const HashValue& value);

private:
    std::array<uint8_t, LEN> bytes_;
};

// Lower-case hex of an arbitrary byte range
std::string bytes_to_hex(const uint8_t* data, size_t len);

} // namespace authtree
