#pragma once
#include "errors.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vbios {

using Image = std::vector<uint8_t>;

namespace hex {
    std::string encode(const std::vector<uint8_t>& bytes);
    std::vector<uint8_t> decode(std::string_view text);

    constexpr bool isDigit(char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }
} // namespace hex

/**
 * Read-only lowercase hex text of an image, two digits per byte.
 * Positions into it are in hex digit units, byte n starts at 2n.
 */
class HexView
{
    std::string digits;

public:
    HexView() = default;
    // Throws DecodeError unless text is even-length lowercase hex
    explicit HexView(std::string text);

    static HexView fromBytes(const std::vector<uint8_t>& bytes);

    std::string_view str() const { return digits; }
    size_t size() const { return digits.size(); }
    size_t byteSize() const { return digits.size() / 2; }
    bool empty() const { return digits.empty(); }

    std::string_view substr(size_t pos, size_t count = std::string_view::npos) const {
        return str().substr(pos, count);
    }
};

} // namespace vbios
