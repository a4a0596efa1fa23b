#include "hex_codec.hpp"
#include <utility>

namespace vbios {

namespace {
    constexpr char DIGITS[] = "0123456789abcdef";

    uint8_t nibble(char c) {
        return static_cast<uint8_t>(c <= '9' ? c - '0' : c - 'a' + 10);
    }

    void validate(std::string_view text) {
        if (text.size() % 2 != 0) {
            throw DecodeError("Odd-length hex string (" + std::to_string(text.size()) + " digits)");
        }
        for (size_t i = 0; i < text.size(); ++i) {
            if (!hex::isDigit(text[i])) {
                throw DecodeError("Non-hex digit at position " + std::to_string(i));
            }
        }
    }
} // namespace

std::string hex::encode(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0F]);
    }
    return out;
}

std::vector<uint8_t> hex::decode(std::string_view text) {
    validate(text);

    std::vector<uint8_t> out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        out.push_back(static_cast<uint8_t>((nibble(text[i]) << 4) | nibble(text[i + 1])));
    }
    return out;
}

HexView::HexView(std::string text) : digits(std::move(text)) {
    validate(digits);
}

HexView HexView::fromBytes(const std::vector<uint8_t>& bytes) {
    HexView view;
    view.digits = hex::encode(bytes);
    return view;
}

} // namespace vbios
