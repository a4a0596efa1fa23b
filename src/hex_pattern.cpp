#include "hex_pattern.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace vbios {

namespace {
    void checkLiteral(std::string_view digits) {
        if (digits.empty() || digits.size() % 2 != 0) {
            throw std::invalid_argument("Pattern literal must be whole bytes: '" + std::string(digits) + "'");
        }
        if (!std::all_of(digits.begin(), digits.end(), hex::isDigit)) {
            throw std::invalid_argument("Pattern literal is not lowercase hex: '" + std::string(digits) + "'");
        }
    }
} // namespace

HexPattern::HexPattern(std::vector<Segment> parts) : segs(std::move(parts)) {
    if (segs.empty() || !std::holds_alternative<Literal>(segs.front())) {
        throw std::invalid_argument("Pattern must start with a literal");
    }

    for (const auto& seg : segs) {
        if (const auto* lit = std::get_if<Literal>(&seg)) {
            checkLiteral(lit->digits);
            totalLength += lit->digits.size();
        } else {
            totalLength += std::get<Wildcard>(seg).bytes * 2;
        }
    }
}

bool HexPattern::matchesAt(const HexView& view, size_t pos) const {
    if (pos % 2 != 0 || pos > view.size() || view.size() - pos < totalLength) {
        return false;
    }

    size_t offset = pos;
    for (const auto& seg : segs) {
        if (const auto* lit = std::get_if<Literal>(&seg)) {
            if (view.substr(offset, lit->digits.size()) != lit->digits) {
                return false;
            }
            offset += lit->digits.size();
        } else {
            // every digit of a HexView is valid hex, any run of the right width matches
            offset += std::get<Wildcard>(seg).bytes * 2;
        }
    }
    return true;
}

std::optional<size_t> HexPattern::find(const HexView& view, size_t from) const {
    const std::string& anchor = std::get<Literal>(segs.front()).digits;

    size_t cursor = from;
    while (true) {
        auto pos = findLiteral(view, anchor, cursor);
        if (!pos) {
            return std::nullopt;
        }
        if (matchesAt(view, *pos)) {
            return pos;
        }
        cursor = *pos + 2;
    }
}

std::optional<size_t> findLiteral(const HexView& view, std::string_view literal,
                                  size_t begin, size_t end) {
    const std::string_view text = view.str();
    end = std::min(end, text.size());

    size_t cursor = begin;
    while (cursor < end) {
        size_t pos = text.find(literal, cursor);
        if (pos == std::string_view::npos || pos + literal.size() > end) {
            return std::nullopt;
        }
        if (pos % 2 == 0) {
            return pos;
        }
        cursor = pos + 1;
    }
    return std::nullopt;
}

size_t countLiteral(const HexView& view, std::string_view literal, size_t begin, size_t end) {
    if (literal.empty()) {
        return 0;
    }

    size_t count = 0;
    size_t cursor = begin;
    while (auto pos = findLiteral(view, literal, cursor, end)) {
        ++count;
        cursor = *pos + literal.size();
    }
    return count;
}

} // namespace vbios
