#pragma once
#include "hex_codec.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vbios {

/**
 * A byte signature made of fixed literals and fixed-width "any byte" runs,
 * e.g. 55aa ?? eb. Matching only ever lands on byte boundaries of the
 * hex view, so every reported position is even.
 */
class HexPattern
{
public:
    struct Literal {
        std::string digits;
    };
    struct Wildcard {
        size_t bytes;
    };
    using Segment = std::variant<Literal, Wildcard>;

    // Throws std::invalid_argument if the first segment is not a literal
    // or a literal is not whole lowercase hex bytes
    explicit HexPattern(std::vector<Segment> parts);

    // Leftmost match starting at or after `from`
    std::optional<size_t> find(const HexView& view, size_t from = 0) const;
    bool matchesAt(const HexView& view, size_t pos) const;

    // Match length in hex digits
    size_t length() const { return totalLength; }
    const std::vector<Segment>& segments() const { return segs; }

private:
    std::vector<Segment> segs;
    size_t totalLength = 0;
};

// Byte-aligned search for a literal inside [begin, end)
std::optional<size_t> findLiteral(const HexView& view, std::string_view literal,
                                  size_t begin = 0, size_t end = std::string_view::npos);

// Non-overlapping byte-aligned occurrences of a literal inside [begin, end)
size_t countLiteral(const HexView& view, std::string_view literal,
                    size_t begin = 0, size_t end = std::string_view::npos);

} // namespace vbios
