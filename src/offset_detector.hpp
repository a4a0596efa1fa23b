#pragma once
#include "hex_codec.hpp"
#include "hex_pattern.hpp"
#include "pattern_catalog.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace vbios {

/**
 * Header and footer positions in hex view coordinates. Both fields are
 * write once, the footer needs the header and has to lie after it.
 * Breaking that throws std::logic_error.
 */
class Offsets
{
    std::optional<size_t> headerPos;
    std::optional<size_t> footerPos;

public:
    const std::optional<size_t>& header() const { return headerPos; }
    const std::optional<size_t>& footer() const { return footerPos; }

    void setHeader(size_t pos);
    void setFooter(size_t pos);
};

struct FooterMatch
{
    size_t position;
    std::string variant;
};

// 55aa ?? eb <10 bytes> "VIDEO"
const HexPattern& headerPattern();

// Leftmost header anchor. Throws HeaderNotFound.
size_t detectHeader(const HexView& view);

/**
 * Tries each layout of the catalog in order and returns the first one that
 * matches anywhere at or after `from`. A later layout is only consulted once
 * every earlier one failed across the whole range, regardless of where the
 * matches sit. Throws FooterNotFound.
 */
FooterMatch detectFooter(const HexView& view, const PatternCatalog& catalog = PatternCatalog::defaults(),
                         size_t from = 0);

// Non-throwing form of detectFooter
std::optional<FooterMatch> findFooter(const HexView& view, const PatternCatalog& catalog, size_t from = 0);

} // namespace vbios
