#pragma once
#include "hex_pattern.hpp"
#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace vbios {

/**
 * One historical footer generation:
 *   564e <firstGapBytes> 4e504453 <28 bytes> 4e504445
 */
struct FooterLayout
{
    std::string name;
    size_t firstGapBytes;

    HexPattern pattern() const;
};

/**
 * Priority-ordered list of footer layouts. Entries are sorted by strictly
 * descending first gap since the longer layouts of newer cards have to be
 * ruled out before falling back to an older one.
 */
class PatternCatalog
{
    std::vector<FooterLayout> layouts;

public:
    // Throws std::invalid_argument on an empty list, duplicate names or
    // gaps that are not strictly descending
    explicit PatternCatalog(std::vector<FooterLayout> entries);
    PatternCatalog(std::initializer_list<FooterLayout> entries)
        : PatternCatalog(std::vector<FooterLayout>(entries)) {}

    // Known NVIDIA generations, RTX 30XX first
    static const PatternCatalog& defaults();

    size_t size() const { return layouts.size(); }
    const FooterLayout& operator[](size_t i) const { return layouts[i]; }
    const FooterLayout* find(const std::string& name) const;

    auto begin() const { return layouts.cbegin(); }
    auto end() const { return layouts.cend(); }
};

} // namespace vbios
