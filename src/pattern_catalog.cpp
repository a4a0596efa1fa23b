#include "pattern_catalog.hpp"
#include "rom_format.hpp"
#include <set>
#include <stdexcept>
#include <utility>

namespace vbios {

HexPattern FooterLayout::pattern() const {
    return HexPattern({
        HexPattern::Literal{std::string(FOOTER_ANCHOR)},
        HexPattern::Wildcard{firstGapBytes},
        HexPattern::Literal{std::string(NPDS_MARKER)},
        HexPattern::Wildcard{FOOTER_SECOND_GAP_BYTES},
        HexPattern::Literal{std::string(NPDE_MARKER)},
    });
}

PatternCatalog::PatternCatalog(std::vector<FooterLayout> entries) : layouts(std::move(entries)) {
    if (layouts.empty()) {
        throw std::invalid_argument("Footer catalog is empty");
    }

    std::set<std::string> names;
    for (size_t i = 0; i < layouts.size(); ++i) {
        if (!names.insert(layouts[i].name).second) {
            throw std::invalid_argument("Duplicate footer layout: " + layouts[i].name);
        }
        if (i > 0 && layouts[i].firstGapBytes >= layouts[i - 1].firstGapBytes) {
            throw std::invalid_argument("Footer layout '" + layouts[i].name +
                                        "' is out of order, gaps must be strictly descending");
        }
    }
}

const PatternCatalog& PatternCatalog::defaults() {
    static const PatternCatalog catalog{
        {"RTX 30XX",             318},
        {"RTX 2060",             286},
        {"GTX 16XX / RTX 20XX",  238},
        {"Quadro PXXX",          222},
        {"GTX 10XX",             174},
        {"GTX 980",               94},
        {"GTX 400 - 900 Series",  62},
    };
    return catalog;
}

const FooterLayout* PatternCatalog::find(const std::string& name) const {
    for (const auto& layout : layouts) {
        if (layout.name == name) return &layout;
    }
    return nullptr;
}

} // namespace vbios
