#include "offset_detector.hpp"
#include "errors.hpp"
#include "rom_format.hpp"
#include <stdexcept>

namespace vbios {

void Offsets::setHeader(size_t pos) {
    if (headerPos) {
        throw std::logic_error("Header offset already set");
    }
    headerPos = pos;
}

void Offsets::setFooter(size_t pos) {
    if (!headerPos) {
        throw std::logic_error("Footer offset set before header");
    }
    if (footerPos) {
        throw std::logic_error("Footer offset already set");
    }
    if (pos <= *headerPos) {
        throw std::logic_error("Footer offset " + std::to_string(pos) +
                               " does not follow header offset " + std::to_string(*headerPos));
    }
    footerPos = pos;
}

const HexPattern& headerPattern() {
    static const HexPattern pattern({
        HexPattern::Literal{std::string(HEADER_MAGIC)},
        HexPattern::Wildcard{HEADER_SIZE_FIELD_BYTES},
        HexPattern::Literal{std::string(HEADER_JUMP)},
        HexPattern::Wildcard{HEADER_RESERVED_BYTES},
        HexPattern::Literal{std::string(HEADER_VIDEO_TAG)},
    });
    return pattern;
}

size_t detectHeader(const HexView& view) {
    auto pos = headerPattern().find(view);
    if (!pos) {
        throw HeaderNotFound();
    }
    return *pos;
}

std::optional<FooterMatch> findFooter(const HexView& view, const PatternCatalog& catalog, size_t from) {
    for (const auto& layout : catalog) {
        if (auto pos = layout.pattern().find(view, from)) {
            return FooterMatch{*pos, layout.name};
        }
    }
    return std::nullopt;
}

FooterMatch detectFooter(const HexView& view, const PatternCatalog& catalog, size_t from) {
    auto match = findFooter(view, catalog, from);
    if (!match) {
        throw FooterNotFound();
    }
    return *match;
}

} // namespace vbios
