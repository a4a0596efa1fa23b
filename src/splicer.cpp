#include "splicer.hpp"
#include "errors.hpp"
#include <stdexcept>
#include <string_view>

namespace vbios {

std::vector<uint8_t> splice(const HexView& view, const Offsets& offsets, bool includeFooter) {
    if (!offsets.header()) {
        throw HeaderNotFound("Header offset not found; cannot splice ROM");
    }

    const size_t start = *offsets.header();
    if (start > view.size() || (includeFooter && offsets.footer() && *offsets.footer() > view.size())) {
        throw std::out_of_range("Splice offsets lie beyond the end of the image");
    }
    std::string_view region;
    if (includeFooter) {
        if (!offsets.footer()) {
            throw FooterNotFound("Footer offset not found; cannot splice ROM");
        }
        region = view.substr(start, *offsets.footer() - start);
    } else {
        region = view.substr(start);
    }

    try {
        return hex::decode(region);
    } catch (const DecodeError& e) {
        throw DecodeError(std::string("Failed to decode spliced content: ") + e.what());
    }
}

} // namespace vbios
