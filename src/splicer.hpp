#pragma once
#include "hex_codec.hpp"
#include "offset_detector.hpp"
#include <cstdint>
#include <vector>

namespace vbios {

/**
 * Copies view[header:footer] (or view[header:] when includeFooter is false,
 * keeping everything up to the end of the image) back into raw bytes.
 * Throws HeaderNotFound / FooterNotFound when a needed offset is unset.
 */
std::vector<uint8_t> splice(const HexView& view, const Offsets& offsets, bool includeFooter);

} // namespace vbios
