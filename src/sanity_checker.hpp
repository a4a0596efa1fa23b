#pragma once
#include "errors.hpp"
#include "hex_codec.hpp"
#include "offset_detector.hpp"
#include <cstddef>
#include <optional>

namespace vbios {

// Marker census of [header, footer)
struct MarkerCounts
{
    size_t npds = 0;
    size_t npde = 0;
    size_t npdeAfterNpds = 0;
};

/**
 * Structural checks on the region between header and footer. A UEFI capable
 * image carries exactly one NPDS and three NPDE markers there, two of the
 * NPDE after the NPDS. Rules are checked in that order and the first failure
 * is reported. Both offsets must be set, otherwise std::logic_error.
 */
class SanityChecker
{
    const HexView& view;
    size_t begin;
    size_t end;

public:
    SanityChecker(const HexView& v, const Offsets& offsets);

    MarkerCounts count() const;
    std::optional<SanityViolation> check() const;
    // Throws the first violation found
    void enforce() const;
};

} // namespace vbios
