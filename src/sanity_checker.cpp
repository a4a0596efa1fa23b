#include "sanity_checker.hpp"
#include "hex_pattern.hpp"
#include "rom_format.hpp"
#include <stdexcept>

namespace vbios {

SanityChecker::SanityChecker(const HexView& v, const Offsets& offsets) : view(v) {
    if (!offsets.header() || !offsets.footer()) {
        throw std::logic_error("Header/footer offsets not set before sanity checks");
    }
    begin = *offsets.header();
    end = *offsets.footer();
}

MarkerCounts SanityChecker::count() const {
    MarkerCounts counts;
    counts.npds = countLiteral(view, NPDS_MARKER, begin, end);
    counts.npde = countLiteral(view, NPDE_MARKER, begin, end);
    if (auto npds = findLiteral(view, NPDS_MARKER, begin, end)) {
        counts.npdeAfterNpds = countLiteral(view, NPDE_MARKER, *npds, end);
    }
    return counts;
}

std::optional<SanityViolation> SanityChecker::check() const {
    using Rule = SanityViolation::Rule;
    const MarkerCounts counts = count();

    if (counts.npds != EXPECTED_NPDS_COUNT) {
        return SanityViolation(Rule::SingleNpds, counts.npds, EXPECTED_NPDS_COUNT);
    }
    if (counts.npde != EXPECTED_NPDE_COUNT) {
        return SanityViolation(Rule::ThreeNpde, counts.npde, EXPECTED_NPDE_COUNT);
    }
    if (counts.npdeAfterNpds != EXPECTED_NPDE_AFTER_NPDS) {
        return SanityViolation(Rule::TwoNpdeAfterNpds, counts.npdeAfterNpds, EXPECTED_NPDE_AFTER_NPDS);
    }
    return std::nullopt;
}

void SanityChecker::enforce() const {
    if (auto violation = check()) {
        throw *violation;
    }
}

} // namespace vbios
