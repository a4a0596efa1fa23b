#include "vbios_rom.hpp"
#include "sanity_checker.hpp"
#include "splicer.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace vbios {

std::string_view to_string(RunState state) {
    switch (state) {
        case RunState::Init:              return "Init";
        case RunState::HeaderFound:       return "HeaderFound";
        case RunState::FooterFound:       return "FooterFound";
        case RunState::FooterSkipped:     return "FooterSkipped";
        case RunState::Validated:         return "Validated";
        case RunState::SkippedValidation: return "SkippedValidation";
        case RunState::Spliced:           return "Spliced";
        case RunState::Failed:            return "Failed";
    }
    return "Unknown";
}

VbiosRom::VbiosRom(const std::vector<uint8_t>& image) : view(HexView::fromBytes(image)) {}

void VbiosRom::require(std::initializer_list<RunState> allowed, const char* step) const {
    if (current == RunState::Failed) {
        throw std::logic_error(std::string(step) + ": run already failed: " + failure);
    }
    if (std::find(allowed.begin(), allowed.end(), current) == allowed.end()) {
        throw std::logic_error(std::string(step) + " not allowed in state " + std::string(to_string(current)));
    }
}

void VbiosRom::fail(const RomError& err) {
    current = RunState::Failed;
    failure = err.what();
    throw;
}

void VbiosRom::detectOffsets(bool stripFooter, const PatternCatalog& catalog) {
    require({RunState::Init}, "detectOffsets");

    try {
        offs.setHeader(detectHeader(view));
        current = RunState::HeaderFound;

        if (!stripFooter) {
            current = RunState::FooterSkipped;
            return;
        }

        // start one byte past the header so the footer always follows it
        FooterMatch footer = detectFooter(view, catalog, *offs.header() + 2);
        offs.setFooter(footer.position);
        footerVariant = std::move(footer.variant);
        current = RunState::FooterFound;
    } catch (const RomError& err) {
        fail(err);
    }
}

std::optional<SanityViolation> VbiosRom::runSanityChecks(bool violationsFatal) {
    require({RunState::FooterFound, RunState::FooterSkipped}, "runSanityChecks");

    if (current == RunState::FooterSkipped) {
        current = RunState::SkippedValidation;
        return std::nullopt;
    }

    try {
        SanityChecker checker(view, offs);
        if (violationsFatal) {
            checker.enforce();
        } else {
            ignored = checker.check();
        }
        current = RunState::Validated;
    } catch (const RomError& err) {
        fail(err);
    }
    return ignored;
}

std::vector<uint8_t> VbiosRom::splice() {
    require({RunState::Validated, RunState::SkippedValidation}, "splice");

    try {
        auto rom = vbios::splice(view, offs, current == RunState::Validated);
        current = RunState::Spliced;
        return rom;
    } catch (const RomError& err) {
        fail(err);
    }
}

SpliceResult run(const std::vector<uint8_t>& image, const PipelineOptions& options) {
    if (!options.catalog) {
        throw std::invalid_argument("Pipeline options carry no footer catalog");
    }

    VbiosRom rom(image);
    rom.detectOffsets(options.stripFooter, *options.catalog);
    rom.runSanityChecks(options.sanityViolationsFatal);

    SpliceResult result;
    result.rom = rom.splice();
    result.offsets = rom.offsets();
    result.variant = rom.variant();
    result.ignoredViolation = rom.ignoredViolation();
    return result;
}

} // namespace vbios
