#pragma once
#include "errors.hpp"
#include "hex_codec.hpp"
#include "offset_detector.hpp"
#include "pattern_catalog.hpp"
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vbios {

enum class RunState
{
    Init,
    HeaderFound,
    FooterFound,
    FooterSkipped,
    Validated,
    SkippedValidation,
    Spliced,
    Failed,
};

std::string_view to_string(RunState state);

struct PipelineOptions
{
    bool stripFooter = true;
    bool sanityViolationsFatal = true;
    const PatternCatalog* catalog = &PatternCatalog::defaults();
};

/**
 * One splice run over a ROM image.
 *
 *   Init -> HeaderFound -> FooterFound   -> Validated         -> Spliced
 *                       -> FooterSkipped -> SkippedValidation -> Spliced
 *
 * Steps must be called in that order; anything else throws std::logic_error.
 * A RomError thrown by a step is rethrown after moving the run to Failed,
 * which is terminal.
 */
class VbiosRom
{
    HexView view;
    Offsets offs;
    RunState current = RunState::Init;
    std::string failure;
    std::optional<std::string> footerVariant;
    std::optional<SanityViolation> ignored;

public:
    explicit VbiosRom(const std::vector<uint8_t>& image);

    // Header always, footer only when stripFooter is set
    void detectOffsets(bool stripFooter = true, const PatternCatalog& catalog = PatternCatalog::defaults());

    /**
     * Does nothing but advance the state when the footer was skipped.
     * A violation either throws (violationsFatal) or is returned and kept
     * in ignoredViolation() while the run carries on.
     */
    std::optional<SanityViolation> runSanityChecks(bool violationsFatal = true);

    std::vector<uint8_t> splice();

    RunState state() const { return current; }
    const std::string& failureReason() const { return failure; }
    const Offsets& offsets() const { return offs; }
    const HexView& hexView() const { return view; }
    const std::optional<std::string>& variant() const { return footerVariant; }
    const std::optional<SanityViolation>& ignoredViolation() const { return ignored; }

private:
    void require(std::initializer_list<RunState> allowed, const char* step) const;
    [[noreturn]] void fail(const RomError& err);
};

struct SpliceResult
{
    std::vector<uint8_t> rom;
    Offsets offsets;
    std::optional<std::string> variant;
    std::optional<SanityViolation> ignoredViolation;
};

// Whole pipeline in one call
SpliceResult run(const std::vector<uint8_t>& image, const PipelineOptions& options = {});

} // namespace vbios
