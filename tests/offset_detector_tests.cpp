/**
 * @file offset_detector_tests.cpp
 * @brief Header anchor and footer layout detection
 */

#include "test_helpers.hpp"
#include "../src/errors.hpp"
#include "../src/offset_detector.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace vbios;

// ============================================================================
// Header
// ============================================================================

TEST(HeaderDetectionTests, FindsHeaderAtStart) {
    auto rom = makeRom();
    auto view = HexView::fromBytes(rom.image);
    EXPECT_EQ(detectHeader(view), 0u);
}

TEST(HeaderDetectionTests, FindsHeaderAfterPrefix) {
    RomBuilder b;
    b.filler(8).header().filler(4);
    auto view = HexView::fromBytes(b.build());
    EXPECT_EQ(detectHeader(view), 16u);
}

TEST(HeaderDetectionTests, DetectionIsIdempotent) {
    auto rom = makeRom();
    auto view = HexView::fromBytes(rom.image);
    EXPECT_EQ(detectHeader(view), detectHeader(view));
}

TEST(HeaderDetectionTests, MissingMagicThrows) {
    RomBuilder b;
    b.filler(64).ascii("VIDEO").filler(8);
    auto view = HexView::fromBytes(b.build());
    EXPECT_THROW(detectHeader(view), HeaderNotFound);
}

TEST(HeaderDetectionTests, EmptyImageThrows) {
    EXPECT_THROW(detectHeader(HexView()), HeaderNotFound);
}

TEST(HeaderDetectionTests, MagicWithoutJumpIsSkipped) {
    RomBuilder b;
    b.raw({0x55, 0xAA, 0x7F, 0x90}).filler(10, 0x11).ascii("VIDEO");
    size_t real = b.hexPos();
    b.header();
    auto view = HexView::fromBytes(b.build());
    EXPECT_EQ(detectHeader(view), real);
}

TEST(HeaderDetectionTests, TakesLeftmostOfSeveralHeaders) {
    RomBuilder b;
    b.filler(2);
    size_t first = b.hexPos();
    b.header().filler(20).header();
    auto view = HexView::fromBytes(b.build());
    EXPECT_EQ(detectHeader(view), first);
}

TEST(HeaderDetectionTests, IgnoresHeaderOffByteBoundary) {
    RomBuilder b;
    b.header();
    // shift the whole signature by one digit
    HexView shifted("0" + std::string(HexView::fromBytes(b.build()).str()) + "0");
    EXPECT_THROW(detectHeader(shifted), HeaderNotFound);
}

// ============================================================================
// Footer
// ============================================================================

TEST(FooterDetectionTests, FindsGtx10xxLayout) {
    auto rom = makeRom();
    auto view = HexView::fromBytes(rom.image);

    auto match = detectFooter(view);
    EXPECT_EQ(match.position, rom.footer);
    EXPECT_EQ(match.variant, "GTX 10XX");
}

TEST(FooterDetectionTests, FindsEveryDefaultLayout) {
    for (const auto& layout : PatternCatalog::defaults()) {
        auto rom = makeRom(1, 1, 2, layout.firstGapBytes);
        auto view = HexView::fromBytes(rom.image);

        auto match = detectFooter(view);
        EXPECT_EQ(match.variant, layout.name);
        EXPECT_EQ(match.position, rom.footer) << layout.name;
    }
}

TEST(FooterDetectionTests, CatalogOrderBeatsBufferPosition) {
    RomBuilder b;
    b.header().filler(16);
    b.footer(TestConstants::GTX_980_GAP).filler(64);
    size_t newer = b.hexPos();
    b.footer(TestConstants::RTX_30XX_GAP).filler(16);
    auto view = HexView::fromBytes(b.build());

    auto match = detectFooter(view);
    EXPECT_EQ(match.variant, "RTX 30XX");
    EXPECT_EQ(match.position, newer);
}

TEST(FooterDetectionTests, CustomCatalogPriorityIsHonoured) {
    RomBuilder b;
    b.header().filler(16);
    size_t older = b.hexPos();
    b.footer(TestConstants::GTX_980_GAP).filler(64);
    b.footer(TestConstants::RTX_30XX_GAP).filler(16);
    auto view = HexView::fromBytes(b.build());

    // catalog that knows only the older layout
    PatternCatalog catalog{{"GTX 980", TestConstants::GTX_980_GAP}};
    auto match = detectFooter(view, catalog);
    EXPECT_EQ(match.variant, "GTX 980");
    EXPECT_EQ(match.position, older);
}

TEST(FooterDetectionTests, SearchStartsAtGivenPosition) {
    RomBuilder b;
    b.footer(TestConstants::GTX_10XX_GAP).filler(8);
    size_t header = b.hexPos();
    b.header().filler(16);
    auto view = HexView::fromBytes(b.build());

    EXPECT_NO_THROW(detectFooter(view));
    EXPECT_THROW(detectFooter(view, PatternCatalog::defaults(), header), FooterNotFound);
}

TEST(FooterDetectionTests, UnknownGapThrows) {
    RomBuilder b;
    b.header().filler(16).footer(100).filler(16);
    auto view = HexView::fromBytes(b.build());
    EXPECT_THROW(detectFooter(view), FooterNotFound);
    EXPECT_FALSE(findFooter(view, PatternCatalog::defaults()).has_value());
}

TEST(FooterDetectionTests, TruncatedFooterThrows) {
    RomBuilder b;
    b.header().filler(16).ascii("VN").filler(TestConstants::GTX_10XX_GAP).npds().filler(10);
    auto view = HexView::fromBytes(b.build());
    EXPECT_THROW(detectFooter(view), FooterNotFound);
}

// ============================================================================
// Offsets record
// ============================================================================

TEST(OffsetsTests, FieldsAreWriteOnce) {
    Offsets offsets;
    offsets.setHeader(0);
    EXPECT_THROW(offsets.setHeader(2), std::logic_error);
    offsets.setFooter(10);
    EXPECT_THROW(offsets.setFooter(12), std::logic_error);
    EXPECT_EQ(offsets.header().value(), 0u);
    EXPECT_EQ(offsets.footer().value(), 10u);
}

TEST(OffsetsTests, FooterNeedsHeaderFirst) {
    Offsets offsets;
    EXPECT_THROW(offsets.setFooter(10), std::logic_error);
    EXPECT_FALSE(offsets.footer().has_value());
}

TEST(OffsetsTests, FooterMustFollowHeader) {
    Offsets offsets;
    offsets.setHeader(20);
    EXPECT_THROW(offsets.setFooter(20), std::logic_error);
    EXPECT_THROW(offsets.setFooter(4), std::logic_error);
    EXPECT_FALSE(offsets.footer().has_value());
}
