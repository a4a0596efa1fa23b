#include "test_helpers.hpp"
#include "../src/errors.hpp"
#include "../src/splicer.hpp"

#include <gtest/gtest.h>

using namespace vbios;

TEST(SplicerTests, WithFooterStopsAtFooter) {
    auto rom = makeRom();
    auto view = HexView::fromBytes(rom.image);
    Offsets offsets;
    offsets.setHeader(rom.header);
    offsets.setFooter(rom.footer);

    auto out = splice(view, offsets, true);
    EXPECT_EQ(out.size(), (rom.footer - rom.header) / 2);
    expectBytes(out, extractBytes(rom.image, rom.header / 2, (rom.footer - rom.header) / 2));
}

TEST(SplicerTests, WithoutFooterRunsToEnd) {
    RomBuilder b;
    b.filler(6, 0xFF);
    size_t header = b.hexPos();
    b.header().filler(40, 0x42);
    auto image = b.build();
    auto view = HexView::fromBytes(image);
    Offsets offsets;
    offsets.setHeader(header);

    auto out = splice(view, offsets, false);
    EXPECT_EQ(out.size(), (view.size() - header) / 2);
    expectBytes(out, extractBytes(image, 6, image.size() - 6));
}

TEST(SplicerTests, IgnoresSetFooterWhenNotIncluded) {
    auto rom = makeRom();
    auto view = HexView::fromBytes(rom.image);
    Offsets offsets;
    offsets.setHeader(rom.header);
    offsets.setFooter(rom.footer);

    EXPECT_EQ(splice(view, offsets, false), rom.image);
}

TEST(SplicerTests, OutputDoesNotAliasImage) {
    auto rom = makeRom();
    auto view = HexView::fromBytes(rom.image);
    Offsets offsets;
    offsets.setHeader(rom.header);

    auto out = splice(view, offsets, false);
    rom.image[0] = 0x00;
    EXPECT_EQ(out[0], 0x55);
}

TEST(SplicerTests, MissingHeaderThrows) {
    auto view = HexView::fromBytes(makeRom().image);
    EXPECT_THROW(splice(view, Offsets(), false), HeaderNotFound);
}

TEST(SplicerTests, MissingFooterThrowsWhenIncluded) {
    auto rom = makeRom();
    auto view = HexView::fromBytes(rom.image);
    Offsets offsets;
    offsets.setHeader(rom.header);
    EXPECT_THROW(splice(view, offsets, true), FooterNotFound);
}

TEST(SplicerTests, OddOffsetFailsToDecode) {
    auto rom = makeRom();
    auto view = HexView::fromBytes(rom.image);
    Offsets offsets;
    offsets.setHeader(1);
    offsets.setFooter(rom.footer);
    EXPECT_THROW(splice(view, offsets, true), DecodeError);
}
