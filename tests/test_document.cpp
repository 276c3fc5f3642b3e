#include <gtest/gtest.h>
#include "flowlayout/document.h"
#include "flowlayout/cache.h"
#include "mock_measure_adapter.h"

using namespace flowlayout;

// MARK: - Block Kind Tests

TEST(BlockModelTest, KindAndIdDispatch) {
    FlowBlock paragraph = makeParagraph("p1", "Hello", 0);
    FlowBlock image = makeImage("img", 10);
    FlowBlock pageBreak = makePageBreak("br");
    BreakBlock columnBreak;
    columnBreak.id = "col";
    columnBreak.kind = BreakKind::Column;
    SectionBreakBlock section;
    section.id = "sec";

    EXPECT_EQ(blockKind(paragraph), BlockKind::Paragraph);
    EXPECT_EQ(blockKind(image), BlockKind::Image);
    EXPECT_EQ(blockKind(pageBreak), BlockKind::PageBreak);
    EXPECT_EQ(blockKind(FlowBlock(columnBreak)), BlockKind::ColumnBreak);
    EXPECT_EQ(blockKind(FlowBlock(section)), BlockKind::SectionBreak);

    EXPECT_EQ(blockId(paragraph), "p1");
    EXPECT_EQ(blockId(image), "img");
    EXPECT_STREQ(blockKindName(BlockKind::ColumnBreak), "columnBreak");
}

TEST(BlockModelTest, FootnoteIdPrefix) {
    EXPECT_TRUE(isFootnoteBlockId("footnote-1-p0"));
    EXPECT_FALSE(isFootnoteBlockId("p-footnote-1"));
    EXPECT_FALSE(isFootnoteBlockId(""));
}

// MARK: - Position Range Tests

TEST(BlockModelTest, ParagraphRangeSpansAllRuns) {
    ParagraphBlock p = makeParagraph("p", "abc", 10);
    flowlayout::Run second;
    second.text = "def";
    second.pmStart = 14;
    second.pmEnd = 17;
    p.runs.push_back(second);

    auto range = blockPositionRange(p);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->start, 10);
    EXPECT_EQ(range->end, 17);
}

TEST(BlockModelTest, BlocksWithoutPositionsHaveNoRange) {
    EXPECT_FALSE(blockPositionRange(makeBareParagraph("p", "abc")).has_value());
    EXPECT_FALSE(blockPositionRange(makePageBreak("br")).has_value());
}

// MARK: - Shift Tests

TEST(ShiftTest, ParagraphRunsShiftIndependently) {
    ParagraphBlock p = makeParagraph("p", "abc", 10);
    flowlayout::Run bare;
    bare.text = "no positions";
    p.runs.push_back(bare);

    FlowBlock shifted = shiftBlockPositions(p, 5);
    const auto& runs = std::get<ParagraphBlock>(shifted).runs;
    ASSERT_EQ(runs.size(), 2);
    EXPECT_EQ(runs[0].pmStart, 15);
    EXPECT_EQ(runs[0].pmEnd, 18);
    // Absent positions are not manufactured
    EXPECT_FALSE(runs[1].pmStart.has_value());
    EXPECT_FALSE(runs[1].pmEnd.has_value());
}

TEST(ShiftTest, ImageAttrsKeepCustomKeys) {
    ImageBlock image = makeImage("img", 20);
    image.attrs.extra["alt"] = "a picture";
    image.attrs.extra["inline"] = true;
    image.attrs.extra["scale"] = 0.5;

    FlowBlock shifted = shiftBlockPositions(image, -3);
    const auto& attrs = std::get<ImageBlock>(shifted).attrs;
    EXPECT_EQ(attrs.pmStart, 17);
    EXPECT_EQ(attrs.pmEnd, 18);
    EXPECT_EQ(attrs.extra["alt"].asString(), "a picture");
    EXPECT_TRUE(attrs.extra["inline"].asBool());
    EXPECT_DOUBLE_EQ(attrs.extra["scale"].asDouble(), 0.5);
    EXPECT_EQ(std::get<ImageBlock>(shifted).src, "img.png");
}

TEST(ShiftTest, DrawingOnlyStartPresent) {
    DrawingBlock drawing;
    drawing.id = "d";
    drawing.drawingKind = "vectorShape";
    drawing.attrs.pmStart = 7;

    FlowBlock shifted = shiftBlockPositions(drawing, 3);
    const auto& attrs = std::get<DrawingBlock>(shifted).attrs;
    EXPECT_EQ(attrs.pmStart, 10);
    EXPECT_FALSE(attrs.pmEnd.has_value());
}

TEST(ShiftTest, SectionBreakTopLevelPositions) {
    SectionBreakBlock section;
    section.id = "sec";
    section.pmStart = 40;
    section.pmEnd = 41;
    section.margins = Margins{36, 36, 36, 36};

    FlowBlock shifted = shiftBlockPositions(section, 10);
    const auto& s = std::get<SectionBreakBlock>(shifted);
    EXPECT_EQ(s.pmStart, 50);
    EXPECT_EQ(s.pmEnd, 51);
    ASSERT_TRUE(s.margins.has_value());
    EXPECT_FLOAT_EQ(s.margins->top, 36);
}

TEST(ShiftTest, BreakWithoutPositionsIsCopied) {
    BreakBlock br = makePageBreak("br");
    br.attrs["reason"] = "manual";
    FlowBlock original = br;

    FlowBlock shifted = shiftBlockPositions(original, 0);
    EXPECT_NE(&shifted, &original);
    EXPECT_EQ(blockId(shifted), "br");
    EXPECT_EQ(std::get<BreakBlock>(shifted).attrs["reason"].asString(), "manual");
}

TEST(ShiftTest, InputIsNeverModified) {
    FlowBlock original = makeParagraph("p", "abc", 10);
    FlowBlock shifted = shiftBlockPositions(original, 0);
    EXPECT_NE(&shifted, &original);

    FlowBlock moved = shiftBlockPositions(original, 100);
    EXPECT_EQ(std::get<ParagraphBlock>(original).runs[0].pmStart, 10);
    EXPECT_EQ(std::get<ParagraphBlock>(moved).runs[0].pmStart, 110);
}

TEST(ShiftTest, ShiftsAreAdditive) {
    std::vector<FlowBlock> blocks = {
        makeParagraph("p", "hello world", 3),
        makeImage("img", 20),
    };
    SectionBreakBlock section;
    section.id = "sec";
    section.pmStart = 30;
    blocks.push_back(section);

    for (const auto& block : blocks) {
        auto twice = blockPositionRange(shiftBlockPositions(shiftBlockPositions(block, 7), -2));
        auto once = blockPositionRange(shiftBlockPositions(block, 5));
        ASSERT_TRUE(twice.has_value()) << blockId(block);
        ASSERT_TRUE(once.has_value()) << blockId(block);
        EXPECT_EQ(twice->start, once->start) << blockId(block);
        EXPECT_EQ(twice->end, once->end) << blockId(block);
    }
}

TEST(ShiftTest, ShiftCachedBlocksIsElementWise) {
    std::vector<FlowBlock> blocks = {
        makeParagraph("a", "one", 0),
        makePageBreak("br"),
        makeImage("img", 9),
    };
    auto shifted = shiftCachedBlocks(blocks, 4);
    ASSERT_EQ(shifted.size(), 3);
    EXPECT_EQ(blockPositionRange(shifted[0])->start, 4);
    EXPECT_FALSE(blockPositionRange(shifted[1]).has_value());
    EXPECT_EQ(blockPositionRange(shifted[2])->start, 13);
    EXPECT_EQ(blockPositionRange(blocks[0])->start, 0);
}

// MARK: - Serialization Tests

TEST(BlockJsonTest, ParagraphSnapshot) {
    Json::Value json = blockToJson(makeParagraph("p1", "Hi", 5));
    EXPECT_EQ(json["kind"].asString(), "paragraph");
    EXPECT_EQ(json["id"].asString(), "p1");
    ASSERT_EQ(json["runs"].size(), 1u);
    EXPECT_EQ(json["runs"][0]["text"].asString(), "Hi");
    EXPECT_EQ(json["runs"][0]["pmStart"].asInt(), 5);
    EXPECT_EQ(json["runs"][0]["pmEnd"].asInt(), 7);
}

TEST(BlockJsonTest, ImageAttrsIncludePositionsAndExtra) {
    ImageBlock image = makeImage("img", 3);
    image.attrs.extra["alt"] = "x";
    Json::Value json = blockToJson(image);
    EXPECT_EQ(json["kind"].asString(), "image");
    EXPECT_EQ(json["attrs"]["alt"].asString(), "x");
    EXPECT_EQ(json["attrs"]["pmStart"].asInt(), 3);
}

TEST(BlockJsonTest, CanonicalFormIgnoresKeyInsertionOrder) {
    ImageBlock a = makeImage("img", 3);
    a.attrs.extra["alpha"] = 1;
    a.attrs.extra["beta"] = 2;
    ImageBlock b = makeImage("img", 3);
    b.attrs.extra["beta"] = 2;
    b.attrs.extra["alpha"] = 1;
    EXPECT_EQ(canonicalJson(blockToJson(a)), canonicalJson(blockToJson(b)));
}

TEST(BlockJsonTest, ContentChangeChangesSnapshot) {
    EXPECT_NE(canonicalJson(blockToJson(makeParagraph("p", "hello", 0))),
              canonicalJson(blockToJson(makeParagraph("p", "hello world", 0))));
}
