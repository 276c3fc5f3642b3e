#pragma once

#include "flowlayout/geometry.h"
#include <json/json.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace flowlayout {

/// Id prefix reserved for footnote body blocks and the fragments placed from them.
/// Body and footnote bands are told apart by this prefix alone.
inline constexpr const char* kFootnoteIdPrefix = "footnote-";

/// A run of uniformly formatted text inside a paragraph
struct Run {
    std::string text;
    std::string font;
    float size = 12.0f;
    std::optional<int> pmStart;   // Document position of the first character
    std::optional<int> pmEnd;     // Document position after the last character
};

/// Attributes of image and drawing blocks: positions plus whatever the
/// document adapter attached. `extra` is carried through untouched.
struct BlockAttrs {
    std::optional<int> pmStart;
    std::optional<int> pmEnd;
    Json::Value extra{Json::objectValue};
};

struct ParagraphBlock {
    std::string id;
    std::vector<Run> runs;
};

struct ImageBlock {
    std::string id;
    std::string src;
    BlockAttrs attrs;
};

struct DrawingBlock {
    std::string id;
    std::string drawingKind;     // e.g. "vectorShape", "shapeGroup"
    BlockAttrs attrs;
};

enum class BreakKind {
    Page,
    Column,
};

/// Page or column break. Carries no positions of its own.
struct BreakBlock {
    std::string id;
    BreakKind kind = BreakKind::Page;
    Json::Value attrs{Json::objectValue};
};

/// Section boundary. Positions sit on the block itself; geometry overrides
/// apply to every page opened after the break.
struct SectionBreakBlock {
    std::string id;
    std::optional<int> pmStart;
    std::optional<int> pmEnd;
    std::optional<PageSize> pageSize;
    std::optional<Margins> margins;
};

/// One unit of layoutable content
using FlowBlock = std::variant<ParagraphBlock, ImageBlock, DrawingBlock,
                               BreakBlock, SectionBreakBlock>;

enum class BlockKind {
    Paragraph,
    Image,
    Drawing,
    PageBreak,
    ColumnBreak,
    SectionBreak,
};

/// Closed document-position range [start, end]
struct PositionRange {
    int start = 0;
    int end = 0;
};

// ---------------------------------------------------------------------------
// Position-span capability. Every block kind provides both overloads;
// the FlowBlock-level helpers below dispatch to them.
// ---------------------------------------------------------------------------

void shiftPositions(ParagraphBlock& block, int delta);
void shiftPositions(ImageBlock& block, int delta);
void shiftPositions(DrawingBlock& block, int delta);
void shiftPositions(BreakBlock& block, int delta);
void shiftPositions(SectionBreakBlock& block, int delta);

std::optional<PositionRange> positionRange(const ParagraphBlock& block);
std::optional<PositionRange> positionRange(const ImageBlock& block);
std::optional<PositionRange> positionRange(const DrawingBlock& block);
std::optional<PositionRange> positionRange(const BreakBlock& block);
std::optional<PositionRange> positionRange(const SectionBreakBlock& block);

// ---------------------------------------------------------------------------
// FlowBlock helpers
// ---------------------------------------------------------------------------

const std::string& blockId(const FlowBlock& block);
BlockKind blockKind(const FlowBlock& block);
const char* blockKindName(BlockKind kind);

/// True for ids carrying kFootnoteIdPrefix
bool isFootnoteBlockId(const std::string& id);

/// Range spanned by every position the block carries, or nullopt if it has none
std::optional<PositionRange> blockPositionRange(const FlowBlock& block);

/// Return a copy of `block` with every position it carries moved by `delta`.
/// Absent positions stay absent. The input is never modified.
FlowBlock shiftBlockPositions(const FlowBlock& block, int delta);

/// Element-wise shiftBlockPositions into a new vector
std::vector<FlowBlock> shiftCachedBlocks(const std::vector<FlowBlock>& blocks, int delta);

/// Canonical JSON snapshot of a block (object keys sorted by jsoncpp).
/// Serves as the source node when the caller has no richer document node.
Json::Value blockToJson(const FlowBlock& block);

} // namespace flowlayout
