#include "flowlayout/document.h"
#include <algorithm>
#include <type_traits>

namespace flowlayout {

namespace {

void shiftOptional(std::optional<int>& pos, int delta) {
    if (pos.has_value()) {
        *pos += delta;
    }
}

/// Widen `range` to include `pos`
void extend(std::optional<PositionRange>& range, const std::optional<int>& pos) {
    if (!pos.has_value()) return;
    if (!range.has_value()) {
        range = PositionRange{*pos, *pos};
        return;
    }
    range->start = std::min(range->start, *pos);
    range->end = std::max(range->end, *pos);
}

std::optional<PositionRange> spanOf(const std::optional<int>& start,
                                    const std::optional<int>& end) {
    std::optional<PositionRange> range;
    extend(range, start);
    extend(range, end);
    return range;
}

void putOptional(Json::Value& obj, const char* key, const std::optional<int>& pos) {
    if (pos.has_value()) {
        obj[key] = *pos;
    }
}

Json::Value attrsToJson(const BlockAttrs& attrs) {
    Json::Value obj = attrs.extra.isObject() ? attrs.extra : Json::Value(Json::objectValue);
    putOptional(obj, "pmStart", attrs.pmStart);
    putOptional(obj, "pmEnd", attrs.pmEnd);
    return obj;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Position-span capability
// ---------------------------------------------------------------------------

void shiftPositions(ParagraphBlock& block, int delta) {
    for (auto& run : block.runs) {
        shiftOptional(run.pmStart, delta);
        shiftOptional(run.pmEnd, delta);
    }
}

void shiftPositions(ImageBlock& block, int delta) {
    shiftOptional(block.attrs.pmStart, delta);
    shiftOptional(block.attrs.pmEnd, delta);
}

void shiftPositions(DrawingBlock& block, int delta) {
    shiftOptional(block.attrs.pmStart, delta);
    shiftOptional(block.attrs.pmEnd, delta);
}

void shiftPositions(BreakBlock&, int) {}

void shiftPositions(SectionBreakBlock& block, int delta) {
    shiftOptional(block.pmStart, delta);
    shiftOptional(block.pmEnd, delta);
}

std::optional<PositionRange> positionRange(const ParagraphBlock& block) {
    std::optional<PositionRange> range;
    for (const auto& run : block.runs) {
        extend(range, run.pmStart);
        extend(range, run.pmEnd);
    }
    return range;
}

std::optional<PositionRange> positionRange(const ImageBlock& block) {
    return spanOf(block.attrs.pmStart, block.attrs.pmEnd);
}

std::optional<PositionRange> positionRange(const DrawingBlock& block) {
    return spanOf(block.attrs.pmStart, block.attrs.pmEnd);
}

std::optional<PositionRange> positionRange(const BreakBlock&) {
    return std::nullopt;
}

std::optional<PositionRange> positionRange(const SectionBreakBlock& block) {
    return spanOf(block.pmStart, block.pmEnd);
}

// ---------------------------------------------------------------------------
// FlowBlock helpers
// ---------------------------------------------------------------------------

const std::string& blockId(const FlowBlock& block) {
    return std::visit([](const auto& b) -> const std::string& { return b.id; }, block);
}

BlockKind blockKind(const FlowBlock& block) {
    return std::visit([](const auto& b) -> BlockKind {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, ParagraphBlock>) {
            return BlockKind::Paragraph;
        } else if constexpr (std::is_same_v<T, ImageBlock>) {
            return BlockKind::Image;
        } else if constexpr (std::is_same_v<T, DrawingBlock>) {
            return BlockKind::Drawing;
        } else if constexpr (std::is_same_v<T, BreakBlock>) {
            return b.kind == BreakKind::Column ? BlockKind::ColumnBreak : BlockKind::PageBreak;
        } else {
            return BlockKind::SectionBreak;
        }
    }, block);
}

const char* blockKindName(BlockKind kind) {
    switch (kind) {
        case BlockKind::Paragraph:    return "paragraph";
        case BlockKind::Image:        return "image";
        case BlockKind::Drawing:      return "drawing";
        case BlockKind::PageBreak:    return "pageBreak";
        case BlockKind::ColumnBreak:  return "columnBreak";
        case BlockKind::SectionBreak: return "sectionBreak";
    }
    return "unknown";
}

bool isFootnoteBlockId(const std::string& id) {
    return id.rfind(kFootnoteIdPrefix, 0) == 0;
}

std::optional<PositionRange> blockPositionRange(const FlowBlock& block) {
    return std::visit([](const auto& b) { return positionRange(b); }, block);
}

FlowBlock shiftBlockPositions(const FlowBlock& block, int delta) {
    FlowBlock copy = block;
    std::visit([delta](auto& b) { shiftPositions(b, delta); }, copy);
    return copy;
}

std::vector<FlowBlock> shiftCachedBlocks(const std::vector<FlowBlock>& blocks, int delta) {
    std::vector<FlowBlock> shifted;
    shifted.reserve(blocks.size());
    for (const auto& block : blocks) {
        shifted.push_back(shiftBlockPositions(block, delta));
    }
    return shifted;
}

Json::Value blockToJson(const FlowBlock& block) {
    Json::Value obj(Json::objectValue);
    obj["kind"] = blockKindName(blockKind(block));
    obj["id"] = blockId(block);

    std::visit([&obj](const auto& b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, ParagraphBlock>) {
            Json::Value runs(Json::arrayValue);
            for (const auto& run : b.runs) {
                Json::Value r(Json::objectValue);
                r["text"] = run.text;
                r["font"] = run.font;
                r["size"] = run.size;
                putOptional(r, "pmStart", run.pmStart);
                putOptional(r, "pmEnd", run.pmEnd);
                runs.append(r);
            }
            obj["runs"] = runs;
        } else if constexpr (std::is_same_v<T, ImageBlock>) {
            obj["src"] = b.src;
            obj["attrs"] = attrsToJson(b.attrs);
        } else if constexpr (std::is_same_v<T, DrawingBlock>) {
            obj["drawingKind"] = b.drawingKind;
            obj["attrs"] = attrsToJson(b.attrs);
        } else if constexpr (std::is_same_v<T, BreakBlock>) {
            obj["attrs"] = b.attrs;
        } else {
            putOptional(obj, "pmStart", b.pmStart);
            putOptional(obj, "pmEnd", b.pmEnd);
            if (b.pageSize) {
                obj["pageSize"]["w"] = b.pageSize->w;
                obj["pageSize"]["h"] = b.pageSize->h;
            }
            if (b.margins) {
                obj["margins"]["top"] = b.margins->top;
                obj["margins"]["right"] = b.margins->right;
                obj["margins"]["bottom"] = b.margins->bottom;
                obj["margins"]["left"] = b.margins->left;
            }
        }
    }, block);

    return obj;
}

} // namespace flowlayout
