#pragma once

#include "flowlayout/document.h"
#include <vector>

namespace flowlayout {

/// One measured line of a paragraph. Line boundaries are expressed as
/// (run index, character offset within that run).
struct LineMeasure {
    int fromRun = 0;
    int fromChar = 0;
    int toRun = 0;
    int toChar = 0;
    float width = 0;
    float ascent = 0;
    float descent = 0;
    float lineHeight = 0;
};

enum class MeasureKind {
    Paragraph,
    Image,
    Drawing,
    Break,
};

/// Geometry computed for a single block. Immutable once produced.
struct Measure {
    MeasureKind kind = MeasureKind::Paragraph;
    std::vector<LineMeasure> lines;   // Paragraph only
    float totalHeight = 0;            // Paragraph: sum of line heights
    float width = 0;                  // Image / Drawing
    float height = 0;                 // Image / Drawing

    /// Vertical space the whole block occupies
    float blockHeight() const {
        switch (kind) {
            case MeasureKind::Paragraph: return totalHeight;
            case MeasureKind::Image:
            case MeasureKind::Drawing:   return height;
            case MeasureKind::Break:     return 0;
        }
        return 0;
    }
};

/// A block together with the measurement produced for it
struct MeasuredBlock {
    FlowBlock block;
    Measure measure;
};

/// Abstract interface for the host's measurement service.
/// Implementations wrap the real text shaper / image decoder; the layout
/// core never computes font metrics itself.
class MeasureAdapter {
public:
    virtual ~MeasureAdapter() = default;

    /// Measure one block. Must be a pure function of the block's content:
    /// identical blocks yield identical measures. When parallel measurement is
    /// enabled this is called concurrently for distinct blocks.
    virtual Measure measureBlock(const FlowBlock& block) = 0;
};

} // namespace flowlayout
