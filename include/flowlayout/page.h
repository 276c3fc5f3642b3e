#pragma once

#include "flowlayout/geometry.h"
#include <optional>
#include <string>
#include <vector>

namespace flowlayout {

enum class FragmentKind {
    Paragraph,
    Image,
    Drawing,
    FootnoteSeparator,
};

/// The placed occurrence of a block, or of a slice of a paragraph's lines,
/// on one page. Coordinates are page-relative (origin = page top-left).
struct Fragment {
    FragmentKind kind = FragmentKind::Paragraph;
    std::string blockId;
    float x = 0;
    float y = 0;
    float width = 0;
    float height = 0;

    // Paragraph slices: lines [fromLine, toLine) of the block's measure
    int fromLine = -1;
    int toLine = -1;
    bool continuesFromPrev = false;
    bool continuesOnNext = false;

    bool clipped = false;    // Atomic content taller than the page band

    // Document positions covered by this fragment
    std::optional<int> pmStart;
    std::optional<int> pmEnd;

    float bottom() const { return y + height; }
};

/// A single laid-out page
struct Page {
    int index = 0;
    PageSize size;
    Margins margins;
    float footnoteReserved = 0;   // Height withheld at the bottom for footnotes
    std::vector<Fragment> fragments;

    /// Body fragments never extend below this line
    float footnoteBandTop() const {
        return size.h - margins.bottom - footnoteReserved;
    }
};

/// Warning types that may occur during layout
enum class LayoutWarning {
    EmptyContent,
    GeometryTooSmall,
    ContentClipped,
    FootnoteReserveClamped,
    FootnoteOverflow,
    UnresolvedFootnoteRef,
    ReserveOscillation,
    ReserveBudgetExhausted,
};

const char* layoutWarningName(LayoutWarning warning);

/// Result of paginating a block sequence
struct Layout {
    PageSize pageSize;
    std::vector<Page> pages;
    std::vector<LayoutWarning> warnings;

    bool hasWarning(LayoutWarning warning) const;
};

/// True for footnote band fragments (footnote bodies and separators)
bool isFootnoteFragment(const Fragment& fragment);

} // namespace flowlayout
