#pragma once

#include "flowlayout/document.h"
#include "flowlayout/page.h"
#include "flowlayout/platform.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace flowlayout {

/// A footnote reference mark at document position `pos`
struct FootnoteRef {
    std::string id;
    int pos = 0;
};

/// Footnotes supplied by the caller alongside the body blocks
struct FootnoteInput {
    std::vector<FootnoteRef> refs;
    std::map<std::string, std::vector<FlowBlock>> blocksById;
};

/// A footnote's body blocks with their measures
struct MeasuredFootnote {
    std::vector<FlowBlock> blocks;
    std::vector<Measure> measures;

    float height() const;
};

using MeasuredFootnotes = std::map<std::string, MeasuredFootnote>;

/// Footnote band decoration sizes
struct FootnoteBandStyle {
    float topPadding = 4.0f;
    float dividerHeight = 2.0f;
};

/// Which footnotes landed on which page
struct FootnoteAssignment {
    std::vector<std::vector<std::string>> idsByPage;   // [pageIndex] -> ids in reference order
    std::vector<std::string> unresolved;               // Refs whose position hit no page

    /// Page holding `footnoteId`, or -1
    int pageOf(const std::string& footnoteId) const;
};

/// Page whose body fragments cover document position `pos`
std::optional<int> findPageForPosition(const Layout& layout, int pos);

/// Resolve every reference to a page. A footnote referenced more than once
/// is assigned to the page of its first resolvable reference.
FootnoteAssignment resolveFootnoteAssignments(const Layout& layout,
                                              const std::vector<FootnoteRef>& refs);

/// Reserve per page: top padding + divider + the heights of its footnotes.
/// Pages without footnotes reserve nothing. Trailing zero pages are trimmed.
std::vector<float> computeFootnoteReserves(const FootnoteAssignment& assignment,
                                           const MeasuredFootnotes& footnotes,
                                           const FootnoteBandStyle& style);

/// Id of the fragment placed for `blockId` of footnote `footnoteId`.
/// Always carries kFootnoteIdPrefix.
std::string footnoteFragmentId(const std::string& footnoteId, const std::string& blockId);

/// Place each page's footnotes into its band, starting at footnoteBandTop():
/// top padding, a separator fragment, then the footnote bodies in order.
void placeFootnoteBands(Layout& layout,
                        const FootnoteAssignment& assignment,
                        const MeasuredFootnotes& footnotes,
                        const FootnoteBandStyle& style);

} // namespace flowlayout
