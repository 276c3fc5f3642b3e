#pragma once

#include "flowlayout/document.h"
#include "flowlayout/geometry.h"
#include "flowlayout/page.h"
#include "flowlayout/platform.h"
#include <optional>
#include <stdexcept>
#include <vector>

namespace flowlayout {

/// The only failure pagination reports by exception: the page content band
/// cannot hold a single line (or is empty to begin with).
class GeometryTooSmall : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Paginate `blocks` (with their measures, same order and length) into pages.
///
/// Page i withholds footnoteReservedByPageIndex[i] (0 past the end of the
/// vector) at the bottom of its content band; no body fragment crosses
/// Page::footnoteBandTop(). Breaks always open a new page. Footnote bodies are
/// not placed here; see placeFootnoteBands().
///
/// Throws std::invalid_argument if the measure count does not match, and
/// GeometryTooSmall if a line cannot fit on an empty page.
Layout layoutDocument(const std::vector<FlowBlock>& blocks,
                      const std::vector<Measure>& measures,
                      const PageGeometry& geometry,
                      const std::vector<float>& footnoteReservedByPageIndex);

/// Document positions covered by lines [fromLine, toLine) of a paragraph
std::optional<PositionRange> linesPositionRange(const ParagraphBlock& block,
                                                const Measure& measure,
                                                int fromLine, int toLine);

/// Index of the first page whose placement differs between two layouts,
/// or nullopt if they are identical
std::optional<int> firstChangedPage(const Layout& previous, const Layout& next);

} // namespace flowlayout
