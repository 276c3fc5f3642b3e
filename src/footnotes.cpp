#include "flowlayout/footnotes.h"
#include "flowlayout/log.h"
#include <algorithm>
#include <set>

namespace flowlayout {

namespace {

constexpr float kOverflowTolerance = 0.5f;

/// Separator rule spans this fraction of the content width
constexpr float kSeparatorWidthFraction = 0.33f;

bool covers(const Fragment& fragment, int pos, bool inclusiveEnd) {
    if (!fragment.pmStart || !fragment.pmEnd) return false;
    if (pos < *fragment.pmStart) return false;
    return inclusiveEnd ? pos <= *fragment.pmEnd : pos < *fragment.pmEnd;
}

} // anonymous namespace

float MeasuredFootnote::height() const {
    float total = 0;
    for (const auto& m : measures) {
        total += m.blockHeight();
    }
    return total;
}

int FootnoteAssignment::pageOf(const std::string& footnoteId) const {
    for (size_t page = 0; page < idsByPage.size(); ++page) {
        const auto& ids = idsByPage[page];
        if (std::find(ids.begin(), ids.end(), footnoteId) != ids.end()) {
            return static_cast<int>(page);
        }
    }
    return -1;
}

std::optional<int> findPageForPosition(const Layout& layout, int pos) {
    // Half-open match first so a position on a boundary belongs to the block
    // that starts there; then accept a reference sitting right at a block end.
    for (bool inclusiveEnd : {false, true}) {
        for (const auto& page : layout.pages) {
            for (const auto& fragment : page.fragments) {
                if (isFootnoteFragment(fragment)) continue;
                if (covers(fragment, pos, inclusiveEnd)) {
                    return page.index;
                }
            }
        }
    }
    return std::nullopt;
}

FootnoteAssignment resolveFootnoteAssignments(const Layout& layout,
                                              const std::vector<FootnoteRef>& refs) {
    FootnoteAssignment assignment;
    assignment.idsByPage.resize(layout.pages.size());

    std::set<std::string> assigned;
    for (const auto& ref : refs) {
        if (assigned.count(ref.id)) continue;
        auto page = findPageForPosition(layout, ref.pos);
        if (!page) {
            if (std::find(assignment.unresolved.begin(), assignment.unresolved.end(), ref.id) ==
                assignment.unresolved.end()) {
                assignment.unresolved.push_back(ref.id);
            }
            continue;
        }
        assignment.idsByPage[*page].push_back(ref.id);
        assigned.insert(ref.id);
    }

    // A later reference may have resolved an id an earlier one could not
    assignment.unresolved.erase(
        std::remove_if(assignment.unresolved.begin(), assignment.unresolved.end(),
                       [&assigned](const std::string& id) { return assigned.count(id) > 0; }),
        assignment.unresolved.end());

    for (const auto& id : assignment.unresolved) {
        FL_LOGW("footnotes: reference '%s' not found on any page, reserving nothing", id.c_str());
    }
    return assignment;
}

std::vector<float> computeFootnoteReserves(const FootnoteAssignment& assignment,
                                           const MeasuredFootnotes& footnotes,
                                           const FootnoteBandStyle& style) {
    std::vector<float> reserves(assignment.idsByPage.size(), 0.0f);
    for (size_t page = 0; page < assignment.idsByPage.size(); ++page) {
        float height = 0;
        bool any = false;
        for (const auto& id : assignment.idsByPage[page]) {
            auto it = footnotes.find(id);
            if (it == footnotes.end()) {
                FL_LOGW("footnotes: no body for footnote '%s'", id.c_str());
                continue;
            }
            height += it->second.height();
            any = true;
        }
        if (any) {
            reserves[page] = style.topPadding + style.dividerHeight + height;
        }
    }
    while (!reserves.empty() && reserves.back() <= 0) {
        reserves.pop_back();
    }
    return reserves;
}

std::string footnoteFragmentId(const std::string& footnoteId, const std::string& blockId) {
    if (isFootnoteBlockId(blockId)) {
        return blockId;
    }
    return std::string(kFootnoteIdPrefix) + footnoteId + "-" + blockId;
}

void placeFootnoteBands(Layout& layout,
                        const FootnoteAssignment& assignment,
                        const MeasuredFootnotes& footnotes,
                        const FootnoteBandStyle& style) {
    bool overflowed = false;

    for (size_t pageIdx = 0; pageIdx < layout.pages.size() && pageIdx < assignment.idsByPage.size(); ++pageIdx) {
        const auto& ids = assignment.idsByPage[pageIdx];
        if (ids.empty()) continue;

        Page& page = layout.pages[pageIdx];
        float contentWidth = page.size.w - page.margins.left - page.margins.right;
        float y = page.footnoteBandTop() + style.topPadding;

        Fragment separator;
        separator.kind = FragmentKind::FootnoteSeparator;
        separator.blockId = std::string(kFootnoteIdPrefix) + "separator-" + std::to_string(page.index);
        separator.x = page.margins.left;
        separator.y = y;
        separator.width = contentWidth * kSeparatorWidthFraction;
        separator.height = style.dividerHeight;
        page.fragments.push_back(separator);
        y += style.dividerHeight;

        for (const auto& id : ids) {
            auto it = footnotes.find(id);
            if (it == footnotes.end()) continue;
            const auto& footnote = it->second;

            for (size_t i = 0; i < footnote.blocks.size() && i < footnote.measures.size(); ++i) {
                const auto& block = footnote.blocks[i];
                const auto& measure = footnote.measures[i];

                Fragment fragment;
                fragment.blockId = footnoteFragmentId(id, blockId(block));
                fragment.x = page.margins.left;
                fragment.y = y;
                fragment.width = contentWidth;
                fragment.height = measure.blockHeight();
                switch (blockKind(block)) {
                    case BlockKind::Paragraph:
                        fragment.kind = FragmentKind::Paragraph;
                        fragment.fromLine = 0;
                        fragment.toLine = static_cast<int>(measure.lines.size());
                        break;
                    case BlockKind::Image:
                        fragment.kind = FragmentKind::Image;
                        break;
                    case BlockKind::Drawing:
                        fragment.kind = FragmentKind::Drawing;
                        break;
                    default:
                        continue;   // Breaks inside a footnote carry no geometry
                }
                if (auto range = blockPositionRange(block)) {
                    fragment.pmStart = range->start;
                    fragment.pmEnd = range->end;
                }
                page.fragments.push_back(fragment);
                y += fragment.height;
            }
        }

        float pageBottom = page.size.h - page.margins.bottom;
        if (y > pageBottom + kOverflowTolerance) {
            FL_LOGW("footnotes: page %d band overflows by %.1f (reserved %.1f)",
                    page.index, y - pageBottom, page.footnoteReserved);
            overflowed = true;
        }
        FL_LOGD("footnotes: page %d band top=%.1f footnotes=%zu",
                page.index, page.footnoteBandTop(), ids.size());
    }

    if (overflowed && !layout.hasWarning(LayoutWarning::FootnoteOverflow)) {
        layout.warnings.push_back(LayoutWarning::FootnoteOverflow);
    }
}

} // namespace flowlayout
