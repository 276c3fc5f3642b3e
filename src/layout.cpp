#include "flowlayout/layout.h"
#include "flowlayout/log.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace flowlayout {

namespace {

constexpr float kEpsilon = 0.001f;

float reserveFor(const std::vector<float>& reserves, int pageIndex) {
    if (pageIndex < 0 || pageIndex >= static_cast<int>(reserves.size())) return 0;
    return std::max(0.0f, reserves[pageIndex]);
}

void checkGeometry(const PageGeometry& geometry) {
    if (geometry.contentHeight() <= 0 || geometry.contentWidth() <= 0) {
        throw GeometryTooSmall("geometry too small to paginate: content area " +
                               std::to_string(geometry.contentWidth()) + "x" +
                               std::to_string(geometry.contentHeight()));
    }
}

PageGeometry applySection(const PageGeometry& current, const SectionBreakBlock& section) {
    PageGeometry next = current;
    if (section.pageSize) next.size = *section.pageSize;
    if (section.margins) next.margins = *section.margins;
    return next;
}

void addWarning(std::vector<LayoutWarning>& warnings, LayoutWarning warning) {
    if (std::find(warnings.begin(), warnings.end(), warning) == warnings.end()) {
        warnings.push_back(warning);
    }
}

bool nearlyEqual(float a, float b) {
    return std::fabs(a - b) <= kEpsilon;
}

bool samePlacement(const Fragment& a, const Fragment& b) {
    return a.kind == b.kind && a.blockId == b.blockId &&
           nearlyEqual(a.x, b.x) && nearlyEqual(a.y, b.y) &&
           nearlyEqual(a.width, b.width) && nearlyEqual(a.height, b.height) &&
           a.fromLine == b.fromLine && a.toLine == b.toLine &&
           a.pmStart == b.pmStart && a.pmEnd == b.pmEnd;
}

bool samePage(const Page& a, const Page& b) {
    if (!nearlyEqual(a.size.w, b.size.w) || !nearlyEqual(a.size.h, b.size.h)) return false;
    if (!nearlyEqual(a.footnoteReserved, b.footnoteReserved)) return false;
    if (a.fragments.size() != b.fragments.size()) return false;
    for (size_t i = 0; i < a.fragments.size(); ++i) {
        if (!samePlacement(a.fragments[i], b.fragments[i])) return false;
    }
    return true;
}

} // anonymous namespace

const char* layoutWarningName(LayoutWarning warning) {
    switch (warning) {
        case LayoutWarning::EmptyContent:           return "EmptyContent";
        case LayoutWarning::GeometryTooSmall:       return "GeometryTooSmall";
        case LayoutWarning::ContentClipped:         return "ContentClipped";
        case LayoutWarning::FootnoteReserveClamped: return "FootnoteReserveClamped";
        case LayoutWarning::FootnoteOverflow:       return "FootnoteOverflow";
        case LayoutWarning::UnresolvedFootnoteRef:  return "UnresolvedFootnoteRef";
        case LayoutWarning::ReserveOscillation:     return "ReserveOscillation";
        case LayoutWarning::ReserveBudgetExhausted: return "ReserveBudgetExhausted";
    }
    return "Unknown";
}

bool Layout::hasWarning(LayoutWarning warning) const {
    return std::find(warnings.begin(), warnings.end(), warning) != warnings.end();
}

bool isFootnoteFragment(const Fragment& fragment) {
    return fragment.kind == FragmentKind::FootnoteSeparator || isFootnoteBlockId(fragment.blockId);
}

std::optional<PositionRange> linesPositionRange(const ParagraphBlock& block,
                                                const Measure& measure,
                                                int fromLine, int toLine) {
    if (fromLine < 0 || toLine <= fromLine || toLine > static_cast<int>(measure.lines.size())) {
        return std::nullopt;
    }
    auto positionAt = [&block](int runIndex, int charOffset) -> std::optional<int> {
        if (runIndex < 0 || runIndex >= static_cast<int>(block.runs.size())) return std::nullopt;
        const auto& run = block.runs[runIndex];
        if (!run.pmStart) return std::nullopt;
        return *run.pmStart + charOffset;
    };
    const auto& first = measure.lines[fromLine];
    const auto& last = measure.lines[toLine - 1];
    auto start = positionAt(first.fromRun, first.fromChar);
    auto end = positionAt(last.toRun, last.toChar);
    if (!start || !end) return std::nullopt;
    return PositionRange{std::min(*start, *end), std::max(*start, *end)};
}

Layout layoutDocument(const std::vector<FlowBlock>& blocks,
                      const std::vector<Measure>& measures,
                      const PageGeometry& geometry,
                      const std::vector<float>& footnoteReservedByPageIndex) {
    if (blocks.size() != measures.size()) {
        throw std::invalid_argument("layoutDocument: " + std::to_string(blocks.size()) +
                                    " blocks but " + std::to_string(measures.size()) +
                                    " measures");
    }
    checkGeometry(geometry);

    Layout result;
    result.pageSize = geometry.size;

    if (blocks.empty()) {
        result.warnings.push_back(LayoutWarning::EmptyContent);
        FL_LOGI("layoutDocument: no blocks");
        return result;
    }

    // Geometry for pages opened from here on; section breaks replace it
    PageGeometry pageGeometry = geometry;

    float cursorY = 0;
    bool keepBlankPage = false;  // Page was opened by an explicit break
    Page currentPage;

    auto openPage = [&](bool fromBreak) {
        currentPage = Page{};
        currentPage.index = static_cast<int>(result.pages.size());
        currentPage.size = pageGeometry.size;
        currentPage.margins = pageGeometry.margins;
        currentPage.footnoteReserved = reserveFor(footnoteReservedByPageIndex, currentPage.index);
        cursorY = 0;
        keepBlankPage = fromBreak;
    };

    auto startNewPage = [&](bool fromBreak, const char* reason) {
        result.pages.push_back(std::move(currentPage));
        openPage(fromBreak);
        FL_LOGD("layout: newPage pageIndex=%d reason=%s reserve=%.1f",
                currentPage.index, reason, currentPage.footnoteReserved);
    };

    auto contentHeight = [&]() {
        return currentPage.size.h - currentPage.margins.top - currentPage.margins.bottom;
    };
    auto contentWidth = [&]() {
        return currentPage.size.w - currentPage.margins.left - currentPage.margins.right;
    };
    auto bandHeight = [&]() {
        return contentHeight() - currentPage.footnoteReserved;
    };

    // Make room for `height` at the cursor, moving to a new page if the current
    // one already holds content. Returns false if even an empty page without
    // any footnote reserve is too short.
    auto makeRoom = [&](float height, const std::string& id) -> bool {
        if (cursorY + height > bandHeight() + kEpsilon && !currentPage.fragments.empty()) {
            startNewPage(false, "overflow");
        }
        if (cursorY + height <= bandHeight() + kEpsilon) {
            return true;
        }
        if (cursorY + height > contentHeight() + kEpsilon) {
            return false;
        }
        // Fits only without the full footnote reserve: shrink the reserve so
        // body content still ends above the band.
        float clamped = std::max(0.0f, contentHeight() - cursorY - height);
        FL_LOGW("layout: page %d reserve %.1f clamped to %.1f to fit '%s'",
                currentPage.index, currentPage.footnoteReserved, clamped, id.c_str());
        currentPage.footnoteReserved = clamped;
        addWarning(result.warnings, LayoutWarning::FootnoteReserveClamped);
        return true;
    };

    openPage(false);

    for (size_t blockIdx = 0; blockIdx < blocks.size(); ++blockIdx) {
        const auto& block = blocks[blockIdx];
        const auto& measure = measures[blockIdx];
        const std::string& id = blockId(block);
        BlockKind kind = blockKind(block);

        // Breaks: always a new page
        if (kind == BlockKind::PageBreak || kind == BlockKind::ColumnBreak) {
            startNewPage(true, blockKindName(kind));
            continue;
        }
        if (kind == BlockKind::SectionBreak) {
            pageGeometry = applySection(pageGeometry, std::get<SectionBreakBlock>(block));
            checkGeometry(pageGeometry);
            startNewPage(true, "sectionBreak");
            continue;
        }

        // Images and drawings: atomic
        if (kind == BlockKind::Image || kind == BlockKind::Drawing) {
            float height = measure.blockHeight();
            bool fits = makeRoom(height, id);

            Fragment fragment;
            fragment.kind = kind == BlockKind::Image ? FragmentKind::Image : FragmentKind::Drawing;
            fragment.blockId = id;
            fragment.x = currentPage.margins.left;
            fragment.y = currentPage.margins.top + cursorY;
            fragment.width = measure.width > 0 ? measure.width : contentWidth();
            fragment.height = height;
            if (!fits) {
                // Taller than the whole content area: the block takes the page
                // alone, so give it the band the reserve would have taken.
                if (currentPage.footnoteReserved > 0) {
                    FL_LOGW("layout: page %d reserve %.1f dropped to fit clipped '%s'",
                            currentPage.index, currentPage.footnoteReserved, id.c_str());
                    currentPage.footnoteReserved = 0;
                    addWarning(result.warnings, LayoutWarning::FootnoteReserveClamped);
                }
                FL_LOGW("layout: %s '%s' height=%.1f exceeds page band %.1f, clipping",
                        blockKindName(kind), id.c_str(), height, bandHeight());
                fragment.height = std::max(0.0f, bandHeight() - cursorY);
                fragment.clipped = true;
                addWarning(result.warnings, LayoutWarning::ContentClipped);
            }
            if (auto range = blockPositionRange(block)) {
                fragment.pmStart = range->start;
                fragment.pmEnd = range->end;
            }
            currentPage.fragments.push_back(fragment);
            cursorY += fragment.height;
            continue;
        }

        // Paragraphs: place line by line, one fragment per page slice
        const auto& paragraph = std::get<ParagraphBlock>(block);
        if (measure.lines.empty()) {
            FL_LOGD("layout: paragraph '%s' has no lines, skipped", id.c_str());
            continue;
        }
        auto blockRange = blockPositionRange(block);

        int openFragment = -1;   // Index of this paragraph's slice on currentPage
        for (int lineIdx = 0; lineIdx < static_cast<int>(measure.lines.size()); ++lineIdx) {
            float lineHeight = measure.lines[lineIdx].lineHeight;
            int pageBefore = currentPage.index;

            if (!makeRoom(lineHeight, id)) {
                throw GeometryTooSmall("geometry too small to paginate: line " +
                                       std::to_string(lineIdx) + " of '" + id +
                                       "' is " + std::to_string(lineHeight) +
                                       " tall, content band is " +
                                       std::to_string(contentHeight()));
            }

            if (currentPage.index != pageBefore && openFragment >= 0) {
                result.pages.back().fragments[openFragment].continuesOnNext = true;
                openFragment = -1;
            }

            if (openFragment < 0) {
                Fragment fragment;
                fragment.kind = FragmentKind::Paragraph;
                fragment.blockId = id;
                fragment.x = currentPage.margins.left;
                fragment.y = currentPage.margins.top + cursorY;
                fragment.width = contentWidth();
                fragment.fromLine = lineIdx;
                fragment.toLine = lineIdx;
                fragment.continuesFromPrev = lineIdx > 0;
                currentPage.fragments.push_back(fragment);
                openFragment = static_cast<int>(currentPage.fragments.size()) - 1;
            }

            auto& fragment = currentPage.fragments[openFragment];
            fragment.toLine = lineIdx + 1;
            fragment.height += lineHeight;
            auto range = linesPositionRange(paragraph, measure, fragment.fromLine, fragment.toLine);
            if (!range) range = blockRange;
            if (range) {
                fragment.pmStart = range->start;
                fragment.pmEnd = range->end;
            }
            cursorY += lineHeight;
        }
    }

    // Keep the last page if it has content, or was opened by a trailing break
    if (!currentPage.fragments.empty() || keepBlankPage || result.pages.empty()) {
        result.pages.push_back(std::move(currentPage));
    }

    FL_LOGI("layoutDocument: pages=%zu blocks=%zu warnings=%zu",
            result.pages.size(), blocks.size(), result.warnings.size());
    return result;
}

std::optional<int> firstChangedPage(const Layout& previous, const Layout& next) {
    size_t common = std::min(previous.pages.size(), next.pages.size());
    for (size_t i = 0; i < common; ++i) {
        if (!samePage(previous.pages[i], next.pages[i])) {
            return static_cast<int>(i);
        }
    }
    if (previous.pages.size() != next.pages.size()) {
        return static_cast<int>(common);
    }
    return std::nullopt;
}

} // namespace flowlayout
