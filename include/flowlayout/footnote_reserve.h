#pragma once

#include "flowlayout/footnotes.h"
#include "flowlayout/page.h"
#include <functional>
#include <vector>

namespace flowlayout {

/// Paginates the body with a given per-page footnote reservation vector
using PaginateFn = std::function<Layout(const std::vector<float>& reserves)>;

enum class ReserveOutcome {
    NoFootnotes,       // Nothing to reserve; single pass
    Converged,         // Proposed reserves equal the ones used
    Oscillated,        // Proposals cycled; relaid with the cheapest cycle vector widened
                       // page-wise by the reserves its own layout demanded
    BudgetExhausted,   // Pass budget spent; relaid with the last proposal
};

const char* reserveOutcomeName(ReserveOutcome outcome);

struct ReserveLoopResult {
    Layout layout;
    std::vector<float> reserves;      // Vector the returned layout was produced with
    FootnoteAssignment assignment;    // Footnote pages in the returned layout
    int passes = 0;                   // Pagination calls made
    ReserveOutcome outcome = ReserveOutcome::NoFootnotes;
};

/// Reserve vectors are equal when they differ by less than a hundredth of a
/// unit on every page; missing trailing pages count as zero.
bool reservesEqual(const std::vector<float>& a, const std::vector<float>& b);

float totalReserved(const std::vector<float>& reserves);

/// Page-wise maximum
std::vector<float> maxReserves(const std::vector<float>& a, const std::vector<float>& b);

/// Repeats pagination with updated footnote reservations until the
/// reservation vector reaches a fixed point, starts cycling, or the pass
/// budget runs out. Always returns a layout, with footnote bands placed on
/// the pages the final pass assigned them to.
///
/// Passes are strictly sequential: each proposal derives only from the
/// layout of the pass before it.
class FootnoteReserveLoop {
public:
    FootnoteReserveLoop(PaginateFn paginate,
                        const MeasuredFootnotes& footnotes,
                        FootnoteBandStyle style,
                        int maxPasses);

    ReserveLoopResult run(const std::vector<FootnoteRef>& refs);

private:
    PaginateFn paginate_;
    const MeasuredFootnotes& footnotes_;
    FootnoteBandStyle style_;
    int maxPasses_;

    /// Pick the vector to settle on once `history[cycleStart..]` has repeated
    std::vector<float> settleOscillation(const std::vector<std::vector<float>>& history,
                                         size_t cycleStart,
                                         const std::vector<float>& proposed) const;
};

} // namespace flowlayout
