#include "flowlayout/footnote_reserve.h"
#include "flowlayout/log.h"
#include <algorithm>
#include <cmath>
#include <optional>

namespace flowlayout {

namespace {

constexpr float kReserveEpsilon = 0.01f;

float at(const std::vector<float>& reserves, size_t index) {
    return index < reserves.size() ? reserves[index] : 0.0f;
}

void addWarning(Layout& layout, LayoutWarning warning) {
    if (!layout.hasWarning(warning)) {
        layout.warnings.push_back(warning);
    }
}

} // anonymous namespace

const char* reserveOutcomeName(ReserveOutcome outcome) {
    switch (outcome) {
        case ReserveOutcome::NoFootnotes:     return "NoFootnotes";
        case ReserveOutcome::Converged:       return "Converged";
        case ReserveOutcome::Oscillated:      return "Oscillated";
        case ReserveOutcome::BudgetExhausted: return "BudgetExhausted";
    }
    return "Unknown";
}

bool reservesEqual(const std::vector<float>& a, const std::vector<float>& b) {
    size_t n = std::max(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if (std::fabs(at(a, i) - at(b, i)) >= kReserveEpsilon) return false;
    }
    return true;
}

float totalReserved(const std::vector<float>& reserves) {
    float total = 0;
    for (float r : reserves) total += r;
    return total;
}

std::vector<float> maxReserves(const std::vector<float>& a, const std::vector<float>& b) {
    std::vector<float> merged(std::max(a.size(), b.size()), 0.0f);
    for (size_t i = 0; i < merged.size(); ++i) {
        merged[i] = std::max(at(a, i), at(b, i));
    }
    return merged;
}

// ---------------------------------------------------------------------------
// FootnoteReserveLoop
// ---------------------------------------------------------------------------

FootnoteReserveLoop::FootnoteReserveLoop(PaginateFn paginate,
                                         const MeasuredFootnotes& footnotes,
                                         FootnoteBandStyle style,
                                         int maxPasses)
    : paginate_(std::move(paginate))
    , footnotes_(footnotes)
    , style_(style)
    , maxPasses_(std::max(1, maxPasses)) {}

ReserveLoopResult FootnoteReserveLoop::run(const std::vector<FootnoteRef>& refs) {
    ReserveLoopResult result;
    std::vector<float> reserves;
    std::vector<std::vector<float>> history{reserves};   // Vectors used, in pass order

    result.layout = paginate_(reserves);
    result.passes = 1;

    if (refs.empty()) {
        result.outcome = ReserveOutcome::NoFootnotes;
        result.assignment.idsByPage.resize(result.layout.pages.size());
        return result;
    }

    while (true) {
        FootnoteAssignment assignment = resolveFootnoteAssignments(result.layout, refs);
        std::vector<float> proposed = computeFootnoteReserves(assignment, footnotes_, style_);

        if (reservesEqual(proposed, reserves)) {
            result.assignment = std::move(assignment);
            result.outcome = ReserveOutcome::Converged;
            break;
        }

        // A proposal matching an older vector (not the one just used) means
        // the passes are cycling and will not converge.
        std::optional<size_t> cycleStart;
        for (size_t i = 0; i + 1 < history.size(); ++i) {
            if (reservesEqual(history[i], proposed)) {
                cycleStart = i;
                break;
            }
        }
        if (cycleStart) {
            reserves = settleOscillation(history, *cycleStart, proposed);
            FL_LOGW("reserve: oscillation after %d passes (cycle length %zu), settling on total=%.1f",
                    result.passes, history.size() - *cycleStart, totalReserved(reserves));
            result.layout = paginate_(reserves);
            ++result.passes;
            result.assignment = resolveFootnoteAssignments(result.layout, refs);
            result.outcome = ReserveOutcome::Oscillated;
            addWarning(result.layout, LayoutWarning::ReserveOscillation);
            break;
        }

        if (result.passes >= maxPasses_) {
            reserves = std::move(proposed);
            FL_LOGW("reserve: no fixed point after %d passes, using last proposal total=%.1f",
                    result.passes, totalReserved(reserves));
            result.layout = paginate_(reserves);
            ++result.passes;
            result.assignment = resolveFootnoteAssignments(result.layout, refs);
            result.outcome = ReserveOutcome::BudgetExhausted;
            addWarning(result.layout, LayoutWarning::ReserveBudgetExhausted);
            break;
        }

        reserves = std::move(proposed);
        history.push_back(reserves);
        result.layout = paginate_(reserves);
        ++result.passes;
        FL_LOGD("reserve: pass %d pages=%zu total=%.1f",
                result.passes, result.layout.pages.size(), totalReserved(reserves));
    }

    result.reserves = std::move(reserves);
    placeFootnoteBands(result.layout, result.assignment, footnotes_, style_);
    if (!result.assignment.unresolved.empty()) {
        addWarning(result.layout, LayoutWarning::UnresolvedFootnoteRef);
    }

    FL_LOGI("reserve: outcome=%s passes=%d pages=%zu",
            reserveOutcomeName(result.outcome), result.passes, result.layout.pages.size());
    return result;
}

std::vector<float> FootnoteReserveLoop::settleOscillation(
        const std::vector<std::vector<float>>& history,
        size_t cycleStart,
        const std::vector<float>& proposed) const {
    // Lowest total wins; ties go to the earliest seen
    size_t best = cycleStart;
    float bestTotal = totalReserved(history[cycleStart]);
    for (size_t i = cycleStart + 1; i < history.size(); ++i) {
        float total = totalReserved(history[i]);
        if (total < bestTotal - kReserveEpsilon) {
            best = i;
            bestTotal = total;
        }
    }

    // The winner's own layout asked for the next vector in the cycle. Widen
    // by it so each footnote that layout places has a band on its page.
    const std::vector<float>& demanded = best + 1 < history.size() ? history[best + 1] : proposed;
    return maxReserves(history[best], demanded);
}

} // namespace flowlayout
