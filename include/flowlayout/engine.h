#pragma once

#include "flowlayout/cache.h"
#include "flowlayout/document.h"
#include "flowlayout/footnote_reserve.h"
#include "flowlayout/footnotes.h"
#include "flowlayout/layout.h"
#include "flowlayout/options.h"
#include "flowlayout/page.h"
#include "flowlayout/platform.h"
#include <memory>
#include <optional>
#include <vector>

namespace flowlayout {

/// A body block together with the document node it was built from
struct SourceBlock {
    FlowBlock block;
    SourceNode node;
};

/// Wrap a block whose source node is the block itself
SourceBlock sourceBlockFor(const FlowBlock& block, std::optional<int64_t> revision = std::nullopt);

/// Result of one IncrementalLayout pass
struct LayoutOutcome {
    Layout layout;
    std::vector<float> reserves;     // Footnote reservation per page index
    int reservePasses = 0;
    ReserveOutcome reserveOutcome = ReserveOutcome::NoFootnotes;
    int measuredBlocks = 0;          // Cache misses measured this pass
    int reusedBlocks = 0;            // Cache hits
    std::optional<int> firstChangedPage;   // Against the previous pass
};

/// Main entry point: measure through the cache, then paginate with footnote
/// reservations. Keeps the cache and the previous layout between calls.
class IncrementalLayout {
public:
    explicit IncrementalLayout(std::shared_ptr<MeasureAdapter> measurer,
                               LayoutConfig config = LayoutConfig());
    ~IncrementalLayout();

    /// Lay out body blocks (with their source nodes) and footnotes
    LayoutOutcome layout(const std::vector<SourceBlock>& blocks,
                         const FootnoteInput& footnotes = FootnoteInput());

    /// Lay out bare blocks; each block serves as its own source node
    LayoutOutcome layoutBlocks(const std::vector<FlowBlock>& blocks,
                               const FootnoteInput& footnotes = FootnoteInput());

    /// Next pass may see content changes without revision bumps
    void setHasExternalChanges(bool value);

    /// Drop the cache and the previous layout
    void reset();

    const Layout* previousLayout() const;
    const CacheStats& cacheStats() const { return cache_.stats(); }
    std::size_t cacheSize() const { return cache_.size(); }

    void setConfig(const LayoutConfig& config) { config_ = config; }
    const LayoutConfig& config() const { return config_; }

    std::shared_ptr<MeasureAdapter> measurer() const { return measurer_; }

private:
    struct Pending;

    std::shared_ptr<MeasureAdapter> measurer_;
    LayoutConfig config_;
    FlowBlockCache cache_;
    std::optional<Layout> previous_;

    void measureAll(std::vector<Pending>& pending, LayoutOutcome& outcome);
};

} // namespace flowlayout
