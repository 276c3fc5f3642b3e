#include "flowlayout/engine.h"
#include "flowlayout/log.h"
#include <future>
#include <set>
#include <stdexcept>
#include <string>

namespace flowlayout {

/// One block to measure or reuse in the current pass
struct IncrementalLayout::Pending {
    std::string key;            // Cache key; empty when the cache is bypassed
    FlowBlock block;
    SourceNode node;
    int orderIndex = 0;

    // Filled by measureAll()
    CacheLookup lookup;
    MeasuredBlock result;
};

namespace {

/// Abandons the open generation unless released
class GenerationGuard {
public:
    explicit GenerationGuard(FlowBlockCache& cache) : cache_(cache) {}
    ~GenerationGuard() {
        if (active_ && cache_.isOpen()) {
            cache_.abandon();
        }
    }
    void release() { active_ = false; }

    GenerationGuard(const GenerationGuard&) = delete;
    GenerationGuard& operator=(const GenerationGuard&) = delete;

private:
    FlowBlockCache& cache_;
    bool active_ = true;
};

/// Reuse a cached measurement for `current`, sliding its positions so the
/// cached start lines up with the current one
MeasuredBlock reuseCached(const CacheEntry& entry, const FlowBlock& current) {
    if (entry.blocks.empty()) {
        return MeasuredBlock{current, Measure()};
    }
    auto now = blockPositionRange(current);
    auto then = blockPositionRange(entry.blocks.front().block);
    if (!now || !then || now->start == then->start) {
        return entry.blocks.front();
    }
    return shiftCachedBlocks(entry.blocks, now->start - then->start).front();
}

} // anonymous namespace

SourceBlock sourceBlockFor(const FlowBlock& block, std::optional<int64_t> revision) {
    return SourceBlock{block, SourceNode{blockToJson(block), revision}};
}

IncrementalLayout::IncrementalLayout(std::shared_ptr<MeasureAdapter> measurer, LayoutConfig config)
    : measurer_(std::move(measurer))
    , config_(std::move(config)) {
    if (!measurer_) {
        throw std::invalid_argument("IncrementalLayout: measurer must not be null");
    }
}

IncrementalLayout::~IncrementalLayout() = default;

LayoutOutcome IncrementalLayout::layoutBlocks(const std::vector<FlowBlock>& blocks,
                                              const FootnoteInput& footnotes) {
    std::vector<SourceBlock> sources;
    sources.reserve(blocks.size());
    for (const auto& block : blocks) {
        sources.push_back(sourceBlockFor(block));
    }
    return layout(sources, footnotes);
}

LayoutOutcome IncrementalLayout::layout(const std::vector<SourceBlock>& blocks,
                                        const FootnoteInput& footnotes) {
    FL_LOGI("layout: blocks=%zu footnotes=%zu refs=%zu page=%.0fx%.0f external=%d",
            blocks.size(), footnotes.blocksById.size(), footnotes.refs.size(),
            config_.geometry.size.w, config_.geometry.size.h,
            cache_.hasExternalChanges() ? 1 : 0);

    LayoutOutcome outcome;

    // Flatten body blocks, then footnote blocks, into one measuring sequence
    std::vector<Pending> pending;
    pending.reserve(blocks.size());
    std::set<std::string> seen;
    auto enqueue = [&](std::string key, const FlowBlock& block, const SourceNode& node) {
        Pending item;
        if (!seen.insert(key).second) {
            FL_LOGW("layout: duplicate block id '%s', measuring without cache", key.c_str());
            key.clear();
        }
        item.key = std::move(key);
        item.block = block;
        item.node = node;
        item.orderIndex = static_cast<int>(pending.size());
        pending.push_back(std::move(item));
    };

    for (const auto& source : blocks) {
        enqueue(blockId(source.block), source.block, source.node);
    }
    for (const auto& [footnoteId, footnoteBlocks] : footnotes.blocksById) {
        for (const auto& block : footnoteBlocks) {
            enqueue(footnoteFragmentId(footnoteId, blockId(block)), block,
                    SourceNode{blockToJson(block), std::nullopt});
        }
    }

    Generation generation = cache_.begin();
    GenerationGuard guard(cache_);
    measureAll(pending, outcome);
    size_t evicted = cache_.commit(generation);
    guard.release();

    // Split the measured sequence back into body and footnotes
    std::vector<FlowBlock> bodyBlocks;
    std::vector<Measure> bodyMeasures;
    bodyBlocks.reserve(blocks.size());
    bodyMeasures.reserve(blocks.size());
    for (size_t i = 0; i < blocks.size(); ++i) {
        bodyBlocks.push_back(pending[i].result.block);
        bodyMeasures.push_back(pending[i].result.measure);
    }

    MeasuredFootnotes measuredFootnotes;
    size_t cursor = blocks.size();
    for (const auto& [footnoteId, footnoteBlocks] : footnotes.blocksById) {
        MeasuredFootnote& footnote = measuredFootnotes[footnoteId];
        for (size_t i = 0; i < footnoteBlocks.size(); ++i, ++cursor) {
            footnote.blocks.push_back(pending[cursor].result.block);
            footnote.measures.push_back(pending[cursor].result.measure);
        }
    }

    FL_LOGD("layout: measured=%d reused=%d evicted=%zu",
            outcome.measuredBlocks, outcome.reusedBlocks, evicted);

    if (bodyBlocks.empty()) {
        outcome.layout.pageSize = config_.geometry.size;
        outcome.layout.warnings.push_back(LayoutWarning::EmptyContent);
        FL_LOGW("layout: empty content");
    } else {
        const PageGeometry geometry = config_.geometry;
        PaginateFn paginate = [&bodyBlocks, &bodyMeasures, geometry](const std::vector<float>& reserves) {
            return layoutDocument(bodyBlocks, bodyMeasures, geometry, reserves);
        };

        try {
            FootnoteReserveLoop loop(paginate, measuredFootnotes,
                                     config_.footnoteBandStyle(), config_.maxReservePasses);
            ReserveLoopResult result = loop.run(footnotes.refs);
            outcome.layout = std::move(result.layout);
            outcome.reserves = std::move(result.reserves);
            outcome.reservePasses = result.passes;
            outcome.reserveOutcome = result.outcome;
        } catch (const GeometryTooSmall& e) {
            FL_LOGW("layout: %s", e.what());
            outcome.layout = Layout();
            outcome.layout.pageSize = config_.geometry.size;
            outcome.layout.warnings.push_back(LayoutWarning::GeometryTooSmall);
        }
    }

    if (previous_) {
        outcome.firstChangedPage = firstChangedPage(*previous_, outcome.layout);
    } else if (!outcome.layout.pages.empty()) {
        outcome.firstChangedPage = 0;
    }
    previous_ = outcome.layout;

    FL_LOGI("layout: pages=%zu passes=%d outcome=%s warnings=%zu",
            outcome.layout.pages.size(), outcome.reservePasses,
            reserveOutcomeName(outcome.reserveOutcome), outcome.layout.warnings.size());
    return outcome;
}

void IncrementalLayout::measureAll(std::vector<Pending>& pending, LayoutOutcome& outcome) {
    std::vector<size_t> misses;
    for (size_t i = 0; i < pending.size(); ++i) {
        Pending& item = pending[i];
        if (item.key.empty()) {
            misses.push_back(i);
            continue;
        }
        item.lookup = cache_.get(item.key, item.node);
        if (item.lookup.hit()) {
            item.result = reuseCached(*item.lookup.entry, item.block);
            ++outcome.reusedBlocks;
        } else {
            misses.push_back(i);
        }
    }

    if (config_.parallelMeasure && misses.size() > 1) {
        std::vector<std::future<Measure>> futures;
        futures.reserve(misses.size());
        for (size_t index : misses) {
            const FlowBlock* block = &pending[index].block;
            MeasureAdapter* measurer = measurer_.get();
            futures.push_back(std::async(std::launch::async, [measurer, block]() {
                return measurer->measureBlock(*block);
            }));
        }
        // Wait for every task before rethrowing the first failure
        for (auto& future : futures) {
            future.wait();
        }
        for (size_t k = 0; k < misses.size(); ++k) {
            Pending& item = pending[misses[k]];
            item.result = MeasuredBlock{item.block, futures[k].get()};
        }
    } else {
        for (size_t index : misses) {
            Pending& item = pending[index];
            item.result = MeasuredBlock{item.block, measurer_->measureBlock(item.block)};
        }
    }
    outcome.measuredBlocks = static_cast<int>(misses.size());

    // Cache writes stay on the calling thread
    for (size_t index : misses) {
        Pending& item = pending[index];
        if (item.key.empty()) continue;
        cache_.set(item.key, item.lookup.nodeJson, item.lookup.nodeRev,
                   {item.result}, item.orderIndex);
    }
}

void IncrementalLayout::setHasExternalChanges(bool value) {
    cache_.setHasExternalChanges(value);
}

void IncrementalLayout::reset() {
    FL_LOGI("reset: dropping %zu cache entries", cache_.size());
    cache_.clear();
    previous_.reset();
}

const Layout* IncrementalLayout::previousLayout() const {
    return previous_ ? &*previous_ : nullptr;
}

} // namespace flowlayout
