#include "flowlayout/cache.h"
#include "flowlayout/log.h"
#include <sstream>

namespace flowlayout {

std::string canonicalJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::size_t sweepUntouched(CacheEntryMap& entries, uint64_t generation) {
    std::size_t evicted = 0;
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->second.lastTouched < generation) {
            it = entries.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

std::vector<MeasuredBlock> shiftCachedBlocks(const std::vector<MeasuredBlock>& blocks, int delta) {
    std::vector<MeasuredBlock> shifted;
    shifted.reserve(blocks.size());
    for (const auto& mb : blocks) {
        shifted.push_back({shiftBlockPositions(mb.block, delta), mb.measure});
    }
    return shifted;
}

// ---------------------------------------------------------------------------
// FlowBlockCache
// ---------------------------------------------------------------------------

Generation FlowBlockCache::begin() {
    if (open_) {
        throw CacheStateError("FlowBlockCache::begin: generation " +
                              std::to_string(generation_) + " is still open");
    }
    open_ = true;
    ++generation_;
    stats_ = CacheStats{};
    FL_LOGD("cache: begin generation=%llu entries=%zu external=%d",
            static_cast<unsigned long long>(generation_), entries_.size(),
            hasExternalChanges_ ? 1 : 0);
    return Generation{generation_};
}

std::size_t FlowBlockCache::commit() {
    requireOpen("commit");
    std::size_t evicted = sweepUntouched(entries_, generation_);
    open_ = false;
    hasExternalChanges_ = false;
    FL_LOGD("cache: commit generation=%llu fast=%d verified=%d misses=%d evicted=%zu",
            static_cast<unsigned long long>(generation_),
            stats_.fastHits, stats_.verifiedHits, stats_.misses, evicted);
    return evicted;
}

std::size_t FlowBlockCache::commit(const Generation& token) {
    requireOpen("commit");
    if (token.id != generation_) {
        std::ostringstream msg;
        msg << "FlowBlockCache::commit: token " << token.id
            << " does not match open generation " << generation_;
        throw CacheStateError(msg.str());
    }
    return commit();
}

void FlowBlockCache::abandon() {
    if (!open_) return;
    open_ = false;
    FL_LOGW("cache: generation %llu abandoned without pruning",
            static_cast<unsigned long long>(generation_));
}

CacheLookup FlowBlockCache::get(const std::string& blockId, const SourceNode& node) {
    requireOpen("get");

    CacheLookup result;
    result.nodeRev = node.revision;

    auto it = entries_.find(blockId);
    if (it == entries_.end()) {
        result.nodeJson = canonicalJson(node.json);
        ++stats_.misses;
        return result;
    }

    CacheEntry& entry = it->second;
    entry.lastTouched = generation_;

    // Fast path: trust the revision marker for local-only edits
    if (!hasExternalChanges_ && node.revision.has_value() && entry.revision.has_value()) {
        if (*node.revision == *entry.revision) {
            result.entry = &entry;
            result.nodeJson = entry.nodeJson;
            ++stats_.fastHits;
        } else {
            result.nodeJson = canonicalJson(node.json);
            ++stats_.misses;
        }
        return result;
    }

    // Verified path: compare content
    result.nodeJson = canonicalJson(node.json);
    if (result.nodeJson == entry.nodeJson) {
        result.entry = &entry;
        ++stats_.verifiedHits;
    } else {
        FL_LOGD("cache: content changed for '%s' (rev %lld)", blockId.c_str(),
                node.revision ? static_cast<long long>(*node.revision) : -1LL);
        ++stats_.misses;
    }
    return result;
}

void FlowBlockCache::set(const std::string& blockId,
                         const std::string& nodeJson,
                         std::optional<int64_t> revision,
                         std::vector<MeasuredBlock> blocks,
                         int orderIndex) {
    requireOpen("set");

    CacheEntry& entry = entries_[blockId];
    entry.blockId = blockId;
    entry.nodeJson = nodeJson;
    entry.revision = revision;
    entry.blocks = std::move(blocks);
    entry.orderIndex = orderIndex;
    entry.lastTouched = generation_;
}

void FlowBlockCache::setHasExternalChanges(bool value) {
    hasExternalChanges_ = value;
}

void FlowBlockCache::clear() {
    FL_LOGD("cache: clear entries=%zu", entries_.size());
    entries_.clear();
    open_ = false;
    hasExternalChanges_ = false;
    stats_ = CacheStats{};
}

void FlowBlockCache::requireOpen(const char* operation) const {
    if (!open_) {
        throw CacheStateError(std::string("FlowBlockCache::") + operation +
                              " called outside an open generation");
    }
}

} // namespace flowlayout
