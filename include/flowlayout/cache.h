#pragma once

#include "flowlayout/platform.h"
#include <json/json.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace flowlayout {

/// Thrown when the cache is used outside the begin()/commit() protocol
class CacheStateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/// The document node a block was built from, as seen by the cache
struct SourceNode {
    Json::Value json;                   // Serialized for the verified comparison
    std::optional<int64_t> revision;    // Caller-maintained revision marker
};

/// Handle for one begin()..commit() epoch
struct Generation {
    uint64_t id = 0;

    bool operator==(const Generation& other) const { return id == other.id; }
    bool operator!=(const Generation& other) const { return id != other.id; }
};

struct CacheEntry {
    std::string blockId;
    std::string nodeJson;                 // Canonical serialization of the source node
    std::optional<int64_t> revision;
    std::vector<MeasuredBlock> blocks;
    int orderIndex = 0;                   // Index of the block in the flattened sequence
    uint64_t lastTouched = 0;             // Generation that last read or wrote this entry
};

using CacheEntryMap = std::unordered_map<std::string, CacheEntry>;

/// Result of FlowBlockCache::get
struct CacheLookup {
    /// Cached entry on HIT, nullptr on MISS. Valid until the next set() for the
    /// same id, commit(), abandon() or clear().
    const CacheEntry* entry = nullptr;
    /// Serialization to store with the next set(). On a fast-path HIT this is the
    /// entry's stored serialization, so the node is never re-serialized.
    std::string nodeJson;
    std::optional<int64_t> nodeRev;

    bool hit() const { return entry != nullptr; }
};

/// Per-generation counters, reset by begin()
struct CacheStats {
    int fastHits = 0;       // Revision markers matched
    int verifiedHits = 0;   // Serializations matched
    int misses = 0;
};

/// Canonical single-line JSON (jsoncpp sorts object keys)
std::string canonicalJson(const Json::Value& value);

/// Remove every entry whose lastTouched lags `generation`.
/// Returns the number of entries evicted.
std::size_t sweepUntouched(CacheEntryMap& entries, uint64_t generation);

/// Slide cached geometry by `delta` document positions
std::vector<MeasuredBlock> shiftCachedBlocks(const std::vector<MeasuredBlock>& blocks, int delta);

/// Generation-scoped cache of measured blocks keyed by block id.
///
/// Two validity checks:
///  - fast path: matching revision markers are trusted without looking at content;
///  - verified path: canonical serializations are compared. Used when either side
///    lacks a revision marker, or when setHasExternalChanges(true) says content may
///    have changed without the marker being bumped.
///
/// Not thread-safe. All get()/set() calls of a generation come from one thread.
class FlowBlockCache {
public:
    FlowBlockCache() = default;

    /// Open a generation. Throws CacheStateError if one is already open.
    Generation begin();

    /// Close the open generation, evicting entries it did not touch, and clear
    /// the external-changes flag. Returns the number of evicted entries.
    std::size_t commit();

    /// As commit(), but first checks that `token` is the open generation
    std::size_t commit(const Generation& token);

    /// Close the open generation without evicting anything (pass abandoned).
    /// The external-changes flag stays set for the retry.
    void abandon();

    /// Look up `blockId` against the current source node
    CacheLookup get(const std::string& blockId, const SourceNode& node);

    /// Insert or replace the entry for `blockId` and mark it touched
    void set(const std::string& blockId,
             const std::string& nodeJson,
             std::optional<int64_t> revision,
             std::vector<MeasuredBlock> blocks,
             int orderIndex);

    /// Content may have changed without revision bumps during the next pass.
    /// Cleared by commit(); re-assert it for every pass where it applies.
    void setHasExternalChanges(bool value);
    bool hasExternalChanges() const { return hasExternalChanges_; }

    /// Forget everything (unrelated document)
    void clear();

    bool isOpen() const { return open_; }
    std::size_t size() const { return entries_.size(); }
    const CacheStats& stats() const { return stats_; }

private:
    CacheEntryMap entries_;
    uint64_t generation_ = 0;
    bool open_ = false;
    bool hasExternalChanges_ = false;
    CacheStats stats_;

    void requireOpen(const char* operation) const;
};

} // namespace flowlayout
