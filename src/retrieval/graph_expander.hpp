// File: src/retrieval/graph_expander.hpp
#pragma once

#include "core/types.hpp"
#include "storage/memory_store.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace engram {

/// Bounded breadth-first expansion over the entity graph
///
/// Seeds are the entities named in the query. Each hop follows relations
/// valid at query time in either direction. An entity's proximity is the
/// best product of edge weights along a shortest path, divided by
/// (hops + 1). A record scores the best proximity among the entities it
/// mentions.
class GraphExpander {
public:
    /// Absolute ceiling on traversal depth
    static constexpr size_t kMaxDepthCap = 3;

    struct Config {
        size_t max_depth{2};          ///< Hops from the seed entities (<= kMaxDepthCap)
        size_t max_seed_entities{8};  ///< Entities taken from the query text
        size_t max_entities{256};     ///< Visited-entity budget for one expansion

        bool IsValid() const {
            return max_depth <= kMaxDepthCap && max_seed_entities > 0 && max_entities > 0;
        }
    };

    /// An entity reached by the expansion
    struct EntityHit {
        EntityID id;
        size_t hops{0};
        float path_weight{1.0f};
        float proximity{1.0f};
    };

    /// Returns true when the caller no longer wants the result
    using StopFn = std::function<bool()>;

    /// @throws std::invalid_argument if store is null or config invalid
    GraphExpander(std::shared_ptr<MemoryStore> store, const Config& config);

    /// Expand from seed entities; ordered by proximity desc, then id
    std::vector<EntityHit> Expand(const std::vector<EntityID>& seeds, Timestamp at,
                                  const StopFn& stop = nullptr) const;

    /// Graph-proximity ranking of records for a query text
    ///
    /// Records failing `filter` are dropped before the ranking is cut to k.
    std::vector<ScoredID> RankRecords(const std::string& query, Timestamp at, size_t k,
                                      const RecordFilter& filter = RecordFilter{},
                                      const StopFn& stop = nullptr) const;

    const Config& GetConfig() const { return config_; }

private:
    std::shared_ptr<MemoryStore> store_;
    Config config_;
};

} // namespace engram
