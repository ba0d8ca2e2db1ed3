// File: src/memory/deduplication_engine.hpp
#pragma once

#include "core/memory_record.hpp"
#include "core/types.hpp"
#include "storage/memory_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram {

/// DeduplicationEngine: Find duplicate records and decide how they merge
///
/// Two phases:
/// - Exact: same owner and same content hash. Resolved on ingest by the
///   store's idempotent upsert; FindExactDuplicate is the read-only lookup.
/// - Semantic: embeddings above a cosine threshold. Background only.
///
/// The engine plans merges but never writes; the lifecycle coordinator
/// applies a MergePlan under the record locks.
class DeduplicationEngine {
public:
    /// Configuration for deduplication
    struct Config {
        float similarity_threshold{0.95f};   ///< Cosine similarity for a merge candidate
        size_t candidate_limit{20};          ///< Neighbours examined per record
        size_t max_alias_hops{16};           ///< Longest tombstone chain followed

        bool IsValid() const {
            return similarity_threshold > 0.0f && similarity_threshold <= 1.0f &&
                   candidate_limit > 0 && max_alias_hops > 0;
        }
    };

    /// A semantic neighbour
    struct Duplicate {
        RecordID id;
        float similarity{0.0f};
    };

    /// How two records collapse into one
    struct MergePlan {
        RecordID survivor_id;
        RecordID discarded_id;

        /// Survivor with the discarded record folded in (version unchanged)
        MemoryRecord merged;
    };

    /// @throws std::invalid_argument if store is null or config invalid
    DeduplicationEngine(std::shared_ptr<MemoryStore> store, const Config& config);

    /// Record holding exactly this content for this owner
    std::optional<RecordID> FindExactDuplicate(const std::string& owner,
                                               const std::string& content_hash) const;

    /// Live records of `owner` whose embedding is at least `threshold` similar
    ///
    /// Ordered by similarity (highest first), then id. `exclude` is left out.
    /// @throws DimensionMismatch if stored embeddings differ in length from `embedding`
    std::vector<Duplicate> FindSemanticDuplicates(const std::string& owner,
                                                  const Embedding& embedding,
                                                  std::optional<float> threshold = std::nullopt,
                                                  const std::optional<RecordID>& exclude = std::nullopt) const;

    /// Decide the survivor and build its merged state
    ///
    /// Survivor: higher importance, then higher access count, then smaller id.
    /// It gains the union of tags, metadata keys it lacks, summed access
    /// counts, the later last-accessed time, the further tier and a
    /// `merged_from` entry naming the discarded id.
    /// @throws ValidationError if ids are equal or owners differ
    static MergePlan PlanMerge(const MemoryRecord& a, const MemoryRecord& b, Timestamp now);

    /// Follow tombstones from `id` to the record that replaced it
    ///
    /// Returns `id` itself when it was never merged away.
    /// @throws CorruptedState when the chain exceeds max_alias_hops (cycle)
    RecordID ResolveAlias(const RecordID& id) const;

    const Config& GetConfig() const { return config_; }

    /// Metadata key listing ids merged into a record
    static constexpr const char* kMergedFromKey = "merged_from";

private:
    std::shared_ptr<MemoryStore> store_;
    Config config_;
};

} // namespace engram
