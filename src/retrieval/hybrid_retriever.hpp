// File: src/retrieval/hybrid_retriever.hpp
//
// Hybrid Retriever
//
// Answers a query by running several ranking signals in parallel and fusing
// their rankings into one ordered, size-bounded context.
//
// Signals:
//   VECTOR  - cosine top-K against the embedded query
//   KEYWORD - full-text top-K against the query text
//   GRAPH   - proximity to entities named in the query
//
// Fusion (weighted reciprocal rank):
//   fused(c) = Σ_signal weight_signal / (rank_signal(c) + k),  rank from 1
//
// Ties: fused desc, importance desc, last accessed desc, id asc.

#pragma once

#include "core/debug_log.hpp"
#include "core/memory_record.hpp"
#include "core/types.hpp"
#include "llm/language_model.hpp"
#include "retrieval/graph_expander.hpp"
#include "storage/memory_store.hpp"
#include "util/cancellation.hpp"
#include "util/semaphore.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram {

/// Candidate generation signal
enum class Signal : uint8_t {
    VECTOR = 0,
    KEYWORD = 1,
    GRAPH = 2,
};

const char* ToString(Signal signal);

/// Caller filters; a record failing any of them is excluded before fusion
struct SearchFilters {
    std::optional<std::string> owner;
    std::vector<MemoryTier> tiers;            ///< Empty means every tier
    std::vector<std::string> required_tags;   ///< Record must carry all of them
    std::optional<Timestamp> created_after;   ///< Inclusive
    std::optional<Timestamp> created_before;  ///< Exclusive
    bool include_archived{false};

    /// The same predicates in the form the store and graph signal apply
    RecordFilter ToRecordFilter() const;

    bool Matches(const MemoryRecord& record) const;
};

/// One search call
struct SearchRequest {
    std::string query;
    SearchFilters filters;
    size_t limit{10};

    /// Token budget for the assembled context (retriever default when unset)
    std::optional<size_t> token_budget;

    /// Soft cancellation: signals still running at the deadline are dropped
    std::optional<std::chrono::steady_clock::time_point> deadline;

    /// Hard cancellation: Search throws OperationCancelled
    CancellationToken cancel;
};

/// Position and raw score of a candidate within one signal
struct SignalHit {
    size_t rank{0};
    float raw_score{0.0f};
};

/// A record competing for a place in the result
struct RetrievalCandidate {
    RecordID id;
    std::map<Signal, SignalHit> signals;
    float fused_score{0.0f};
    float importance{0.0f};
    Timestamp last_accessed;
    MemoryRecord record;

    /// Signals that proposed this record, in enum order
    std::vector<Signal> Sources() const;
};

/// Search outcome
struct SearchResult {
    std::vector<RetrievalCandidate> items;

    /// Set when any signal failed or was dropped at the deadline
    bool partial{false};
    std::vector<Signal> failed_signals;
    std::vector<Signal> cancelled_signals;

    size_t tokens_used{0};
    size_t candidates_considered{0};
    std::optional<QueryIntent> intent;
};

/// Hybrid multi-signal retriever
class HybridRetriever {
public:
    /// Configuration for retrieval
    struct Config {
        size_t per_signal_k{50};            ///< Candidates taken from each signal
        float rrf_k{60.0f};                 ///< Rank damping constant
        float vector_weight{1.0f};
        float keyword_weight{1.0f};
        float graph_weight{1.0f};
        bool enable_vector{true};
        bool enable_keyword{true};
        bool enable_graph{true};
        size_t max_graph_depth{2};          ///< At most GraphExpander::kMaxDepthCap
        size_t default_token_budget{8000};
        bool classify_intent{false};        ///< Annotate results with the query intent
        std::chrono::milliseconds poll_interval{5};
        size_t max_concurrent_signals{16};  ///< Signal threads running at once, across searches

        bool IsValid() const;
    };

    /// @param llm May be null; the vector signal and intent are then skipped
    /// @throws std::invalid_argument if store is null or config invalid
    HybridRetriever(std::shared_ptr<MemoryStore> store,
                    std::shared_ptr<ILanguageModel> llm,
                    const Config& config);

    /// Run a search
    ///
    /// @throws ValidationError on an empty query or zero limit
    /// @throws UpstreamUnavailable when every signal failed
    /// @throws OperationCancelled when request.cancel fires
    SearchResult Search(const SearchRequest& request) const;

    /// Weighted reciprocal-rank fusion of ranked lists (ranks start at 1)
    static std::vector<RetrievalCandidate> FuseRankings(
        const std::map<Signal, std::vector<ScoredID>>& rankings,
        const std::map<Signal, float>& weights,
        float k);

    /// Deterministic total order: fused, importance, last accessed, id
    static void SortCandidates(std::vector<RetrievalCandidate>& candidates);

    const Config& GetConfig() const { return config_; }

    /// Set output stream for log messages
    void SetLogStream(std::ostream* os) { log_.SetStream(os); }
    void SetDebugEnabled(bool enabled) { log_.SetDebugEnabled(enabled); }

private:
    std::shared_ptr<MemoryStore> store_;
    std::shared_ptr<ILanguageModel> llm_;
    std::shared_ptr<GraphExpander> graph_;
    Config config_;

    // Shared with signal threads, which may outlive a search
    std::shared_ptr<Semaphore> signal_slots_;

    DebugLog log_{"HybridRetriever"};

    float WeightFor(Signal signal) const;
};

} // namespace engram
