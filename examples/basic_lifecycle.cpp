// File: examples/basic_lifecycle.cpp
//
// Basic memory lifecycle example using the Engram engine.
// Demonstrates:
// - Loading configuration from YAML (or using defaults)
// - Ingesting memories, including a duplicate
// - Hybrid search with a token budget
// - Running a consolidation tick and reading its report
//
// Usage: engram_example [config.yaml]

#include "config/engine_config.hpp"
#include "core/errors.hpp"
#include "lifecycle/lifecycle_coordinator.hpp"
#include "llm/cached_language_model.hpp"
#include "llm/hashing_language_model.hpp"
#include "storage/memory_backend.hpp"
#include "storage/persistent_backend.hpp"
#include <iomanip>
#include <iostream>
#include <memory>

using namespace engram;

void PrintResult(const SearchResult& result) {
    std::cout << "  " << result.items.size() << " result(s), "
              << result.tokens_used << " tokens";
    if (result.partial) {
        std::cout << " (partial)";
    }
    if (result.intent) {
        std::cout << ", intent " << ToString(*result.intent);
    }
    std::cout << "\n";

    for (const auto& item : result.items) {
        std::cout << "    " << std::fixed << std::setprecision(4) << item.fused_score
                  << "  [" << ToString(item.record.GetTier()) << "]  "
                  << item.record.GetContent() << "  via";
        for (Signal signal : item.Sources()) {
            std::cout << " " << ToString(signal);
        }
        std::cout << "\n";
    }
}

int main(int argc, char* argv[]) {
    std::cout << "=== Engram Memory Lifecycle Example ===\n\n";

    // Step 1: Configuration
    EngineConfig config = EngineConfig::Default();
    if (argc > 1) {
        auto loaded = EngineConfig::LoadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Could not load configuration from " << argv[1] << "\n";
            return 1;
        }
        config = *loaded;
    }
    config.retrieval.classify_intent = true;

    // Step 2: Storage and language model
    std::shared_ptr<MemoryStore> store;
    try {
        if (config.storage.backend == "sqlite") {
            auto persistent = std::make_shared<PersistentBackend>(config.ToPersistentConfig());
            if (config.logging.quiet) {
                persistent->SetLogStream(nullptr);
            }
            store = persistent;
        } else {
            store = std::make_shared<MemoryBackend>();
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to open storage: " << e.what() << "\n";
        return 1;
    }

    auto upstream = std::make_shared<HashingLanguageModel>(config.ToHashingModelConfig());
    auto llm = std::make_shared<CachedLanguageModel>(upstream, config.ToCachedModelConfig());

    LifecycleCoordinator coordinator(store, llm, config.ToCoordinatorConfig());
    if (config.logging.quiet) {
        llm->SetLogStream(nullptr);
        coordinator.SetLogStream(nullptr);
    }
    coordinator.SetDebugEnabled(config.logging.debug);
    std::cout << "Step 1: Engine ready (" << config.storage.backend << " backend)\n\n";

    try {
        // Step 3: Ingest
        std::cout << "Step 2: Ingesting memories...\n";
        RecordID dark = coordinator.Ingest("User prefers dark mode in the editor", "alice", {"ui"});
        coordinator.Ingest("Meeting with the design team moved to Thursday", "alice", {"calendar"});
        coordinator.Ingest("Alice works at Acme in Berlin", "alice", {"profile"});
        coordinator.Ingest("Bob prefers light mode", "bob");

        // Same content again: lands on the same record
        RecordID again = coordinator.Ingest("User prefers dark mode in the editor", "alice", {"settings"});
        MemoryRecord record = coordinator.Get(dark);
        std::cout << "  duplicate ingest returned the same id: "
                  << (again == dark ? "yes" : "no") << "\n";
        std::cout << "  access count " << record.GetAccessCount()
                  << ", tags " << record.GetTags().size() << "\n\n";

        // Step 4: Consolidate
        std::cout << "Step 3: Running consolidation one hour from now...\n";
        auto jobs = coordinator.RunConsolidationTick(Timestamp::Now() + std::chrono::hours(1));
        for (const auto& job : jobs) {
            std::cout << "  " << std::left << std::setw(10) << ToString(job.tier)
                      << " " << ToString(job.status)
                      << "  seen " << job.records_seen
                      << ", embedded " << job.embedded
                      << ", tagged " << job.tagged
                      << ", promoted " << job.promoted
                      << ", archived " << job.archived
                      << ", merged " << job.merged
                      << ", grouped " << job.grouped << "\n";
        }
        std::cout << "\n";

        // Step 5: Search
        std::cout << "Step 4: Searching alice's memories for 'dark mode'...\n";
        SearchRequest request;
        request.query = "what does the user prefer, dark mode?";
        request.filters.owner = "alice";
        request.limit = 5;
        request.token_budget = 200;
        PrintResult(coordinator.Search(request));
        std::cout << "\n";

        std::cout << "Step 5: Searching every owner for 'mode'...\n";
        request.query = "mode";
        request.filters.owner.reset();
        PrintResult(coordinator.Search(request));
    } catch (const EngramError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
