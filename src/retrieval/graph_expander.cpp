// File: src/retrieval/graph_expander.cpp
#include "retrieval/graph_expander.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include <unordered_map>

namespace engram {

GraphExpander::GraphExpander(std::shared_ptr<MemoryStore> store, const Config& config)
    : store_(std::move(store)), config_(config) {
    if (!store_) {
        throw std::invalid_argument("GraphExpander requires a store");
    }
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid GraphExpander configuration (max_depth at most " +
                                    std::to_string(kMaxDepthCap) + ")");
    }
}

std::vector<GraphExpander::EntityHit> GraphExpander::Expand(const std::vector<EntityID>& seeds,
                                                            Timestamp at,
                                                            const StopFn& stop) const {
    std::map<EntityID, EntityHit> visited;
    std::vector<EntityID> frontier;

    for (const auto& seed : seeds) {
        if (visited.size() >= config_.max_entities) break;
        if (visited.emplace(seed, EntityHit{seed, 0, 1.0f, 1.0f}).second) {
            frontier.push_back(seed);
        }
    }

    for (size_t depth = 1; depth <= config_.max_depth && !frontier.empty(); ++depth) {
        if (stop && stop()) {
            break;
        }

        // Best path weight per newly reached entity at this depth
        std::map<EntityID, float> next;
        for (const auto& entity : frontier) {
            float parent_weight = visited.at(entity).path_weight;
            for (const auto& edge : store_->GetRelations(entity, at)) {
                const EntityID& neighbour = edge.source == entity ? edge.target : edge.source;
                if (visited.count(neighbour) > 0) {
                    continue;
                }
                float weight = parent_weight * std::clamp(edge.weight, 0.0f, 1.0f);
                auto it = next.find(neighbour);
                if (it == next.end()) {
                    next.emplace(neighbour, weight);
                } else {
                    it->second = std::max(it->second, weight);
                }
            }
        }

        frontier.clear();
        for (const auto& [id, weight] : next) {
            if (visited.size() >= config_.max_entities) break;
            float proximity = weight / static_cast<float>(depth + 1);
            visited.emplace(id, EntityHit{id, depth, weight, proximity});
            frontier.push_back(id);
        }
    }

    std::vector<EntityHit> hits;
    hits.reserve(visited.size());
    for (auto& [id, hit] : visited) {
        hits.push_back(std::move(hit));
    }
    std::sort(hits.begin(), hits.end(), [](const EntityHit& a, const EntityHit& b) {
        if (a.proximity != b.proximity) return a.proximity > b.proximity;
        return a.id < b.id;
    });
    return hits;
}

std::vector<ScoredID> GraphExpander::RankRecords(const std::string& query, Timestamp at, size_t k,
                                                 const RecordFilter& filter,
                                                 const StopFn& stop) const {
    std::vector<ScoredID> ranked;
    if (k == 0) {
        return ranked;
    }

    std::vector<EntityID> seeds;
    for (const auto& entity : store_->FindEntitiesInText(query, config_.max_seed_entities)) {
        seeds.push_back(entity.id);
    }
    if (seeds.empty()) {
        return ranked;
    }

    auto hits = Expand(seeds, at, stop);
    if (stop && stop()) {
        return ranked;
    }

    std::unordered_map<EntityID, float> proximity;
    std::vector<EntityID> reached;
    for (const auto& hit : hits) {
        proximity.emplace(hit.id, hit.proximity);
        reached.push_back(hit.id);
    }

    std::map<RecordID, float> best;
    for (const auto& mention : store_->RecordsForEntities(reached)) {
        float score = proximity[mention.entity];
        auto it = best.find(mention.record);
        if (it == best.end()) {
            best.emplace(mention.record, score);
        } else {
            it->second = std::max(it->second, score);
        }
    }

    std::vector<ScoredID> scored;
    scored.reserve(best.size());
    for (const auto& [id, score] : best) {
        scored.push_back(ScoredID{id, score});
    }
    std::sort(scored.begin(), scored.end(), [](const ScoredID& a, const ScoredID& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    });

    for (const auto& hit : scored) {
        if (ranked.size() == k || (stop && stop())) {
            break;
        }
        auto record = store_->Get(hit.id);
        if (record && filter.Matches(*record)) {
            ranked.push_back(hit);
        }
    }
    return ranked;
}

} // namespace engram
