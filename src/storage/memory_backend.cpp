// File: src/storage/memory_backend.cpp
#include "storage/memory_backend.hpp"
#include "core/errors.hpp"
#include "util/text.hpp"
#include "util/vector_math.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <unordered_set>

namespace engram {

namespace {

// Highest score first, then smaller id
void SortScored(std::vector<ScoredID>& results) {
    std::sort(results.begin(), results.end(), [](const ScoredID& a, const ScoredID& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    });
}

void Truncate(std::vector<ScoredID>& results, size_t k) {
    if (results.size() > k) {
        results.resize(k);
    }
}

} // namespace

// ============================================================================
// Constructor
// ============================================================================

MemoryBackend::MemoryBackend()
    : MemoryBackend(Config{}) {}

MemoryBackend::MemoryBackend(const Config& config)
    : config_(config) {}

// ============================================================================
// Records
// ============================================================================

UpsertResult MemoryBackend::UpsertByContent(const MemoryRecord& candidate) {
    // Exclusive lock spans lookup and write
    std::unique_lock<std::shared_mutex> lock(mutex_);

    HashKey key{candidate.GetOwner(), candidate.GetContentHash()};
    auto hash_it = hash_index_.find(key);

    if (hash_it != hash_index_.end()) {
        auto record_it = records_.find(hash_it->second);
        if (record_it == records_.end()) {
            throw CorruptedState("Hash index points at missing record " + hash_it->second.value());
        }

        MemoryRecord& existing = record_it->second;
        existing.RecordAccess(candidate.GetLastAccessed());
        existing.AddTags(candidate.GetTags());
        existing.Touch(candidate.GetLastModified());
        existing.SetVersion(existing.GetVersion() + 1);

        return UpsertResult{existing.GetID(), false, existing.GetAccessCount(), existing.GetVersion()};
    }

    if (records_.count(candidate.GetID()) > 0) {
        throw ValidationError("Record id already in use: " + candidate.GetID().value());
    }

    MemoryRecord stored = candidate;
    stored.SetVersion(1);
    records_.emplace(stored.GetID(), stored);
    hash_index_.emplace(key, stored.GetID());

    return UpsertResult{stored.GetID(), true, stored.GetAccessCount(), stored.GetVersion()};
}

std::optional<MemoryRecord> MemoryBackend::Get(const RecordID& id) {
    // Shared lock for reading
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<RecordID> MemoryBackend::FindByContentHash(const std::string& owner,
                                                         const std::string& content_hash) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = hash_index_.find(HashKey{owner, content_hash});
    if (it == hash_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryBackend::UpdateIfVersion(const MemoryRecord& record, uint64_t expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = records_.find(record.GetID());
    if (it == records_.end() || it->second.GetVersion() != expected_version) {
        return false;
    }

    if (it->second.GetContentHash() != record.GetContentHash() ||
        it->second.GetOwner() != record.GetOwner()) {
        throw ValidationError("Content and owner of record " + record.GetID().value() +
                              " are immutable");
    }

    it->second = record;
    it->second.SetVersion(expected_version + 1);
    return true;
}

bool MemoryBackend::Delete(const RecordID& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }

    hash_index_.erase(HashKey{it->second.GetOwner(), it->second.GetContentHash()});
    UnlinkRecordUnlocked(id);
    records_.erase(it);
    return true;
}

RecordPage MemoryBackend::ListPage(const PageRequest& request) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    RecordPage page;
    if (request.limit == 0) {
        return page;
    }

    auto it = request.after ? records_.upper_bound(*request.after) : records_.begin();
    for (; it != records_.end(); ++it) {
        if (!request.filter.Matches(it->second)) {
            continue;
        }
        page.records.push_back(it->second);
        if (page.records.size() == request.limit) {
            ++it;
            break;
        }
    }

    if (page.records.size() == request.limit && it != records_.end()) {
        page.next_after = page.records.back().GetID();
    }
    return page;
}

size_t MemoryBackend::Count(const RecordFilter& filter) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
        [&filter](const auto& entry) { return filter.Matches(entry.second); }));
}

// ============================================================================
// Search
// ============================================================================

std::vector<ScoredID> MemoryBackend::VectorTopK(const Embedding& query, size_t k,
                                                const RecordFilter& filter) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ScoredID> results;
    if (query.empty() || k == 0) {
        return results;
    }

    for (const auto& [id, record] : records_) {
        if (!record.HasEmbedding() || !filter.Matches(record)) {
            continue;
        }
        results.push_back(ScoredID{id, CosineSimilarity(query, record.GetEmbedding())});
    }

    SortScored(results);
    Truncate(results, k);
    return results;
}

std::vector<ScoredID> MemoryBackend::KeywordTopK(const std::string& query, size_t k,
                                                 const RecordFilter& filter) {
    std::vector<std::string> query_terms = text::ContentTokens(query);
    std::sort(query_terms.begin(), query_terms.end());
    query_terms.erase(std::unique(query_terms.begin(), query_terms.end()), query_terms.end());

    std::vector<ScoredID> results;
    if (query_terms.empty() || k == 0) {
        return results;
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    // Tokenize the visible corpus once
    struct Doc {
        const RecordID* id;
        std::unordered_map<std::string, size_t> tf;
        size_t length;
    };
    std::vector<Doc> docs;
    std::unordered_map<std::string, size_t> df;
    double total_length = 0.0;

    for (const auto& [id, record] : records_) {
        if (!filter.Matches(record)) {
            continue;
        }
        Doc doc{&id, {}, 0};
        for (auto& token : text::Tokenize(record.GetContent())) {
            ++doc.tf[token];
            ++doc.length;
        }
        for (const auto& term : query_terms) {
            if (doc.tf.count(term) > 0) {
                ++df[term];
            }
        }
        total_length += static_cast<double>(doc.length);
        docs.push_back(std::move(doc));
    }

    if (docs.empty()) {
        return results;
    }

    const double n = static_cast<double>(docs.size());
    const double avg_length = std::max(1.0, total_length / n);
    const double k1 = config_.bm25_k1;
    const double b = config_.bm25_b;

    for (const auto& doc : docs) {
        double score = 0.0;
        for (const auto& term : query_terms) {
            auto tf_it = doc.tf.find(term);
            if (tf_it == doc.tf.end()) {
                continue;
            }
            double term_df = static_cast<double>(df[term]);
            double idf = std::log(1.0 + (n - term_df + 0.5) / (term_df + 0.5));
            double tf = static_cast<double>(tf_it->second);
            double norm = k1 * (1.0 - b + b * static_cast<double>(doc.length) / avg_length);
            score += idf * (tf * (k1 + 1.0)) / (tf + norm);
        }
        if (score > 0.0) {
            results.push_back(ScoredID{*doc.id, static_cast<float>(score)});
        }
    }

    SortScored(results);
    Truncate(results, k);
    return results;
}

// ============================================================================
// Tombstones and cursors
// ============================================================================

void MemoryBackend::PutTombstone(const RecordID& discarded, const RecordID& survivor) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    tombstones_[discarded] = survivor;
}

std::optional<RecordID> MemoryBackend::GetTombstone(const RecordID& discarded) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = tombstones_.find(discarded);
    if (it == tombstones_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryBackend::SaveCursor(const std::string& name, const RecordID& after) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cursors_[name] = after;
}

std::optional<RecordID> MemoryBackend::LoadCursor(const std::string& name) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = cursors_.find(name);
    if (it == cursors_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryBackend::ClearCursor(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cursors_.erase(name);
}

// ============================================================================
// Graph
// ============================================================================

void MemoryBackend::UpsertEntity(const EntityNode& entity) {
    if (entity.id.empty() || entity.label.empty()) {
        throw ValidationError("Entity needs an id and a label");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entities_[entity.id] = entity;
}

void MemoryBackend::UpsertRelation(const RelationEdge& relation) {
    if (relation.id.empty() || relation.source.empty() || relation.target.empty()) {
        throw ValidationError("Relation needs an id, a source and a target");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    relations_[relation.id] = relation;
}

void MemoryBackend::LinkRecordEntity(const RecordID& record, const EntityID& entity) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto range = mentions_by_record_.equal_range(record);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second == entity) {
            return;
        }
    }
    mentions_by_record_.emplace(record, entity);
    mentions_by_entity_.emplace(entity, record);
}

std::vector<EntityNode> MemoryBackend::FindEntitiesInText(const std::string& text, size_t limit) {
    std::string haystack = text::ToLower(text);

    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<EntityNode> found;
    for (const auto& [id, entity] : entities_) {
        if (haystack.find(text::ToLower(entity.label)) != std::string::npos) {
            found.push_back(entity);
        }
    }

    std::sort(found.begin(), found.end(), [](const EntityNode& a, const EntityNode& b) {
        if (a.label.size() != b.label.size()) return a.label.size() > b.label.size();
        return a.id < b.id;
    });
    if (found.size() > limit) {
        found.resize(limit);
    }
    return found;
}

std::vector<RelationEdge> MemoryBackend::GetRelations(const EntityID& entity, Timestamp at) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<RelationEdge> edges;
    for (const auto& [id, relation] : relations_) {
        if ((relation.source == entity || relation.target == entity) && relation.IsValidAt(at)) {
            edges.push_back(relation);
        }
    }
    return edges;
}

std::vector<EntityMention> MemoryBackend::RecordsForEntities(const std::vector<EntityID>& entities) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<EntityMention> mentions;
    std::set<EntityID> seen;
    for (const auto& entity : entities) {
        if (!seen.insert(entity).second) {
            continue;
        }
        auto range = mentions_by_entity_.equal_range(entity);
        for (auto it = range.first; it != range.second; ++it) {
            mentions.push_back(EntityMention{entity, it->second});
        }
    }
    return mentions;
}

std::vector<EntityID> MemoryBackend::EntitiesForRecord(const RecordID& record) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<EntityID> entities;
    auto range = mentions_by_record_.equal_range(record);
    for (auto it = range.first; it != range.second; ++it) {
        entities.push_back(it->second);
    }
    return entities;
}

void MemoryBackend::UnlinkRecordUnlocked(const RecordID& id) {
    auto range = mentions_by_record_.equal_range(id);
    for (auto it = range.first; it != range.second; ++it) {
        auto entity_range = mentions_by_entity_.equal_range(it->second);
        for (auto e = entity_range.first; e != entity_range.second;) {
            if (e->second == id) {
                e = mentions_by_entity_.erase(e);
            } else {
                ++e;
            }
        }
    }
    mentions_by_record_.erase(id);
}

// ============================================================================
// Maintenance
// ============================================================================

StorageStats MemoryBackend::GetStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    StorageStats stats;
    stats.total_records = records_.size();
    stats.total_tombstones = tombstones_.size();
    stats.total_entities = entities_.size();
    stats.total_relations = relations_.size();
    return stats;
}

void MemoryBackend::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    records_.clear();
    hash_index_.clear();
    tombstones_.clear();
    cursors_.clear();
    entities_.clear();
    relations_.clear();
    mentions_by_entity_.clear();
    mentions_by_record_.clear();
}

} // namespace engram
