// File: src/core/memory_record.hpp
#pragma once

#include "core/types.hpp"
#include <set>
#include <string>
#include <iosfwd>

namespace engram {

// MemoryRecord: One unit of remembered content with its lifecycle statistics
//
// A record is a value type: the store hands out copies and every write
// goes back through the store with a version check, so no field here needs
// its own synchronization.
class MemoryRecord {
public:
    using TagSet = std::set<std::string>;

    // Constructors
    MemoryRecord() = default;

    // Build a fresh record; computes the content hash and stamps all timestamps with `now`
    MemoryRecord(RecordID id, std::string owner, std::string content,
                 MemoryTier tier, Timestamp now);

    // Getters
    const RecordID& GetID() const { return id_; }
    const std::string& GetOwner() const { return owner_; }
    const std::string& GetContent() const { return content_; }
    const std::string& GetContentHash() const { return content_hash_; }
    const Embedding& GetEmbedding() const { return embedding_; }
    bool HasEmbedding() const { return !embedding_.empty(); }
    MemoryTier GetTier() const { return tier_; }
    bool IsArchived() const { return archived_; }
    float GetImportance() const { return importance_; }
    float GetDecayWeight() const { return decay_weight_; }
    uint32_t GetAccessCount() const { return access_count_; }
    Timestamp GetCreatedAt() const { return created_at_; }
    Timestamp GetLastAccessed() const { return last_accessed_; }
    Timestamp GetLastModified() const { return last_modified_; }
    Timestamp GetTierEnteredAt() const { return tier_entered_at_; }
    const TagSet& GetTags() const { return tags_; }
    const Metadata& GetMetadata() const { return metadata_; }
    const std::string& GetSummary() const { return summary_; }
    uint64_t GetVersion() const { return version_; }

    // Setters (clamp into range; NaN is rejected with std::invalid_argument)
    void SetImportance(float importance);
    void SetDecayWeight(float weight);
    void SetEmbedding(Embedding embedding);
    void SetSummary(std::string summary);
    void SetVersion(uint64_t version) { version_ = version; }

    // Move to a later tier; throws InvalidRecordState when `tier` is not forward
    void AdvanceTier(MemoryTier tier, Timestamp now);

    // Mark archived (tier is kept)
    void MarkArchived(Timestamp now);

    // Access statistics
    void RecordAccess(Timestamp now);
    void IncrementAccessCount(uint32_t count, Timestamp last_access);

    // Tags and metadata
    bool AddTag(const std::string& tag);
    void AddTags(const TagSet& tags);
    void SetMetadataValue(const std::string& key, const std::string& value);

    // Update last-modified time
    void Touch(Timestamp now);

    // Check hash and timestamp invariants; throws CorruptedState on violation
    void VerifyIntegrity() const;

    // Rough token count of the content (4 characters per token, rounded up)
    size_t EstimateTokens() const;

    // Serialization
    void Serialize(std::ostream& out) const;
    static MemoryRecord Deserialize(std::istream& in);

    // String representation
    std::string ToString() const;

private:
    // Identity and content
    RecordID id_;
    std::string owner_;
    std::string content_;
    std::string content_hash_;
    Embedding embedding_;
    std::string summary_;

    // Lifecycle state
    MemoryTier tier_{MemoryTier::WORKING};
    bool archived_{false};
    float importance_{0.5f};
    float decay_weight_{0.5f};
    uint32_t access_count_{0};
    uint64_t version_{0};

    // Timestamps
    Timestamp created_at_;
    Timestamp last_accessed_;
    Timestamp last_modified_;
    Timestamp tier_entered_at_;

    // Free-form annotations
    TagSet tags_;
    Metadata metadata_;
};

} // namespace engram
