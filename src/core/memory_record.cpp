// File: src/core/memory_record.cpp
#include "core/memory_record.hpp"
#include "core/content_hash.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace engram {

namespace {

// Serialization format version, bumped on layout change
constexpr uint32_t kFormatVersion = 1;

// Upper bound on any length prefix, guards against reading garbage
constexpr uint64_t kMaxFieldLength = 64ull * 1024 * 1024;

template <typename T>
void WritePod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template <typename T>
T ReadPod(std::istream& in) {
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (!in) {
        throw CorruptedState("Truncated record data");
    }
    return value;
}

void WriteString(std::ostream& out, const std::string& str) {
    WritePod<uint64_t>(out, str.size());
    out.write(str.data(), static_cast<std::streamsize>(str.size()));
}

std::string ReadString(std::istream& in) {
    auto length = ReadPod<uint64_t>(in);
    if (length > kMaxFieldLength) {
        throw CorruptedState("Record field length out of range");
    }
    std::string str(length, '\0');
    in.read(&str[0], static_cast<std::streamsize>(length));
    if (!in) {
        throw CorruptedState("Truncated record string");
    }
    return str;
}

} // namespace

MemoryRecord::MemoryRecord(RecordID id, std::string owner, std::string content,
                           MemoryTier tier, Timestamp now)
    : id_(std::move(id)),
      owner_(std::move(owner)),
      content_(std::move(content)),
      content_hash_(ComputeContentHash(content_)),
      tier_(tier),
      created_at_(now),
      last_accessed_(now),
      last_modified_(now),
      tier_entered_at_(now) {}

void MemoryRecord::SetImportance(float importance) {
    if (std::isnan(importance)) {
        throw std::invalid_argument("Importance cannot be NaN");
    }
    importance_ = std::clamp(importance, 0.0f, 1.0f);
}

void MemoryRecord::SetDecayWeight(float weight) {
    if (std::isnan(weight)) {
        throw std::invalid_argument("Decay weight cannot be NaN");
    }
    decay_weight_ = std::max(0.0f, weight);
}

void MemoryRecord::SetEmbedding(Embedding embedding) {
    embedding_ = std::move(embedding);
}

void MemoryRecord::SetSummary(std::string summary) {
    summary_ = std::move(summary);
}

void MemoryRecord::AdvanceTier(MemoryTier tier, Timestamp now) {
    if (static_cast<int>(tier) <= static_cast<int>(tier_)) {
        throw InvalidRecordState(std::string("Cannot move record ") + id_.value() +
                                 " from " + engram::ToString(tier_) +
                                 " to " + engram::ToString(tier));
    }
    tier_ = tier;
    tier_entered_at_ = now;
    last_modified_ = now;
}

void MemoryRecord::MarkArchived(Timestamp now) {
    archived_ = true;
    last_modified_ = now;
}

void MemoryRecord::RecordAccess(Timestamp now) {
    IncrementAccessCount(1, now);
}

void MemoryRecord::IncrementAccessCount(uint32_t count, Timestamp last_access) {
    access_count_ += count;
    if (last_access > last_accessed_) {
        last_accessed_ = last_access;
    }
}

bool MemoryRecord::AddTag(const std::string& tag) {
    if (tag.empty()) {
        return false;
    }
    return tags_.insert(tag).second;
}

void MemoryRecord::AddTags(const TagSet& tags) {
    for (const auto& tag : tags) {
        AddTag(tag);
    }
}

void MemoryRecord::SetMetadataValue(const std::string& key, const std::string& value) {
    metadata_[key] = value;
}

void MemoryRecord::Touch(Timestamp now) {
    if (now > last_modified_) {
        last_modified_ = now;
    }
}

void MemoryRecord::VerifyIntegrity() const {
    if (ComputeContentHash(content_) != content_hash_) {
        throw CorruptedState("Content hash mismatch for record " + id_.value());
    }
    if (last_accessed_ < created_at_ || last_modified_ < created_at_ ||
        tier_entered_at_ < created_at_) {
        throw CorruptedState("Timestamp precedes creation time for record " + id_.value());
    }
}

size_t MemoryRecord::EstimateTokens() const {
    return (content_.size() + 3) / 4;
}

void MemoryRecord::Serialize(std::ostream& out) const {
    WritePod<uint32_t>(out, kFormatVersion);
    WriteString(out, id_.value());
    WriteString(out, owner_);
    WriteString(out, content_);
    WriteString(out, content_hash_);
    WriteString(out, summary_);

    WritePod<uint64_t>(out, embedding_.size());
    if (!embedding_.empty()) {
        out.write(reinterpret_cast<const char*>(embedding_.data()),
                  static_cast<std::streamsize>(embedding_.size() * sizeof(float)));
    }

    WritePod<uint8_t>(out, static_cast<uint8_t>(tier_));
    WritePod<uint8_t>(out, archived_ ? 1 : 0);
    WritePod<float>(out, importance_);
    WritePod<float>(out, decay_weight_);
    WritePod<uint32_t>(out, access_count_);
    WritePod<uint64_t>(out, version_);

    created_at_.Serialize(out);
    last_accessed_.Serialize(out);
    last_modified_.Serialize(out);
    tier_entered_at_.Serialize(out);

    WritePod<uint64_t>(out, tags_.size());
    for (const auto& tag : tags_) {
        WriteString(out, tag);
    }

    WritePod<uint64_t>(out, metadata_.size());
    for (const auto& [key, value] : metadata_) {
        WriteString(out, key);
        WriteString(out, value);
    }
}

MemoryRecord MemoryRecord::Deserialize(std::istream& in) {
    auto format = ReadPod<uint32_t>(in);
    if (format != kFormatVersion) {
        throw CorruptedState("Unsupported record format version " + std::to_string(format));
    }

    MemoryRecord record;
    record.id_ = RecordID(ReadString(in));
    record.owner_ = ReadString(in);
    record.content_ = ReadString(in);
    record.content_hash_ = ReadString(in);
    record.summary_ = ReadString(in);

    auto dims = ReadPod<uint64_t>(in);
    if (dims > kMaxFieldLength / sizeof(float)) {
        throw CorruptedState("Embedding length out of range");
    }
    record.embedding_.resize(dims);
    if (dims > 0) {
        in.read(reinterpret_cast<char*>(record.embedding_.data()),
                static_cast<std::streamsize>(dims * sizeof(float)));
        if (!in) {
            throw CorruptedState("Truncated embedding");
        }
    }

    auto tier = TierFromInt(ReadPod<uint8_t>(in));
    if (!tier) {
        throw CorruptedState("Unknown tier in record " + record.id_.value());
    }
    record.tier_ = *tier;
    record.archived_ = ReadPod<uint8_t>(in) != 0;
    record.importance_ = ReadPod<float>(in);
    record.decay_weight_ = ReadPod<float>(in);
    record.access_count_ = ReadPod<uint32_t>(in);
    record.version_ = ReadPod<uint64_t>(in);

    if (std::isnan(record.importance_) || record.importance_ < 0.0f || record.importance_ > 1.0f ||
        std::isnan(record.decay_weight_) || record.decay_weight_ < 0.0f) {
        throw CorruptedState("Score out of range in record " + record.id_.value());
    }

    record.created_at_ = Timestamp::Deserialize(in);
    record.last_accessed_ = Timestamp::Deserialize(in);
    record.last_modified_ = Timestamp::Deserialize(in);
    record.tier_entered_at_ = Timestamp::Deserialize(in);
    if (!in) {
        throw CorruptedState("Truncated timestamps in record " + record.id_.value());
    }

    auto tag_count = ReadPod<uint64_t>(in);
    for (uint64_t i = 0; i < tag_count; ++i) {
        record.tags_.insert(ReadString(in));
    }

    auto metadata_count = ReadPod<uint64_t>(in);
    for (uint64_t i = 0; i < metadata_count; ++i) {
        std::string key = ReadString(in);
        record.metadata_[key] = ReadString(in);
    }

    return record;
}

std::string MemoryRecord::ToString() const {
    std::ostringstream oss;
    oss << "MemoryRecord{id=" << id_.value()
        << ", owner=" << owner_
        << ", tier=" << engram::ToString(tier_)
        << (archived_ ? ", archived" : "")
        << ", importance=" << importance_
        << ", decay=" << decay_weight_
        << ", accesses=" << access_count_
        << ", tags=" << tags_.size()
        << ", v" << version_ << "}";
    return oss.str();
}

} // namespace engram
