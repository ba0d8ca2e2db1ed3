// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <chrono>
#include <vector>
#include <map>
#include <optional>
#include <iosfwd>

namespace engram {

// RecordID: Unique, stable identifier for memory records
// 128 random bits rendered as 32 lowercase hex characters
class RecordID {
public:
    // Default constructor creates invalid ID
    RecordID() = default;

    // Explicit constructor from an existing identifier string
    explicit RecordID(std::string value) : value_(std::move(value)) {}

    // Generate new random ID (thread-safe)
    static RecordID Generate();

    // Check if ID is valid
    bool IsValid() const { return !value_.empty(); }

    // Get underlying value
    const std::string& value() const { return value_; }

    // Comparison operators (lexicographic, used as the final tie-break)
    bool operator==(const RecordID& other) const { return value_ == other.value_; }
    bool operator!=(const RecordID& other) const { return value_ != other.value_; }
    bool operator<(const RecordID& other) const { return value_ < other.value_; }
    bool operator>(const RecordID& other) const { return value_ > other.value_; }

    // String conversion for debugging
    std::string ToString() const;

    // Hash support for std::unordered_map
    struct Hash {
        size_t operator()(const RecordID& id) const {
            return std::hash<std::string>()(id.value_);
        }
    };

private:
    std::string value_;
};

// MemoryTier: Coarse retention class, ordered by retention length
enum class MemoryTier : uint8_t {
    WORKING = 0,      // Active processing, short half-life
    SHORT_TERM = 1,   // Recent memories
    LONG_TERM = 2,    // Persistent, important memories
};

// Convert MemoryTier to string
const char* ToString(MemoryTier tier);

// Parse MemoryTier from string ("WORKING", "SHORT_TERM", "LONG_TERM")
MemoryTier ParseMemoryTier(const std::string& str);

// Parse MemoryTier from its stored integer value
std::optional<MemoryTier> TierFromInt(int value);

// Next tier in the promotion path, nullopt for LONG_TERM
std::optional<MemoryTier> NextTier(MemoryTier tier);

// All tiers in promotion order
const std::vector<MemoryTier>& AllTiers();

// Timestamp: Microsecond-precision wall-clock time point
// Wall clock (not steady) so persisted records keep their age across restarts
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since the Unix epoch
    static Timestamp FromMicros(int64_t micros);

    // Default constructor creates zero timestamp (the epoch)
    Timestamp() = default;

    // Get microseconds since epoch
    int64_t ToMicros() const { return micros_; }

    // Duration since another timestamp (negative if other is later)
    Duration operator-(const Timestamp& other) const {
        return Duration(micros_ - other.micros_);
    }

    Timestamp operator+(Duration d) const { return Timestamp(micros_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(micros_ - d.count()); }

    // Comparison operators
    bool operator<(const Timestamp& other) const { return micros_ < other.micros_; }
    bool operator>(const Timestamp& other) const { return micros_ > other.micros_; }
    bool operator<=(const Timestamp& other) const { return micros_ <= other.micros_; }
    bool operator>=(const Timestamp& other) const { return micros_ >= other.micros_; }
    bool operator==(const Timestamp& other) const { return micros_ == other.micros_; }
    bool operator!=(const Timestamp& other) const { return micros_ != other.micros_; }

    // String conversion
    std::string ToString() const;

    // Serialization
    void Serialize(std::ostream& out) const;
    static Timestamp Deserialize(std::istream& in);

private:
    explicit Timestamp(int64_t micros) : micros_(micros) {}
    int64_t micros_{0};
};

// Fractional days in a duration
double ToDays(Timestamp::Duration duration);

// Embedding: dense semantic vector; empty means "not embedded yet"
using Embedding = std::vector<float>;

// Free-form record metadata
using Metadata = std::map<std::string, std::string>;

// Identifier of an entity node in the store's graph
using EntityID = std::string;

} // namespace engram

namespace std {
    template<>
    struct hash<engram::RecordID> {
        size_t operator()(const engram::RecordID& id) const {
            return engram::RecordID::Hash()(id);
        }
    };
}
