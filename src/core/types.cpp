// File: src/core/types.cpp
#include "core/types.hpp"
#include "core/errors.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <random>
#include <mutex>
#include <istream>
#include <ostream>

namespace engram {

// RecordID implementations

RecordID RecordID::Generate() {
    static std::mutex generator_mutex;
    static std::mt19937_64 generator{std::random_device{}()};

    uint64_t high;
    uint64_t low;
    {
        std::lock_guard<std::mutex> lock(generator_mutex);
        high = generator();
        low = generator();
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << high
        << std::setw(16) << low;
    return RecordID(oss.str());
}

std::string RecordID::ToString() const {
    if (!IsValid()) {
        return "RecordID(INVALID)";
    }
    return "RecordID(" + value_ + ")";
}

// MemoryTier implementations

const char* ToString(MemoryTier tier) {
    switch (tier) {
        case MemoryTier::WORKING: return "WORKING";
        case MemoryTier::SHORT_TERM: return "SHORT_TERM";
        case MemoryTier::LONG_TERM: return "LONG_TERM";
        default: return "UNKNOWN";
    }
}

MemoryTier ParseMemoryTier(const std::string& str) {
    if (str == "WORKING") return MemoryTier::WORKING;
    if (str == "SHORT_TERM") return MemoryTier::SHORT_TERM;
    if (str == "LONG_TERM") return MemoryTier::LONG_TERM;
    throw std::invalid_argument("Unknown MemoryTier: " + str);
}

std::optional<MemoryTier> TierFromInt(int value) {
    switch (value) {
        case 0: return MemoryTier::WORKING;
        case 1: return MemoryTier::SHORT_TERM;
        case 2: return MemoryTier::LONG_TERM;
        default: return std::nullopt;
    }
}

std::optional<MemoryTier> NextTier(MemoryTier tier) {
    switch (tier) {
        case MemoryTier::WORKING: return MemoryTier::SHORT_TERM;
        case MemoryTier::SHORT_TERM: return MemoryTier::LONG_TERM;
        default: return std::nullopt;
    }
}

const std::vector<MemoryTier>& AllTiers() {
    static const std::vector<MemoryTier> tiers{
        MemoryTier::WORKING, MemoryTier::SHORT_TERM, MemoryTier::LONG_TERM};
    return tiers;
}

// Timestamp implementations

Timestamp Timestamp::Now() {
    auto since_epoch = ClockType::now().time_since_epoch();
    return Timestamp(std::chrono::duration_cast<Duration>(since_epoch).count());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    return Timestamp(micros);
}

std::string Timestamp::ToString() const {
    auto seconds = micros_ / 1000000;
    auto remaining_micros = micros_ % 1000000;
    if (remaining_micros < 0) {
        seconds -= 1;
        remaining_micros += 1000000;
    }

    std::ostringstream oss;
    oss << "Timestamp(" << seconds << "."
        << std::setw(6) << std::setfill('0') << remaining_micros << "s)";
    return oss.str();
}

void Timestamp::Serialize(std::ostream& out) const {
    out.write(reinterpret_cast<const char*>(&micros_), sizeof(micros_));
}

Timestamp Timestamp::Deserialize(std::istream& in) {
    int64_t micros = 0;
    in.read(reinterpret_cast<char*>(&micros), sizeof(micros));
    if (!in) {
        throw CorruptedState("Truncated timestamp");
    }
    return FromMicros(micros);
}

double ToDays(Timestamp::Duration duration) {
    return std::chrono::duration_cast<std::chrono::duration<double, std::ratio<86400>>>(duration).count();
}

} // namespace engram
