// File: src/lifecycle/record_lock_table.hpp
#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace engram {

/// Striped mutexes keyed by string
///
/// Two keys may share a stripe; that only costs concurrency, never
/// correctness. Multi-key locks are taken in stripe order so concurrent
/// callers cannot deadlock.
class RecordLockTable {
public:
    explicit RecordLockTable(size_t stripes = 64)
        : mutexes_(stripes == 0 ? 1 : stripes) {}

    RecordLockTable(const RecordLockTable&) = delete;
    RecordLockTable& operator=(const RecordLockTable&) = delete;

    /// Lock held for one key
    std::unique_lock<std::mutex> Lock(const std::string& key) {
        return std::unique_lock<std::mutex>(mutexes_[StripeOf(key)]);
    }

    /// Locks held for two keys (one lock when they share a stripe)
    class PairLock {
    public:
        PairLock(std::mutex* first, std::mutex* second) {
            first_ = std::unique_lock<std::mutex>(*first);
            if (second) {
                second_ = std::unique_lock<std::mutex>(*second);
            }
        }

    private:
        std::unique_lock<std::mutex> first_;
        std::unique_lock<std::mutex> second_;
    };

    PairLock LockPair(const std::string& a, const std::string& b) {
        size_t sa = StripeOf(a);
        size_t sb = StripeOf(b);
        if (sa == sb) {
            return PairLock(&mutexes_[sa], nullptr);
        }
        if (sa > sb) {
            std::swap(sa, sb);
        }
        return PairLock(&mutexes_[sa], &mutexes_[sb]);
    }

    size_t StripeCount() const { return mutexes_.size(); }

    size_t StripeOf(const std::string& key) const {
        return std::hash<std::string>{}(key) % mutexes_.size();
    }

private:
    std::vector<std::mutex> mutexes_;
};

} // namespace engram
