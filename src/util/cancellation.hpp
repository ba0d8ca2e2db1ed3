// File: src/util/cancellation.hpp
#pragma once

#include "core/errors.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace engram {

/// Shared flag for hard cancellation
///
/// Copies share one flag, so a caller keeps a copy and hands another to the
/// operation it may want to abort.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() { flag_->store(true, std::memory_order_release); }

    bool IsCancelled() const { return flag_->load(std::memory_order_acquire); }

    /// @throws OperationCancelled if cancelled
    void ThrowIfCancelled(const std::string& operation) const {
        if (IsCancelled()) {
            throw OperationCancelled(operation + " cancelled");
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace engram
