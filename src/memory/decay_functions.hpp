// File: src/memory/decay_functions.hpp
#pragma once

#include "core/types.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <string>

namespace engram {

/**
 * @brief Abstract interface for decay functions
 *
 * A decay function turns a record's importance and age into its decay weight.
 * Each tier owns one instance configured with that tier's half-life.
 */
class IDecayFunction {
public:
    virtual ~IDecayFunction() = default;

    /**
     * @brief Apply decay to a strength based on elapsed time
     *
     * @param initial_strength Importance of the record (in [0.0, 1.0])
     * @param elapsed_time Age of the record, must be non-negative
     * @return Decayed strength, never above initial_strength
     */
    virtual float ApplyDecay(float initial_strength, Timestamp::Duration elapsed_time) const = 0;

    /**
     * @brief Get a descriptive name for this decay function
     */
    virtual const char* GetName() const = 0;

    /**
     * @brief Half-life in days this function was configured with
     */
    virtual double GetHalfLifeDays() const = 0;

    /**
     * @brief Clone this decay function
     */
    virtual std::unique_ptr<IDecayFunction> Clone() const = 0;
};

/**
 * @brief Inverse-square decay
 *
 *   s(t) = s_0 / (1 + (t / h)^2)
 *
 * Where t is the age in days and h the half-life in days. At t = h the
 * strength is exactly half of s_0. Decays slowly at first and has a long
 * tail, so old but important records fade instead of vanishing.
 */
class InverseSquareDecay : public IDecayFunction {
public:
    explicit InverseSquareDecay(double half_life_days = 30.0)
        : half_life_days_(half_life_days) {}

    float ApplyDecay(float initial_strength, Timestamp::Duration elapsed_time) const override {
        if (initial_strength <= 0.0f) {
            return 0.0f;
        }
        if (half_life_days_ <= 0.0) {
            return 0.0f;
        }

        double ratio = std::max(0.0, ToDays(elapsed_time)) / half_life_days_;
        double decayed = initial_strength / (1.0 + ratio * ratio);
        return std::clamp(static_cast<float>(decayed), 0.0f, initial_strength);
    }

    const char* GetName() const override {
        return "InverseSquareDecay";
    }

    double GetHalfLifeDays() const override { return half_life_days_; }

    std::unique_ptr<IDecayFunction> Clone() const override {
        return std::make_unique<InverseSquareDecay>(half_life_days_);
    }

private:
    double half_life_days_;
};

/**
 * @brief Exponential decay based on the Ebbinghaus forgetting curve
 *
 *   s(t) = s_0 × e^(-t / h)
 *
 * Where t is the age in days and h the configured half-life parameter in
 * days. Forgets faster than InverseSquareDecay for old records.
 */
class ExponentialDecay : public IDecayFunction {
public:
    explicit ExponentialDecay(double half_life_days = 30.0)
        : half_life_days_(half_life_days) {}

    float ApplyDecay(float initial_strength, Timestamp::Duration elapsed_time) const override {
        if (initial_strength <= 0.0f) {
            return 0.0f;
        }
        if (half_life_days_ <= 0.0) {
            return 0.0f;
        }

        double days = std::max(0.0, ToDays(elapsed_time));
        double decayed = initial_strength * std::exp(-days / half_life_days_);
        return std::clamp(static_cast<float>(decayed), 0.0f, initial_strength);
    }

    const char* GetName() const override {
        return "ExponentialDecay";
    }

    double GetHalfLifeDays() const override { return half_life_days_; }

    std::unique_ptr<IDecayFunction> Clone() const override {
        return std::make_unique<ExponentialDecay>(half_life_days_);
    }

private:
    double half_life_days_;
};

/**
 * @brief Factory function to create decay functions by name
 *
 * @param name Name of the decay function ("inverse_square", "exponential")
 * @param half_life_days Half-life parameter in days
 * @return Unique pointer to the decay function, or nullptr if name is unknown
 */
inline std::unique_ptr<IDecayFunction> CreateDecayFunction(const std::string& name,
                                                           double half_life_days) {
    if (name == "inverse_square") {
        return std::make_unique<InverseSquareDecay>(half_life_days);
    } else if (name == "exponential") {
        return std::make_unique<ExponentialDecay>(half_life_days);
    }
    return nullptr;
}

} // namespace engram
