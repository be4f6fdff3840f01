/**
 * @file types.hpp
 * @brief Fundamental types used throughout DepPlanner.
 * @author Dimitris Kafetzis
 *
 * Defines NodeId, Weight, the tagged Distance value, and the per-run
 * metrics record shared by every graph algorithm.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

namespace dep_planner {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = uint32_t;
using ComponentId = NodeId;
using Weight = int32_t;
using Duration = std::chrono::nanoseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Distance
// ─────────────────────────────────────────────

/**
 * @brief A path length that is either finite or unreachable.
 *
 * Replaces the "extreme integer means unreachable" convention. Adding a
 * weight to an unreachable distance yields unreachable, so relaxation can
 * never produce a finite number out of a sentinel.
 *
 * Distances are 64-bit while weights are 32-bit: a simple path has fewer
 * than 2^32 edges, so the sum cannot wrap.
 */
class Distance {
public:
    constexpr Distance() noexcept = default;

    [[nodiscard]] static constexpr Distance unreachable() noexcept { return Distance{}; }
    [[nodiscard]] static constexpr Distance of(int64_t value) noexcept {
        return Distance{value};
    }

    [[nodiscard]] constexpr bool reachable() const noexcept { return value_.has_value(); }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return reachable(); }

    /// Finite value. Only meaningful when reachable().
    [[nodiscard]] constexpr int64_t value() const noexcept { return value_.value_or(0); }

    [[nodiscard]] constexpr Distance operator+(Weight w) const noexcept {
        if (!value_) return unreachable();
        return Distance{*value_ + static_cast<int64_t>(w)};
    }

    /// Strictly shorter; unreachable is longer than everything finite.
    [[nodiscard]] constexpr bool shorter_than(const Distance& other) const noexcept {
        if (!value_) return false;
        if (!other.value_) return true;
        return *value_ < *other.value_;
    }

    /// Strictly longer; unreachable is shorter than everything finite.
    [[nodiscard]] constexpr bool longer_than(const Distance& other) const noexcept {
        if (!value_) return false;
        if (!other.value_) return true;
        return *value_ > *other.value_;
    }

    constexpr bool operator==(const Distance&) const = default;

private:
    constexpr explicit Distance(int64_t value) noexcept : value_(value) {}

    std::optional<int64_t> value_;
};

using DistanceVector = std::vector<Distance>;

// ─────────────────────────────────────────────
// Run Metrics
// ─────────────────────────────────────────────

/**
 * @brief Work counters and elapsed time for one algorithm invocation.
 *
 * Returned by value inside each algorithm's result; never shared between runs.
 */
struct RunMetrics {
    uint64_t dfs_visits{0};
    uint64_t edge_traversals{0};
    uint64_t queue_pushes{0};
    uint64_t queue_pops{0};
    uint64_t relax_operations{0};
    Duration elapsed{0};

    [[nodiscard]] double elapsed_ms() const noexcept {
        return std::chrono::duration<double, std::milli>(elapsed).count();
    }

    [[nodiscard]] uint64_t total_operations() const noexcept {
        return dfs_visits + edge_traversals + queue_pushes + queue_pops + relax_operations;
    }

    bool operator==(const RunMetrics&) const = default;
};

/**
 * @brief Monotonic stopwatch started on construction.
 */
class Stopwatch {
public:
    Stopwatch() noexcept : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] Duration elapsed() const noexcept {
        return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_);
    }

private:
    SteadyTime start_;
};

// ─────────────────────────────────────────────
// Critical Path Policy
// ─────────────────────────────────────────────

/// What to report when no node is farther from the source than the source itself.
enum class CriticalPathPolicy : uint8_t {
    EmptyPath,     ///< length 0, no nodes
    SourceOnly     ///< length 0, [source]
};

[[nodiscard]] constexpr std::string_view to_string(CriticalPathPolicy policy) noexcept {
    switch (policy) {
        case CriticalPathPolicy::EmptyPath:  return "empty";
        case CriticalPathPolicy::SourceOnly: return "source";
    }
    return "unknown";
}

inline constexpr NodeId kInvalidNode = std::numeric_limits<NodeId>::max();

}  // namespace dep_planner
