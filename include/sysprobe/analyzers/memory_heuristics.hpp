/**
 * @file memory_heuristics.hpp
 * @brief Fragmentation metric and leak assessment over snapshots
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/core/snapshot_store.hpp"
#include "sysprobe/analyzers/snapshot_differ.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace sysprobe {
namespace analyzers {

/**
 * @struct LeakAssessment
 * @brief Verdict on whether growth between two snapshots looks like a leak
 */
struct LeakAssessment {
    bool potential_leak{false};
    bool churn{false};               ///< Growth accompanied by at least as many removals
    int64_t net_size_change{0};
    std::size_t added_count{0};
    std::size_t removed_count{0};
    uint64_t threshold{0};
    std::string reason;
};

/**
 * @class MemoryHeuristics
 * @brief Pure functions over snapshots and diffs
 *
 * Fragmentation of a region set is `1 - largest_free / total_free`, 0 when
 * there is no free space. A single free block scores 0; many equal blocks
 * approach 1.
 */
class MemoryHeuristics {
public:
    /// Fragmentation of one region list
    static double Fragmentation(const std::vector<monitors::MemoryRegion>& regions);

    /// Fragmentation of one view of a snapshot
    static double Fragmentation(const core::MemorySnapshot& snapshot, monitors::MemoryView view);

    /// Fragmentation over the free regions of all views pooled together
    static double OverallFragmentation(const core::MemorySnapshot& snapshot);

    /**
     * @brief Decide whether growth from a to b is a potential leak
     *
     * potential_leak = net growth above threshold_bytes and no churn, where
     * churn means regions were removed and removals are at least as many as
     * additions.
     *
     * @throws core::InvalidArgumentError if the snapshots belong to different
     *         processes or were taken at the same instant
     */
    static LeakAssessment AssessLeak(const core::MemorySnapshot& a,
                                     const core::MemorySnapshot& b,
                                     const SnapshotDiff& diff,
                                     uint64_t threshold_bytes = 1024 * 1024);
};

} // namespace analyzers
} // namespace sysprobe
