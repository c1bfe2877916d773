/**
 * @file snapshot_differ.hpp
 * @brief Structural comparison of two memory snapshots
 *
 * Regions are matched by base address within each view. Region ids are
 * snapshot-local and never used as a key.
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/core/snapshot_store.hpp"

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace sysprobe {
namespace analyzers {

/**
 * @struct RegionChange
 * @brief Region present in both snapshots whose size or used flag differs
 */
struct RegionChange {
    monitors::MemoryRegion old_region;
    monitors::MemoryRegion new_region;
};

/**
 * @struct ViewDiff
 * @brief Differences within one memory view
 */
struct ViewDiff {
    std::vector<monitors::MemoryRegion> added;     ///< In B only
    std::vector<monitors::MemoryRegion> removed;   ///< In A only
    std::vector<RegionChange> changed;             ///< In both, size or used differs

    bool Empty() const { return added.empty() && removed.empty() && changed.empty(); }
};

/**
 * @struct ChangeAnalysis
 * @brief Size and fragmentation deltas between two snapshots
 */
struct ChangeAnalysis {
    int64_t net_size_change{0};                               ///< used(B) - used(A)
    bool leak_suspected{false};                               ///< net_size_change > leak threshold
    std::map<monitors::MemoryView, double> fragmentation_change;  ///< frag(B) - frag(A) per view
    double overall_fragmentation_change{0.0};
};

/**
 * @struct SnapshotDiff
 * @brief Complete comparison result of snapshot A (before) and B (after)
 */
struct SnapshotDiff {
    uint64_t snapshot_a{0};
    uint64_t snapshot_b{0};
    std::map<monitors::MemoryView, ViewDiff> views;   ///< One entry per view
    ChangeAnalysis analysis;
    bool identical{false};                            ///< Fingerprints match

    std::size_t AddedCount() const;
    std::size_t RemovedCount() const;
    std::size_t ChangedCount() const;
};

/**
 * @class SnapshotDiffer
 * @brief Computes SnapshotDiffs in time linear in the number of regions
 *
 * **Usage Example**:
 * @code
 * SnapshotDiffer differ;
 * auto diff = differ.Compare(store, before->id, after->id);
 * if (diff.analysis.leak_suspected) {
 *     spdlog::warn("Used memory grew by {} bytes", diff.analysis.net_size_change);
 * }
 * @endcode
 */
class SnapshotDiffer {
public:
    /**
     * @struct Config
     * @brief Differ settings
     */
    struct Config {
        uint64_t leak_threshold_bytes{1024 * 1024};   ///< Growth above this suspects a leak
    };

    SnapshotDiffer();
    explicit SnapshotDiffer(const Config& config);

    /**
     * @brief Compare two stored snapshots
     * @throws core::NotFoundError if either id is unknown
     */
    SnapshotDiff Compare(const core::SnapshotStore& store, uint64_t snapshot_a, uint64_t snapshot_b) const;

    /// Compare two snapshots directly
    SnapshotDiff Diff(const core::MemorySnapshot& a, const core::MemorySnapshot& b) const;

    /// Compare two region lists of the same view
    static ViewDiff DiffView(const std::vector<monitors::MemoryRegion>& before,
                             const std::vector<monitors::MemoryRegion>& after);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace analyzers
} // namespace sysprobe
