/**
 * @file snapshot_differ.cpp
 * @brief Implementation of snapshot differencing
 *
 * **Matching** (per view):
 * ```
 * index A by base_address ──► walk B: miss → added
 *                                     hit  → changed if size/used differ
 *                            leftover A    → removed
 * ```
 *
 * @date 2025
 */

#include "sysprobe/analyzers/snapshot_differ.hpp"
#include "sysprobe/analyzers/memory_heuristics.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>

namespace sysprobe {
namespace analyzers {

using monitors::MemoryRegion;
using monitors::MemoryView;

std::size_t SnapshotDiff::AddedCount() const {
    std::size_t count = 0;
    for (const auto& [view, diff] : views) {
        count += diff.added.size();
    }
    return count;
}

std::size_t SnapshotDiff::RemovedCount() const {
    std::size_t count = 0;
    for (const auto& [view, diff] : views) {
        count += diff.removed.size();
    }
    return count;
}

std::size_t SnapshotDiff::ChangedCount() const {
    std::size_t count = 0;
    for (const auto& [view, diff] : views) {
        count += diff.changed.size();
    }
    return count;
}

SnapshotDiffer::SnapshotDiffer() : SnapshotDiffer(Config{}) {}

// Constructor
SnapshotDiffer::SnapshotDiffer(const Config& config)
    : config_(config) {
}

SnapshotDiff SnapshotDiffer::Compare(const core::SnapshotStore& store,
                                     uint64_t snapshot_a, uint64_t snapshot_b) const {
    auto a = store.GetSnapshot(snapshot_a);
    auto b = store.GetSnapshot(snapshot_b);
    return Diff(*a, *b);
}

ViewDiff SnapshotDiffer::DiffView(const std::vector<MemoryRegion>& before,
                                  const std::vector<MemoryRegion>& after) {
    ViewDiff diff;

    // Regions sharing a base address pair up in list order
    std::unordered_map<uint64_t, std::vector<std::size_t>> by_address;
    by_address.reserve(before.size());
    for (std::size_t i = 0; i < before.size(); ++i) {
        by_address[before[i].base_address].push_back(i);
    }

    std::unordered_map<uint64_t, std::size_t> consumed;
    std::vector<bool> matched(before.size(), false);

    for (const auto& region : after) {
        auto it = by_address.find(region.base_address);
        std::size_t& next = consumed[region.base_address];
        if (it == by_address.end() || next >= it->second.size()) {
            diff.added.push_back(region);
            continue;
        }

        std::size_t index = it->second[next++];
        matched[index] = true;
        const MemoryRegion& old_region = before[index];
        if (old_region.size != region.size || old_region.used != region.used) {
            diff.changed.push_back(RegionChange{old_region, region});
        }
    }

    for (std::size_t i = 0; i < before.size(); ++i) {
        if (!matched[i]) {
            diff.removed.push_back(before[i]);
        }
    }

    return diff;
}

SnapshotDiff SnapshotDiffer::Diff(const core::MemorySnapshot& a, const core::MemorySnapshot& b) const {
    SnapshotDiff result;
    result.snapshot_a = a.id;
    result.snapshot_b = b.id;
    result.identical = !a.fingerprint.empty() && a.fingerprint == b.fingerprint;

    for (MemoryView view : monitors::kAllViews) {
        result.views[view] = DiffView(a.Regions(view), b.Regions(view));

        result.analysis.fragmentation_change[view] =
            MemoryHeuristics::Fragmentation(b, view) - MemoryHeuristics::Fragmentation(a, view);
    }

    result.analysis.overall_fragmentation_change =
        MemoryHeuristics::OverallFragmentation(b) - MemoryHeuristics::OverallFragmentation(a);

    result.analysis.net_size_change = static_cast<int64_t>(b.summary.used_size) -
                                      static_cast<int64_t>(a.summary.used_size);
    result.analysis.leak_suspected =
        result.analysis.net_size_change > static_cast<int64_t>(config_.leak_threshold_bytes);

    spdlog::debug("Diff {} -> {}: +{} -{} ~{} regions, net {} bytes",
                  a.id, b.id, result.AddedCount(), result.RemovedCount(),
                  result.ChangedCount(), result.analysis.net_size_change);

    return result;
}

} // namespace analyzers
} // namespace sysprobe
