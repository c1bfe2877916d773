/**
 * @file memory_heuristics.cpp
 * @brief Implementation of fragmentation and leak heuristics
 *
 * @date 2025
 */

#include "sysprobe/analyzers/memory_heuristics.hpp"
#include "sysprobe/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace sysprobe {
namespace analyzers {

using monitors::MemoryRegion;
using monitors::MemoryView;

double MemoryHeuristics::Fragmentation(const std::vector<MemoryRegion>& regions) {
    uint64_t total_free = 0;
    uint64_t largest_free = 0;

    for (const auto& region : regions) {
        if (region.used) {
            continue;
        }
        total_free += region.size;
        largest_free = std::max(largest_free, region.size);
    }

    if (total_free == 0) {
        return 0.0;
    }
    return 1.0 - static_cast<double>(largest_free) / static_cast<double>(total_free);
}

double MemoryHeuristics::Fragmentation(const core::MemorySnapshot& snapshot, MemoryView view) {
    return Fragmentation(snapshot.Regions(view));
}

double MemoryHeuristics::OverallFragmentation(const core::MemorySnapshot& snapshot) {
    std::vector<MemoryRegion> free_regions;
    for (const auto& [view, regions] : snapshot.regions_by_view) {
        std::copy_if(regions.begin(), regions.end(), std::back_inserter(free_regions),
                     [](const MemoryRegion& r) { return !r.used; });
    }
    return Fragmentation(free_regions);
}

LeakAssessment MemoryHeuristics::AssessLeak(const core::MemorySnapshot& a,
                                            const core::MemorySnapshot& b,
                                            const SnapshotDiff& diff,
                                            uint64_t threshold_bytes) {
    if (a.process_id != b.process_id) {
        throw core::InvalidArgumentError("Snapshots " + std::to_string(a.id) + " and " +
                                         std::to_string(b.id) + " belong to different processes (" +
                                         std::to_string(a.process_id) + " vs " +
                                         std::to_string(b.process_id) + ")");
    }
    if (a.taken_at == b.taken_at) {
        throw core::InvalidArgumentError("Snapshots " + std::to_string(a.id) + " and " +
                                         std::to_string(b.id) + " were taken at the same time");
    }

    LeakAssessment assessment;
    assessment.net_size_change = diff.analysis.net_size_change;
    assessment.added_count = diff.AddedCount();
    assessment.removed_count = diff.RemovedCount();
    assessment.threshold = threshold_bytes;

    assessment.churn = assessment.removed_count > 0 &&
                       assessment.removed_count >= assessment.added_count;

    bool grew = assessment.net_size_change > static_cast<int64_t>(threshold_bytes);
    assessment.potential_leak = grew && !assessment.churn;

    if (assessment.potential_leak) {
        assessment.reason = "Used memory grew by " + std::to_string(assessment.net_size_change) +
                            " bytes across " + std::to_string(assessment.added_count) +
                            " new region(s) without matching releases";
        spdlog::warn("Potential leak in PID {}: +{} bytes between snapshots {} and {}",
                     a.process_id, assessment.net_size_change, a.id, b.id);
    } else if (grew) {
        assessment.reason = "Growth of " + std::to_string(assessment.net_size_change) +
                            " bytes is matched by " + std::to_string(assessment.removed_count) +
                            " released region(s)";
    } else {
        assessment.reason = "Net change of " + std::to_string(assessment.net_size_change) +
                            " bytes is within the " + std::to_string(threshold_bytes) +
                            " byte threshold";
    }

    return assessment;
}

} // namespace analyzers
} // namespace sysprobe
