/**
 * @file snapshot_store.cpp
 * @brief Implementation of memory snapshot capture and storage
 *
 * **Fingerprint Format** (input to SHA-256):
 * ```
 * heap:0x55d0c0000000+0x21000:1:rw-p;...|stack:...|code:...|data:...
 * ```
 * Region ids and labels are left out so two captures of an unchanged
 * address space produce the same fingerprint.
 *
 * @date 2025
 */

#include "sysprobe/core/snapshot_store.hpp"
#include "sysprobe/core/errors.hpp"
#include "sysprobe/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>
#include <mutex>

namespace sysprobe {
namespace core {

using monitors::MemoryRegion;
using monitors::MemoryView;

namespace {

std::string Hex(uint64_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

} // anonymous namespace

const std::vector<MemoryRegion>& MemorySnapshot::Regions(MemoryView view) const {
    static const std::vector<MemoryRegion> empty;
    auto it = regions_by_view.find(view);
    return it == regions_by_view.end() ? empty : it->second;
}

std::size_t MemorySnapshot::RegionCount() const {
    std::size_t count = 0;
    for (const auto& [view, regions] : regions_by_view) {
        count += regions.size();
    }
    return count;
}

SnapshotStore::SnapshotStore(std::shared_ptr<monitors::MemoryInspector> inspector,
                             ProcessResolver resolver)
    : SnapshotStore(std::move(inspector), std::move(resolver), Config{}) {
}

// Constructor
SnapshotStore::SnapshotStore(std::shared_ptr<monitors::MemoryInspector> inspector,
                             ProcessResolver resolver,
                             const Config& config)
    : config_(config)
    , inspector_(std::move(inspector))
    , resolver_(std::move(resolver)) {

    if (!inspector_) {
        throw InvalidArgumentError("Memory inspector is required");
    }
    spdlog::debug("Snapshot store initialized (retention: {})",
                  config_.max_snapshots == 0 ? std::string("unlimited")
                                             : std::to_string(config_.max_snapshots));
}

int SnapshotStore::ResolveProcess(const SnapshotRequest& request) const {
    if (request.session_id) {
        if (!resolver_) {
            throw NotFoundError("Session not found: " + std::to_string(*request.session_id));
        }
        return resolver_(*request.session_id);
    }

    if (!request.process_id) {
        throw InvalidArgumentError("A sessionId or processId is required");
    }
    if (*request.process_id <= 0) {
        throw InvalidArgumentError("Invalid processId: " + std::to_string(*request.process_id));
    }
    return *request.process_id;
}

std::shared_ptr<const MemorySnapshot> SnapshotStore::TakeSnapshot(const SnapshotRequest& request) {
    int process_id = ResolveProcess(request);

    auto snapshot = std::make_shared<MemorySnapshot>();
    snapshot->session_id = request.session_id;
    snapshot->process_id = process_id;
    snapshot->label = request.label.empty() ? config_.default_label : request.label;

    // Enumerate every view before touching the store
    for (MemoryView view : monitors::kAllViews) {
        std::vector<MemoryRegion> regions;
        try {
            regions = inspector_->Regions(process_id, view);
        }
        catch (const SysprobeError&) {
            throw;
        }
        catch (const std::exception& e) {
            throw CaptureUnavailableError("Cannot enumerate " + monitors::MemoryViewToString(view) +
                                          " of PID " + std::to_string(process_id) + ": " + e.what());
        }

        std::stable_sort(regions.begin(), regions.end(),
                         [](const MemoryRegion& a, const MemoryRegion& b) {
                             return a.base_address < b.base_address;
                         });
        for (auto& region : regions) {
            region.view = view;
        }

        ValidateDisjoint(view, regions);
        snapshot->regions_by_view[view] = std::move(regions);
    }

    // Snapshot-local ids, unique across views
    uint64_t region_id = 1;
    for (auto& [view, regions] : snapshot->regions_by_view) {
        for (auto& region : regions) {
            region.id = region_id++;
        }
    }

    snapshot->summary = Summarize(snapshot->regions_by_view);
    snapshot->fingerprint = Fingerprint(snapshot->regions_by_view);
    snapshot->taken_at = std::chrono::system_clock::now();

    {
        std::unique_lock<std::shared_mutex> lock(snapshots_mutex_);
        snapshot->id = next_snapshot_id_++;
        snapshots_[snapshot->id] = snapshot;

        if (config_.max_snapshots > 0) {
            while (snapshots_.size() > config_.max_snapshots) {
                spdlog::debug("Dropping snapshot {} (retention limit)", snapshots_.begin()->first);
                snapshots_.erase(snapshots_.begin());
            }
        }
    }

    spdlog::info("Snapshot {} '{}' of PID {}: {} regions, {} bytes used ({:.1f}%)",
                 snapshot->id, snapshot->label, process_id, snapshot->summary.region_count,
                 snapshot->summary.used_size, snapshot->summary.used_percentage);

    return snapshot;
}

std::shared_ptr<const MemorySnapshot> SnapshotStore::GetSnapshot(uint64_t snapshot_id) const {
    std::shared_lock<std::shared_mutex> lock(snapshots_mutex_);
    auto it = snapshots_.find(snapshot_id);
    if (it == snapshots_.end()) {
        throw NotFoundError("Snapshot not found: " + std::to_string(snapshot_id));
    }
    return it->second;
}

std::vector<std::shared_ptr<const MemorySnapshot>> SnapshotStore::ListSnapshots() const {
    std::shared_lock<std::shared_mutex> lock(snapshots_mutex_);
    std::vector<std::shared_ptr<const MemorySnapshot>> result;
    result.reserve(snapshots_.size());
    for (const auto& [id, snapshot] : snapshots_) {
        result.push_back(snapshot);
    }
    return result;
}

std::vector<std::shared_ptr<const MemorySnapshot>> SnapshotStore::SnapshotsForProcess(int process_id) const {
    std::shared_lock<std::shared_mutex> lock(snapshots_mutex_);
    std::vector<std::shared_ptr<const MemorySnapshot>> result;
    for (const auto& [id, snapshot] : snapshots_) {
        if (snapshot->process_id == process_id) {
            result.push_back(snapshot);
        }
    }
    return result;
}

void SnapshotStore::ValidateDisjoint(MemoryView view, const std::vector<MemoryRegion>& regions) {
    std::vector<const MemoryRegion*> sorted;
    sorted.reserve(regions.size());
    for (const auto& region : regions) {
        if (region.base_address + region.size < region.base_address) {
            throw IntegrityViolationError("Region at " + Hex(region.base_address) +
                                          " wraps the address space in " +
                                          monitors::MemoryViewToString(view) + " view");
        }
        sorted.push_back(&region);
    }

    std::sort(sorted.begin(), sorted.end(), [](const MemoryRegion* a, const MemoryRegion* b) {
        return a->base_address < b->base_address;
    });

    // Free gaps are part of the layout too, so each base address appears once
    for (std::size_t i = 1; i < sorted.size(); ++i) {
        const MemoryRegion& prev = *sorted[i - 1];
        const MemoryRegion& cur = *sorted[i];
        if (prev.EndAddress() > cur.base_address || prev.base_address == cur.base_address) {
            throw IntegrityViolationError(
                std::string("Overlapping ") + (prev.used && cur.used ? "used " : "") + "regions in " +
                monitors::MemoryViewToString(view) + " view: [" +
                Hex(prev.base_address) + ", " + Hex(prev.EndAddress()) + ") and [" +
                Hex(cur.base_address) + ", " + Hex(cur.EndAddress()) + ")");
        }
    }
}

MemorySummary SnapshotStore::Summarize(const std::map<MemoryView, std::vector<MemoryRegion>>& regions_by_view) {
    MemorySummary summary;

    for (const auto& [view, regions] : regions_by_view) {
        for (const auto& region : regions) {
            summary.region_count++;
            summary.total_size += region.size;
            if (region.used) {
                summary.used_region_count++;
                summary.used_size += region.size;
            } else {
                summary.free_size += region.size;
            }
        }
    }

    if (summary.total_size > 0) {
        summary.used_percentage = static_cast<double>(summary.used_size) * 100.0 /
                                  static_cast<double>(summary.total_size);
    }

    return summary;
}

std::string SnapshotStore::Fingerprint(const std::map<MemoryView, std::vector<MemoryRegion>>& regions_by_view) {
    std::ostringstream canonical;

    for (MemoryView view : monitors::kAllViews) {
        canonical << monitors::MemoryViewToString(view) << ':';
        auto it = regions_by_view.find(view);
        if (it != regions_by_view.end()) {
            for (const auto& region : it->second) {
                canonical << Hex(region.base_address) << '+' << Hex(region.size) << ':'
                          << (region.used ? 1 : 0) << ':' << region.protection << ';';
            }
        }
        canonical << '|';
    }

    return utils::HashUtils::ComputeSHA256(canonical.str());
}

} // namespace core
} // namespace sysprobe
