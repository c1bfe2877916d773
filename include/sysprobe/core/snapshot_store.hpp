/**
 * @file snapshot_store.hpp
 * @brief Immutable memory snapshots of traced processes
 *
 * Captures the heap, stack, code and data views of a process through a
 * MemoryInspector, validates them, summarises them and keeps them under
 * monotonically increasing ids for the lifetime of the store.
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/monitors/memory_inspector.hpp"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <shared_mutex>
#include <chrono>
#include <cstdint>

namespace sysprobe {
namespace core {

/**
 * @struct MemorySummary
 * @brief Size totals over all regions of a snapshot
 */
struct MemorySummary {
    uint64_t total_size{0};       ///< Used + free bytes
    uint64_t used_size{0};        ///< Bytes in used regions
    uint64_t free_size{0};        ///< Bytes in free regions
    double used_percentage{0.0};  ///< used_size / total_size * 100 (0 when empty)
    std::size_t region_count{0};
    std::size_t used_region_count{0};
};

/**
 * @struct MemorySnapshot
 * @brief Point-in-time view of a process's memory regions
 *
 * Never modified after the store creates it; shared as a pointer to const.
 */
struct MemorySnapshot {
    uint64_t id{0};                                   ///< Monotonic store id
    std::optional<uint64_t> session_id;               ///< Trace session it was taken for
    int process_id{0};
    std::string label;
    std::chrono::system_clock::time_point taken_at;

    std::map<monitors::MemoryView, std::vector<monitors::MemoryRegion>> regions_by_view;
    MemorySummary summary;
    std::string fingerprint;                          ///< SHA-256 of the region layout

    /// Regions of one view (empty if the view has none)
    const std::vector<monitors::MemoryRegion>& Regions(monitors::MemoryView view) const;

    std::size_t RegionCount() const;
};

/**
 * @struct SnapshotRequest
 * @brief Parameters of TakeSnapshot()
 *
 * When session_id is set the process is taken from that session and
 * process_id is ignored.
 */
struct SnapshotRequest {
    std::optional<uint64_t> session_id;
    std::optional<int> process_id;
    std::string label;
};

/// Maps a trace session id to its process id; throws NotFoundError for unknown sessions
using ProcessResolver = std::function<int(uint64_t session_id)>;

/**
 * @class SnapshotStore
 * @brief Thread-safe registry of memory snapshots
 *
 * **Snapshot Workflow**:
 * 1. Resolve the process (from the session or the request)
 * 2. Enumerate heap, stack, code and data through the inspector
 * 3. Reject views whose regions overlap or share a base address
 * 4. Compute the summary and fingerprint
 * 5. Store under the next id
 *
 * A failure at any step stores nothing.
 *
 * **Usage Example**:
 * @code
 * auto inspector = std::make_shared<monitors::ProcMapsInspector>();
 * SnapshotStore store(inspector);
 *
 * auto before = store.TakeSnapshot({std::nullopt, 1234, "before"});
 * // ...
 * auto after = store.TakeSnapshot({std::nullopt, 1234, "after"});
 * std::cout << after->summary.used_size - before->summary.used_size << std::endl;
 * @endcode
 */
class SnapshotStore {
public:
    /**
     * @struct Config
     * @brief Snapshot store settings
     */
    struct Config {
        std::size_t max_snapshots{0};             ///< Oldest snapshots are dropped beyond this (0 = unlimited)
        std::string default_label{"snapshot"};    ///< Label used when a request has none
    };

    explicit SnapshotStore(std::shared_ptr<monitors::MemoryInspector> inspector,
                           ProcessResolver resolver = nullptr);
    SnapshotStore(std::shared_ptr<monitors::MemoryInspector> inspector,
                  ProcessResolver resolver,
                  const Config& config);

    ~SnapshotStore() = default;

    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    /**
     * @brief Capture, validate and store a snapshot
     *
     * @throws NotFoundError if request.session_id names an unknown session
     * @throws InvalidArgumentError if neither a session nor a positive process id is given
     * @throws CaptureUnavailableError if a view cannot be enumerated
     * @throws IntegrityViolationError if used regions of a view overlap
     */
    std::shared_ptr<const MemorySnapshot> TakeSnapshot(const SnapshotRequest& request);

    /**
     * @brief Look up a snapshot
     * @throws NotFoundError for unknown ids
     */
    std::shared_ptr<const MemorySnapshot> GetSnapshot(uint64_t snapshot_id) const;

    /// All stored snapshots ordered by id
    std::vector<std::shared_ptr<const MemorySnapshot>> ListSnapshots() const;

    /// Snapshots of one process ordered by id
    std::vector<std::shared_ptr<const MemorySnapshot>> SnapshotsForProcess(int process_id) const;

    /**
     * @brief Check that the regions of a view do not overlap
     *
     * Used regions must be disjoint, and free gaps may not overlap anything
     * either, so base addresses are unique within a view.
     *
     * @throws IntegrityViolationError naming the first overlapping pair
     */
    static void ValidateDisjoint(monitors::MemoryView view,
                                 const std::vector<monitors::MemoryRegion>& regions);

    /// Totals over every region of every view
    static MemorySummary Summarize(
        const std::map<monitors::MemoryView, std::vector<monitors::MemoryRegion>>& regions_by_view);

    /// SHA-256 over view, address, size, used flag and protection of every region
    static std::string Fingerprint(
        const std::map<monitors::MemoryView, std::vector<monitors::MemoryRegion>>& regions_by_view);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::shared_ptr<monitors::MemoryInspector> inspector_;
    ProcessResolver resolver_;

    std::map<uint64_t, std::shared_ptr<const MemorySnapshot>> snapshots_;
    mutable std::shared_mutex snapshots_mutex_;
    uint64_t next_snapshot_id_{1};   ///< Guarded by snapshots_mutex_

    int ResolveProcess(const SnapshotRequest& request) const;
};

} // namespace core
} // namespace sysprobe
