/**
 * @file proc_maps_inspector.hpp
 * @brief MemoryInspector backed by /proc/[pid]/maps
 *
 * Reads the kernel's mapping table for a process and sorts each mapping into
 * a view: [heap] into HEAP, [stack] and [stack:tid] into STACK, executable
 * mappings into CODE, and everything else into DATA. Gaps between neighbouring
 * mappings of the same view, up to a configurable size, are reported as free
 * (unused) regions so fragmentation can be measured.
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/monitors/memory_inspector.hpp"

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace sysprobe {
namespace monitors {

/**
 * @struct MapsEntry
 * @brief One parsed line of /proc/[pid]/maps
 */
struct MapsEntry {
    uint64_t start_address{0};
    uint64_t end_address{0};
    std::string permissions;  ///< e.g. "rw-p"
    uint64_t offset{0};
    std::string device;
    uint64_t inode{0};
    std::string pathname;     ///< May be empty for anonymous mappings
};

/**
 * @class ProcMapsInspector
 * @brief Linux procfs implementation of MemoryInspector
 *
 * **Thread Safety**: Stateless apart from its configuration; safe to share.
 */
class ProcMapsInspector : public MemoryInspector {
public:
    /**
     * @struct Config
     * @brief Inspector settings
     */
    struct Config {
        std::filesystem::path proc_root{"/proc"};     ///< procfs mount point
        uint64_t max_free_gap_bytes{64ull << 20};      ///< Largest gap still counted as free space
    };

    ProcMapsInspector();
    explicit ProcMapsInspector(const Config& config);

    std::vector<MemoryRegion> Regions(int pid, MemoryView view) override;

    /**
     * @brief Parse one maps line
     * @param line Raw line, e.g. "55d0c000-55d0d000 r-xp 00001000 08:01 1234 /bin/cat"
     * @return Parsed entry, or nullopt if malformed
     */
    static std::optional<MapsEntry> ParseMapsLine(const std::string& line);

    /**
     * @brief Decide which view a mapping belongs to
     */
    static MemoryView ClassifyView(const MapsEntry& entry);

    /**
     * @brief Build the region list of one view from parsed entries
     *
     * Used regions come straight from the entries; free regions fill gaps
     * between consecutive entries of the view that are no larger than
     * max_free_gap_bytes.
     */
    std::vector<MemoryRegion> BuildView(const std::vector<MapsEntry>& entries,
                                        MemoryView view) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    std::vector<MapsEntry> ReadMaps(int pid) const;
    static AllocationKind ClassifyKind(const MapsEntry& entry);
};

} // namespace monitors
} // namespace sysprobe
