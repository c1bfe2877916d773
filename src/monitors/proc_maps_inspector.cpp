/**
 * @file proc_maps_inspector.cpp
 * @brief Implementation of the /proc/[pid]/maps memory inspector
 *
 * **maps Line Format**:
 * ```
 * address           perms offset  dev   inode   pathname
 * 00400000-00452000 r-xp 00000000 08:02 173521  /usr/bin/dbus-daemon
 * 00e03000-00e24000 rw-p 00000000 00:00 0       [heap]
 * 7fff5a2d5000-7fff5a2f6000 rw-p 00000000 00:00 0  [stack]
 * ```
 *
 * **View Classification**:
 * - `[heap]`                  → HEAP
 * - `[stack]`, `[stack:tid]`  → STACK
 * - permissions contain `x`   → CODE
 * - anything else             → DATA
 *
 * @date 2025
 */

#include "sysprobe/monitors/proc_maps_inspector.hpp"
#include "sysprobe/core/errors.hpp"
#include "sysprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <algorithm>

namespace sysprobe {
namespace monitors {

using utils::StringUtils;

ProcMapsInspector::ProcMapsInspector()
    : ProcMapsInspector(Config{}) {
}

ProcMapsInspector::ProcMapsInspector(const Config& config)
    : config_(config) {
    spdlog::debug("ProcMaps inspector initialized (root: {})", config_.proc_root.string());
}

std::vector<MemoryRegion> ProcMapsInspector::Regions(int pid, MemoryView view) {
    auto entries = ReadMaps(pid);
    auto regions = BuildView(entries, view);

    spdlog::debug("pid {} {} view: {} regions", pid, MemoryViewToString(view), regions.size());
    return regions;
}

std::vector<MapsEntry> ProcMapsInspector::ReadMaps(int pid) const {
    if (pid <= 0) {
        throw core::CaptureUnavailableError("Invalid process id: " + std::to_string(pid));
    }

    auto maps_path = config_.proc_root / std::to_string(pid) / "maps";
    std::ifstream maps_file(maps_path);
    if (!maps_file.is_open()) {
        spdlog::error("Failed to open {}", maps_path.string());
        throw core::CaptureUnavailableError("Cannot read memory map of pid " + std::to_string(pid));
    }

    std::vector<MapsEntry> entries;
    std::string line;
    int line_num = 0;

    while (std::getline(maps_file, line)) {
        line_num++;
        if (line.empty()) {
            continue;
        }

        auto entry = ParseMapsLine(line);
        if (!entry) {
            spdlog::warn("Skipping malformed maps line {}: {}", line_num, line);
            continue;
        }
        entries.push_back(*entry);
    }

    if (maps_file.bad()) {
        throw core::CaptureUnavailableError("I/O error reading " + maps_path.string());
    }

    return entries;
}

std::optional<MapsEntry> ProcMapsInspector::ParseMapsLine(const std::string& line) {
    std::istringstream iss(line);
    std::string address_range;
    std::string offset_string;
    std::string inode_string;
    MapsEntry entry;

    if (!(iss >> address_range >> entry.permissions >> offset_string >> entry.device >> inode_string)) {
        return std::nullopt;
    }

    std::getline(iss >> std::ws, entry.pathname);
    entry.pathname = StringUtils::Trim(entry.pathname);

    auto hyphen = address_range.find('-');
    if (hyphen == std::string::npos || entry.permissions.size() != 4) {
        return std::nullopt;
    }

    try {
        entry.start_address = std::stoull(address_range.substr(0, hyphen), nullptr, 16);
        entry.end_address = std::stoull(address_range.substr(hyphen + 1), nullptr, 16);
        entry.offset = std::stoull(offset_string, nullptr, 16);
        entry.inode = std::stoull(inode_string);
    }
    catch (const std::exception&) {
        return std::nullopt;
    }

    if (entry.end_address <= entry.start_address) {
        return std::nullopt;
    }

    return entry;
}

MemoryView ProcMapsInspector::ClassifyView(const MapsEntry& entry) {
    if (entry.pathname == "[heap]") {
        return MemoryView::HEAP;
    }
    if (StringUtils::StartsWith(entry.pathname, "[stack")) {
        return MemoryView::STACK;
    }
    if (entry.permissions.find('x') != std::string::npos) {
        return MemoryView::CODE;
    }
    return MemoryView::DATA;
}

AllocationKind ProcMapsInspector::ClassifyKind(const MapsEntry& entry) {
    if (entry.pathname == "[heap]") {
        return AllocationKind::HEAP;
    }
    if (StringUtils::StartsWith(entry.pathname, "[stack")) {
        return AllocationKind::STACK;
    }
    if (StringUtils::StartsWith(entry.pathname, "[")) {
        return AllocationKind::SPECIAL;
    }
    if (entry.pathname.empty() || entry.inode == 0) {
        return AllocationKind::ANONYMOUS;
    }
    return AllocationKind::FILE_BACKED;
}

std::vector<MemoryRegion> ProcMapsInspector::BuildView(const std::vector<MapsEntry>& entries,
                                                       MemoryView view) const {
    std::vector<MapsEntry> selected;
    for (const auto& entry : entries) {
        if (ClassifyView(entry) == view) {
            selected.push_back(entry);
        }
    }

    std::sort(selected.begin(), selected.end(),
              [](const MapsEntry& a, const MapsEntry& b) {
                  return a.start_address < b.start_address;
              });

    std::vector<MemoryRegion> regions;
    uint64_t next_id = 1;

    for (std::size_t i = 0; i < selected.size(); ++i) {
        const auto& entry = selected[i];

        // Free gap between the previous mapping of this view and this one
        if (i > 0) {
            uint64_t gap_start = selected[i - 1].end_address;
            if (entry.start_address > gap_start &&
                entry.start_address - gap_start <= config_.max_free_gap_bytes) {
                MemoryRegion gap;
                gap.id = next_id++;
                gap.view = view;
                gap.base_address = gap_start;
                gap.size = entry.start_address - gap_start;
                gap.used = false;
                gap.protection = "---p";
                gap.allocation_kind = AllocationKind::UNMAPPED;
                regions.push_back(gap);
            }
        }

        MemoryRegion region;
        region.id = next_id++;
        region.view = view;
        region.base_address = entry.start_address;
        region.size = entry.end_address - entry.start_address;
        region.used = true;
        region.protection = entry.permissions;
        region.allocation_kind = ClassifyKind(entry);
        region.label = entry.pathname;
        regions.push_back(region);
    }

    return regions;
}

} // namespace monitors
} // namespace sysprobe
