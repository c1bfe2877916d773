/**
 * @file memory_inspector.hpp
 * @brief Memory region model and the platform enumeration interface
 *
 * A process's address space is presented through four views (heap, stack,
 * code, data). Each view is a list of regions, some in use and some free.
 * Within one view of one snapshot, used regions never overlap.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <array>
#include <optional>
#include <cstdint>

namespace sysprobe {
namespace monitors {

/**
 * @enum MemoryView
 * @brief Logical partition of a process address space
 */
enum class MemoryView {
    HEAP,   ///< brk heap
    STACK,  ///< Thread stacks
    CODE,   ///< Executable mappings
    DATA    ///< Everything else (data, bss, anonymous, file mappings)
};

/// All views in canonical order
constexpr std::array<MemoryView, 4> kAllViews = {
    MemoryView::HEAP, MemoryView::STACK, MemoryView::CODE, MemoryView::DATA
};

/**
 * @enum AllocationKind
 * @brief How a region came to exist
 */
enum class AllocationKind {
    HEAP,         ///< Program break heap
    STACK,        ///< Stack mapping
    ANONYMOUS,    ///< Anonymous mmap
    FILE_BACKED,  ///< File mapping (binary, shared library, mapped file)
    SPECIAL,      ///< Kernel provided ([vdso], [vvar], ...)
    UNMAPPED      ///< Free gap between mappings
};

/**
 * @struct MemoryRegion
 * @brief Contiguous address range within one view
 */
struct MemoryRegion {
    uint64_t id{0};                               ///< Snapshot-local id, not comparable across snapshots
    MemoryView view{MemoryView::DATA};            ///< View this region belongs to
    uint64_t base_address{0};                     ///< First byte
    uint64_t size{0};                             ///< Length in bytes
    bool used{true};                              ///< Mapped/allocated (false = free)
    std::string protection;                       ///< Permission string, e.g. "r-xp"
    AllocationKind allocation_kind{AllocationKind::ANONYMOUS};  ///< Origin of the region
    std::string label;                            ///< Backing path or pseudo name

    /// One past the last byte
    uint64_t EndAddress() const { return base_address + size; }
};

std::string MemoryViewToString(MemoryView view);
std::optional<MemoryView> MemoryViewFromString(const std::string& name);
std::string AllocationKindToString(AllocationKind kind);
std::optional<AllocationKind> AllocationKindFromString(const std::string& name);

/**
 * @class MemoryInspector
 * @brief Synchronous enumeration of a process's memory regions
 */
class MemoryInspector {
public:
    virtual ~MemoryInspector() = default;

    /**
     * @brief Enumerate one view of a process's memory
     * @param pid Process id
     * @param view View to enumerate
     * @return Regions in ascending address order
     *
     * @throws core::CaptureUnavailableError if the process cannot be inspected
     */
    virtual std::vector<MemoryRegion> Regions(int pid, MemoryView view) = 0;
};

} // namespace monitors
} // namespace sysprobe
