/**
 * @file memory_inspector.cpp
 * @brief Name conversions for memory views and allocation kinds
 *
 * @date 2025
 */

#include "sysprobe/monitors/memory_inspector.hpp"

namespace sysprobe {
namespace monitors {

std::string MemoryViewToString(MemoryView view) {
    switch (view) {
        case MemoryView::HEAP: return "heap";
        case MemoryView::STACK: return "stack";
        case MemoryView::CODE: return "code";
        case MemoryView::DATA: return "data";
        default: return "unknown";
    }
}

std::optional<MemoryView> MemoryViewFromString(const std::string& name) {
    for (auto view : kAllViews) {
        if (MemoryViewToString(view) == name) {
            return view;
        }
    }
    return std::nullopt;
}

std::string AllocationKindToString(AllocationKind kind) {
    switch (kind) {
        case AllocationKind::HEAP: return "heap";
        case AllocationKind::STACK: return "stack";
        case AllocationKind::ANONYMOUS: return "anonymous";
        case AllocationKind::FILE_BACKED: return "file";
        case AllocationKind::SPECIAL: return "special";
        case AllocationKind::UNMAPPED: return "unmapped";
        default: return "unknown";
    }
}

std::optional<AllocationKind> AllocationKindFromString(const std::string& name) {
    static const AllocationKind kinds[] = {
        AllocationKind::HEAP, AllocationKind::STACK, AllocationKind::ANONYMOUS,
        AllocationKind::FILE_BACKED, AllocationKind::SPECIAL, AllocationKind::UNMAPPED
    };
    for (auto kind : kinds) {
        if (AllocationKindToString(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace monitors
} // namespace sysprobe
