// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "pointer_id_allocator.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace touchstick {

PointerIdAllocator::PointerIdAllocator(int max_pointers, int first_id)
    : max_pointers_(std::max(1, max_pointers)), first_id_(first_id),
      used_(static_cast<size_t>(max_pointers_), false) {}

std::optional<int> PointerIdAllocator::allocate(WidgetId owner) {
    auto existing = owners_.find(owner);
    if (existing != owners_.end()) {
        spdlog::warn("[PointerIdAllocator] Widget {} already holds pointer {}", owner,
                     existing->second);
        return existing->second;
    }

    for (size_t slot = 0; slot < used_.size(); ++slot) {
        if (!used_[slot]) {
            used_[slot] = true;
            int id = first_id_ + static_cast<int>(slot);
            owners_.emplace(owner, id);
            ++total_allocations_;
            spdlog::trace("[PointerIdAllocator] Widget {} -> pointer {}", owner, id);
            return id;
        }
    }

    spdlog::warn("[PointerIdAllocator] No free pointer for widget {} ({} in use)", owner,
                 owners_.size());
    return std::nullopt;
}

bool PointerIdAllocator::release(WidgetId owner) {
    auto it = owners_.find(owner);
    if (it == owners_.end()) {
        return false;
    }
    used_[static_cast<size_t>(it->second - first_id_)] = false;
    spdlog::trace("[PointerIdAllocator] Widget {} released pointer {}", owner, it->second);
    owners_.erase(it);
    ++total_releases_;
    return true;
}

std::optional<int> PointerIdAllocator::allocated_id(WidgetId owner) const {
    auto it = owners_.find(owner);
    if (it == owners_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace touchstick
