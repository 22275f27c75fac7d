// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "event_bus.h"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace touchstick {

/**
 * @brief Exclusive touch pointer slots shared by all widgets
 *
 * Each widget holds at most one id at a time. The lowest free id is handed
 * out first. Allocating twice for the same owner returns the id it already
 * holds; releasing an owner that holds nothing is a no-op.
 */
class PointerIdAllocator {
  public:
    explicit PointerIdAllocator(int max_pointers = 10, int first_id = 1);

    /// @return The owner's id, or nullopt if every slot is taken
    std::optional<int> allocate(WidgetId owner);

    /// @return true if the owner held an id
    bool release(WidgetId owner);

    std::optional<int> allocated_id(WidgetId owner) const;

    size_t in_use() const {
        return owners_.size();
    }

    uint64_t total_allocations() const {
        return total_allocations_;
    }
    uint64_t total_releases() const {
        return total_releases_;
    }

  private:
    int max_pointers_;
    int first_id_;
    std::map<WidgetId, int> owners_;
    std::vector<bool> used_;
    uint64_t total_allocations_ = 0;
    uint64_t total_releases_ = 0;
};

} // namespace touchstick
