// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "config_store.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace touchstick {

namespace {
const json NULL_VALUE = nullptr;
} // namespace

const json& ConfigStore::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return NULL_VALUE;
    }
    return *it;
}

bool ConfigStore::has(const std::string& key) const {
    return values_.contains(key);
}

void ConfigStore::set(const std::string& key, json value, ChangeOrigin origin) {
    if (value.is_null()) {
        unset(key, origin);
        return;
    }

    auto it = values_.find(key);
    if (it != values_.end() && *it == value) {
        return;
    }
    values_[key] = value;
    spdlog::trace("[ConfigStore] {} = {}{}", key, value.dump(),
                  origin == ChangeOrigin::Restore ? " (restore)" : "");
    notify(key, value, origin);
}

void ConfigStore::unset(const std::string& key, ChangeOrigin origin) {
    if (!values_.contains(key)) {
        return;
    }
    values_.erase(key);
    spdlog::trace("[ConfigStore] {} unset", key);
    notify(key, NULL_VALUE, origin);
}

ConfigStore::CallbackId ConfigStore::add_change_callback(const std::string& key,
                                                         ChangeCallback cb) {
    CallbackId id = next_id_++;
    listeners_.push_back({id, key, std::move(cb)});
    return id;
}

void ConfigStore::remove_change_callback(CallbackId id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const Listener& l) { return l.id == id; }),
                     listeners_.end());
}

size_t ConfigStore::restore(const json& values) {
    if (!values.is_object()) {
        spdlog::warn("[ConfigStore] Ignoring non-object restore payload ({})", values.type_name());
        return 0;
    }
    size_t applied = 0;
    for (const auto& [key, value] : values.items()) {
        set(key, value, ChangeOrigin::Restore);
        ++applied;
    }
    return applied;
}

void ConfigStore::notify(const std::string& key, const json& value, ChangeOrigin origin) {
    // Copy: callbacks may add or remove listeners
    auto listeners = listeners_;
    for (const auto& l : listeners) {
        if (l.key.empty() || l.key == key) {
            l.cb(key, value, origin);
        }
    }
}

} // namespace touchstick
