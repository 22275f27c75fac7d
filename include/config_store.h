// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <vector>

namespace touchstick {

using json = nlohmann::json;

/**
 * @brief Where a configuration mutation came from
 *
 * Restore marks programmatic rehydration (profile load). Listeners must not
 * trigger side effects such as overlay refreshes for Restore changes.
 */
enum class ChangeOrigin { User, Restore };

/**
 * @brief Per-widget key/value configuration store
 *
 * Values are JSON scalars (numbers, strings, booleans) or small JSON documents.
 * An unset key reads as null. Change callbacks fire only when a value actually
 * changes, with the origin of the mutation.
 *
 * Usage:
 * @code
 * ConfigStore config;
 * auto id = config.add_change_callback("x_gain", [](const std::string& key,
 *                                                   const json& value, ChangeOrigin origin) {
 *     if (origin == ChangeOrigin::Restore) return;
 *     ...
 * });
 * config.set("x_gain", 1.25);
 * @endcode
 */
class ConfigStore {
  public:
    using ChangeCallback =
        std::function<void(const std::string& key, const json& value, ChangeOrigin origin)>;
    using CallbackId = int;

    /// @return The stored value, or null if unset
    const json& get(const std::string& key) const;

    /**
     * @brief Typed read with default
     *
     * Returns default_value if the key is unset or has an incompatible type.
     */
    template <typename T> T get(const std::string& key, const T& default_value) const {
        const json& v = get(key);
        if (v.is_null()) {
            return default_value;
        }
        try {
            return v.get<T>();
        } catch (const json::exception&) {
            return default_value;
        }
    }

    bool has(const std::string& key) const;

    /// Store a value. Setting null is equivalent to unset().
    void set(const std::string& key, json value, ChangeOrigin origin = ChangeOrigin::User);

    /// Remove a value (reads back as null)
    void unset(const std::string& key, ChangeOrigin origin = ChangeOrigin::User);

    /**
     * @brief Register a callback for one key
     * @param key Key to watch; an empty key watches every key
     */
    CallbackId add_change_callback(const std::string& key, ChangeCallback cb);

    void remove_change_callback(CallbackId id);

    /// Snapshot of all values as a JSON object
    const json& values() const {
        return values_;
    }

    /**
     * @brief Replace stored values from a JSON object
     *
     * Each entry is applied with ChangeOrigin::Restore. Non-object input is
     * ignored.
     *
     * @return Number of keys applied
     */
    size_t restore(const json& values);

  private:
    void notify(const std::string& key, const json& value, ChangeOrigin origin);

    struct Listener {
        CallbackId id;
        std::string key;
        ChangeCallback cb;
    };

    json values_ = json::object();
    std::vector<Listener> listeners_;
    CallbackId next_id_ = 1;
};

} // namespace touchstick
