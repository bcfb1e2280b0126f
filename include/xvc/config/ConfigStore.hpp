/**
 * ConfigStore.hpp - Key-path configuration lookup
 *
 * Loads config/config.json, merges it over built-in defaults and answers
 * dotted lookups such as "SYSTEM_OPTIONS.NETWORK.WEBSOCKET_URL". The only
 * values written back are the generated device identity fields.
 */

#pragma once

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

namespace xvc::config {

class ConfigStore {
public:
    /** Store holding only the built-in defaults. */
    ConfigStore();

    /**
     * Load a JSON file and merge it over the defaults.
     * @return false if the file is missing or malformed (defaults stay in effect)
     */
    bool load(const std::string& path);

    /**
     * Merge a JSON document given as text over the current values.
     */
    bool loadFromString(const std::string& text);

    /**
     * Look up a dotted key path.
     * @return nullptr if any segment is missing
     */
    const nlohmann::json* find(const std::string& key_path) const;

    bool has(const std::string& key_path) const { return find(key_path) != nullptr; }

    /**
     * Typed lookup. Missing keys, nulls and type mismatches yield `fallback`.
     */
    template <typename T>
    T get(const std::string& key_path, const T& fallback) const {
        const nlohmann::json* node = find(key_path);
        if (!node || node->is_null()) {
            return fallback;
        }
        try {
            return node->get<T>();
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[Config] Bad value for " << key_path << ": " << e.what() << std::endl;
            return fallback;
        }
    }

    std::string getString(const std::string& key_path, const std::string& fallback = "") const {
        return get<std::string>(key_path, fallback);
    }

    const nlohmann::json& root() const { return root_; }

    /**
     * Fill in SYSTEM_OPTIONS.CLIENT_ID (random UUID) and SYSTEM_OPTIONS.DEVICE_ID
     * (MAC address of the first non-loopback interface) when they are unset.
     * Configured values are never replaced. When `persist_path` is given and
     * something was generated, the document is written there so the identity
     * survives restarts.
     * @return false only if generated values could not be written
     */
    bool ensureIdentity(const std::string& persist_path = "");

    /** Write the current document as JSON. */
    bool save(const std::string& path) const;

    /** Built-in default document. */
    static nlohmann::json defaults();

private:
    void set(const std::string& key_path, nlohmann::json value);
    static void merge(nlohmann::json& base, const nlohmann::json& overlay);

    nlohmann::json root_;
};

} // namespace xvc::config
