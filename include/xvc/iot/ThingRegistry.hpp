/**
 * ThingRegistry.hpp - Devices keyed by name, dispatched with std::visit
 *
 * Used from the session's event path only.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "xvc/iot/Things.hpp"

namespace xvc::iot {

class ThingRegistry {
public:
    /**
     * Register a thing under its name.
     * @return false if a thing with that name is already registered
     */
    bool add(Thing thing);

    size_t size() const { return things_.size(); }
    bool contains(const std::string& name) const { return index_.count(name) > 0; }

    /** Descriptor array for every registered thing, in registration order. */
    nlohmann::json descriptors() const;

    /** Full state array. Resets the delta baseline. */
    nlohmann::json states();

    /**
     * States that changed since the last call to states() or changedStates().
     * @return nullopt if nothing changed
     */
    std::optional<nlohmann::json> changedStates();

    /**
     * Run one command {"name", "method", "parameters"}.
     * @return {"success": bool, "message": string}
     */
    nlohmann::json invoke(const nlohmann::json& command);

    /** Run every entry of an iot message's "commands" array. */
    nlohmann::json invokeAll(const nlohmann::json& commands);

    const Thing* find(const std::string& name) const;

private:
    std::vector<Thing> things_;
    std::map<std::string, size_t> index_;
    std::map<std::string, nlohmann::json> last_states_;
};

} // namespace xvc::iot
