/**
 * ThingRegistry.cpp - Name-keyed dispatch over the Thing variant
 */

#include "xvc/iot/ThingRegistry.hpp"
#include "xvc/protocol/Messages.hpp"

#include <iostream>

using json = nlohmann::json;

namespace xvc::iot {

bool ThingRegistry::add(Thing thing) {
    std::string name = std::visit([](const auto& t) { return t.name(); }, thing);
    if (index_.count(name)) {
        std::cerr << "[IoT] Thing already registered: " << name << std::endl;
        return false;
    }
    index_[name] = things_.size();
    things_.push_back(std::move(thing));
    std::cout << "[IoT] Registered " << name << std::endl;
    return true;
}

json ThingRegistry::descriptors() const {
    json out = json::array();
    for (const auto& thing : things_) {
        out.push_back(std::visit([](const auto& t) { return t.descriptor(); }, thing));
    }
    return out;
}

json ThingRegistry::states() {
    last_states_.clear();
    json out = json::array();
    for (const auto& thing : things_) {
        json state = std::visit([](const auto& t) { return t.state(); }, thing);
        last_states_[state["name"].get<std::string>()] = state;
        out.push_back(std::move(state));
    }
    return out;
}

std::optional<json> ThingRegistry::changedStates() {
    json out = json::array();
    for (const auto& thing : things_) {
        json state = std::visit([](const auto& t) { return t.state(); }, thing);
        std::string name = state["name"].get<std::string>();

        auto it = last_states_.find(name);
        if (it != last_states_.end() && it->second == state) {
            continue;
        }
        last_states_[name] = state;
        out.push_back(std::move(state));
    }

    if (out.empty()) return std::nullopt;
    return out;
}

json ThingRegistry::invoke(const json& command) {
    if (!command.is_object()) {
        return invokeResult(false, "Command must be an object");
    }

    std::string name = protocol::stringField(command, "name");
    std::string method = protocol::stringField(command, "method");
    json parameters = json::object();
    if (command.contains("parameters")) {
        if (!command["parameters"].is_object()) {
            return invokeResult(false, "parameters must be an object");
        }
        parameters = command["parameters"];
    }

    auto it = index_.find(name);
    if (it == index_.end()) {
        std::cerr << "[IoT] Unknown thing: " << name << std::endl;
        return invokeResult(false, "Unknown thing: " + name);
    }

    return std::visit([&](auto& t) { return t.invoke(method, parameters); }, things_[it->second]);
}

json ThingRegistry::invokeAll(const json& commands) {
    json results = json::array();
    if (!commands.is_array()) {
        std::cerr << "[IoT] commands is not an array" << std::endl;
        return results;
    }

    for (const auto& command : commands) {
        json result = invoke(command);
        results.push_back({
            {"name", protocol::stringField(command, "name")},
            {"method", protocol::stringField(command, "method")},
            {"result", result},
        });
    }
    return results;
}

const Thing* ThingRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &things_[it->second];
}

} // namespace xvc::iot
