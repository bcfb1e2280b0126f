/**
 * Things.cpp - Virtual lamp and speaker
 */

#include "xvc/iot/Things.hpp"

#include <iostream>

using json = nlohmann::json;

namespace xvc::iot {

json invokeResult(bool success, const std::string& message) {
    return {{"success", success}, {"message", message}};
}

// Lamp

json Lamp::descriptor() const {
    return {
        {"name", name()},
        {"description", "Virtual lamp"},
        {"properties", {
            {"power", {{"description", "Whether the lamp is on"}, {"type", "boolean"}}},
        }},
        {"methods", {
            {"TurnOn", {{"description", "Turn the lamp on"}, {"parameters", json::object()}}},
            {"TurnOff", {{"description", "Turn the lamp off"}, {"parameters", json::object()}}},
        }},
    };
}

json Lamp::state() const {
    return {{"name", name()}, {"state", {{"power", power_}}}};
}

json Lamp::invoke(const std::string& method, const json& /*parameters*/) {
    if (method == "TurnOn") {
        power_ = true;
        std::cout << "[Lamp] On" << std::endl;
        return invokeResult(true, "Lamp turned on");
    }
    if (method == "TurnOff") {
        power_ = false;
        std::cout << "[Lamp] Off" << std::endl;
        return invokeResult(true, "Lamp turned off");
    }
    return invokeResult(false, "Unknown method: " + method);
}

// Speaker

json Speaker::descriptor() const {
    return {
        {"name", name()},
        {"description", "Speaker of the voice client"},
        {"properties", {
            {"volume", {{"description", "Current volume"}, {"type", "number"}}},
        }},
        {"methods", {
            {"SetVolume", {
                {"description", "Set the volume"},
                {"parameters", {
                    {"volume", {{"description", "Integer between 0 and 100"}, {"type", "number"}}},
                }},
            }},
        }},
    };
}

json Speaker::state() const {
    return {{"name", name()}, {"state", {{"volume", volume_}}}};
}

json Speaker::invoke(const std::string& method, const json& parameters) {
    if (method != "SetVolume") {
        return invokeResult(false, "Unknown method: " + method);
    }

    if (!parameters.is_object() || !parameters.contains("volume") || !parameters["volume"].is_number()) {
        return invokeResult(false, "Missing parameter: volume");
    }

    double requested = parameters["volume"].get<double>();
    if (!(requested >= 0.0 && requested <= 100.0)) {
        return invokeResult(false, "Volume must be between 0 and 100");
    }

    volume_ = static_cast<int>(requested);
    std::cout << "[Speaker] Volume " << volume_ << std::endl;
    return invokeResult(true, "Volume set to " + std::to_string(volume_));
}

} // namespace xvc::iot
