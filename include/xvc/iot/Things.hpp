/**
 * Things.hpp - Closed set of controllable devices
 *
 * Each thing exposes a descriptor (properties and methods), its current
 * state, and invoke(method, parameters) returning {"success", "message"}.
 */

#pragma once

#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace xvc::iot {

class Lamp {
public:
    std::string name() const { return "Lamp"; }
    nlohmann::json descriptor() const;
    nlohmann::json state() const;
    nlohmann::json invoke(const std::string& method, const nlohmann::json& parameters);

    bool power() const { return power_; }

private:
    bool power_ = false;
};

class Speaker {
public:
    explicit Speaker(int volume = 100) : volume_(volume) {}

    std::string name() const { return "Speaker"; }
    nlohmann::json descriptor() const;
    nlohmann::json state() const;
    nlohmann::json invoke(const std::string& method, const nlohmann::json& parameters);

    int volume() const { return volume_; }

private:
    int volume_;
};

using Thing = std::variant<Lamp, Speaker>;

nlohmann::json invokeResult(bool success, const std::string& message);

} // namespace xvc::iot
