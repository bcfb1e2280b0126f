/**
 * ActivationClient.hpp - Device activation check against the OTA endpoint
 *
 * POSTs the device description to SYSTEM_OPTIONS.NETWORK.OTA_VERSION_URL.
 * A response carrying an "activation" block means the device still waits
 * for its verification code to be entered; anything else is activated.
 */

#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "xvc/protocol/Messages.hpp"
#include "xvc/session/Collaborators.hpp"

namespace xvc::config { class ConfigStore; }

namespace xvc::net {

struct ActivationOptions {
    std::string ota_url;
    protocol::Identity identity;
    std::string app_version = "1.6.0";
    int timeout_ms = 10000;

    static ActivationOptions fromConfig(const config::ConfigStore& store);
};

class ActivationClient : public session::ActivationGate {
public:
    explicit ActivationClient(ActivationOptions options);
    ~ActivationClient() override;

    ActivationClient(const ActivationClient&) = delete;
    ActivationClient& operator=(const ActivationClient&) = delete;

    /** Runs the request on a worker thread; `done` is called from that thread. */
    void check(Completion done) override;

    /** Classify an OTA response body. */
    static session::ActivationResult interpret(const std::string& body);

    /** Request body sent to the OTA endpoint. */
    nlohmann::json requestBody() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xvc::net
