/**
 * TransportFactory.cpp - Carrier selection
 */

#include "xvc/transport/TransportFactory.hpp"
#include "xvc/config/ConfigStore.hpp"
#include "xvc/transport/MqttTransport.hpp"
#include "xvc/transport/WebsocketTransport.hpp"

#include <iostream>

namespace xvc::transport {

std::unique_ptr<Transport> createTransport(const config::ConfigStore& config, boost::asio::io_context& io) {
    std::string kind = config.getString("SYSTEM_OPTIONS.NETWORK.TRANSPORT", "websocket");

    if (kind == "websocket") {
        WebsocketOptions options;
        options.url = config.getString("SYSTEM_OPTIONS.NETWORK.WEBSOCKET_URL");
        options.access_token = config.getString("SYSTEM_OPTIONS.NETWORK.WEBSOCKET_ACCESS_TOKEN");
        options.identity.device_id = config.getString("SYSTEM_OPTIONS.DEVICE_ID");
        options.identity.client_id = config.getString("SYSTEM_OPTIONS.CLIENT_ID");

        if (!parseWebsocketUrl(options.url)) {
            std::cerr << "[Transport] WEBSOCKET_URL is not a ws:// or wss:// URL: '" << options.url << "'" << std::endl;
            return nullptr;
        }
        std::cout << "[Transport] Using WebSocket " << options.url << std::endl;
        return std::make_unique<WebsocketTransport>(io, std::move(options));
    }

    if (kind == "mqtt") {
        const nlohmann::json* info = config.find("SYSTEM_OPTIONS.NETWORK.MQTT_INFO");
        MqttOptions options = MqttOptions::fromJson(info ? *info : nlohmann::json());
        if (options.host.empty()) {
            // Activation hands out the broker settings through setCredentials()
            std::cout << "[Transport] Using MQTT + UDP, endpoint pending activation" << std::endl;
        } else {
            std::cout << "[Transport] Using MQTT " << options.host << ":" << options.port << " + UDP" << std::endl;
        }
        return std::make_unique<MqttTransport>(io, std::move(options));
    }

    std::cerr << "[Transport] Unknown TRANSPORT '" << kind << "'" << std::endl;
    return nullptr;
}

} // namespace xvc::transport
