/**
 * TransportFactory.hpp - Pick the carrier named in the configuration
 */

#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>

#include "xvc/transport/Transport.hpp"

namespace xvc::config { class ConfigStore; }

namespace xvc::transport {

/**
 * Build the transport selected by SYSTEM_OPTIONS.NETWORK.TRANSPORT
 * ("websocket" or "mqtt").
 * @return nullptr if the carrier is unknown or not configured
 */
std::unique_ptr<Transport> createTransport(const config::ConfigStore& config, boost::asio::io_context& io);

} // namespace xvc::transport
