/**
 * ConnectionSupervisor.hpp - Reconnects a lost transport with exponential backoff
 *
 * Delays run 1s, 2s, 4s, 8s, ... capped at 30s. A successful connection
 * resets the sequence.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

namespace xvc::net {

class ConnectionSupervisor {
public:
    using ReconnectFn = std::function<void()>;

    ConnectionSupervisor(boost::asio::io_context& io,
                         ReconnectFn reconnect,
                         std::chrono::milliseconds initial = std::chrono::seconds(1),
                         std::chrono::milliseconds cap = std::chrono::seconds(30));
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /** Schedule the next reconnect attempt. Thread-safe. */
    void onDisconnected(const std::string& reason);

    /** Reset backoff and cancel any scheduled attempt. Thread-safe. */
    void onConnected();

    /** Cancel pending attempts; later disconnects are ignored. */
    void stop();

    /** Attempts scheduled since the last successful connection. */
    int attempts() const;

    /** Delay before reconnect attempt number `attempt` (0-based). */
    static std::chrono::milliseconds backoffFor(int attempt,
                                                std::chrono::milliseconds initial,
                                                std::chrono::milliseconds cap);

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace xvc::net
