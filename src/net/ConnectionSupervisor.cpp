/**
 * ConnectionSupervisor.cpp - Backoff timer on an Asio strand
 */

#include "xvc/net/ConnectionSupervisor.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <iostream>

namespace asio = boost::asio;

namespace xvc::net {

struct ConnectionSupervisor::Impl : std::enable_shared_from_this<ConnectionSupervisor::Impl> {
    asio::strand<asio::io_context::executor_type> strand;
    asio::steady_timer timer;
    ReconnectFn reconnect;
    std::chrono::milliseconds initial;
    std::chrono::milliseconds cap;

    std::atomic<int> attempt{0};
    bool scheduled = false;
    bool stopped = false;
    uint64_t gen = 0;

    Impl(asio::io_context& io, ReconnectFn fn, std::chrono::milliseconds first, std::chrono::milliseconds max)
        : strand(asio::make_strand(io)), timer(strand), reconnect(std::move(fn)), initial(first), cap(max) {}

    void schedule(const std::string& reason) {
        if (stopped || scheduled) return;

        auto delay = backoffFor(attempt++, initial, cap);
        scheduled = true;
        uint64_t id = ++gen;

        std::cerr << "[Supervisor] " << reason << "; reconnecting in " << delay.count() << " ms" << std::endl;

        timer.expires_after(delay);
        std::weak_ptr<Impl> weak = weak_from_this();
        timer.async_wait([weak, id](const boost::system::error_code& ec) {
            if (ec == asio::error::operation_aborted) return;
            auto self = weak.lock();
            if (!self || self->stopped || id != self->gen) return;

            self->scheduled = false;
            std::cout << "[Supervisor] Reconnect attempt " << self->attempt << std::endl;
            if (self->reconnect) self->reconnect();
        });
    }

    void reset() {
        if (attempt > 0) {
            std::cout << "[Supervisor] Connection restored" << std::endl;
        }
        attempt = 0;
        scheduled = false;
        ++gen;
        timer.cancel();
    }

    void halt() {
        stopped = true;
        scheduled = false;
        ++gen;
        timer.cancel();
    }
};

ConnectionSupervisor::ConnectionSupervisor(asio::io_context& io, ReconnectFn reconnect,
                                           std::chrono::milliseconds initial, std::chrono::milliseconds cap)
    : impl_(std::make_shared<Impl>(io, std::move(reconnect), initial, cap)) {
}

ConnectionSupervisor::~ConnectionSupervisor() {
    stop();
}

void ConnectionSupervisor::onDisconnected(const std::string& reason) {
    auto impl = impl_;
    asio::post(impl->strand, [impl, reason]() { impl->schedule(reason); });
}

void ConnectionSupervisor::onConnected() {
    auto impl = impl_;
    asio::post(impl->strand, [impl]() { impl->reset(); });
}

void ConnectionSupervisor::stop() {
    auto impl = impl_;
    asio::post(impl->strand, [impl]() { impl->halt(); });
}

int ConnectionSupervisor::attempts() const {
    return impl_->attempt;
}

std::chrono::milliseconds ConnectionSupervisor::backoffFor(int attempt,
                                                           std::chrono::milliseconds initial,
                                                           std::chrono::milliseconds cap) {
    std::chrono::milliseconds delay = initial;
    for (int i = 0; i < attempt && delay < cap; ++i) {
        delay *= 2;
    }
    return delay < cap ? delay : cap;
}

} // namespace xvc::net
