/**
 * test_supervisor.cpp - Reconnect backoff schedule and timer behavior
 */

#include "xvc/net/ConnectionSupervisor.hpp"
#include "../support/Fakes.hpp"

#include <cassert>
#include <iostream>

using namespace xvc::net;
using xvc::testing::pump;
using xvc::testing::runFor;
using std::chrono::milliseconds;
using std::chrono::seconds;

void test_backoff_sequence() {
    const long expected[] = {1, 2, 4, 8, 16, 30, 30, 30};
    for (int i = 0; i < 8; ++i) {
        auto delay = ConnectionSupervisor::backoffFor(i, seconds(1), seconds(30));
        assert(delay == seconds(expected[i]));
    }
    assert(ConnectionSupervisor::backoffFor(1000, seconds(1), seconds(30)) == seconds(30));

    std::cout << "[PASS] test_backoff_sequence" << std::endl;
}

void test_reconnect_fires_after_delay() {
    boost::asio::io_context io;
    int reconnects = 0;
    ConnectionSupervisor supervisor(io, [&reconnects]() { ++reconnects; }, milliseconds(20), milliseconds(80));

    supervisor.onDisconnected("socket reset");
    pump(io);
    assert(reconnects == 0);
    assert(supervisor.attempts() == 1);

    runFor(io, 60);
    assert(reconnects == 1);

    // Second failure waits twice as long
    supervisor.onDisconnected("refused");
    runFor(io, 25);
    assert(reconnects == 1);
    runFor(io, 60);
    assert(reconnects == 2);
    assert(supervisor.attempts() == 2);

    std::cout << "[PASS] test_reconnect_fires_after_delay" << std::endl;
}

void test_duplicate_disconnects_schedule_once() {
    boost::asio::io_context io;
    int reconnects = 0;
    ConnectionSupervisor supervisor(io, [&reconnects]() { ++reconnects; }, milliseconds(10), milliseconds(40));

    for (int i = 0; i < 5; ++i) supervisor.onDisconnected("flap");
    runFor(io, 50);
    assert(reconnects == 1);
    assert(supervisor.attempts() == 1);

    std::cout << "[PASS] test_duplicate_disconnects_schedule_once" << std::endl;
}

void test_connected_resets_and_cancels() {
    boost::asio::io_context io;
    int reconnects = 0;
    ConnectionSupervisor supervisor(io, [&reconnects]() { ++reconnects; }, milliseconds(30), milliseconds(120));

    supervisor.onDisconnected("lost");
    supervisor.onConnected();
    runFor(io, 60);
    assert(reconnects == 0);
    assert(supervisor.attempts() == 0);

    std::cout << "[PASS] test_connected_resets_and_cancels" << std::endl;
}

void test_stop_ignores_later_disconnects() {
    boost::asio::io_context io;
    int reconnects = 0;
    ConnectionSupervisor supervisor(io, [&reconnects]() { ++reconnects; }, milliseconds(10), milliseconds(40));

    supervisor.onDisconnected("lost");
    supervisor.stop();
    supervisor.onDisconnected("lost again");
    runFor(io, 50);
    assert(reconnects == 0);

    std::cout << "[PASS] test_stop_ignores_later_disconnects" << std::endl;
}

int main() {
    std::cout << "=== ConnectionSupervisor Tests ===" << std::endl;

    test_backoff_sequence();
    test_reconnect_fires_after_delay();
    test_duplicate_disconnects_schedule_once();
    test_connected_resets_and_cancels();
    test_stop_ignores_later_disconnects();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
