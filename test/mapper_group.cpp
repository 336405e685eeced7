#undef NDEBUG

#include "fake_stun_server.hpp"
#include "../include/nyat/mapper_builder.hpp"
#include "../include/nyat/mapper_group.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ip/udp.hpp>

using namespace nyat;
using namespace std::chrono_literals;

namespace {

const local_address loopback(asio::ip::make_address("127.0.0.1"), 0);

// A mapper that fails with a recoverable error is restarted, one that fails
// fatally is left stopped, and the group completes once every mapper stopped.
void test_restart_and_fatal()
{
    asio::io_context io;
    fake_stun_server stun(io);

    uint16_t closed_port = 0;
    {
        asio::ip::tcp::acceptor probe(io, asio::ip::tcp::endpoint(
                    asio::ip::make_address("127.0.0.1"), 0));
        closed_port = probe.local_endpoint().port();
    }

    error_code error;
    // Fails with connect_failed, which is recoverable, after each discovery.
    auto refused = mapper_builder::tcp(loopback, stun.address(),
            remote_address(asio::ip::make_address("127.0.0.1"), closed_port))
        .connect_attempts(1)
        .probe_timeout(2s)
        .build(io, error);
    assert(!error);

    // Fails with bind_failed, which is fatal.
    asio::ip::udp::socket blocker(io, asio::ip::udp::endpoint(
                asio::ip::make_address("127.0.0.1"), 0));
    auto unbindable = mapper_builder::udp(
            local_address(asio::ip::make_address("127.0.0.1"),
                blocker.local_endpoint().port()),
            stun.address())
        .build(io, error);
    assert(!error);

    mapper_group group(io, 10ms);
    int num_changes = 0;
    group.add("refused", std::move(refused),
            make_handler([&](const mapping_info&) { ++num_changes; }));
    group.add("unbindable", std::move(unbindable),
            make_handler([](const mapping_info&) { assert(false); }));
    assert(group.size() == 2);

    stun.on_request = [&](int n) {
        if(n == 3) {
            // The unbindable mapper stopped for good, the refused one runs.
            assert(group.num_active() == 1);
            group.cancel();
        }
    };

    bool completed = false;
    group.async_run([&] {
        completed = true;
        stun.close();
    });
    assert(group.num_active() == 2);
    io.run();

    assert(completed);
    assert(group.num_active() == 0);
    assert(stun.num_requests == 3);
    // Every run starts afresh, so each of the two completed discoveries was
    // reported. The third was cancelled before its response was read.
    assert(num_changes == 2);
}

void test_empty_group()
{
    asio::io_context io;
    mapper_group group(io);
    bool completed = false;
    group.async_run([&] { completed = true; });
    assert(!completed);
    io.run();
    assert(completed);
}

// Cancelling stops mappers that never fail by themselves.
void test_cancel()
{
    asio::io_context io;
    fake_stun_server stun(io);

    mapper_group group(io);
    error_code error;
    for(int i = 0; i < 3; ++i) {
        auto mapper = mapper_builder::udp(loopback, stun.address())
            .interval(10ms)
            .build(io, error);
        assert(!error);
        group.add("udp" + std::to_string(i), std::move(mapper),
                make_handler([](const mapping_info&) {}));
    }

    stun.on_keepalive = [&](int n) {
        // Every mapper has discovered the mapping and keeps it alive.
        if(n == 6) {
            group.cancel();
        }
    };
    bool completed = false;
    group.async_run([&] {
        completed = true;
        stun.close();
    });
    io.run();

    assert(completed);
    assert(stun.num_requests >= 3);
}

} // namespace

int main()
{
    init_test_logging();
    test_restart_and_fatal();
    test_empty_group();
    test_cancel();
    std::cout << "OK\n";
}
