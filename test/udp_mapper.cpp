#undef NDEBUG

#include "fake_stun_server.hpp"
#include "../include/nyat/mapper_builder.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <thread>
#include <vector>

#include <asio/bind_executor.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/udp.hpp>

using namespace nyat;
using namespace std::chrono_literals;

namespace {

const local_address loopback(asio::ip::make_address("127.0.0.1"), 0);

// check_per_tick = 3: after the initial discovery, ticks 3, 6 and 9 discover
// and the six others only send keepalives to the STUN server.
void test_probe_cadence()
{
    asio::io_context io;
    fake_stun_server server(io);

    error_code error;
    auto mapper = mapper_builder::udp(loopback, server.address())
        .interval(20ms)
        .check_per_tick(3)
        .probe_timeout(2s)
        .build(io, error);
    assert(!error);

    int num_changes = 0;
    error_code result;
    bool completed = false;

    server.on_request = [&](int n) {
        if(n == 4) {
            mapper->cancel();
        }
    };
    mapper->async_run(make_handler([&](const mapping_info&) { ++num_changes; }),
            [&](const error_code& error) {
                result = error;
                completed = true;
                server.close();
            });
    assert(mapper->is_running());

    io.run();

    assert(completed);
    assert(result == asio::error::operation_aborted);
    assert(server.num_requests == 4);
    assert(server.num_keepalives == 6);
    for(const auto& payload : server.keepalive_payloads) {
        assert(payload == "nya");
    }
    assert(mapper->num_ticks() == 9);
    assert(num_changes == 1);
    assert(!mapper->is_running());
    assert(mapper->current_state() == udp_mapper::state::unbound);

    // Every request carries a fresh transaction ID.
    for(std::size_t i = 1; i < server.transaction_ids.size(); ++i) {
        assert(server.transaction_ids[i] != server.transaction_ids[i - 1]);
    }
}

// The server reports 203.0.113.5:51000 three times, then :51001 three times.
// The handler sees exactly the two distinct endpoints, in order.
void test_mapping_changes()
{
    asio::io_context io;
    fake_stun_server server(io);

    error_code error;
    auto mapper = mapper_builder::udp(loopback, server.address())
        .interval(10ms)
        .check_per_tick(1)
        .probe_timeout(2s)
        .build(io, error);
    assert(!error);

    std::vector<mapping_info> changes;
    std::vector<udp_mapper::state> states;
    mapper->set_state_listener([&](udp_mapper::state s) { states.push_back(s); });

    server.on_request = [&](int n) {
        if(n == 3) {
            server.mapped.port(51001);
        } else if(n == 6) {
            mapper->cancel();
        }
    };

    error_code second_result;
    mapper->async_run(make_handler([&](const mapping_info& info) { changes.push_back(info); }),
            [&](const error_code&) { server.close(); });
    // Only one run at a time.
    mapper->async_run(make_handler([](const mapping_info&) { assert(false); }),
            [&](const error_code& error) { second_result = error; });

    io.run();

    assert(second_result == error::mapper::already_running);
    assert(changes.size() == 2);
    assert(changes[0].public_address == asio::ip::make_address("203.0.113.5"));
    assert(changes[0].public_port == 51000);
    assert(changes[1].public_address == asio::ip::make_address("203.0.113.5"));
    assert(changes[1].public_port == 51001);
    for(const auto& info : changes) {
        assert(info.local_address == asio::ip::make_address("127.0.0.1"));
        assert(info.local_port == mapper->local_endpoint().port());
        assert(info.local_port != 0);
    }

    assert(states.size() >= 4);
    assert(states[0] == udp_mapper::state::bound);
    assert(states[1] == udp_mapper::state::discovering);
    assert(states[2] == udp_mapper::state::mapped);
    assert(states[3] == udp_mapper::state::refreshing);
    assert(states.back() == udp_mapper::state::unbound);
}

// Bound to the unspecified address on a fixed port, the mapping reports the
// bind address as it was given.
void test_unspecified_bind_address()
{
    asio::io_context io;
    fake_stun_server server(io);

    uint16_t port = 0;
    {
        asio::ip::udp::socket picker(io, asio::ip::udp::endpoint(
                    asio::ip::address_v4::any(), 0));
        port = picker.local_endpoint().port();
    }

    error_code error;
    auto mapper = mapper_builder::udp(
            local_address(asio::ip::make_address("0.0.0.0"), port), server.address())
        .interval(10ms)
        .probe_timeout(2s)
        .build(io, error);
    assert(!error);

    std::vector<mapping_info> changes;
    mapper->async_run(make_handler([&](const mapping_info& info) {
                changes.push_back(info);
                mapper->cancel();
            }),
            [&](const error_code&) { server.close(); });
    io.run();

    assert(changes.size() == 1);
    assert(changes[0].public_address == asio::ip::make_address("203.0.113.5"));
    assert(changes[0].public_port == 51000);
    assert(changes[0].local_address == asio::ip::make_address("0.0.0.0"));
    assert(changes[0].local_port == port);
}

// The completion handler runs on its own executor, whose context doesn't
// run out of work before the run ended.
void test_completion_executor()
{
    asio::io_context io;
    asio::io_context completion_io;
    fake_stun_server server(io);

    error_code error;
    auto mapper = mapper_builder::udp(loopback, server.address())
        .interval(10ms)
        .probe_timeout(2s)
        .build(io, error);
    assert(!error);

    std::thread::id completion_thread;
    bool completed = false;
    error_code result;
    mapper->async_run(make_handler([&](const mapping_info&) {
                mapper->cancel();
                server.close();
            }),
            asio::bind_executor(completion_io, [&](const error_code& error) {
                result = error;
                completed = true;
                completion_thread = std::this_thread::get_id();
            }));

    // Runs while the mapper has yet to complete anything.
    std::thread runner([&] { completion_io.run(); });
    const auto runner_thread = runner.get_id();
    io.run();
    runner.join();

    assert(completed);
    assert(result == asio::error::operation_aborted);
    assert(completion_thread == runner_thread);
}

// A mapper may be run again right after a cancelled run, and reports the
// mapping again since each run starts without one.
void test_restart()
{
    asio::io_context io;
    fake_stun_server server(io);

    error_code error;
    auto mapper = mapper_builder::udp(loopback, server.address())
        .interval(10ms)
        .build(io, error);
    assert(!error);

    int num_changes = 0;
    int num_runs = 0;
    auto handler = make_handler([&](const mapping_info&) {
        ++num_changes;
        mapper->cancel();
    });

    std::function<void()> run = [&] {
        ++num_runs;
        mapper->async_run(handler, [&](const error_code& error) {
            assert(error == asio::error::operation_aborted);
            if(num_runs < 2) {
                run();
            } else {
                server.close();
            }
        });
    };
    run();
    io.run();

    assert(num_runs == 2);
    assert(num_changes == 2);
    assert(server.num_requests == 2);
}

// Unanswered discoveries don't end the run, but a run cancelled after three
// failed discoveries in a row reports the last failure.
void test_failures_reported_on_cancel()
{
    asio::io_context io;
    fake_stun_server server(io);
    server.respond = false;

    error_code error;
    auto mapper = mapper_builder::udp(loopback, server.address())
        .interval(10ms)
        .probe_timeout(20ms)
        .probe_attempts(1)
        .build(io, error);
    assert(!error);

    server.on_request = [&](int n) {
        if(n == 4) {
            mapper->cancel();
        }
    };
    error_code result;
    mapper->async_run(make_handler([](const mapping_info&) { assert(false); }),
            [&](const error_code& error) {
                result = error;
                server.close();
            });
    io.run();

    assert(result == asio::error::timed_out);
    assert(is_recoverable(result));
    // Without a mapping there are no keepalives.
    assert(server.num_keepalives == 0);
}

// Binding error responses are retried with a fresh transaction.
void test_error_response_retried()
{
    asio::io_context io;
    fake_stun_server server(io);
    server.error_code_to_send = 420;

    error_code error;
    auto mapper = mapper_builder::udp(loopback, server.address())
        .interval(10ms)
        .probe_timeout(2s)
        .probe_attempts(2)
        .build(io, error);
    assert(!error);

    server.on_request = [&](int n) {
        if(n == 3) {
            // The first discovery has given up after two attempts.
            server.error_code_to_send = 0;
        }
    };
    int num_changes = 0;
    mapper->async_run(make_handler([&](const mapping_info&) {
                ++num_changes;
                mapper->cancel();
            }),
            [&](const error_code&) { server.close(); });
    io.run();

    assert(num_changes == 1);
    assert(server.num_requests == 4);
    assert(server.transaction_ids[0] != server.transaction_ids[1]);
}

void test_bind_failure()
{
    asio::io_context io;
    fake_stun_server server(io);

    // Holds the port without SO_REUSEADDR or SO_REUSEPORT.
    asio::ip::udp::socket blocker(io, asio::ip::udp::endpoint(
                asio::ip::make_address("127.0.0.1"), 0));
    const local_address taken(asio::ip::make_address("127.0.0.1"),
            blocker.local_endpoint().port());

    error_code error;
    auto mapper = mapper_builder::udp(taken, server.address()).build(io, error);
    assert(!error);

    error_code result;
    mapper->async_run(make_handler([](const mapping_info&) { assert(false); }),
            [&](const error_code& error) {
                result = error;
                server.close();
            });
    io.run();

    assert(result == error::mapper::bind_failed);
    assert(!is_recoverable(result));
    assert(mapper->current_state() == udp_mapper::state::failed);
    assert(server.num_requests == 0);
}

} // namespace

int main()
{
    init_test_logging();
    test_probe_cadence();
    test_mapping_changes();
    test_unspecified_bind_address();
    test_completion_executor();
    test_restart();
    test_failures_reported_on_cancel();
    test_error_response_retried();
    test_bind_failure();
    std::cout << "OK\n";
}
