#ifndef NYAT_UDP_MAPPER_IMPL
#define NYAT_UDP_MAPPER_IMPL

#include "../udp_mapper.hpp"

#include <utility>

#include <asio/buffer.hpp>
#include <plog/Log.h>

namespace nyat {
namespace detail {

// Not a STUN message, so servers drop it. Only the outgoing packet matters.
constexpr char udp_keepalive_payload[] = {'n', 'y', 'a'};

// After this many failed discoveries in a row a cancelled run reports the
// last failure.
constexpr uint32_t udp_failure_report_threshold = 3;

} // detail

inline const char* to_string(const udp_mapper::state s) noexcept
{
    switch(s) {
    case udp_mapper::state::unbound: return "unbound";
    case udp_mapper::state::bound: return "bound";
    case udp_mapper::state::discovering: return "discovering";
    case udp_mapper::state::mapped: return "mapped";
    case udp_mapper::state::refreshing: return "refreshing";
    case udp_mapper::state::failed: return "failed";
    default: return "unknown";
    }
}

inline udp_mapper::udp_mapper(asio::io_context& io_context, local_address local,
        remote_address stun_server, remote_address remote, udp_mapper_config config)
    : mapper(io_context)
    , local_(std::move(local))
    , stun_server_(stun_server.for_local(local_.address()))
    , remote_(remote.for_local(local_.address()))
    , config_(config)
    , socket_(io_context)
    , resolver_(io_context)
    , timer_(io_context)
    , client_(socket_, config_.probe_timeout, config_.probe_attempts)
{}

inline void udp_mapper::start()
{
    num_ticks_ = 0;
    num_consecutive_failures_ = 0;
    last_error_ = error_code();
    remote_endpoint_.reset();
    set_state(state::unbound);

    error_code error;
    local_.open(socket_, error);
    if(!error) {
        local_endpoint_ = socket_.local_endpoint(error);
    }
    if(error) {
        PLOGE << "binding UDP " << local_.address() << ':' << local_.port()
              << " failed: " << error.message();
        error_code ignored;
        socket_.close(ignored);
        set_state(state::failed);
        finish(make_error_code(error::mapper::bind_failed));
        return;
    }

    PLOGD << "UDP socket bound to " << local_endpoint_;
    set_state(state::bound);
    discover();
}

inline void udp_mapper::cancel()
{
    if(!is_running()) {
        return;
    }

    error_code result = asio::error::operation_aborted;
    if(num_consecutive_failures_ >= detail::udp_failure_report_threshold) {
        result = last_error_;
    }

    client_.cancel();
    resolver_.cancel();
    timer_.cancel();
    error_code ignored;
    socket_.close(ignored);

    set_state(state::unbound);
    finish(result);
}

inline void udp_mapper::set_state(const state s)
{
    if(s == state_) {
        return;
    }
    PLOGD << "UDP mapper on port " << local_endpoint_.port() << ": "
          << to_string(state_) << " -> " << to_string(s);
    state_ = s;
    if(state_listener_) {
        state_listener_(s);
    }
}

inline void udp_mapper::discover()
{
    set_state(current_mapping() ? state::refreshing : state::discovering);

    const auto generation = generation_;
    async_resolve(resolver_, stun_server_,
            [this, generation](const error_code& error,
                    const asio::ip::udp::endpoint& server) {
                if(generation != generation_) { return; }
                if(error) {
                    on_discovery_failed(error);
                    return;
                }

                server_endpoint_ = server;
                client_.async_query(server,
                        [this, generation](const error_code& error,
                                const asio::ip::udp::endpoint& mapped) {
                            if(generation != generation_) { return; }
                            if(error) {
                                on_discovery_failed(error);
                            } else {
                                on_discovered(mapped);
                            }
                        });
            });
}

inline void udp_mapper::on_discovered(const asio::ip::udp::endpoint& mapped)
{
    num_consecutive_failures_ = 0;
    last_error_ = error_code();
    // The keepalive remote is resolved again after every discovery.
    remote_endpoint_.reset();
    set_state(state::mapped);

    mapping_info info;
    info.public_address = mapped.address();
    info.public_port = mapped.port();
    info.local_address = local_endpoint_.address();
    info.local_port = local_endpoint_.port();

    const auto generation = generation_;
    report(info);
    if(generation != generation_) {
        // Cancelled by the handler.
        return;
    }
    schedule_tick();
}

inline void udp_mapper::on_discovery_failed(const error_code& error)
{
    ++num_consecutive_failures_;
    last_error_ = error;
    PLOGW << "STUN discovery via " << stun_server_.to_string() << " failed: "
          << error.message() << " (" << num_consecutive_failures_ << " in a row)";
    if(current_mapping()) {
        set_state(state::mapped);
    }
    schedule_tick();
}

inline void udp_mapper::schedule_tick()
{
    timer_.expires_after(config_.interval);
    timer_.async_wait([this, generation = generation_](const error_code& error) {
        if(generation != generation_ || error) { return; }
        on_tick();
    });
}

inline void udp_mapper::on_tick()
{
    ++num_ticks_;
    if(!current_mapping() || num_ticks_ % config_.check_per_tick == 0) {
        discover();
    } else {
        send_keepalive();
    }
}

inline void udp_mapper::send_keepalive()
{
    if(remote_.empty()) {
        send_keepalive_to(server_endpoint_);
        return;
    }
    if(remote_endpoint_) {
        send_keepalive_to(*remote_endpoint_);
        return;
    }

    async_resolve(resolver_, remote_,
            [this, generation = generation_](const error_code& error,
                    const asio::ip::udp::endpoint& endpoint) {
                if(generation != generation_) { return; }
                if(error) {
                    PLOGW << "resolving keepalive remote " << remote_.to_string()
                          << " failed: " << error.message();
                    schedule_tick();
                    return;
                }
                remote_endpoint_ = endpoint;
                send_keepalive_to(endpoint);
            });
}

inline void udp_mapper::send_keepalive_to(const asio::ip::udp::endpoint& endpoint)
{
    socket_.async_send_to(asio::buffer(detail::udp_keepalive_payload), endpoint,
            [this, generation = generation_, endpoint](const error_code& error, std::size_t) {
                if(generation != generation_) { return; }
                if(error) {
                    // Not fatal, the next discovery will tell if the mapping
                    // is gone.
                    PLOGW << "UDP keepalive to " << endpoint << " failed: "
                          << error.message();
                } else {
                    PLOGD << "UDP keepalive sent to " << endpoint;
                }
                schedule_tick();
            });
}

} // nyat

#endif // NYAT_UDP_MAPPER_IMPL
