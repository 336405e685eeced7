#ifndef NYAT_TCP_MAPPER_IMPL
#define NYAT_TCP_MAPPER_IMPL

#include "../tcp_mapper.hpp"

#include <algorithm>
#include <utility>

#include <asio/buffer.hpp>
#include <asio/socket_base.hpp>
#include <asio/write.hpp>
#include <plog/Log.h>

namespace nyat {

inline const char* to_string(const tcp_mapper::state s) noexcept
{
    switch(s) {
    case tcp_mapper::state::unbound: return "unbound";
    case tcp_mapper::state::discovering: return "discovering";
    case tcp_mapper::state::connecting: return "connecting";
    case tcp_mapper::state::connected: return "connected";
    case tcp_mapper::state::keepalive: return "keepalive";
    case tcp_mapper::state::reconnecting: return "reconnecting";
    case tcp_mapper::state::failed: return "failed";
    default: return "unknown";
    }
}

inline tcp_mapper::tcp_mapper(asio::io_context& io_context, local_address local,
        remote_address stun_server, remote_address remote, tcp_mapper_config config)
    : mapper(io_context)
    , local_(std::move(local))
    , stun_server_(stun_server.for_local(local_.address()))
    , remote_(remote.for_local(local_.address()))
    , config_(config)
    , probe_(io_context)
    , udp_resolver_(io_context)
    , client_(probe_, config_.probe_timeout, config_.probe_attempts)
    , socket_(io_context)
    , tcp_resolver_(io_context)
    , timer_(io_context)
    , connect_timer_(io_context)
{}

inline void tcp_mapper::start()
{
    local_port_ = local_.port();
    num_connect_failures_ = 0;
    num_discoveries_ = 0;
    connect_timed_out_ = false;
    set_state(state::unbound);
    discover();
}

inline void tcp_mapper::cancel()
{
    if(!is_running()) {
        return;
    }

    client_.cancel();
    udp_resolver_.cancel();
    tcp_resolver_.cancel();
    timer_.cancel();
    connect_timer_.cancel();
    close_probe();
    close_socket();
    ++connection_;

    set_state(state::unbound);
    finish(asio::error::operation_aborted);
}

inline void tcp_mapper::set_state(const state s)
{
    if(s == state_) {
        return;
    }
    PLOGD << "TCP mapper on port " << local_port_ << ": "
          << to_string(state_) << " -> " << to_string(s);
    state_ = s;
    if(state_listener_) {
        state_listener_(s);
    }
}

inline void tcp_mapper::discover()
{
    ++num_discoveries_;
    set_state(state::discovering);

    error_code error;
    local_.open(probe_, local_port_, error);
    if(!error && local_port_ == 0) {
        // Later binds must use the same port for the mapping to apply.
        local_port_ = probe_.local_endpoint(error).port();
    }
    if(error) {
        fail_bind("UDP probe", error);
        return;
    }

    const auto generation = generation_;
    async_resolve(udp_resolver_, stun_server_,
            [this, generation](const error_code& error,
                    const asio::ip::udp::endpoint& server) {
                if(generation != generation_) { return; }
                if(error) {
                    on_discovery_failed(error);
                    return;
                }

                client_.async_query(server,
                        [this, generation](const error_code& error,
                                const asio::ip::udp::endpoint& mapped) {
                            if(generation != generation_) { return; }
                            // The TCP socket takes over the port from here.
                            close_probe();
                            if(error) {
                                on_discovery_failed(error);
                                return;
                            }

                            mapping_info info;
                            info.public_address = mapped.address();
                            info.public_port = mapped.port();
                            info.local_address = local_.address();
                            info.local_port = local_port_;
                            report(info);
                            if(generation != generation_) {
                                // Cancelled by the handler.
                                return;
                            }
                            connect();
                        });
            });
}

inline void tcp_mapper::on_discovery_failed(const error_code& error)
{
    close_probe();
    PLOGW << "STUN discovery via " << stun_server_.to_string() << " failed: "
          << error.message() << ", retrying in " << config_.retry_interval.count() << " ms";

    timer_.expires_after(config_.retry_interval);
    timer_.async_wait([this, generation = generation_](const error_code& error) {
        if(generation != generation_ || error) { return; }
        discover();
    });
}

inline void tcp_mapper::connect()
{
    set_state(state::connecting);
    async_resolve(tcp_resolver_, remote_,
            [this, generation = generation_](const error_code& error,
                    const asio::ip::tcp::endpoint& endpoint) {
                if(generation != generation_) { return; }
                if(error) {
                    on_connect_failed(error);
                    return;
                }
                connect_to(endpoint);
            });
}

inline void tcp_mapper::connect_to(const asio::ip::tcp::endpoint& endpoint)
{
    error_code error;
    local_.open(socket_, local_port_, error);
    if(error) {
        fail_bind("TCP socket", error);
        return;
    }

    const auto generation = generation_;
    connect_timed_out_ = false;
    connect_timer_.expires_after(config_.connect_timeout);
    connect_timer_.async_wait([this, generation](const error_code& error) {
        if(generation != generation_ || error || state_ != state::connecting) { return; }
        connect_timed_out_ = true;
        error_code ignored;
        socket_.cancel(ignored);
    });

    PLOGD << "connecting to " << endpoint << " from port " << local_port_;
    socket_.async_connect(endpoint, [this, generation](error_code error) {
        if(generation != generation_) { return; }
        connect_timer_.cancel();
        if(error == asio::error::operation_aborted && connect_timed_out_) {
            error = asio::error::timed_out;
        }
        if(error) {
            on_connect_failed(error);
            return;
        }
        on_connected();
    });
}

inline void tcp_mapper::on_connect_failed(const error_code& error)
{
    close_socket();
    ++num_connect_failures_;
    if(num_connect_failures_ >= config_.connect_attempts) {
        PLOGE << "connecting to " << remote_.to_string() << " failed "
              << num_connect_failures_ << " times, last error: " << error.message();
        set_state(state::failed);
        finish(make_error_code(error::mapper::connect_failed));
        return;
    }

    const auto delay = backoff_delay();
    PLOGW << "connecting to " << remote_.to_string() << " failed: " << error.message()
          << ", retrying in " << delay.count() << " ms";
    timer_.expires_after(delay);
    timer_.async_wait([this, generation = generation_](const error_code& error) {
        if(generation != generation_ || error) { return; }
        connect();
    });
}

inline void tcp_mapper::on_connected()
{
    num_connect_failures_ = 0;
    const auto connection = ++connection_;
    set_state(state::connected);

    error_code error;
    socket_.set_option(asio::socket_base::keep_alive(true), error);
    if(error) {
        PLOGW << "enabling SO_KEEPALIVE failed: " << error.message();
    }
    PLOGI << "keepalive connection to " << remote_.to_string()
          << " established from port " << local_port_;

    request_ = "HEAD / HTTP/1.1\r\nHost: " + remote_.host_header()
        + "\r\nConnection: keep-alive\r\n\r\n";
    set_state(state::keepalive);
    read_response(connection);
    send_request(connection);
}

inline void tcp_mapper::send_request(const uint64_t connection)
{
    asio::async_write(socket_, asio::buffer(request_),
            [this, generation = generation_, connection](const error_code& error,
                    std::size_t) {
                if(generation != generation_ || connection != connection_) { return; }
                if(error) {
                    on_connection_lost(connection, error);
                    return;
                }

                timer_.expires_after(config_.interval);
                timer_.async_wait([this, generation, connection](const error_code& error) {
                    if(generation != generation_ || connection != connection_ || error) {
                        return;
                    }
                    send_request(connection);
                });
            });
}

inline void tcp_mapper::read_response(const uint64_t connection)
{
    // The responses carry no information, they are only drained.
    socket_.async_read_some(asio::buffer(read_buffer_),
            [this, generation = generation_, connection](const error_code& error,
                    std::size_t) {
                if(generation != generation_ || connection != connection_) { return; }
                if(error) {
                    on_connection_lost(connection, error);
                    return;
                }
                read_response(connection);
            });
}

inline void tcp_mapper::on_connection_lost(const uint64_t connection,
        const error_code& error)
{
    // The read and the write may both fail for the same connection.
    if(connection != connection_) {
        return;
    }
    ++connection_;

    if(error == asio::error::eof) {
        PLOGW << "keepalive connection closed by " << remote_.to_string();
    } else {
        PLOGW << "keepalive connection to " << remote_.to_string() << " lost: "
              << error.message();
    }
    close_socket();
    set_state(state::reconnecting);

    timer_.expires_after(config_.retry_interval);
    timer_.async_wait([this, generation = generation_](const error_code& error) {
        if(generation != generation_ || error) { return; }
        discover();
    });
}

inline void tcp_mapper::fail_bind(const char* what, const error_code& error)
{
    PLOGE << "binding " << what << " to " << local_.address() << ':' << local_port_
          << " failed: " << error.message();
    close_probe();
    close_socket();
    set_state(state::failed);
    finish(make_error_code(error::mapper::bind_failed));
}

inline void tcp_mapper::close_probe()
{
    error_code ignored;
    probe_.close(ignored);
}

inline void tcp_mapper::close_socket()
{
    error_code ignored;
    socket_.close(ignored);
}

inline std::chrono::milliseconds tcp_mapper::backoff_delay() const
{
    auto delay = config_.retry_interval;
    for(uint32_t i = 1; i < num_connect_failures_ && delay < config_.max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, config_.max_backoff);
}

} // nyat

#endif // NYAT_TCP_MAPPER_IMPL
