#ifndef NYAT_TCP_MAPPER_HEADER
#define NYAT_TCP_MAPPER_HEADER

#include "mapper.hpp"
#include "mapper_config.hpp"
#include "local_address.hpp"
#include "remote_address.hpp"
#include "detail/stun_client.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include <asio/ip/tcp.hpp>
#include <asio/ip/udp.hpp>
#include <asio/steady_timer.hpp>

namespace nyat {

/**
 * @brief Keeps a TCP mapping alive through a long lived HTTP connection.
 *
 * The public endpoint is discovered with a short lived UDP probe bound to
 * the same local port as the TCP connection. Once the mapping is known, the
 * mapper connects to the keepalive remote from that port and sends an HTTP
 * `HEAD` request every `interval`, discarding the responses. When the
 * connection is lost it waits `retry_interval`, discovers the mapping again
 * and reconnects.
 *
 * The probe is closed before the TCP socket binds the port, so another
 * process may take the port in between. Enable force-reuse on the local
 * address if that is a concern.
 *
 * The run completes with @ref error::mapper::bind_failed if a socket cannot
 * be bound, or with @ref error::mapper::connect_failed after
 * `connect_attempts` consecutive failed connection attempts. Discovery
 * failures are retried indefinitely.
 */
class tcp_mapper : public mapper
{
public:
    enum class state
    {
        unbound,
        discovering,
        connecting,
        connected,
        keepalive,
        reconnecting,
        failed,
    };

    using state_listener = std::function<void(state)>;

private:
    local_address local_;
    remote_address stun_server_;
    remote_address remote_;
    tcp_mapper_config config_;

    asio::ip::udp::socket probe_;
    asio::ip::udp::resolver udp_resolver_;
    detail::stun_client client_;

    asio::ip::tcp::socket socket_;
    asio::ip::tcp::resolver tcp_resolver_;
    asio::steady_timer timer_;
    asio::steady_timer connect_timer_;

    // The port every socket of this run binds. If the local address has port
    // 0, this is the port the OS chose for the first probe.
    uint16_t local_port_ = 0;

    uint32_t num_connect_failures_ = 0;
    uint32_t num_discoveries_ = 0;
    // Identifies the current connection, so that the read and write
    // handlers of a connection already torn down are ignored.
    uint64_t connection_ = 0;
    bool connect_timed_out_ = false;

    std::string request_;
    std::array<char, 4096> read_buffer_;

    state state_ = state::unbound;
    state_listener state_listener_;

public:
    /**
     * @param stun_server Must not be empty.
     * @param remote The HTTP server the keepalive connection is made to. Must
     * not be empty.
     */
    tcp_mapper(asio::io_context& io_context, local_address local,
            remote_address stun_server, remote_address remote,
            tcp_mapper_config config = tcp_mapper_config());

    void cancel() override;

    state current_state() const noexcept { return state_; }

    /** Invoked on every state transition, for diagnostics. */
    void set_state_listener(state_listener listener)
    {
        state_listener_ = std::move(listener);
    }

    /** The number of discoveries started in the current or last run. */
    uint32_t num_discoveries() const noexcept { return num_discoveries_; }

    /** The local port of the current or last run, 0 if not yet bound. */
    uint16_t local_port() const noexcept { return local_port_; }

    const tcp_mapper_config& config() const noexcept { return config_; }

protected:
    void start() override;

private:
    void set_state(state s);

    void discover();
    void on_discovery_failed(const error_code& error);

    void connect();
    void connect_to(const asio::ip::tcp::endpoint& endpoint);
    void on_connect_failed(const error_code& error);
    void on_connected();

    void send_request(uint64_t connection);
    void read_response(uint64_t connection);
    void on_connection_lost(uint64_t connection, const error_code& error);

    void fail_bind(const char* what, const error_code& error);
    void close_probe();
    void close_socket();

    std::chrono::milliseconds backoff_delay() const;
};

/** Returns the name of @p s for log output. */
const char* to_string(tcp_mapper::state s) noexcept;

} // nyat

#include "impl/tcp_mapper.ipp"

#endif // NYAT_TCP_MAPPER_HEADER
