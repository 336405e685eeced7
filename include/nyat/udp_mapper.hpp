#ifndef NYAT_UDP_MAPPER_HEADER
#define NYAT_UDP_MAPPER_HEADER

#include "mapper.hpp"
#include "mapper_config.hpp"
#include "local_address.hpp"
#include "remote_address.hpp"
#include "detail/stun_client.hpp"

#include <cstdint>
#include <functional>
#include <optional>

#include <asio/ip/udp.hpp>
#include <asio/steady_timer.hpp>

namespace nyat {

/**
 * @brief Keeps a UDP mapping alive through a single bound socket.
 *
 * The socket is bound once per run. Every `interval` the mapper ticks: every
 * `check_per_tick`-th tick (and every tick while no mapping is known) queries
 * the STUN server, the other ticks send a small keepalive datagram to the
 * keepalive remote, or to the STUN server if there is none.
 *
 * Discovery failures never end the run. If the run is cancelled after three
 * or more consecutive discoveries failed, it completes with the error of the
 * last one instead of `asio::error::operation_aborted`.
 */
class udp_mapper : public mapper
{
public:
    enum class state
    {
        unbound,
        bound,
        discovering,
        mapped,
        refreshing,
        failed,
    };

    using state_listener = std::function<void(state)>;

private:
    local_address local_;
    remote_address stun_server_;
    remote_address remote_;
    udp_mapper_config config_;

    asio::ip::udp::socket socket_;
    asio::ip::udp::resolver resolver_;
    asio::steady_timer timer_;
    detail::stun_client client_;

    asio::ip::udp::endpoint local_endpoint_;
    asio::ip::udp::endpoint server_endpoint_;
    // Resolved lazily on the first keepalive after each discovery.
    std::optional<asio::ip::udp::endpoint> remote_endpoint_;

    state state_ = state::unbound;
    state_listener state_listener_;

    uint64_t num_ticks_ = 0;
    uint32_t num_consecutive_failures_ = 0;
    error_code last_error_;

public:
    /**
     * @param stun_server Must not be empty.
     * @param remote The keepalive peer. May be empty.
     */
    udp_mapper(asio::io_context& io_context, local_address local,
            remote_address stun_server, remote_address remote,
            udp_mapper_config config = udp_mapper_config());

    void cancel() override;

    state current_state() const noexcept { return state_; }

    /** Invoked on every state transition, for diagnostics. */
    void set_state_listener(state_listener listener)
    {
        state_listener_ = std::move(listener);
    }

    /** The number of ticks in the current or last run. */
    uint64_t num_ticks() const noexcept { return num_ticks_; }

    /** The bound local endpoint of the current or last run. */
    const asio::ip::udp::endpoint& local_endpoint() const noexcept
    {
        return local_endpoint_;
    }

    const udp_mapper_config& config() const noexcept { return config_; }

protected:
    void start() override;

private:
    void set_state(state s);

    void discover();
    void on_discovered(const asio::ip::udp::endpoint& mapped);
    void on_discovery_failed(const error_code& error);

    void schedule_tick();
    void on_tick();

    void send_keepalive();
    void send_keepalive_to(const asio::ip::udp::endpoint& endpoint);
};

/** Returns the name of @p s for log output. */
const char* to_string(udp_mapper::state s) noexcept;

} // nyat

#include "impl/udp_mapper.ipp"

#endif // NYAT_UDP_MAPPER_HEADER
