#ifndef NYAT_STUN_CLIENT_HEADER
#define NYAT_STUN_CLIENT_HEADER

#include "../stun.hpp"
#include "../error.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>

#include <asio/ip/udp.hpp>
#include <asio/steady_timer.hpp>

namespace nyat {
namespace detail {

/**
 * @brief Runs STUN binding queries over a UDP socket owned by a mapper.
 *
 * A query sends a binding request and waits up to the probe timeout for the
 * matching response. On timeout, or if the server answers with a binding
 * error response, the request is sent again with a fresh transaction ID,
 * up to the configured number of attempts. Datagrams that are not a valid
 * response to the current transaction are discarded.
 *
 * Only a single query may be outstanding at any given time.
 */
class stun_client
{
public:
    using handler_type = std::function<void(error_code, asio::ip::udp::endpoint)>;

private:
    asio::ip::udp::socket& socket_;
    asio::steady_timer timer_;

    std::chrono::milliseconds timeout_;
    uint32_t max_attempts_;
    uint32_t num_attempts_ = 0;

    // Identifies the current attempt. Handlers of earlier attempts, which may
    // still be queued after being cancelled, compare unequal and return.
    uint64_t sequence_ = 0;

    asio::ip::udp::endpoint server_;
    asio::ip::udp::endpoint sender_;
    stun::binding_request request_;
    std::array<uint8_t, stun::max_message_size> receive_buffer_;

    handler_type handler_;

public:
    stun_client(asio::ip::udp::socket& socket, std::chrono::milliseconds timeout,
            uint32_t max_attempts);

    /**
     * @brief Asks @p server for the public endpoint of the socket.
     *
     * The socket must be open.
     *
     * @param handler Invoked once with the mapped endpoint, or with the error
     * of the last attempt: `asio::error::timed_out` if no response arrived, or
     * an error in the stun_response category if the server kept rejecting
     * the request.
     */
    void async_query(const asio::ip::udp::endpoint& server, handler_type handler);

    /**
     * Abandons the outstanding query, if any. Its handler is not invoked.
     */
    void cancel();

    bool is_busy() const noexcept { return handler_ != nullptr; }

private:
    void send_request();
    void receive_response(uint64_t sequence);
    void on_attempt_failed(const error_code& error);
    void finish(const error_code& error, const asio::ip::udp::endpoint& mapped);
};

} // detail
} // nyat

#include "impl/stun_client.ipp"

#endif // NYAT_STUN_CLIENT_HEADER
