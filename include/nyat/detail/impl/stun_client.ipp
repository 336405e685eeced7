#ifndef NYAT_STUN_CLIENT_IMPL
#define NYAT_STUN_CLIENT_IMPL

#include "../stun_client.hpp"

#include <utility>

#include <asio/buffer.hpp>
#include <plog/Log.h>

namespace nyat {
namespace detail {

inline stun_client::stun_client(asio::ip::udp::socket& socket,
        std::chrono::milliseconds timeout, uint32_t max_attempts)
    : socket_(socket)
    , timer_(socket.get_executor())
    , timeout_(timeout)
    , max_attempts_(max_attempts)
{}

inline void stun_client::async_query(const asio::ip::udp::endpoint& server,
        handler_type handler)
{
    server_ = server;
    num_attempts_ = 0;
    handler_ = std::move(handler);
    send_request();
}

inline void stun_client::cancel()
{
    if(!handler_) {
        return;
    }
    ++sequence_;
    handler_ = nullptr;
    timer_.cancel();
    error_code ignored;
    socket_.cancel(ignored);
}

inline void stun_client::send_request()
{
    ++num_attempts_;
    const auto sequence = ++sequence_;
    request_ = stun::make_binding_request();
    PLOGD << "sending STUN binding request to " << server_
          << " (attempt " << num_attempts_ << '/' << max_attempts_ << ')';

    // Send the request...
    socket_.async_send_to(request_.buffer(), server_,
            [this, sequence](const error_code& error, std::size_t) {
                if(sequence != sequence_) { return; }
                // A failed send won't be answered, so don't wait for the timeout.
                if(error) { finish(error, {}); }
            });

    // ...and simultaneously start the timer and initiate a receive operation.
    timer_.expires_after(timeout_);
    timer_.async_wait([this, sequence](const error_code& error) {
        if(sequence != sequence_ || error) { return; }
        on_attempt_failed(asio::error::timed_out);
    });

    receive_response(sequence);
}

inline void stun_client::receive_response(const uint64_t sequence)
{
    socket_.async_receive_from(asio::buffer(receive_buffer_), sender_,
            [this, sequence](error_code error, const std::size_t num_received) {
                if(sequence != sequence_) { return; }
                if(error) {
                    finish(error, {});
                    return;
                }

                const auto mapped = stun::decode_binding_response(
                        receive_buffer_.data(), num_received, request_.id, error);
                if(!error) {
                    finish(error, mapped);
                } else if(error.category() == error::get_stun_response_error_category()
                        || error == error::stun::no_mapped_address) {
                    // The server understood but rejected the request.
                    PLOGW << "STUN server " << server_ << " rejected request: "
                          << error.message();
                    on_attempt_failed(error);
                } else {
                    // Stray or stale datagram, keep waiting for the actual
                    // response.
                    PLOGD << "discarding datagram from " << sender_ << ": "
                          << error.message();
                    receive_response(sequence);
                }
            });
}

inline void stun_client::on_attempt_failed(const error_code& error)
{
    if(num_attempts_ >= max_attempts_) {
        finish(error, {});
        return;
    }
    // Abort the receive of this attempt before the next one starts its own.
    ++sequence_;
    error_code ignored;
    socket_.cancel(ignored);
    send_request();
}

inline void stun_client::finish(const error_code& error,
        const asio::ip::udp::endpoint& mapped)
{
    ++sequence_;
    timer_.cancel();
    error_code ignored;
    socket_.cancel(ignored);

    auto handler = std::move(handler_);
    handler_ = nullptr;
    handler(error, mapped);
}

} // detail
} // nyat

#endif // NYAT_STUN_CLIENT_IMPL
