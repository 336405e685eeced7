#ifndef NYAT_TEST_FAKE_STUN_SERVER_HEADER
#define NYAT_TEST_FAKE_STUN_SERVER_HEADER

#include "../include/nyat/stun.hpp"
#include "../include/nyat/remote_address.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <asio/buffer.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/udp.hpp>
#include <plog/Log.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Initializers/ConsoleInitializer.h>

// Logs everything the library reports at warning level or above to stderr.
inline void init_test_logging()
{
    plog::init<plog::TxtFormatter>(plog::warning, plog::streamStdErr);
}

/**
 * A STUN server on 127.0.0.1 which answers every binding request with
 * `mapped`, and counts every other datagram as a keepalive.
 *
 * The callbacks run after the reply has been sent.
 */
struct fake_stun_server
{
    asio::ip::udp::socket socket;
    asio::ip::udp::endpoint sender;
    std::array<uint8_t, 2048> buffer;

    asio::ip::udp::endpoint mapped;
    // If false, requests are counted but not answered.
    bool respond = true;
    // If non-zero, requests are answered with a binding error response.
    int error_code_to_send = 0;

    int num_requests = 0;
    int num_keepalives = 0;
    std::vector<std::string> keepalive_payloads;
    std::vector<nyat::stun::transaction_id> transaction_ids;

    std::function<void(int)> on_request;
    std::function<void(int)> on_keepalive;

    explicit fake_stun_server(asio::io_context& io_context)
        : socket(io_context, asio::ip::udp::endpoint(
                    asio::ip::make_address("127.0.0.1"), 0))
        , mapped(asio::ip::make_address("203.0.113.5"), 51000)
    {
        receive();
    }

    nyat::remote_address address() const
    {
        const auto local = socket.local_endpoint();
        return nyat::remote_address(local.address(), local.port());
    }

    void close()
    {
        nyat::error_code ignored;
        socket.close(ignored);
    }

private:
    void receive()
    {
        socket.async_receive_from(asio::buffer(buffer), sender,
                [this](const nyat::error_code& error, const std::size_t num_received) {
                    if(error) {
                        return;
                    }

                    nyat::stun::transaction_id id;
                    if(nyat::stun::parse_binding_request(buffer.data(), num_received, id)) {
                        ++num_requests;
                        transaction_ids.push_back(id);
                        if(respond) {
                            const auto reply = error_code_to_send != 0
                                ? nyat::stun::encode_error_response(
                                        error_code_to_send, "Rejected", id)
                                : nyat::stun::encode_binding_response(mapped, id);
                            nyat::error_code ignored;
                            socket.send_to(asio::buffer(reply), sender, 0, ignored);
                        }
                        if(on_request) {
                            on_request(num_requests);
                        }
                    } else {
                        ++num_keepalives;
                        keepalive_payloads.emplace_back(
                                reinterpret_cast<const char*>(buffer.data()), num_received);
                        if(on_keepalive) {
                            on_keepalive(num_keepalives);
                        }
                    }
                    receive();
                });
    }
};

#endif // NYAT_TEST_FAKE_STUN_SERVER_HEADER
