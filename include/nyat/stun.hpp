#ifndef NYAT_STUN_HEADER
#define NYAT_STUN_HEADER

#include "error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <asio/buffer.hpp>
#include <asio/ip/udp.hpp>

namespace nyat {
namespace stun {

// RFC 5389 framing constants.
constexpr uint32_t magic_cookie = 0x2112A442;
constexpr std::size_t header_size = 20;
constexpr std::size_t max_body_size = 2048;
constexpr std::size_t max_message_size = header_size + max_body_size;

namespace message_type {
constexpr uint16_t binding_request = 0x0001;
constexpr uint16_t binding_success_response = 0x0101;
constexpr uint16_t binding_error_response = 0x0111;
} // message_type

namespace attribute_type {
constexpr uint16_t mapped_address = 0x0001;
constexpr uint16_t error_code = 0x0009;
constexpr uint16_t xor_mapped_address = 0x0020;
} // attribute_type

namespace address_family {
constexpr uint8_t ipv4 = 0x01;
constexpr uint8_t ipv6 = 0x02;
} // address_family

using transaction_id = std::array<uint8_t, 12>;

/** An encoded binding request and the transaction ID it was sent with. */
struct binding_request
{
    std::array<uint8_t, header_size> message;
    transaction_id id;

    asio::const_buffer buffer() const
    {
        return asio::buffer(message);
    }
};

/** Returns a transaction ID drawn from a per-thread random generator. */
transaction_id make_transaction_id();

/**
 * Encodes an attribute-less binding request with a fresh transaction ID.
 */
binding_request make_binding_request();

/**
 * @brief Decodes the reply to a binding request.
 *
 * XOR-MAPPED-ADDRESS is preferred over the legacy MAPPED-ADDRESS when both
 * are present. All other attributes are skipped.
 *
 * @param data The received datagram.
 * @param size The number of bytes in @p data.
 * @param id The transaction ID of the request this is expected to answer.
 * @param error Set to an @ref error::stun value if the datagram is not a
 * valid response to @p id, or to an error in the stun_response category
 * carrying the STUN error code if the server sent a binding error response.
 *
 * @return The mapped address, or a default constructed endpoint if @p error
 * is set.
 */
asio::ip::udp::endpoint decode_binding_response(const uint8_t* data,
        std::size_t size, const transaction_id& id, error_code& error);

/**
 * Tells whether @p data holds a binding request, and if so extracts its
 * transaction ID into @p id.
 */
bool parse_binding_request(const uint8_t* data, std::size_t size, transaction_id& id);

/**
 * Encodes a binding success response announcing @p mapped. If @p use_xor is
 * false the legacy MAPPED-ADDRESS attribute is used instead of
 * XOR-MAPPED-ADDRESS.
 */
std::vector<uint8_t> encode_binding_response(const asio::ip::udp::endpoint& mapped,
        const transaction_id& id, bool use_xor = true);

/** Encodes a binding error response with an ERROR-CODE attribute. */
std::vector<uint8_t> encode_error_response(int code, const std::string& reason,
        const transaction_id& id);

} // stun
} // nyat

#include "impl/stun.ipp"

#endif // NYAT_STUN_HEADER
