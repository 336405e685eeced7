#ifndef NYAT_STUN_IMPL
#define NYAT_STUN_IMPL

#include "../stun.hpp"

#include <algorithm>
#include <random>

#include <endian/endian.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/address_v6.hpp>

namespace nyat {
namespace stun {
namespace detail {

inline void write_header(uint8_t* buffer, uint16_t type, uint16_t body_size,
        const transaction_id& id)
{
    endian::write<endian::order::network, uint16_t>(type, &buffer[0]);
    endian::write<endian::order::network, uint16_t>(body_size, &buffer[2]);
    endian::write<endian::order::network, uint32_t>(magic_cookie, &buffer[4]);
    std::copy(id.begin(), id.end(), &buffer[8]);
}

// The key an IPv6 XOR-MAPPED-ADDRESS is XORed with: the magic cookie followed
// by the transaction ID. An IPv4 address only uses the first four bytes.
inline std::array<uint8_t, 16> xor_key(const transaction_id& id)
{
    std::array<uint8_t, 16> key;
    endian::write<endian::order::network, uint32_t>(magic_cookie, key.data());
    std::copy(id.begin(), id.end(), key.begin() + 4);
    return key;
}

// Parses the value of a MAPPED-ADDRESS, or of an XOR-MAPPED-ADDRESS if @p id
// is not null.
inline asio::ip::udp::endpoint parse_address(const uint8_t* value,
        std::size_t size, const transaction_id* id, error_code& error)
{
    if(size < 8) {
        error = make_error_code(error::stun::malformed_message);
        return {};
    }

    const auto family = value[1];
    auto port = endian::read<endian::order::network, uint16_t>(&value[2]);
    if(id) {
        port ^= static_cast<uint16_t>(magic_cookie >> 16);
    }

    if(family == address_family::ipv4) {
        auto address = endian::read<endian::order::network, uint32_t>(&value[4]);
        if(id) {
            address ^= magic_cookie;
        }
        return asio::ip::udp::endpoint(asio::ip::address_v4(address), port);
    } else if(family == address_family::ipv6 && size >= 20) {
        asio::ip::address_v6::bytes_type bytes;
        std::copy(&value[4], &value[20], bytes.begin());
        if(id) {
            const auto key = xor_key(*id);
            for(std::size_t i = 0; i < bytes.size(); ++i) {
                bytes[i] ^= key[i];
            }
        }
        return asio::ip::udp::endpoint(asio::ip::address_v6(bytes), port);
    }

    error = make_error_code(error::stun::malformed_message);
    return {};
}

// Returns the STUN error code (class * 100 + number) of an error response
// body.
inline int parse_error_code(const uint8_t* body, std::size_t body_size,
        error_code& error)
{
    std::size_t offset = 0;
    while(offset + 4 <= body_size) {
        const auto type = endian::read<endian::order::network, uint16_t>(&body[offset]);
        const auto size = endian::read<endian::order::network, uint16_t>(&body[offset + 2]);
        if(offset + 4 + size > body_size) {
            break;
        }
        if(type == attribute_type::error_code) {
            if(size < 4) {
                break;
            }
            const uint8_t* value = &body[offset + 4];
            return (value[2] & 0x07) * 100 + value[3];
        }
        offset += 4 + ((size + 3) & ~std::size_t(3));
    }
    error = make_error_code(error::stun::malformed_message);
    return 0;
}

} // detail

inline transaction_id make_transaction_id()
{
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<int> byte(0, 255);
    transaction_id id;
    for(auto& b : id) {
        b = static_cast<uint8_t>(byte(generator));
    }
    return id;
}

inline binding_request make_binding_request()
{
    binding_request request;
    request.id = make_transaction_id();
    detail::write_header(request.message.data(), message_type::binding_request,
            0, request.id);
    return request;
}

inline asio::ip::udp::endpoint decode_binding_response(const uint8_t* data,
        std::size_t size, const transaction_id& id, error_code& error)
{
    error = error_code();
    if(size < header_size) {
        error = make_error_code(error::stun::malformed_message);
        return {};
    }
    // The two most significant bits of every STUN message are zero.
    if((data[0] & 0xc0) != 0
            || endian::read<endian::order::network, uint32_t>(&data[4]) != magic_cookie) {
        error = make_error_code(error::stun::malformed_message);
        return {};
    }

    const std::size_t body_size = endian::read<endian::order::network, uint16_t>(&data[2]);
    if(body_size > max_body_size) {
        error = make_error_code(error::stun::response_too_large);
        return {};
    }
    if(header_size + body_size > size) {
        error = make_error_code(error::stun::malformed_message);
        return {};
    }
    if(!std::equal(id.begin(), id.end(), &data[8])) {
        error = make_error_code(error::stun::transaction_mismatch);
        return {};
    }

    const uint8_t* body = &data[header_size];
    const auto type = endian::read<endian::order::network, uint16_t>(&data[0]);
    if(type == message_type::binding_error_response) {
        const int code = detail::parse_error_code(body, body_size, error);
        if(!error) {
            error = make_stun_response_error(code);
        }
        return {};
    }
    if(type != message_type::binding_success_response) {
        error = make_error_code(error::stun::unexpected_message);
        return {};
    }

    asio::ip::udp::endpoint mapped;
    error_code mapped_error = make_error_code(error::stun::no_mapped_address);
    std::size_t offset = 0;
    while(offset + 4 <= body_size) {
        const auto attr_type = endian::read<endian::order::network, uint16_t>(&body[offset]);
        const auto attr_size = endian::read<endian::order::network, uint16_t>(&body[offset + 2]);
        if(offset + 4 + attr_size > body_size) {
            error = make_error_code(error::stun::malformed_message);
            return {};
        }

        const uint8_t* value = &body[offset + 4];
        if(attr_type == attribute_type::xor_mapped_address) {
            return detail::parse_address(value, attr_size, &id, error);
        } else if(attr_type == attribute_type::mapped_address && mapped_error) {
            mapped_error = error_code();
            mapped = detail::parse_address(value, attr_size, nullptr, mapped_error);
        }

        // Attributes are padded to a multiple of four bytes.
        offset += 4 + ((attr_size + 3) & ~std::size_t(3));
    }

    error = mapped_error;
    return mapped;
}

inline bool parse_binding_request(const uint8_t* data, std::size_t size, transaction_id& id)
{
    if(size < header_size) {
        return false;
    }
    if(endian::read<endian::order::network, uint16_t>(&data[0]) != message_type::binding_request
            || endian::read<endian::order::network, uint32_t>(&data[4]) != magic_cookie) {
        return false;
    }
    std::copy(&data[8], &data[header_size], id.begin());
    return true;
}

inline std::vector<uint8_t> encode_binding_response(
        const asio::ip::udp::endpoint& mapped, const transaction_id& id, bool use_xor)
{
    const auto address = mapped.address();
    const std::size_t value_size = address.is_v4() ? 8 : 20;
    std::vector<uint8_t> message(header_size + 4 + value_size, 0);

    detail::write_header(message.data(), message_type::binding_success_response,
            static_cast<uint16_t>(4 + value_size), id);

    uint8_t* attr = &message[header_size];
    endian::write<endian::order::network, uint16_t>(use_xor
            ? attribute_type::xor_mapped_address : attribute_type::mapped_address, &attr[0]);
    endian::write<endian::order::network, uint16_t>(
            static_cast<uint16_t>(value_size), &attr[2]);

    uint8_t* value = &attr[4];
    uint16_t port = mapped.port();
    if(use_xor) {
        port ^= static_cast<uint16_t>(magic_cookie >> 16);
    }
    endian::write<endian::order::network, uint16_t>(port, &value[2]);

    if(address.is_v4()) {
        value[1] = address_family::ipv4;
        auto bits = address.to_v4().to_uint();
        if(use_xor) {
            bits ^= magic_cookie;
        }
        endian::write<endian::order::network, uint32_t>(bits, &value[4]);
    } else {
        value[1] = address_family::ipv6;
        auto bytes = address.to_v6().to_bytes();
        if(use_xor) {
            const auto key = detail::xor_key(id);
            for(std::size_t i = 0; i < bytes.size(); ++i) {
                bytes[i] ^= key[i];
            }
        }
        std::copy(bytes.begin(), bytes.end(), &value[4]);
    }
    return message;
}

inline std::vector<uint8_t> encode_error_response(int code, const std::string& reason,
        const transaction_id& id)
{
    const std::size_t value_size = 4 + reason.size();
    const std::size_t padded_size = (value_size + 3) & ~std::size_t(3);
    std::vector<uint8_t> message(header_size + 4 + padded_size, 0);

    detail::write_header(message.data(), message_type::binding_error_response,
            static_cast<uint16_t>(4 + padded_size), id);

    uint8_t* attr = &message[header_size];
    endian::write<endian::order::network, uint16_t>(attribute_type::error_code, &attr[0]);
    endian::write<endian::order::network, uint16_t>(
            static_cast<uint16_t>(value_size), &attr[2]);
    attr[6] = static_cast<uint8_t>((code / 100) & 0x07);
    attr[7] = static_cast<uint8_t>(code % 100);
    std::copy(reason.begin(), reason.end(), &attr[8]);
    return message;
}

} // stun
} // nyat

#endif // NYAT_STUN_IMPL
