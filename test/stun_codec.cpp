#undef NDEBUG

#include "../include/nyat/stun.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

#include <endian/endian.hpp>

using namespace nyat;

namespace {

const stun::transaction_id test_id = {{
    0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c
}};

asio::ip::udp::endpoint decode(const std::vector<uint8_t>& message, error_code& error)
{
    return stun::decode_binding_response(message.data(), message.size(), test_id, error);
}

// A success response header followed by the raw attributes in @p body.
std::vector<uint8_t> make_success_response(const std::vector<uint8_t>& body)
{
    std::vector<uint8_t> message(stun::header_size, 0);
    endian::write<endian::order::network, uint16_t>(
            stun::message_type::binding_success_response, &message[0]);
    endian::write<endian::order::network, uint16_t>(
            static_cast<uint16_t>(body.size()), &message[2]);
    endian::write<endian::order::network, uint32_t>(stun::magic_cookie, &message[4]);
    std::copy(test_id.begin(), test_id.end(), &message[8]);
    message.insert(message.end(), body.begin(), body.end());
    return message;
}

void test_binding_request()
{
    const auto request = stun::make_binding_request();
    const auto& m = request.message;
    assert(m.size() == 20);
    assert(m[0] == 0x00 && m[1] == 0x01);
    assert(m[2] == 0x00 && m[3] == 0x00);
    assert(m[4] == 0x21 && m[5] == 0x12 && m[6] == 0xa4 && m[7] == 0x42);
    assert(std::equal(request.id.begin(), request.id.end(), &m[8]));
    assert(request.buffer().size() == 20);

    stun::transaction_id parsed;
    assert(stun::parse_binding_request(m.data(), m.size(), parsed));
    assert(parsed == request.id);

    // Transaction IDs are random per request.
    assert(stun::make_binding_request().id != request.id);
}

void test_xor_mapped_ipv4()
{
    const asio::ip::udp::endpoint mapped(asio::ip::make_address("203.0.113.5"), 51000);
    const auto response = stun::encode_binding_response(mapped, test_id);

    // Port 51000 (0xC738) XOR 0x2112 and 203.0.113.5 XOR the magic cookie.
    assert(response[20] == 0x00 && response[21] == 0x20);
    assert(response[25] == 0x01);
    assert(response[26] == 0xe6 && response[27] == 0x2a);
    assert(response[28] == (203 ^ 0x21) && response[29] == (0 ^ 0x12));
    assert(response[30] == (113 ^ 0xa4) && response[31] == (5 ^ 0x42));

    error_code error;
    const auto decoded = decode(response, error);
    assert(!error);
    assert(decoded == mapped);
}

void test_xor_mapped_ipv6()
{
    const asio::ip::udp::endpoint mapped(asio::ip::make_address("2001:db8::1"), 40000);
    const auto response = stun::encode_binding_response(mapped, test_id);
    assert(response.size() == 20 + 4 + 20);
    assert(response[25] == 0x02);

    error_code error;
    const auto decoded = decode(response, error);
    assert(!error);
    assert(decoded == mapped);
}

void test_legacy_mapped_address()
{
    const asio::ip::udp::endpoint mapped(asio::ip::make_address("198.51.100.7"), 3478);
    const auto response = stun::encode_binding_response(mapped, test_id, false);
    assert(response[20] == 0x00 && response[21] == 0x01);
    // Not XORed.
    assert(response[26] == 0x0d && response[27] == 0x96);

    error_code error;
    assert(decode(response, error) == mapped);
    assert(!error);
}

void test_xor_preferred_over_legacy()
{
    // MAPPED-ADDRESS 10.0.0.1:1000 followed by XOR-MAPPED-ADDRESS
    // 203.0.113.5:51000.
    const auto legacy = stun::encode_binding_response(
            asio::ip::udp::endpoint(asio::ip::make_address("10.0.0.1"), 1000), test_id, false);
    const auto xored = stun::encode_binding_response(
            asio::ip::udp::endpoint(asio::ip::make_address("203.0.113.5"), 51000), test_id);
    std::vector<uint8_t> body(legacy.begin() + 20, legacy.end());
    body.insert(body.end(), xored.begin() + 20, xored.end());

    error_code error;
    const auto decoded = decode(make_success_response(body), error);
    assert(!error);
    assert(decoded.address() == asio::ip::make_address("203.0.113.5"));
    assert(decoded.port() == 51000);
}

void test_unknown_attributes_skipped()
{
    // SOFTWARE (0x8022) with a 5 byte value padded to 8, then the address.
    std::vector<uint8_t> body = {0x80, 0x22, 0x00, 0x05, 'n', 'y', 'a', 't', '!', 0, 0, 0};
    const auto xored = stun::encode_binding_response(
            asio::ip::udp::endpoint(asio::ip::make_address("192.0.2.33"), 6000), test_id);
    body.insert(body.end(), xored.begin() + 20, xored.end());

    error_code error;
    const auto decoded = decode(make_success_response(body), error);
    assert(!error);
    assert(decoded.address() == asio::ip::make_address("192.0.2.33"));
    assert(decoded.port() == 6000);
}

void test_transaction_mismatch()
{
    const auto response = stun::encode_binding_response(
            asio::ip::udp::endpoint(asio::ip::make_address("203.0.113.5"), 51000), test_id);
    auto other_id = test_id;
    other_id[11] ^= 0xff;

    error_code error;
    stun::decode_binding_response(response.data(), response.size(), other_id, error);
    assert(error == error::stun::transaction_mismatch);
}

void test_error_response()
{
    const auto response = stun::encode_error_response(420, "Unknown Attribute", test_id);
    error_code error;
    decode(response, error);
    assert(error);
    assert(error.category() == error::get_stun_response_error_category());
    assert(error.value() == 420);
    assert(error.message() == "Unknown Attribute");

    // A code without a well known reason still carries its number.
    decode(stun::encode_error_response(499, "", test_id), error);
    assert(error.value() == 499);
}

void test_malformed()
{
    const auto valid = stun::encode_binding_response(
            asio::ip::udp::endpoint(asio::ip::make_address("203.0.113.5"), 51000), test_id);
    error_code error;

    // Shorter than a header.
    std::vector<uint8_t> short_message(valid.begin(), valid.begin() + 19);
    decode(short_message, error);
    assert(error == error::stun::malformed_message);

    // Bad magic cookie.
    auto bad_cookie = valid;
    bad_cookie[4] = 0;
    decode(bad_cookie, error);
    assert(error == error::stun::malformed_message);

    // Declared length exceeds the datagram.
    std::vector<uint8_t> truncated(valid.begin(), valid.end() - 2);
    decode(truncated, error);
    assert(error == error::stun::malformed_message);

    // Declared length above the maximum body size.
    auto too_large = valid;
    endian::write<endian::order::network, uint16_t>(4096, &too_large[2]);
    decode(too_large, error);
    assert(error == error::stun::response_too_large);

    // Unknown address family.
    auto bad_family = valid;
    bad_family[25] = 0x05;
    decode(bad_family, error);
    assert(error == error::stun::malformed_message);
}

void test_no_mapped_address()
{
    error_code error;
    decode(make_success_response({}), error);
    assert(error == error::stun::no_mapped_address);
}

void test_unexpected_message()
{
    // A binding request with the expected transaction ID.
    auto message = make_success_response({});
    endian::write<endian::order::network, uint16_t>(
            stun::message_type::binding_request, &message[0]);
    error_code error;
    decode(message, error);
    assert(error == error::stun::unexpected_message);

    stun::transaction_id id;
    assert(stun::parse_binding_request(message.data(), message.size(), id));
    assert(!stun::parse_binding_request(message.data(), 10, id));
    const uint8_t keepalive[] = {'\r', '\n', '\r', '\n'};
    assert(!stun::parse_binding_request(keepalive, sizeof(keepalive), id));
}

} // namespace

int main()
{
    test_binding_request();
    test_xor_mapped_ipv4();
    test_xor_mapped_ipv6();
    test_legacy_mapped_address();
    test_xor_preferred_over_legacy();
    test_unknown_attributes_skipped();
    test_transaction_mismatch();
    test_error_response();
    test_malformed();
    test_no_mapped_address();
    test_unexpected_message();
    std::cout << "OK\n";
}
