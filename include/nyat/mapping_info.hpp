#ifndef NYAT_MAPPING_INFO_HEADER
#define NYAT_MAPPING_INFO_HEADER

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include <asio/ip/address.hpp>
#include <asio/ip/udp.hpp>

namespace nyat {

/**
 * This object represents a mapping between this host's local socket and the
 * socket address observed on the NAT's WAN facing side.
 */
struct mapping_info
{
    // The address and port as seen by the STUN server.
    asio::ip::address public_address;
    uint16_t public_port = 0;
    // The address and port this host's socket is bound to. If the mapper was
    // configured with port 0, this is the port the OS picked.
    asio::ip::address local_address;
    uint16_t local_port = 0;

    asio::ip::udp::endpoint public_endpoint() const
    {
        return asio::ip::udp::endpoint(public_address, public_port);
    }

    asio::ip::udp::endpoint local_endpoint() const
    {
        return asio::ip::udp::endpoint(local_address, local_port);
    }
};

/** Two mappings are the same mapping if their public sides match. */
inline bool same_public_endpoint(const mapping_info& a, const mapping_info& b)
{
    return (a.public_address == b.public_address) && (a.public_port == b.public_port);
}

inline bool operator==(const mapping_info& a, const mapping_info& b)
{
    return same_public_endpoint(a, b)
        && (a.local_address == b.local_address)
        && (a.local_port == b.local_port);
}

inline bool operator!=(const mapping_info& a, const mapping_info& b)
{
    return !(a == b);
}

/**
 * Writes @p info as a single line record without the trailing newline:
 * @code PUBLIC_IP PUBLIC_PORT LOCAL_IP LOCAL_PORT @endcode
 */
inline std::ostream& operator<<(std::ostream& out, const mapping_info& info)
{
    return out << info.public_address.to_string() << ' ' << info.public_port << ' '
               << info.local_address.to_string() << ' ' << info.local_port;
}

/**
 * @brief Returns the environment variables an exec hook receives for
 * @p info.
 *
 * The names are `NYAT_PUB_ADDR`, `NYAT_PUB_PORT`, `NYAT_LOCAL_ADDR` and
 * `NYAT_LOCAL_PORT`, in this order.
 */
inline std::array<std::pair<std::string, std::string>, 4>
exec_environment(const mapping_info& info)
{
    return {{
        {"NYAT_PUB_ADDR", info.public_address.to_string()},
        {"NYAT_PUB_PORT", std::to_string(info.public_port)},
        {"NYAT_LOCAL_ADDR", info.local_address.to_string()},
        {"NYAT_LOCAL_PORT", std::to_string(info.local_port)},
    }};
}

} // nyat

#endif // NYAT_MAPPING_INFO_HEADER
