#ifndef NYAT_REMOTE_ADDRESS_HEADER
#define NYAT_REMOTE_ADDRESS_HEADER

#include "error.hpp"

#include <cstdint>
#include <string>

#include <asio/ip/address.hpp>

namespace nyat {

/** Which address family to pick when a host name resolves to several. */
enum class ip_preference
{
    // The first address returned by the resolver.
    any,
    v4,
    v6,
};

/** The preference matching the family of @p address. */
inline ip_preference family_of(const asio::ip::address& address) noexcept
{
    return address.is_v6() ? ip_preference::v6 : ip_preference::v4;
}

// Default ports used when a remote string carries none.
constexpr uint16_t default_stun_port = 3478;
constexpr uint16_t default_remote_port = 80;

/**
 * @brief A STUN server or keepalive peer.
 *
 * Either a literal address and port, which never touches DNS, or a host
 * name, port and family preference, which is resolved every time the mapper
 * needs the endpoint. A default constructed object is empty, meaning "not
 * configured".
 */
class remote_address
{
    std::string host_;
    asio::ip::address address_;
    uint16_t port_ = 0;
    ip_preference preference_ = ip_preference::any;
    bool resolved_ = false;

public:
    remote_address() = default;

    remote_address(const asio::ip::address& address, uint16_t port)
        : address_(address)
        , port_(port)
        , resolved_(true)
    {}

    remote_address(std::string host, uint16_t port,
            ip_preference preference = ip_preference::any)
        : host_(std::move(host))
        , port_(port)
        , preference_(preference)
    {}

    /**
     * @brief Parses `HOST`, `HOST:PORT`, `IP`, `IP:PORT` or `[IPV6]:PORT`.
     *
     * Literal addresses yield a resolved remote; anything else is treated as
     * a host name to be resolved with @p preference.
     *
     * @param default_port Used when @p text has no port.
     * @param error Set to `asio::error::invalid_argument` if the port is not
     * a number in [1, 65535] or the host is empty.
     */
    static remote_address parse(const std::string& text, uint16_t default_port,
            ip_preference preference, error_code& error);

    /**
     * Returns a copy that resolves to the family of @p local if this remote
     * is a host name with @ref ip_preference::any. A socket can only reach
     * endpoints of its own family.
     */
    remote_address for_local(const asio::ip::address& local) const
    {
        remote_address copy = *this;
        if(!resolved_ && preference_ == ip_preference::any) {
            copy.preference_ = family_of(local);
        }
        return copy;
    }

    bool empty() const noexcept { return !resolved_ && host_.empty(); }
    bool is_resolved() const noexcept { return resolved_; }

    /** The host name, or empty for a literal address. */
    const std::string& host() const noexcept { return host_; }
    /** The literal address, or unspecified for a host name. */
    const asio::ip::address& address() const noexcept { return address_; }
    uint16_t port() const noexcept { return port_; }
    ip_preference preference() const noexcept { return preference_; }

    /**
     * Returns the value of an HTTP `Host` header addressing this remote: the
     * host name, or the literal address with IPv6 in brackets.
     */
    std::string host_header() const;

    /** Returns `host:port` for log output. */
    std::string to_string() const;
};

/**
 * @brief Parses a local bind address: `PORT` or `ADDR:PORT`.
 *
 * A bare port binds the unspecified address of the family chosen by
 * @p ipv6.
 */
asio::ip::address parse_bind_address(const std::string& text, bool ipv6,
        uint16_t& port, error_code& error);

/**
 * @brief Picks the endpoint to use from a list of resolved candidates.
 *
 * With @ref ip_preference::any the first candidate is used; otherwise the
 * first candidate of the preferred family, regardless of its position.
 *
 * @param candidates A range of endpoints, or of resolver entries.
 * @param error Set to @ref error::resolve::no_address_found if no candidate
 * qualifies.
 */
template<typename Endpoint, typename Range>
Endpoint select_endpoint(const Range& candidates, ip_preference preference,
        error_code& error);

/**
 * @brief Resolves @p remote into an endpoint of the resolver's protocol.
 *
 * @param resolver An `asio::ip::udp::resolver` or `asio::ip::tcp::resolver`.
 * @param error Set to @ref error::resolve::resolution_failed if the DNS
 * lookup failed, or @ref error::resolve::no_address_found if no answer
 * matches the remote's preference.
 */
template<typename Resolver>
typename Resolver::endpoint_type resolve(Resolver& resolver,
        const remote_address& remote, error_code& error);

/**
 * @brief Asynchronously resolves @p remote into an endpoint of the resolver's
 * protocol.
 *
 * @param handler The handler to be called when resolution completes.
 * The function signature of the handler must be:
 * @code void handler(nyat::error_code, Resolver::endpoint_type); @endcode
 * Literal addresses complete without a DNS lookup, but the handler is never
 * invoked from within this function.
 */
template<typename Resolver, typename Handler>
void async_resolve(Resolver& resolver, const remote_address& remote, Handler handler);

} // nyat

#include "impl/remote_address.ipp"

#endif // NYAT_REMOTE_ADDRESS_HEADER
