#ifndef NYAT_LOCAL_ADDRESS_HEADER
#define NYAT_LOCAL_ADDRESS_HEADER

#include "error.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <asio/ip/address.hpp>

namespace nyat {

/**
 * @brief The local side of a mapping: the address and port to bind, and the
 * options every socket bound to it gets.
 *
 * Sockets opened through this object always have `SO_REUSEADDR` and, where
 * available, `SO_REUSEPORT` set, so that a mapper's probe and keepalive
 * sockets may share the port with each other and with other cooperating
 * processes.
 */
class local_address
{
    asio::ip::address address_;
    uint16_t port_ = 0;
    std::string interface_;
    std::optional<uint32_t> fwmark_;
    bool force_reuse_ = false;

public:
    /** Binds the IPv4 unspecified address on a port the OS chooses. */
    local_address()
        : address_(asio::ip::address_v4::any())
    {}

    /** Port 0 lets the OS choose the port. */
    local_address(const asio::ip::address& address, uint16_t port)
        : address_(address)
        , port_(port)
    {}

    const asio::ip::address& address() const noexcept { return address_; }
    uint16_t port() const noexcept { return port_; }

    /** Binds sockets to the network interface @p name (Linux only). */
    local_address& bind_interface(std::string name)
    {
        interface_ = std::move(name);
        return *this;
    }

    const std::string& interface_name() const noexcept { return interface_; }

    /** Sets `SO_MARK` on sockets for policy routing (Linux only). */
    local_address& fwmark(uint32_t mark)
    {
        fwmark_ = mark;
        return *this;
    }

    const std::optional<uint32_t>& fwmark() const noexcept { return fwmark_; }

    /**
     * If enabled and a bind fails because another process holds the port,
     * @ref force_reuse_port is used on that process's socket before binding
     * again (Linux only, needs root).
     */
    local_address& force_reuse(bool enabled)
    {
        force_reuse_ = enabled;
        return *this;
    }

    bool force_reuse() const noexcept { return force_reuse_; }

    /**
     * @brief Opens @p socket, applies the socket options and binds it to this
     * address and @p port.
     *
     * @p port is passed separately so that a mapper can rebind the concrete
     * port it obtained the first time it bound port 0.
     *
     * @param error Set to the error of the failing system call, if any. On
     * error @p socket is closed.
     */
    template<typename Socket>
    void open(Socket& socket, uint16_t port, error_code& error) const;

    template<typename Socket>
    void open(Socket& socket, error_code& error) const
    {
        open(socket, port_, error);
    }

private:
    template<typename Socket>
    void set_options(Socket& socket, error_code& error) const;
};

} // nyat

#include "impl/local_address.ipp"

#endif // NYAT_LOCAL_ADDRESS_HEADER
