#ifndef NYAT_LOCAL_ADDRESS_IMPL
#define NYAT_LOCAL_ADDRESS_IMPL

#include "../local_address.hpp"
#include "../reuse_port.hpp"
#include "../detail/socket_option.hpp"

#include <asio/socket_base.hpp>
#include <plog/Log.h>

namespace nyat {

template<typename Socket>
void local_address::set_options(Socket& socket, error_code& error) const
{
    socket.set_option(asio::socket_base::reuse_address(true), error);
    if(error) {
        return;
    }
#if defined(SO_REUSEPORT)
    socket.set_option(detail::reuse_port(true), error);
    if(error) {
        return;
    }
#endif
#if defined(__linux__)
    if(fwmark_) {
        socket.set_option(detail::mark(static_cast<int>(*fwmark_)), error);
        if(error) {
            return;
        }
    }
    if(!interface_.empty()) {
        socket.set_option(detail::bind_to_device(interface_), error);
        if(error) {
            return;
        }
    }
#endif
}

template<typename Socket>
void local_address::open(Socket& socket, uint16_t port, error_code& error) const
{
    using endpoint_type = typename Socket::endpoint_type;
    const endpoint_type endpoint(address_, port);

    error_code ignored;
    socket.open(endpoint.protocol(), error);
    if(error) {
        return;
    }

    set_options(socket, error);
    if(error) {
        socket.close(ignored);
        return;
    }

    socket.bind(endpoint, error);
    if(error == asio::error::address_in_use && force_reuse_ && port != 0) {
        error_code reuse_error;
        const auto num_forced = force_reuse_port(port, reuse_error);
        if(reuse_error) {
            PLOGW << "forcing SO_REUSEPORT on port " << port << " failed: "
                  << reuse_error.message();
        } else {
            PLOGI << "forced SO_REUSEPORT on " << num_forced
                  << " socket(s) bound to port " << port;
            socket.bind(endpoint, error);
        }
    }
    if(error) {
        socket.close(ignored);
    }
}

} // nyat

#endif // NYAT_LOCAL_ADDRESS_IMPL
