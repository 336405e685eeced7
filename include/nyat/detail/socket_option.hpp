#ifndef NYAT_SOCKET_OPTION_HEADER
#define NYAT_SOCKET_OPTION_HEADER

#include <cstddef>
#include <cstring>
#include <string>

#include <asio/detail/socket_option.hpp>

#if defined(__linux__)
# include <net/if.h>
# include <sys/socket.h>
#endif

namespace nyat {
namespace detail {

#if defined(SO_REUSEPORT)
using reuse_port = asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;
#endif

#if defined(__linux__)
// Linux fwmark for policy routing. Requires CAP_NET_ADMIN.
using mark = asio::detail::socket_option::integer<SOL_SOCKET, SO_MARK>;

/** SO_BINDTODEVICE, settable through `socket.set_option`. */
class bind_to_device
{
    char name_[IFNAMSIZ];

public:
    explicit bind_to_device(const std::string& name)
    {
        std::memset(name_, 0, sizeof(name_));
        std::strncpy(name_, name.c_str(), sizeof(name_) - 1);
    }

    template<typename Protocol>
    int level(const Protocol&) const { return SOL_SOCKET; }

    template<typename Protocol>
    int name(const Protocol&) const { return SO_BINDTODEVICE; }

    template<typename Protocol>
    const void* data(const Protocol&) const { return name_; }

    template<typename Protocol>
    std::size_t size(const Protocol&) const { return std::strlen(name_) + 1; }
};
#endif

} // detail
} // nyat

#endif // NYAT_SOCKET_OPTION_HEADER
