#ifndef NYAT_REUSE_PORT_HEADER
#define NYAT_REUSE_PORT_HEADER

#include "error.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace nyat {

/**
 * @brief Forces `SO_REUSEPORT` on the sockets other processes have bound to
 * @p port, so that this process can bind the port as well.
 *
 * The sockets are looked up in `/proc/net/{tcp,tcp6,udp,udp6}` (TCP sockets
 * only when listening), their owners are found through `/proc/<pid>/fd`,
 * and each socket is duplicated into this process with `pidfd_getfd(2)` to
 * set the option. The option lives on the shared socket, so the change to
 * the other process's socket is permanent.
 *
 * Requires Linux 5.6 or later and `CAP_SYS_PTRACE` over the owning process
 * (in practice, root). The lookup races with the owners: a socket may be
 * closed or rebound between the scan and the duplication. Callers should
 * treat failure as something to log and carry on from.
 *
 * @param error Set to an @ref error::reuse value on failure:
 * @ref error::reuse::permission_denied also when the owner of a socket
 * could not be looked up because `/proc/<pid>/fd` is unreadable. On
 * platforms other than Linux always set to @ref error::reuse::unsupported.
 *
 * @return The number of sockets that now have `SO_REUSEPORT` set.
 */
std::size_t force_reuse_port(uint16_t port, error_code& error);

namespace detail {

/** A descriptor number within a process. */
struct socket_owner
{
    int pid = 0;
    int fd = -1;
};

/**
 * Parses a `/proc/net/{tcp,udp}{,6}` table and returns the inodes of the
 * sockets whose local port is @p port. If @p listening_only, only sockets in
 * the TCP LISTEN state qualify.
 */
std::vector<uint64_t> find_socket_inodes(std::istream& table, uint16_t port,
        bool listening_only);

/**
 * Scans `<proc_root>/<pid>/fd` of every process but this one for a
 * descriptor referring to `socket:[<inode>]`.
 *
 * @param error Set to @ref error::reuse::permission_denied if no owner was
 * found and some process's descriptors could not be listed for lack of
 * permission, otherwise cleared.
 */
std::optional<socket_owner> find_socket_owner(uint64_t inode, error_code& error,
        const std::string& proc_root = "/proc");

} // detail
} // nyat

#include "impl/reuse_port.ipp"

#endif // NYAT_REUSE_PORT_HEADER
