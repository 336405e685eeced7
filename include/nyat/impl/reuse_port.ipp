#ifndef NYAT_REUSE_PORT_IMPL
#define NYAT_REUSE_PORT_IMPL

#include "../reuse_port.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <plog/Log.h>

#if defined(__linux__)
# include <sys/socket.h>
# include <sys/syscall.h>
# include <unistd.h>
// Older libc headers lack the pidfd syscall numbers, which are the same on
// every architecture.
# ifndef SYS_pidfd_open
#  define SYS_pidfd_open 434
# endif
# ifndef SYS_pidfd_getfd
#  define SYS_pidfd_getfd 438
# endif
#endif

namespace nyat {
namespace detail {

// TCP_LISTEN in the `st` column of /proc/net/tcp.
constexpr unsigned long tcp_listen_state = 0x0A;

inline std::vector<uint64_t> find_socket_inodes(std::istream& table, uint16_t port,
        bool listening_only)
{
/* Example table:
  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode
   0: 00000000:1F90 00000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 29375 1 0000000000000000 100 0 0 10 0
*/
    std::vector<uint64_t> inodes;
    std::string line;
    // Ignore the header line.
    std::getline(table, line);
    while(std::getline(table, line))
    {
        std::istringstream ss(line);
        std::string slot, local, remote, state, queues, timer, retransmits, uid, timeout;
        uint64_t inode = 0;
        if(!(ss >> slot >> local >> remote >> state >> queues >> timer
                >> retransmits >> uid >> timeout >> inode)) {
            continue;
        }

        const auto colon = local.rfind(':');
        if(colon == std::string::npos) {
            continue;
        }
        char* end = nullptr;
        const auto local_port = std::strtoul(local.c_str() + colon + 1, &end, 16);
        if(*end != '\0' || local_port != port) {
            continue;
        }
        if(listening_only && std::strtoul(state.c_str(), nullptr, 16) != tcp_listen_state) {
            continue;
        }
        if(inode > 0) {
            inodes.push_back(inode);
        }
    }
    return inodes;
}

inline std::optional<socket_owner> find_socket_owner(uint64_t inode,
        error_code& error, const std::string& proc_root)
{
    error = error_code();
    namespace fs = std::filesystem;
    const auto target = "socket:[" + std::to_string(inode) + "]";
#if defined(__linux__)
    const auto self = std::to_string(::getpid());
#else
    const std::string self;
#endif

    bool was_denied = false;
    std::error_code ec;
    for(fs::directory_iterator process(proc_root, ec), end; !ec && process != end;
            process.increment(ec)) {
        const auto pid = process->path().filename().string();
        if(pid.empty() || pid == self
                || pid.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }

        // Processes that exited meanwhile are skipped, ones we may not
        // inspect are remembered.
        std::error_code fd_ec;
        for(fs::directory_iterator fd(process->path() / "fd", fd_ec), fd_end;
                !fd_ec && fd != fd_end; fd.increment(fd_ec)) {
            std::error_code link_ec;
            const auto link = fs::read_symlink(fd->path(), link_ec);
            if(link_ec || link.string() != target) {
                continue;
            }
            const auto fd_name = fd->path().filename().string();
            if(fd_name.find_first_not_of("0123456789") != std::string::npos) {
                continue;
            }
            return socket_owner{std::stoi(pid), std::stoi(fd_name)};
        }
        if(fd_ec == std::errc::permission_denied
                || fd_ec == std::errc::operation_not_permitted) {
            was_denied = true;
        }
    }
    if(was_denied) {
        error = make_error_code(error::reuse::permission_denied);
    }
    return std::nullopt;
}

#if defined(__linux__)

/** Owns a raw descriptor and closes it on destruction. */
class unique_fd
{
    int fd_ = -1;

public:
    unique_fd() = default;
    explicit unique_fd(int fd) : fd_(fd) {}
    ~unique_fd() { reset(); }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    unique_fd(unique_fd&& other) noexcept : fd_(other.fd_)
    {
        other.fd_ = -1;
    }

    unique_fd& operator=(unique_fd&& other) noexcept
    {
        if(this != &other) {
            reset(other.fd_);
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }

    void reset(int fd = -1)
    {
        if(fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }
};

inline error_code make_reuse_error(int errnum)
{
    switch(errnum) {
    case EPERM:
    case EACCES:
        return make_error_code(error::reuse::permission_denied);
    // The process exited or closed the descriptor since the scan.
    case ESRCH:
    case EBADF:
        return make_error_code(error::reuse::no_matching_socket);
    default:
        return make_error_code(error::reuse::duplication_failed);
    }
}

inline void set_reuse_port(const socket_owner& owner, error_code& error)
{
    error = error_code();
    unique_fd pidfd(static_cast<int>(::syscall(SYS_pidfd_open, owner.pid, 0u)));
    if(!pidfd.valid()) {
        error = make_reuse_error(errno);
        return;
    }

    unique_fd socket(static_cast<int>(::syscall(SYS_pidfd_getfd, pidfd.get(), owner.fd, 0u)));
    if(!socket.valid()) {
        error = make_reuse_error(errno);
        return;
    }

    const int enable = 1;
    if(::setsockopt(socket.get(), SOL_SOCKET, SO_REUSEPORT, &enable, sizeof(enable)) != 0) {
        error = make_error_code(error::reuse::duplication_failed);
    }
}

#endif // __linux__

} // detail

inline std::size_t force_reuse_port(uint16_t port, error_code& error)
{
#if defined(__linux__)
    struct proc_source
    {
        const char* path;
        bool is_tcp;
    };
    static const proc_source sources[] = {
        {"/proc/net/tcp", true},
        {"/proc/net/tcp6", true},
        {"/proc/net/udp", false},
        {"/proc/net/udp6", false},
    };

    error = error_code();
    std::size_t num_forced = 0;
    error_code last_error = make_error_code(error::reuse::no_matching_socket);
    for(const auto& source : sources) {
        std::ifstream file(source.path);
        if(!file) {
            // E.g. IPv6 disabled.
            continue;
        }
        for(const auto inode : detail::find_socket_inodes(file, port, source.is_tcp)) {
            error_code ec;
            const auto owner = detail::find_socket_owner(inode, ec);
            if(!owner) {
                if(ec) {
                    PLOGD << "socket inode " << inode << ": " << ec.message();
                    last_error = ec;
                }
                continue;
            }
            detail::set_reuse_port(*owner, ec);
            if(ec) {
                PLOGD << "pid " << owner->pid << " fd " << owner->fd << ": " << ec.message();
                last_error = ec;
                continue;
            }
            PLOGD << "set SO_REUSEPORT on pid " << owner->pid << " fd " << owner->fd;
            ++num_forced;
        }
    }

    if(num_forced == 0) {
        error = last_error;
    }
    return num_forced;
#else
    error = make_error_code(error::reuse::unsupported);
    return 0;
#endif
}

} // nyat

#endif // NYAT_REUSE_PORT_IMPL
