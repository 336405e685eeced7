#ifndef NYAT_ERROR_HEADER
#define NYAT_ERROR_HEADER

#include <type_traits>
#include <string>

#include <asio/error.hpp>

namespace nyat {

using asio::error_code;
using asio::error_category;

namespace error {

/** Failures of a mapper's run loop that are reported to the caller. */
enum class mapper
{
    // The local socket could not be created or bound. Terminal.
    bind_failed = 1,
    // The TCP keepalive connection failed more often than allowed.
    connect_failed,
    // `async_run` was invoked while a previous run is still active.
    already_running,
};

enum class resolve
{
    // DNS succeeded but no candidate matched the address family preference.
    no_address_found = 1,
    resolution_failed,
};

enum class stun
{
    // Short, truncated, bad magic cookie or bad attribute.
    malformed_message = 1,
    transaction_mismatch,
    // Neither a binding success nor a binding error response.
    unexpected_message,
    response_too_large,
    // A success response without a (XOR-)MAPPED-ADDRESS attribute.
    no_mapped_address,
};

enum class reuse
{
    // Missing CAP_SYS_PTRACE or not root.
    permission_denied = 1,
    // No foreign process holds a socket on the port.
    no_matching_socket,
    // pidfd_getfd or setsockopt was rejected, e.g. kernel older than 5.6.
    duplication_failed,
    unsupported,
};

enum class config
{
    missing_stun_server = 1,
    missing_remote,
    zero_interval,
    zero_check_per_tick,
    zero_timeout,
    zero_attempts,
    interface_name_too_long,
    // fwmark, interface binding and force-reuse are Linux only.
    unsupported_option,
};

struct mapper_error_category : public nyat::error_category
{
    const char* name() const noexcept override { return "nyat.mapper"; }
    std::string message(int ev) const override
    {
        switch(static_cast<mapper>(ev)) {
        case mapper::bind_failed: return "Socket creation or bind failed";
        case mapper::connect_failed: return "Connection to keepalive remote failed";
        case mapper::already_running: return "Mapper is already running";
        default: return "Unknown mapper error";
        }
    }
};

struct resolve_error_category : public nyat::error_category
{
    const char* name() const noexcept override { return "nyat.resolve"; }
    std::string message(int ev) const override
    {
        switch(static_cast<resolve>(ev)) {
        case resolve::no_address_found: return "No matching address found";
        case resolve::resolution_failed: return "DNS resolution failed";
        default: return "Unknown resolve error";
        }
    }
};

struct stun_error_category : public nyat::error_category
{
    const char* name() const noexcept override { return "nyat.stun"; }
    std::string message(int ev) const override
    {
        switch(static_cast<stun>(ev)) {
        case stun::malformed_message: return "Malformed STUN message";
        case stun::transaction_mismatch: return "STUN transaction ID mismatch";
        case stun::unexpected_message: return "Unexpected STUN message type";
        case stun::response_too_large: return "STUN response too large";
        case stun::no_mapped_address: return "STUN response carries no mapped address";
        default: return "Unknown STUN error";
        }
    }
};

/**
 * Category of STUN binding error responses. The error value is the STUN
 * error code itself (class * 100 + number), e.g. 420 for Unknown Attribute.
 */
struct stun_response_error_category : public nyat::error_category
{
    const char* name() const noexcept override { return "nyat.stun_response"; }
    std::string message(int ev) const override
    {
        switch(ev) {
        case 300: return "Try Alternate";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 420: return "Unknown Attribute";
        case 438: return "Stale Nonce";
        case 500: return "Server Error";
        default: return "STUN error response " + std::to_string(ev);
        }
    }
};

struct reuse_error_category : public nyat::error_category
{
    const char* name() const noexcept override { return "nyat.reuse"; }
    std::string message(int ev) const override
    {
        switch(static_cast<reuse>(ev)) {
        case reuse::permission_denied: return "Permission denied";
        case reuse::no_matching_socket: return "No foreign socket bound to port";
        case reuse::duplication_failed: return "Socket duplication failed";
        case reuse::unsupported: return "Forced port reuse is not supported on this platform";
        default: return "Unknown reuse error";
        }
    }
};

struct config_error_category : public nyat::error_category
{
    const char* name() const noexcept override { return "nyat.config"; }
    std::string message(int ev) const override
    {
        switch(static_cast<config>(ev)) {
        case config::missing_stun_server: return "STUN server is required";
        case config::missing_remote: return "TCP mode requires a keepalive remote";
        case config::zero_interval: return "Interval must be positive";
        case config::zero_check_per_tick: return "check_per_tick must be positive";
        case config::zero_timeout: return "Timeout must be positive";
        case config::zero_attempts: return "Attempt count must be positive";
        case config::interface_name_too_long: return "Interface name too long";
        case config::unsupported_option: return "Option is not supported on this platform";
        default: return "Unknown config error";
        }
    }
};

inline const mapper_error_category& get_mapper_error_category()
{
    static mapper_error_category instance;
    return instance;
}

inline const resolve_error_category& get_resolve_error_category()
{
    static resolve_error_category instance;
    return instance;
}

inline const stun_error_category& get_stun_error_category()
{
    static stun_error_category instance;
    return instance;
}

inline const stun_response_error_category& get_stun_response_error_category()
{
    static stun_response_error_category instance;
    return instance;
}

inline const reuse_error_category& get_reuse_error_category()
{
    static reuse_error_category instance;
    return instance;
}

inline const config_error_category& get_config_error_category()
{
    static config_error_category instance;
    return instance;
}

} // error

inline error_code make_error_code(error::mapper ec)
{
    return error_code(static_cast<int>(ec), error::get_mapper_error_category());
}

inline error_code make_error_code(error::resolve ec)
{
    return error_code(static_cast<int>(ec), error::get_resolve_error_category());
}

inline error_code make_error_code(error::stun ec)
{
    return error_code(static_cast<int>(ec), error::get_stun_error_category());
}

inline error_code make_error_code(error::reuse ec)
{
    return error_code(static_cast<int>(ec), error::get_reuse_error_category());
}

inline error_code make_error_code(error::config ec)
{
    return error_code(static_cast<int>(ec), error::get_config_error_category());
}

/** Wraps the error code carried by a STUN binding error response. */
inline error_code make_stun_response_error(int stun_code)
{
    return error_code(stun_code, error::get_stun_response_error_category());
}

/**
 * @brief Tells whether running a mapper again may succeed after it completed
 * with @p error.
 *
 * Configuration errors, bind failures and cancellation are final; everything
 * else (DNS, STUN, exhausted connect attempts) may clear up on its own.
 */
inline bool is_recoverable(const error_code& error)
{
    if(!error) {
        return true;
    }
    if(error == asio::error::operation_aborted) {
        return false;
    }
    if(error.category() == error::get_config_error_category()) {
        return false;
    }
    if(error == make_error_code(error::mapper::bind_failed)
            || error == make_error_code(error::mapper::already_running)) {
        return false;
    }
    return true;
}

} // nyat

namespace std {
template<> struct is_error_code_enum<nyat::error::mapper> : public true_type {};
template<> struct is_error_code_enum<nyat::error::resolve> : public true_type {};
template<> struct is_error_code_enum<nyat::error::stun> : public true_type {};
template<> struct is_error_code_enum<nyat::error::reuse> : public true_type {};
template<> struct is_error_code_enum<nyat::error::config> : public true_type {};
} // std

#endif // NYAT_ERROR_HEADER
