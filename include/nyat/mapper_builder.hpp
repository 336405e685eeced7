#ifndef NYAT_MAPPER_BUILDER_HEADER
#define NYAT_MAPPER_BUILDER_HEADER

#include "error.hpp"
#include "mapper_config.hpp"
#include "local_address.hpp"
#include "remote_address.hpp"
#include "udp_mapper.hpp"
#include "tcp_mapper.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <asio/io_context.hpp>

#if defined(__linux__)
# include <net/if.h>
#endif

namespace nyat {
namespace detail {

/**
 * Setters and validation shared by @ref udp_mapper_builder and
 * @ref tcp_mapper_builder. Setters return the derived builder so calls can be
 * chained.
 */
template<typename Derived, typename Config>
class basic_mapper_builder
{
protected:
    local_address local_;
    remote_address stun_server_;
    remote_address remote_;
    Config config_;

    basic_mapper_builder(local_address local, remote_address stun_server,
            remote_address remote)
        : local_(std::move(local))
        , stun_server_(std::move(stun_server))
        , remote_(std::move(remote))
    {}

    Derived& self() { return static_cast<Derived&>(*this); }

    /** Checks the settings common to both mapper kinds. */
    error_code validate_common() const
    {
        if(stun_server_.empty()) {
            return make_error_code(error::config::missing_stun_server);
        }
        if(config_.interval.count() <= 0 || config_.retry_interval.count() <= 0) {
            return make_error_code(error::config::zero_interval);
        }
        if(config_.probe_timeout.count() <= 0) {
            return make_error_code(error::config::zero_timeout);
        }
        if(config_.probe_attempts == 0) {
            return make_error_code(error::config::zero_attempts);
        }
#if defined(__linux__)
        if(local_.interface_name().size() > static_cast<std::size_t>(IFNAMSIZ - 1)) {
            return make_error_code(error::config::interface_name_too_long);
        }
#else
        if(!local_.interface_name().empty() || local_.fwmark() || local_.force_reuse()) {
            return make_error_code(error::config::unsupported_option);
        }
#endif
        return {};
    }

public:
    Derived& interval(std::chrono::milliseconds interval)
    {
        config_.interval = interval;
        return self();
    }

    /** Binds every socket to the network interface @p name. Linux only. */
    Derived& bind_interface(std::string name)
    {
        local_.bind_interface(std::move(name));
        return self();
    }

    /** Sets `SO_MARK` on every socket. Linux only. */
    Derived& fwmark(uint32_t mark)
    {
        local_.fwmark(mark);
        return self();
    }

    /**
     * Takes over the local port from other processes if it is in use. Linux
     * only, needs root. See @ref force_reuse_port.
     */
    Derived& force_reuse(bool enabled)
    {
        local_.force_reuse(enabled);
        return self();
    }

    Derived& probe_timeout(std::chrono::milliseconds timeout)
    {
        config_.probe_timeout = timeout;
        return self();
    }

    Derived& probe_attempts(uint32_t attempts)
    {
        config_.probe_attempts = attempts;
        return self();
    }

    Derived& retry_interval(std::chrono::milliseconds interval)
    {
        config_.retry_interval = interval;
        return self();
    }

    const Config& config() const noexcept { return config_; }
    const local_address& local() const noexcept { return local_; }
    const remote_address& stun_server() const noexcept { return stun_server_; }
    const remote_address& remote() const noexcept { return remote_; }
};

} // detail

/** Configures and validates a @ref udp_mapper. */
class udp_mapper_builder
    : public detail::basic_mapper_builder<udp_mapper_builder, udp_mapper_config>
{
public:
    udp_mapper_builder(local_address local, remote_address stun_server,
            remote_address remote)
        : basic_mapper_builder(std::move(local), std::move(stun_server), std::move(remote))
    {}

    udp_mapper_builder& check_per_tick(uint32_t n)
    {
        config_.check_per_tick = n;
        return *this;
    }

    /**
     * @brief Creates the mapper. No I/O is performed until it is run.
     *
     * @param error Set to an @ref error::config value if the configuration is
     * invalid.
     *
     * @return The mapper, or null if @p error is set.
     */
    std::unique_ptr<udp_mapper> build(asio::io_context& io_context, error_code& error) const
    {
        error = validate_common();
        if(!error && config_.check_per_tick == 0) {
            error = make_error_code(error::config::zero_check_per_tick);
        }
        if(error) {
            return nullptr;
        }
        return std::make_unique<udp_mapper>(io_context, local_, stun_server_,
                remote_, config_);
    }
};

/** Configures and validates a @ref tcp_mapper. */
class tcp_mapper_builder
    : public detail::basic_mapper_builder<tcp_mapper_builder, tcp_mapper_config>
{
public:
    tcp_mapper_builder(local_address local, remote_address stun_server,
            remote_address remote)
        : basic_mapper_builder(std::move(local), std::move(stun_server), std::move(remote))
    {}

    tcp_mapper_builder& connect_timeout(std::chrono::milliseconds timeout)
    {
        config_.connect_timeout = timeout;
        return *this;
    }

    tcp_mapper_builder& connect_attempts(uint32_t attempts)
    {
        config_.connect_attempts = attempts;
        return *this;
    }

    /** @copydoc udp_mapper_builder::build */
    std::unique_ptr<tcp_mapper> build(asio::io_context& io_context, error_code& error) const
    {
        error = validate_common();
        if(error) {
            return nullptr;
        }
        if(remote_.empty()) {
            error = make_error_code(error::config::missing_remote);
        } else if(config_.connect_timeout.count() <= 0) {
            error = make_error_code(error::config::zero_timeout);
        } else if(config_.connect_attempts == 0) {
            error = make_error_code(error::config::zero_attempts);
        }
        if(error) {
            return nullptr;
        }
        return std::make_unique<tcp_mapper>(io_context, local_, stun_server_,
                remote_, config_);
    }
};

/**
 * Entry point for creating mappers:
 * @code
 * nyat::error_code error;
 * auto mapper = nyat::mapper_builder::udp(local, stun)
 *         .interval(std::chrono::seconds(10))
 *         .check_per_tick(3)
 *         .build(io_context, error);
 * @endcode
 */
struct mapper_builder
{
    /** @param remote The keepalive peer. If empty, keepalives go to @p stun_server. */
    static udp_mapper_builder udp(local_address local, remote_address stun_server,
            remote_address remote = remote_address())
    {
        return udp_mapper_builder(std::move(local), std::move(stun_server),
                std::move(remote));
    }

    /** @param remote The HTTP server the keepalive connection is made to. */
    static tcp_mapper_builder tcp(local_address local, remote_address stun_server,
            remote_address remote)
    {
        return tcp_mapper_builder(std::move(local), std::move(stun_server),
                std::move(remote));
    }
};

} // nyat

#endif // NYAT_MAPPER_BUILDER_HEADER
