#ifndef NYAT_MAPPER_CONFIG_HEADER
#define NYAT_MAPPER_CONFIG_HEADER

#include <chrono>
#include <cstdint>

namespace nyat {

/** Settings shared by both mapper kinds. */
struct mapper_config
{
    // Period of the run loop: the UDP tick, or the TCP keepalive request.
    std::chrono::milliseconds interval;

    // How long to wait for a STUN response before sending the request again,
    // and how many requests to send per discovery.
    std::chrono::milliseconds probe_timeout = std::chrono::seconds(3);
    uint32_t probe_attempts = 3;

    // Delay before retrying a failed discovery (TCP) or reconnecting after
    // the keepalive connection was lost. Also the base of the TCP connect
    // backoff.
    std::chrono::milliseconds retry_interval = std::chrono::seconds(5);

protected:
    explicit mapper_config(std::chrono::milliseconds default_interval)
        : interval(default_interval)
    {}
};

struct udp_mapper_config : public mapper_config
{
    // Every check_per_tick-th tick runs a STUN discovery, the others only
    // send a keepalive datagram.
    uint32_t check_per_tick = 5;

    udp_mapper_config() : mapper_config(std::chrono::seconds(5)) {}
};

struct tcp_mapper_config : public mapper_config
{
    std::chrono::milliseconds connect_timeout = std::chrono::seconds(30);
    // Consecutive connect failures after which the run completes with
    // error::mapper::connect_failed.
    uint32_t connect_attempts = 5;
    // Ceiling of the exponential backoff between connect attempts.
    std::chrono::milliseconds max_backoff = std::chrono::seconds(60);

    tcp_mapper_config() : mapper_config(std::chrono::seconds(30)) {}
};

} // nyat

#endif // NYAT_MAPPER_CONFIG_HEADER
