#ifndef NYAT_REMOTE_ADDRESS_IMPL
#define NYAT_REMOTE_ADDRESS_IMPL

#include "../remote_address.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

#include <asio/post.hpp>
#include <plog/Log.h>

namespace nyat {
namespace detail {

// Parses a decimal port number. Port 0 is only accepted if @p allow_zero.
inline bool parse_port(const std::string& text, bool allow_zero, uint16_t& port)
{
    if(text.empty() || text.size() > 5) {
        return false;
    }
    if(!std::all_of(text.begin(), text.end(),
            [](const char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return false;
    }
    const auto value = std::stoul(text);
    if(value > 65535 || (value == 0 && !allow_zero)) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

// Splits `[v6]:port` or `host:port`. Returns false if @p text has no port.
inline bool split_host_port(const std::string& text, std::string& host, std::string& port)
{
    if(!text.empty() && text.front() == '[') {
        const auto close = text.find("]:");
        if(close == std::string::npos) {
            return false;
        }
        host = text.substr(1, close - 1);
        port = text.substr(close + 2);
        return true;
    }
    const auto colon = text.rfind(':');
    // More than one colon without brackets is a bare IPv6 address.
    if(colon == std::string::npos || text.find(':') != colon) {
        return false;
    }
    host = text.substr(0, colon);
    port = text.substr(colon + 1);
    return true;
}

} // detail

inline remote_address remote_address::parse(const std::string& text,
        uint16_t default_port, ip_preference preference, error_code& error)
{
    error = error_code();

    error_code ec;
    auto address = asio::ip::make_address(text, ec);
    if(!ec) {
        return remote_address(address, default_port);
    }

    std::string host;
    std::string port_text;
    uint16_t port = default_port;
    if(detail::split_host_port(text, host, port_text)) {
        if(!detail::parse_port(port_text, false, port)) {
            error = make_error_code(asio::error::invalid_argument);
            return {};
        }
    } else {
        host = text;
    }

    if(host.empty()) {
        error = make_error_code(asio::error::invalid_argument);
        return {};
    }

    address = asio::ip::make_address(host, ec);
    if(!ec) {
        return remote_address(address, port);
    }
    return remote_address(std::move(host), port, preference);
}

inline std::string remote_address::host_header() const
{
    if(!resolved_) {
        return host_;
    }
    if(address_.is_v6()) {
        return '[' + address_.to_string() + ']';
    }
    return address_.to_string();
}

inline std::string remote_address::to_string() const
{
    std::ostringstream ss;
    ss << host_header() << ':' << port_;
    return ss.str();
}

inline asio::ip::address parse_bind_address(const std::string& text, bool ipv6,
        uint16_t& port, error_code& error)
{
    error = error_code();
    if(detail::parse_port(text, true, port)) {
        if(ipv6) {
            return asio::ip::address_v6::any();
        }
        return asio::ip::address_v4::any();
    }

    std::string host;
    std::string port_text;
    if(!detail::split_host_port(text, host, port_text)
            || !detail::parse_port(port_text, true, port)) {
        error = make_error_code(asio::error::invalid_argument);
        return {};
    }

    auto address = asio::ip::make_address(host, error);
    if(error) {
        error = make_error_code(asio::error::invalid_argument);
        return {};
    }
    return address;
}

template<typename Endpoint, typename Range>
Endpoint select_endpoint(const Range& candidates, ip_preference preference,
        error_code& error)
{
    error = error_code();
    for(const auto& candidate : candidates) {
        const Endpoint endpoint = candidate;
        switch(preference) {
        case ip_preference::any:
            return endpoint;
        case ip_preference::v4:
            if(endpoint.address().is_v4()) { return endpoint; }
            break;
        case ip_preference::v6:
            if(endpoint.address().is_v6()) { return endpoint; }
            break;
        }
    }
    error = make_error_code(error::resolve::no_address_found);
    return {};
}

template<typename Resolver>
typename Resolver::endpoint_type resolve(Resolver& resolver,
        const remote_address& remote, error_code& error)
{
    using endpoint_type = typename Resolver::endpoint_type;
    error = error_code();
    if(remote.is_resolved()) {
        return endpoint_type(remote.address(), remote.port());
    }

    const auto results = resolver.resolve(remote.host(), std::to_string(remote.port()),
            Resolver::numeric_service, error);
    if(error) {
        PLOGW << "resolving " << remote.to_string() << " failed: " << error.message();
        error = make_error_code(error::resolve::resolution_failed);
        return {};
    }
    return select_endpoint<endpoint_type>(results, remote.preference(), error);
}

template<typename Resolver, typename Handler>
void async_resolve(Resolver& resolver, const remote_address& remote, Handler handler)
{
    using endpoint_type = typename Resolver::endpoint_type;
    if(remote.is_resolved()) {
        asio::post(resolver.get_executor(),
                [handler = std::move(handler),
                 endpoint = endpoint_type(remote.address(), remote.port())]() mutable
                { handler(error_code(), endpoint); });
        return;
    }

    resolver.async_resolve(remote.host(), std::to_string(remote.port()),
            Resolver::numeric_service,
            [handler = std::move(handler), preference = remote.preference(),
             name = remote.to_string()](error_code error, const auto& results) mutable {
                if(error == asio::error::operation_aborted) {
                    handler(error, endpoint_type());
                    return;
                }
                if(error) {
                    PLOGW << "resolving " << name << " failed: " << error.message();
                    handler(make_error_code(error::resolve::resolution_failed),
                            endpoint_type());
                    return;
                }
                const auto endpoint = select_endpoint<endpoint_type>(
                        results, preference, error);
                handler(error, endpoint);
            });
}

} // nyat

#endif // NYAT_REMOTE_ADDRESS_IMPL
