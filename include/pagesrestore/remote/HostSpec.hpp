#pragma once

#include "pagesrestore/Config.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace pagesrestore::remote {

struct HostSpec {
    std::string user;
    std::string host;
    std::uint16_t port{0};

    // The host as it appears in "host:path" and "host:port" forms; IPv6
    // literals are bracketed.
    std::string address() const;

    // address:port
    std::string display() const;
};

// Accepts "[user@]host[:port]", with IPv6 literals written as "[addr]" or
// "[addr]:port". Throws ConfigError on malformed input.
HostSpec parse_host_spec(std::string_view text, const Config& config);

}  // namespace pagesrestore::remote
