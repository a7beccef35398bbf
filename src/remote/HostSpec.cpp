#include "pagesrestore/remote/HostSpec.hpp"

#include "pagesrestore/Errors.hpp"

#include <charconv>
#include <string>
#include <system_error>

namespace pagesrestore::remote {

namespace {

constexpr const char* kBracketHint = "Write IPv6 addresses as [addr] or [addr]:port";

std::uint16_t parse_port(std::string_view port_text) {
    unsigned int port = 0;
    const auto* begin = port_text.data();
    const auto* end = port_text.data() + port_text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, port);
    if (port_text.empty() || ec != std::errc{} || ptr != end || port == 0 || port > 65535) {
        throw_config_error("E_INVALID_HOST",
                           "Invalid port in host specification: " + std::string(port_text),
                           "Use host or host:port with a port between 1 and 65535");
    }
    return static_cast<std::uint16_t>(port);
}

}  // namespace

std::string HostSpec::address() const {
    if (host.find(':') != std::string::npos) {
        return '[' + host + ']';
    }
    return host;
}

std::string HostSpec::display() const {
    return address() + ':' + std::to_string(port);
}

HostSpec parse_host_spec(std::string_view text, const Config& config) {
    if (text.empty()) {
        throw_config_error("E_MISSING_HOST", "A target host is required", "Usage: restore-pages [options] <host>");
    }
    if (text.find_first_of(" \t\r\n") != std::string_view::npos) {
        throw_config_error("E_INVALID_HOST", "Host must not contain whitespace: " + std::string(text));
    }

    HostSpec spec{};
    spec.user = config.default_remote_user;
    spec.port = config.default_remote_port;

    if (const auto at = text.rfind('@'); at != std::string_view::npos) {
        spec.user = std::string(text.substr(0, at));
        text.remove_prefix(at + 1);
        if (spec.user.empty()) {
            throw_config_error("E_INVALID_HOST", "Empty user name in host specification");
        }
    }

    if (text.starts_with("[")) {
        const auto close = text.find(']');
        if (close == std::string_view::npos || close == 1) {
            throw_config_error("E_INVALID_HOST", "Malformed bracketed address: " + std::string(text), kBracketHint);
        }
        const auto rest = text.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                throw_config_error("E_INVALID_HOST", "Unexpected text after address: " + std::string(rest),
                                   kBracketHint);
            }
            spec.port = parse_port(rest.substr(1));
        }
        spec.host = std::string(text.substr(1, close - 1));
        return spec;
    }

    if (const auto colon = text.find(':'); colon != std::string_view::npos) {
        // A second colon means a bare IPv6 literal, which cannot carry a port.
        if (text.find(':', colon + 1) != std::string_view::npos) {
            throw_config_error("E_INVALID_HOST", "Ambiguous host specification: " + std::string(text), kBracketHint);
        }
        spec.port = parse_port(text.substr(colon + 1));
        text = text.substr(0, colon);
    }

    if (text.empty()) {
        throw_config_error("E_INVALID_HOST", "Host name is empty");
    }
    spec.host = std::string(text);
    return spec;
}

}  // namespace pagesrestore::remote
