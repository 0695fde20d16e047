/**
 * chiralmon - Proxy Address Validator
 */

#pragma once

#include <cstdint>
#include <string>

namespace chiral {

/**
 * Why an address was rejected
 */
enum class AddressError {
    None,
    Empty,
    ContainsWhitespace,
    UnsupportedScheme,
    MissingPort,
    PortOutOfRange,
    ReservedPort,
    MalformedHost
};

const char* toString(AddressError error);

/**
 * Result of validating one address
 */
struct AddressCheck {
    AddressError error{AddressError::None};
    std::string scheme;      // "tcp", "ws", "wss" or empty
    std::string host;        // without IPv6 brackets
    uint16_t port{0};
    std::string canonical;   // host:port, IPv6 bracketed

    bool ok() const { return error == AddressError::None; }
};

/**
 * AddressValidator class
 *
 * Accepts "host:port" with an optional tcp://, ws:// or wss:// prefix. Host
 * is an IPv4 literal, a bracketed IPv6 literal or a DNS name. Ports below
 * 1024 are reserved except 80 and 443.
 */
class AddressValidator {
public:
    static AddressCheck check(const std::string& address);

    static bool isValid(const std::string& address) { return check(address).ok(); }

private:
    static bool isHostname(const std::string& host);
};

}  // namespace chiral
