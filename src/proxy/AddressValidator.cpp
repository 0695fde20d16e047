/**
 * chiralmon - Proxy Address Validator Implementation
 */

#include "AddressValidator.h"
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <boost/system/error_code.hpp>
#include <algorithm>
#include <cctype>
#include <regex>

namespace chiral {

const char* toString(AddressError error) {
    switch (error) {
        case AddressError::None:               return "ok";
        case AddressError::Empty:              return "address is empty";
        case AddressError::ContainsWhitespace: return "address contains whitespace";
        case AddressError::UnsupportedScheme:  return "unsupported scheme (expected tcp, ws or wss)";
        case AddressError::MissingPort:        return "port is missing";
        case AddressError::PortOutOfRange:     return "port must be 1-65535";
        case AddressError::ReservedPort:       return "port below 1024 is reserved (80 and 443 allowed)";
        case AddressError::MalformedHost:      return "host is malformed";
        default:                               return "invalid address";
    }
}

namespace {

AddressCheck fail(AddressError error) {
    AddressCheck result;
    result.error = error;
    return result;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool looksNumeric(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) || c == '.'; });
}

}  // namespace

AddressCheck AddressValidator::check(const std::string& address) {
    if (address.empty()) {
        return fail(AddressError::Empty);
    }

    if (std::any_of(address.begin(), address.end(),
                    [](unsigned char c) { return std::isspace(c) != 0; })) {
        return fail(AddressError::ContainsWhitespace);
    }

    // Optional scheme: tcp://host:port, ws://host:port, wss://host:port
    std::string scheme;
    std::string rest = address;
    static const std::regex schemeRegex(R"(^([A-Za-z][A-Za-z0-9+.-]*)://(.*)$)");
    std::smatch match;
    if (std::regex_match(address, match, schemeRegex)) {
        scheme = lower(match[1].str());
        if (scheme != "tcp" && scheme != "ws" && scheme != "wss") {
            return fail(AddressError::UnsupportedScheme);
        }
        rest = match[2].str();
        if (!rest.empty() && rest.back() == '/') {
            rest.pop_back();
        }
    }

    if (rest.empty()) {
        return fail(AddressError::Empty);
    }

    std::string host;
    std::string portText;
    bool ipv6 = false;

    if (rest.front() == '[') {
        size_t close = rest.find(']');
        if (close == std::string::npos) {
            return fail(AddressError::MalformedHost);
        }
        host = rest.substr(1, close - 1);
        ipv6 = true;

        std::string tail = rest.substr(close + 1);
        if (tail.empty() || tail == ":") {
            return fail(AddressError::MissingPort);
        }
        if (tail.front() != ':') {
            return fail(AddressError::MalformedHost);
        }
        portText = tail.substr(1);
    } else {
        size_t colon = rest.rfind(':');
        if (colon == std::string::npos) {
            return fail(AddressError::MissingPort);
        }
        host = rest.substr(0, colon);
        portText = rest.substr(colon + 1);

        // Unbracketed IPv6 literal
        if (host.find(':') != std::string::npos) {
            return fail(AddressError::MalformedHost);
        }
        if (portText.empty()) {
            return fail(AddressError::MissingPort);
        }
    }

    if (host.empty()) {
        return fail(AddressError::MalformedHost);
    }

    // Six digits are enough to detect anything above 65535
    if (!allDigits(portText) || portText.size() > 6) {
        return fail(AddressError::PortOutOfRange);
    }
    unsigned long port = std::stoul(portText);
    if (port == 0 || port > 65535) {
        return fail(AddressError::PortOutOfRange);
    }
    if (port < 1024 && port != 80 && port != 443) {
        return fail(AddressError::ReservedPort);
    }

    AddressCheck result;
    result.scheme = scheme;
    result.port = static_cast<uint16_t>(port);

    boost::system::error_code ec;
    if (ipv6) {
        auto addr = boost::asio::ip::make_address_v6(host, ec);
        if (ec) {
            return fail(AddressError::MalformedHost);
        }
        result.host = addr.to_string();
        result.canonical = "[" + result.host + "]:" + std::to_string(port);
        return result;
    }

    if (looksNumeric(host)) {
        auto addr = boost::asio::ip::make_address_v4(host, ec);
        if (ec) {
            return fail(AddressError::MalformedHost);
        }
        result.host = addr.to_string();
    } else {
        if (!isHostname(host)) {
            return fail(AddressError::MalformedHost);
        }
        result.host = lower(host);
    }

    result.canonical = result.host + ":" + std::to_string(port);
    return result;
}

bool AddressValidator::isHostname(const std::string& host) {
    if (host.size() > 253) {
        return false;
    }

    size_t start = 0;
    while (start <= host.size()) {
        size_t dot = host.find('.', start);
        size_t end = dot == std::string::npos ? host.size() : dot;
        size_t len = end - start;

        if (len == 0 || len > 63) {
            return false;
        }
        if (host[start] == '-' || host[end - 1] == '-') {
            return false;
        }
        for (size_t i = start; i < end; i++) {
            unsigned char c = static_cast<unsigned char>(host[i]);
            if (!std::isalnum(c) && c != '-') {
                return false;
            }
        }

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return true;
}

}  // namespace chiral
