/**
 * chiralmon - Error Codes
 *
 * Project error category for boost::system::error_code. Collaborator
 * completion handlers and synchronous commands both report through it.
 */

#pragma once

#include <boost/system/error_code.hpp>
#include <string>
#include <type_traits>

namespace chiral {

enum class errc {
    success = 0,
    no_account,            // start requested without a configured account
    backend_unavailable,   // engine / node not reachable
    session_active,        // session already starting or running
    validation_failed,     // bad address / port / missing field
    duplicate_resource,    // address already present
    node_online,           // remove requested on an online node
    unknown_node,          // no node with that address
    rpc_error,             // backend answered with an error object
    bad_response,          // unparseable or malformed backend reply
    timed_out,             // request exceeded its deadline
    scope_closed           // owning timer scope already closed
};

/**
 * The "chiral" error category
 */
const boost::system::error_category& errorCategory();

inline boost::system::error_code make_error_code(errc e) {
    return boost::system::error_code(static_cast<int>(e), errorCategory());
}

}  // namespace chiral

namespace boost {
namespace system {

template <>
struct is_error_code_enum<chiral::errc> : std::true_type {};

}  // namespace system
}  // namespace boost
