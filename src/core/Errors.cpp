/**
 * chiralmon - Error Codes Implementation
 */

#include "Errors.h"

namespace chiral {

namespace {

class ChiralErrorCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override {
        return "chiral";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::success:             return "success";
            case errc::no_account:          return "no account configured";
            case errc::backend_unavailable: return "backend not running";
            case errc::session_active:      return "mining session already active";
            case errc::validation_failed:   return "validation failed";
            case errc::duplicate_resource:  return "resource already present";
            case errc::node_online:         return "node is online, disconnect first";
            case errc::unknown_node:        return "unknown node";
            case errc::rpc_error:           return "backend returned an error";
            case errc::bad_response:        return "malformed backend response";
            case errc::timed_out:           return "request timed out";
            case errc::scope_closed:        return "timer scope closed";
            default:                        return "unknown error";
        }
    }
};

}  // namespace

const boost::system::error_category& errorCategory() {
    static ChiralErrorCategory category;
    return category;
}

}  // namespace chiral
