#pragma once

#include "sync/model/Payload.hpp"

#include <stdexcept>
#include <string>

namespace tally::sync {

// Any failed round trip: network error, non-2xx status, unreadable body.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& msg, const long status = 0)
        : std::runtime_error(msg), status_(status) {}

    // HTTP status when the server answered, 0 otherwise.
    [[nodiscard]] long status() const { return status_; }

private:
    long status_;
};

class Transport {
public:
    virtual ~Transport() = default;

    // One request/response round trip. Throws TransportError.
    virtual model::SyncResponse exchange(const model::SyncRequest& request, const std::string& bearerToken) = 0;
};

}
