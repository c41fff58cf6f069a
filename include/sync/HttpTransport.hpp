#pragma once

#include "sync/Transport.hpp"

#include <chrono>

namespace tally::sync {

// POST {server_url}/api/sync over libcurl.
class HttpTransport final : public Transport {
public:
    HttpTransport(std::string serverUrl, std::chrono::seconds timeout);

    model::SyncResponse exchange(const model::SyncRequest& request, const std::string& bearerToken) override;

    [[nodiscard]] const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
    std::chrono::seconds timeout_;
};

}
