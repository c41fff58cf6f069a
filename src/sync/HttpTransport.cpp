#include "sync/HttpTransport.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace tally::sync;

namespace {

std::string joinEndpoint(std::string base) {
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/api/sync";
}

}

HttpTransport::HttpTransport(std::string serverUrl, const std::chrono::seconds timeout)
    : endpoint_(joinEndpoint(std::move(serverUrl))), timeout_(timeout) {
    static const CURLcode globalInit = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (globalInit != CURLE_OK)
        throw std::runtime_error(fmt::format("curl_global_init failed: {}", curl_easy_strerror(globalInit)));
}

model::SyncResponse HttpTransport::exchange(const model::SyncRequest& request, const std::string& bearerToken) {
    const auto body = nlohmann::json(request).dump();

    util::SList headers;
    headers.add("Content-Type: application/json");
    headers.add("Accept: application/json");
    headers.add("Authorization: Bearer " + bearerToken);

    const auto res = util::performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, endpoint_.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    });

    if (res.curl != CURLE_OK) {
        log::Registry::http()->warn("[HttpTransport] {} unreachable: {}", endpoint_, curl_easy_strerror(res.curl));
        throw TransportError(fmt::format("Request to {} failed: {}", endpoint_, curl_easy_strerror(res.curl)));
    }

    if (!res.ok()) {
        log::Registry::http()->warn("[HttpTransport] {} answered HTTP {}", endpoint_, res.http);
        throw TransportError(fmt::format("Sync endpoint answered HTTP {}", res.http), res.http);
    }

    try {
        return nlohmann::json::parse(res.body).get<model::SyncResponse>();
    } catch (const std::exception& e) {
        log::Registry::http()->warn("[HttpTransport] Malformed response body: {}", e.what());
        throw TransportError(fmt::format("Malformed sync response: {}", e.what()), res.http);
    }
}
