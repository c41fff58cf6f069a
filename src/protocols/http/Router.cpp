#include "protocols/http/Router.hpp"
#include "auth/TokenValidator.hpp"
#include "sync/Processor.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace tally::protocols::http;
using namespace tally::log;

namespace {

constexpr std::string_view kSyncPath = "/api/sync";
constexpr std::string_view kHealthPath = "/healthz";
constexpr std::string_view kBearer = "Bearer ";

std::string_view pathOf(const request& req) {
    const std::string_view target{req.target().data(), req.target().size()};
    return target.substr(0, target.find('?'));
}

}

Router::Router(sync::Processor& processor, const auth::TokenValidator& tokens)
    : processor_(processor), tokens_(tokens) {}

string_response Router::route(const request& req) const {
    const auto path = pathOf(req);

    if (path == kSyncPath) {
        if (req.method() != verb::post) return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
        return handleSync(req);
    }

    if (path == kHealthPath) {
        if (req.method() != verb::get) return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
        string_response res{status::ok, req.version()};
        res.set(field::content_type, "text/plain");
        res.keep_alive(req.keep_alive());
        res.body() = "ok";
        res.prepare_payload();
        return res;
    }

    return makeErrorResponse(req, "Not found", status::not_found);
}

string_response Router::handleSync(const request& req) const {
    const auto token = bearerToken(req);
    if (token.empty()) return makeErrorResponse(req, "Missing bearer token", status::unauthorized);

    const auto owner = tokens_.ownerFromToken(token);
    if (!owner) return makeErrorResponse(req, "Invalid token", status::unauthorized);

    sync::model::SyncRequest syncReq;
    try {
        syncReq = nlohmann::json::parse(req.body()).get<sync::model::SyncRequest>();
    } catch (const std::exception& e) {
        Registry::http()->warn("[Router] Malformed sync body from {}: {}", *owner, e.what());
        return makeErrorResponse(req, "Malformed request body", status::bad_request);
    }

    try {
        const auto res = processor_.process(*owner, syncReq);
        return makeJsonResponse(req, res);
    } catch (const std::exception& e) {
        Registry::http()->error("[Router] Sync for {} failed: {}", *owner, e.what());
        return makeErrorResponse(req, "Sync failed", status::internal_server_error);
    }
}

std::string Router::bearerToken(const request& req) {
    const auto it = req.find(field::authorization);
    if (it == req.end()) return {};

    const std::string_view value{it->value().data(), it->value().size()};
    if (!value.starts_with(kBearer)) return {};
    return std::string{value.substr(kBearer.size())};
}

string_response Router::makeErrorResponse(const request& req, const std::string& msg, const status s) {
    string_response res{s, req.version()};
    res.set(field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = nlohmann::json{{"error", msg}}.dump();
    res.prepare_payload();
    return res;
}

string_response Router::makeJsonResponse(const request& req, const nlohmann::json& j) {
    string_response res{status::ok, req.version()};
    res.set(field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = j.dump();
    res.prepare_payload();
    return res;
}
