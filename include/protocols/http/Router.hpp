#pragma once

#include <boost/beast/http.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace tally::auth {
class TokenValidator;
}

namespace tally::sync {
class Processor;
}

namespace tally::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using string_response = boost::beast::http::response<boost::beast::http::string_body>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

// POST /api/sync and GET /healthz.
class Router {
public:
    Router(sync::Processor& processor, const auth::TokenValidator& tokens);

    string_response route(const request& req) const;

    static string_response makeErrorResponse(const request& req, const std::string& msg, status s);

    static string_response makeJsonResponse(const request& req, const nlohmann::json& j);

private:
    sync::Processor& processor_;
    const auth::TokenValidator& tokens_;

    string_response handleSync(const request& req) const;

    // Bearer token from the Authorization header; empty when missing or malformed.
    static std::string bearerToken(const request& req);
};

}
