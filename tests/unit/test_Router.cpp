#include <gtest/gtest.h>
#include "support/Harness.hpp"

#include "auth/TokenValidator.hpp"
#include "protocols/http/Router.hpp"

#include <nlohmann/json.hpp>

using namespace tally;
using namespace tally::protocols::http;

class RouterTest : public ::testing::Test {
protected:
    test::ManualClock clock;
    test::ServerHarness server{clock};
    auth::TokenValidator tokens{config::AuthConfig{"router-secret", "tally", 5}};
    Router router{server.processor, tokens};

    static request make(const verb method, const std::string& target, const std::string& body = "",
                        const std::string& bearer = "") {
        request req{method, target, 11};
        if (!bearer.empty()) req.set(field::authorization, "Bearer " + bearer);
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    static std::string errorOf(const string_response& res) {
        return nlohmann::json::parse(res.body()).at("error").get<std::string>();
    }
};

TEST_F(RouterTest, HealthCheck) {
    const auto res = router.route(make(verb::get, "/healthz"));
    EXPECT_EQ(res.result(), status::ok);
    EXPECT_EQ(res.body(), "ok");
}

TEST_F(RouterTest, UnknownPathIsNotFound) {
    const auto res = router.route(make(verb::get, "/api/other"));
    EXPECT_EQ(res.result(), status::not_found);
    EXPECT_EQ(errorOf(res), "Not found");
}

TEST_F(RouterTest, WrongMethodIsRejected) {
    EXPECT_EQ(router.route(make(verb::get, "/api/sync")).result(), status::method_not_allowed);
    EXPECT_EQ(router.route(make(verb::post, "/healthz")).result(), status::method_not_allowed);
}

TEST_F(RouterTest, SyncNeedsAValidBearer) {
    EXPECT_EQ(router.route(make(verb::post, "/api/sync", "{}")).result(), status::unauthorized);
    EXPECT_EQ(router.route(make(verb::post, "/api/sync", "{}", "not-a-jwt")).result(), status::unauthorized);

    const auth::TokenValidator otherKey{config::AuthConfig{"someone-else", "tally", 5}};
    const auto forged = otherKey.generateToken("alice");
    EXPECT_EQ(router.route(make(verb::post, "/api/sync", "{}", forged)).result(), status::unauthorized);
}

TEST_F(RouterTest, MalformedBodyIsABadRequest) {
    const auto token = tokens.generateToken("alice");
    EXPECT_EQ(router.route(make(verb::post, "/api/sync", "{not json", token)).result(), status::bad_request);
    EXPECT_EQ(router.route(make(verb::post, "/api/sync", "{}", token)).result(), status::bad_request);
    EXPECT_EQ(router.route(make(verb::post, "/api/sync", R"({"last_synced_at":"yesterday"})", token)).result(),
              status::bad_request);
}

TEST_F(RouterTest, SyncRoundTripForTheTokenOwner) {
    sync::model::SyncRequest req;
    sync::model::CategoryDto c;
    c.global_id = util::generateGlobalId();
    c.updated_at = clock.now();
    c.name = "Rent";
    req.client_changes.categories.push_back(c);

    const auto res = router.route(make(verb::post, "/api/sync?v=1", nlohmann::json(req).dump(),
                                       tokens.generateToken("alice")));
    ASSERT_EQ(res.result(), status::ok);
    EXPECT_EQ(res[field::content_type], "application/json");

    const auto body = nlohmann::json::parse(res.body()).get<sync::model::SyncResponse>();
    ASSERT_EQ(body.server_changes.categories.size(), 1u);
    EXPECT_EQ(body.server_changes.categories[0].global_id, c.global_id);

    server.inspect("alice", [&](ledger::ChangeLedger& l) {
        EXPECT_TRUE(l.categories().findByGlobalId(c.global_id));
    });
    server.inspect("bob", [&](ledger::ChangeLedger& l) {
        EXPECT_TRUE(l.categories().listAll().empty());
    });
}

TEST(TokenValidatorTest, IssuedTokensCarryTheOwner) {
    const auth::TokenValidator tokens{config::AuthConfig{"s3cret", "tally", 5}};
    EXPECT_EQ(tokens.ownerFromToken(tokens.generateToken("alice")), "alice");
    EXPECT_FALSE(tokens.ownerFromToken(""));

    const auth::TokenValidator otherIssuer{config::AuthConfig{"s3cret", "elsewhere", 5}};
    EXPECT_FALSE(tokens.ownerFromToken(otherIssuer.generateToken("alice")));
}

TEST(TokenValidatorTest, SecretIsRequired) {
    EXPECT_THROW(auth::TokenValidator(config::AuthConfig{}), std::invalid_argument);
}
