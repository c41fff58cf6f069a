#include "auth/TokenValidator.hpp"
#include "log/Registry.hpp"

#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>
#include <stdexcept>

using namespace tally::auth;

TokenValidator::TokenValidator(config::AuthConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.jwt_secret.empty()) throw std::invalid_argument("auth.jwt_secret must be set");
}

std::string TokenValidator::generateToken(const std::string& ownerId) const {
    const auto now = std::chrono::system_clock::now();

    return jwt::create<jwt::traits::nlohmann_json>()
        .set_issuer(cfg_.issuer)
        .set_type("JWS")
        .set_subject(ownerId)
        .set_issued_at(now)
        .set_expires_at(now + std::chrono::minutes(cfg_.token_expiry_minutes))
        .sign(jwt::algorithm::hs256{cfg_.jwt_secret});
}

std::optional<std::string> TokenValidator::ownerFromToken(const std::string& token) const {
    try {
        const auto decoded = jwt::decode<jwt::traits::nlohmann_json>(token);

        const auto verifier = jwt::verify<jwt::traits::nlohmann_json>()
            .allow_algorithm(jwt::algorithm::hs256{cfg_.jwt_secret})
            .with_issuer(cfg_.issuer);

        verifier.verify(decoded);

        if (!decoded.has_subject() || decoded.get_subject().empty()) {
            log::Registry::auth()->warn("[TokenValidator] Token has no subject");
            return std::nullopt;
        }
        return decoded.get_subject();
    } catch (const std::exception& e) {
        log::Registry::auth()->warn("[TokenValidator] Token validation failed: {}", e.what());
        return std::nullopt;
    }
}
