#pragma once

#include "config/Config.hpp"

#include <optional>
#include <string>

namespace tally::auth {

// HS256 bearer tokens. The subject claim carries the owner id.
class TokenValidator {
public:
    explicit TokenValidator(config::AuthConfig cfg);

    [[nodiscard]] std::string generateToken(const std::string& ownerId) const;

    // Owner id of a valid, unexpired token issued by us; nullopt otherwise.
    [[nodiscard]] std::optional<std::string> ownerFromToken(const std::string& token) const;

private:
    config::AuthConfig cfg_;
};

}
