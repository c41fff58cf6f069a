#pragma once

#include <optional>
#include <string>

namespace tally::auth {

// Where the sync agent gets its bearer token.
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    // A currently valid token, or nullopt when the owner is signed out.
    [[nodiscard]] virtual std::optional<std::string> getValidCredential() const = 0;
};

// A fixed token from configuration; empty means signed out.
class StaticCredentialProvider final : public CredentialProvider {
public:
    explicit StaticCredentialProvider(std::string token) : token_(std::move(token)) {}

    [[nodiscard]] std::optional<std::string> getValidCredential() const override {
        if (token_.empty()) return std::nullopt;
        return token_;
    }

private:
    std::string token_;
};

}
