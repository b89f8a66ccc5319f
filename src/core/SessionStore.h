#pragma once
#include <optional>
#include <string>

namespace Courier {

    struct Credential {
        std::string user;
        std::string token;

        bool IsValid() const { return !token.empty(); }
    };

    // Supplies the session credential and is told when the server has
    // rejected it for good, so the application can force a fresh login.
    class SessionStore {
    public:
        virtual ~SessionStore() = default;
        virtual std::optional<Credential> CurrentCredential() = 0;
        virtual void OnAuthenticationFailed(const Credential& credential, const std::string& reason) = 0;
    };

} // namespace Courier
