#pragma once
#include <functional>
#include <string>
#include <system_error>
#include "../sync/Message.h"

namespace Courier {

    struct PreparedEnvelope {
        std::string envelope;          // opaque wire form
        std::string correlationToken;  // minted by the provider, unique per call
        int protocolVersion = 1;
    };

    // Encryption boundary. Both calls may complete asynchronously but must
    // invoke their callback on the event loop, exactly once.
    class CryptoProvider {
    public:
        using PrepareCallback = std::function<void(std::error_code, PreparedEnvelope)>;
        using DecryptCallback = std::function<void(std::error_code, std::string)>;

        virtual ~CryptoProvider() = default;

        virtual void PrepareEnvelope(const std::string& plaintext, const ConversationKey& target,
            PrepareCallback callback) = 0;
        /// Reports SyncError::DecryptError for an envelope it cannot open.
        virtual void Decrypt(const std::string& envelope, int protocolVersion, const ConversationKey& source,
            DecryptCallback callback) = 0;
    };

} // namespace Courier
