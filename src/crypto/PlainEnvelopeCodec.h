#pragma once
#include <mutex>
#include <random>
#include "CryptoProvider.h"

namespace Courier {

    // Development provider: NO ENCRYPTION. The envelope is the plaintext wrapped
    // in a JSON object tagged {"codec":"plain"}. Only for local servers and the
    // demo client; a real deployment injects the E2EE module instead.
    class PlainEnvelopeCodec : public CryptoProvider {
    public:
        static constexpr int kProtocolVersion = 1;

        PlainEnvelopeCodec();

        void PrepareEnvelope(const std::string& plaintext, const ConversationKey& target,
            PrepareCallback callback) override;
        void Decrypt(const std::string& envelope, int protocolVersion, const ConversationKey& source,
            DecryptCallback callback) override;

        static std::string Wrap(const std::string& plaintext);

        /// Random RFC 4122 version 4 identifier.
        std::string NewToken();

    private:
        std::mutex m_RngMutex;
        std::mt19937_64 m_Rng;
    };

} // namespace Courier
