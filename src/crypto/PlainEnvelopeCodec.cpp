#include "PlainEnvelopeCodec.h"
#include "../core/SyncError.h"
#include <cstdio>
#include <nlohmann/json.hpp>

namespace Courier {

    PlainEnvelopeCodec::PlainEnvelopeCodec() : m_Rng(std::random_device{}()) {}

    std::string PlainEnvelopeCodec::Wrap(const std::string& plaintext) {
        return nlohmann::json{ {"codec", "plain"}, {"body", plaintext} }.dump();
    }

    std::string PlainEnvelopeCodec::NewToken() {
        uint64_t hi, lo;
        {
            std::lock_guard<std::mutex> lock(m_RngMutex);
            hi = m_Rng();
            lo = m_Rng();
        }
        hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;   // version 4
        lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // variant 10
        char buf[37];
        std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
            static_cast<unsigned>(hi >> 32),
            static_cast<unsigned>((hi >> 16) & 0xFFFF),
            static_cast<unsigned>(hi & 0xFFFF),
            static_cast<unsigned>(lo >> 48),
            static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
        return buf;
    }

    void PlainEnvelopeCodec::PrepareEnvelope(const std::string& plaintext, const ConversationKey& target,
        PrepareCallback callback)
    {
        if (!target.IsValid()) {
            callback(make_error_code(SyncError::InvalidMessage), {});
            return;
        }
        PreparedEnvelope out;
        out.envelope = Wrap(plaintext);
        out.correlationToken = NewToken();
        out.protocolVersion = kProtocolVersion;
        callback({}, std::move(out));
    }

    void PlainEnvelopeCodec::Decrypt(const std::string& envelope, int /*protocolVersion*/,
        const ConversationKey& /*source*/, DecryptCallback callback)
    {
        auto j = nlohmann::json::parse(envelope, nullptr, false);
        auto codec = j.is_object() ? j.find("codec") : j.end();
        if (!j.is_object() || codec == j.end() || *codec != "plain") {
            callback(make_error_code(SyncError::DecryptError), {});
            return;
        }
        auto body = j.find("body");
        if (body == j.end() || !body->is_string()) {
            callback(make_error_code(SyncError::DecryptError), {});
            return;
        }
        callback({}, body->get<std::string>());
    }

} // namespace Courier
