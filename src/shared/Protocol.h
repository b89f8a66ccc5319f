#pragma once
#include <cstdint>
#include <cstring>

namespace Courier {

    namespace detail {
        inline bool IsLittleEndian() noexcept {
            static constexpr uint32_t kOne = 1u;
            uint8_t b;
            std::memcpy(&b, &kOne, 1);
            return b == 1u;
        }
    }

    inline uint32_t Swap32(uint32_t v) noexcept {
        return ((v & 0xFFU) << 24) | ((v & 0xFF00U) << 8)
            | ((v & 0xFF0000U) >> 8) | ((v & 0xFF000000U) >> 24);
    }

    inline uint32_t HostToNet32(uint32_t v) noexcept {
        return detail::IsLittleEndian() ? Swap32(v) : v;
    }
    inline uint32_t NetToHost32(uint32_t v) noexcept { return HostToNet32(v); }

    enum class PacketType : uint8_t {
        // --- SESSION ---
        Authenticate,        // Client -> Server: {"token"}
        Authenticated,       // Server -> Client: {"userId","username"}
        Auth_Error,          // Server -> Client: {"message"}; server closes afterwards

        // --- MESSAGES ---
        Message_Send,        // Client -> Server: encrypted payload + clientNonce
        Message_Received,    // Server -> Client: encrypted message push (may be our own echo)
        Message_Ack,         // Server -> Client: {"clientNonce","messageId","status"}
        Message_Error,       // Server -> Client: {"clientNonce","error"}
        Receipt_Send,        // Client -> Server: {"messageId","status"}

        // --- ROOMS ---
        Channel_Join,
        Channel_Leave,
        Dm_Join,
        Dm_Leave,

        // --- PRESENCE ---
        Typing_Start,        // both directions
        Typing_Stop,         // both directions
        Presence_Update,     // Server -> Client: {"userId","status"}

        // --- HISTORY ---
        History_Request,     // Client -> Server: {"requestId","channelId"|"conversationId","limit","before"}
        History_Response,    // Server -> Client: {"requestId","messages":[...]}

        // --- DIAGNOSTIC ---
        Ping,
        Pong
    };

    constexpr bool IsKnownPacketType(uint8_t raw) noexcept {
        return raw <= static_cast<uint8_t>(PacketType::Pong);
    }

#pragma pack(push, 1)
    struct PacketHeader {
        PacketType type;
        uint32_t   size;

        void ToNetwork() { size = HostToNet32(size); }
        void ToHost() { size = NetToHost32(size); }
    };
#pragma pack(pop)

    static_assert(sizeof(PacketHeader) == 5, "PacketHeader must be packed");

} // namespace Courier
