#pragma once
#include <cstdint>

namespace Courier {
    namespace Globals {
        constexpr const char* APP_NAME = "courier";
        constexpr const char* DEFAULT_HOST = "127.0.0.1";
        constexpr uint16_t DEFAULT_PORT = 5555;

        // Connection lifecycle
        constexpr int CONNECT_TIMEOUT_MS = 10000;
        constexpr int RECONNECT_DELAY_MIN_MS = 1000;
        constexpr int RECONNECT_DELAY_MAX_MS = 5000;

        // Outbound
        constexpr int PENDING_TIMEOUT_MS = 30000;
        constexpr int MAX_MESSAGE_LEN = 4096;

        // History / presence
        constexpr int HISTORY_PAGE_SIZE = 50;
        constexpr int TYPING_EXPIRY_MS = 6000;
        constexpr int TYPING_RESEND_MS = 3000;

        // Local cache
        constexpr int CACHE_KEEP_LAST = 2000;

        // Wire
        constexpr uint32_t MAX_FRAME_SIZE = 10u * 1024u * 1024u;
    }
}
