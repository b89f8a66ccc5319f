#pragma once
#include <string>
#include <system_error>

namespace Courier {

    // Error taxonomy of the synchronization layer. Connection-level transient
    // failures never reach the UI through these; message-level failures are
    // attached to the record (status FAILED) and only mirrored here.
    enum class SyncError {
        None = 0,
        ConnectTimeout,
        AuthenticationError,
        TransportError,
        NotConnected,
        SendFailed,
        DecryptError,
        InvalidMessage,
        Shutdown
    };

    const std::error_category& SyncCategory() noexcept;

    inline std::error_code make_error_code(SyncError e) noexcept {
        return { static_cast<int>(e), SyncCategory() };
    }

    const char* ToString(SyncError e) noexcept;

} // namespace Courier

namespace std {
    template <>
    struct is_error_code_enum<Courier::SyncError> : true_type {};
}
