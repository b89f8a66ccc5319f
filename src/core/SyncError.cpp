#include "SyncError.h"

namespace Courier {

    namespace {
        class SyncErrorCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "courier.sync"; }

            std::string message(int ev) const override {
                return ToString(static_cast<SyncError>(ev));
            }
        };
    }

    const std::error_category& SyncCategory() noexcept {
        static SyncErrorCategory instance;
        return instance;
    }

    const char* ToString(SyncError e) noexcept {
        switch (e) {
            case SyncError::None:                return "success";
            case SyncError::ConnectTimeout:      return "connection timeout";
            case SyncError::AuthenticationError: return "authentication rejected";
            case SyncError::TransportError:      return "transport error";
            case SyncError::NotConnected:        return "not connected";
            case SyncError::SendFailed:          return "send failed";
            case SyncError::DecryptError:        return "decrypt failed";
            case SyncError::InvalidMessage:      return "invalid message";
            case SyncError::Shutdown:            return "operation aborted";
        }
        return "unknown";
    }

} // namespace Courier
