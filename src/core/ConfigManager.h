#pragma once
#include <optional>
#include <string>
#include "Globals.h"
#include "SessionStore.h"

namespace Courier {

    struct SyncConfig {
        std::string host = Globals::DEFAULT_HOST;
        int port = Globals::DEFAULT_PORT;

        int connectTimeoutMs = Globals::CONNECT_TIMEOUT_MS;
        int reconnectDelayMinMs = Globals::RECONNECT_DELAY_MIN_MS;
        int reconnectDelayMaxMs = Globals::RECONNECT_DELAY_MAX_MS;
        int pendingTimeoutMs = Globals::PENDING_TIMEOUT_MS;    // 0 disables the watchdog
        int historyPageSize = Globals::HISTORY_PAGE_SIZE;
        int typingExpiryMs = Globals::TYPING_EXPIRY_MS;
        int typingResendMs = Globals::TYPING_RESEND_MS;
        int maxMessageLength = Globals::MAX_MESSAGE_LEN;
        bool sendDeliveryReceipts = true;

        bool cacheEnabled = false;
        std::string cachePath;
        int cacheKeepLast = Globals::CACHE_KEEP_LAST;

        std::string logFile;
        bool logConsole = false;
        std::string logLevel = "info";
    };

    class ConfigManager {
    public:
        static ConfigManager& Get() { static ConfigManager instance; return instance; }

        /// $COURIER_HOME, else $XDG_CONFIG_HOME/courier, else ~/.config/courier.
        std::string GetConfigDirectory() const;
        std::string GetConfigPath() const { return GetConfigDirectory() + "/config.json"; }
        std::string GetSessionPath() const { return GetConfigDirectory() + "/session.json"; }

        /// Defaults with the file locations resolved against the config directory.
        SyncConfig DefaultSyncConfig() const;
        /// Missing or mistyped keys keep their default. An unreadable file yields the defaults.
        SyncConfig LoadSyncConfig(const std::string& path = {}) const;
        bool SaveSyncConfig(const SyncConfig& cfg, const std::string& path = {}) const;
        static SyncConfig ParseSyncConfig(const std::string& text, SyncConfig defaults);
        static std::string SerializeSyncConfig(const SyncConfig& cfg);

        std::optional<Credential> LoadSession() const;
        bool SaveSession(const Credential& credential) const;
        void ClearSession() const;

    private:
        ConfigManager() = default;
        bool EnsureConfigDirectory() const;
    };

    // SessionStore backed by session.json. A rejected credential is removed.
    class ConfigSessionStore : public SessionStore {
    public:
        std::optional<Credential> CurrentCredential() override;
        void OnAuthenticationFailed(const Credential& credential, const std::string& reason) override;
    };

} // namespace Courier
