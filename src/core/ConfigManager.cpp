#include "ConfigManager.h"
#include "Logger.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace Courier {

    using json = nlohmann::json;

    namespace {
        void ReadInt(const json& j, const char* key, int& out) {
            auto it = j.find(key);
            if (it != j.end() && it->is_number_integer()) out = it->get<int>();
        }
        void ReadBool(const json& j, const char* key, bool& out) {
            auto it = j.find(key);
            if (it != j.end() && it->is_boolean()) out = it->get<bool>();
        }
        void ReadString(const json& j, const char* key, std::string& out) {
            auto it = j.find(key);
            if (it != j.end() && it->is_string()) out = it->get<std::string>();
        }
        const json* Section(const json& j, const char* key) {
            auto it = j.find(key);
            return (it != j.end() && it->is_object()) ? &*it : nullptr;
        }

        bool ReadFile(const std::string& path, std::string& out) {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open()) return false;
            std::stringstream buffer;
            buffer << file.rdbuf();
            out = buffer.str();
            return true;
        }
    }

    std::string ConfigManager::GetConfigDirectory() const {
        if (const char* home = std::getenv("COURIER_HOME"); home && *home)
            return home;
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
            return std::string(xdg) + "/" + Globals::APP_NAME;
        if (const char* userHome = std::getenv("HOME"); userHome && *userHome)
            return std::string(userHome) + "/.config/" + Globals::APP_NAME;
        return std::string(".") + "/" + Globals::APP_NAME;
    }

    bool ConfigManager::EnsureConfigDirectory() const {
        std::error_code ec;
        std::filesystem::create_directories(GetConfigDirectory(), ec);
        if (ec) LOG_ERROR("Cannot create config directory " + GetConfigDirectory() + ": " + ec.message());
        return !ec;
    }

    SyncConfig ConfigManager::DefaultSyncConfig() const {
        SyncConfig cfg;
        const std::string dir = GetConfigDirectory();
        cfg.cachePath = dir + "/courier_cache.db";
        cfg.logFile = dir + "/courier.log";
        return cfg;
    }

    SyncConfig ConfigManager::ParseSyncConfig(const std::string& text, SyncConfig cfg) {
        json j = json::parse(text, nullptr, false);
        if (!j.is_object()) {
            LOG_ERROR("Config is not a JSON object; using defaults");
            return cfg;
        }

        if (const json* server = Section(j, "server")) {
            ReadString(*server, "host", cfg.host);
            ReadInt(*server, "port", cfg.port);
        }
        ReadInt(j, "connect_timeout_ms", cfg.connectTimeoutMs);
        ReadInt(j, "reconnect_delay_min_ms", cfg.reconnectDelayMinMs);
        ReadInt(j, "reconnect_delay_max_ms", cfg.reconnectDelayMaxMs);
        ReadInt(j, "pending_timeout_ms", cfg.pendingTimeoutMs);
        ReadInt(j, "history_page_size", cfg.historyPageSize);
        ReadInt(j, "typing_expiry_ms", cfg.typingExpiryMs);
        ReadInt(j, "typing_resend_ms", cfg.typingResendMs);
        ReadInt(j, "max_message_length", cfg.maxMessageLength);
        ReadBool(j, "send_delivery_receipts", cfg.sendDeliveryReceipts);

        if (const json* cache = Section(j, "cache")) {
            ReadBool(*cache, "enabled", cfg.cacheEnabled);
            ReadString(*cache, "path", cfg.cachePath);
            ReadInt(*cache, "keep_last", cfg.cacheKeepLast);
        }
        if (const json* log = Section(j, "log")) {
            ReadString(*log, "file", cfg.logFile);
            ReadBool(*log, "console", cfg.logConsole);
            ReadString(*log, "level", cfg.logLevel);
        }

        if (cfg.reconnectDelayMaxMs < cfg.reconnectDelayMinMs) cfg.reconnectDelayMaxMs = cfg.reconnectDelayMinMs;
        if (cfg.historyPageSize <= 0) cfg.historyPageSize = Globals::HISTORY_PAGE_SIZE;
        return cfg;
    }

    std::string ConfigManager::SerializeSyncConfig(const SyncConfig& cfg) {
        json j;
        j["server"] = { {"host", cfg.host}, {"port", cfg.port} };
        j["connect_timeout_ms"] = cfg.connectTimeoutMs;
        j["reconnect_delay_min_ms"] = cfg.reconnectDelayMinMs;
        j["reconnect_delay_max_ms"] = cfg.reconnectDelayMaxMs;
        j["pending_timeout_ms"] = cfg.pendingTimeoutMs;
        j["history_page_size"] = cfg.historyPageSize;
        j["typing_expiry_ms"] = cfg.typingExpiryMs;
        j["typing_resend_ms"] = cfg.typingResendMs;
        j["max_message_length"] = cfg.maxMessageLength;
        j["send_delivery_receipts"] = cfg.sendDeliveryReceipts;
        j["cache"] = { {"enabled", cfg.cacheEnabled}, {"path", cfg.cachePath}, {"keep_last", cfg.cacheKeepLast} };
        j["log"] = { {"file", cfg.logFile}, {"console", cfg.logConsole}, {"level", cfg.logLevel} };
        return j.dump(2);
    }

    SyncConfig ConfigManager::LoadSyncConfig(const std::string& path) const {
        const std::string file = path.empty() ? GetConfigPath() : path;
        std::string text;
        if (!ReadFile(file, text)) {
            if (!path.empty()) LOG_ERROR("Cannot read config " + file + "; using defaults");
            return DefaultSyncConfig();
        }
        return ParseSyncConfig(text, DefaultSyncConfig());
    }

    bool ConfigManager::SaveSyncConfig(const SyncConfig& cfg, const std::string& path) const {
        if (path.empty() && !EnsureConfigDirectory()) return false;
        std::ofstream f(path.empty() ? GetConfigPath() : path, std::ios::trunc);
        if (!f.is_open()) return false;
        f << SerializeSyncConfig(cfg);
        return f.good();
    }

    std::optional<Credential> ConfigManager::LoadSession() const {
        std::string text;
        if (!ReadFile(GetSessionPath(), text)) return std::nullopt;
        json j = json::parse(text, nullptr, false);
        if (!j.is_object()) {
            LOG_WARN("session.json is corrupt; ignoring");
            return std::nullopt;
        }
        Credential cred;
        ReadString(j, "user", cred.user);
        ReadString(j, "token", cred.token);
        if (!cred.IsValid()) return std::nullopt;
        return cred;
    }

    bool ConfigManager::SaveSession(const Credential& credential) const {
        if (!EnsureConfigDirectory()) return false;
        std::ofstream f(GetSessionPath(), std::ios::binary | std::ios::trunc);
        if (!f.is_open()) return false;
        f << json{ {"user", credential.user}, {"token", credential.token} }.dump();
        f.close();
        std::error_code ec;
        std::filesystem::permissions(GetSessionPath(),
            std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
            std::filesystem::perm_options::replace, ec);
        if (ec) LOG_WARN("Could not restrict session file permissions: " + ec.message());
        return true;
    }

    void ConfigManager::ClearSession() const {
        std::error_code ec;
        std::filesystem::remove(GetSessionPath(), ec);
    }

    std::optional<Credential> ConfigSessionStore::CurrentCredential() {
        return ConfigManager::Get().LoadSession();
    }

    void ConfigSessionStore::OnAuthenticationFailed(const Credential& credential, const std::string& reason) {
        LOG_WARN("Session for '" + credential.user + "' rejected: " + reason);
        ConfigManager::Get().ClearSession();
    }

} // namespace Courier
