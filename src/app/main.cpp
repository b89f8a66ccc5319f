#include "SyncClient.h"
#include "../core/ConfigManager.h"
#include "../core/Logger.h"
#include "../crypto/PlainEnvelopeCodec.h"
#include "../network/NetworkClient.h"
#include <asio.hpp>
#include <cstring>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace Courier;

namespace {
    void PrintUsage() {
        std::cout <<
            "usage: courier_client [--config <path>] [--user <name> --token <token>]\n"
            "commands:\n"
            "  /open channel:<id> | /open dm:<id>\n"
            "  /older\n"
            "  /retry <token>\n"
            "  /quit\n"
            "  anything else is sent to the open conversation\n";
    }

    void PrintMessage(const Message& m) {
        std::cout << "[" << ToString(m.status) << "] "
            << (m.senderUsername.empty() ? m.senderId : m.senderUsername) << ": " << m.content;
        if (m.status == MessageStatus::Failed)
            std::cout << "  (" << m.failureReason << ", /retry " << m.correlationToken << ")";
        std::cout << "\n";
    }

    class Console {
    public:
        explicit Console(SyncClient& client) : m_Client(client) {}

        // Runs on the event loop.
        bool Handle(const std::string& line) {
            if (line.empty()) return true;
            if (line == "/quit") return false;
            if (line.rfind("/open ", 0) == 0) {
                auto key = ConversationKey::Parse(line.substr(6));
                if (!key) { std::cout << "bad conversation key\n"; return true; }
                if (m_Open) m_Client.CloseConversation(*m_Open);
                m_Open = key;
                m_Client.OpenConversation(*key);
                for (const auto& m : m_Client.Store().Timeline(*key)) PrintMessage(m);
                return true;
            }
            if (!m_Open) { std::cout << "open a conversation first\n"; return true; }
            if (line == "/older") {
                m_Client.LoadOlder(*m_Open, [](std::error_code ec, size_t fetched) {
                    if (ec) std::cout << "history failed: " << ec.message() << "\n";
                    else std::cout << "fetched " << fetched << " older messages\n";
                });
                return true;
            }
            if (line.rfind("/retry ", 0) == 0) {
                m_Client.Resend(line.substr(7), [](std::error_code ec, const std::string& token) {
                    if (ec) std::cout << "retry failed: " << ec.message() << "\n";
                    else std::cout << "resent as " << token << "\n";
                });
                return true;
            }
            m_Client.Send(*m_Open, line, {}, [](std::error_code ec, const std::string&) {
                if (ec) std::cout << "send failed: " << ec.message() << "\n";
            });
            return true;
        }

        void OnChanged(const ConversationKey& key) {
            if (!m_Open || key != *m_Open) return;
            auto timeline = m_Client.Store().Timeline(key);
            if (!timeline.empty()) PrintMessage(timeline.back());
        }

    private:
        SyncClient& m_Client;
        std::optional<ConversationKey> m_Open;
    };
}

int main(int argc, char** argv) {
    std::string configPath;
    Credential cli;
    for (int i = 1; i < argc; ++i) {
        if (!std::strcmp(argv[i], "--config") && i + 1 < argc) configPath = argv[++i];
        else if (!std::strcmp(argv[i], "--user") && i + 1 < argc) cli.user = argv[++i];
        else if (!std::strcmp(argv[i], "--token") && i + 1 < argc) cli.token = argv[++i];
        else { PrintUsage(); return 2; }
    }

    ConfigManager& config = ConfigManager::Get();
    const SyncConfig cfg = config.LoadSyncConfig(configPath);

    Logger& log = Logger::Instance();
    if (!log.Initialize(cfg.logFile))
        std::cerr << "cannot open log file " << cfg.logFile << "\n";
    log.SetConsoleMirror(cfg.logConsole);
    log.SetLevel(ParseLogLevel(cfg.logLevel));
    LOG_INFO("courier_client starting");
    LOG_WARN("PlainEnvelopeCodec in use: messages are NOT encrypted");

    if (cli.IsValid()) config.SaveSession(cli);
    std::optional<Credential> credential = cli.IsValid() ? std::optional<Credential>(cli) : config.LoadSession();
    if (!credential) {
        std::cerr << "no session: pass --user <name> --token <token>\n";
        return 1;
    }

    asio::io_context ctx;
    auto work = asio::make_work_guard(ctx);
    NetworkClient transport(ctx);
    PlainEnvelopeCodec crypto;
    ConfigSessionStore sessions;
    SyncClient client(ctx, transport, crypto, &sessions, cfg);
    Console console(client);

    client.Init();
    client.OnConversationChanged([&console](const ConversationKey& key) { console.OnChanged(key); });
    client.OnConnectivityChanged([](bool up) { std::cout << (up ? "* online\n" : "* offline, reconnecting\n"); });
    client.Connect(*credential, [&client](std::error_code ec) {
        if (ec) std::cout << "connect failed: " << ec.message() << "\n";
        else std::cout << "connected as " << client.Connection().Identity().username << "\n";
    });

    std::thread input([&ctx, &console, &client, &work] {
        std::string line;
        while (std::getline(std::cin, line)) {
            bool keepGoing = true;
            std::promise<void> done;
            asio::post(ctx, [&] { keepGoing = console.Handle(line); done.set_value(); });
            done.get_future().wait();
            if (!keepGoing) break;
        }
        asio::post(ctx, [&client, &work] {
            client.Shutdown();
            work.reset();
        });
    });

    ctx.run();
    input.join();
    LOG_INFO("courier_client exiting");
    log.Shutdown();
    return 0;
}
