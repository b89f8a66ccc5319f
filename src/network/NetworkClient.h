#pragma once

#include <string>
#include <memory>
#include "Transport.h"

namespace asio { class io_context; }

namespace Courier {

    // TCP transport on a caller-owned io_context. No threads of its own: every
    // completion runs wherever the context is run.
    class NetworkClient : public Transport {
    public:
        explicit NetworkClient(asio::io_context& context);
        ~NetworkClient() override;

        void Open(const std::string& host, int port) override;
        void Close() override;
        bool IsOpen() const override;
        bool Send(PacketType type, const std::string& body) override;

    private:
        struct Impl;
        std::shared_ptr<Impl> m_Impl;

        void ReadHeader();
        void ReadBody();
        void CloseSocket(std::error_code reason);
    };

} // namespace Courier
