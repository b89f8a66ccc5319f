#include "NetworkClient.h"
#include "../core/Globals.h"
#include "../core/Logger.h"
#include "../core/SyncError.h"
#include <asio.hpp>
#include <array>
#include <deque>
#include <memory>
#include <vector>

namespace Courier {

    struct NetworkClient::Impl {
        explicit Impl(asio::io_context& ctx) : m_Context(ctx), m_Socket(ctx), m_Resolver(ctx) {}
        asio::io_context&         m_Context;
        asio::ip::tcp::socket     m_Socket;
        asio::ip::tcp::resolver   m_Resolver;
        bool                      m_IsOpen = false;
        // Bumped on every Open/Close; completions from an older generation are ignored.
        uint64_t                  m_Generation = 0;
        PacketHeader              m_InHeader{};
        std::vector<uint8_t>      m_InBody;
        struct OutPacket {
            PacketHeader         header;
            std::vector<uint8_t> body;
        };
        std::deque<std::shared_ptr<OutPacket>> m_WriteQueue;
        NetworkClient* m_Owner = nullptr;
    };

    NetworkClient::NetworkClient(asio::io_context& context)
        : m_Impl(std::make_shared<Impl>(context))
    {
        m_Impl->m_Owner = this;
    }

    NetworkClient::~NetworkClient() {
        Close();
        m_Impl->m_Owner = nullptr;
    }

    void NetworkClient::Open(const std::string& host, int port) {
        Close();
        auto impl = m_Impl;
        const uint64_t gen = ++impl->m_Generation;
        impl->m_Socket = asio::ip::tcp::socket(impl->m_Context);
        impl->m_WriteQueue.clear();

        LOG_NETWORK("Resolving " + host + ":" + std::to_string(port));
        impl->m_Resolver.async_resolve(host, std::to_string(port),
            [impl, gen](std::error_code ec, asio::ip::tcp::resolver::results_type results) {
                if (gen != impl->m_Generation || !impl->m_Owner) return;
                if (ec) {
                    LOG_ERROR("Resolve failed: " + ec.message());
                    impl->m_Owner->NotifyOpened(ec);
                    return;
                }
                asio::async_connect(impl->m_Socket, results,
                    [impl, gen](std::error_code ec, const asio::ip::tcp::endpoint&) {
                        if (gen != impl->m_Generation || !impl->m_Owner) return;
                        if (ec) {
                            LOG_ERROR("Connect failed: " + ec.message());
                            impl->m_Owner->NotifyOpened(ec);
                            return;
                        }
                        std::error_code opt;
                        impl->m_Socket.set_option(asio::ip::tcp::no_delay(true), opt);
                        impl->m_IsOpen = true;
                        NetworkClient* owner = impl->m_Owner;
                        owner->ReadHeader();
                        owner->NotifyOpened({});
                    });
            });
    }

    // Remote close or I/O error. Runs inside completion handlers.
    void NetworkClient::CloseSocket(std::error_code reason) {
        if (!m_Impl->m_IsOpen) return;
        ++m_Impl->m_Generation;
        m_Impl->m_IsOpen = false;
        std::error_code ec;
        m_Impl->m_Socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        m_Impl->m_Socket.close(ec);
        m_Impl->m_WriteQueue.clear();
        LOG_NETWORK("Transport closed: " + reason.message());
        NotifyClosed(reason);
    }

    void NetworkClient::Close() {
        ++m_Impl->m_Generation;
        m_Impl->m_IsOpen = false;
        m_Impl->m_Resolver.cancel();
        std::error_code ec;
        if (m_Impl->m_Socket.is_open()) {
            m_Impl->m_Socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            m_Impl->m_Socket.close(ec);
        }
        m_Impl->m_WriteQueue.clear();
    }

    bool NetworkClient::IsOpen() const {
        return m_Impl->m_IsOpen;
    }

    bool NetworkClient::Send(PacketType type, const std::string& body) {
        if (!IsOpen()) return false;
        auto pkt = std::make_shared<Impl::OutPacket>();
        pkt->header = { type, static_cast<uint32_t>(body.size()) };
        pkt->header.ToNetwork();
        pkt->body.assign(
            reinterpret_cast<const uint8_t*>(body.data()),
            reinterpret_cast<const uint8_t*>(body.data()) + body.size());

        auto impl = m_Impl;
        const bool writeInProgress = !impl->m_WriteQueue.empty();
        impl->m_WriteQueue.push_back(pkt);
        if (writeInProgress) return true;

        // Serialized writer: one async_write in flight, the rest queue behind it.
        struct Writer {
            static void Next(const std::shared_ptr<Impl>& impl, uint64_t gen) {
                if (impl->m_WriteQueue.empty()) return;
                auto front = impl->m_WriteQueue.front();
                std::array<asio::const_buffer, 2> bufs = {
                    asio::buffer(&front->header, sizeof(front->header)),
                    asio::buffer(front->body)
                };
                asio::async_write(impl->m_Socket, bufs,
                    [impl, gen, front](std::error_code ec, std::size_t) {
                        if (gen != impl->m_Generation || !impl->m_Owner) return;
                        if (ec) {
                            impl->m_Owner->CloseSocket(ec);
                            return;
                        }
                        impl->m_WriteQueue.pop_front();
                        Next(impl, gen);
                    });
            }
        };
        Writer::Next(impl, impl->m_Generation);
        return true;
    }

    void NetworkClient::ReadHeader() {
        auto impl = m_Impl;
        const uint64_t gen = impl->m_Generation;
        asio::async_read(impl->m_Socket,
            asio::buffer(&impl->m_InHeader, sizeof(PacketHeader)),
            [impl, gen](std::error_code ec, std::size_t) {
                if (gen != impl->m_Generation || !impl->m_Owner) return;
                NetworkClient* self = impl->m_Owner;
                if (ec) { self->CloseSocket(ec); return; }
                impl->m_InHeader.ToHost();
                if (impl->m_InHeader.size > Globals::MAX_FRAME_SIZE) {
                    LOG_ERROR("Frame of " + std::to_string(impl->m_InHeader.size) + " bytes exceeds limit");
                    self->CloseSocket(make_error_code(SyncError::TransportError));
                    return;
                }
                impl->m_InBody.resize(impl->m_InHeader.size);
                self->ReadBody();
            });
    }

    void NetworkClient::ReadBody() {
        auto impl = m_Impl;
        const uint64_t gen = impl->m_Generation;
        asio::async_read(impl->m_Socket,
            asio::buffer(impl->m_InBody),
            [impl, gen](std::error_code ec, std::size_t) {
                if (gen != impl->m_Generation || !impl->m_Owner) return;
                NetworkClient* self = impl->m_Owner;
                if (ec) { self->CloseSocket(ec); return; }

                const auto rawType = static_cast<uint8_t>(impl->m_InHeader.type);
                if (!IsKnownPacketType(rawType)) {
                    LOG_WARN("Dropping frame with unknown type " + std::to_string(rawType));
                } else {
                    std::string body(impl->m_InBody.begin(), impl->m_InBody.end());
                    self->NotifyFrame(impl->m_InHeader.type, body);
                }

                // The frame handler may have closed or reopened the transport.
                if (gen != impl->m_Generation || !impl->m_Owner) return;
                self->ReadHeader();
            });
    }

} // namespace Courier
