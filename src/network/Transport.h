#pragma once
#include <functional>
#include <string>
#include <system_error>
#include "../shared/Protocol.h"

namespace Courier {

    // Framed, bidirectional byte pipe to the messaging server. Every handler is
    // invoked on the event loop that owns the transport.
    class Transport {
    public:
        using OpenedHandler = std::function<void(std::error_code)>;
        using FrameHandler = std::function<void(PacketType, const std::string&)>;
        using ClosedHandler = std::function<void(std::error_code)>;

        virtual ~Transport() = default;

        /// Starts the transport handshake; `opened` reports its outcome exactly once.
        virtual void Open(const std::string& host, int port) = 0;
        /// Local close: pending operations are cancelled and `closed` is not reported.
        virtual void Close() = 0;
        virtual bool IsOpen() const = 0;
        /// Returns false when the transport is not open.
        virtual bool Send(PacketType type, const std::string& body) = 0;

        void SetOpenedHandler(OpenedHandler h) { m_OnOpened = std::move(h); }
        void SetFrameHandler(FrameHandler h) { m_OnFrame = std::move(h); }
        void SetClosedHandler(ClosedHandler h) { m_OnClosed = std::move(h); }

    protected:
        void NotifyOpened(std::error_code ec) { if (m_OnOpened) m_OnOpened(ec); }
        void NotifyFrame(PacketType type, const std::string& body) { if (m_OnFrame) m_OnFrame(type, body); }
        void NotifyClosed(std::error_code ec) { if (m_OnClosed) m_OnClosed(ec); }

    private:
        OpenedHandler m_OnOpened;
        FrameHandler m_OnFrame;
        ClosedHandler m_OnClosed;
    };

} // namespace Courier
