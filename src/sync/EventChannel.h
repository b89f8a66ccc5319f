#pragma once
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace Courier {

    using SubscriptionId = uint64_t;

    // One typed channel per event kind. Handlers run synchronously on the
    // publishing thread (the event loop) in subscription order.
    template <typename Event>
    class EventChannel {
    public:
        using Handler = std::function<void(const Event&)>;

        SubscriptionId Subscribe(Handler handler) {
            const SubscriptionId id = ++m_NextId;
            m_Handlers.emplace_back(id, std::move(handler));
            return id;
        }

        void Unsubscribe(SubscriptionId id) {
            for (auto it = m_Handlers.begin(); it != m_Handlers.end(); ++it) {
                if (it->first == id) { m_Handlers.erase(it); return; }
            }
        }

        void Publish(const Event& event) const {
            // Snapshot: a handler may subscribe or unsubscribe while we iterate.
            const auto handlers = m_Handlers;
            for (const auto& [id, handler] : handlers) {
                if (handler) handler(event);
            }
        }

        void Clear() { m_Handlers.clear(); }
        size_t Size() const { return m_Handlers.size(); }

    private:
        std::vector<std::pair<SubscriptionId, Handler>> m_Handlers;
        SubscriptionId m_NextId = 0;
    };

} // namespace Courier
