//
// Created on 19/10/26.
//

/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel between the batch engine and its front-ends.
 */

#ifndef UNMARK_EVENT_BUS_HPP
#define UNMARK_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace unmark {

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details BatchOrchestrator publishes per-item progress (see events.hpp)
     * without knowing who listens; the CLI subscribes to drive its progress
     * line and collect report rows. Handlers run synchronously on the
     * publishing thread, in subscription order.
     */
    class EventBus {
    public:
        EventBus() = default;
        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Register a handler for one event type.
         * @tparam Event Event struct type (e.g. ItemCompleteEvent).
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            subscribers_[std::type_index(typeid(Event))].push_back(
                [handler = std::move(handler)](const void* e) {
                    handler(*static_cast<const Event*>(e));
                });
        }

        /**
         * @brief Deliver an event to every handler subscribed to its type.
         * @tparam Event Event struct type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::vector<Callback> handlers;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                handlers = it->second;
            }
            // handlers may subscribe from inside a callback
            for (const auto& fn : handlers) {
                fn(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace unmark

#endif // UNMARK_EVENT_BUS_HPP
