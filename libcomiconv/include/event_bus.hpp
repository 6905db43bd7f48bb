/**
 * @file event_bus.hpp
 * @brief Defines a simple, thread-safe publish/subscribe event bus.
 */

#ifndef COMICONV_EVENT_BUS_HPP
#define COMICONV_EVENT_BUS_HPP

#include <functional>
#include <unordered_map>
#include <typeindex>
#include <vector>
#include <mutex>

namespace comiconv {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details Producers (ArchiveOrchestrator, RemoteSession, Converter)
     * broadcast progress without knowing who is listening; consumers (the
     * CLI progress bar, the public observer bridge) subscribe per event type.
     *
     * Worker threads publish concurrently, so subscriptions and publications
     * are protected by a mutex. Handlers run on the publishing thread, outside
     * the lock, and must be thread-safe themselves.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., EntryTranscodedEvent).
         * @param handler Function to invoke when an event of this type is published.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         * @tparam Event The event struct type.
         * @param event The event instance to publish.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::vector<Callback> callbacks;
            {
                std::lock_guard lock(mtx_);
                auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) return;
                callbacks = it->second;
            }
            for (auto& fn : callbacks) {
                fn(&event);
            }
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        std::mutex mtx_;
    };

} // namespace comiconv

#endif // COMICONV_EVENT_BUS_HPP
