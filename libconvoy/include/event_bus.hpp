/**
 * @file event_bus.hpp
 * @brief In-process publish/subscribe bus used by the coordinator.
 */

#ifndef CONVOY_EVENT_BUS_HPP
#define CONVOY_EVENT_BUS_HPP

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace convoy {

    /**
     * @brief Type-keyed publish/subscribe bus.
     *
     * @details The coordinator publishes every job event it decodes, the
     * front end subscribes to the types it renders. Handlers run on the
     * publishing thread, under the bus mutex, so they must not publish
     * or subscribe themselves.
     */
    class EventBus {
    public:
        EventBus() = default;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., JobCompletedEvent).
         * @param handler Function invoked with a const reference to each event.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            handlers_[std::type_index(typeid(Event))].push_back(
                [h = std::move(handler)](const void* e) {
                    h(*static_cast<const Event*>(e));
                });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::lock_guard lock(mtx_);
            const auto it = handlers_.find(std::type_index(typeid(Event)));
            if (it == handlers_.end()) return;
            for (const auto& fn : it->second) {
                fn(&event);
            }
        }

    private:
        using Handler = std::function<void(const void*)>;
        ///< Handlers per event type
        std::unordered_map<std::type_index, std::vector<Handler>> handlers_;
        std::mutex mtx_;
    };

} // namespace convoy

#endif // CONVOY_EVENT_BUS_HPP
