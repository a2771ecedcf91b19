/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel between the pipeline and its front-ends.
 */

#ifndef NICLEAN_EVENT_BUS_HPP
#define NICLEAN_EVENT_BUS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace niclean {

    /**
     * @brief Simple type-safe publish/subscribe event bus.
     *
     * @details BatchOrchestrator publishes the events declared in events.hpp;
     * the CLI (progress bar, console messages) subscribes to them. Handlers
     * are invoked on the publishing thread, which may be a worker of the
     * copy+strip pool, so they must be thread-safe.
     *
     * The subscriber table is guarded by a mutex. Handlers are called
     * outside the lock, so a handler may itself publish.
     */
    class EventBus {
    public:
        EventBus() = default;

        EventBus(const EventBus&) = delete;
        EventBus& operator=(const EventBus&) = delete;

        /**
         * @brief Subscribe a handler to a specific event type.
         * @tparam Event The event struct type (e.g., FileSanitizedEvent).
         * @param handler Function invoked with a const reference to each event.
         */
        template <typename Event>
        void subscribe(std::function<void(const Event&)> handler) {
            std::lock_guard lock(mtx_);
            auto& vec = subscribers_[std::type_index(typeid(Event))];
            vec.push_back([handler = std::move(handler)](const void* e) {
                handler(*static_cast<const Event*>(e));
            });
        }

        /**
         * @brief Publish an event to all subscribers of its type.
         */
        template <typename Event>
        void publish(const Event& event) {
            std::vector<Callback> callbacks;
            {
                std::lock_guard lock(mtx_);
                const auto it = subscribers_.find(std::type_index(typeid(Event)));
                if (it == subscribers_.end()) {
                    return;
                }
                callbacks = it->second;
            }
            for (const auto& fn : callbacks) {
                fn(&event);
            }
        }

        /// @return Number of handlers registered for Event.
        template <typename Event>
        [[nodiscard]] std::size_t subscriber_count() const {
            std::lock_guard lock(mtx_);
            const auto it = subscribers_.find(std::type_index(typeid(Event)));
            return it == subscribers_.end() ? 0 : it->second.size();
        }

    private:
        using Callback = std::function<void(const void*)>;
        std::unordered_map<std::type_index, std::vector<Callback>> subscribers_;
        mutable std::mutex mtx_;
    };

} // namespace niclean

#endif // NICLEAN_EVENT_BUS_HPP
