/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for decoupled component communication
 *
 * WHY THIS FILE EXISTS:
 * The upload pipeline announces what happened (upload created, file
 * imported, reconcile finished) without knowing who listens. Logging,
 * metrics and owner-change notification subscribe here.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<FileImportedEvent>([](const FileImportedEvent& e) { ... });
 * bus.emit(FileImportedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace nexus::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Multiple threads can emit and subscribe concurrently
 * - Handlers are called synchronously in the emitting thread
 * - A throwing handler is logged and does not stop the others
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Subscription ID for unsubscribing later
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;

        handlers_[type_id].push_back({handler_id, wrapper});
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);

        if (it != handlers_.end()) {
            auto& handler_list = it->second;
            handler_list.erase(
                std::remove_if(handler_list.begin(), handler_list.end(),
                    [handler_id](const auto& pair) {
                        return pair.first == handler_id;
                    }),
                handler_list.end()
            );
        }
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * HOW IT WORKS:
     * 1. Copy the handler list under a shared lock
     * 2. Call each handler without holding the lock, so a handler
     *    may itself subscribe or emit
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto type_id = std::type_index(typeid(EventType));
            auto it = handlers_.find(type_id);

            if (it == handlers_.end()) {
                return;
            }

            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto type_id = std::type_index(typeid(EventType));
        auto it = handlers_.find(type_id);
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            // Only EventType handlers are stored under EventType's key
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace nexus::events
