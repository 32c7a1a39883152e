#include "common/event_bus.hpp"
#include "common/logger.hpp"
#include <vector>

int EventBus::subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    int id = nextId_++;
    subscribers_[id] = std::move(callback);
    return id;
}

void EventBus::unsubscribe(int subscriptionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(subscriptionId);
}

void EventBus::publish(const std::string& name, const nlohmann::json& payload) {
    // Copy the callbacks so a subscriber may unsubscribe from inside its callback
    std::vector<EventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.reserve(subscribers_.size());
        for (const auto& pair : subscribers_) {
            callbacks.push_back(pair.second);
        }
    }

    Event event{name, payload};
    for (const auto& callback : callbacks) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            Logger::warning("Event subscriber failed on '" + name + "': " + e.what());
        }
    }
}

size_t EventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}
