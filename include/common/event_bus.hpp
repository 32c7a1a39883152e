#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <string>

struct Event {
    std::string name;
    nlohmann::json payload;
};

using EventCallback = std::function<void(const Event& event)>;

// Synchronous publish/subscribe fan-out with no delivery guarantee.
// Subscribers run on the publishing thread and must return quickly; a
// subscriber that throws is logged and skipped.
class EventBus {
public:
    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    int subscribe(EventCallback callback);
    void unsubscribe(int subscriptionId);
    void publish(const std::string& name, const nlohmann::json& payload);
    size_t subscriberCount() const;

private:
    std::map<int, EventCallback> subscribers_;
    int nextId_{1};
    mutable std::mutex mutex_;
};
