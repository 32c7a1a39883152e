#pragma once

#include "common/event_bus.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Forwards terminal run events to an HTTP endpoint. Delivery happens on a
// dedicated thread so a slow endpoint never holds up the publisher.
class WebhookNotifier {
public:
    static constexpr size_t kMaxQueued = 32;

    WebhookNotifier(std::string url, std::shared_ptr<EventBus> events);
    ~WebhookNotifier();

    WebhookNotifier(const WebhookNotifier&) = delete;
    WebhookNotifier& operator=(const WebhookNotifier&) = delete;

    // Drains the queue and stops the delivery thread
    void shutdown();

    size_t droppedCount() const { return dropped_.load(); }

    static bool isForwarded(const std::string& eventName);
    static nlohmann::json buildPayload(const Event& event, const std::string& host);

private:
    void enqueue(const Event& event);
    void deliveryLoop();
    bool post(const std::string& body);

    std::string url_;
    std::string host_;
    std::shared_ptr<EventBus> events_;
    int subscription_{-1};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    bool stopping_{false};
    std::atomic<size_t> dropped_{0};
    std::thread worker_;
};
