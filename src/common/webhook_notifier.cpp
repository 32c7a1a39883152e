#include "common/webhook_notifier.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <curl/curl.h>

using json = nlohmann::json;

namespace {

size_t discardCallback(void* /*contents*/, size_t size, size_t nmemb, void* /*userp*/) {
    return size * nmemb;
}

} // namespace

WebhookNotifier::WebhookNotifier(std::string url, std::shared_ptr<EventBus> events)
    : url_(std::move(url))
    , host_(utils::hostname())
    , events_(std::move(events)) {
    curl_global_init(CURL_GLOBAL_ALL);
    worker_ = std::thread(&WebhookNotifier::deliveryLoop, this);
    subscription_ = events_->subscribe([this](const Event& event) {
        if (isForwarded(event.name)) {
            enqueue(event);
        }
    });
    Logger::info("Webhook notifications enabled: " + url_);
}

WebhookNotifier::~WebhookNotifier() {
    shutdown();
    curl_global_cleanup();
}

bool WebhookNotifier::isForwarded(const std::string& eventName) {
    return eventName == "complete" || eventName == "error" || eventName == "cancelled";
}

json WebhookNotifier::buildPayload(const Event& event, const std::string& host) {
    return {
        {"event", "backup:" + event.name},
        {"host", host},
        {"data", event.payload}
    };
}

void WebhookNotifier::shutdown() {
    if (subscription_ >= 0) {
        events_->unsubscribe(subscription_);
        subscription_ = -1;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void WebhookNotifier::enqueue(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        if (queue_.size() >= kMaxQueued) {
            dropped_++;
            Logger::warning("Webhook queue full, dropping event: " + event.name);
            return;
        }
        queue_.push_back(buildPayload(event, host_).dump(-1, ' ', false, json::error_handler_t::replace));
    }
    cv_.notify_one();
}

void WebhookNotifier::deliveryLoop() {
    while (true) {
        std::string body;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            body = std::move(queue_.front());
            queue_.pop_front();
        }
        post(body);
    }
}

bool WebhookNotifier::post(const std::string& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        Logger::error("Failed to initialize CURL for webhook");
        return false;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardCallback);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        Logger::error("Webhook delivery failed: " + std::string(curl_easy_strerror(res)));
        return false;
    }
    if (httpCode < 200 || httpCode >= 300) {
        Logger::error("Webhook endpoint returned HTTP " + std::to_string(httpCode));
        return false;
    }
    Logger::debug("Webhook delivered");
    return true;
}
