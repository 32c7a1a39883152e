#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <thread>
#include <type_traits>

// Thread helpers shared by the manager and the CLI
class ThreadUtils {
public:
    static void sleepFor(std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    }

    // Always runs func on a new thread
    template<typename Func, typename... Args>
    static std::future<typename std::result_of<Func(Args...)>::type>
    async(Func&& func, Args&&... args) {
        return std::async(std::launch::async,
                          std::forward<Func>(func),
                          std::forward<Args>(args)...);
    }

    // A future that is already satisfied with value
    template<typename T>
    static std::future<T> ready(T value) {
        std::promise<T> promise;
        promise.set_value(std::move(value));
        return promise.get_future();
    }

    // Polls pred until it holds or timeout expires
    static bool waitUntil(const std::function<bool()>& pred,
                          std::chrono::milliseconds timeout,
                          std::chrono::milliseconds interval = std::chrono::milliseconds(10)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            sleepFor(interval);
        }
        return true;
    }
};
