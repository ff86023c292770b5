#pragma once

#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

#include "Logger.h"

namespace Tessera {

    /**
     * @brief A value with synchronous change notification
     *
     * set() stores the new value and, only if it differs from the previous
     * one, invokes every subscriber on the calling thread before returning.
     * Callbacks run without the internal lock held, so a subscriber may call
     * get() or even set() on the same observable.
     *
     * @code
     * Observable<bool> connected{false};
     * auto id = connected.subscribe([](const bool& up) { ... });
     * connected.set(true);      // callback runs here
     * connected.unsubscribe(id);
     * @endcode
     */
    template <typename T>
    class Observable {
    public:
        using Callback = std::function<void(const T&)>;
        using SubscriptionId = int;

        Observable() = default;
        explicit Observable(T initial) : value_(std::move(initial)) {}

        Observable(const Observable&) = delete;
        Observable& operator=(const Observable&) = delete;

        T get() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return value_;
        }

        /**
         * @brief Replace the value
         * @return true if the value changed and subscribers were notified
         */
        bool set(const T& value) {
            std::map<SubscriptionId, Callback> targets;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (value_ == value) {
                    return false;
                }
                value_ = value;
                targets = subscribers_;
            }

            for (auto& [id, callback] : targets) {
                try {
                    callback(value);
                } catch (const std::exception& e) {
                    Logger::instance().error("Observer " + std::to_string(id) + " threw: " + e.what(), "Observable");
                }
            }
            return true;
        }

        SubscriptionId subscribe(Callback callback) {
            std::lock_guard<std::mutex> lock(mutex_);
            SubscriptionId id = nextId_++;
            subscribers_.emplace(id, std::move(callback));
            return id;
        }

        void unsubscribe(SubscriptionId id) {
            std::lock_guard<std::mutex> lock(mutex_);
            subscribers_.erase(id);
        }

    private:
        mutable std::mutex mutex_;
        T value_{};
        std::map<SubscriptionId, Callback> subscribers_;
        SubscriptionId nextId_ = 1;
    };

}
