#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace tiercache::domain {

/**
 * @brief Носитель отмены и дедлайна для операций кэша
 *
 * Копии разделяют одно состояние: cancel() на любой копии
 * виден всем остальным.
 *
 * Кэш сам ничего не прерывает, контекст передаётся дальше
 * в IRemoteStore и в producer.
 *
 * Контекст по умолчанию (background) отменить нельзя.
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context() = default;

    static Context background() {
        return Context();
    }

    static Context cancellable() {
        return Context(std::make_shared<State>());
    }

    static Context withDeadline(Clock::time_point deadline) {
        auto state = std::make_shared<State>();
        state->deadline = deadline;
        return Context(std::move(state));
    }

    static Context withTimeout(Clock::duration timeout) {
        return withDeadline(Clock::now() + timeout);
    }

    /**
     * @brief Отменить контекст (для background ничего не делает)
     */
    void cancel() const {
        if (state_) {
            state_->cancelled.store(true);
        }
    }

    bool isCancelled() const {
        if (!state_) {
            return false;
        }
        if (state_->cancelled.load()) {
            return true;
        }
        return state_->deadline && Clock::now() >= *state_->deadline;
    }

    std::optional<Clock::time_point> deadline() const {
        if (!state_) {
            return std::nullopt;
        }
        return state_->deadline;
    }

    bool isBackground() const { return !state_; }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
    };

    explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

} // namespace tiercache::domain
