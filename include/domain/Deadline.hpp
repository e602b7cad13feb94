#pragma once

#include "domain/exceptions/DeadlineExceededError.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace shortener::domain {

/**
 * @brief Дедлайн запроса
 *
 * Передаётся вызывающей стороной в каждую операцию ядра и хранилища.
 * Пустой дедлайн (unbounded) не ограничивает время выполнения.
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    Deadline() = default;

    static Deadline unbounded() { return Deadline(); }

    /**
     * @brief Дедлайн через timeout от текущего момента
     * @param timeout Таймаут; 0 означает отсутствие ограничения
     */
    static Deadline after(std::chrono::milliseconds timeout) {
        if (timeout.count() <= 0) {
            return Deadline();
        }
        return Deadline(Clock::now() + timeout);
    }

    bool isBounded() const { return at_.has_value(); }

    bool expired() const {
        return at_ && Clock::now() >= *at_;
    }

    /**
     * @brief Оставшееся время (0, если дедлайн истёк)
     *
     * Для unbounded дедлайна возвращает milliseconds::max().
     */
    std::chrono::milliseconds remaining() const {
        if (!at_) {
            return std::chrono::milliseconds::max();
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*at_ - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    /**
     * @brief Бросает DeadlineExceededError, если дедлайн истёк
     * @param operation Имя операции для сообщения об ошибке
     */
    void ensureNotExpired(const std::string& operation) const {
        if (expired()) {
            throw DeadlineExceededError(operation);
        }
    }

private:
    explicit Deadline(Clock::time_point at) : at_(at) {}

    std::optional<Clock::time_point> at_;
};

} // namespace shortener::domain
