#pragma once

#include "ShortenerError.hpp"

namespace shortener::domain {

/**
 * @brief Истёк дедлайн запроса
 */
class DeadlineExceededError : public ShortenerError {
public:
    explicit DeadlineExceededError(const std::string& operation)
        : ShortenerError("Deadline exceeded: " + operation) {}
};

} // namespace shortener::domain
