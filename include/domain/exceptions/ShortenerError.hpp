#pragma once

#include <stdexcept>
#include <string>

namespace shortener::domain {

/**
 * @brief Базовое исключение сервиса сокращения ссылок
 */
class ShortenerError : public std::runtime_error {
public:
    explicit ShortenerError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace shortener::domain
