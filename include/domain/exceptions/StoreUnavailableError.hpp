#pragma once

#include "ShortenerError.hpp"

namespace shortener::domain {

/**
 * @brief Ошибка ввода-вывода хранилища (нет соединения, ошибка SQL)
 */
class StoreUnavailableError : public ShortenerError {
public:
    explicit StoreUnavailableError(const std::string& message)
        : ShortenerError("Store unavailable: " + message) {}
};

} // namespace shortener::domain
