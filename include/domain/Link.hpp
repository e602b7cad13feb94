#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace shortener::domain {

/**
 * @brief Короткая ссылка
 *
 * id и createdAt назначает хранилище при вставке.
 * После создания меняется только clickCount (и только в сторону увеличения).
 */
struct Link {
    std::int64_t id = 0;            ///< Идентификатор, назначается хранилищем
    std::string ownerId;            ///< Внешний идентификатор владельца
    std::string originalUrl;        ///< Исходный URL как его передал клиент
    std::string code;               ///< Короткий код, глобально уникален
    std::int64_t clickCount = 0;    ///< Число успешных переходов
    std::chrono::system_clock::time_point createdAt;

    Link() = default;

    Link(const std::string& ownerId,
         const std::string& originalUrl,
         const std::string& code)
        : ownerId(ownerId)
        , originalUrl(originalUrl)
        , code(code)
    {}
};

} // namespace shortener::domain
