#pragma once

#include "domain/Deadline.hpp"
#include <string>
#include <optional>

namespace shortener::ports::input {

/**
 * @brief Интерфейс разрешения коротких кодов
 */
class IResolver {
public:
    virtual ~IResolver() = default;

    /**
     * @brief Разрешить код в исходный URL и учесть переход
     *
     * @return Исходный URL или nullopt (код не найден)
     * @throws domain::StoreUnavailableError при ошибке поиска
     * @throws domain::DeadlineExceededError
     */
    virtual std::optional<std::string> resolve(
        const std::string& code,
        const domain::Deadline& deadline
    ) = 0;
};

} // namespace shortener::ports::input
