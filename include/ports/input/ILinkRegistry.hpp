#pragma once

#include "domain/Link.hpp"
#include "domain/Deadline.hpp"
#include <string>
#include <vector>

namespace shortener::ports::input {

/**
 * @brief Интерфейс реестра ссылок (создание и список)
 */
class ILinkRegistry {
public:
    virtual ~ILinkRegistry() = default;

    /**
     * @brief Создать короткую ссылку
     *
     * @param ownerId Идентификатор владельца (уже аутентифицирован)
     * @param originalUrl Исходный URL
     * @return Сохранённая ссылка с id и code
     *
     * @throws domain::ExhaustionError
     * @throws domain::StoreUnavailableError
     * @throws domain::DeadlineExceededError
     */
    virtual domain::Link create(
        const std::string& ownerId,
        const std::string& originalUrl,
        const domain::Deadline& deadline
    ) = 0;

    /**
     * @brief Все ссылки владельца вместе со счётчиками переходов
     */
    virtual std::vector<domain::Link> listByOwner(
        const std::string& ownerId,
        const domain::Deadline& deadline
    ) = 0;
};

} // namespace shortener::ports::input
