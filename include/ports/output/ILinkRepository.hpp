#pragma once

#include "domain/Link.hpp"
#include "domain/Deadline.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace shortener::ports::output {

/**
 * @brief Интерфейс хранилища ссылок
 *
 * Output Port. Единственный разделяемый изменяемый ресурс сервиса:
 * все изменения Link выполняются атомарными операциями хранилища.
 *
 * Ошибки:
 * - domain::StoreUnavailableError - ошибка ввода-вывода
 * - domain::DeadlineExceededError - вызов прерван по дедлайну
 */
class ILinkRepository {
public:
    virtual ~ILinkRepository() = default;

    /**
     * @brief Найти ссылку по коду (точное совпадение)
     * @return Link или nullopt
     */
    virtual std::optional<domain::Link> findByCode(
        const std::string& code,
        const domain::Deadline& deadline
    ) = 0;

    /**
     * @brief Все ссылки владельца, упорядоченные по id
     */
    virtual std::vector<domain::Link> findByOwner(
        const std::string& ownerId,
        const domain::Deadline& deadline
    ) = 0;

    /**
     * @brief Вставить новую ссылку
     *
     * Атомарна относительно конкурентных вставок.
     *
     * @param link Ссылка без id
     * @return Сохранённая ссылка с назначенными id и createdAt
     * @throws domain::ConflictError если код уже занят
     */
    virtual domain::Link insert(
        const domain::Link& link,
        const domain::Deadline& deadline
    ) = 0;

    /**
     * @brief Атомарно увеличить счётчик переходов на 1
     * @return Новое значение счётчика или nullopt, если кода нет
     */
    virtual std::optional<std::int64_t> incrementClicks(
        const std::string& code,
        const domain::Deadline& deadline
    ) = 0;
};

} // namespace shortener::ports::output
