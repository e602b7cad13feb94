#pragma once

#include "domain/Deadline.hpp"
#include "domain/AttemptBudget.hpp"
#include <string>

namespace shortener::ports::output {

/**
 * @brief Генератор коротких кодов
 */
class ICodeGenerator {
public:
    virtual ~ICodeGenerator() = default;

    /**
     * @brief Сгенерировать код, свободный на момент вызова
     *
     * Проверка свободности - только оптимизация: уникальность
     * гарантирует ILinkRepository::insert.
     *
     * @param budget Общий лимит попыток; каждый кандидат расходует одну
     * @throws domain::ExhaustionError если budget исчерпан
     */
    virtual std::string generate(const domain::Deadline& deadline, domain::AttemptBudget& budget) = 0;
};

} // namespace shortener::ports::output
