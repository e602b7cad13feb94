#pragma once

#include <cstddef>

namespace shortener::domain {

/**
 * @brief Лимит попыток подобрать код в рамках одного создания ссылки
 *
 * Один экземпляр делят LinkRegistry и ICodeGenerator: каждый
 * кандидат, выданный генератором, расходует одну попытку, повторная
 * вставка после ConflictError новых попыток не добавляет.
 */
class AttemptBudget {
public:
    explicit AttemptBudget(std::size_t limit) : limit_(limit) {}

    /// false, если попытки закончились
    bool tryConsume() {
        if (used_ >= limit_) {
            return false;
        }
        ++used_;
        return true;
    }

    bool exhausted() const { return used_ >= limit_; }
    std::size_t used() const { return used_; }
    std::size_t limit() const { return limit_; }

private:
    std::size_t limit_;
    std::size_t used_ = 0;
};

} // namespace shortener::domain
