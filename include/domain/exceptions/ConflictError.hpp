#pragma once

#include "ShortenerError.hpp"

namespace shortener::domain {

/**
 * @brief Код уже занят другой ссылкой
 *
 * Выбрасывается хранилищем при вставке. Обрабатывается повтором
 * в LinkRegistry и наружу не выходит.
 */
class ConflictError : public ShortenerError {
public:
    explicit ConflictError(const std::string& code)
        : ShortenerError("Code already exists: " + code)
        , code_(code) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

} // namespace shortener::domain
