#pragma once

#include "ShortenerError.hpp"
#include <cstddef>

namespace shortener::domain {

/**
 * @brief Исчерпан лимит попыток подобрать свободный код
 */
class ExhaustionError : public ShortenerError {
public:
    explicit ExhaustionError(std::size_t attempts)
        : ShortenerError("No free code found after " + std::to_string(attempts) + " attempts")
        , attempts_(attempts) {}

    std::size_t attempts() const { return attempts_; }

private:
    std::size_t attempts_;
};

} // namespace shortener::domain
