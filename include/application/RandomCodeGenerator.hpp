#pragma once

#include "ports/output/ICodeGenerator.hpp"
#include "ports/output/ILinkRepository.hpp"
#include "settings/ShortenerSettings.hpp"
#include "domain/exceptions/ExhaustionError.hpp"
#include "domain/AttemptBudget.hpp"

#include <memory>
#include <random>
#include <string>
#include <iostream>

namespace shortener::application {

/**
 * @brief Генератор случайных кодов фиксированной длины
 *
 * Кандидат выбирается равномерно из alphabet^length и проверяется
 * в хранилище. Занятый кандидат отбрасывается; каждый кандидат
 * расходует попытку из переданного AttemptBudget, после его
 * исчерпания бросается ExhaustionError.
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class RandomCodeGenerator : public ports::output::ICodeGenerator {
public:
    RandomCodeGenerator(
        std::shared_ptr<settings::ShortenerSettings> settings,
        std::shared_ptr<ports::output::ILinkRepository> repository
    ) : settings_(std::move(settings))
      , repository_(std::move(repository))
    {
        std::cout << "[RandomCodeGenerator] Created (length=" << settings_->getCodeLength()
                  << ", alphabet=" << settings_->getAlphabet().size() << " symbols)" << std::endl;
    }

    std::string generate(const domain::Deadline& deadline, domain::AttemptBudget& budget) override {
        while (true) {
            deadline.ensureNotExpired("code generation");
            if (!budget.tryConsume()) {
                break;
            }

            std::string candidate = draw();
            if (!repository_->findByCode(candidate, deadline)) {
                return candidate;
            }

            std::cout << "[RandomCodeGenerator] Collision on " << candidate
                      << " (attempt " << budget.used() << "/" << budget.limit() << ")" << std::endl;
        }

        std::cerr << "[RandomCodeGenerator] Code space exhausted after "
                  << budget.used() << " attempts" << std::endl;
        throw domain::ExhaustionError(budget.used());
    }

private:
    std::shared_ptr<settings::ShortenerSettings> settings_;
    std::shared_ptr<ports::output::ILinkRepository> repository_;

    std::string draw() const {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());

        const auto& alphabet = settings_->getAlphabet();
        std::uniform_int_distribution<std::size_t> dist(0, alphabet.size() - 1);

        std::string code;
        code.reserve(settings_->getCodeLength());
        for (std::size_t i = 0; i < settings_->getCodeLength(); ++i) {
            code.push_back(alphabet[dist(gen)]);
        }
        return code;
    }
};

} // namespace shortener::application
