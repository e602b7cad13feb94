#pragma once

#include "ports/input/ILinkRegistry.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ICodeGenerator.hpp"
#include "ports/output/ILinkRepository.hpp"
#include "settings/ShortenerSettings.hpp"
#include "domain/exceptions/ConflictError.hpp"
#include "domain/exceptions/ExhaustionError.hpp"
#include "domain/AttemptBudget.hpp"

#include <memory>
#include <iostream>

namespace shortener::application {

/**
 * @brief Реестр ссылок: создание и список по владельцу
 *
 * Создание: код от ICodeGenerator -> ILinkRepository::insert.
 * Если между проверкой и вставкой код успели занять (ConflictError),
 * запрашивается новый код. На всё создание заводится один
 * AttemptBudget(getMaxAttempts()), его расходует генератор, так что
 * обращений к хранилищу не больше 2 * getMaxAttempts().
 */
class LinkRegistry : public ports::input::ILinkRegistry {
public:
    LinkRegistry(
        std::shared_ptr<settings::ShortenerSettings> settings,
        std::shared_ptr<ports::output::ICodeGenerator> codeGenerator,
        std::shared_ptr<ports::output::ILinkRepository> repository,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : settings_(std::move(settings))
      , codeGenerator_(std::move(codeGenerator))
      , repository_(std::move(repository))
      , metrics_(std::move(metrics))
    {
        std::cout << "[LinkRegistry] Created" << std::endl;
    }

    domain::Link create(
        const std::string& ownerId,
        const std::string& originalUrl,
        const domain::Deadline& deadline
    ) override {
        domain::AttemptBudget budget(settings_->getMaxAttempts());

        while (true) {
            deadline.ensureNotExpired("link creation");

            const auto usedBefore = budget.used();
            std::string code = codeGenerator_->generate(deadline, budget);
            // Кандидат всегда стоит одну попытку, даже если генератор её не списал
            if (budget.used() == usedBefore) {
                budget.tryConsume();
            }

            try {
                auto saved = repository_->insert(domain::Link(ownerId, originalUrl, code), deadline);
                metrics_->increment("links_created_total");
                std::cout << "[LinkRegistry] Created link " << saved.id << " -> " << saved.code
                          << " (owner " << ownerId << ")" << std::endl;
                return saved;
            } catch (const domain::ConflictError& e) {
                metrics_->increment("code_collisions_total");
                std::cout << "[LinkRegistry] Insert conflict on " << e.code()
                          << " (attempt " << budget.used() << "/" << budget.limit() << ")" << std::endl;
            }

            if (budget.exhausted()) {
                std::cerr << "[LinkRegistry] Giving up after " << budget.used() << " attempts" << std::endl;
                throw domain::ExhaustionError(budget.used());
            }
        }
    }

    std::vector<domain::Link> listByOwner(
        const std::string& ownerId,
        const domain::Deadline& deadline
    ) override {
        deadline.ensureNotExpired("link listing");
        return repository_->findByOwner(ownerId, deadline);
    }

private:
    std::shared_ptr<settings::ShortenerSettings> settings_;
    std::shared_ptr<ports::output::ICodeGenerator> codeGenerator_;
    std::shared_ptr<ports::output::ILinkRepository> repository_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace shortener::application
