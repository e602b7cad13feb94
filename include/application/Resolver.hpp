#pragma once

#include "ports/input/IResolver.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ILinkRepository.hpp"
#include "domain/exceptions/StoreUnavailableError.hpp"
#include "domain/exceptions/DeadlineExceededError.hpp"

#include <memory>
#include <iostream>

namespace shortener::application {

/**
 * @brief Разрешение кода в исходный URL с учётом перехода
 *
 * Ошибка поиска пробрасывается вызывающему. Ошибка инкремента
 * не мешает редиректу: она логируется и учитывается в метрике
 * click_accounting_failures_total.
 */
class Resolver : public ports::input::IResolver {
public:
    Resolver(
        std::shared_ptr<ports::output::ILinkRepository> repository,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : repository_(std::move(repository))
      , metrics_(std::move(metrics))
    {
        std::cout << "[Resolver] Created" << std::endl;
    }

    std::optional<std::string> resolve(
        const std::string& code,
        const domain::Deadline& deadline
    ) override {
        deadline.ensureNotExpired("resolve");

        auto link = repository_->findByCode(code, deadline);
        if (!link) {
            metrics_->increment("resolutions_total", {{"result", "not_found"}});
            return std::nullopt;
        }

        metrics_->increment("resolutions_total", {{"result", "found"}});

        try {
            auto clicks = repository_->incrementClicks(code, deadline);
            if (!clicks) {
                reportAccountingFailure(code, "code disappeared before increment");
            }
        } catch (const domain::StoreUnavailableError& e) {
            reportAccountingFailure(code, e.what());
        } catch (const domain::DeadlineExceededError& e) {
            reportAccountingFailure(code, e.what());
        }

        return link->originalUrl;
    }

private:
    std::shared_ptr<ports::output::ILinkRepository> repository_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    void reportAccountingFailure(const std::string& code, const std::string& reason) {
        metrics_->increment("click_accounting_failures_total");
        std::cerr << "[Resolver] Click not recorded for " << code << ": " << reason << std::endl;
    }
};

} // namespace shortener::application
