#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/ShortenerSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/MetricsSettings.hpp"

// Ports
#include "ports/input/ILinkRegistry.hpp"
#include "ports/input/IResolver.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/ILinkRepository.hpp"
#include "ports/output/ICodeGenerator.hpp"

// Application
#include "application/LinkRegistry.hpp"
#include "application/Resolver.hpp"
#include "application/RandomCodeGenerator.hpp"
#include "application/MetricsService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresLinkRepository.hpp"
#include "adapters/secondary/InMemoryLinkRepository.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/MetricsDecoratorHandler.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/OwnerIdExtractorMiddleware.hpp"
#include "adapters/primary/CreateLinkHandler.hpp"
#include "adapters/primary/ListLinksHandler.hpp"
#include "adapters/primary/RedirectHandler.hpp"

#include <memory>
#include <iostream>

namespace di = boost::di;

namespace shortener {

/**
 * @brief URL Shortener Application
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка config.json в Environment
 * 2. configureInjection() - Boost.DI и регистрация handlers
 * 3. start() - запуск HTTP сервера (из базового класса)
 *
 * Хранилище выбирается через SHORTENER_STORAGE (postgres | memory)
 * и передаётся во все компоненты одним экземпляром.
 */
class ShortenerApp : public BoostBeastApplication {
public:
    ShortenerApp() { std::cout << "[ShortenerApp] Initializing..." << std::endl; }
    ~ShortenerApp() override { std::cout << "[ShortenerApp] Shutting down..." << std::endl; }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[ShortenerApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[ShortenerApp] Configuring DI..." << std::endl;

        // Шаг 1: Настройки (instance binding: у ShortenerSettings два конструктора)
        auto shortenerSettings = std::make_shared<settings::ShortenerSettings>();

        // Шаг 2: Хранилище - один экземпляр на всё приложение
        std::shared_ptr<ports::output::ILinkRepository> repository;
        if (shortenerSettings->getStorage() == "memory") {
            std::cout << "[ShortenerApp] Storage: in-memory" << std::endl;
            repository = std::make_shared<adapters::secondary::InMemoryLinkRepository>();
        } else {
            std::cout << "[ShortenerApp] Storage: PostgreSQL" << std::endl;
            auto dbInjector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton));
            repository = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresLinkRepository>>();
        }

        // Шаг 3: Основной injector
        auto injector = di::make_injector(
            di::bind<settings::ShortenerSettings>().to(shortenerSettings),
            di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),

            di::bind<ports::output::ILinkRepository>().to(repository),
            di::bind<ports::output::ICodeGenerator>().to<application::RandomCodeGenerator>().in(di::singleton),

            di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton),
            di::bind<ports::input::ILinkRegistry>().to<application::LinkRegistry>().in(di::singleton),
            di::bind<ports::input::IResolver>().to<application::Resolver>().in(di::singleton));

        // Шаг 4: HTTP Handlers, каждый обёрнут в MetricsDecoratorHandler
        auto metrics = injector.create<std::shared_ptr<ports::input::IMetricsService>>();
        auto withMetrics = [&metrics](std::shared_ptr<IHttpHandler> handler) {
            return std::make_shared<adapters::primary::MetricsDecoratorHandler>(std::move(handler), metrics);
        };

        handlers_[getHandlerKey("GET", "/health")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());
        handlers_[getHandlerKey("GET", "/metrics")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>());

        auto ownerMiddleware = std::make_shared<adapters::primary::OwnerIdExtractorMiddleware>();

        handlers_[getHandlerKey("POST", "/api/v1/links")] = withMetrics(
            std::make_shared<adapters::primary::ChainHandler>(
                ownerMiddleware,
                injector.create<std::shared_ptr<adapters::primary::CreateLinkHandler>>()));

        handlers_[getHandlerKey("GET", "/api/v1/links")] = withMetrics(
            std::make_shared<adapters::primary::ChainHandler>(
                ownerMiddleware,
                injector.create<std::shared_ptr<adapters::primary::ListLinksHandler>>()));

        handlers_[getHandlerKey("GET", "/*")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::RedirectHandler>>());

        std::cout << "[ShortenerApp] Registered handlers:" << std::endl;
        std::cout << "  ✓ GET  /health" << std::endl;
        std::cout << "  ✓ GET  /metrics" << std::endl;
        std::cout << "  ✓ POST /api/v1/links" << std::endl;
        std::cout << "  ✓ GET  /api/v1/links" << std::endl;
        std::cout << "  ✓ GET  /{code}" << std::endl;
        std::cout << "[ShortenerApp] Ready" << std::endl;
    }
};

} // namespace shortener
