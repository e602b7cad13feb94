#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>
#include <string>

namespace shortener::adapters::primary {

/**
 * @brief Декоратор для подсчёта HTTP метрик
 *
 * Метрика: http_requests_total{method="...",path="..."}
 *
 * Path нормализуется, чтобы коды не раздували число labels:
 * - /aB3xQ9 -> /{code}
 * - /api/v1/links, /health, /metrics -> без изменений
 */
class MetricsDecoratorHandler : public IHttpHandler {
public:
    MetricsDecoratorHandler(
        std::shared_ptr<IHttpHandler> inner,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : inner_(std::move(inner))
      , metrics_(std::move(metrics)) {}

    void handle(IRequest& req, IResponse& res) override {
        // Считаем входящие запросы до обработки
        metrics_->increment("http_requests_total", {{"method", req.getMethod()},
                                                    {"path", normalizePath(req.getPath())}});
        inner_->handle(req, res);
    }

    static std::string normalizePath(const std::string& path) {
        std::string cleanPath = path;
        size_t queryPos = cleanPath.find('?');
        if (queryPos != std::string::npos) {
            cleanPath = cleanPath.substr(0, queryPos);
        }

        if (cleanPath == "/health" || cleanPath == "/metrics" ||
            cleanPath.find("/api/") == 0) {
            return cleanPath;
        }

        return "/{code}";
    }

private:
    std::shared_ptr<IHttpHandler> inner_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace shortener::adapters::primary
