#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace shortener::settings {

/**
 * @brief Настройки метрик URL Shortener
 *
 * - HTTP метрики (запросы к endpoints)
 * - Бизнес метрики (создание ссылок, переходы, сбои учёта)
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"links_created_total", "Total short links created", "counter"},
            {"code_collisions_total", "Codes rejected by the store as already taken", "counter"},
            {"resolutions_total", "Total code resolutions", "counter"},
            {"click_accounting_failures_total", "Resolutions served without a recorded click", "counter"}
        };
    }

    std::vector<std::string> getInitialSeries() const override {
        return {
            // HTTP метрики (method + path)
            "http_requests_total{method=\"GET\",path=\"/health\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/links\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/links\"}",
            "http_requests_total{method=\"GET\",path=\"/{code}\"}",

            // Бизнес метрики
            "links_created_total",
            "code_collisions_total",
            "resolutions_total{result=\"found\"}",
            "resolutions_total{result=\"not_found\"}",
            "click_accounting_failures_total"
        };
    }
};

} // namespace shortener::settings
