#pragma once

#include <string>
#include <vector>

namespace shortener::settings {

/**
 * @brief Описание метрики: строки # HELP и # TYPE
 */
struct MetricDefinition {
    std::string name;
    std::string help;
    std::string type;   ///< "counter"
};

/**
 * @brief Каталог метрик сервиса
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /**
     * @brief Серии, которые видны в /metrics с нулём ещё до первого события
     *
     * Формат ключа: name{label="value",...}, labels по алфавиту.
     */
    virtual std::vector<std::string> getInitialSeries() const = 0;
};

} // namespace shortener::settings
