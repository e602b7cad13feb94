#pragma once

#include <string>
#include <map>

namespace shortener::ports::input {

/**
 * @brief Счётчики сервиса для /metrics
 *
 * Ядро пишет сюда созданные ссылки, коллизии кодов, результаты
 * разрешения и переходы, которые не удалось учесть в хранилище.
 *
 * @code
 * metrics->increment("resolutions_total", {{"result", "not_found"}});
 * @endcode
 */
class IMetricsService {
public:
    using Labels = std::map<std::string, std::string>;

    virtual ~IMetricsService() = default;

    /// +1 к серии name{labels}; неизвестная серия заводится на лету
    virtual void increment(const std::string& name, const Labels& labels = {}) = 0;

    /// Текущее значение серии, 0 если её нет
    virtual long long value(const std::string& name, const Labels& labels = {}) const = 0;

    /// Prometheus text exposition format 0.0.4
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace shortener::ports::input
