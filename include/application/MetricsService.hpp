#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <memory>
#include <string>
#include <sstream>
#include <map>
#include <shared_mutex>
#include <mutex>
#include <atomic>
#include <iostream>

namespace shortener::application {

/**
 * @brief Счётчики сервиса в памяти процесса
 *
 * Серии хранятся в std::map, упорядоченном по ключу, поэтому
 * в выводе серии одной метрики идут подряд. Значения атомарные:
 * инкремент известной серии берёт только shared_lock, новая серия
 * добавляется под unique_lock.
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& series : settings_->getInitialSeries()) {
            series_.emplace(series, std::make_unique<std::atomic<long long>>(0));
        }
        std::cout << "[MetricsService] " << series_.size() << " series registered" << std::endl;
    }

    void increment(const std::string& name, const Labels& labels = {}) override {
        const std::string key = seriesKey(name, labels);

        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            if (auto* counter = find(key)) {
                counter->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto [it, inserted] = series_.emplace(key, nullptr);
        if (inserted) {
            it->second = std::make_unique<std::atomic<long long>>(0);
        }
        it->second->fetch_add(1, std::memory_order_relaxed);
    }

    long long value(const std::string& name, const Labels& labels = {}) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto* counter = find(seriesKey(name, labels));
        return counter ? counter->load(std::memory_order_relaxed) : 0;
    }

    std::string toPrometheusFormat() const override {
        std::map<std::string, settings::MetricDefinition> definitions;
        for (auto& def : settings_->getDefinitions()) {
            definitions.emplace(def.name, def);
        }

        std::ostringstream out;
        std::string currentMetric;

        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [key, counter] : series_) {
            std::string metric = key.substr(0, key.find('{'));
            if (metric != currentMetric) {
                currentMetric = metric;
                auto def = definitions.find(metric);
                if (def != definitions.end()) {
                    out << "# HELP " << metric << " " << def->second.help << "\n";
                    out << "# TYPE " << metric << " " << def->second.type << "\n";
                }
            }
            out << key << " " << counter->load(std::memory_order_relaxed) << "\n";
        }
        return out.str();
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<std::atomic<long long>>> series_;

    std::atomic<long long>* find(const std::string& key) const {
        auto it = series_.find(key);
        return it != series_.end() ? it->second.get() : nullptr;
    }

    /// name{k1="v1",k2="v2"}; labels уже отсортированы std::map
    static std::string seriesKey(const std::string& name, const Labels& labels) {
        if (labels.empty()) {
            return name;
        }
        std::string key = name + "{";
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            if (it != labels.begin()) key += ",";
            key += it->first + "=\"" + it->second + "\"";
        }
        return key + "}";
    }
};

} // namespace shortener::application
