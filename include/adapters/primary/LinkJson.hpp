#pragma once

#include "domain/Link.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace shortener::adapters::primary {

/**
 * @brief JSON-представление ссылки для ответов API
 */
inline nlohmann::json linkToJson(const domain::Link& link, const std::string& baseUrl) {
    nlohmann::json j;
    j["id"] = link.id;
    j["code"] = link.code;
    j["short_url"] = baseUrl + "/" + link.code;
    j["original_url"] = link.originalUrl;
    j["click_count"] = link.clickCount;
    j["created_at"] = std::chrono::duration_cast<std::chrono::seconds>(
        link.createdAt.time_since_epoch()).count();
    return j;
}

} // namespace shortener::adapters::primary
