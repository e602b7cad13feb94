#pragma once

#include "ports/output/ILinkRepository.hpp"
#include "domain/exceptions/ConflictError.hpp"

#include <map>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <iostream>

namespace shortener::adapters::secondary {

/**
 * @brief In-Memory реализация хранилища ссылок
 *
 * Используется при SHORTENER_STORAGE=memory и в тестах.
 * Уникальный индекс по коду проверяется и обновляется под тем же
 * exclusive lock, что и вставка, поэтому insert атомарен.
 */
class InMemoryLinkRepository : public ports::output::ILinkRepository {
public:
    InMemoryLinkRepository() {
        std::cout << "[InMemoryLinkRepository] Created" << std::endl;
    }

    std::optional<domain::Link> findByCode(
        const std::string& code,
        const domain::Deadline& deadline
    ) override {
        deadline.ensureNotExpired("findByCode");

        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = codeIndex_.find(code);
        if (it == codeIndex_.end()) return std::nullopt;
        return links_.at(it->second);
    }

    std::vector<domain::Link> findByOwner(
        const std::string& ownerId,
        const domain::Deadline& deadline
    ) override {
        deadline.ensureNotExpired("findByOwner");

        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::Link> result;
        for (const auto& [id, link] : links_) {
            if (link.ownerId == ownerId) {
                result.push_back(link);
            }
        }
        return result;
    }

    domain::Link insert(
        const domain::Link& link,
        const domain::Deadline& deadline
    ) override {
        deadline.ensureNotExpired("insert");

        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (codeIndex_.count(link.code) > 0) {
            throw domain::ConflictError(link.code);
        }

        domain::Link saved = link;
        saved.id = nextId_++;
        saved.clickCount = 0;
        saved.createdAt = std::chrono::system_clock::now();

        links_[saved.id] = saved;
        codeIndex_[saved.code] = saved.id;
        return saved;
    }

    std::optional<std::int64_t> incrementClicks(
        const std::string& code,
        const domain::Deadline& deadline
    ) override {
        deadline.ensureNotExpired("incrementClicks");

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = codeIndex_.find(code);
        if (it == codeIndex_.end()) return std::nullopt;
        return ++links_.at(it->second).clickCount;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return links_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::int64_t, domain::Link> links_;                  // id -> link, упорядочено по id
    std::unordered_map<std::string, std::int64_t> codeIndex_;     // code -> id
    std::int64_t nextId_ = 1;
};

} // namespace shortener::adapters::secondary
