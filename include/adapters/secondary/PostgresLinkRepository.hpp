#pragma once

#include "ports/output/ILinkRepository.hpp"
#include "settings/DbSettings.hpp"
#include "ConnectionPool.hpp"
#include "domain/exceptions/ConflictError.hpp"
#include "domain/exceptions/StoreUnavailableError.hpp"
#include "domain/exceptions/DeadlineExceededError.hpp"

#include <pqxx/pqxx>
#include <algorithm>
#include <memory>
#include <utility>
#include <iostream>

namespace shortener::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий ссылок
 *
 * Схема: migrations/V1__create_links.sql.
 * - уникальность кода обеспечивает UNIQUE (code): unique_violation -> ConflictError
 * - счётчик увеличивается одним UPDATE ... SET click_count = click_count + 1
 * - дедлайн вызова превращается в SET LOCAL statement_timeout
 *
 * Соединения берутся из ConnectionPool размером getPoolSize():
 * каждый вызов получает своё соединение на время транзакции.
 * Оборванное соединение выбрасывается из пула и открывается заново.
 */
class PostgresLinkRepository : public ports::output::ILinkRepository {
public:
    explicit PostgresLinkRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
        , pool_(static_cast<std::size_t>(settings_->getPoolSize()), [db = settings_]() {
              return std::make_unique<pqxx::connection>(db->getConnectionString());
          })
    {
        std::cout << "[PostgresLinkRepository] Connecting to " << settings_->getHost()
                  << " (pool " << pool_.size() << ")" << std::endl;
        try {
            // Проверяем соединение на старте; оно остаётся в пуле
            auto lease = pool_.acquire(domain::Deadline::unbounded());
            std::cout << "[PostgresLinkRepository] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLinkRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Link> findByCode(
        const std::string& code,
        const domain::Deadline& deadline
    ) override {
        return execute("findByCode", deadline, [&](pqxx::work& txn) -> std::optional<domain::Link> {
            auto result = txn.exec_params(
                "SELECT " + COLUMNS + " FROM links WHERE code = $1",
                code
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToLink(result[0]);
        });
    }

    std::vector<domain::Link> findByOwner(
        const std::string& ownerId,
        const domain::Deadline& deadline
    ) override {
        return execute("findByOwner", deadline, [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                "SELECT " + COLUMNS + " FROM links WHERE owner_id = $1 ORDER BY id",
                ownerId
            );
            txn.commit();

            std::vector<domain::Link> links;
            links.reserve(result.size());
            for (const auto& row : result) {
                links.push_back(rowToLink(row));
            }
            return links;
        });
    }

    domain::Link insert(
        const domain::Link& link,
        const domain::Deadline& deadline
    ) override {
        return execute("insert", deadline, [&](pqxx::work& txn) {
            pqxx::result result;
            try {
                result = txn.exec_params(
                    "INSERT INTO links (owner_id, original_url, code, click_count) "
                    "VALUES ($1, $2, $3, 0) "
                    "RETURNING " + COLUMNS,
                    link.ownerId,
                    link.originalUrl,
                    link.code
                );
            } catch (const pqxx::unique_violation&) {
                throw domain::ConflictError(link.code);
            }
            txn.commit();
            return rowToLink(result[0]);
        });
    }

    std::optional<std::int64_t> incrementClicks(
        const std::string& code,
        const domain::Deadline& deadline
    ) override {
        return execute("incrementClicks", deadline, [&](pqxx::work& txn) -> std::optional<std::int64_t> {
            auto result = txn.exec_params(
                "UPDATE links SET click_count = click_count + 1 WHERE code = $1 RETURNING click_count",
                code
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return result[0]["click_count"].as<std::int64_t>();
        });
    }

private:
    inline static const std::string COLUMNS =
        "id, owner_id, original_url, code, click_count, "
        "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at_epoch";

    std::shared_ptr<settings::DbSettings> settings_;
    ConnectionPool<pqxx::connection> pool_;

    /**
     * @brief Выполнить операцию в транзакции с учётом дедлайна
     *
     * Переводит исключения libpqxx в доменные:
     * query_cancelled -> DeadlineExceededError, остальные -> StoreUnavailableError.
     * Доменные исключения из operation проходят без изменений.
     */
    template <typename Operation>
    auto execute(const char* name, const domain::Deadline& deadline, Operation&& operation)
        -> decltype(operation(std::declval<pqxx::work&>()))
    {
        deadline.ensureNotExpired(name);

        try {
            auto lease = pool_.acquire(deadline);
            try {
                pqxx::work txn(*lease);
                applyStatementTimeout(txn, deadline);
                return operation(txn);
            } catch (const pqxx::broken_connection&) {
                lease.discard();
                throw;
            }

        } catch (const pqxx::query_cancelled& e) {
            std::cerr << "[PostgresLinkRepository] " << name << "() cancelled: " << e.what() << std::endl;
            throw domain::DeadlineExceededError(name);
        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresLinkRepository] " << name << "() lost connection: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        } catch (const pqxx::failure& e) {
            std::cerr << "[PostgresLinkRepository] " << name << "() failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        }
    }

    void applyStatementTimeout(pqxx::work& txn, const domain::Deadline& deadline) const {
        long long timeoutMs = settings_->getStatementTimeoutMs();
        if (deadline.isBounded()) {
            // 0 в statement_timeout отключает таймаут, поэтому минимум 1 мс
            timeoutMs = std::max<long long>(1, deadline.remaining().count());
        }
        if (timeoutMs > 0) {
            txn.exec("SET LOCAL statement_timeout = " + std::to_string(timeoutMs));
        }
    }

    static domain::Link rowToLink(const pqxx::row& row) {
        domain::Link link(
            row["owner_id"].as<std::string>(),
            row["original_url"].as<std::string>(),
            row["code"].as<std::string>()
        );
        link.id = row["id"].as<std::int64_t>();
        link.clickCount = row["click_count"].as<std::int64_t>();
        link.createdAt = std::chrono::system_clock::time_point(
            std::chrono::seconds(row["created_at_epoch"].as<std::int64_t>()));
        return link;
    }
};

} // namespace shortener::adapters::secondary
