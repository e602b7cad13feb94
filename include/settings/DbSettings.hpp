#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace shortener::settings {

/**
 * @brief Настройки подключения к PostgreSQL
 *
 * Читает параметры из переменных окружения (K8s ENV).
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("SHORTENER_DB_HOST", "shortener-postgres");
        port_ = std::stoi(getEnvOrDefault("SHORTENER_DB_PORT", "5432"));
        name_ = getEnvOrDefault("SHORTENER_DB_NAME", "shortener_db");
        user_ = getEnvOrDefault("SHORTENER_DB_USER", "shortener_user");
        password_ = getEnvOrThrow("SHORTENER_DB_PASSWORD");
        statementTimeoutMs_ = std::stoi(getEnvOrDefault("SHORTENER_DB_STATEMENT_TIMEOUT_MS", "5000"));
        poolSize_ = std::stoi(getEnvOrDefault("SHORTENER_DB_POOL_SIZE", "4"));
        if (poolSize_ <= 0) {
            throw std::invalid_argument("SHORTENER_DB_POOL_SIZE must be positive");
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }

    /**
     * @brief Таймаут запроса по умолчанию, если у вызова нет дедлайна (0 - без ограничения)
     */
    int getStatementTimeoutMs() const { return statementTimeoutMs_; }

    /// Число соединений в пуле PostgresLinkRepository
    int getPoolSize() const { return poolSize_; }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    int statementTimeoutMs_;
    int poolSize_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value) {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace shortener::settings
