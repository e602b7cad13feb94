#pragma once

#include "domain/Deadline.hpp"
#include "domain/exceptions/DeadlineExceededError.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>

namespace shortener::adapters::secondary {

/**
 * @brief Пул соединений фиксированного размера
 *
 * Соединения открываются лениво, при первой выдаче слота.
 * Ожидание свободного слота ограничено дедлайном вызова.
 * Соединение, сломавшееся во время работы, сбрасывается через
 * Lease::discard(), и слот откроет новое при следующей выдаче.
 *
 * @tparam Connection Тип соединения (pqxx::connection в PostgresLinkRepository)
 */
template <typename Connection>
class ConnectionPool {
public:
    using Factory = std::function<std::unique_ptr<Connection>()>;

    /**
     * @brief Соединение, взятое из пула; возвращается в пул в деструкторе
     */
    class Lease {
    public:
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
            : pool_(pool), connection_(std::move(connection)) {}

        Lease(Lease&& other) noexcept
            : pool_(other.pool_), connection_(std::move(other.connection_))
        {
            other.pool_ = nullptr;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        ~Lease() {
            if (pool_) {
                pool_->release(std::move(connection_));
            }
        }

        Connection& operator*() const { return *connection_; }
        Connection* operator->() const { return connection_.get(); }

        /// Не возвращать соединение в пул: слот переоткроется
        void discard() { connection_.reset(); }

    private:
        friend class ConnectionPool;

        ConnectionPool* pool_;
        std::unique_ptr<Connection> connection_;
    };

    ConnectionPool(std::size_t size, Factory factory)
        : factory_(std::move(factory))
        , size_(size)
    {
        for (std::size_t i = 0; i < size_; ++i) {
            idle_.push(nullptr);
        }
    }

    /**
     * @brief Взять соединение
     * @throws domain::DeadlineExceededError если слот не освободился до дедлайна
     * @throws то, что бросает Factory, если соединение не открылось
     */
    Lease acquire(const domain::Deadline& deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto available = [this]() { return !idle_.empty(); };

        if (!deadline.isBounded()) {
            cv_.wait(lock, available);
        } else if (!cv_.wait_for(lock, deadline.remaining(), available)) {
            throw domain::DeadlineExceededError("connection pool wait");
        }

        auto connection = std::move(idle_.front());
        idle_.pop();
        lock.unlock();

        // Пустой слот: открываем соединение; при ошибке слот возвращается пустым
        Lease lease(this, std::move(connection));
        if (!lease.connection_) {
            lease.connection_ = factory_();
        }
        return lease;
    }

    std::size_t size() const { return size_; }

    std::size_t idle() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return idle_.size();
    }

private:
    Factory factory_;
    std::size_t size_;
    std::queue<std::unique_ptr<Connection>> idle_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    void release(std::unique_ptr<Connection> connection) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            idle_.push(std::move(connection));
        }
        cv_.notify_one();
    }
};

} // namespace shortener::adapters::secondary
