#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <vector>
#include <iostream>

namespace shortener::adapters::primary {

/**
 * @brief Цепочка middleware + handler
 *
 * Handlers вызываются по очереди, пока кто-то не выставит ненулевой статус.
 * Middleware оставляет статус 0, чтобы цепочка продолжилась.
 */
class ChainHandler : public IHttpHandler {
public:
    template <typename... Handlers>
    explicit ChainHandler(Handlers&&... handlers) {
        (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
    }

    void handle(IRequest& req, IResponse& res) override {
        for (auto& h : handlers_) {
            h->handle(req, res);
            if (res.getStatus() != 0) {
                return;
            }
        }

        // Цепочка закончилась, а статус так и не выставлен: ошибка конфигурации
        std::cerr << "[ChainHandler] Error: middleware chain finished, but httpStatus is zero." << std::endl;
        nlohmann::json error;
        error["error"] = "Internal server error";
        res.setResult(500, "application/json", error.dump());
    }

private:
    std::vector<std::shared_ptr<IHttpHandler>> handlers_;
};

} // namespace shortener::adapters::primary
