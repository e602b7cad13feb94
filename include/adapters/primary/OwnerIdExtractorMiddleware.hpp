#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace shortener::adapters::primary {

/**
 * @brief Middleware для извлечения ownerId и добавления в attributes.
 *
 * Аутентификацию выполняет внешний gateway и передаёт идентификатор
 * пользователя в заголовке X-Owner-Id.
 */
class OwnerIdExtractorMiddleware : public IHttpHandler {
public:
    static constexpr const char* HEADER = "X-Owner-Id";
    static constexpr const char* ATTRIBUTE = "ownerId";

    void handle(IRequest& req, IResponse& res) override {
        std::string ownerId = req.getHeader(HEADER).value_or("");
        if (ownerId.empty()) {
            sendError(res, 401, "Owner identity required (X-Owner-Id header)");
            return;
        }

        req.setAttribute(ATTRIBUTE, ownerId);
        res.setStatus(0); // для middleware
    }

private:
    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace shortener::adapters::primary
