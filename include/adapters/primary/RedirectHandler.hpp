#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IResolver.hpp"
#include "settings/ShortenerSettings.hpp"
#include "domain/exceptions/StoreUnavailableError.hpp"
#include "domain/exceptions/DeadlineExceededError.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace shortener::adapters::primary {

/**
 * @brief GET /{code} - редирект на исходный URL
 *
 * Роутер регистрирует с паттерном "/*".
 * 302 + Location при успехе, 404 для неизвестного кода.
 */
class RedirectHandler : public IHttpHandler {
public:
    RedirectHandler(
        std::shared_ptr<ports::input::IResolver> resolver,
        std::shared_ptr<settings::ShortenerSettings> settings
    ) : resolver_(std::move(resolver))
      , settings_(std::move(settings))
    {
        std::cout << "[RedirectHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        std::string code = extractCode(req);
        if (code.empty()) {
            sendError(res, 404, "Short link not found");
            return;
        }

        try {
            auto deadline = domain::Deadline::after(settings_->getRequestTimeout());
            auto originalUrl = resolver_->resolve(code, deadline);

            if (!originalUrl) {
                sendError(res, 404, "Short link not found");
                return;
            }

            res.setStatus(302);
            res.setHeader("Location", *originalUrl);
            // Каждый переход должен дойти до сервера и попасть в счётчик
            res.setHeader("Cache-Control", "no-store");
            res.setBody("");

        } catch (const domain::StoreUnavailableError& e) {
            std::cerr << "[RedirectHandler] " << e.what() << std::endl;
            sendError(res, 503, "Storage unavailable");
        } catch (const domain::DeadlineExceededError& e) {
            std::cerr << "[RedirectHandler] " << e.what() << std::endl;
            sendError(res, 504, "Request timed out");
        }
    }

private:
    std::shared_ptr<ports::input::IResolver> resolver_;
    std::shared_ptr<settings::ShortenerSettings> settings_;

    static std::string extractCode(IRequest& req) {
        auto param = req.getPathParam(0);
        if (param) {
            return *param;
        }

        // pathPattern не установлен: берём первый сегмент пути
        std::string path = req.getPath();
        auto queryPos = path.find('?');
        if (queryPos != std::string::npos) {
            path = path.substr(0, queryPos);
        }
        if (!path.empty() && path.front() == '/') {
            path.erase(0, 1);
        }
        return path.find('/') == std::string::npos ? path : "";
    }

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace shortener::adapters::primary
