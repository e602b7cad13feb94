#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ILinkRegistry.hpp"
#include "settings/ShortenerSettings.hpp"
#include "domain/exceptions/ExhaustionError.hpp"
#include "domain/exceptions/StoreUnavailableError.hpp"
#include "domain/exceptions/DeadlineExceededError.hpp"
#include "OwnerIdExtractorMiddleware.hpp"
#include "LinkJson.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <memory>
#include <iostream>

namespace shortener::adapters::primary {

/**
 * @brief POST /api/v1/links - создать короткую ссылку
 *
 * Регистрируется за OwnerIdExtractorMiddleware (attribute "ownerId").
 *
 * Request:  {"original_url": "https://example.com"}
 * Response: 201 {"id": 1, "code": "aB3xQ9", "short_url": "...", ...}
 */
class CreateLinkHandler : public IHttpHandler {
public:
    CreateLinkHandler(
        std::shared_ptr<ports::input::ILinkRegistry> registry,
        std::shared_ptr<settings::ShortenerSettings> settings
    ) : registry_(std::move(registry))
      , settings_(std::move(settings))
    {
        std::cout << "[CreateLinkHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        auto ownerId = req.getAttribute(OwnerIdExtractorMiddleware::ATTRIBUTE).value_or("");
        if (ownerId.empty()) {
            sendError(res, 401, "Owner identity required");
            return;
        }

        std::string originalUrl;
        try {
            auto body = nlohmann::json::parse(req.getBody());
            originalUrl = body.value("original_url", "");
        } catch (const nlohmann::json::exception&) {
            sendError(res, 400, "Invalid JSON");
            return;
        }

        if (originalUrl.empty()) {
            sendError(res, 400, "original_url is required");
            return;
        }

        // URL потом уходит в заголовок Location как есть: CR/LF разорвали бы ответ
        if (hasControlCharacters(originalUrl)) {
            sendError(res, 400, "original_url must not contain control characters");
            return;
        }

        try {
            auto deadline = domain::Deadline::after(settings_->getRequestTimeout());
            auto link = registry_->create(ownerId, originalUrl, deadline);

            res.setResult(201, "application/json", linkToJson(link, settings_->getBaseUrl()).dump());

        } catch (const domain::ExhaustionError& e) {
            std::cerr << "[CreateLinkHandler] " << e.what() << std::endl;
            sendError(res, 503, "Could not allocate a short code, try again later");
        } catch (const domain::StoreUnavailableError& e) {
            std::cerr << "[CreateLinkHandler] " << e.what() << std::endl;
            sendError(res, 503, "Storage unavailable");
        } catch (const domain::DeadlineExceededError& e) {
            std::cerr << "[CreateLinkHandler] " << e.what() << std::endl;
            sendError(res, 504, "Request timed out");
        }
    }

private:
    std::shared_ptr<ports::input::ILinkRegistry> registry_;
    std::shared_ptr<settings::ShortenerSettings> settings_;

    static bool hasControlCharacters(const std::string& value) {
        return std::any_of(value.begin(), value.end(), [](char c) {
            auto byte = static_cast<unsigned char>(c);
            return byte < 0x20 || byte == 0x7F;
        });
    }

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace shortener::adapters::primary
