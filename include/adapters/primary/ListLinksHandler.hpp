#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ILinkRegistry.hpp"
#include "settings/ShortenerSettings.hpp"
#include "domain/exceptions/StoreUnavailableError.hpp"
#include "domain/exceptions/DeadlineExceededError.hpp"
#include "OwnerIdExtractorMiddleware.hpp"
#include "LinkJson.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace shortener::adapters::primary {

/**
 * @brief GET /api/v1/links - ссылки текущего владельца со счётчиками
 */
class ListLinksHandler : public IHttpHandler {
public:
    ListLinksHandler(
        std::shared_ptr<ports::input::ILinkRegistry> registry,
        std::shared_ptr<settings::ShortenerSettings> settings
    ) : registry_(std::move(registry))
      , settings_(std::move(settings))
    {
        std::cout << "[ListLinksHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        auto ownerId = req.getAttribute(OwnerIdExtractorMiddleware::ATTRIBUTE).value_or("");
        if (ownerId.empty()) {
            sendError(res, 401, "Owner identity required");
            return;
        }

        try {
            auto deadline = domain::Deadline::after(settings_->getRequestTimeout());
            auto links = registry_->listByOwner(ownerId, deadline);

            nlohmann::json response;
            response["links"] = nlohmann::json::array();
            for (const auto& link : links) {
                response["links"].push_back(linkToJson(link, settings_->getBaseUrl()));
            }

            res.setResult(200, "application/json", response.dump());

        } catch (const domain::StoreUnavailableError& e) {
            std::cerr << "[ListLinksHandler] " << e.what() << std::endl;
            sendError(res, 503, "Storage unavailable");
        } catch (const domain::DeadlineExceededError& e) {
            std::cerr << "[ListLinksHandler] " << e.what() << std::endl;
            sendError(res, 504, "Request timed out");
        }
    }

private:
    std::shared_ptr<ports::input::ILinkRegistry> registry_;
    std::shared_ptr<settings::ShortenerSettings> settings_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace shortener::adapters::primary
