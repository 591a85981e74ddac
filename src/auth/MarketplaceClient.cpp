#include "nsm/LicenseAuthority.hpp"

#include <iostream>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "nsm/Errors.hpp"

namespace nsm {

namespace {

nlohmann::json parseBody(const std::string& body, const char* what) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw ArchiveError(ErrorCode::ValidationFailure,
                           std::string("marketplace: malformed ") + what + " response: " + e.what());
    }
}

} // namespace

MarketplaceClient::MarketplaceClient(std::string baseUrl, int timeoutSeconds)
    : baseUrl_(std::move(baseUrl)), timeoutSeconds_(timeoutSeconds) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

ValidationResult MarketplaceClient::validate(const std::string& licenseKey) {
    httplib::Client cli(baseUrl_);
    cli.set_connection_timeout(timeoutSeconds_, 0);
    cli.set_read_timeout(timeoutSeconds_, 0);
    httplib::Headers headers{{"Authorization", "Bearer " + licenseKey}};

    std::cerr << "MarketplaceClient: validating license with " << baseUrl_ << "\n";
    auto res = cli.Get("/api/v1/tokens/validate", headers);
    if (!res) {
        throw ArchiveError(ErrorCode::ValidationFailure,
                           "marketplace: validation request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw ArchiveError(ErrorCode::ValidationFailure,
                           "marketplace returned an error (status " + std::to_string(res->status) + ")");
    }

    auto body = parseBody(res->body, "validation");
    ValidationResult result;
    try {
        result.valid = body.at("is_valid").get<bool>();
        result.availableTokens = body.at("available_tokens").get<int64_t>();
    } catch (const nlohmann::json::exception& e) {
        throw ArchiveError(ErrorCode::ValidationFailure,
                           std::string("marketplace: incomplete validation response: ") + e.what());
    }
    if (result.availableTokens < 0) {
        throw ArchiveError(ErrorCode::ValidationFailure, "marketplace: negative token balance");
    }
    return result;
}

PurchaseOrder MarketplaceClient::initiatePurchase(const std::string& licenseKey, int64_t count) {
    if (count <= 0) {
        throw ArchiveError(ErrorCode::InvalidArgument, "token count must be positive");
    }
    httplib::Client cli(baseUrl_);
    cli.set_connection_timeout(timeoutSeconds_, 0);
    cli.set_read_timeout(timeoutSeconds_, 0);
    httplib::Headers headers{{"Authorization", "Bearer " + licenseKey}};
    nlohmann::json payload{{"token_count", count}};

    std::cerr << "MarketplaceClient: initiating purchase of " << count << " token(s)\n";
    auto res = cli.Post("/api/v1/tokens/purchase", headers, payload.dump(), "application/json");
    if (!res) {
        throw ArchiveError(ErrorCode::ValidationFailure,
                           "marketplace: purchase request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw ArchiveError(ErrorCode::ValidationFailure,
                           "marketplace returned an error (status " + std::to_string(res->status) + ")");
    }

    auto body = parseBody(res->body, "purchase");
    PurchaseOrder order;
    try {
        order.paymentUrl = body.at("payment_url").get<std::string>();
        order.orderId = body.at("order_id").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw ArchiveError(ErrorCode::ValidationFailure,
                           std::string("marketplace: incomplete purchase response: ") + e.what());
    }
    return order;
}

} // namespace nsm
