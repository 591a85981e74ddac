#pragma once

#include <cstdint>
#include <string>

namespace nsm {

struct ValidationResult {
    bool valid = false;
    int64_t availableTokens = 0;
};

struct PurchaseOrder {
    std::string paymentUrl;
    std::string orderId;
};

// Remote authority that owns the authoritative token balance for a license.
// Implementations throw ArchiveError(ValidationFailure) when the round-trip
// does not complete.
class LicenseAuthority {
public:
    virtual ~LicenseAuthority() = default;

    virtual ValidationResult validate(const std::string& licenseKey) = 0;
    virtual PurchaseOrder initiatePurchase(const std::string& licenseKey, int64_t count) = 0;
};

// HTTP client for the marketplace API.
class MarketplaceClient : public LicenseAuthority {
public:
    explicit MarketplaceClient(std::string baseUrl, int timeoutSeconds = 15);

    ValidationResult validate(const std::string& licenseKey) override;
    PurchaseOrder initiatePurchase(const std::string& licenseKey, int64_t count) override;

private:
    std::string baseUrl_;
    int timeoutSeconds_;
};

} // namespace nsm
