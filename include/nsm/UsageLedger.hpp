#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "nsm/LicenseAuthority.hpp"

namespace nsm {

struct TokenState {
    std::string licenseKey;
    int64_t availableTokens = 0;
    // Unix seconds of the last successful remote sync (or first seeding).
    int64_t lastSync = 0;
};

void to_json(nlohmann::json& j, const TokenState& state);
void from_json(const nlohmann::json& j, TokenState& state);

// Persisted token counter gating archive creation. Every mutation is written
// to disk before it is acknowledged to the caller.
class UsageLedger {
public:
    static constexpr const char* kFileName = ".nsm-tokens";

    // Loads `path`, or seeds it with `freeTokens` when absent. A non-empty
    // licenseKey overrides the stored one. Throws ArchiveError(PersistenceFailure).
    UsageLedger(std::string path, int64_t freeTokens = 1, const std::string& licenseKey = "",
                LicenseAuthority* authority = nullptr);

    UsageLedger(const UsageLedger&) = delete;
    UsageLedger& operator=(const UsageLedger&) = delete;

    // Atomic check-and-decrement. Throws NoTokensAvailable or PersistenceFailure.
    void consumeToken();

    int64_t availableTokens() const;

    // Replace the local balance with the authority's; untouched on failure.
    // Throws ValidationFailure or PersistenceFailure.
    void validateOnline();

    PurchaseOrder initiatePurchase(int64_t count);

    std::string licenseKey() const;
    void setLicenseKey(const std::string& licenseKey);

    TokenState snapshot() const;
    const std::string& path() const { return path_; }

private:
    // Callers hold mutex_.
    void persist(const TokenState& state) const;
    bool reloadLocked();

    std::string path_;
    LicenseAuthority* authority_;
    mutable std::mutex mutex_;
    TokenState state_;
};

} // namespace nsm
