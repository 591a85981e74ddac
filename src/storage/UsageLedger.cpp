#include "nsm/UsageLedger.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include "nsm/DurableFile.hpp"
#include "nsm/Errors.hpp"

namespace fs = std::filesystem;

namespace nsm {

namespace {

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Exclusive advisory lock on `<ledger>.lock`, held for one read-modify-write.
class FileLock {
public:
    explicit FileLock(const std::string& path) {
        fd_ = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            throw ArchiveError(ErrorCode::PersistenceFailure, "ledger: cannot open lock file " + path);
        }
        if (::flock(fd_, LOCK_EX) != 0) {
            ::close(fd_);
            throw ArchiveError(ErrorCode::PersistenceFailure, "ledger: cannot lock " + path);
        }
    }
    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

} // namespace

void to_json(nlohmann::json& j, const TokenState& state) {
    j = nlohmann::json{{"license_key", state.licenseKey},
                       {"available_tokens", state.availableTokens},
                       {"last_sync", state.lastSync}};
}

void from_json(const nlohmann::json& j, TokenState& state) {
    state.licenseKey = j.value("license_key", std::string());
    state.availableTokens = j.at("available_tokens").get<int64_t>();
    state.lastSync = j.value("last_sync", int64_t{0});
}

UsageLedger::UsageLedger(std::string path, int64_t freeTokens, const std::string& licenseKey,
                         LicenseAuthority* authority)
    : path_(std::move(path)), authority_(authority) {
    std::lock_guard<std::mutex> guard(mutex_);
    std::error_code ec;
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    FileLock lock(path_ + ".lock");
    if (!reloadLocked()) {
        TokenState seeded;
        seeded.licenseKey = licenseKey;
        seeded.availableTokens = freeTokens;
        seeded.lastSync = nowSeconds();
        persist(seeded);
        state_ = seeded;
        std::cerr << "UsageLedger: seeded " << path_ << " with " << freeTokens << " free token(s)\n";
        return;
    }
    if (!licenseKey.empty() && licenseKey != state_.licenseKey) {
        TokenState next = state_;
        next.licenseKey = licenseKey;
        persist(next);
        state_ = next;
        std::cerr << "UsageLedger: license key updated\n";
    }
}

void UsageLedger::consumeToken() {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(path_ + ".lock");
    reloadLocked();
    if (state_.availableTokens <= 0) {
        std::cerr << "UsageLedger: token requested but none available\n";
        throw ArchiveError(ErrorCode::NoTokensAvailable, "no compression tokens available");
    }
    TokenState next = state_;
    --next.availableTokens;
    // In-memory state only advances once the decrement is on disk.
    persist(next);
    state_ = next;
}

int64_t UsageLedger::availableTokens() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return state_.availableTokens;
}

void UsageLedger::validateOnline() {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!authority_) {
        throw ArchiveError(ErrorCode::ValidationFailure, "no license authority configured");
    }
    if (state_.licenseKey.empty()) {
        throw ArchiveError(ErrorCode::ValidationFailure, "cannot validate online without a license key");
    }
    ValidationResult result = authority_->validate(state_.licenseKey);
    if (!result.valid) {
        throw ArchiveError(ErrorCode::ValidationFailure, "license key rejected by marketplace");
    }

    FileLock lock(path_ + ".lock");
    reloadLocked();
    TokenState next = state_;
    next.availableTokens = result.availableTokens;
    next.lastSync = nowSeconds();
    persist(next);
    state_ = next;
    std::cerr << "UsageLedger: synced with marketplace, tokens=" << state_.availableTokens << "\n";
}

PurchaseOrder UsageLedger::initiatePurchase(int64_t count) {
    if (count <= 0) {
        throw ArchiveError(ErrorCode::InvalidArgument, "token count must be positive");
    }
    std::string key;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        key = state_.licenseKey;
    }
    if (!authority_) {
        throw ArchiveError(ErrorCode::ValidationFailure, "no license authority configured");
    }
    return authority_->initiatePurchase(key, count);
}

std::string UsageLedger::licenseKey() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return state_.licenseKey;
}

void UsageLedger::setLicenseKey(const std::string& licenseKey) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(path_ + ".lock");
    reloadLocked();
    TokenState next = state_;
    next.licenseKey = licenseKey;
    persist(next);
    state_ = next;
}

TokenState UsageLedger::snapshot() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return state_;
}

void UsageLedger::persist(const TokenState& state) const {
    const std::string tmpPath = path_ + ".tmp";
    nlohmann::json j = state;
    std::error_code ec;
    try {
        writeFileDurably(tmpPath, j.dump(2), S_IRUSR | S_IWUSR, ErrorCode::PersistenceFailure);
    } catch (const ArchiveError& e) {
        fs::remove(tmpPath, ec);
        throw ArchiveError(e.code(), std::string("ledger: ") + e.what());
    }
    fs::rename(tmpPath, path_, ec);
    if (ec) {
        fs::remove(tmpPath, ec);
        throw ArchiveError(ErrorCode::PersistenceFailure, "ledger: failed to replace " + path_);
    }
    syncParentDirectory(path_, ErrorCode::PersistenceFailure);
}

bool UsageLedger::reloadLocked() {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        std::error_code ec;
        if (!fs::exists(path_, ec)) return false;
        throw ArchiveError(ErrorCode::PersistenceFailure, "ledger: cannot read " + path_);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        state_ = nlohmann::json::parse(buffer.str()).get<TokenState>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "UsageLedger: corrupt ledger " << path_ << ": " << e.what() << "\n";
        throw ArchiveError(ErrorCode::PersistenceFailure, "ledger: corrupt state in " + path_);
    }
    return true;
}

} // namespace nsm
