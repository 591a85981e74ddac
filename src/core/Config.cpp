#include "nsm/Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include "nsm/Errors.hpp"
#include "nsm/UsageLedger.hpp"

using json = nlohmann::json;

namespace nsm {

namespace {

bool parseFlag(const std::string& v, bool def) {
    if (v == "0" || v == "false" || v == "off" || v == "no") return false;
    if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
    return def;
}

void ignored(const char* name, const char* value) {
    std::cerr << "Config: ignoring invalid " << name << "=" << value << "\n";
}

} // namespace

Config Config::fromEnvironment() {
    Config cfg;
    if (const char* home = std::getenv("HOME")) {
        cfg.homeDir = home;
    }
    if (const char* envHome = std::getenv("NSM_HOME")) {
        cfg.homeDir = envHome;
    }
    if (const char* envAlgo = std::getenv("NSM_ALGORITHM")) {
        try { cfg.algorithm = parseAlgorithm(envAlgo); }
        catch (const ArchiveError& e) {
            std::cerr << "Config: ignoring NSM_ALGORITHM: " << e.what() << "\n";
        }
    }
    if (const char* envZstd = std::getenv("NSM_ZSTD_LEVEL")) {
        try { cfg.zstdLevel = std::clamp(std::stoi(envZstd), 1, 19); }
        catch (const std::exception&) { ignored("NSM_ZSTD_LEVEL", envZstd); }
    }
    if (const char* envGzip = std::getenv("NSM_GZIP_LEVEL")) {
        try { cfg.gzipLevel = std::clamp(std::stoi(envGzip), 1, 9); }
        catch (const std::exception&) { ignored("NSM_GZIP_LEVEL", envGzip); }
    }
    if (const char* envJobs = std::getenv("NSM_MAX_CODEC_JOBS")) {
        try { cfg.maxCodecJobs = std::max<size_t>(1, static_cast<size_t>(std::stoull(envJobs))); }
        catch (const std::exception&) { ignored("NSM_MAX_CODEC_JOBS", envJobs); }
    }
    if (const char* envLimit = std::getenv("NSM_SEARCH_LIMIT")) {
        try { cfg.searchLimit = std::max<size_t>(1, static_cast<size_t>(std::stoull(envLimit))); }
        catch (const std::exception&) { ignored("NSM_SEARCH_LIMIT", envLimit); }
    }
    if (const char* envIdx = std::getenv("NSM_BUILD_SEARCH_INDEX")) {
        cfg.buildSearchIndex = parseFlag(envIdx, cfg.buildSearchIndex);
    }
    if (const char* envKey = std::getenv("NSM_ENCRYPTION_KEY")) {
        cfg.encryptionKeyHex = envKey;
    }
    if (const char* envFree = std::getenv("NSM_FREE_TOKENS")) {
        try { cfg.freeTokens = std::max<int64_t>(0, std::stoll(envFree)); }
        catch (const std::exception&) { ignored("NSM_FREE_TOKENS", envFree); }
    }
    if (const char* envUrl = std::getenv("NSM_MARKETPLACE_URL")) {
        cfg.marketplaceUrl = envUrl;
    }
    if (const char* envLicense = std::getenv("NSM_LICENSE_KEY")) {
        cfg.licenseKey = envLicense;
    }
    if (const char* envHost = std::getenv("NSM_HOST")) {
        cfg.host = envHost;
    }
    if (const char* envPort = std::getenv("NSM_PORT")) {
        try { cfg.port = std::clamp(std::stoi(envPort), 1, 65535); }
        catch (const std::exception&) { ignored("NSM_PORT", envPort); }
    }
    if (const char* envVerbose = std::getenv("NSM_VERBOSE")) {
        cfg.verbose = parseFlag(envVerbose, cfg.verbose);
    }
    return cfg;
}

std::string Config::ledgerPath() const {
    std::filesystem::path base = homeDir.empty() ? std::filesystem::current_path() : std::filesystem::path(homeDir);
    return (base / UsageLedger::kFileName).string();
}

json Config::toJson() const {
    json j{
        {"home_dir", homeDir},
        {"ledger_path", ledgerPath()},
        {"algorithm", algorithmName(algorithm)},
        {"zstd_level", zstdLevel},
        {"gzip_level", gzipLevel},
        {"max_codec_jobs", maxCodecJobs},
        {"search_limit", searchLimit},
        {"build_search_index", buildSearchIndex},
        {"encryption", encryptionKeyHex.empty() ? "none" : "aes-256-gcm"},
        {"free_tokens", freeTokens},
        {"marketplace_url", marketplaceUrl},
        {"license_key_set", !licenseKey.empty()},
        {"host", host},
        {"port", port},
        {"verbose", verbose}
    };
    return j;
}

} // namespace nsm
