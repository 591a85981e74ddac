#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "nsm/Format.hpp"

namespace nsm {

struct Config {
    // Directory holding the ledger file; defaults to $HOME.
    std::string homeDir;
    Algorithm algorithm = Algorithm::Zstd;
    int zstdLevel = 3;
    int gzipLevel = 6;
    // 0 means max(1, hardware_concurrency / 2).
    size_t maxCodecJobs = 0;
    size_t searchLimit = 100;
    bool buildSearchIndex = true;
    // 64 hex chars enable AES-256-GCM frame encryption.
    std::string encryptionKeyHex;
    int64_t freeTokens = 1;
    std::string marketplaceUrl = "http://localhost:8080";
    std::string licenseKey;
    std::string host = "0.0.0.0";
    int port = 8080;
    bool verbose = false;

    // Read NSM_* variables on top of the defaults; malformed values keep the default.
    static Config fromEnvironment();

    std::string ledgerPath() const;
    nlohmann::json toJson() const;
};

} // namespace nsm
