#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "httplib.h"
#include "NsmEngine.hpp"
#include <nlohmann/json.hpp>

class NsmHttpServer {
public:
    NsmHttpServer(std::string host, int port, nsm::Config config);
    void run();

    // HTTP status for an engine error.
    static int statusFor(nsm::ErrorCode code);

private:
    void setupRoutes();

    std::string host_;
    int port_;
    httplib::Server server_;
    nsm::Config config_;
    nsm::MarketplaceClient authority_;
    nsm::Compressor compressor_;
    nsm::UsageLedger ledger_;
    nsm::NsmEngine engine_;
    std::chrono::steady_clock::time_point startTime_;
};
