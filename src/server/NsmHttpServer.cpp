#include "NsmHttpServer.hpp"

#include <algorithm>
#include <functional>
#include <iostream>

using json = nlohmann::json;

namespace {

nsm::Compressor::Options codecOptions(const nsm::Config& config) {
    nsm::Compressor::Options options;
    options.maxJobs = config.maxCodecJobs;
    options.zstdLevel = config.zstdLevel;
    options.gzipLevel = config.gzipLevel;
    return options;
}

json toJson(const nsm::ArchiveSummary& s) {
    return json{{"output", s.outputPath},
                {"files", s.fileCount},
                {"uncompressed_bytes", s.uncompressedBytes},
                {"data_bytes", s.dataBytes},
                {"index_bytes", s.indexBytes},
                {"algorithm", nsm::algorithmName(s.algorithm)},
                {"encrypted", s.encryption != nsm::Encryption::None},
                {"search_terms", s.searchTerms},
                {"tokens_remaining", s.tokensRemaining}};
}

json toJson(const nsm::ExtractReport& report) {
    json failures = json::array();
    for (const auto& f : report.failures) {
        failures.push_back({{"path", f.path}, {"kind", nsm::errorCodeName(f.code)}, {"message", f.message}});
    }
    return json{{"extracted", report.extracted}, {"failures", failures}, {"complete", report.complete()}};
}

json toJson(const nsm::ArchiveInfo& info) {
    json entries = json::array();
    for (const auto& e : info.entries) {
        entries.push_back({{"path", e.path},
                           {"size", e.uncompressedSize},
                           {"compressed_size", e.compressedSize},
                           {"offset", e.offset},
                           {"mtime", e.mtime},
                           {"mode", e.mode},
                           {"crc32", e.checksum}});
    }
    const auto& h = info.header;
    return json{{"version", h.version},
                {"algorithm", nsm::algorithmName(h.algorithm)},
                {"encrypted", h.encryption != nsm::Encryption::None},
                {"search_index", h.hasSearchIndex()},
                {"search_terms", info.searchTerms},
                {"created_ns", h.timestamp},
                {"data_bytes", h.dataLength},
                {"index_bytes", h.indexLength},
                {"data_sha256", nsm::toHex(h.dataChecksum)},
                {"entries", entries}};
}

nsm::SearchMode parseMode(const std::string& mode) {
    if (mode.empty() || mode == "auto") return nsm::SearchMode::Auto;
    if (mode == "index") return nsm::SearchMode::Index;
    if (mode == "scan") return nsm::SearchMode::Scan;
    throw nsm::ArchiveError(nsm::ErrorCode::InvalidArgument, "unknown search mode: " + mode);
}

} // namespace

NsmHttpServer::NsmHttpServer(std::string host, int port, nsm::Config config)
    : host_(std::move(host)),
      port_(port),
      config_(std::move(config)),
      authority_(config_.marketplaceUrl),
      compressor_(codecOptions(config_)),
      ledger_(config_.ledgerPath(), config_.freeTokens, config_.licenseKey, &authority_),
      engine_(config_, compressor_, ledger_),
      startTime_(std::chrono::steady_clock::now()) {
    setupRoutes();
}

void NsmHttpServer::run() {
    std::cout << "NSM HTTP server listening on "
              << host_ << ":" << port_ << std::endl;
    if (!server_.listen(host_.c_str(), port_)) {
        throw std::runtime_error("failed to listen on " + host_ + ":" + std::to_string(port_));
    }
}

int NsmHttpServer::statusFor(nsm::ErrorCode code) {
    using nsm::ErrorCode;
    switch (code) {
    case ErrorCode::InvalidArgument: return 400;
    case ErrorCode::InvalidFormat:
    case ErrorCode::UnsupportedVersion:
    case ErrorCode::UnsupportedAlgorithm: return 422;
    case ErrorCode::ChecksumMismatch:
    case ErrorCode::DecryptionFailure: return 409;
    case ErrorCode::NoTokensAvailable: return 402;
    case ErrorCode::ArchiveReadFailure: return 404;
    case ErrorCode::ValidationFailure: return 502;
    default: return 500;
    }
}

void NsmHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& kind, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"kind", kind},
                {"message", message}
            }}
        };
    };

    auto isJsonContent = [](const httplib::Request& req) {
        auto ct = req.get_header_value("Content-Type");
        return ct.find("application/json") != std::string::npos;
    };

    // CORS helper to add to ALL responses
    auto addCors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    };

    // Runs a handler body and maps engine errors onto the envelope.
    auto guarded = [ok, err, addCors](httplib::Response& res, const std::function<json()>& body) {
        try {
            json data = body();
            res.set_content(ok(data).dump(), "application/json");
        } catch (const nsm::ArchiveError& e) {
            int status = statusFor(e.code());
            if (status >= 500) std::cerr << "NsmHttpServer: " << e.what() << "\n";
            json envelope = err(status, nsm::errorCodeName(e.code()), e.what());
            envelope["error"]["retriable"] = nsm::isRetriable(e.code());
            res.status = status;
            res.set_content(envelope.dump(), "application/json");
        } catch (const json::exception& e) {
            res.status = 400;
            res.set_content(err(400, "InvalidArgument", std::string("Invalid JSON: ") + e.what()).dump(),
                            "application/json");
        } catch (const std::exception& e) {
            std::cerr << "NsmHttpServer: " << e.what() << "\n";
            res.status = 500;
            res.set_content(err(500, "Internal", e.what()).dump(), "application/json");
        }
        addCors(res);
    };

    auto requireJson = [err, isJsonContent, addCors](const httplib::Request& req, httplib::Response& res) {
        if (isJsonContent(req)) return true;
        res.status = 415;
        res.set_content(err(415, "InvalidArgument", "Content-Type must be application/json").dump(),
                        "application/json");
        addCors(res);
        return false;
    };

    // Handle preflight OPTIONS requests for ANY route
    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, guarded](const httplib::Request&, httplib::Response& res) {
        guarded(res, [this] {
            auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - startTime_).count();
            return json{{"uptime_seconds", uptime},
                        {"codec_jobs", compressor_.maxJobs()},
                        {"active_codec_jobs", compressor_.activeJobs()},
                        {"peak_codec_jobs", compressor_.peakJobs()},
                        {"config", config_.toJson()}};
        });
    });

    // --- TOKENS ---
    server_.Get("/v1/tokens", [this, guarded](const httplib::Request&, httplib::Response& res) {
        guarded(res, [this] {
            auto state = ledger_.snapshot();
            return json{{"available_tokens", state.availableTokens},
                        {"last_sync", state.lastSync},
                        {"licensed", !state.licenseKey.empty()}};
        });
    });

    server_.Post("/v1/tokens/validate", [this, guarded](const httplib::Request&, httplib::Response& res) {
        guarded(res, [this] {
            ledger_.validateOnline();
            return json{{"available_tokens", ledger_.availableTokens()}};
        });
    });

    server_.Post("/v1/tokens/purchase", [this, guarded, requireJson](const httplib::Request& req, httplib::Response& res) {
        if (!requireJson(req, res)) return;
        guarded(res, [this, &req] {
            auto j = json::parse(req.body);
            auto order = ledger_.initiatePurchase(j.value("count", int64_t{0}));
            return json{{"payment_url", order.paymentUrl}, {"order_id", order.orderId}};
        });
    });

    // --- CREATE ARCHIVE ---
    server_.Post("/v1/archives", [this, guarded, requireJson](const httplib::Request& req, httplib::Response& res) {
        if (!requireJson(req, res)) return;
        guarded(res, [this, &req, &res] {
            auto j = json::parse(req.body);
            auto output = j.value("output", std::string());
            auto inputs = j.value("inputs", std::vector<std::string>{});
            nsm::CreateOptions options;
            if (j.contains("algorithm")) options.algorithm = nsm::parseAlgorithm(j.at("algorithm").get<std::string>());
            if (j.contains("encrypt")) options.encrypt = j.at("encrypt").get<bool>();
            if (j.contains("search_index")) options.buildSearchIndex = j.at("search_index").get<bool>();
            auto summary = engine_.create(output, inputs, options);
            res.status = 201;
            return toJson(summary);
        });
    });

    // --- EXTRACT ---
    server_.Post("/v1/archives/extract", [this, guarded, requireJson](const httplib::Request& req, httplib::Response& res) {
        if (!requireJson(req, res)) return;
        guarded(res, [this, &req] {
            auto j = json::parse(req.body);
            auto archive = j.value("archive", std::string());
            auto destination = j.value("destination", std::string());
            if (archive.empty() || destination.empty()) {
                throw nsm::ArchiveError(nsm::ErrorCode::InvalidArgument, "archive and destination are required");
            }
            if (j.contains("paths")) {
                return toJson(engine_.extract(archive, j.at("paths").get<std::vector<std::string>>(), destination));
            }
            return toJson(engine_.extractAll(archive, destination));
        });
    });

    // --- SEARCH ---
    server_.Get("/v1/archives/search", [this, guarded](const httplib::Request& req, httplib::Response& res) {
        auto parseBounded = [](const std::string& val, int def, int min, int max) -> int {
            if (val.empty()) return def;
            try {
                int v = std::stoi(val);
                return std::min(std::max(v, min), max);
            }
            catch (const std::exception&) { return def; }
        };

        guarded(res, [this, &req, parseBounded] {
            auto archive = req.get_param_value("archive");
            auto q = req.get_param_value("q");
            if (archive.empty()) {
                throw nsm::ArchiveError(nsm::ErrorCode::InvalidArgument, "archive parameter is required");
            }
            nsm::SearchOptions options;
            options.mode = parseMode(req.get_param_value("mode"));
            options.maxResults = static_cast<size_t>(
                parseBounded(req.get_param_value("size"), static_cast<int>(config_.searchLimit), 1, 10000));

            json hits = json::array();
            for (const auto& r : engine_.search(archive, q, options)) {
                hits.push_back({{"path", r.path}, {"matches", r.matches}, {"density", r.density}});
            }
            return json{{"query", q}, {"hits", hits}};
        });
    });

    // --- INFO ---
    server_.Get("/v1/archives/info", [this, guarded](const httplib::Request& req, httplib::Response& res) {
        guarded(res, [this, &req] {
            auto archive = req.get_param_value("archive");
            if (archive.empty()) {
                throw nsm::ArchiveError(nsm::ErrorCode::InvalidArgument, "archive parameter is required");
            }
            return toJson(engine_.inspect(archive));
        });
    });
}
