#include "PhonoMatchHttpServer.hpp"

#include <algorithm>
#include <iostream>

using json = nlohmann::json;

PhonoMatchHttpServer::PhonoMatchHttpServer(std::string host, int port, std::string corpusPath)
    : host_(std::move(host)), port_(port), engine_(corpusPath), corpusPath_(std::move(corpusPath)),
      startTime_(std::chrono::steady_clock::now()) {
    setupRoutes();
}

void PhonoMatchHttpServer::run() {
    std::cout << "PhonoMatch HTTP server listening on "
              << host_ << ":" << port_ << std::endl;
    if (!server_.listen(host_.c_str(), port_)) {
        throw std::runtime_error("failed to listen on " + host_ + ":" + std::to_string(port_));
    }
}

void PhonoMatchHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    // CORS helper to add to ALL responses
    auto addCors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    };

    auto fail = [err, addCors](httplib::Response& res, int code, const std::string& message) {
        res.status = code;
        res.set_content(err(code, message).dump(), "application/json");
        addCors(res);
    };

    auto parseBounded = [](const std::string& val, int def, int min, int max) -> int {
        if (val.empty()) return def;
        try {
            int v = std::stoi(val);
            return std::min(std::max(v, min), max);
        }
        catch (const std::exception&) { return def; }
    };

    // Handle preflight OPTIONS requests for ANY route
    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_).count();
        res.set_content(ok(json{{"uptime_seconds", uptime}}).dump(), "application/json");
        addCors(res);
    });

    // --- CONFIG ---
    server_.Get("/v1/config", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        res.set_content(ok(engine_.config()).dump(), "application/json");
        addCors(res);
    });

    // --- STATS ---
    server_.Get("/v1/stats", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        res.set_content(ok(engine_.stats()).dump(), "application/json");
        addCors(res);
    });

    // --- REPORT ---
    server_.Get("/v1/report", [this, addCors](const httplib::Request&, httplib::Response& res) {
        res.set_content(engine_.report(), "text/plain");
        addCors(res);
    });

    // --- BEST MATCH ---
    server_.Get("/v1/match", [this, ok, fail, addCors](const httplib::Request& req, httplib::Response& res) {
        if (!req.has_param("q")) {
            fail(res, 400, "Missing query parameter 'q'");
            return;
        }
        auto q = req.get_param_value("q");
        try {
            auto idx = engine_.snapshot();
            auto result = phonomatch::algo::findBestMatch(q, *idx);
            json data = result;
            data["query"] = q;
            data["sample"] = idx->sample(result.sampleId);
            res.set_content(ok(data).dump(), "application/json");
        } catch (const phonomatch::NoMatchError& e) {
            fail(res, 404, e.what());
            return;
        }
        addCors(res);
    });

    // --- SEARCH ---
    server_.Get("/v1/search", [this, ok, fail, parseBounded, addCors](const httplib::Request& req, httplib::Response& res) {
        auto q = req.get_param_value("q");
        if (q.empty()) {
            fail(res, 400, "Missing query parameter 'q'");
            return;
        }
        int size = parseBounded(req.get_param_value("size"), static_cast<int>(engine_.searchLimit()), 1, 500);
        auto samples = engine_.search(q, static_cast<size_t>(size));
        json data = {
            {"query", q},
            {"size", size},
            {"total", samples.size()},
            {"hits", samples}
        };
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });

    // --- LIST CATEGORY ---
    server_.Get(R"(/v1/categories/([^/]+))", [this, ok, fail, parseBounded, addCors](const httplib::Request& req, httplib::Response& res) {
        std::string category = req.matches[1];
        int size = parseBounded(req.get_param_value("size"), static_cast<int>(engine_.searchLimit()), 1, 1'000'000);
        try {
            auto samples = engine_.listCategory(category);
            const size_t total = samples.size();
            if (samples.size() > static_cast<size_t>(size)) samples.resize(static_cast<size_t>(size));
            json data = {
                {"category", category},
                {"total", total},
                {"samples", samples}
            };
            res.set_content(ok(data).dump(), "application/json");
        } catch (const phonomatch::UnknownCategoryError& e) {
            fail(res, 404, e.what());
            return;
        }
        addCors(res);
    });

    // --- GET SAMPLE ---
    server_.Get(R"(/v1/samples/([^/]+))", [this, ok, fail, addCors](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        try {
            res.set_content(ok(engine_.getSample(id)).dump(), "application/json");
        } catch (const phonomatch::UnknownSampleIdError& e) {
            fail(res, 404, e.what());
            return;
        }
        addCors(res);
    });

    // --- ANALYZE SAMPLE ---
    server_.Get(R"(/v1/samples/([^/]+)/analysis)", [this, ok, fail, addCors](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        try {
            res.set_content(ok(engine_.analyze(id)).dump(), "application/json");
        } catch (const phonomatch::UnknownSampleIdError& e) {
            fail(res, 404, e.what());
            return;
        } catch (const phonomatch::MalformedTranscriptionError& e) {
            fail(res, 422, e.what());
            return;
        }
        addCors(res);
    });

    // --- RELOAD CORPUS ---
    server_.Post("/v1/reload", [this, ok, fail, addCors](const httplib::Request& req, httplib::Response& res) {
        std::string path = req.get_param_value("path");
        if (path.empty()) path = engine_.config().value("corpus_path", corpusPath_);
        if (path.empty()) {
            fail(res, 400, "No corpus path configured");
            return;
        }
        try {
            if (!engine_.loadCorpus(path)) {
                fail(res, 500, "Failed to load corpus " + path);
                return;
            }
        } catch (const phonomatch::InvalidCorpusError& e) {
            fail(res, 500, std::string("Invalid corpus: ") + e.what());
            return;
        }
        json data = {
            {"path", path},
            {"samples", engine_.stats().sampleCount}
        };
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });
}
