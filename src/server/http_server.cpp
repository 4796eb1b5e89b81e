#include "server/http_server.hpp"

#include <algorithm>
#include <utility>

#include "utils/logging.hpp"

namespace dailyfeels::server {

HttpServer::HttpServer(config::ServerConfig config, ApiController& controller)
    : config_(std::move(config))
    , controller_(controller) {
    RegisterRoutes();
}

int HttpServer::Bind() {
    if (config_.port == 0) {
        bound_port_ = server_.bind_to_any_port(config_.host);
    } else {
        bound_port_ = server_.bind_to_port(config_.host, config_.port) ? config_.port : -1;
    }
    if (bound_port_ < 0) {
        utils::LogError("http", "failed to bind " + config_.host + ":" + std::to_string(config_.port));
    }
    return bound_port_;
}

bool HttpServer::Listen() {
    if (bound_port_ < 0 && Bind() < 0) {
        return false;
    }
    utils::LogInfo("http", "listening on " + config_.host + ":" + std::to_string(bound_port_));
    const bool ok = server_.listen_after_bind();
    if (!ok) {
        utils::LogError("http", "server stopped listening on " + config_.host + ":" + std::to_string(bound_port_));
    }
    return ok;
}

void HttpServer::Stop() {
    server_.stop();
}

std::string HttpServer::AllowedOrigin(const std::string& origin) const {
    const auto& origins = config_.cors_origins;
    if (std::find(origins.begin(), origins.end(), "*") != origins.end()) {
        return "*";
    }
    if (!origin.empty() && std::find(origins.begin(), origins.end(), origin) != origins.end()) {
        return origin;
    }
    return {};
}

void HttpServer::RegisterRoutes() {
    auto health = [this](const httplib::Request&, httplib::Response& res) {
        Write(controller_.Health(), res);
    };
    server_.Get("/api", health);
    server_.Get("/api/", health);

    server_.Get("/api/moods/defaults", [this](const httplib::Request&, httplib::Response& res) {
        Write(controller_.GetDefaultMoods(), res);
    });
    server_.Get("/api/moods/config", [this](const httplib::Request&, httplib::Response& res) {
        Write(controller_.GetMoodConfig(), res);
    });
    server_.Post("/api/moods/config", [this](const httplib::Request& req, httplib::Response& res) {
        Write(controller_.SetMoodConfig(req.body), res);
    });

    server_.Post("/api/entries", [this](const httplib::Request& req, httplib::Response& res) {
        Write(controller_.CreateEntry(req.body), res);
    });
    server_.Get("/api/entries", [this](const httplib::Request& req, httplib::Response& res) {
        Write(controller_.ListEntries(ApiController::MakeRange(Param(req, "start"), Param(req, "end"))), res);
    });
    server_.Delete(R"(/api/entries/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        Write(controller_.DeleteEntry(req.matches[1]), res);
    });

    server_.Get("/api/export/pdf", [this](const httplib::Request& req, httplib::Response& res) {
        Write(controller_.ExportPdf(ApiController::MakeRange(Param(req, "start"), Param(req, "end"))), res);
    });

    server_.Options(R"(/api/.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
        res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "*");
    });

    server_.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        const auto allowed = AllowedOrigin(req.get_header_value("Origin"));
        if (!allowed.empty()) {
            res.set_header("Access-Control-Allow-Origin", allowed);
            if (allowed != "*") {
                res.set_header("Access-Control-Allow-Credentials", "true");
                res.set_header("Vary", "Origin");
            }
        }
    });

    server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        utils::Log(utils::LogMessage{
            utils::LogLevel::kInfo,
            "http",
            req.method + " " + req.path,
            {{"status", std::to_string(res.status)}}});
    });
}

void HttpServer::Write(const ApiResponse& api, httplib::Response& res) {
    res.status = api.status;
    for (const auto& [name, value] : api.headers) {
        res.set_header(name, value);
    }
    res.set_content(api.body, api.content_type);
}

std::string HttpServer::Param(const httplib::Request& req, const char* name) {
    return req.has_param(name) ? req.get_param_value(name) : std::string();
}

}  // namespace dailyfeels::server
