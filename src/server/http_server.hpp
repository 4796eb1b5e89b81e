#pragma once

#include <string>

#include "config/config_schema.hpp"
#include "httplib.h"
#include "server/api_controller.hpp"

namespace dailyfeels::server {

class HttpServer {
public:
    HttpServer(config::ServerConfig config, ApiController& controller);

    // Binds the configured address; port 0 picks a free port. Returns the
    // bound port, or -1 on failure.
    int Bind();
    // Blocks until Stop() is called or the socket cannot be bound. Binds
    // first unless Bind() already succeeded.
    bool Listen();
    void Stop();

    // Value for Access-Control-Allow-Origin, empty when the origin is not allowed.
    std::string AllowedOrigin(const std::string& origin) const;

private:
    void RegisterRoutes();
    static void Write(const ApiResponse& api, httplib::Response& res);
    static std::string Param(const httplib::Request& req, const char* name);

    config::ServerConfig config_;
    ApiController& controller_;
    httplib::Server server_;
    int bound_port_ = -1;
};

}  // namespace dailyfeels::server
