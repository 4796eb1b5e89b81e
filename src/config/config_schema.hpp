#pragma once

#include <string>
#include <vector>

namespace dailyfeels::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8001;
    std::vector<std::string> cors_origins = {"*"};
};

struct StorageConfig {
    std::string database_path = "~/.dailyfeels/journal.db";
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    ServerConfig server;
    StorageConfig storage;
    LoggingConfig logging;
};

}  // namespace dailyfeels::config
