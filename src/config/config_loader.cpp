#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace dailyfeels::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        if (server.contains("host") && server["host"].is_string()) {
            config.server.host = server["host"].get<std::string>();
        }
        if (server.contains("port") && server["port"].is_number_integer()) {
            config.server.port = server["port"].get<int>();
        }
        if (server.contains("corsOrigins") && server["corsOrigins"].is_array()) {
            config.server.cors_origins.clear();
            for (const auto& item : server["corsOrigins"]) {
                if (item.is_string()) {
                    config.server.cors_origins.push_back(item.get<std::string>());
                }
            }
        }
    }

    if (data.contains("storage") && data["storage"].is_object()) {
        const auto& storage = data["storage"];
        if (storage.contains("databasePath") && storage["databasePath"].is_string()) {
            config.storage.database_path = storage["databasePath"].get<std::string>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

}  // namespace

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto overridden = GetEnv("DAILYFEELS_CONFIG");
    if (!overridden.empty()) {
        return std::filesystem::path(ExpandHome(overridden));
    }
    return GetHomePath() / ".dailyfeels" / "config.json";
}

std::string ExpandHome(const std::string& path) {
    if (path == "~") {
        return GetHomePath().string();
    }
    if (path.rfind("~/", 0) == 0) {
        return (GetHomePath() / path.substr(2)).string();
    }
    return path;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::LogWarn("config", "ignoring unparsable config file " + config_path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    const auto host = GetEnvFallback("DAILYFEELS_SERVER__HOST", "DAILYFEELS_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("DAILYFEELS_SERVER__PORT", "DAILYFEELS_PORT");
    if (!port.empty()) {
        config.server.port = ParseInt(port, config.server.port);
    }

    const auto cors_origins = GetEnvFallback("DAILYFEELS_SERVER__CORS_ORIGINS", "CORS_ORIGINS");
    if (!cors_origins.empty()) {
        config.server.cors_origins = utils::SplitCsv(cors_origins);
    }

    const auto database_path = GetEnvFallback(
        "DAILYFEELS_STORAGE__DATABASE_PATH",
        "DAILYFEELS_DB_PATH");
    if (!database_path.empty()) {
        config.storage.database_path = database_path;
    }

    const auto log_level = GetEnvFallback("DAILYFEELS_LOGGING__LEVEL", "DAILYFEELS_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    config.storage.database_path = ExpandHome(config.storage.database_path);
    return config;
}

}  // namespace dailyfeels::config
