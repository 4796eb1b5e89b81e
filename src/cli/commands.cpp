#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

#include <signal.h>

#include <QGuiApplication>

#include "config/config_loader.hpp"
#include "journal/entry_store.hpp"
#include "journal/errors.hpp"
#include "journal/mood_config_service.hpp"
#include "report/report_builder.hpp"
#include "server/api_controller.hpp"
#include "server/http_server.hpp"
#include "store/sqlite_store.hpp"
#include "utils/logging.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void ApplyLogging(const dailyfeels::config::Config& config) {
    dailyfeels::utils::LogConfig log_config{};
    log_config.min_level = dailyfeels::utils::ParseLogLevel(config.logging.level, log_config.min_level);
    dailyfeels::utils::SetLogConfig(log_config);
}

// "-" and "" both mean the bound is absent.
std::string ArgOrEmpty(int argc, char** argv, int index) {
    if (index >= argc) {
        return {};
    }
    const std::string value = argv[index];
    return value == "-" ? std::string() : value;
}

int RunServer() {
    const auto config = dailyfeels::config::LoadConfig();
    ApplyLogging(config);

    dailyfeels::store::SqliteStore store(config.storage.database_path);
    dailyfeels::journal::EntryStore entries(store);
    dailyfeels::journal::MoodConfigService moods(store);
    dailyfeels::server::ApiController controller(entries, moods);
    dailyfeels::server::HttpServer http_server(config.server, controller);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed]() {
        if (!http_server.Listen()) {
            listen_failed.store(true);
        }
    });

    dailyfeels::utils::LogInfo("main", "dailyfeels started with database " + store.Path());
    while (g_running.load()) {
        if (g_signal != 0 || listen_failed.load()) {
            g_running.store(false);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    dailyfeels::utils::LogInfo("main", "dailyfeels stopped");
    return listen_failed.load() ? 1 : 0;
}

int RunExport(int argc, char** argv) {
    const auto config = dailyfeels::config::LoadConfig();
    ApplyLogging(config);

    const auto range = dailyfeels::server::ApiController::MakeRange(
        ArgOrEmpty(argc, argv, 2),
        ArgOrEmpty(argc, argv, 3));

    dailyfeels::store::SqliteStore store(config.storage.database_path);
    dailyfeels::journal::EntryStore entries(store);
    dailyfeels::journal::MoodConfigService moods(store);
    dailyfeels::report::ReportBuilder builder;

    const auto artifact = builder.Export(entries.List(range), moods.GetConfiguration(), range);
    const auto output = argc > 4 ? std::string(argv[4]) : artifact.filename;
    std::ofstream file(output, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        dailyfeels::utils::LogError("main", "failed to open " + output + " for writing");
        return 1;
    }
    file.write(artifact.content.data(), static_cast<std::streamsize>(artifact.content.size()));
    if (!file) {
        dailyfeels::utils::LogError("main", "failed to write " + output);
        return 1;
    }
    std::cout << "Wrote " << output << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string command = argc >= 2 ? argv[1] : "serve";

    // PDF export lays out text through Qt; no display is needed.
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);

    try {
        if (command == "serve") {
            return RunServer();
        }
        if (command == "export") {
            return RunExport(argc, argv);
        }
    } catch (const dailyfeels::journal::PersistenceUnavailable&) {
        // The store has already logged the failure.
        return 1;
    }

    std::cout << "Usage: dailyfeels serve | dailyfeels export [start] [end] [output.pdf]" << std::endl;
    return 1;
}
