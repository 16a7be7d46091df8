#include "server_logger.h"

#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace toolhub_server {

namespace {

spdlog::level::level_enum toSpdlogLevel(const QString& level) {
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn")  return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

QtMessageHandler s_previousHandler = nullptr;
bool s_installed = false;

void qtToSpdlogHandler(QtMsgType type,
                       const QMessageLogContext&,
                       const QString& msg) {
    auto logger = spdlog::default_logger();
    const std::string text = msg.toStdString();
    switch (type) {
    case QtDebugMsg:    logger->debug("{}", text); break;
    case QtInfoMsg:     logger->info("{}", text); break;
    case QtWarningMsg:  logger->warn("{}", text); break;
    case QtCriticalMsg: logger->error("{}", text); break;
    case QtFatalMsg:    logger->critical("{}", text); logger->flush(); abort();
    }
}

} // namespace

bool ServerLogger::init(const Config& config, QString& error) {
    try {
        auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        std::vector<spdlog::sink_ptr> sinks{consoleSink};
        if (!config.logDir.isEmpty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (config.logDir + "/" + kLogFileName).toStdString(),
                static_cast<size_t>(config.maxFileBytes),
                static_cast<size_t>(config.maxFiles)));
        }

        auto logger = std::make_shared<spdlog::logger>("toolhub", sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(config.logLevel));
        logger->set_pattern("%Y-%m-%dT%H:%M:%S.%eZ [%L] %v",
                            spdlog::pattern_time_type::utc);
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);
        if (!s_installed) {
            s_previousHandler = qInstallMessageHandler(qtToSpdlogHandler);
            s_installed = true;
        }
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        error = QString("failed to initialize logger: %1").arg(ex.what());
        return false;
    }
}

void ServerLogger::shutdown() {
    if (s_installed) {
        qInstallMessageHandler(s_previousHandler);
        s_previousHandler = nullptr;
        s_installed = false;
    }
    spdlog::shutdown();
}

} // namespace toolhub_server
