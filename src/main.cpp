#include "gui/ApplicationShell.hpp"
#include "gui/SystemTrayBackend.hpp"
#include "utils/AutostartManager.hpp"
#include "utils/ConfigManager.hpp"
#include "core/Logger.hpp"
#include "percent-tray/Constants.hpp"
#include <QApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QMessageBox>
#include <QDir>
#include <QFile>
#include <iostream>

using namespace percent_tray;

#ifndef PERCENT_TRAY_VERSION
#define PERCENT_TRAY_VERSION "0.0.0"
#endif

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("Shows a percentage as a live system tray icon");
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOption(QCommandLineOption(
        QStringList() << "c" << "config",
        "Specify configuration file path.",
        "config"
    ));
    parser.addOption(QCommandLineOption(
        QStringList() << "l" << "log-file",
        "Specify log file path.",
        "log-file"
    ));
    parser.addOption(QCommandLineOption(
        QStringList() << "v" << "verbosity",
        "Set log level (0-4: debug, info, warning, error, critical).",
        "level"
    ));
    parser.addOption(QCommandLineOption(
        QStringList() << "m" << "metric",
        "Value to display: battery, cpu or disk.",
        "metric"
    ));
    parser.addOption(QCommandLineOption(
        QStringList() << "s" << "style",
        "Icon style: numeral or gauge.",
        "style"
    ));
    parser.addOption(QCommandLineOption(
        QStringList() << "i" << "interval",
        "Polling interval in milliseconds.",
        "ms"
    ));
    parser.addOption(QCommandLineOption(
        QStringList() << "icon-size",
        "Tray icon size in pixels.",
        "px"
    ));
}

bool loadConfiguration(ConfigManager& config, const QCommandLineParser& parser) {
    QString configPath;

    if (parser.isSet("config")) {
        configPath = parser.value("config");
    } else {
        QStringList configLocations = {
            QDir::currentPath() + "/config.json",
            QDir::homePath() + "/.config/percent-tray/config.json",
            "/etc/percent-tray/config.json"
        };

        for (const auto& path : configLocations) {
            if (QFile::exists(path)) {
                configPath = path;
                break;
            }
        }
    }

    if (!configPath.isEmpty()) {
        if (config.loadFromFile(configPath.toStdString())) {
            LOG_INFO("Loaded configuration from " + configPath.toStdString());
        } else if (parser.isSet("config")) {
            LOG_ERROR("Failed to load configuration from " + configPath.toStdString());
            return false;
        } else {
            LOG_WARNING("Failed to load configuration from " +
                        configPath.toStdString() + ", using defaults");
            config.resetToDefaults();
        }
    } else {
        LOG_INFO("No configuration file found, using defaults");
    }

    // Command line wins over the file
    if (parser.isSet("metric")) {
        config.setString(ConfigKeys::METRIC, parser.value("metric").toStdString());
    }
    if (parser.isSet("style")) {
        config.setString(ConfigKeys::ICON_STYLE, parser.value("style").toStdString());
    }
    if (parser.isSet("interval")) {
        config.setInt(ConfigKeys::POLL_INTERVAL, parser.value("interval").toInt());
    }
    if (parser.isSet("icon-size")) {
        config.setInt(ConfigKeys::ICON_SIZE, parser.value("icon-size").toInt());
    }
    if (parser.isSet("verbosity")) {
        config.setInt(ConfigKeys::LOG_LEVEL, parser.value("verbosity").toInt());
    }
    if (parser.isSet("log-file")) {
        config.setString(ConfigKeys::LOG_FILE, parser.value("log-file").toStdString());
    }
    return true;
}

void initializeLogger(const ConfigManager& config) {
    auto& logger = Logger::instance();

    const std::string logFile = config.getString(ConfigKeys::LOG_FILE);
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
        logger.setLogDestination(LogDestination::All);
    }

    logger.setLogLevel(logLevelFromVerbosity(config.getInt(ConfigKeys::LOG_LEVEL, 1)));
}

int main(int argc, char *argv[]) {
    try {
        QApplication app(argc, argv);
        app.setApplicationName("percent-tray");
        app.setApplicationDisplayName("Percent Tray");
        app.setApplicationVersion(PERCENT_TRAY_VERSION);
        app.setQuitOnLastWindowClosed(false);

        QCommandLineParser parser;
        setupCommandLineParser(parser);
        parser.process(app);

        ConfigManager config;
        if (!loadConfiguration(config, parser)) {
            return ExitCodes::CONFIG_ERROR;
        }
        initializeLogger(config);
        LOG_INFO("Application starting...");

        AutostartManager autostart;
        auto shell = ApplicationShell::fromConfig(
            config,
            std::make_unique<SystemTrayBackend>(config.iconSize()),
            &autostart);

        QObject::connect(shell.get(), &ApplicationShell::finished,
                         &app, &QApplication::quit);

        if (!shell->start()) {
            QMessageBox::critical(nullptr, "Percent Tray",
                "No system tray is available on this desktop.\n\n"
                "The application will now close.");
            return ExitCodes::TRAY_UNAVAILABLE;
        }

        LOG_INFO("Application initialized successfully");

        const int result = app.exec();
        shell->stop();
        Logger::instance().flush();
        return result;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return ExitCodes::FATAL;
    } catch (...) {
        std::cerr << "Unknown fatal error occurred" << std::endl;
        LOG_CRITICAL("Unknown fatal error occurred");
        return ExitCodes::FATAL;
    }
}
