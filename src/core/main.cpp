#include "app/Application.h"
#include "core/Config.h"
#include "logging/Logger.h"
#include "utils/ArgumentParser.h"
#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
    ArgumentParser::AppArgs args;
    if (!ArgumentParser::parseAppArgs(argc, argv, args)) {
        return 1;
    }
    if (args.showHelp) {
        ArgumentParser::printUsage(argv[0]);
        return 0;
    }

    Config::AppConfig config;
    const bool explicitPath = !args.configPath.empty();
    const std::string envPath = explicitPath ? args.configPath : Config::defaultEnvPath();
    bool envLoaded = false;
    try {
        envLoaded = Config::loadEnvFile(envPath, explicitPath);
        config = Config::load();
        if (!args.logLevel.empty()) {
            config.logging.level = args.logLevel;
        }
        config.logging.console = args.consoleLog;
        Config::validate(config);
    } catch (const std::exception &e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    Logger::Level level;
    if (!Logger::parseLevel(config.logging.level, level)) {
        std::cerr << "Config error: unknown log level " << config.logging.level << "\n";
        return 1;
    }
    Logger::setLevel(level);
    Logger::setConsoleEnabled(config.logging.console);
    if (!config.logging.file.empty() && !Logger::openFile(config.logging.file)) {
        std::cerr << "Cannot open log file " << config.logging.file << "\n";
    }

    if (envLoaded) {
        Logger::info(Logger::Source::Other, "main", "Configuration loaded from %s", envPath.c_str());
    } else {
        Logger::info(Logger::Source::Other, "main", "%s not found, using environment and defaults", envPath.c_str());
    }

    int rc = 1;
    try {
        Application app(std::move(config), std::move(args));
        rc = app.run();
    } catch (const std::exception &e) {
        Logger::error(Logger::Source::Other, "main", "Unhandled error: %s", e.what());
    }
    Logger::closeFile();
    return rc;
}
