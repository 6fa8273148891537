#include "core/CommandEncoder.hpp"
#include "core/DeviceLocator.hpp"
#include "core/GameWatcher.hpp"
#include "core/Logger.hpp"
#include "core/RateController.hpp"
#include "gui/TrayNotifier.hpp"
#include "platform/windows/WindowsHidBackend.hpp"
#include "platform/windows/WindowsProcessSampler.hpp"
#include "steam/SteamLibraryScanner.hpp"
#include "steam/SteamLocator.hpp"
#include "utils/ConfigManager.hpp"
#include <pollswitch/Errors.hpp>
#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>

using namespace pollswitch;

namespace {

constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

std::atomic<bool> stopRequested{false};

void handleStopSignal(int) {
    stopRequested = true;
}

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription(
        "Switches the mouse polling rate while a configured game is running.\n\n"
        "Commands:\n"
        "  run                 watch processes and switch rates (default)\n"
        "  set <rate>          set the polling rate once\n"
        "  list                list supported polling rates\n"
        "  debug               list device interfaces and test rate changes\n"
        "  scan-steam          add installed Steam games to the config\n"
        "  add-game            add a custom game (--name, --exe, [--path])\n"
        "  remove-game         remove a custom game (--name)\n"
        "  list-games          list configured games");
    parser.addHelpOption();
    parser.addPositionalArgument("command", "Command to run.", "[command]");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");

    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Configuration file path.",
        "config",
        "config.json"
    );
    parser.addOption(configOption);

    QCommandLineOption verboseOption(
        QStringList() << "v" << "verbose",
        "Log debug messages."
    );
    parser.addOption(verboseOption);

    QCommandLineOption logFileOption(
        QStringList() << "l" << "log-file",
        "Also write the log to this file.",
        "log-file"
    );
    parser.addOption(logFileOption);

    QCommandLineOption daemonOption(
        QStringList() << "d" << "daemon",
        "Run without the interactive banner."
    );
    parser.addOption(daemonOption);

    // scan-steam
    parser.addOption(QCommandLineOption("dry-run", "Show what would be stored without saving."));
    parser.addOption(QCommandLineOption("force", "Rescan even if the last scan is recent."));

    // add-game / remove-game
    parser.addOption(QCommandLineOption("name", "Game name.", "name"));
    parser.addOption(QCommandLineOption("exe", "Game executable.", "exe"));
    parser.addOption(QCommandLineOption("path", "Game install path.", "path"));
}

void initializeLogger(const QCommandLineParser& parser) {
    auto& logger = Logger::instance();

    if (parser.isSet("log-file")) {
        logger.setLogFile(parser.value("log-file").toStdString());
        logger.setLogDestination(LogDestination::All);
    }

    logger.setLogLevel(parser.isSet("verbose") ? LogLevel::Debug : LogLevel::Info);
    logger.enableSourceInfo(parser.isSet("verbose"));
}

std::string configPath(const QCommandLineParser& parser) {
    return parser.value("config").toStdString();
}

std::string joinedRates() {
    std::string text;
    for (int rate : CommandEncoder::supportedRates()) {
        if (!text.empty()) text += ", ";
        text += std::to_string(rate);
    }
    return text;
}

int runAutomator(QApplication& app, const QCommandLineParser& parser) {
    ConfigManager configManager;
    configManager.load(configPath(parser));
    const AppConfig& config = configManager.config();

    WindowsHidBackend backend;
    RateController controller(backend);
    controller.connectDevice();
    controller.testConnection();

    const bool daemon = parser.isSet("daemon");
    if (!daemon) {
        std::cout << "Polling rate auto-switch\n"
                  << "Mouse connected successfully" << std::endl;
    }

    controller.setRate(config.defaultPollingRate);

    WatcherSettings settings = configManager.watcherSettings();
    POLLSWITCH_LOG_INFO("Default polling rate: " + std::to_string(settings.defaultRate) + "Hz");
    POLLSWITCH_LOG_INFO("Game polling rate: " + std::to_string(settings.gameRate) + "Hz");
    POLLSWITCH_LOG_INFO("Monitoring " + std::to_string(settings.games.size()) + " games");

    WindowsProcessSampler sampler;
    GameWatcher watcher(settings, controller, sampler);

    TrayNotifier notifier(config.notifications);
    QObject::connect(&watcher, &GameWatcher::gameDetected,
                     &notifier, &TrayNotifier::handleGameDetected);
    QObject::connect(&watcher, &GameWatcher::gameClosed,
                     &notifier, &TrayNotifier::handleGameClosed);
    QObject::connect(&watcher, &GameWatcher::rateChangeFailed,
                     &notifier, &TrayNotifier::handleRateChangeFailed);
    QObject::connect(&watcher, &GameWatcher::errorOccurred,
                     &notifier, &TrayNotifier::handleError);
    notifier.showAppStarted(settings.defaultRate, static_cast<int>(settings.games.size()));

    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    QTimer stopPoll;
    QObject::connect(&stopPoll, &QTimer::timeout, &app, [&app]() {
        if (stopRequested) {
            app.quit();
        }
    });
    stopPoll.start(200);

    if (!daemon) {
        std::cout << "Watching for games (Ctrl+C to stop)..." << std::endl;
    }
    POLLSWITCH_LOG_INFO(daemon ? "Starting in daemon mode" : "Starting in interactive mode");

    watcher.start();
    const int result = app.exec();

    POLLSWITCH_LOG_INFO("Shutting down...");
    watcher.stop();
    controller.close();
    return result;
}

int runSetRate(const QStringList& args) {
    if (args.size() != 1) {
        std::cerr << "Usage: pollswitch set <rate>" << std::endl;
        return EXIT_USAGE;
    }

    auto rate = CommandEncoder::parseRate(args.first().toStdString());
    if (!rate) {
        std::cerr << "Invalid polling rate: " << args.first().toStdString() << "\n"
                  << "Valid rates: " << joinedRates() << std::endl;
        return EXIT_USAGE;
    }

    WindowsHidBackend backend;
    RateController controller(backend);
    controller.connectDevice();
    controller.setRate(*rate);
    controller.close();

    std::cout << "Polling rate set to " << *rate << "Hz" << std::endl;
    return 0;
}

int runListRates() {
    std::cout << "Available polling rates:" << std::endl;
    for (int rate : CommandEncoder::supportedRates()) {
        std::cout << "  " << rate << "Hz" << std::endl;
    }
    return 0;
}

int runDebug() {
    std::cout << "Device debug mode\n=================" << std::endl;

    WindowsHidBackend backend;
    DeviceLocator locator(backend);
    const auto interfaces = locator.listInterfaces(TARGET_DEVICE);
    std::cout << "Matching interfaces: " << interfaces.size() << std::endl;
    for (const auto& entry : interfaces) {
        std::cout << "  interface "
                  << (entry.interfaceNumber ? std::to_string(*entry.interfaceNumber) : "?")
                  << (entry.interfaceNumber == TARGET_DEVICE.interfaceNumber ? " (target)" : "")
                  << ": " << entry.devicePath << std::endl;
    }

    std::cout << "\nTesting connection..." << std::endl;
    RateController controller(backend);
    try {
        controller.connectDevice();
        controller.testConnection();
    } catch (const Error& e) {
        std::cout << "Failed to connect: " << e.what() << std::endl;
        return EXIT_FAILED;
    }

    const auto attributes = controller.attributes();
    char ids[48];
    std::snprintf(ids, sizeof(ids), "VID=0x%04X, PID=0x%04X, version=0x%04X",
                  attributes.vendorId, attributes.productId, attributes.versionNumber);
    std::cout << "Connected: " << ids << "\n" << controller.devicePath() << std::endl;

    std::cout << "\nTesting polling rate changes..." << std::endl;
    int failures = 0;
    for (int rate : {1000, 2000, 1000}) {
        std::cout << "Setting " << rate << "Hz... ";
        try {
            TransmissionPath path = controller.setRate(rate);
            std::cout << "ok ("
                      << (path == TransmissionPath::FeatureReport ? "feature report" : "output report")
                      << ")" << std::endl;
        } catch (const Error& e) {
            ++failures;
            std::cout << "failed: " << e.what() << std::endl;
        }
    }

    controller.close();
    return failures ? EXIT_FAILED : 0;
}

int runScanSteam(const QCommandLineParser& parser) {
    const std::string path = configPath(parser);
    ConfigManager configManager;
    configManager.load(path);
    const AppConfig& config = configManager.config();

    SteamLocator locator;
    auto steamPath = locator.findInstallation(config.steam ? config.steam->installPath : "");
    if (!steamPath) {
        std::cerr << "Steam installation not found" << std::endl;
        return EXIT_FAILED;
    }
    POLLSWITCH_LOG_DEBUG("Steam found at: " + *steamPath);

    if (!parser.isSet("force") && !configManager.isRescanDue()) {
        std::cout << "A scan ran less than " << RESCAN_MIN_AGE
                  << " hours ago, use --force to rescan" << std::endl;
        return 0;
    }

    const auto libraries = locator.discoverLibraries(*steamPath);
    SteamLibraryScanner scanner;
    const auto games = scanner.scan(libraries);
    std::cout << "Found " << games.size() << " games across "
              << libraries.size() << " libraries" << std::endl;

    if (parser.isSet("dry-run")) {
        std::cout << "\nDry run, nothing saved.\nSteam libraries:" << std::endl;
        for (const auto& library : libraries) {
            std::cout << "  - " << library.label << ": " << library.path << std::endl;
        }
        std::cout << "\nDetected games:" << std::endl;
        for (const auto& game : games) {
            std::cout << "  - " << game.name << " ("
                      << (game.executable.empty() ? "no executable" : game.executable) << ")"
                      << std::endl;
        }
        return 0;
    }

    configManager.updateWithSteamData(*steamPath, libraries, games);
    configManager.save(path);

    const AppConfig& updated = configManager.config();
    std::cout << "Config updated: " << updated.detectedGames.size() << " detected, "
              << updated.customGames.size() << " custom games" << std::endl;
    return 0;
}

int runAddGame(const QCommandLineParser& parser) {
    if (!parser.isSet("name") || !parser.isSet("exe")) {
        std::cerr << "add-game requires --name and --exe" << std::endl;
        return EXIT_USAGE;
    }

    const std::string path = configPath(parser);
    ConfigManager configManager;
    configManager.load(path);

    const std::string name = parser.value("name").toStdString();
    const std::string exe = parser.value("exe").toStdString();
    configManager.addCustomGame(name, exe, parser.value("path").toStdString());
    configManager.save(path);

    std::cout << "Added custom game: " << name << " (" << exe << ")" << std::endl;
    return 0;
}

int runRemoveGame(const QCommandLineParser& parser) {
    if (!parser.isSet("name")) {
        std::cerr << "remove-game requires --name" << std::endl;
        return EXIT_USAGE;
    }

    const std::string path = configPath(parser);
    ConfigManager configManager;
    configManager.load(path);

    const std::string name = parser.value("name").toStdString();
    configManager.removeCustomGame(name);
    configManager.save(path);

    std::cout << "Removed custom game: " << name << std::endl;
    return 0;
}

int runListGames(const QCommandLineParser& parser) {
    ConfigManager configManager;
    configManager.load(configPath(parser));
    const AppConfig& config = configManager.config();

    std::cout << "Configured games:" << std::endl;

    if (!config.detectedGames.empty()) {
        std::cout << "\nSteam games:" << std::endl;
        for (const auto& game : config.detectedGames) {
            std::cout << "  - " << game.name << " (" << game.executable << ")";
            if (game.sizeMb > 0) {
                std::cout << " " << std::fixed << std::setprecision(1)
                          << static_cast<double>(game.sizeMb) / 1024.0 << " GB";
            }
            std::cout << std::endl;
        }
    }

    if (!config.customGames.empty()) {
        std::cout << "\nCustom games:" << std::endl;
        for (const auto& game : config.customGames) {
            std::cout << "  - " << game.name << " (" << game.executable << ")";
            if (!game.path.empty()) {
                std::cout << " [" << game.path << "]";
            }
            std::cout << std::endl;
        }
    }

    if (!config.games.empty()) {
        std::cout << "\nLegacy games:" << std::endl;
        for (const auto& game : config.games) {
            std::cout << "  - " << game << std::endl;
        }
    }

    std::cout << "\nWatching " << configManager.watchedProcesses().size()
              << " executables" << std::endl;

    if (config.steam && config.steam->lastScan.isValid()) {
        std::cout << "Last Steam scan: "
                  << config.steam->lastScan.toLocalTime()
                         .toString("yyyy-MM-dd HH:mm:ss").toStdString()
                  << std::endl;
    }
    return 0;
}

void handleUnexpectedExceptions() {
    try {
        throw;
    } catch (const std::exception& e) {
        POLLSWITCH_LOG_CRITICAL("Unhandled exception: " + std::string(e.what()));
    } catch (...) {
        POLLSWITCH_LOG_CRITICAL("Unhandled non-standard exception");
    }
    Logger::instance().flush();
}

} // namespace

int main(int argc, char* argv[]) {
    std::set_terminate([]() {
        if (std::current_exception()) {
            handleUnexpectedExceptions();
        }
        std::abort();
    });

    QApplication app(argc, argv);
    app.setApplicationName("pollswitch");
    app.setApplicationVersion("1.0.0");
    app.setQuitOnLastWindowClosed(false);

    QCommandLineParser parser;
    setupCommandLineParser(parser);
    parser.process(app);

    initializeLogger(parser);

    const QStringList positional = parser.positionalArguments();
    const QString command = positional.isEmpty() ? QString("run") : positional.first();
    const QStringList args = positional.mid(1);

    try {
        if (command == "run") return runAutomator(app, parser);
        if (command == "set") return runSetRate(args);
        if (command == "list") return runListRates();
        if (command == "debug") return runDebug();
        if (command == "scan-steam") return runScanSteam(parser);
        if (command == "add-game") return runAddGame(parser);
        if (command == "remove-game") return runRemoveGame(parser);
        if (command == "list-games") return runListGames(parser);

        std::cerr << "Unknown command: " << command.toStdString() << std::endl;
        parser.showHelp(EXIT_USAGE);
    } catch (const UnsupportedRateError& e) {
        std::cerr << e.what() << "\nValid rates: " << joinedRates() << std::endl;
        return EXIT_USAGE;
    } catch (const Error& e) {
        POLLSWITCH_LOG_CRITICAL(e.what());
        return EXIT_FAILED;
    } catch (const std::exception& e) {
        POLLSWITCH_LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return EXIT_FAILED;
    }
    return 0;
}
