#include "GameWatcher.hpp"
#include "Logger.hpp"
#include "ProcessSampler.hpp"
#include "RateController.hpp"
#include <QThread>
#include <QTimer>
#include <atomic>
#include <mutex>
#include <stdexcept>

namespace pollswitch {

class GameWatcher::Private {
public:
    WatcherSettings settings;
    RateController* controller{nullptr};
    ProcessSampler* sampler{nullptr};
    std::atomic<WatcherState> state{WatcherState::Idle};

    QThread thread;
    QTimer* timer{nullptr};
    std::mutex lifecycleMutex;
    std::mutex tickMutex;
};

GameWatcher::GameWatcher(WatcherSettings settings,
                         RateController& controller,
                         ProcessSampler& sampler,
                         QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->settings = std::move(settings);
    d->controller = &controller;
    d->sampler = &sampler;
    d->thread.setObjectName(QStringLiteral("GameWatcher"));
}

GameWatcher::~GameWatcher() {
    stop();
}

void GameWatcher::start() {
    std::lock_guard<std::mutex> lock(d->lifecycleMutex);
    if (d->timer) {
        return;
    }

    // Apply the right rate now instead of one interval later.
    checkProcesses();

    d->timer = new QTimer;
    d->timer->setInterval(static_cast<int>(d->settings.checkInterval.count()));
    d->timer->moveToThread(&d->thread);

    connect(d->timer, &QTimer::timeout,
            this, &GameWatcher::checkProcesses, Qt::DirectConnection);
    connect(&d->thread, &QThread::started,
            d->timer, QOverload<>::of(&QTimer::start), Qt::DirectConnection);
    connect(&d->thread, &QThread::finished,
            d->timer, &QTimer::stop, Qt::DirectConnection);

    d->thread.start();
    POLLSWITCH_LOG_DEBUG("Watcher started, checking every " +
                         std::to_string(d->settings.checkInterval.count()) + "ms");
}

void GameWatcher::stop() {
    std::lock_guard<std::mutex> lock(d->lifecycleMutex);
    if (!d->timer) {
        return;
    }

    // The event loop exits once the current check returns.
    d->thread.quit();
    d->thread.wait();

    delete d->timer;
    d->timer = nullptr;
    POLLSWITCH_LOG_DEBUG("Watcher stopped");
}

bool GameWatcher::isRunning() const {
    return d->thread.isRunning();
}

WatcherState GameWatcher::state() const {
    return d->state.load();
}

int GameWatcher::currentRate() const {
    return d->state.load() == WatcherState::GameActive
        ? d->settings.gameRate
        : d->settings.defaultRate;
}

const WatcherSettings& GameWatcher::settings() const {
    return d->settings;
}

void GameWatcher::checkProcesses() {
    std::lock_guard<std::mutex> lock(d->tickMutex);

    ProcessSnapshot snapshot;
    try {
        snapshot = d->sampler->sample();
    } catch (const std::exception& e) {
        POLLSWITCH_LOG_ERROR(std::string("Error getting processes: ") + e.what());
        emit errorOccurred(QString::fromStdString(e.what()));
        return;
    }

    const bool gameRunning = isAnyGameRunning(snapshot);
    const WatcherState current = d->state.load();

    if (gameRunning && current == WatcherState::Idle) {
        const int rate = d->settings.gameRate;
        POLLSWITCH_LOG_INFO("Game detected! Switching to " + std::to_string(rate) + "Hz");
        d->state = WatcherState::GameActive;
        if (applyRate(rate)) {
            emit gameDetected(rate);
        }
    } else if (!gameRunning && current == WatcherState::GameActive) {
        const int rate = d->settings.defaultRate;
        POLLSWITCH_LOG_INFO("No game detected. Switching to " + std::to_string(rate) + "Hz");
        d->state = WatcherState::Idle;
        if (applyRate(rate)) {
            emit gameClosed(rate);
        }
    }
}

bool GameWatcher::isAnyGameRunning(const ProcessSnapshot& snapshot) const {
    for (const auto& game : d->settings.games) {
        if (snapshot.contains(game)) {
            POLLSWITCH_LOG_DEBUG("Detected game: " + game);
            return true;
        }
    }
    return false;
}

bool GameWatcher::applyRate(int rate) {
    try {
        d->controller->setRate(rate);
        return true;
    } catch (const std::exception& e) {
        POLLSWITCH_LOG_ERROR("Failed to set polling rate " + std::to_string(rate) +
                             "Hz: " + e.what());
        emit rateChangeFailed(rate, QString::fromStdString(e.what()));
        return false;
    }
}

}
