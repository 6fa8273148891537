#pragma once
#include <pollswitch/Types.hpp>
#include <QObject>
#include <QString>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace pollswitch {

class RateController;
class ProcessSampler;
class ProcessSnapshot;

struct WatcherSettings {
    int defaultRate{DEFAULT_POLLING_RATE};
    int gameRate{GAME_POLLING_RATE};
    std::chrono::milliseconds checkInterval{CHECK_INTERVAL};
    std::vector<std::string> games;
};

// Switches between the default and the game polling rate whenever the
// presence of a configured game changes. Ticks run on a private thread; a
// tick never overlaps another one.
//
// The state moves to the new value even when the rate change fails, so a
// failed write leaves the watcher ahead of the device until the next
// transition.
class GameWatcher : public QObject {
    Q_OBJECT

public:
    GameWatcher(WatcherSettings settings,
                RateController& controller,
                ProcessSampler& sampler,
                QObject* parent = nullptr);
    ~GameWatcher();

    // Runs one check on the calling thread, then starts the timer thread.
    void start();

    // Stops scheduling and waits for a running check to finish. Safe to call
    // more than once.
    void stop();

    bool isRunning() const;
    WatcherState state() const;
    int currentRate() const;
    const WatcherSettings& settings() const;

public slots:
    void checkProcesses();

signals:
    void gameDetected(int rate);
    void gameClosed(int rate);
    void rateChangeFailed(int rate, const QString& reason);
    void errorOccurred(const QString& message);

private:
    bool isAnyGameRunning(const ProcessSnapshot& snapshot) const;
    bool applyRate(int rate);

    class Private;
    std::unique_ptr<Private> d;
};

}
