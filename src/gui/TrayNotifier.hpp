// src/gui/TrayNotifier.hpp
#pragma once
#include <QSystemTrayIcon>
#include <memory>

namespace pollswitch {

// Balloon notifications for rate changes. Messages are always logged and
// only shown when enabled and supported by the desktop.
class TrayNotifier : public QSystemTrayIcon {
    Q_OBJECT

public:
    explicit TrayNotifier(bool enabled, QObject* parent = nullptr);
    ~TrayNotifier();

    void showAppStarted(int defaultRate, int watchedGames);

public slots:
    void handleGameDetected(int rate);
    void handleGameClosed(int rate);
    void handleRateChangeFailed(int rate, const QString& reason);
    void handleError(const QString& message);

private:
    void showNotification(const QString& title,
                          const QString& message,
                          QSystemTrayIcon::MessageIcon icon = QSystemTrayIcon::Information);
    void updateToolTip(int rate);

    class Private;
    std::unique_ptr<Private> d;
};

} // namespace pollswitch
