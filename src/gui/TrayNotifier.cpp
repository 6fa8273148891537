// src/gui/TrayNotifier.cpp
#include "TrayNotifier.hpp"
#include "core/Logger.hpp"
#include <QAction>
#include <QApplication>
#include <QMenu>
#include <QStyle>

namespace pollswitch {

class TrayNotifier::Private {
public:
    bool enabled{true};
    std::unique_ptr<QMenu> trayMenu;
};

TrayNotifier::TrayNotifier(bool enabled, QObject* parent)
    : QSystemTrayIcon(parent)
    , d(std::make_unique<Private>()) {

    d->enabled = enabled && QSystemTrayIcon::isSystemTrayAvailable();

    setIcon(QApplication::style()->standardIcon(QStyle::SP_ComputerIcon));
    setToolTip("Polling rate switcher");

    d->trayMenu = std::make_unique<QMenu>();
    auto quitAction = d->trayMenu->addAction("Quit");
    connect(quitAction, &QAction::triggered, qApp, &QApplication::quit);
    setContextMenu(d->trayMenu.get());

    if (d->enabled) {
        show();
    }
}

TrayNotifier::~TrayNotifier() = default;

void TrayNotifier::showAppStarted(int defaultRate, int watchedGames) {
    updateToolTip(defaultRate);
    showNotification("Polling rate switcher",
                     QString("Started, watching %1 games").arg(watchedGames));
}

void TrayNotifier::handleGameDetected(int rate) {
    updateToolTip(rate);
    showNotification("Game detected", QString("Polling rate set to %1Hz").arg(rate));
}

void TrayNotifier::handleGameClosed(int rate) {
    updateToolTip(rate);
    showNotification("Game closed", QString("Default polling rate %1Hz restored").arg(rate));
}

void TrayNotifier::handleRateChangeFailed(int rate, const QString& reason) {
    showNotification(QString("Could not switch to %1Hz").arg(rate), reason,
                     QSystemTrayIcon::Warning);
}

void TrayNotifier::handleError(const QString& message) {
    showNotification("Error", message, QSystemTrayIcon::Critical);
}

void TrayNotifier::showNotification(const QString& title,
                                    const QString& message,
                                    QSystemTrayIcon::MessageIcon icon) {
    POLLSWITCH_LOG_DEBUG("Notification: " + title.toStdString() + " - " + message.toStdString());

    if (d->enabled && supportsMessages()) {
        showMessage(title, message, icon, 3000);
    }
}

void TrayNotifier::updateToolTip(int rate) {
    setToolTip(QString("Polling rate switcher (%1Hz)").arg(rate));
}

} // namespace pollswitch
