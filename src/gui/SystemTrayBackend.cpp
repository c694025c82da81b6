// src/gui/SystemTrayBackend.cpp
#include "SystemTrayBackend.hpp"
#include "../core/Logger.hpp"
#include "percent-tray/Constants.hpp"
#include <QIcon>
#include <QMenu>
#include <QPixmap>

namespace percent_tray {

class SystemTrayBackend::Private {
public:
    std::unique_ptr<QSystemTrayIcon> tray;
    int iconSize{DEFAULT_ICON_SIZE};
};

SystemTrayBackend::SystemTrayBackend(int iconSize, QObject* parent)
    : TrayBackend(parent)
    , d(std::make_unique<Private>()) {
    d->iconSize = iconSize;
}

SystemTrayBackend::~SystemTrayBackend() {
    destroy();
}

bool SystemTrayBackend::create(QMenu* menu) {
    if (d->tray) {
        return true;
    }

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        LOG_ERROR("No system tray available on this desktop");
        return false;
    }

    d->tray = std::make_unique<QSystemTrayIcon>();
    if (menu) {
        d->tray->setContextMenu(menu);
    }

    connect(d->tray.get(), &QSystemTrayIcon::activated,
            this, &SystemTrayBackend::handleActivated);

    d->tray->show();
    return true;
}

void SystemTrayBackend::destroy() {
    if (!d->tray) {
        return;
    }
    d->tray->hide();
    d->tray->disconnect(this);
    d->tray.reset();
}

bool SystemTrayBackend::setIcon(const QImage& image) {
    // The tray can vanish at runtime, e.g. when the panel restarts
    if (!d->tray || image.isNull() || !QSystemTrayIcon::isSystemTrayAvailable()) {
        return false;
    }
    d->tray->setIcon(QIcon(QPixmap::fromImage(image)));
    if (!d->tray->isVisible()) {
        d->tray->show();
    }
    return true;
}

void SystemTrayBackend::setToolTip(const QString& toolTip) {
    if (d->tray) {
        d->tray->setToolTip(toolTip);
    }
}

void SystemTrayBackend::showMessage(const QString& title, const QString& message) {
    if (d->tray && QSystemTrayIcon::supportsMessages()) {
        d->tray->showMessage(title, message, QSystemTrayIcon::Information, MESSAGE_TIMEOUT);
    }
}

QSize SystemTrayBackend::iconSize() const {
    return QSize(d->iconSize, d->iconSize);
}

void SystemTrayBackend::handleActivated(QSystemTrayIcon::ActivationReason reason) {
    switch (reason) {
        case QSystemTrayIcon::Trigger:
            emit eventOccurred(TrayEvent::Activated);
            break;

        case QSystemTrayIcon::DoubleClick:
        case QSystemTrayIcon::MiddleClick:
            emit eventOccurred(TrayEvent::RefreshRequested);
            break;

        default:
            break;
    }
}

} // namespace percent_tray
