// src/gui/TrayController.cpp
#include "TrayController.hpp"
#include "TrayBackend.hpp"
#include "../core/IconRenderer.hpp"
#include "../core/Logger.hpp"
#include "../utils/AutostartManager.hpp"
#include <QAction>
#include <QCoreApplication>
#include <QMenu>

namespace percent_tray {

class TrayController::Private {
public:
    std::unique_ptr<TrayBackend> backend;
    AutostartManager* autostart{nullptr};
    State state{State::Uninitialized};

    std::unique_ptr<QMenu> trayMenu;
    QAction* refreshAction{nullptr};
    QAction* autostartAction{nullptr};
    QAction* quitAction{nullptr};

    IconImage current;
    QString toolTip;
    int updateCount{0};
};

TrayController::TrayController(std::unique_ptr<TrayBackend> backend,
                               AutostartManager* autostart,
                               QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->backend = std::move(backend);
    d->autostart = autostart;

    connect(d->backend.get(), &TrayBackend::eventOccurred,
            this, &TrayController::handleEvent);
}

TrayController::~TrayController() {
    shutdown();
}

bool TrayController::start() {
    if (d->state != State::Uninitialized) {
        LOG_WARNING("Tray controller already started");
        return d->state == State::Active;
    }

    createMenu();

    if (!d->backend->create(d->trayMenu.get())) {
        emit errorOccurred("Unable to create the system tray icon");
        return false;
    }

    d->state = State::Active;
    LOG_DEBUG("Tray icon created");
    return true;
}

void TrayController::shutdown() {
    if (d->state != State::Active) {
        return;
    }

    d->backend->destroy();
    d->state = State::Terminated;
    LOG_DEBUG("Tray icon released");
}

bool TrayController::update(const IconImage& icon, const QString& toolTip) {
    if (d->state != State::Active) {
        LOG_WARNING("Ignoring icon update while the tray is not active");
        return false;
    }

    if (icon.isNull()) {
        LOG_ERROR("Refusing to display an empty icon");
        return false;
    }

    if (!d->backend->setIcon(icon.image)) {
        emit errorOccurred("The system tray rejected the icon update");
        return false;
    }

    if (!toolTip.isEmpty()) {
        d->backend->setToolTip(toolTip);
        d->toolTip = toolTip;
    }

    d->current = icon;
    ++d->updateCount;
    emit iconChanged();
    return true;
}

TrayController::State TrayController::state() const {
    return d->state;
}

QSize TrayController::iconSize() const {
    return d->backend->iconSize();
}

const IconImage& TrayController::currentIcon() const {
    return d->current;
}

QString TrayController::toolTip() const {
    return d->toolTip;
}

int TrayController::updateCount() const {
    return d->updateCount;
}

QMenu* TrayController::menu() const {
    return d->trayMenu.get();
}

QAction* TrayController::autostartAction() const {
    return d->autostartAction;
}

void TrayController::handleEvent(TrayEvent event) {
    if (d->state != State::Active) {
        return;
    }

    switch (event) {
        case TrayEvent::Activated:
            if (!d->toolTip.isEmpty()) {
                d->backend->showMessage(QCoreApplication::applicationName(), d->toolTip);
            }
            break;

        case TrayEvent::RefreshRequested:
            emit refreshRequested();
            break;

        case TrayEvent::ToggleAutostart:
            if (d->autostart && !d->autostart->setEnabled(!d->autostart->isEnabled())) {
                emit errorOccurred("Autostart change failed: " + d->autostart->lastError());
            }
            updateAutostartAction();
            break;

        case TrayEvent::QuitRequested:
            LOG_INFO("Quit requested from the tray menu");
            emit quitRequested();
            break;
    }
}

void TrayController::createMenu() {
    d->trayMenu = std::make_unique<QMenu>();

    d->refreshAction = d->trayMenu->addAction(tr("Refresh now"));
    connect(d->refreshAction, &QAction::triggered, this, [this]() {
        handleEvent(TrayEvent::RefreshRequested);
    });

    if (d->autostart) {
        d->autostartAction = d->trayMenu->addAction(QString());
        connect(d->autostartAction, &QAction::triggered, this, [this]() {
            handleEvent(TrayEvent::ToggleAutostart);
        });
        updateAutostartAction();
    }

    d->trayMenu->addSeparator();

    d->quitAction = d->trayMenu->addAction(tr("Quit"));
    connect(d->quitAction, &QAction::triggered, this, [this]() {
        handleEvent(TrayEvent::QuitRequested);
    });
}

void TrayController::updateAutostartAction() {
    if (!d->autostartAction || !d->autostart) {
        return;
    }
    d->autostartAction->setText(d->autostart->isEnabled()
        ? tr("Disable autostart")
        : tr("Enable autostart"));
}

} // namespace percent_tray
