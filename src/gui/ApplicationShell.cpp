// src/gui/ApplicationShell.cpp
#include "ApplicationShell.hpp"
#include "TrayBackend.hpp"
#include "TrayController.hpp"
#include "../core/IconRenderer.hpp"
#include "../core/Logger.hpp"
#include "../core/PercentageSource.hpp"
#include "../utils/ConfigManager.hpp"
#include "percent-tray/Constants.hpp"
#include <QTimer>
#include <algorithm>

namespace percent_tray {

class ApplicationShell::Private {
public:
    std::unique_ptr<PercentageSource> source;
    std::unique_ptr<IconRenderer> renderer;
    std::unique_ptr<TrayController> tray;
    QTimer* timer{nullptr};
    bool running{false};

    std::optional<PercentageReading> lastReading;
    std::optional<PercentageReading> displayed;
    bool retryPending{false};
};

ApplicationShell::ApplicationShell(std::unique_ptr<PercentageSource> source,
                                   std::unique_ptr<IconRenderer> renderer,
                                   std::unique_ptr<TrayController> tray,
                                   int pollInterval,
                                   QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->source = std::move(source);
    d->renderer = std::move(renderer);
    d->tray = std::move(tray);

    d->timer = new QTimer(this);
    d->timer->setInterval(std::max(MIN_POLLING_INTERVAL, pollInterval));
    connect(d->timer, &QTimer::timeout, this, &ApplicationShell::tick);

    connect(d->tray.get(), &TrayController::refreshRequested, this, [this]() {
        d->displayed.reset();
        tick();
    });
    connect(d->tray.get(), &TrayController::quitRequested,
            this, &ApplicationShell::stop);
    connect(d->tray.get(), &TrayController::errorOccurred,
            this, [](const std::string& error) { LOG_ERROR(error); });
}

ApplicationShell::~ApplicationShell() {
    d->timer->stop();
    d->tray->shutdown();
}

std::unique_ptr<PercentageSource> ApplicationShell::createSource(const ConfigManager& config) {
    switch (config.metric()) {
        case MetricKind::CpuLoad:
            return std::make_unique<CpuLoadSource>(
                QString::fromStdString(config.getString(ConfigKeys::PROC_STAT_PATH, "/proc/stat")));
        case MetricKind::DiskUsage:
            return std::make_unique<DiskUsageSource>(
                QString::fromStdString(config.getString(ConfigKeys::DISK_PATH, "/")));
        case MetricKind::Battery:
            break;
    }
    return std::make_unique<BatterySource>(
        QString::fromStdString(config.getString(ConfigKeys::POWER_SUPPLY_PATH, "/sys/class/power_supply")),
        QString::fromStdString(config.getString(ConfigKeys::BATTERY_NAME)));
}

std::unique_ptr<IconRenderer> ApplicationShell::createRenderer(const ConfigManager& config) {
    RenderOptions options;
    options.style = config.iconStyle();
    options.foreground = config.color(ConfigKeys::FOREGROUND_COLOR, options.foreground);
    options.background = config.color(ConfigKeys::BACKGROUND_COLOR, options.background);
    options.lowColor = config.color(ConfigKeys::LOW_COLOR, options.lowColor);
    options.chargingColor = config.color(ConfigKeys::CHARGING_COLOR, options.chargingColor);
    options.lowThreshold = std::clamp(config.getInt(ConfigKeys::LOW_THRESHOLD, LOW_LEVEL_THRESHOLD), 0, 100);
    options.fontFamily = QString::fromStdString(config.getString(ConfigKeys::FONT_FAMILY));
    options.chargingMarker = config.getBool(ConfigKeys::CHARGING_MARKER, true);
    return std::make_unique<IconRenderer>(options);
}

std::unique_ptr<ApplicationShell> ApplicationShell::fromConfig(const ConfigManager& config,
                                                               std::unique_ptr<TrayBackend> backend,
                                                               AutostartManager* autostart) {
    auto tray = std::make_unique<TrayController>(std::move(backend), autostart);
    return std::make_unique<ApplicationShell>(createSource(config),
                                              createRenderer(config),
                                              std::move(tray),
                                              config.pollInterval());
}

bool ApplicationShell::start() {
    if (d->running) {
        return true;
    }

    if (!d->tray->start()) {
        LOG_CRITICAL("System tray is unavailable");
        return false;
    }

    d->running = true;
    LOG_INFO("Monitoring " + d->source->name().toStdString() +
             " as " + toString(d->renderer->options().style) +
             " every " + std::to_string(d->timer->interval()) + " ms");

    tick();
    d->timer->start();
    return true;
}

void ApplicationShell::stop() {
    if (!d->running) {
        return;
    }

    d->timer->stop();
    d->tray->shutdown();
    d->running = false;
    LOG_INFO("Stopped");
    emit finished();
}

bool ApplicationShell::isRunning() const {
    return d->running;
}

void ApplicationShell::tick() {
    if (d->tray->state() != TrayController::State::Active) {
        return;
    }

    auto reading = d->source->read();
    if (!reading) {
        // Last known value stays on screen
        LOG_WARNING("Failed to read " + d->source->name().toStdString() +
                    ": " + d->source->lastError());
        emit readFailed(d->source->lastError());
        return;
    }

    reading->value = clampPercentage(reading->value);
    d->lastReading = reading;

    if (d->displayed && *d->displayed == *reading && !d->retryPending) {
        return;
    }

    std::string error;
    auto icon = d->renderer->render(reading->value, d->tray->iconSize(), reading->state, &error);
    if (!icon) {
        LOG_WARNING("Failed to render icon: " + error + "; using default icon");
        icon = d->renderer->defaultIcon(d->tray->iconSize());
    }

    if (!d->tray->update(*icon, d->source->describe(*reading))) {
        LOG_ERROR("Tray icon update failed, retrying on next tick");
        d->retryPending = true;
        return;
    }

    d->retryPending = false;
    if (icon->fallback) {
        // Rendering is attempted again on the next tick
        d->displayed.reset();
        return;
    }
    d->displayed = reading;
    emit iconUpdated(reading->rounded());
}

std::optional<PercentageReading> ApplicationShell::lastReading() const {
    return d->lastReading;
}

int ApplicationShell::pollInterval() const {
    return d->timer->interval();
}

TrayController* ApplicationShell::trayController() const {
    return d->tray.get();
}

const IconRenderer& ApplicationShell::renderer() const {
    return *d->renderer;
}

} // namespace percent_tray
