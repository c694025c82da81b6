// src/gui/ApplicationShell.hpp
#pragma once
#include <QObject>
#include <memory>
#include <optional>
#include <string>
#include "percent-tray/Types.hpp"

namespace percent_tray {

class PercentageSource;
class IconRenderer;
class TrayController;
class TrayBackend;
class AutostartManager;
class ConfigManager;

// Drives source -> renderer -> tray on a timer
class ApplicationShell : public QObject {
    Q_OBJECT

public:
    ApplicationShell(std::unique_ptr<PercentageSource> source,
                     std::unique_ptr<IconRenderer> renderer,
                     std::unique_ptr<TrayController> tray,
                     int pollInterval,
                     QObject* parent = nullptr);
    ~ApplicationShell();

    static std::unique_ptr<ApplicationShell> fromConfig(const ConfigManager& config,
                                                        std::unique_ptr<TrayBackend> backend,
                                                        AutostartManager* autostart = nullptr);
    static std::unique_ptr<PercentageSource> createSource(const ConfigManager& config);
    static std::unique_ptr<IconRenderer> createRenderer(const ConfigManager& config);

    // False when the tray cannot be created
    bool start();
    void stop();
    bool isRunning() const;

    std::optional<PercentageReading> lastReading() const;
    int pollInterval() const;
    TrayController* trayController() const;
    const IconRenderer& renderer() const;

public slots:
    void tick();

signals:
    void iconUpdated(int percentage);
    void readFailed(const std::string& error);
    void finished();

private:
    class Private;
    std::unique_ptr<Private> d;
};

} // namespace percent_tray
