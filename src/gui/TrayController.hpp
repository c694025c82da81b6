// src/gui/TrayController.hpp
#pragma once
#include <QObject>
#include <QSize>
#include <QString>
#include <memory>
#include "percent-tray/Types.hpp"

class QMenu;
class QAction;

namespace percent_tray {

class TrayBackend;
class AutostartManager;
struct IconImage;

/**
 * Owns the tray icon for the lifetime of the application.
 *
 * State only moves forward: Uninitialized -> Active on start(),
 * Active -> Terminated on shutdown() or destruction. Icon updates and
 * tray events are only honored while Active.
 */
class TrayController : public QObject {
    Q_OBJECT

public:
    enum class State {
        Uninitialized,
        Active,
        Terminated
    };

    // autostart may be null, which hides the autostart menu entry
    TrayController(std::unique_ptr<TrayBackend> backend,
                   AutostartManager* autostart = nullptr,
                   QObject* parent = nullptr);
    ~TrayController();

    bool start();
    void shutdown();

    bool update(const IconImage& icon, const QString& toolTip = QString());

    State state() const;
    QSize iconSize() const;
    const IconImage& currentIcon() const;
    QString toolTip() const;
    int updateCount() const;

    QMenu* menu() const;
    QAction* autostartAction() const;

public slots:
    void handleEvent(percent_tray::TrayEvent event);

signals:
    void iconChanged();
    void refreshRequested();
    void quitRequested();
    void errorOccurred(const std::string& error);

private:
    void createMenu();
    void updateAutostartAction();

    class Private;
    std::unique_ptr<Private> d;
};

} // namespace percent_tray
