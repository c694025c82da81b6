#pragma once
#include <QObject>
#include <QString>
#include <memory>
#include <string>

namespace percent_tray {

// Launch-at-login through an XDG autostart desktop entry
class AutostartManager : public QObject {
    Q_OBJECT

public:
    // Empty arguments pick <config>/autostart/percent-tray.desktop and the
    // running executable
    explicit AutostartManager(const QString& desktopFile = QString(),
                              const QString& executable = QString(),
                              QObject* parent = nullptr);
    ~AutostartManager();

    bool isEnabled() const;
    bool setEnabled(bool enabled);

    QString desktopFile() const;
    std::string lastError() const;

    static QString defaultDesktopFile();

signals:
    void enabledChanged(bool enabled);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
