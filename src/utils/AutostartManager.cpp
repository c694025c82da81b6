#include "AutostartManager.hpp"
#include "../core/Logger.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QStandardPaths>
#include <QTextStream>

namespace percent_tray {

class AutostartManager::Private {
public:
    QString desktopFile;
    QString executable;
    std::string lastError;

    QByteArray desktopEntry() const {
        QString text;
        QTextStream out(&text);
        out << "[Desktop Entry]\n"
            << "Type=Application\n"
            << "Name=" << QCoreApplication::applicationName() << "\n"
            << "Comment=Percentage tray icon\n"
            << "Exec=\"" << executable << "\"\n"
            << "Terminal=false\n"
            << "X-GNOME-Autostart-enabled=true\n";
        return text.toUtf8();
    }
};

AutostartManager::AutostartManager(const QString& desktopFile,
                                   const QString& executable,
                                   QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->desktopFile = desktopFile.isEmpty() ? defaultDesktopFile() : desktopFile;
    d->executable = executable.isEmpty()
        ? QCoreApplication::applicationFilePath() : executable;
}

AutostartManager::~AutostartManager() = default;

QString AutostartManager::defaultDesktopFile() {
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
        + QStringLiteral("/autostart/percent-tray.desktop");
}

QString AutostartManager::desktopFile() const {
    return d->desktopFile;
}

std::string AutostartManager::lastError() const {
    return d->lastError;
}

bool AutostartManager::isEnabled() const {
    return QFileInfo::exists(d->desktopFile);
}

bool AutostartManager::setEnabled(bool enabled) {
    if (enabled == isEnabled()) {
        return true;
    }

    if (enabled) {
        const QString dir = QFileInfo(d->desktopFile).absolutePath();
        if (!QDir().mkpath(dir)) {
            d->lastError = "cannot create " + dir.toStdString();
            LOG_ERROR("Failed to enable autostart: " + d->lastError);
            return false;
        }

        QSaveFile file(d->desktopFile);
        if (!file.open(QIODevice::WriteOnly) ||
            file.write(d->desktopEntry()) < 0 ||
            !file.commit()) {
            d->lastError = file.errorString().toStdString();
            LOG_ERROR("Failed to enable autostart: " + d->lastError);
            return false;
        }
    } else if (!QFile::remove(d->desktopFile)) {
        d->lastError = "cannot remove " + d->desktopFile.toStdString();
        LOG_ERROR("Failed to disable autostart: " + d->lastError);
        return false;
    }

    d->lastError.clear();
    LOG_INFO(std::string("Autostart ") + (enabled ? "enabled" : "disabled"));
    emit enabledChanged(enabled);
    return true;
}

}
