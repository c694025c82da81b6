// src/gui/TrayBackend.hpp
#pragma once
#include <QObject>
#include <QImage>
#include <QSize>
#include <QString>
#include "percent-tray/Types.hpp"

class QMenu;

namespace percent_tray {

// Adapter over the OS tray. The backend owns the native tray handle
// between create() and destroy().
class TrayBackend : public QObject {
    Q_OBJECT

public:
    explicit TrayBackend(QObject* parent = nullptr) : QObject(parent) {}
    ~TrayBackend() override = default;

    virtual bool create(QMenu* menu) = 0;
    virtual void destroy() = 0;
    virtual bool setIcon(const QImage& image) = 0;
    virtual void setToolTip(const QString& toolTip) = 0;
    virtual void showMessage(const QString& title, const QString& message) = 0;
    virtual QSize iconSize() const = 0;

signals:
    void eventOccurred(percent_tray::TrayEvent event);
};

} // namespace percent_tray
