// src/gui/SystemTrayBackend.hpp
#pragma once
#include <QSystemTrayIcon>
#include <memory>
#include "TrayBackend.hpp"

namespace percent_tray {

class SystemTrayBackend : public TrayBackend {
    Q_OBJECT

public:
    explicit SystemTrayBackend(int iconSize, QObject* parent = nullptr);
    ~SystemTrayBackend() override;

    bool create(QMenu* menu) override;
    void destroy() override;
    bool setIcon(const QImage& image) override;
    void setToolTip(const QString& toolTip) override;
    void showMessage(const QString& title, const QString& message) override;
    QSize iconSize() const override;

private slots:
    void handleActivated(QSystemTrayIcon::ActivationReason reason);

private:
    class Private;
    std::unique_ptr<Private> d;
};

} // namespace percent_tray
