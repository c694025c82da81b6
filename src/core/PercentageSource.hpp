#pragma once
#include <QString>
#include <optional>
#include <string>
#include "percent-tray/Types.hpp"

namespace percent_tray {

// Supplies the value shown in the tray. A failed read returns nullopt
// and leaves the reason in lastError().
class PercentageSource {
public:
    virtual ~PercentageSource() = default;

    virtual std::optional<PercentageReading> read() = 0;
    virtual QString name() const = 0;

    // Tooltip text for a reading
    virtual QString describe(const PercentageReading& reading) const;

    const std::string& lastError() const { return lastError_; }

protected:
    std::optional<PercentageReading> fail(std::string error);

    std::string lastError_;
};

// Linux power_supply class, e.g. /sys/class/power_supply/BAT0
class BatterySource : public PercentageSource {
public:
    explicit BatterySource(QString supplyRoot = QStringLiteral("/sys/class/power_supply"),
                           QString batteryName = QString());

    std::optional<PercentageReading> read() override;
    QString name() const override;
    QString describe(const PercentageReading& reading) const override;

    static ChargeState parseStatus(const QString& status);

private:
    QString findBattery() const;

    QString supplyRoot_;
    QString batteryName_;
};

// Aggregate CPU load from the "cpu" line of /proc/stat
class CpuLoadSource : public PercentageSource {
public:
    explicit CpuLoadSource(QString statPath = QStringLiteral("/proc/stat"));

    std::optional<PercentageReading> read() override;
    QString name() const override;

private:
    QString statPath_;
    unsigned long long prevIdle_{0};
    unsigned long long prevTotal_{0};
    bool havePrevious_{false};
};

// Used space of the filesystem that holds a path
class DiskUsageSource : public PercentageSource {
public:
    explicit DiskUsageSource(QString path = QStringLiteral("/"));

    std::optional<PercentageReading> read() override;
    QString name() const override;

private:
    QString path_;
};

} // namespace percent_tray
