#include "PercentageSource.hpp"
#include <QDir>
#include <QFile>
#include <QStorageInfo>
#include <QStringList>
#include <QTextStream>
#include <algorithm>
#include <utility>

namespace percent_tray {

namespace {

std::optional<QString> readSysfsValue(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return std::nullopt;
    }
    return QString::fromUtf8(file.readAll()).trimmed();
}

std::optional<double> readSysfsNumber(const QString& path) {
    auto text = readSysfsValue(path);
    if (!text) {
        return std::nullopt;
    }
    bool ok = false;
    double value = text->toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> readRatio(const QString& dir, const char* now, const char* full) {
    auto current = readSysfsNumber(dir + QLatin1Char('/') + QLatin1String(now));
    auto maximum = readSysfsNumber(dir + QLatin1Char('/') + QLatin1String(full));
    if (!current || !maximum || *maximum <= 0.0) {
        return std::nullopt;
    }
    return *current / *maximum * 100.0;
}

} // namespace

QString PercentageSource::describe(const PercentageReading& reading) const {
    return QStringLiteral("%1: %2%").arg(name()).arg(reading.rounded());
}

std::optional<PercentageReading> PercentageSource::fail(std::string error) {
    lastError_ = std::move(error);
    return std::nullopt;
}

BatterySource::BatterySource(QString supplyRoot, QString batteryName)
    : supplyRoot_(std::move(supplyRoot))
    , batteryName_(std::move(batteryName)) {
}

QString BatterySource::name() const {
    return QStringLiteral("Battery");
}

ChargeState BatterySource::parseStatus(const QString& status) {
    const QString s = status.trimmed().toLower();
    if (s == QLatin1String("charging")) return ChargeState::Charging;
    if (s == QLatin1String("discharging")) return ChargeState::Discharging;
    if (s == QLatin1String("full")) return ChargeState::Full;
    if (s == QLatin1String("not charging")) return ChargeState::NotCharging;
    return ChargeState::Unknown;
}

QString BatterySource::findBattery() const {
    QDir root(supplyRoot_);
    if (!batteryName_.isEmpty()) {
        return root.exists(batteryName_) ? root.filePath(batteryName_) : QString();
    }

    const QStringList entries = root.entryList(
        QDir::Dirs | QDir::NoDotAndDotDot | QDir::System, QDir::Name);
    for (const QString& entry : entries) {
        const QString dir = root.filePath(entry);
        auto type = readSysfsValue(dir + QStringLiteral("/type"));
        if (!type || *type != QLatin1String("Battery")) {
            continue;
        }
        auto present = readSysfsValue(dir + QStringLiteral("/present"));
        if (present && *present == QLatin1String("0")) {
            continue;
        }
        return dir;
    }
    return QString();
}

std::optional<PercentageReading> BatterySource::read() {
    const QString dir = findBattery();
    if (dir.isEmpty()) {
        return fail("no battery found under " + supplyRoot_.toStdString());
    }

    std::optional<double> value = readSysfsNumber(dir + QStringLiteral("/capacity"));
    if (!value) {
        value = readRatio(dir, "energy_now", "energy_full");
    }
    if (!value) {
        value = readRatio(dir, "charge_now", "charge_full");
    }
    if (!value) {
        return fail("battery " + dir.toStdString() + " reports no charge level");
    }

    PercentageReading reading;
    reading.value = clampPercentage(*value);
    auto status = readSysfsValue(dir + QStringLiteral("/status"));
    reading.state = status ? parseStatus(*status) : ChargeState::Unknown;
    lastError_.clear();
    return reading;
}

QString BatterySource::describe(const PercentageReading& reading) const {
    switch (reading.state) {
        case ChargeState::Charging:
            return QStringLiteral("Charging: %1%").arg(reading.rounded());
        case ChargeState::Discharging:
            return QStringLiteral("Discharging: %1%").arg(reading.rounded());
        case ChargeState::Full:
            return QStringLiteral("Full");
        default:
            return PercentageSource::describe(reading);
    }
}

CpuLoadSource::CpuLoadSource(QString statPath)
    : statPath_(std::move(statPath)) {
}

QString CpuLoadSource::name() const {
    return QStringLiteral("CPU");
}

std::optional<PercentageReading> CpuLoadSource::read() {
    QFile file(statPath_);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return fail("cannot open " + statPath_.toStdString());
    }

    QTextStream in(&file);
    const QString line = in.readLine();
    const QStringList fields = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    // cpu user nice system idle [iowait irq softirq steal ...]
    if (fields.size() < 5 || fields.first() != QLatin1String("cpu")) {
        return fail("unexpected format in " + statPath_.toStdString());
    }

    unsigned long long total = 0;
    unsigned long long idle = 0;
    // guest and guest_nice are already part of user and nice
    const int last = std::min<int>(fields.size(), 9);
    for (int i = 1; i < last; ++i) {
        bool ok = false;
        const unsigned long long ticks = fields.at(i).toULongLong(&ok);
        if (!ok) {
            return fail("unexpected format in " + statPath_.toStdString());
        }
        total += ticks;
        if (i == 4 || i == 5) {  // idle, iowait
            idle += ticks;
        }
    }

    unsigned long long deltaTotal = total;
    unsigned long long deltaIdle = idle;
    if (havePrevious_) {
        if (total <= prevTotal_) {
            return fail("no CPU time elapsed since the previous sample");
        }
        deltaTotal = total - prevTotal_;
        deltaIdle = idle >= prevIdle_ ? idle - prevIdle_ : 0;
    }
    prevTotal_ = total;
    prevIdle_ = idle;
    havePrevious_ = true;

    if (deltaTotal == 0) {
        return fail("no CPU time recorded in " + statPath_.toStdString());
    }

    PercentageReading reading;
    reading.value = clampPercentage(
        100.0 * static_cast<double>(deltaTotal - std::min(deltaIdle, deltaTotal)) /
        static_cast<double>(deltaTotal));
    lastError_.clear();
    return reading;
}

DiskUsageSource::DiskUsageSource(QString path)
    : path_(std::move(path)) {
}

QString DiskUsageSource::name() const {
    return QStringLiteral("Disk %1").arg(path_);
}

std::optional<PercentageReading> DiskUsageSource::read() {
    QStorageInfo storage(path_);
    storage.refresh();
    if (!storage.isValid() || !storage.isReady()) {
        return fail("filesystem for " + path_.toStdString() + " is not available");
    }

    const qint64 total = storage.bytesTotal();
    if (total <= 0) {
        return fail("filesystem for " + path_.toStdString() + " reports no capacity");
    }

    const qint64 used = total - storage.bytesFree();
    PercentageReading reading;
    reading.value = clampPercentage(100.0 * static_cast<double>(used) / static_cast<double>(total));
    lastError_.clear();
    return reading;
}

} // namespace percent_tray
