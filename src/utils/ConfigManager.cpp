#include "ConfigManager.hpp"
#include "../core/Logger.hpp"
#include "percent-tray/Constants.hpp"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace percent_tray {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

class ConfigManager::Private {
public:
    std::map<std::string, ConfigValue> settings;

    QJsonValue toJsonValue(const ConfigValue& value) const {
        return std::visit(overloaded{
            [](bool b) -> QJsonValue { return b; },
            [](int i) -> QJsonValue { return i; },
            [](double d) -> QJsonValue { return d; },
            [](const std::string& s) -> QJsonValue { return QString::fromStdString(s); }
        }, value);
    }

    std::optional<ConfigValue> fromJsonValue(const QJsonValue& json) const {
        switch (json.type()) {
            case QJsonValue::Bool:
                return ConfigValue{json.toBool()};
            case QJsonValue::Double: {
                // JSON has one number type; whole numbers become int
                const double value = json.toDouble();
                double whole = 0.0;
                if (std::modf(value, &whole) == 0.0 &&
                    std::abs(value) <= static_cast<double>(std::numeric_limits<int>::max())) {
                    return ConfigValue{static_cast<int>(value)};
                }
                return ConfigValue{value};
            }
            case QJsonValue::String:
                return ConfigValue{json.toString().toStdString()};
            default:
                return std::nullopt;
        }
    }

    void setDefaults() {
        settings = {
            {ConfigKeys::POLL_INTERVAL, POLLING_INTERVAL},
            {ConfigKeys::ICON_SIZE, DEFAULT_ICON_SIZE},
            {ConfigKeys::ICON_STYLE, std::string("numeral")},
            {ConfigKeys::METRIC, std::string("battery")},
            {ConfigKeys::BATTERY_NAME, std::string()},
            {ConfigKeys::POWER_SUPPLY_PATH, std::string("/sys/class/power_supply")},
            {ConfigKeys::PROC_STAT_PATH, std::string("/proc/stat")},
            {ConfigKeys::DISK_PATH, std::string("/")},
            {ConfigKeys::FONT_FAMILY, std::string()},
            {ConfigKeys::FOREGROUND_COLOR, std::string("#000000")},
            {ConfigKeys::BACKGROUND_COLOR, std::string("#00000000")},
            {ConfigKeys::LOW_COLOR, std::string("#d32f2f")},
            {ConfigKeys::CHARGING_COLOR, std::string("#2e7d32")},
            {ConfigKeys::LOW_THRESHOLD, LOW_LEVEL_THRESHOLD},
            {ConfigKeys::CHARGING_MARKER, true},
            {ConfigKeys::LOG_LEVEL, 1},
            {ConfigKeys::LOG_FILE, std::string()}
        };
    }
};

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->setDefaults();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    auto it = d->settings.find(key);
    if (it != d->settings.end()) {
        if (std::holds_alternative<bool>(it->second)) {
            return std::get<bool>(it->second);
        }
    }
    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    auto it = d->settings.find(key);
    if (it != d->settings.end()) {
        if (std::holds_alternative<int>(it->second)) {
            return std::get<int>(it->second);
        }
    }
    return defaultValue;
}

double ConfigManager::getDouble(const std::string& key, double defaultValue) const {
    auto it = d->settings.find(key);
    if (it != d->settings.end()) {
        if (std::holds_alternative<double>(it->second)) {
            return std::get<double>(it->second);
        }
        if (std::holds_alternative<int>(it->second)) {
            return std::get<int>(it->second);
        }
    }
    return defaultValue;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    auto it = d->settings.find(key);
    if (it != d->settings.end()) {
        if (std::holds_alternative<std::string>(it->second)) {
            return std::get<std::string>(it->second);
        }
    }
    return defaultValue;
}

void ConfigManager::setBool(const std::string& key, bool value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setInt(const std::string& key, int value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setDouble(const std::string& key, double value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    d->settings[key] = value;
    emit configChanged(key);
}

bool ConfigManager::contains(const std::string& key) const {
    return d->settings.find(key) != d->settings.end();
}

int ConfigManager::pollInterval() const {
    return std::max(MIN_POLLING_INTERVAL,
                    getInt(ConfigKeys::POLL_INTERVAL, POLLING_INTERVAL));
}

int ConfigManager::iconSize() const {
    return std::clamp(getInt(ConfigKeys::ICON_SIZE, DEFAULT_ICON_SIZE),
                      MIN_ICON_SIZE, MAX_ICON_SIZE);
}

IconStyle ConfigManager::iconStyle() const {
    const std::string style = getString(ConfigKeys::ICON_STYLE, "numeral");
    if (style == "gauge") {
        return IconStyle::Gauge;
    }
    if (style != "numeral") {
        LOG_WARNING("Unknown icon style '" + style + "', using " + toString(IconStyle::Numeral));
    }
    return IconStyle::Numeral;
}

MetricKind ConfigManager::metric() const {
    const std::string metric = getString(ConfigKeys::METRIC, "battery");
    if (metric == "cpu") {
        return MetricKind::CpuLoad;
    }
    if (metric == "disk") {
        return MetricKind::DiskUsage;
    }
    if (metric != "battery") {
        LOG_WARNING("Unknown metric '" + metric + "', using " + toString(MetricKind::Battery));
    }
    return MetricKind::Battery;
}

QColor ConfigManager::color(const std::string& key, const QColor& fallback) const {
    const std::string name = getString(key);
    if (name.empty()) {
        return fallback;
    }
    // #AARRGGBB and named colors are both accepted
    QColor parsed(QString::fromStdString(name));
    if (!parsed.isValid()) {
        LOG_WARNING("Invalid color '" + name + "' for " + key);
        return fallback;
    }
    return parsed;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARNING("Cannot open configuration " + filename);
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        LOG_WARNING("Invalid configuration " + filename + ": " +
                    parseError.errorString().toStdString());
        return false;
    }

    const QJsonObject root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        const std::string key = it.key().toStdString();
        auto value = d->fromJsonValue(it.value());
        if (!value) {
            LOG_WARNING("Ignoring unsupported value for " + key);
            continue;
        }
        d->settings[key] = *value;
        emit configChanged(key);
    }

    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    QJsonObject root;
    for (const auto& [key, value] : d->settings) {
        root[QString::fromStdString(key)] = d->toJsonValue(value);
    }

    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_WARNING("Cannot write configuration " + filename);
        return false;
    }

    return file.write(QJsonDocument(root).toJson()) >= 0;
}

void ConfigManager::resetToDefaults() {
    d->setDefaults();

    for (const auto& [key, _] : d->settings) {
        emit configChanged(key);
    }
}

}
