#pragma once
#include <QObject>
#include <QColor>
#include <memory>
#include <string>
#include <variant>
#include <map>
#include "percent-tray/Types.hpp"

namespace percent_tray {

using ConfigValue = std::variant<bool, int, double, std::string>;

class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    bool getBool(const std::string& key, bool defaultValue = false) const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    void setBool(const std::string& key, bool value);
    void setInt(const std::string& key, int value);
    void setDouble(const std::string& key, double value);
    void setString(const std::string& key, const std::string& value);

    bool contains(const std::string& key) const;

    // Validated views over the raw values
    int pollInterval() const;
    int iconSize() const;
    IconStyle iconStyle() const;
    MetricKind metric() const;
    QColor color(const std::string& key, const QColor& fallback) const;

    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    void resetToDefaults();

signals:
    void configChanged(const std::string& key);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
