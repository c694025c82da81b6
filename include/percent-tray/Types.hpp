#pragma once
#include <algorithm>
#include <cmath>
#include <string>

namespace percent_tray {

enum class ChargeState {
    Unknown,
    Charging,
    Discharging,
    Full,
    NotCharging
};

enum class IconStyle {
    Numeral,
    Gauge
};

enum class MetricKind {
    Battery,
    CpuLoad,
    DiskUsage
};

enum class TrayEvent {
    Activated,
    RefreshRequested,
    ToggleAutostart,
    QuitRequested
};

// Clamps to [0, 100]; NaN maps to 0
inline double clampPercentage(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 100.0);
}

inline int roundedPercentage(double value) {
    return static_cast<int>(std::lround(clampPercentage(value)));
}

struct PercentageReading {
    double value{0.0};      // percent, clamped by the consumer
    ChargeState state{ChargeState::Unknown};

    int rounded() const { return roundedPercentage(value); }

    bool operator==(const PercentageReading& other) const {
        return rounded() == other.rounded() && state == other.state;
    }
    bool operator!=(const PercentageReading& other) const {
        return !(*this == other);
    }
};

inline std::string toString(IconStyle style) {
    switch (style) {
        case IconStyle::Numeral: return "numeral";
        case IconStyle::Gauge:   return "gauge";
    }
    return "numeral";
}

inline std::string toString(MetricKind kind) {
    switch (kind) {
        case MetricKind::Battery:   return "battery";
        case MetricKind::CpuLoad:   return "cpu";
        case MetricKind::DiskUsage: return "disk";
    }
    return "battery";
}

}
