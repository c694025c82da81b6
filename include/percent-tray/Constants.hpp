#pragma once

namespace percent_tray {

constexpr int DEFAULT_ICON_SIZE = 64;  // px
constexpr int MIN_ICON_SIZE = 8;       // px
constexpr int MAX_ICON_SIZE = 256;     // px

constexpr int POLLING_INTERVAL = 1000;     // ms
constexpr int MIN_POLLING_INTERVAL = 100;  // ms

constexpr int FULL_CHARGE_THRESHOLD = 97;  // %, above this a charging label turns into "^_^"
constexpr int LOW_LEVEL_THRESHOLD = 20;    // %

constexpr int MESSAGE_TIMEOUT = 3000;  // ms

namespace ExitCodes {
    constexpr int CONFIG_ERROR = 1;
    constexpr int TRAY_UNAVAILABLE = 2;
    constexpr int FATAL = 3;
}

namespace ConfigKeys {
    constexpr const char* POLL_INTERVAL = "pollInterval";
    constexpr const char* ICON_SIZE = "iconSize";
    constexpr const char* ICON_STYLE = "iconStyle";
    constexpr const char* METRIC = "metric";
    constexpr const char* BATTERY_NAME = "batteryName";
    constexpr const char* POWER_SUPPLY_PATH = "powerSupplyPath";
    constexpr const char* PROC_STAT_PATH = "procStatPath";
    constexpr const char* DISK_PATH = "diskPath";
    constexpr const char* FONT_FAMILY = "fontFamily";
    constexpr const char* FOREGROUND_COLOR = "foregroundColor";
    constexpr const char* BACKGROUND_COLOR = "backgroundColor";
    constexpr const char* LOW_COLOR = "lowColor";
    constexpr const char* CHARGING_COLOR = "chargingColor";
    constexpr const char* LOW_THRESHOLD = "lowThreshold";
    constexpr const char* CHARGING_MARKER = "chargingMarker";
    constexpr const char* LOG_LEVEL = "logLevel";
    constexpr const char* LOG_FILE = "logFile";
}

}
