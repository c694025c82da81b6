// src/core/IconRenderer.hpp
#pragma once
#include <QByteArray>
#include <QColor>
#include <QImage>
#include <QSize>
#include <QString>
#include <optional>
#include <string>
#include "percent-tray/Types.hpp"
#include "percent-tray/Constants.hpp"

namespace percent_tray {

struct RenderOptions {
    IconStyle style{IconStyle::Numeral};
    QColor foreground{Qt::black};
    QColor background{Qt::transparent};
    QColor lowColor{0xd3, 0x2f, 0x2f};
    QColor chargingColor{0x2e, 0x7d, 0x32};
    int lowThreshold{LOW_LEVEL_THRESHOLD};
    QString fontFamily;     // empty: application default font
    bool chargingMarker{true};
};

struct IconImage {
    QImage image;
    int percentage{-1};     // rounded value drawn, -1 for the fallback icon
    ChargeState state{ChargeState::Unknown};
    bool fallback{false};

    QSize size() const { return image.size(); }
    bool isNull() const { return image.isNull(); }

    // Encodes with a Qt image writer ("PNG", "ICO", ...); empty on failure
    QByteArray encode(const char* format = "PNG") const;

    bool operator==(const IconImage& other) const {
        return percentage == other.percentage &&
               state == other.state &&
               fallback == other.fallback &&
               image == other.image;
    }
    bool operator!=(const IconImage& other) const { return !(*this == other); }
};

/**
 * Draws a percentage into a tray-sized image.
 *
 * Rendering is a pure function of the options and the arguments: no state
 * is kept between calls and identical input gives identical pixels.
 */
class IconRenderer {
public:
    explicit IconRenderer(RenderOptions options = {});

    const RenderOptions& options() const { return options_; }

    // Out-of-range values are clamped. On failure returns nullopt and,
    // when given, fills error.
    std::optional<IconImage> render(double percentage,
                                    const QSize& size,
                                    ChargeState state = ChargeState::Unknown,
                                    std::string* error = nullptr) const;

    // Always succeeds, even below MIN_ICON_SIZE; empty sizes become 1x1
    IconImage defaultIcon(const QSize& size) const;

    // "42", "42*" while charging, "^_^" while charging above FULL_CHARGE_THRESHOLD
    QString labelFor(int percentage, ChargeState state) const;

private:
    bool drawNumeral(QImage& image, const QString& label, std::string* error) const;
    void drawGauge(QImage& image, int percentage, ChargeState state) const;
    void drawOutline(QImage& image, const QColor& color) const;

    RenderOptions options_;
};

} // namespace percent_tray
