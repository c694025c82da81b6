#include "IconRenderer.hpp"
#include <QBuffer>
#include <QFont>
#include <QFontDatabase>
#include <QFontMetrics>
#include <QPainter>
#include <QRect>
#include <algorithm>
#include <cmath>
#include <utility>

namespace percent_tray {

namespace {

struct GaugeGeometry {
    QRect body;
    QRect nub;
    QRect inner;
    int stroke{1};
};

// Horizontal battery: body on the left, terminal nub on the right
GaugeGeometry gaugeGeometry(const QSize& size) {
    GaugeGeometry g;
    const int w = size.width();
    const int h = size.height();

    g.stroke = std::max(1, h / 16);
    const int nubWidth = std::max(1, w / 12);
    const int bodyWidth = w - nubWidth;
    const int bodyHeight = std::max(3 * g.stroke + 2, (h * 5) / 8);
    const int top = (h - bodyHeight) / 2;

    g.body = QRect(0, top, bodyWidth, bodyHeight);
    g.nub = QRect(bodyWidth, top + bodyHeight / 4, nubWidth, std::max(1, bodyHeight / 2));

    const int inset = 2 * g.stroke;
    g.inner = g.body.adjusted(inset, inset, -inset, -inset);
    return g;
}

bool hasForegroundPixels(const QImage& image, QRgb background) {
    for (int y = 0; y < image.height(); ++y) {
        for (int x = 0; x < image.width(); ++x) {
            if (image.pixel(x, y) != background) {
                return true;
            }
        }
    }
    return false;
}

QImage blankImage(const QSize& size, const QColor& background) {
    QImage image(size, QImage::Format_ARGB32_Premultiplied);
    image.fill(background);
    return image;
}

} // namespace

QByteArray IconImage::encode(const char* format) const {
    QByteArray bytes;
    if (image.isNull()) {
        return bytes;
    }
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly) || !image.save(&buffer, format)) {
        return QByteArray();
    }
    return bytes;
}

IconRenderer::IconRenderer(RenderOptions options)
    : options_(std::move(options)) {
}

QString IconRenderer::labelFor(int percentage, ChargeState state) const {
    const int value = std::clamp(percentage, 0, 100);
    if (options_.chargingMarker && state == ChargeState::Charging) {
        if (value > FULL_CHARGE_THRESHOLD) {
            return QStringLiteral("^_^");
        }
        return QString::number(value) + QLatin1Char('*');
    }
    return QString::number(value);
}

std::optional<IconImage> IconRenderer::render(double percentage,
                                              const QSize& size,
                                              ChargeState state,
                                              std::string* error) const {
    if (size.width() < MIN_ICON_SIZE || size.height() < MIN_ICON_SIZE) {
        if (error) {
            *error = "icon size " + std::to_string(size.width()) + "x" +
                     std::to_string(size.height()) + " is below the minimum of " +
                     std::to_string(MIN_ICON_SIZE) + "px";
        }
        return std::nullopt;
    }

    const int value = roundedPercentage(percentage);

    IconImage icon;
    icon.percentage = value;
    icon.state = state;
    icon.image = blankImage(size, options_.background);

    switch (options_.style) {
        case IconStyle::Numeral:
            if (!drawNumeral(icon.image, labelFor(value, state), error)) {
                return std::nullopt;
            }
            break;
        case IconStyle::Gauge:
            drawGauge(icon.image, value, state);
            break;
    }

    return icon;
}

IconImage IconRenderer::defaultIcon(const QSize& size) const {
    const QSize actual(std::max(size.width(), 1), std::max(size.height(), 1));

    IconImage icon;
    icon.fallback = true;
    icon.image = blankImage(actual, options_.background);
    drawOutline(icon.image, options_.foreground);

    // Centered square marker: "value unknown"
    const GaugeGeometry g = gaugeGeometry(actual);
    const int side = std::max(1, std::min(g.inner.width(), g.inner.height()) / 2);
    QRect marker(0, 0, side, side);
    marker.moveCenter(g.inner.center());

    QPainter p(&icon.image);
    p.fillRect(marker, options_.foreground);
    p.end();

    return icon;
}

bool IconRenderer::drawNumeral(QImage& image, const QString& label, std::string* error) const {
    if (QFontDatabase::families().isEmpty()) {
        if (error) {
            *error = "no fonts available";
        }
        return false;
    }

    QFont font = options_.fontFamily.isEmpty() ? QFont() : QFont(options_.fontFamily);
    font.setStyleStrategy(QFont::PreferAntialias);

    // Binary search for the largest pixel size whose glyph bounds fit
    const int maxExtent = std::max(image.width(), image.height());
    int low = 1;
    int high = maxExtent * 2;
    int best = 0;
    while (low <= high) {
        const int mid = low + (high - low) / 2;
        font.setPixelSize(mid);
        const QRect bounds = QFontMetrics(font).tightBoundingRect(label);
        if (bounds.width() <= image.width() && bounds.height() <= image.height()) {
            best = mid;
            low = mid + 1;
        } else {
            high = mid - 1;
        }
    }

    if (best == 0) {
        if (error) {
            *error = "label \"" + label.toStdString() + "\" does not fit the icon";
        }
        return false;
    }

    const QRgb background = image.pixel(0, 0);

    font.setPixelSize(best);
    const QRect bounds = QFontMetrics(font).tightBoundingRect(label);
    const int x = (image.width() - bounds.width()) / 2 - bounds.left();
    const int y = (image.height() - bounds.height()) / 2 - bounds.top();

    QPainter p(&image);
    p.setRenderHint(QPainter::TextAntialiasing, true);
    p.setFont(font);
    p.setPen(options_.foreground);
    p.drawText(x, y, label);
    p.end();

    if (!hasForegroundPixels(image, background)) {
        if (error) {
            *error = "font \"" + font.family().toStdString() + "\" produced no glyphs";
        }
        return false;
    }
    return true;
}

void IconRenderer::drawOutline(QImage& image, const QColor& color) const {
    const GaugeGeometry g = gaugeGeometry(image.size());
    const QRect& b = g.body;
    const int s = g.stroke;

    QPainter p(&image);
    p.fillRect(QRect(b.left(), b.top(), b.width(), s), color);
    p.fillRect(QRect(b.left(), b.bottom() - s + 1, b.width(), s), color);
    p.fillRect(QRect(b.left(), b.top(), s, b.height()), color);
    p.fillRect(QRect(b.right() - s + 1, b.top(), s, b.height()), color);
    p.fillRect(g.nub, color);
    p.end();
}

void IconRenderer::drawGauge(QImage& image, int percentage, ChargeState state) const {
    drawOutline(image, options_.foreground);

    const GaugeGeometry g = gaugeGeometry(image.size());
    const int fillWidth = static_cast<int>(
        std::lround(percentage * g.inner.width() / 100.0));
    if (fillWidth <= 0) {
        return;
    }

    QColor fill = options_.foreground;
    if (state == ChargeState::Charging) {
        fill = options_.chargingColor;
    } else if (percentage <= options_.lowThreshold) {
        fill = options_.lowColor;
    }

    QPainter p(&image);
    p.fillRect(QRect(g.inner.left(), g.inner.top(), fillWidth, g.inner.height()), fill);
    p.end();
}

} // namespace percent_tray
