#ifndef SCENETYPES_H
#define SCENETYPES_H

#include <QString>
#include <QColor>
#include <QRectF>
#include <optional>

// Minimum width/height of a free-placement image, in preview pixels.
constexpr qreal kMinFreeformSize = 20.0;

enum class LayoutMode {
    Grid,
    LeftBig,
    RightBig,
    TopBig,
    BottomBig,
    SingleFocus,
    FreePlacement
};

enum class FitPolicy {
    Cover,   // fill the cell, clip overflow
    Contain  // fit inside the cell, letterbox
};

enum class WatermarkAnchor {
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
    Center
};

// Stored geometry of an image in free-placement mode (preview pixel units).
struct FreeformGeometry {
    qreal x = 0.0;
    qreal y = 0.0;
    qreal width = 300.0;
    qreal height = 200.0;
    int zIndex = 0;

    QRectF rect() const { return QRectF(x, y, width, height); }
    bool operator==(const FreeformGeometry& other) const {
        return x == other.x && y == other.y && width == other.width
            && height == other.height && zIndex == other.zIndex;
    }
};

struct ImageItem {
    QString id;               // correlates with the decoded pixel source in DecodedImageCache
    int insertionOrder = 0;   // tie-breaker for stacking, never reused
    // Only consulted while LayoutMode::FreePlacement is active.
    std::optional<FreeformGeometry> freeform;
};

struct TextItem {
    QString id;
    QString text;
    qreal x = 0.0;
    qreal y = 0.0;
    qreal fontSize = 48.0;
    QString fontFamily;
    QString color;            // CSS hex
    qreal rotation = 0.0;     // degrees, clockwise
    bool shadow = false;
    QString backgroundColor;  // CSS hex
    qreal backgroundOpacity = 0.0; // 0 disables the background box
    qreal padding = 0.0;
};

struct WatermarkItem {
    QString id;               // pixel source identity
    qreal opacity = 0.5;
    qreal sizePercent = 20.0; // of target canvas width
    WatermarkAnchor anchor = WatermarkAnchor::BottomRight;
};

struct BackgroundSpec {
    enum class Kind { Color, Image };
    Kind kind = Kind::Color;
    QString color;            // used when kind == Color, or as fallback while the image is pending
    QString imageId;          // used when kind == Image
};

struct LayoutParameters {
    LayoutMode mode = LayoutMode::Grid;
    qreal gap = 16.0;
    qreal globalZoom = 1.0;
    FitPolicy fit = FitPolicy::Cover;
    // Single-focus only
    qreal focalZoom = 1.0;
    qreal backdropBlur = 10.0;
    qreal backdropOpacity = 0.3;
};

QString layoutModeToString(LayoutMode mode);
std::optional<LayoutMode> layoutModeFromString(const QString& value);

QString fitPolicyToString(FitPolicy fit);
std::optional<FitPolicy> fitPolicyFromString(const QString& value);

QString watermarkAnchorToString(WatermarkAnchor anchor);
std::optional<WatermarkAnchor> watermarkAnchorFromString(const QString& value);

// Parses a CSS hex color, returning `fallback` when the string is not a valid color.
QColor colorFromCss(const QString& css, const QColor& fallback);

#endif // SCENETYPES_H
