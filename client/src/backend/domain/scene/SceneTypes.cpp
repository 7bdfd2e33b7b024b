#include "backend/domain/scene/SceneTypes.h"

#include <array>
#include <utility>

namespace {

const std::array<std::pair<LayoutMode, const char*>, 7> kLayoutModeNames = {{
    {LayoutMode::Grid, "grid"},
    {LayoutMode::LeftBig, "left-big"},
    {LayoutMode::RightBig, "right-big"},
    {LayoutMode::TopBig, "top-big"},
    {LayoutMode::BottomBig, "bottom-big"},
    {LayoutMode::SingleFocus, "single-focus"},
    {LayoutMode::FreePlacement, "free-placement"}
}};

const std::array<std::pair<WatermarkAnchor, const char*>, 5> kAnchorNames = {{
    {WatermarkAnchor::TopLeft, "top-left"},
    {WatermarkAnchor::TopRight, "top-right"},
    {WatermarkAnchor::BottomLeft, "bottom-left"},
    {WatermarkAnchor::BottomRight, "bottom-right"},
    {WatermarkAnchor::Center, "center"}
}};

} // namespace

QString layoutModeToString(LayoutMode mode) {
    for (const auto& entry : kLayoutModeNames) {
        if (entry.first == mode) {
            return QString::fromLatin1(entry.second);
        }
    }
    return QStringLiteral("grid");
}

std::optional<LayoutMode> layoutModeFromString(const QString& value) {
    const QString key = value.trimmed().toLower();
    for (const auto& entry : kLayoutModeNames) {
        if (key == QLatin1String(entry.second)) {
            return entry.first;
        }
    }
    // Names used by older saved settings
    if (key == QLatin1String("single-blur")) return LayoutMode::SingleFocus;
    if (key == QLatin1String("freeform")) return LayoutMode::FreePlacement;
    return std::nullopt;
}

QString fitPolicyToString(FitPolicy fit) {
    return fit == FitPolicy::Cover ? QStringLiteral("cover") : QStringLiteral("contain");
}

std::optional<FitPolicy> fitPolicyFromString(const QString& value) {
    const QString key = value.trimmed().toLower();
    if (key == QLatin1String("cover")) return FitPolicy::Cover;
    if (key == QLatin1String("contain")) return FitPolicy::Contain;
    return std::nullopt;
}

QString watermarkAnchorToString(WatermarkAnchor anchor) {
    for (const auto& entry : kAnchorNames) {
        if (entry.first == anchor) {
            return QString::fromLatin1(entry.second);
        }
    }
    return QStringLiteral("bottom-right");
}

std::optional<WatermarkAnchor> watermarkAnchorFromString(const QString& value) {
    const QString key = value.trimmed().toLower();
    for (const auto& entry : kAnchorNames) {
        if (key == QLatin1String(entry.second)) {
            return entry.first;
        }
    }
    return std::nullopt;
}

QColor colorFromCss(const QString& css, const QColor& fallback) {
    if (css.isEmpty()) {
        return fallback;
    }
    QString value = css.trimmed();
    // CSS puts alpha last (#RRGGBBAA), Qt expects it first (#AARRGGBB)
    if (value.size() == 9 && value.startsWith(QLatin1Char('#'))) {
        value = QLatin1Char('#') + value.mid(7, 2) + value.mid(1, 6);
    }
    const QColor parsed = QColor::fromString(value);
    return parsed.isValid() ? parsed : fallback;
}
