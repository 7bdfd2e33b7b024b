#include "backend/rendering/TextLayerGeometry.h"
#include "backend/rendering/FontRegistry.h"

#include <QtMath>
#include <cmath>

QSizeF TextLayerGeometry::boxSize(FontRegistry& fonts, const TextItem& layer, const RenderScale& scale) {
    const qreal fontSize = scale.vertical(layer.fontSize);
    const qreal padding = scale.vertical(layer.padding);
    const qreal textWidth = fonts.textWidth(layer.text, layer.fontFamily, fontSize);
    return QSizeF(textWidth + padding * 2.0, fontSize + padding * 2.0);
}

QPointF TextLayerGeometry::toLocal(const TextItem& layer, const QPointF& point) {
    const qreal angle = -qDegreesToRadians(layer.rotation);
    const qreal c = std::cos(angle);
    const qreal s = std::sin(angle);
    const qreal dx = point.x() - layer.x;
    const qreal dy = point.y() - layer.y;
    return QPointF(dx * c - dy * s, dx * s + dy * c);
}

bool TextLayerGeometry::contains(FontRegistry& fonts, const TextItem& layer, const QPointF& point) {
    const QSizeF box = boxSize(fonts, layer);
    const QPointF local = toLocal(layer, point);
    return std::abs(local.x()) < box.width() / 2.0 && std::abs(local.y()) < box.height() / 2.0;
}
