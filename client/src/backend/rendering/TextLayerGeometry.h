#ifndef TEXTLAYERGEOMETRY_H
#define TEXTLAYERGEOMETRY_H

#include <QPointF>
#include <QSizeF>

#include "backend/domain/scene/SceneTypes.h"
#include "backend/rendering/RenderScale.h"

class FontRegistry;

// Geometry of a text layer's box: the measured text plus padding on every
// side, centered on the layer origin and rotated with the layer.
class TextLayerGeometry {
public:
    // (textWidth + 2*padding, fontSize + 2*padding). Font size and padding scale by scale.y.
    static QSizeF boxSize(FontRegistry& fonts, const TextItem& layer, const RenderScale& scale = RenderScale());

    // Pointer position expressed in the layer's unrotated local frame.
    static QPointF toLocal(const TextItem& layer, const QPointF& point);

    // Strict containment against the rotated box, in preview coordinates.
    static bool contains(FontRegistry& fonts, const TextItem& layer, const QPointF& point);
};

#endif // TEXTLAYERGEOMETRY_H
