#ifndef LAYOUTENGINE_H
#define LAYOUTENGINE_H

#include <QRectF>
#include <QSizeF>
#include <QPointF>
#include <QString>
#include <QVector>

#include "backend/domain/scene/SceneTypes.h"

// How the draw pipeline treats a placement rectangle.
enum class PlacementRole {
    Cell,      // fit + clip, global zoom
    Focus,     // fit + clip, global zoom x focal zoom
    Backdrop,  // stretched into the rect, painted through the blurred backdrop layer
    Freeform   // drawn exactly at the rect, no clip, no fit
};

struct Placement {
    QString imageId;
    QRectF rect;
    PlacementRole role = PlacementRole::Cell;
    qreal extraZoom = 1.0;
};

struct GridDimensions {
    int cols = 0;
    int rows = 0;
};

struct LayoutRequest {
    QSizeF canvasSize;
    // Gap in canvas pixels per axis. The export path passes gap*scaleX / gap*scaleY.
    qreal gapX = 0.0;
    qreal gapY = 0.0;
    LayoutParameters parameters;
    // Images that have pixels available, in list order.
    QVector<ImageItem> images;
    // Maps stored free-placement geometry (preview pixels) to canvas pixels.
    QPointF geometryScale{1.0, 1.0};
};

/**
 * LayoutEngine
 *
 * Pure placement math shared by the interactive canvas and the export renderer.
 * Nothing here touches a paint device: every function depends only on its
 * arguments, so the export path is the same calls made with scaled numbers.
 * Degenerate input (gap larger than the canvas, zero images) yields empty or
 * negative-size rectangles instead of errors; the painter skips those.
 */
class LayoutEngine {
public:
    // Fraction of the canvas covered by the single-focus box.
    static constexpr qreal kFocusWidthRatio = 0.8;
    static constexpr qreal kFocusHeightRatio = 0.9;

    // cols = ceil(sqrt(n)), rows = ceil(n / cols); {0, 0} for n <= 0.
    static GridDimensions gridDimensions(int count);

    // Tiles `count` cells row-major inside `area`, with `gapX`/`gapY` between
    // neighbouring cells only (no outer margin).
    static QVector<QRectF> tileCells(const QRectF& area, int count, qreal gapX, qreal gapY);

    static QRectF focusBox(const QSizeF& canvasSize);

    // One placement per available image, in stacking order (first painted first).
    static QVector<Placement> compute(const LayoutRequest& request);

    // Rectangle the source image is drawn into for a cell under the fit policy and zoom.
    // Centered on the cell; may overflow it (cover, zoom > 1). Null for degenerate input.
    static QRectF fitRect(const QSizeF& sourceSize, const QRectF& cell, FitPolicy fit, qreal zoom);

private:
    static QVector<Placement> computeGrid(const LayoutRequest& request);
    static QVector<Placement> computeSideBig(const LayoutRequest& request, bool bigOnLeft);
    static QVector<Placement> computeStackedBig(const LayoutRequest& request, bool bigOnTop);
    static QVector<Placement> computeSingleFocus(const LayoutRequest& request);
    static QVector<Placement> computeFreePlacement(const LayoutRequest& request);
};

#endif // LAYOUTENGINE_H
